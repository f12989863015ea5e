#include "http/request.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace http
{

static constexpr std::string_view header_terminator {"\r\n\r\n"};

bool header_less::operator()(const std::string& lhs, const std::string& rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) < std::tolower(static_cast<unsigned char>(b));
    });
}

request::request(std::string_view unparsed_request)
{
    parse(unparsed_request);
}

void request::parse(std::string_view request)
{
    size_t pos_q;

    /* extract the request line */
    pos_q = request.find("\r\n");
    if(pos_q == std::string_view::npos)
        throw std::invalid_argument("invalid_request");
    this->parse_requestline(request.substr(0, pos_q));

    /* Parse resource to path and params */
    if((pos_q = m_resource.find('?')) == std::string::npos)
    {
        m_path = m_resource;
        m_query.clear();
    }
    else
    {
        m_path = m_resource.substr(0, pos_q);
        m_query = m_resource.substr(pos_q + 1);
        size_t fragment = m_query.find('#');
        if(fragment != std::string::npos)
            m_query.resize(fragment);
        request::parse_params(m_query, m_query_params);
    }

    /* Read and parse request headers */
    size_t start_pos = request.find("\r\n") + 2;
    std::string_view headerline {request.data() + start_pos, request.size() - start_pos};
    while(true)
    {
        size_t end_pos = headerline.find("\r\n");
        if(end_pos == std::string_view::npos)
        {
            // Head without a terminating empty line
            if(headerline.empty())
                break;
            throw std::invalid_argument {"invalid_request"};
        }
        if(end_pos == 0)
        {
            headerline.remove_prefix(2);
            break;
        }

        size_t mid_pos = headerline.find(':');
        if(mid_pos == std::string_view::npos || mid_pos > end_pos)
            throw std::invalid_argument {"invalid_request"};

        std::string_view key {headerline.data(), mid_pos};
        std::string_view val {headerline.data() + mid_pos + 1, end_pos - (mid_pos + 1)};
        while(!val.empty() && (val.front() == ' ' || val.front() == '\t'))
            val.remove_prefix(1);
        while(!val.empty() && (val.back() == ' ' || val.back() == '\t'))
            val.remove_suffix(1);

        m_headers.emplace(std::string {key}, std::string {val});

        headerline.remove_prefix(end_pos + 2);
    }

    /* Everything after the head up to Content-Length is the body */
    size_t length = content_length();
    m_body = std::string {headerline.substr(0, std::min(length, headerline.size()))};
}

size_t request::content_length() const
{
    auto hdr = find_header("Content-Length");
    if(!hdr || hdr->empty())
        return 0;

    size_t length = 0;
    auto res = std::from_chars(hdr->data(), hdr->data() + hdr->size(), length);
    if(res.ec != std::errc {} || res.ptr != hdr->data() + hdr->size())
        throw std::invalid_argument {"invalid_content_length"};

    return length;
}

std::optional<size_t> request::expected_size(std::string_view partial)
{
    size_t head_end = partial.find(header_terminator);
    if(head_end == std::string_view::npos)
        return std::nullopt;

    size_t head_size = head_end + header_terminator.size();

    // Only the Content-Length header matters here, the full parse follows later
    std::string head = utils::to_lower(partial.substr(0, head_size));
    size_t pos = head.find("\r\ncontent-length:");
    if(pos == std::string::npos)
        return head_size;

    pos += 17;
    while(pos < head.size() && head[pos] == ' ')
        ++pos;

    size_t length = 0;
    auto res = std::from_chars(head.data() + pos, head.data() + head.size(), length);
    if(res.ec != std::errc {})
        return head_size;

    return head_size + length;
}

void request::parse_requestline(std::string_view requestline)
{
    uint32_t last_index = 0, vec_index = 0;
    std::string_view tmp_store[3];
    for(uint32_t i = 0; i < requestline.size() && vec_index < 3; i++)
    {
        if(requestline[i] == ' ' || i + 1 == requestline.size())
        {
            size_t end = (requestline[i] == ' ') ? i : i + 1;
            tmp_store[vec_index] = std::string_view {requestline.data() + last_index, end - last_index};
            last_index = i + 1;
            vec_index++;
        }
    }

    if(vec_index != 3 || tmp_store[0].empty() || tmp_store[1].empty())
        throw std::invalid_argument {"invalid_requestline"};

    this->m_method = tmp_store[0];
    this->m_resource = tmp_store[1];
    this->m_protocol = tmp_store[2];
}

void request::parse_params(std::string_view param_string, param_map& param_container)
{
    size_t offset = 0;
    for(size_t i = 0; i <= param_string.length(); i++)
    {
        if(i == param_string.length() || param_string[i] == '&')
        {
            std::string_view param {param_string.data() + offset, i - offset};
            size_t pos = param.find('=');
            if(pos != std::string_view::npos)
            {
                param_container.emplace(utils::url_decode(param.substr(0, pos)),
                    utils::url_decode(param.substr(pos + 1)));
            }
            else if(!param.empty())
            {
                param_container.emplace(utils::url_decode(param), std::string {});
            }
            offset = i + 1;
        }
    }
}

bool request::check_header(const std::string& key) const
{
    return m_headers.find(key) != m_headers.end();
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    if(it == m_headers.end())
        return "";
    return it->second;
}

std::optional<std::string> request::find_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    if(it == m_headers.end())
        return std::nullopt;
    return it->second;
}

std::string request::get_param(const std::string& key) const
{
    auto it = m_query_params.find(key);
    if(it == m_query_params.end())
        return "";
    return it->second;
}

} // namespace http
