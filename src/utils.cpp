#include <utils.hpp>

#include <array>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>

namespace utils
{

const char* error_msg = "Unable to get local ip address";

std::string get_local_ipaddr()
{
    ifaddrs* addrs;
    if (getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    for (ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr)
            continue;

        // DIAL clients expect an IPv4 LOCATION
        if (curr_addr->ifa_addr->sa_family == AF_INET)
        {
            std::array<char, NI_MAXHOST> host;

            int s = getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in),
                host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
            if(s != 0)
            {
                freeifaddrs(addrs);
                throw std::runtime_error {error_msg};
            }

            const unsigned int flags = curr_addr->ifa_flags;
            if ((flags & IFF_UP) && !(flags & IFF_LOOPBACK))
            {
                std::string result {host.data()};
                freeifaddrs(addrs);
                return result;
            }
        }
    }

    freeifaddrs(addrs);
    throw std::runtime_error {error_msg};
}

static int hex_value(char c)
{
    if(c >= '0' && c <= '9')
        return c - '0';
    if(c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if(c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

static constexpr std::string_view replacement_char {"\xEF\xBF\xBD"};

// Length of the valid UTF-8 sequence at the start of bytes, or the negated
// length of the invalid prefix that has to be replaced
static int utf8_sequence(std::string_view bytes)
{
    const auto lead = static_cast<unsigned char>(bytes[0]);
    if(lead < 0x80)
        return 1;

    int length = 0;
    unsigned char lower = 0x80;
    unsigned char upper = 0xBF;
    if(lead >= 0xC2 && lead <= 0xDF)
        length = 2;
    else if(lead >= 0xE0 && lead <= 0xEF)
    {
        length = 3;
        if(lead == 0xE0)
            lower = 0xA0;
        else if(lead == 0xED)
            upper = 0x9F;
    }
    else if(lead >= 0xF0 && lead <= 0xF4)
    {
        length = 4;
        if(lead == 0xF0)
            lower = 0x90;
        else if(lead == 0xF4)
            upper = 0x8F;
    }
    else
        return -1;

    for(int i = 1; i < length; ++i)
    {
        if(static_cast<size_t>(i) >= bytes.size())
            return -i;

        const auto c = static_cast<unsigned char>(bytes[i]);
        if(c < lower || c > upper)
            return -i;
        lower = 0x80;
        upper = 0xBF;
    }
    return length;
}

std::string to_valid_utf8(std::string_view bytes)
{
    std::string valid;
    valid.reserve(bytes.size());

    while(!bytes.empty())
    {
        int length = utf8_sequence(bytes);
        if(length > 0)
        {
            valid.append(bytes.substr(0, length));
        }
        else
        {
            valid.append(replacement_char);
            length = -length;
        }
        bytes.remove_prefix(length);
    }

    return valid;
}

std::string url_decode(std::string_view value)
{
    std::string decoded;
    decoded.reserve(value.size());

    for(size_t i = 0; i < value.size(); ++i)
    {
        if(value[i] == '+')
        {
            decoded.push_back(' ');
        }
        else if(value[i] == '%' && i + 2 < value.size())
        {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if(hi < 0 || lo < 0)
            {
                decoded.push_back(value[i]);
                continue;
            }
            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        else
        {
            decoded.push_back(value[i]);
        }
    }

    return to_valid_utf8(decoded);
}

std::string xml_escape(std::string_view value)
{
    std::string escaped;
    escaped.reserve(value.size());

    for(char c : value)
    {
        switch(c)
        {
            case '&':
                escaped.append("&amp;");
                break;
            case '<':
                escaped.append("&lt;");
                break;
            case '>':
                escaped.append("&gt;");
                break;
            case '"':
                escaped.append("&quot;");
                break;
            case '\'':
                escaped.append("&apos;");
                break;
            default:
                escaped.push_back(c);
        }
    }

    return escaped;
}

bool is_printable_ascii(std::string_view value)
{
    for(char c : value)
    {
        const auto uc = static_cast<unsigned char>(c);
        if(uc > 0x7E)
            return false;
        if(uc < 0x20 && c != '\t' && c != '\r' && c != '\n')
            return false;
    }
    return true;
}

std::string crlf(std::string_view text)
{
    std::string fixed;
    fixed.reserve(text.size() + text.size() / 16);

    for(size_t i = 0; i < text.size(); ++i)
    {
        if(text[i] == '\r')
        {
            fixed.append("\r\n");
            if(i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        }
        else if(text[i] == '\n')
        {
            fixed.append("\r\n");
        }
        else
        {
            fixed.push_back(text[i]);
        }
    }

    return fixed;
}

std::string http_date()
{
    std::array<char, 64> buffer;
    std::time_t now = std::time(nullptr);
    std::tm gmt;
    gmtime_r(&now, &gmt);

    size_t len = std::strftime(buffer.data(), buffer.size(), "%a, %d %b %Y %H:%M:%S GMT", &gmt);
    return std::string {buffer.data(), len};
}

string_map parse_form(std::string_view form)
{
    string_map parsed;

    while(!form.empty())
    {
        size_t amp = form.find('&');
        std::string_view pair = form.substr(0, amp);
        form = (amp == std::string_view::npos) ? std::string_view {} : form.substr(amp + 1);

        size_t eq = pair.find('=');
        if(eq == std::string_view::npos)
            continue;

        std::string key = url_decode(pair.substr(0, eq));
        std::string val = url_decode(pair.substr(eq + 1));
        if(key.empty() || val.empty())
            continue;

        // emplace keeps the first value of a repeated key
        parsed.emplace(std::move(key), std::move(val));
    }

    return parsed;
}

std::string to_lower(std::string_view value)
{
    std::string lowered {value};
    for(auto& c : lowered)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lowered;
}

} // utils
