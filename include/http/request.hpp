#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <map>
#include <optional>

namespace http {

// Header names compare case-insensitively
struct header_less
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using header_map = std::map<std::string, std::string, header_less>;
using param_map = std::map<std::string, std::string>;

class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;

    explicit request(std::string_view request_string);

    /// Throws std::invalid_argument on a malformed request line or header
    void parse(std::string_view request);

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    std::optional<std::string> find_header(const std::string& key) const;

    const std::string& get_method() const { return m_method; }

    const std::string& get_resource() const { return m_resource; }

    const std::string& get_protocol() const { return m_protocol; }

    const std::string& get_path() const { return m_path; }

    /// Raw query string without the leading '?'
    const std::string& get_query() const { return m_query; }

    const param_map& get_params() const { return m_query_params; }

    std::string get_param(const std::string& key) const;

    const std::string& get_body() const { return m_body; }

    size_t content_length() const;

    /**
     * Number of bytes a raw request needs in total once its head is complete,
     * std::nullopt while the header terminator was not received yet.
     */
    static std::optional<size_t> expected_size(std::string_view partial);

private:

    void parse_requestline(std::string_view requestline);

    static void parse_params(std::string_view param_string, param_map& param_container);

    std::string m_method;     /// http method used by this request (e.g. post, get, ...)
    std::string m_protocol;   /// protocol of this request - should be HTTP/*.*
    std::string m_resource;   /// resource addressed by this request
    std::string m_path;       /// path of the resource addressed by this request
    std::string m_query;      /// unparsed query string

    param_map m_query_params; /// contains names and values of the query string
    header_map m_headers;     /// contains names and values of the http request headers
    std::string m_body;       /// body as declared by the Content-Length header

};

} // namespace http

#endif
