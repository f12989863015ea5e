#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <map>

namespace http
{

std::string_view get_http_phrase(int status_code);

class response
{
public:

    response() = default;

    explicit response(int code)
        : m_code {code}
    {}

    std::string to_string() const;

    void set_header(const std::string& key, const std::string& value);

    void set_header(const std::string& key, std::string&& value);

    std::string get_header(const std::string& key) const;

    bool check_header(const std::string& key) const
    {
        return m_headers.find(key) != m_headers.end();
    }

    void set_code(int code)
    {
        m_code = code;
    }

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    /// Sets the body but leaves the length to the end of the connection
    void set_streamed_body(std::string&& body);

    const std::string& get_body() const
    {
        return m_body;
    }

    int get_code() const
    {
        return m_code;
    }

private:

    int m_code = 0;
    std::string m_body;

    std::map<std::string, std::string> m_headers;

};

} // namespace http

#endif
