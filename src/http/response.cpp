#include <http/response.hpp>

#include "utils.hpp"

namespace http
{

std::string_view get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 413: return "Request Entity Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default: return "Unknown";
    }
}

std::string response::to_string() const
{
    std::string response;
    int code = (m_code == 0) ? 200 : m_code;

    /* Begin with response line */
    response.append("HTTP/1.1 " + std::to_string(code) + " ");
    response.append(get_http_phrase(code));
    response.append("\r\n");

    if(m_headers.find("Date") == m_headers.end())
        response.append("Date: " + utils::http_date() + "\r\n");

    /* Append all headers to response */
    for(const auto& it : m_headers)
    {
        response.append(it.first + ": " + it.second + "\r\n");
    }

    /* Append body to response line */
    response.append("\r\n");
    if(!m_body.empty())
    {
        response.append(m_body);
    }

    return response;
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_streamed_body(std::string&& body)
{
    m_body = std::move(body);
    m_headers.erase("Content-Length");
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

void response::set_header(const std::string& key, std::string&& value)
{
    m_headers[key] = std::move(value);
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    if(it == m_headers.end())
        return "";
    return it->second;
}

} // namespace http
