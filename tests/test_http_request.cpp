#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "http/request.hpp"
#include "http/response.hpp"

TEST(HttpRequest, ParsesRequestLineAndQuery)
{
    http::request req {"GET /apps/YouTube?clientDialVer=2.1&name=My+Phone&v=%3Ca%3E HTTP/1.1\r\nHost: 10.0.0.2\r\n\r\n"};

    EXPECT_EQ(req.get_method(), "GET");
    EXPECT_EQ(req.get_protocol(), "HTTP/1.1");
    EXPECT_EQ(req.get_resource(), "/apps/YouTube?clientDialVer=2.1&name=My+Phone&v=%3Ca%3E");
    EXPECT_EQ(req.get_path(), "/apps/YouTube");
    EXPECT_EQ(req.get_query(), "clientDialVer=2.1&name=My+Phone&v=%3Ca%3E");
    EXPECT_EQ(req.get_param("clientDialVer"), "2.1");
    EXPECT_EQ(req.get_param("name"), "My Phone");
    EXPECT_EQ(req.get_param("v"), "<a>");
    EXPECT_EQ(req.get_param("missing"), "");
}

TEST(HttpRequest, HeadersAreCaseInsensitive)
{
    http::request req {"POST /apps/YouTube HTTP/1.1\r\norigin:   https://www.youtube.com  \r\nCONTENT-LENGTH: 3\r\n\r\nv=1"};

    EXPECT_TRUE(req.check_header("Origin"));
    EXPECT_EQ(req.get_header("ORIGIN"), "https://www.youtube.com");
    ASSERT_TRUE(req.find_header("Content-Length").has_value());
    EXPECT_EQ(req.content_length(), 3u);
    EXPECT_FALSE(req.find_header("Referer").has_value());
}

TEST(HttpRequest, BodyIsCutToContentLength)
{
    http::request req {"POST /apps/YouTube HTTP/1.1\r\nContent-Length: 4\r\n\r\nv=abcdef"};
    EXPECT_EQ(req.get_body(), "v=ab");

    http::request no_length {"POST /apps/YouTube HTTP/1.1\r\n\r\nignored"};
    EXPECT_EQ(no_length.get_body(), "");
}

TEST(HttpRequest, MalformedRequestsThrow)
{
    EXPECT_THROW(http::request {"garbage"}, std::invalid_argument);
    EXPECT_THROW(http::request {"GET\r\n\r\n"}, std::invalid_argument);
    EXPECT_THROW(http::request {"GET / HTTP/1.1\r\nno separator\r\n\r\n"}, std::invalid_argument);

    EXPECT_THROW(http::request {"POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n"}, std::invalid_argument);
}

TEST(HttpRequest, ExpectedSize)
{
    const std::string head = "POST /apps/YouTube HTTP/1.1\r\nContent-Length: 10\r\n\r\n";

    EXPECT_FALSE(http::request::expected_size("POST /apps/YouTube HTTP/1.1\r\nContent-Len").has_value());
    EXPECT_EQ(http::request::expected_size(head).value_or(0), head.size() + 10);
    EXPECT_EQ(http::request::expected_size("GET / HTTP/1.1\r\n\r\n").value_or(0), 18u);
}

TEST(HttpResponse, SerializesStatusHeadersAndBody)
{
    http::response res {404};
    res.set_header("Content-Type", "text/plain");
    res.set_body(std::string {"missing"});

    const std::string raw = res.to_string();
    EXPECT_EQ(raw.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u);
    EXPECT_NE(raw.find("\r\nContent-Length: 7\r\n"), std::string::npos);
    EXPECT_NE(raw.find("\r\nDate: "), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 11), "\r\n\r\nmissing");
}

TEST(HttpResponse, StreamedBodyHasNoContentLength)
{
    http::response res {200};
    res.set_body(std::string {"abc"});
    res.set_streamed_body(std::string {"<root/>"});

    EXPECT_FALSE(res.check_header("Content-Length"));
    EXPECT_EQ(res.get_body(), "<root/>");
}

TEST(HttpResponse, ReasonPhrases)
{
    EXPECT_EQ(http::get_http_phrase(201), "Created");
    EXPECT_EQ(http::get_http_phrase(413), "Request Entity Too Large");
    EXPECT_EQ(http::get_http_phrase(503), "Service Unavailable");
}
