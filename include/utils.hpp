#ifndef DIALCAST_UTILS_HPP
#define DIALCAST_UTILS_HPP

#include <string>
#include <string_view>
#include <map>

namespace utils
{

using string_map = std::map<std::string, std::string>;

// First IPv4 address of an interface that is up and not a loopback
std::string get_local_ipaddr();

// Invalid UTF-8 sequences are replaced by U+FFFD
std::string to_valid_utf8(std::string_view bytes);

// '+' is decoded as space, the result is valid UTF-8
std::string url_decode(std::string_view value);

std::string xml_escape(std::string_view value);

bool is_printable_ascii(std::string_view value);

std::string crlf(std::string_view text);

// RFC 1123 date in GMT, e.g. "Sat, 09 Jan 2021 09:27:22 GMT"
std::string http_date();

/**
 * Parse an application/x-www-form-urlencoded string.
 * Keys and values are decoded, pairs with an empty value are dropped and
 * only the first value of a repeated key is kept.
 */
string_map parse_form(std::string_view form);

std::string to_lower(std::string_view value);

} // utils

#endif
