#ifndef DIAL_ORIGIN_VALIDATOR_HPP
#define DIAL_ORIGIN_VALIDATOR_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "app_registry.hpp"

namespace dial
{

/**
 * Decide whether a request with the given Origin header may act on an
 * application. An absent or empty origin always passes. The registry is
 * locked without blocking; if the lock is busy the origin is denied.
 */
bool is_allowed_origin(app_registry& registry, const std::optional<std::string>& origin, std::string_view app_name);

bool is_uri_in_list(std::string_view origin, const std::vector<std::string>& origin_list);

/// https comparison: ".netflix.com" accepts "https://www.netflix.com:443"
bool host_matches(std::string_view origin, std::string_view candidate);

/// Every other scheme: candidate is a regular expression anchored at the start
bool origin_matches(std::string_view origin, const std::string& candidate);

std::string origin_host(std::string_view origin);

} // namespace dial

#endif
