#include "origin_validator.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <regex>

namespace dial
{

static constexpr std::string_view log_name {"DIAL-Server"};
static constexpr std::string_view https_scheme {"https://"};

std::string origin_host(std::string_view origin)
{
    size_t scheme_end = origin.find("://");
    if(scheme_end != std::string_view::npos)
        origin.remove_prefix(scheme_end + 3);

    size_t host_end = origin.find_first_of("/?#");
    if(host_end != std::string_view::npos)
        origin = origin.substr(0, host_end);

    size_t at = origin.rfind('@');
    if(at != std::string_view::npos)
        origin.remove_prefix(at + 1);

    if(!origin.empty() && origin.front() == '[')
    {
        // IPv6 literal, the port follows the closing bracket
        size_t bracket = origin.find(']');
        if(bracket != std::string_view::npos)
            origin = origin.substr(0, bracket + 1);
    }
    else
    {
        size_t colon = origin.rfind(':');
        if(colon != std::string_view::npos)
            origin = origin.substr(0, colon);
    }

    return utils::to_lower(origin);
}

bool host_matches(std::string_view origin, std::string_view candidate)
{
    const std::string origin_name = origin_host(origin);
    if(origin_name.empty())
        return false;

    if(!candidate.empty() && candidate.front() == '.')
    {
        const std::string domain = utils::to_lower(candidate.substr(1));
        if(origin_name == domain)
            return true;
        return origin_name.size() > candidate.size()
            && origin_name.compare(origin_name.size() - candidate.size(), candidate.size(), utils::to_lower(candidate)) == 0;
    }

    return origin_name == origin_host(candidate);
}

bool origin_matches(std::string_view origin, const std::string& candidate)
{
    try {
        const std::regex pattern {candidate};
        return std::regex_search(origin.begin(), origin.end(), pattern, std::regex_constants::match_continuous);
    } catch(const std::regex_error& e) {
        logging::error(log_name, "Invalid origin pattern '{}': {}", candidate, e.what());
        return false;
    }
}

bool is_uri_in_list(std::string_view origin, const std::vector<std::string>& origin_list)
{
    if(origin.empty() || origin_list.empty())
        return false;

    const bool is_https = utils::to_lower(origin.substr(0, https_scheme.size())) == https_scheme;
    for(const auto& candidate : origin_list)
    {
        if(is_https ? host_matches(origin, candidate) : origin_matches(origin, candidate))
            return true;
    }
    return false;
}

bool is_allowed_origin(app_registry& registry, const std::optional<std::string>& origin, std::string_view app_name)
{
    if(!origin || origin->empty())
        return true;

    logging::debug(log_name, "Checking {} for {}", *origin, app_name);

    auto guard = registry.try_lock();
    if(!guard.owns_lock())
    {
        logging::warn(log_name, "Registry busy, denying origin {} for {}", *origin, app_name);
        return false;
    }

    const application* app = registry.find(guard, app_name);
    if(!app)
        return false;

    return is_uri_in_list(*origin, app->descriptor().origins);
}

} // namespace dial
