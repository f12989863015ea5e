#ifndef DIAL_ROUTER_HPP
#define DIAL_ROUTER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "app_registry.hpp"
#include "upnp_device.hpp"
#include "http/request.hpp"
#include "http/response.hpp"

namespace dial
{

constexpr const char* dial_version = "2.2";         // Reported in the status response
constexpr size_t max_payload = 4096;                // Start payload limit of DIAL 1.6.1
constexpr size_t max_additional_data_url = 1024;
constexpr size_t max_dial_data_size = 8 * 1024;     // Rendered additionalData fragment
constexpr size_t max_dial_data_payload = 4096;
constexpr size_t max_app_name = 255;

constexpr std::string_view run_uri {"/run"};
constexpr std::string_view apps_uri {"/apps/"};
constexpr std::string_view hide_uri {"/hide"};
constexpr std::string_view dial_data_uri {"/dial_data"};

class callback_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Maps DIAL requests onto the application registry. Every handler that
 * touches the registry takes its lock without blocking and answers 500 if
 * the lock is busy. route() never throws.
 */
class dial_router
{
public:
    using address_provider = std::function<std::string()>;

    dial_router() = delete;
    dial_router(const dial_router&) = delete;
    dial_router& operator=(const dial_router&) = delete;

    dial_router(app_registry& registry, upnp::device_info device, uint16_t dial_port, address_provider local_addr);

    http::response route(const http::request& req, const std::string& client_addr);

private:

    http::response dispatch(const http::request& req, const std::string& client_addr);

    http::response handle_app_start(const http::request& req, const std::string& app_name, const std::optional<std::string>& origin);

    http::response handle_app_status(const http::request& req, const std::string& app_name, const std::optional<std::string>& origin);

    http::response handle_app_stop(const std::string& app_name, const std::optional<std::string>& origin);

    http::response handle_app_hide(const std::string& app_name, const std::optional<std::string>& origin);

    http::response handle_dial_data(const std::string& payload, const std::string& app_name, const std::optional<std::string>& origin);

    app_registry& m_registry;

    const upnp::device_info m_device;

    const uint16_t m_port;

    address_provider m_local_addr;

};

/// Name in front of a suffix: "/apps/YouTube/run" with "/run" -> "YouTube", cut to max_app_name
std::string app_name_before(std::string_view path, std::string_view suffix);

bool client_supports_hide(std::string_view client_version);

} // namespace dial

#endif
