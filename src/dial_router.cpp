#include "dial_router.hpp"
#include "origin_validator.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <charconv>
#include <exception>

#include "fmt/format.h"

namespace dial
{

static constexpr std::string_view log_name {"DIAL-Server"};

static bool starts_with(std::string_view value, std::string_view prefix)
{
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

static bool ends_with(std::string_view value, std::string_view suffix)
{
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static http::response error_response(int code)
{
    http::response res {code};
    res.set_header("Content-Length", "0");
    return res;
}

static void allow_origin(http::response& res, const std::optional<std::string>& origin)
{
    if(origin)
        res.set_header("Access-Control-Allow-Origin", *origin);
}

static http::response options_response(std::string_view methods, const std::optional<std::string>& origin)
{
    http::response res {204};
    res.set_header("Access-Control-Allow-Methods", std::string {methods});
    res.set_header("Access-Control-Max-Age", "86400");
    res.set_header("Content-Length", "0");
    allow_origin(res, origin);
    return res;
}

static http::response ok_response(int code, const std::optional<std::string>& origin)
{
    http::response res {code};
    res.set_header("Content-Type", "text/plain");
    res.set_header("Content-Length", "0");
    allow_origin(res, origin);
    return res;
}

// Runs an application callback, exceptions leave as callback_error
template<typename Func>
static auto guarded(const application& app, std::string_view operation, Func&& func) -> decltype(func())
{
    try {
        return func();
    } catch(const std::exception& e) {
        logging::error(log_name, "The app {} raised an error in its {} callback: {}", app.name(), operation, e.what());
        throw callback_error {fmt::format("{} callback of {} failed: {}", operation, app.name(), e.what())};
    }
}

std::string app_name_before(std::string_view path, std::string_view suffix)
{
    if(ends_with(path, suffix))
        path.remove_suffix(suffix.size());

    size_t slash = path.rfind('/');
    if(slash != std::string_view::npos)
        path.remove_prefix(slash + 1);

    return std::string {path.substr(0, max_app_name)};
}

bool client_supports_hide(std::string_view client_version)
{
    int major = 0;
    int minor = 0;

    auto res = std::from_chars(client_version.data(), client_version.data() + client_version.size(), major);
    if(res.ec != std::errc {})
        return false;

    if(res.ptr != client_version.data() + client_version.size() && *res.ptr == '.')
    {
        const char* minor_begin = res.ptr + 1;
        std::from_chars(minor_begin, client_version.data() + client_version.size(), minor);
    }

    return major > 2 || (major == 2 && minor >= 1);
}

dial_router::dial_router(app_registry& registry, upnp::device_info device, uint16_t dial_port, address_provider local_addr)
    : m_registry {registry},
      m_device {std::move(device)},
      m_port {dial_port},
      m_local_addr {std::move(local_addr)}
{}

http::response dial_router::route(const http::request& req, const std::string& client_addr)
{
    logging::debug(log_name, "Received {} request {} {}", req.get_method(), req.get_resource(), client_addr);

    try {
        return dispatch(req, client_addr);
    } catch(const callback_error&) {
        return error_response(503);
    } catch(const std::exception& e) {
        logging::error(log_name, "Handling {} {} raised an exception: {}", req.get_method(), req.get_path(), e.what());
        return error_response(500);
    }
}

http::response dial_router::dispatch(const http::request& req, const std::string& client_addr)
{
    const std::string& path = req.get_path();
    const std::string& method = req.get_method();

    if(path == upnp::device_description_path)
        return upnp::device_description_response(m_device, m_local_addr(), m_port);

    const std::optional<std::string> origin = req.find_header("Origin");

    if(ends_with(path, run_uri))
    {
        const std::string app_name = app_name_before(path, run_uri);
        if(!is_allowed_origin(m_registry, origin, app_name))
            return error_response(403);

        if(method == "OPTIONS")
            return options_response("DELETE, OPTIONS", origin);

        if(!app_name.empty() && method == "DELETE")
            return handle_app_stop(app_name, origin);

        return error_response(501);
    }
    else if(starts_with(path, apps_uri) && path.find('/', apps_uri.size()) == std::string::npos)
    {
        const std::string app_name = path.substr(apps_uri.size(), max_app_name);
        if(!is_allowed_origin(m_registry, origin, app_name))
            return error_response(403);

        if(method == "OPTIONS")
            return options_response("GET, POST, OPTIONS", origin);

        if(method == "POST")
        {
            const std::string& payload = req.get_body();
            if(payload.size() > max_payload || req.content_length() > max_payload)
                return error_response(413);
            if(!utils::is_printable_ascii(payload))
                return error_response(400);

            return handle_app_start(req, app_name, origin);
        }
        else if(method == "GET")
        {
            return handle_app_status(req, app_name, origin);
        }

        return error_response(501);
    }
    else if(ends_with(path, hide_uri))
    {
        const std::string app_name = app_name_before(path, hide_uri);
        if(!is_allowed_origin(m_registry, origin, app_name))
            return error_response(403);

        if(method == "OPTIONS")
            return options_response("POST, OPTIONS", origin);

        if(!app_name.empty() && method == "POST")
            return handle_app_hide(app_name, origin);

        return error_response(501);
    }
    else if(ends_with(path, dial_data_uri))
    {
        // Only the applications running on this device may deliver data
        if(client_addr != "127.0.0.1" && client_addr != m_local_addr())
            return error_response(404);

        const std::string app_name = app_name_before(path, dial_data_uri);
        if(app_name.empty())
            return error_response(500);

        if(!is_allowed_origin(m_registry, origin, app_name))
            return error_response(403);

        if(method == "OPTIONS")
            return options_response("POST, OPTIONS", origin);

        const bool use_body = (method == "POST");
        const std::string& payload = use_body ? req.get_body() : req.get_query();
        if(payload.size() > max_dial_data_payload || (use_body && req.content_length() > max_dial_data_payload))
            return error_response(413);
        if(!utils::is_printable_ascii(payload))
            return error_response(400);

        return handle_dial_data(payload, app_name, origin);
    }

    return error_response(404);
}

http::response dial_router::handle_app_status(const http::request& req, const std::string& app_name, const std::optional<std::string>& origin)
{
    const bool supports_hide = client_supports_hide(req.get_param("clientDialVer"));

    auto guard = m_registry.try_lock();
    if(!guard.owns_lock())
        return error_response(500);

    application* app = m_registry.find(guard, app_name);
    if(!app)
        return error_response(404);

    std::string dial_data;
    for(const auto& [key, value] : app->dial_data())
    {
        dial_data += fmt::format("\r\n    <{0}>{1}</{0}>", utils::xml_escape(key), utils::xml_escape(value));
    }
    if(dial_data.size() > max_dial_data_size)
    {
        logging::error(log_name, "Exceeded maximum size for dial_data of {}", app_name);
        return error_response(500);
    }

    dial_state local_state = guarded(*app, "status", [app]() { return app->refresh_status(); });

    // Clients older than DIAL 2.1 do not know the hidden state
    if(!supports_hide && local_state == dial_state::hidden)
        local_state = dial_state::stopped;

    std::string_view state_str;
    if(local_state == dial_state::hidden)
        state_str = "hidden";
    else if(local_state == dial_state::running)
        state_str = "running";
    else
        state_str = "stopped";

    std::string body = fmt::format(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\r\n"
        "<service xmlns=\"urn:dial-multiscreen-org:schemas:dial\" dialVer=\"{0}\">\r\n"
        "  <name>{1}</name>\r\n"
        "  <options allowStop=\"true\"/>\r\n"
        "  <state>{2}</state>{3}\r\n"
        "  <additionalData>{4}\r\n"
        "  </additionalData>\r\n"
        "</service>\r\n",
        dial_version,
        utils::xml_escape(app_name),
        state_str,
        (local_state == dial_state::stopped) ? "" : "\r\n  <link rel=\"run\" href=\"run\"/>",
        dial_data
    );

    http::response res {200};
    res.set_header("Content-Type", "text/xml");
    allow_origin(res, origin);
    res.set_body(std::move(body));
    return res;
}

http::response dial_router::handle_app_start(const http::request& req, const std::string& app_name, const std::optional<std::string>& origin)
{
    const std::string local_addr = m_local_addr();

    auto guard = m_registry.try_lock();
    if(!guard.owns_lock())
        return error_response(500);

    application* app = m_registry.find(guard, app_name);
    if(!app)
        return error_response(404);

    std::optional<std::string> additional_data_url;
    if(app->descriptor().uses_additional_data)
    {
        additional_data_url = fmt::format("http://127.0.0.1:{}/apps/{}/dial_data", m_port, app_name);
        if(additional_data_url->size() > max_additional_data_url)
        {
            logging::error(log_name, "Exceeded maximum size for the additionalDataUrl of {}", app_name);
            return error_response(413);
        }
    }

    const std::string& payload = req.get_body();
    logging::debug(log_name, "Starting app {} with params {}", app_name, payload);

    dial_state state = guarded(*app, "start", [&]() {
        return app->start(payload, req.get_params(), additional_data_url);
    });

    switch(state)
    {
        case dial_state::running:
        {
            http::response res = ok_response(201, origin);
            res.set_header("Location", fmt::format("http://{}:{}/apps/{}/run", local_addr, m_port, app_name));
            return res;
        }
        case dial_state::error_forbidden:
            return error_response(403);
        case dial_state::error_unauthorized:
            return error_response(401);
        case dial_state::error_not_implemented:
            return error_response(501);
        default:
            return error_response(503);
    }
}

http::response dial_router::handle_app_stop(const std::string& app_name, const std::optional<std::string>& origin)
{
    auto guard = m_registry.try_lock();
    if(!guard.owns_lock())
        return error_response(500);

    application* app = m_registry.find(guard, app_name);
    if(app)
        guarded(*app, "status", [app]() { return app->refresh_status(); });

    if(!app || app->state() == dial_state::stopped)
        return error_response(404);

    guarded(*app, "stop", [app]() { app->stop(); });
    return ok_response(200, origin);
}

http::response dial_router::handle_app_hide(const std::string& app_name, const std::optional<std::string>& origin)
{
    auto guard = m_registry.try_lock();
    if(!guard.owns_lock())
        return error_response(500);

    application* app = m_registry.find(guard, app_name);
    if(app)
        guarded(*app, "status", [app]() { return app->refresh_status(); });

    if(!app || (app->state() != dial_state::running && app->state() != dial_state::hidden))
        return error_response(404);

    dial_state result = guarded(*app, "hide", [app]() { return app->hide(); });
    if(result != dial_state::hidden)
    {
        logging::error(log_name, "Hide is not implemented by {}", app_name);
        return error_response(501);
    }

    return ok_response(200, origin);
}

http::response dial_router::handle_dial_data(const std::string& payload, const std::string& app_name, const std::optional<std::string>& origin)
{
    store::dial_data data = utils::parse_form(payload);

    auto guard = m_registry.try_lock();
    if(!guard.owns_lock())
        return error_response(500);

    application* app = m_registry.find(guard, app_name);
    if(!app)
        return error_response(404);

    guarded(*app, "status", [app]() { return app->refresh_status(); });

    try {
        m_registry.data_store().save(app_name, data);
    } catch(const std::exception& e) {
        logging::error(log_name, "Can not store DIAL data of {}: {}", app_name, e.what());
        return error_response(500);
    }

    app->replace_dial_data(std::move(data));
    return ok_response(200, origin);
}

} // namespace dial
