#ifndef DIAL_APP_HPP
#define DIAL_APP_HPP

#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <memory>
#include <optional>

#include "store/kv_store.hpp"

namespace dial
{

enum class dial_state
{
    stopped,
    running,
    hidden,
    error_not_implemented,
    error_forbidden,
    error_unauthorized,
    error_generic
};

std::string_view state_name(dial_state state);

inline bool is_error(dial_state state)
{
    return state == dial_state::error_not_implemented || state == dial_state::error_forbidden
        || state == dial_state::error_unauthorized || state == dial_state::error_generic;
}

using query_params = std::map<std::string, std::string>;

struct app_descriptor
{
    std::string name;                   // DIAL application name, unique in the registry
    std::string addon_id;               // Identifier of the owning component
    std::vector<std::string> origins;   // Allowed origins, plain strings or regular expressions
    bool uses_additional_data = false;
    bool enable_persistence = false;
};

enum class host_event_type
{
    playback_started,
    playback_paused,
    playback_resumed,
    playback_seek,
    playback_tick,
    playback_stopped,
    volume_changed,
    host_closing
};

struct host_event
{
    host_event_type type;
    std::map<std::string, std::string> data;
};

/**
 * A launchable DIAL application. The server calls every on_* member while
 * it holds the registry lock, so implementations must return quickly.
 * Exceptions thrown from a callback are caught by the server.
 */
class dial_app
{
public:
    dial_app() = delete;
    dial_app(const dial_app&) = delete;
    dial_app& operator=(const dial_app&) = delete;
    dial_app(dial_app&&) = delete;
    dial_app& operator=(dial_app&&) = delete;
    virtual ~dial_app() = default;

    explicit dial_app(app_descriptor descriptor)
        : m_descriptor {std::move(descriptor)}
    {}

    /// Returns dial_state::running on success or the error describing the failure
    virtual dial_state on_start(const std::string& payload, const query_params& params,
        const std::optional<std::string>& additional_data_url) = 0;

    virtual void on_stop() = 0;

    virtual dial_state on_status() = 0;

    virtual dial_state on_hide()
    {
        return dial_state::error_not_implemented;
    }

    virtual void on_host_event(const host_event&)
    {}

    const app_descriptor& descriptor() const
    {
        return m_descriptor;
    }

    const std::string& name() const
    {
        return m_descriptor.name;
    }

    /// Persistent storage, nullptr unless the descriptor enables persistence
    store::kv_store* storage() const
    {
        return m_storage.get();
    }

    /// Payload of the last successful start, empty before the first one
    const std::string& last_payload() const
    {
        return m_last_payload;
    }

private:

    friend class app_registry;
    friend class application;

    app_descriptor m_descriptor;

    std::unique_ptr<store::kv_store> m_storage {nullptr};

    std::string m_last_payload;

};

using app_ptr = std::unique_ptr<dial_app>;

class app_provider
{
public:
    virtual ~app_provider() = default;

    virtual std::vector<app_ptr> provide() = 0;
};

} // namespace dial

#endif
