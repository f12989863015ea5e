#ifndef DIAL_APP_REGISTRY_HPP
#define DIAL_APP_REGISTRY_HPP

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "dial_app.hpp"
#include "store/dial_data_store.hpp"
#include "store/kv_store.hpp"

namespace dial
{

/**
 * Registry entry of a DIAL application: the application itself plus the
 * server side state. Every member that changes the state must be called
 * with the registry lock held.
 */
class application
{
public:
    application() = delete;
    application(const application&) = delete;
    application& operator=(const application&) = delete;
    application(application&&) = delete;
    application& operator=(application&&) = delete;
    ~application() = default;

    application(app_ptr app, store::dial_data data);

    const std::string& name() const
    {
        return m_app->name();
    }

    const app_descriptor& descriptor() const
    {
        return m_app->descriptor();
    }

    dial_app& app() const
    {
        return *m_app;
    }

    dial_state state() const
    {
        return m_state;
    }

    const std::string& last_payload() const
    {
        return m_app->last_payload();
    }

    const store::dial_data& dial_data() const
    {
        return m_dial_data;
    }

    dial_state start(const std::string& payload, const query_params& params,
        const std::optional<std::string>& additional_data_url);

    dial_state refresh_status();

    /// Always ends in stopped
    void stop();

    /// Ends in hidden only if the application reports it, otherwise the state is kept
    dial_state hide();

    void replace_dial_data(store::dial_data data)
    {
        m_dial_data = std::move(data);
    }

private:

    app_ptr m_app;

    dial_state m_state = dial_state::stopped;

    store::dial_data m_dial_data;

};

class app_registry
{
public:
    using lock_type = std::unique_lock<std::mutex>;

    app_registry() = delete;
    app_registry(const app_registry&) = delete;
    app_registry& operator=(const app_registry&) = delete;
    app_registry(app_registry&&) = delete;
    app_registry& operator=(app_registry&&) = delete;
    ~app_registry() = default;

    explicit app_registry(store::dial_data_store& data_store, store::kv_store_provider* storage_provider = nullptr);

    /**
     * Adds an application. Rejected (false) if the addon id or the name is
     * empty or if the name is registered already, in which case the first
     * registrant is kept.
     */
    bool register_app(app_ptr app);

    size_t register_apps(app_provider& provider);

    /// Does not block, the returned lock does not own the mutex on contention
    lock_type try_lock();

    lock_type lock();

    /// Linear lookup, the caller must pass a lock that owns this registry's mutex
    application* find(const lock_type& lock, std::string_view name) const;

    std::vector<std::string> names() const;

    size_t size() const;

    bool notify(std::string_view name, const host_event& event);

    void notify_all(const host_event& event);

    store::dial_data_store& data_store() const
    {
        return m_data_store;
    }

private:

    void check_lock(const lock_type& lock) const;

    static void deliver(application& app, const host_event& event);

    store::dial_data_store& m_data_store;

    store::kv_store_provider* m_storage_provider;

    std::vector<std::unique_ptr<application>> m_apps;

    mutable std::mutex m_mutex;

};

} // namespace dial

#endif
