#include "app_registry.hpp"
#include "log.hpp"

#include <algorithm>
#include <stdexcept>

namespace dial
{

static constexpr std::string_view log_name {"Registry"};

std::string_view state_name(dial_state state)
{
    switch(state)
    {
        case dial_state::stopped:
            return "stopped";
        case dial_state::running:
            return "running";
        case dial_state::hidden:
            return "hidden";
        case dial_state::error_not_implemented:
            return "error_not_implemented";
        case dial_state::error_forbidden:
            return "error_forbidden";
        case dial_state::error_unauthorized:
            return "error_unauthorized";
        case dial_state::error_generic:
            return "error";
    }
    return "error";
}

application::application(app_ptr app, store::dial_data data)
    : m_app {std::move(app)},
      m_dial_data {std::move(data)}
{
    if(!m_app)
        throw std::invalid_argument {"application without implementation"};
}

dial_state application::start(const std::string& payload, const query_params& params,
    const std::optional<std::string>& additional_data_url)
{
    dial_state result = m_app->on_start(payload, params, additional_data_url);
    if(result != dial_state::running && !is_error(result))
    {
        logging::warn(log_name, "{} returned {} from its start callback", name(), state_name(result));
        result = dial_state::error_generic;
    }

    m_state = result;
    if(m_state == dial_state::running)
        m_app->m_last_payload = payload;

    return m_state;
}

dial_state application::refresh_status()
{
    m_state = m_app->on_status();
    return m_state;
}

void application::stop()
{
    try {
        m_app->on_stop();
    } catch(...) {
        m_state = dial_state::stopped;
        throw;
    }
    m_state = dial_state::stopped;
}

dial_state application::hide()
{
    dial_state result = m_app->on_hide();
    if(result == dial_state::hidden)
        m_state = dial_state::hidden;

    return result;
}

app_registry::app_registry(store::dial_data_store& data_store, store::kv_store_provider* storage_provider)
    : m_data_store {data_store},
      m_storage_provider {storage_provider}
{}

bool app_registry::register_app(app_ptr app)
{
    if(!app)
        return false;

    const app_descriptor& desc = app->descriptor();
    if(desc.addon_id.empty() || desc.name.empty())
    {
        logging::error(log_name, "addon id or application name not specified on app '{}' of add-on '{}'",
            desc.name, desc.addon_id);
        return false;
    }

    // Store I/O happens before the lock is taken
    store::dial_data data;
    std::unique_ptr<store::kv_store> storage;
    try {
        data = m_data_store.load(desc.name);
        if(desc.enable_persistence)
        {
            if(m_storage_provider)
                storage = m_storage_provider->open(desc.name);
            else
                logging::warn(log_name, "{} requests persistence but no storage is configured", desc.name);
        }
    } catch(const std::exception& e) {
        logging::error(log_name, "Can not prepare the storage of DIAL app {}: {}", desc.name, e.what());
        return false;
    }

    const std::string name = desc.name;
    const std::string addon_id = desc.addon_id;

    auto guard = lock();
    // Registries hold tens of applications at most, no index needed
    auto existing = std::find_if(m_apps.begin(), m_apps.end(), [&name](const std::unique_ptr<application>& entry) {
        return entry->name() == name;
    });
    if(existing != m_apps.end())
    {
        logging::warn(log_name, "skipped DIAL app {}, it is already registered by add-on {}",
            name, (*existing)->descriptor().addon_id);
        return false;
    }

    app->m_storage = std::move(storage);
    m_apps.push_back(std::make_unique<application>(std::move(app), std::move(data)));
    guard.unlock();

    logging::info(log_name, "Registered \"{}\" DIAL app to \"{}\" add-on", name, addon_id);
    return true;
}

size_t app_registry::register_apps(app_provider& provider)
{
    size_t accepted = 0;
    for(auto& app : provider.provide())
    {
        if(register_app(std::move(app)))
            ++accepted;
    }
    return accepted;
}

app_registry::lock_type app_registry::try_lock()
{
    return lock_type {m_mutex, std::try_to_lock};
}

app_registry::lock_type app_registry::lock()
{
    return lock_type {m_mutex};
}

void app_registry::check_lock(const lock_type& lock) const
{
    if(!lock.owns_lock() || lock.mutex() != &m_mutex)
        throw std::logic_error {"registry accessed without holding its lock"};
}

application* app_registry::find(const lock_type& lock, std::string_view name) const
{
    check_lock(lock);

    auto it = std::find_if(m_apps.begin(), m_apps.end(), [name](const std::unique_ptr<application>& entry) {
        return entry->name() == name;
    });

    if(it == m_apps.end())
        return nullptr;
    return it->get();
}

std::vector<std::string> app_registry::names() const
{
    std::lock_guard<std::mutex> guard {m_mutex};

    std::vector<std::string> result;
    result.reserve(m_apps.size());
    for(const auto& entry : m_apps)
        result.push_back(entry->name());
    return result;
}

size_t app_registry::size() const
{
    std::lock_guard<std::mutex> guard {m_mutex};
    return m_apps.size();
}

void app_registry::deliver(application& app, const host_event& event)
{
    try {
        app.app().on_host_event(event);
    } catch(const std::exception& e) {
        logging::error(log_name, "The app {} raised an error on a host event: {}", app.name(), e.what());
    }
}

bool app_registry::notify(std::string_view name, const host_event& event)
{
    auto guard = lock();
    application* app = find(guard, name);
    if(!app)
    {
        logging::warn(log_name, "Ignored host event, no app {} registered", name);
        return false;
    }

    deliver(*app, event);
    return true;
}

void app_registry::notify_all(const host_event& event)
{
    auto guard = lock();
    for(auto& entry : m_apps)
        deliver(*entry, event);
}

} // namespace dial
