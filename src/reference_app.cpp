#include "reference_app.hpp"
#include "log.hpp"

#include <string>

namespace dial
{

dial_state reference_app::on_start(const std::string& payload, const query_params& params,
    const std::optional<std::string>& additional_data_url)
{
    logging::debug(name(), "Start requested for add-on {} with {} query param(s)", descriptor().addon_id, params.size());
    logging::debug(name(), "payload: {}", payload);
    if(additional_data_url)
        logging::debug(name(), "additionalDataUrl: {}", *additional_data_url);

    if(descriptor().addon_id.empty())
        return dial_state::error_generic;

    // The same payload again asks for the current run, nothing to restart
    if(m_state == dial_state::running && payload == last_payload())
    {
        logging::debug(name(), "Already running with this payload");
        return m_state;
    }

    if(store::kv_store* db = storage())
    {
        const int launches = std::stoi(db->get("launches").value_or("0"));
        db->set("launches", std::to_string(launches + 1));
    }

    m_state = dial_state::running;
    return m_state;
}

void reference_app::on_stop()
{
    logging::debug(name(), "Stop requested");
    m_state = dial_state::stopped;
}

dial_state reference_app::on_status()
{
    return m_state;
}

void reference_app::on_host_event(const host_event& event)
{
    if(event.type == host_event_type::playback_stopped || event.type == host_event_type::host_closing)
        m_state = dial_state::stopped;
}

std::vector<app_ptr> config_app_provider::provide()
{
    std::vector<app_ptr> apps;
    apps.reserve(m_apps.size());
    for(const auto& app : m_apps)
    {
        apps.push_back(std::make_unique<reference_app>(app_descriptor {
            app.name,
            app.addon_id,
            app.origins,
            app.use_additional_data,
            app.enable_persistence
        }));
    }
    return apps;
}

} // namespace dial
