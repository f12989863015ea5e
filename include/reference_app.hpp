#ifndef DIAL_REFERENCE_APP_HPP
#define DIAL_REFERENCE_APP_HPP

#include <vector>

#include "config.hpp"
#include "dial_app.hpp"

namespace dial
{

// Stands in for a real add-on. A stopped playback or a closing host ends the run
class reference_app : public dial_app
{
public:
    explicit reference_app(app_descriptor descriptor)
        : dial_app {std::move(descriptor)}
    {}

    dial_state on_start(const std::string& payload, const query_params& params,
        const std::optional<std::string>& additional_data_url) override;

    void on_stop() override;

    dial_state on_status() override;

    void on_host_event(const host_event& event) override;

private:

    dial_state m_state = dial_state::stopped;

};

class config_app_provider : public app_provider
{
public:
    explicit config_app_provider(std::vector<app_config> apps)
        : m_apps {std::move(apps)}
    {}

    std::vector<app_ptr> provide() override;

private:

    std::vector<app_config> m_apps;

};

} // namespace dial

#endif
