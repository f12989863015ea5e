#ifndef DIAL_SERVICE_HPP
#define DIAL_SERVICE_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "app_registry.hpp"
#include "config.hpp"
#include "dial_router.hpp"
#include "ssdp_responder.hpp"
#include "store/dial_data_store.hpp"
#include "store/file_store.hpp"
#include "store/kv_store.hpp"

namespace dial
{

// Applications may be registered before or after start()
class dial_service
{
public:
    using address_provider = std::function<std::string()>;

    dial_service() = delete;
    dial_service(const dial_service&) = delete;
    dial_service& operator=(const dial_service&) = delete;
    dial_service(dial_service&&) = delete;
    dial_service& operator=(dial_service&&) = delete;
    ~dial_service();

    /// Without a file store the data path of the configuration is used
    explicit dial_service(const server_config& config, std::unique_ptr<store::file_store> files = nullptr,
        address_provider local_addr = nullptr);

    bool register_app(app_ptr app);

    size_t register_apps(app_provider& provider);

    void start();

    /// Stops both loops, the SSDP loop sends its byebye, and joins the threads
    void shutdown();

    bool running() const
    {
        return m_run.load();
    }

    bool notify(std::string_view app_name, const host_event& event)
    {
        return m_registry.notify(app_name, event);
    }

    void notify_all(const host_event& event)
    {
        m_registry.notify_all(event);
    }

    app_registry& registry()
    {
        return m_registry;
    }

    dial_router& router()
    {
        return m_router;
    }

    const upnp::device_info& device() const
    {
        return m_device;
    }

private:

    uint16_t m_port;

    std::unique_ptr<store::file_store> m_files;

    address_provider m_local_addr;

    upnp::device_info m_device;

    store::dial_data_store m_data_store;

    store::json_kv_store_provider m_storage_provider;

    app_registry m_registry;

    dial_router m_router;

    discovery::ssdp_responder m_responder;

    std::atomic<bool> m_run {false};

    std::vector<std::thread> m_workers;

};

} // namespace dial

#endif
