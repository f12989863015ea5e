#include "dial_service.hpp"
#include "http/webserver.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace dial
{

static constexpr std::string_view log_name {"DIAL-Server"};

static std::unique_ptr<store::file_store> open_files(const server_config& config, std::unique_ptr<store::file_store> files)
{
    if(files)
        return files;
    return std::make_unique<store::directory_file_store>(config.data_path);
}

static upnp::device_info make_device(const server_config& config, store::file_store& files)
{
    return upnp::device_info {
        resolve_device_uuid(config, files),
        config.friendly_name,
        config.model_name,
        config.manufacturer_name
    };
}

dial_service::dial_service(const server_config& config, std::unique_ptr<store::file_store> files, address_provider local_addr)
    : m_port {config.dial_port},
      m_files {open_files(config, std::move(files))},
      m_local_addr {local_addr ? std::move(local_addr) : address_provider {utils::get_local_ipaddr}},
      m_device {make_device(config, *m_files)},
      m_data_store {*m_files},
      m_storage_provider {*m_files},
      m_registry {m_data_store, &m_storage_provider},
      m_router {m_registry, m_device, m_port, m_local_addr},
      m_responder {m_device, m_port, m_local_addr}
{}

dial_service::~dial_service()
{
    shutdown();
}

bool dial_service::register_app(app_ptr app)
{
    return m_registry.register_app(std::move(app));
}

size_t dial_service::register_apps(app_provider& provider)
{
    return m_registry.register_apps(provider);
}

void dial_service::start()
{
    if(m_run.exchange(true))
        return;

    logging::info(log_name, "Starting DIAL server on port {} as {}", m_port, m_device.uuid);

    m_workers.reserve(2);
    m_workers.emplace_back([this]() {
        try {
            http::webserver server {m_port, [this](const http::request& req, const std::string& peer) {
                return m_router.route(req, peer);
            }};
            server.serve(m_run);
        } catch(const std::exception& e) {
            logging::error(log_name, "The DIAL server stopped: {}", e.what());
        }
    });
    m_workers.emplace_back([this]() {
        try {
            m_responder.serve(m_run);
        } catch(const std::exception& e) {
            logging::error("SSDP-UDP-Server", "The SSDP server stopped: {}", e.what());
        }
    });
}

void dial_service::shutdown()
{
    m_run.store(false);
    for(auto& worker : m_workers)
    {
        if(worker.joinable())
            worker.join();
    }
    if(!m_workers.empty())
        logging::info(log_name, "DIAL server stopped");
    m_workers.clear();
}

} // namespace dial
