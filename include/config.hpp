#ifndef DIALCAST_CONFIG_HPP
#define DIALCAST_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "log.hpp"
#include "store/file_store.hpp"

namespace dial
{

struct app_config
{
    std::string name;
    std::string addon_id;
    std::vector<std::string> origins;
    bool use_additional_data = false;
    bool enable_persistence = false;
};

struct server_config
{
    uint16_t dial_port = 56789;
    std::string friendly_name {"dialcast"};
    std::string model_name {"dialcast"};
    std::string manufacturer_name {" "};
    std::string device_uuid;                    // Empty: reuse the persisted one or generate
    std::string data_path {"./dialcast_data"};
    logging::level log_level = logging::level::info;
    std::vector<app_config> apps;
};

// Missing keys keep their defaults, a missing file yields the default
// configuration. Throws std::invalid_argument on malformed or mistyped values
server_config load_config(const std::string& path);

server_config parse_config(const std::string& content);

/**
 * The configured UUID, otherwise the one stored as "device_uuid",
 * otherwise a freshly generated version 4 UUID that gets stored.
 */
std::string resolve_device_uuid(const server_config& config, store::file_store& files);

std::string generate_uuid();

} // namespace dial

#endif
