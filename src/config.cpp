#include "config.hpp"

#include <fstream>
#include <sstream>
#include <random>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "fmt/format.h"

using nlohmann::json;

namespace dial
{

static constexpr std::string_view log_name {"Config"};
static const std::string uuid_file {"device_uuid"};

template<typename T>
static void read_value(const json& j, const char* key, T& target)
{
    auto it = j.find(key);
    if(it != j.end() && !it->is_null())
        target = it->get<T>();
}

static app_config parse_app(const json& j)
{
    if(!j.is_object())
        throw std::invalid_argument {"every entry of \"apps\" must be an object"};

    app_config app;
    read_value(j, "name", app.name);
    read_value(j, "addon_id", app.addon_id);
    read_value(j, "origins", app.origins);
    read_value(j, "use_additional_data", app.use_additional_data);
    read_value(j, "enable_persistence", app.enable_persistence);
    return app;
}

server_config parse_config(const std::string& content)
{
    server_config config;

    try {
        json j = json::parse(content);
        if(!j.is_object())
            throw std::invalid_argument {"the configuration must be a JSON object"};

        int port = config.dial_port;
        read_value(j, "dial_port", port);
        if(port <= 0 || port > 65535)
            throw std::invalid_argument {fmt::format("dial_port {} is out of range", port)};
        config.dial_port = static_cast<uint16_t>(port);

        read_value(j, "friendly_name", config.friendly_name);
        read_value(j, "model_name", config.model_name);
        read_value(j, "manufacturer_name", config.manufacturer_name);
        read_value(j, "device_uuid", config.device_uuid);
        read_value(j, "data_path", config.data_path);

        std::string level_name;
        read_value(j, "log_level", level_name);
        if(!level_name.empty())
            config.log_level = logging::level_from_string(level_name);

        auto apps = j.find("apps");
        if(apps != j.end() && !apps->is_null())
        {
            if(!apps->is_array())
                throw std::invalid_argument {"\"apps\" must be an array"};
            for(const auto& entry : *apps)
                config.apps.push_back(parse_app(entry));
        }
    } catch(const json::exception& e) {
        throw std::invalid_argument {fmt::format("Invalid configuration: {}", e.what())};
    }

    return config;
}

server_config load_config(const std::string& path)
{
    std::ifstream file {path};
    if(!file)
    {
        logging::info(log_name, "No configuration at {}, using defaults", path);
        return server_config {};
    }

    std::stringstream content;
    content << file.rdbuf();
    server_config config = parse_config(content.str());
    logging::debug(log_name, "Loaded configuration {} with {} app(s)", path, config.apps.size());
    return config;
}

std::string generate_uuid()
{
    std::random_device rd;
    std::mt19937_64 gen {(static_cast<uint64_t>(rd()) << 32) | rd()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t high = dist(gen);
    uint64_t low = dist(gen);

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>(high >> 16),
        static_cast<uint16_t>(high),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFFULL);
}

static std::string trim(const std::string& value)
{
    size_t begin = value.find_first_not_of(" \t\r\n");
    if(begin == std::string::npos)
        return {};
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string resolve_device_uuid(const server_config& config, store::file_store& files)
{
    if(!config.device_uuid.empty())
        return config.device_uuid;

    if(auto stored = files.load(uuid_file))
    {
        std::string uuid = trim(*stored);
        if(!uuid.empty())
            return uuid;
    }

    std::string uuid = generate_uuid();
    try {
        files.save(uuid_file, uuid);
    } catch(const std::exception& e) {
        logging::warn(log_name, "Can not persist the device UUID, it changes on restart: {}", e.what());
    }

    logging::info(log_name, "Generated device UUID {}", uuid);
    return uuid;
}

} // namespace dial
