#include "store/kv_store.hpp"
#include "log.hpp"
#include "utils.hpp"

#include <stdexcept>

using nlohmann::json;

namespace store
{

static constexpr std::string_view log_name {"Store"};

json_kv_store::json_kv_store(file_store& files, std::string file_name)
    : m_files {files},
      m_file_name {std::move(file_name)},
      m_values(json::object())
{
    auto content = m_files.load(m_file_name);
    if(!content)
        return;

    try {
        json parsed = json::parse(*content);
        if(parsed.is_object())
            m_values = std::move(parsed);
        else
            logging::error(log_name, "Ignoring {}, it does not contain a JSON object", m_file_name);
    } catch(const json::parse_error& e) {
        logging::error(log_name, "Ignoring corrupt store {}: {}", m_file_name, e.what());
    }
}

std::optional<std::string> json_kv_store::get(const std::string& key) const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = m_values.find(key);
    if(it == m_values.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

void json_kv_store::set(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    m_values[key] = value;
    flush();
}

bool json_kv_store::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    if(m_values.erase(key) == 0)
        return false;
    flush();
    return true;
}

void json_kv_store::flush() const
{
    m_files.save(m_file_name, m_values.dump(2));
}

std::string json_kv_store_provider::file_name(const std::string& app_name)
{
    return "app_" + utils::to_lower(app_name) + ".json";
}

std::unique_ptr<kv_store> json_kv_store_provider::open(const std::string& app_name)
{
    return std::make_unique<json_kv_store>(m_files, file_name(app_name));
}

} // namespace store
