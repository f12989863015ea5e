#include "store/dial_data_store.hpp"
#include "log.hpp"

#include <optional>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace store
{

static constexpr std::string_view log_name {"Store"};

std::string dial_data_store::file_name(const std::string& app_name)
{
    return "dial_data/" + app_name + ".json";
}

dial_data dial_data_store::load(const std::string& app_name) const
{
    dial_data data;

    std::optional<std::string> content;
    try {
        content = m_files.load(file_name(app_name));
    } catch(const std::exception& e) {
        logging::error(log_name, "Can not read DIAL data of {}: {}", app_name, e.what());
        return data;
    }
    if(!content)
        return data;

    try {
        json parsed = json::parse(*content);
        if(!parsed.is_object())
        {
            logging::error(log_name, "DIAL data of {} is not a JSON object", app_name);
            return data;
        }

        for(auto it = parsed.begin(); it != parsed.end(); ++it)
        {
            if(it.value().is_string())
                data.emplace(it.key(), it.value().get<std::string>());
            else
                logging::warn(log_name, "Skipping non string DIAL data value {} of {}", it.key(), app_name);
        }
    } catch(const json::exception& e) {
        logging::error(log_name, "Corrupt DIAL data of {}: {}", app_name, e.what());
        data.clear();
    }

    return data;
}

void dial_data_store::save(const std::string& app_name, const dial_data& data)
{
    json j = data;
    m_files.save(file_name(app_name), j.dump());
    logging::debug(log_name, "Stored {} DIAL data entries of {}", data.size(), app_name);
}

} // namespace store
