#ifndef STORE_DIAL_DATA_STORE_HPP
#define STORE_DIAL_DATA_STORE_HPP

#include <string>
#include <map>

#include "store/file_store.hpp"

namespace store
{

using dial_data = std::map<std::string, std::string>;

class dial_data_store
{
public:
    dial_data_store() = delete;
    dial_data_store(const dial_data_store&) = delete;
    dial_data_store& operator=(const dial_data_store&) = delete;

    explicit dial_data_store(file_store& files)
        : m_files {files}
    {}

    /// Missing or unreadable data yields an empty map
    dial_data load(const std::string& app_name) const;

    /// Throws std::runtime_error if the data can not be written
    void save(const std::string& app_name, const dial_data& data);

    static std::string file_name(const std::string& app_name);

private:

    file_store& m_files;

};

} // namespace store

#endif
