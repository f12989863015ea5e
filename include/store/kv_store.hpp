#ifndef STORE_KV_STORE_HPP
#define STORE_KV_STORE_HPP

#include <string>
#include <optional>
#include <memory>
#include <mutex>

#include <nlohmann/json.hpp>

#include "store/file_store.hpp"

namespace store
{

class kv_store
{
public:
    virtual ~kv_store() = default;

    virtual std::optional<std::string> get(const std::string& key) const = 0;

    virtual void set(const std::string& key, const std::string& value) = 0;

    virtual bool remove(const std::string& key) = 0;
};

/// Creates the kv_store of an application, called once per registration
class kv_store_provider
{
public:
    virtual ~kv_store_provider() = default;

    virtual std::unique_ptr<kv_store> open(const std::string& app_name) = 0;
};

/**
 * kv_store kept as one JSON object in "app_<name>.json". Every change is
 * written through to the file store. Applications may call it from their
 * own threads, so access is serialized.
 */
class json_kv_store : public kv_store
{
public:
    json_kv_store() = delete;
    json_kv_store(const json_kv_store&) = delete;
    json_kv_store& operator=(const json_kv_store&) = delete;

    json_kv_store(file_store& files, std::string file_name);

    std::optional<std::string> get(const std::string& key) const override;

    void set(const std::string& key, const std::string& value) override;

    bool remove(const std::string& key) override;

private:

    void flush() const;

    file_store& m_files;

    const std::string m_file_name;

    nlohmann::json m_values;

    mutable std::mutex m_mutex;

};

class json_kv_store_provider : public kv_store_provider
{
public:
    explicit json_kv_store_provider(file_store& files)
        : m_files {files}
    {}

    std::unique_ptr<kv_store> open(const std::string& app_name) override;

    static std::string file_name(const std::string& app_name);

private:

    file_store& m_files;

};

} // namespace store

#endif
