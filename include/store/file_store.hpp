#ifndef STORE_FILE_STORE_HPP
#define STORE_FILE_STORE_HPP

#include <string>
#include <optional>
#include <memory>
#include <filesystem>

namespace store
{

class file_store
{
public:
    virtual ~file_store() = default;

    virtual bool exists(const std::string& name) const = 0;

    virtual std::optional<std::string> load(const std::string& name) const = 0;

    /// Throws std::runtime_error if the blob can not be written
    virtual void save(const std::string& name, const std::string& content) = 0;
};

class directory_file_store : public file_store
{
public:
    directory_file_store() = delete;
    directory_file_store(const directory_file_store&) = delete;
    directory_file_store& operator=(const directory_file_store&) = delete;

    explicit directory_file_store(std::filesystem::path root);

    bool exists(const std::string& name) const override;

    std::optional<std::string> load(const std::string& name) const override;

    void save(const std::string& name, const std::string& content) override;

    const std::filesystem::path& root() const
    {
        return m_root;
    }

private:

    std::filesystem::path resolve(const std::string& name) const;

    std::filesystem::path m_root;

};

} // namespace store

#endif
