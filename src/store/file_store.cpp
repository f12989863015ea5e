#include "store/file_store.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "fmt/format.h"

namespace store
{

directory_file_store::directory_file_store(std::filesystem::path root)
    : m_root {std::move(root)}
{}

std::filesystem::path directory_file_store::resolve(const std::string& name) const
{
    if(name.empty() || name.find("..") != std::string::npos || name.front() == '/')
        throw std::invalid_argument {fmt::format("Path '{}' contains not allowed characters", name)};

    return m_root / name;
}

bool directory_file_store::exists(const std::string& name) const
{
    std::error_code ec;
    return std::filesystem::is_regular_file(resolve(name), ec);
}

std::optional<std::string> directory_file_store::load(const std::string& name) const
{
    std::ifstream ifs(resolve(name), std::ios::binary);
    if(!ifs.good())
        return std::nullopt;

    std::stringstream sstr;
    sstr << ifs.rdbuf();
    return sstr.str();
}

void directory_file_store::save(const std::string& name, const std::string& content)
{
    const auto path = resolve(name);

    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if(ec)
        throw std::runtime_error {fmt::format("Can not create directory {}: {}", path.parent_path().string(), ec.message())};

    // Readers never observe a partially written file
    auto tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
        if(!ofs.good())
            throw std::runtime_error {fmt::format("Can not open {} for writing", tmp_path.string())};
        ofs << content;
        if(!ofs.good())
            throw std::runtime_error {fmt::format("Can not write {}", tmp_path.string())};
    }

    std::filesystem::rename(tmp_path, path, ec);
    if(ec)
        throw std::runtime_error {fmt::format("Can not replace {}: {}", path.string(), ec.message())};
}

} // namespace store
