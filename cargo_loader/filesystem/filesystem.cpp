#include <cargo_loader/filesystem/filesystem.h>

#include <stdexcept>

namespace filesystem {

relative_path_t::relative_path_t(const std::filesystem::path& relative_path):
    m_relative_path(relative_path)
{
    if (m_relative_path.is_absolute()) {
        throw std::runtime_error(std::format("relative_path_t: path '{}' is absolute", m_relative_path.string()));
    }
}

relative_path_t::relative_path_t(const char* relative_path):
    relative_path_t(std::filesystem::path(relative_path))
{
}

std::string relative_path_t::string() const {
    return m_relative_path.string();
}

const std::filesystem::path& relative_path_t::to_native_path() const {
    return m_relative_path;
}

path_t::path_t(const std::filesystem::path& path):
    m_path(std::filesystem::absolute(path).lexically_normal())
{
    // "/a/b/" normalizes to "/a/b/", drop the empty filename so joins and comparisons agree
    if (!m_path.has_filename() && m_path.has_relative_path()) {
        m_path = m_path.parent_path();
    }
}

path_t path_t::parent() const {
    if (!m_path.has_relative_path()) {
        throw std::runtime_error(std::format("parent: path '{}' has no parent", m_path.string()));
    }

    return path_t(m_path.parent_path());
}

bool path_t::is_child(const path_t& other) const {
    const auto rel = other.m_path.lexically_relative(m_path);
    return !rel.empty() && rel != "." && !rel.native().starts_with("..");
}

const char* path_t::c_str() const {
    return m_path.c_str();
}

std::string path_t::string() const {
    return m_path.string();
}

bool path_t::operator==(const path_t& other) const {
    return m_path == other.m_path;
}

path_t path_t::operator/(const relative_path_t& relative_path) const {
    path_t result(m_path / relative_path.to_native_path());

    if (!is_child(result)) {
        throw std::runtime_error(std::format("operator/: path '{}' must be a strict child of the base path '{}'", result.m_path.string(), m_path.string()));
    }

    return result;
}

const std::filesystem::path& path_t::to_native_path() const {
    return m_path;
}

pretty_path_t::pretty_path_t(const path_t& path) {
    const auto cwd = current_path();
    if (cwd.is_child(path)) {
        m_string = path.to_native_path().lexically_relative(cwd.to_native_path()).string();
    } else {
        m_string = path.string();
    }
}

const std::string& pretty_path_t::string() const {
    return m_string;
}

path_t current_path() {
    std::error_code ec;
    const auto result = std::filesystem::current_path(ec);
    if (ec) {
        throw std::runtime_error(std::format("current_path: {}", ec.message()));
    }

    return path_t(result);
}

bool is_directory(const path_t& path) {
    std::error_code ec;
    const bool result = std::filesystem::is_directory(path.to_native_path(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw std::runtime_error(std::format("is_directory: failed to check '{}': {}", path, ec.message()));
    }

    return result;
}

} // namespace filesystem
