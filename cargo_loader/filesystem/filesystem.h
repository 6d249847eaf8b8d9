#ifndef CARGO_LOADER_FILESYSTEM_FILESYSTEM_H
# define CARGO_LOADER_FILESYSTEM_FILESYSTEM_H

# include <filesystem>
# include <format>
# include <string>
# include <string_view>

/**
 * filesystem
 *
 * Path vocabulary for project and target directories.
 *
 * All functions throw std::runtime_error on failure.
 */
namespace filesystem {

/**
 * relative_path_t
 *
 * Invariants:
 * - Always relative
 */
class relative_path_t {
public:
    relative_path_t(const std::filesystem::path& relative_path);
    relative_path_t(const char* relative_path);

    std::string string() const;

    const std::filesystem::path& to_native_path() const;

private:
    std::filesystem::path m_relative_path;
};

/**
 * path_t
 *
 * Invariants:
 * - Always absolute
 * - Always lexically normalized
 *
 * Semantics:
 * - Represents a concrete filesystem location, e.g. a crate directory
 * - Joining enforces containment
 */
class path_t {
public:
    /**
     * Constructs a normalized absolute path, relative paths are resolved against the current directory.
     */
    path_t(const std::filesystem::path& path);

    /**
     * Returns the parent directory.
     *
     * Throws if the path is root.
     */
    path_t parent() const;

    /**
     * Checks whether `other` is a strict lexical descendant of this path.
     */
    bool is_child(const path_t& other) const;

    const char* c_str() const;

    std::string string() const;

    bool operator==(const path_t& other) const;

    /**
     * Joins a relative path component.
     *
     * Throws if the result escapes the base path or is identical to it.
     */
    path_t operator/(const relative_path_t& relative_path) const;

    const std::filesystem::path& to_native_path() const;

private:
    std::filesystem::path m_path;
};

/**
 * pretty_path_t
 *
 * Formatting adapter, shortens paths below the current directory.
 */
class pretty_path_t {
public:
    explicit pretty_path_t(const path_t& path);

    const std::string& string() const;

private:
    std::string m_string;
};

path_t current_path();

bool is_directory(const path_t& path);

} // namespace filesystem

namespace std {

template <>
struct formatter<::filesystem::path_t> : formatter<std::string> {
    auto format(const ::filesystem::path_t& path, auto& ctx) const {
        return formatter<std::string>::format(path.string(), ctx);
    }
};

template <>
struct formatter<::filesystem::pretty_path_t> : formatter<std::string> {
    auto format(const ::filesystem::pretty_path_t& pretty_path, auto& ctx) const {
        return formatter<std::string>::format(pretty_path.string(), ctx);
    }
};

} // namespace std

#endif // CARGO_LOADER_FILESYSTEM_FILESYSTEM_H
