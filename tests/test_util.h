#ifndef CARGO_LOADER_TESTS_TEST_UTIL_H
# define CARGO_LOADER_TESTS_TEST_UTIL_H

# include <cstdlib>
# include <filesystem>
# include <fstream>
# include <iterator>
# include <optional>
# include <stdexcept>
# include <string>
# include <utility>

# include <sys/stat.h>
# include <unistd.h>

namespace test_util {

/**
 * Sets or unsets an environment variable and restores the previous value on destruction.
 */
class scoped_env_t {
public:
    scoped_env_t(std::string name, const std::optional<std::string>& value):
        m_name(std::move(name))
    {
        if (const char* previous = std::getenv(m_name.c_str()); previous != nullptr) {
            m_previous = previous;
        }

        if (value.has_value()) {
            ::setenv(m_name.c_str(), value->c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

    ~scoped_env_t() {
        if (m_previous.has_value()) {
            ::setenv(m_name.c_str(), m_previous->c_str(), 1);
        } else {
            ::unsetenv(m_name.c_str());
        }
    }

    scoped_env_t(const scoped_env_t& other) = delete;
    scoped_env_t& operator=(const scoped_env_t& other) = delete;

private:
    std::string m_name;
    std::optional<std::string> m_previous;
};

/**
 * Fresh directory under the system temp directory, removed with its contents on destruction.
 */
class temp_dir_t {
public:
    temp_dir_t() {
        auto pattern = (std::filesystem::temp_directory_path() / "cargo_loader_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("temp_dir_t: mkdtemp failed");
        }
        m_path = std::filesystem::canonical(pattern);
    }

    ~temp_dir_t() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    temp_dir_t(const temp_dir_t& other) = delete;
    temp_dir_t& operator=(const temp_dir_t& other) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::filesystem::path write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error("write_file: failed to open " + path.string());
    }
    ofs << content;
    return path;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("read_file: failed to open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

/**
 * Writes an executable /bin/sh script.
 */
inline std::filesystem::path write_script(const std::filesystem::path& path, const std::string& body) {
    write_file(path, "#!/bin/sh\n" + body);
    if (::chmod(path.c_str(), 0755) != 0) {
        throw std::runtime_error("write_script: chmod failed for " + path.string());
    }
    return path;
}

} // namespace test_util

#endif // CARGO_LOADER_TESTS_TEST_UTIL_H
