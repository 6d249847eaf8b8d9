#include <cargo_loader/shared_library/shared_library.h>

#include <format>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include <dlfcn.h>

namespace shared_library {

template <typename E>
[[noreturn]] static void throw_unknown(const char* what, E value) {
    throw std::runtime_error(std::format("shared_library_t: unknown {} {}", what, static_cast<std::underlying_type_t<E>>(value)));
}

static int to_dlopen_flag(shared_library_lifetime_t lifetime) {
    switch (lifetime) {
        case shared_library_lifetime_t::PROCESS: return RTLD_NODELETE;
        case shared_library_lifetime_t::DTOR: return 0;
    }
    throw_unknown("shared_library_lifetime", lifetime);
}

static int to_dlopen_flag(symbol_resolution_t resolution) {
    switch (resolution) {
        case symbol_resolution_t::NOW: return RTLD_NOW;
        case symbol_resolution_t::LAZY: return RTLD_LAZY;
    }
    throw_unknown("symbol_resolution", resolution);
}

static int to_dlopen_flag(symbol_visibility_t visibility) {
    switch (visibility) {
        case symbol_visibility_t::LOCAL: return RTLD_LOCAL;
        case symbol_visibility_t::GLOBAL: return RTLD_GLOBAL;
    }
    throw_unknown("symbol_visibility", visibility);
}

symbol_t::symbol_t(void* symbol):
    m_symbol(symbol)
{
    if (m_symbol == nullptr) {
        throw std::runtime_error("symbol_t::symbol_t: null symbol pointer");
    }
}

void* symbol_t::address() const {
    return m_symbol;
}

shared_library_t::shared_library_t(const std::filesystem::path& path, const load_policy_t& load_policy):
    m_path(path),
    m_handle(nullptr)
{
    // A bare file name would make dlopen search the library path instead
    const auto load_path = path.is_absolute() ? path : std::filesystem::absolute(path);

    const int flags = to_dlopen_flag(load_policy.lifetime) | to_dlopen_flag(load_policy.resolution) | to_dlopen_flag(load_policy.visibility);
    m_handle = dlopen(load_path.c_str(), flags);
    if (m_handle == nullptr) {
        const char* error = dlerror();
        throw std::runtime_error(std::format("shared_library_t: failed to load cdylib '{}': {}", load_path.string(), error != nullptr ? error : "unknown dlopen error"));
    }
}

shared_library_t::~shared_library_t() {
    close_handle();
}

shared_library_t::shared_library_t(shared_library_t&& other) noexcept:
    m_path(std::move(other.m_path)),
    m_handle(std::exchange(other.m_handle, nullptr))
{
}

shared_library_t& shared_library_t::operator=(shared_library_t&& other) noexcept {
    if (this != &other) {
        close_handle();

        m_path = std::move(other.m_path);
        m_handle = std::exchange(other.m_handle, nullptr);
    }

    return *this;
}

symbol_t shared_library_t::resolve(const char* symbol) const {
    dlerror();
    void* result = dlsym(m_handle, symbol);
    if (result == nullptr) {
        const char* error = dlerror();
        throw std::runtime_error(std::format("shared_library_t::resolve: failed to resolve symbol '{}' in '{}': {}", symbol, m_path.string(), error != nullptr ? error : "symbol is null"));
    }

    return symbol_t(result);
}

const std::filesystem::path& shared_library_t::path() const {
    return m_path;
}

void shared_library_t::close_handle() noexcept {
    if (m_handle == nullptr) {
        return ;
    }

    // RTLD_NODELETE keeps PROCESS libraries mapped, dlclose only drops our reference
    dlclose(m_handle);
    m_handle = nullptr;
}

} // namespace shared_library
