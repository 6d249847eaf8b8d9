#ifndef CARGO_LOADER_SHARED_LIBRARY_SHARED_LIBRARY_H
# define CARGO_LOADER_SHARED_LIBRARY_SHARED_LIBRARY_H

# include <filesystem>

namespace shared_library {

enum class shared_library_lifetime_t {
    PROCESS, // Library stays mapped for the rest of the process
    DTOR // Library lifetime is tied to shared_library_t object lifetime
};

enum class symbol_resolution_t {
    NOW, // Resolve relocations at load time; fail early on missing symbols
    LAZY // Defer relocations until first use; failures may surface later
};

enum class symbol_visibility_t {
    LOCAL, // Symbols are not added to the global symbol table
    GLOBAL // Symbols are added to the global symbol table
};

struct load_policy_t {
    shared_library_lifetime_t lifetime = shared_library_lifetime_t::DTOR;
    symbol_resolution_t resolution = symbol_resolution_t::NOW;
    symbol_visibility_t visibility = symbol_visibility_t::LOCAL;
};

/**
 * symbol_t
 * - Non-owning, type-erased symbol address returned by shared_library_t::resolve()
 * - Convertible to a function pointer type (unchecked; caller must provide correct signature)
 *
 * Invariants:
 * - m_symbol != nullptr
 *
 * Example:
 *   using fn_t = int32_t (*)(int32_t);
 *   fn_t fn = lib.resolve("plugin_entry");
 */
class symbol_t {
public:
    symbol_t(void* symbol);

    template <typename F>
    operator F() const;

    void* address() const;

private:
    void* m_symbol;
};

/**
 * shared_library_t
 *
 * RAII wrapper around a dynamic library produced by cargo.
 *
 * Invariants:
 * - m_handle != nullptr after successful construction
 * - m_handle == nullptr only for moved-from objects
 *
 * Semantics:
 * - Loads the library in the ctor, a relative path is taken relative to the current directory
 * - Throws std::runtime_error with the dlerror() text on any load/resolve failure
 */
class shared_library_t {
public:
    shared_library_t(const std::filesystem::path& path, const load_policy_t& load_policy);

    ~shared_library_t();

    shared_library_t(const shared_library_t& other) = delete;
    shared_library_t& operator=(const shared_library_t& other) = delete;

    shared_library_t(shared_library_t&& other) noexcept;
    shared_library_t& operator=(shared_library_t&& other) noexcept;

    /**
     * Resolve a symbol by name.
     * - Throws if symbol is missing or resolution fails
     */
    symbol_t resolve(const char* symbol) const;

    const std::filesystem::path& path() const;

private:
    void close_handle() noexcept;

private:
    std::filesystem::path m_path;
    void* m_handle;
};

template <typename F>
symbol_t::operator F() const {
    return reinterpret_cast<F>(m_symbol);
}

} // namespace shared_library

#endif // CARGO_LOADER_SHARED_LIBRARY_SHARED_LIBRARY_H
