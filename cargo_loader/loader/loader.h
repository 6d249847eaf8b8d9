#ifndef CARGO_LOADER_LOADER_LOADER_H
# define CARGO_LOADER_LOADER_LOADER_H

# include <cargo_loader/cargo/cargo.h>
# include <cargo_loader/shared_library/shared_library.h>

namespace loader {

/**
 * Builds `project` and loads the resulting dynamic library.
 * Build failures propagate as cargo::error_t, load failures as std::runtime_error.
 */
shared_library::shared_library_t load_cdylib(const cargo::project_t& project, const shared_library::load_policy_t& load_policy = {});

/**
 * Builds the library of the crate in the current directory and loads it.
 */
shared_library::shared_library_t load_self_cdylib(const shared_library::load_policy_t& load_policy = {}, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

} // namespace loader

#endif // CARGO_LOADER_LOADER_LOADER_H
