#ifndef CARGO_LOADER_CARGO_RUSTFLAGS_H
# define CARGO_LOADER_CARGO_RUSTFLAGS_H

# include <cargo_loader/process/process.h>

# include <string>
# include <vector>

namespace rustflags {

inline const constexpr char* RUSTFLAGS_ENV = "RUSTFLAGS";

/**
 * Flags every loader build passes to rustc.
 */
std::vector<std::string> make_vec();

/**
 * Appends make_vec() to an inherited RUSTFLAGS and sets the result on `command`.
 * Leaves `command` untouched when RUSTFLAGS is unset, so cargo's own configuration applies.
 */
void set_env(process::command_t& command);

} // namespace rustflags

#endif // CARGO_LOADER_CARGO_RUSTFLAGS_H
