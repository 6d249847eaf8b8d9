#ifndef CARGO_LOADER_CARGO_CARGO_H
# define CARGO_LOADER_CARGO_CARGO_H

# include <cargo_loader/cargo/error.h>
# include <cargo_loader/cargo/message.h>
# include <cargo_loader/filesystem/filesystem.h>
# include <cargo_loader/process/process.h>

# include <chrono>
# include <filesystem>
# include <optional>
# include <string>
# include <string_view>
# include <vector>

namespace cargo {

inline const constexpr char* CARGO_ENV = "CARGO";
inline const constexpr char* CARGO_TARGET_DIR_ENV = "CARGO_TARGET_DIR";
inline const constexpr char* DEFAULT_CARGO = "cargo";

/**
 * project_t
 *
 * A crate to be built into a dynamic library.
 *
 * - `features`: std::nullopt builds default features, otherwise exactly the listed ones
 * - `timeout`: cargo is killed and the build fails once it runs longer
 */
struct project_t {
    filesystem::path_t dir;
    std::optional<std::vector<std::string>> features;
    std::optional<std::chrono::milliseconds> timeout;
};

struct metadata_t {
    std::filesystem::path target_directory;
    std::filesystem::path workspace_root;
};

/**
 * The cargo executable: $CARGO when set, "cargo" from PATH otherwise.
 */
std::string program();

/**
 * Whether `cargo --version --offline` succeeds. Any failure, including a missing cargo,
 * counts as unsupported. Cached per program for the lifetime of the process.
 */
bool supports_offline();

std::vector<std::string> feature_args(const std::optional<std::vector<std::string>>& features);

/**
 * `cargo [--offline] build --message-format=json [--no-default-features --features <csv>]`
 * with the loader's RUSTFLAGS applied.
 */
process::command_t build_command(const std::optional<std::vector<std::string>>& features);

/**
 * Builds `project` with its own target directory (<dir>/target) and returns its dynamic library.
 */
std::filesystem::path build_cdylib(const project_t& project);

/**
 * Builds the library of the crate in the current directory with discovered features.
 * Names from CARGO_FEATURE_ variables are matched against `cargo metadata --no-deps`.
 */
std::filesystem::path build_self_cdylib(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/**
 * Builds example `name` of the crate in the current directory with discovered features.
 */
std::filesystem::path build_example(const std::string& name, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

/**
 * Runs `cargo metadata --format-version=1`, in `dir` when given.
 */
metadata_t metadata(const std::optional<filesystem::path_t>& dir = std::nullopt);

/**
 * Decodes a `cargo metadata` document, unknown fields are ignored. Throws error_t(METADATA_DECODE).
 */
metadata_t parse_metadata(std::string_view document);

/**
 * Feature names declared by the package whose Cargo.toml is in `dir`, or by the only package
 * of a `cargo metadata --no-deps` document. Throws error_t(METADATA_DECODE).
 */
std::vector<std::string> parse_declared_features(std::string_view document, const filesystem::path_t& dir);

} // namespace cargo

#endif // CARGO_LOADER_CARGO_CARGO_H
