#ifndef CARGO_LOADER_CARGO_ERROR_H
# define CARGO_LOADER_CARGO_ERROR_H

# include <stdexcept>
# include <string>
# include <string_view>

namespace cargo {

enum class error_kind_t {
    PROCESS_LAUNCH, // cargo could not be started
    MESSAGE_DECODE, // A line of the build message stream has an unknown shape
    BUILD_FAILED, // Non-zero exit, no artifact reported, or timed out
    CDYLIB_NOT_FOUND, // The artifact has no .so/.dylib/.dll output
    METADATA_DECODE // `cargo metadata` output has an unexpected shape
};

std::string_view to_string(error_kind_t kind);

/**
 * error_t
 *
 * Every failure of the cargo module is reported as error_t; what() holds the detail,
 * kind() tells the caller which remedy applies. Nothing is retried.
 */
class error_t : public std::runtime_error {
public:
    error_t(error_kind_t kind, const std::string& what);

    error_kind_t kind() const noexcept;

private:
    error_kind_t m_kind;
};

} // namespace cargo

#endif // CARGO_LOADER_CARGO_ERROR_H
