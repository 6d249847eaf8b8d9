#ifndef CARGO_LOADER_CARGO_MESSAGE_H
# define CARGO_LOADER_CARGO_MESSAGE_H

# include <cargo_loader/process/process.h>

# include <filesystem>
# include <functional>
# include <optional>
# include <string>
# include <string_view>
# include <variant>
# include <vector>

/**
 * Decoding of the newline-delimited JSON that `cargo build --message-format=json` prints.
 *
 * Every line is an object tagged by "reason". Known reasons must carry their required
 * fields, unknown reasons are accepted and ignored.
 */
namespace cargo {

struct compiler_message_t {
    std::string message;
    std::optional<std::string> rendered;

    /**
     * The human readable diagnostic, `rendered` when cargo provided it.
     */
    const std::string& text() const;
};

struct compiler_artifact_t {
    std::optional<std::string> target_name;
    std::vector<std::filesystem::path> filenames;
};

struct build_script_executed_t {
};

struct build_finished_t {
    bool success;
};

struct unknown_message_t {
    std::string reason;
};

using message_t = std::variant<
    compiler_message_t,
    compiler_artifact_t,
    build_script_executed_t,
    build_finished_t,
    unknown_message_t
>;

inline const constexpr char* REASON_COMPILER_MESSAGE = "compiler-message";
inline const constexpr char* REASON_COMPILER_ARTIFACT = "compiler-artifact";
inline const constexpr char* REASON_BUILD_SCRIPT_EXECUTED = "build-script-executed";
inline const constexpr char* REASON_BUILD_FINISHED = "build-finished";

/**
 * Decodes a single line. Throws error_t(MESSAGE_DECODE).
 */
message_t parse_message(std::string_view line);

/**
 * Decodes `bytes` line by line and calls `on_message` in stream order.
 * Blank lines are skipped, the first undecodable line throws error_t(MESSAGE_DECODE)
 * and no later line is looked at.
 */
void parse_stream(std::string_view bytes, const std::function<void(message_t&& message)>& on_message);

/**
 * Checks for a .so, .dylib or .dll extension, regardless of the host platform.
 */
bool is_cdylib(const std::filesystem::path& filename);

/**
 * Turns a finished `cargo build` into the path of its dynamic library.
 *
 * - Diagnostics are written to standard error as they are decoded
 * - The last compiler-artifact message wins
 * - Non-zero exit, or zero exit without any artifact: error_t(BUILD_FAILED)
 * - No filename of the artifact is a dynamic library: error_t(CDYLIB_NOT_FOUND)
 *
 * The returned path is exactly what cargo reported.
 */
std::filesystem::path parse_output(const process::output_t& output);

} // namespace cargo

#endif // CARGO_LOADER_CARGO_MESSAGE_H
