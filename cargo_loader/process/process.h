#ifndef CARGO_LOADER_PROCESS_PROCESS_H
# define CARGO_LOADER_PROCESS_PROCESS_H

# include <cargo_loader/filesystem/filesystem.h>

# include <chrono>
# include <optional>
# include <stdexcept>
# include <string>
# include <utility>
# include <variant>
# include <vector>

namespace process {

using process_arg_t = std::variant<std::string, filesystem::path_t>;

enum class stderr_mode_t {
    INHERIT, // Child writes straight to our standard error
    CAPTURE, // Collected into output_t::stderr_bytes
    DISCARD // Redirected to /dev/null
};

/**
 * command_t
 *
 * Description of a single child process.
 *
 * Semantics:
 * - `program` without a '/' is searched on PATH (the overridden PATH if `env` sets one)
 * - `env` entries are applied on top of the inherited environment, later entries win
 * - Standard input is always /dev/null, standard output is always captured
 * - The child leads a new process group
 */
struct command_t {
    std::string program;
    std::vector<process_arg_t> args;
    std::optional<filesystem::path_t> working_dir;
    std::vector<std::pair<std::string, std::string>> env;
    stderr_mode_t stderr_mode = stderr_mode_t::INHERIT;
    std::optional<std::chrono::milliseconds> timeout;

    command_t& arg(process_arg_t value);
    command_t& set_env(std::string key, std::string value);
};

struct output_t {
    /**
     * Non-negative exit code, or the negated number of the signal that terminated the child.
     */
    int exit_code;
    std::string stdout_bytes;
    std::string stderr_bytes;

    bool success() const;
};

/**
 * Thrown when the program could not be started at all: not found, not executable,
 * or the working directory could not be entered.
 */
class launch_error_t : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Thrown after the child's process group was killed because command_t::timeout expired.
 */
class timeout_error_t : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Runs the command to completion and returns its exit status and captured output.
 *
 * Throws launch_error_t, timeout_error_t, or std::runtime_error on system call failures.
 */
output_t run(const command_t& command);

/**
 * Renders the command line for display, e.g. "cargo build --message-format=json".
 */
std::string to_string(const command_t& command);

} // namespace process

#endif // CARGO_LOADER_PROCESS_PROCESS_H
