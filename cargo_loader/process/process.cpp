#include <cargo_loader/process/process.h>
#include <cargo_loader/logging/logging.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <limits>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace process {

enum class child_stage_t : int {
    CHDIR,
    EXEC
};

struct child_failure_t {
    child_stage_t stage;
    int err;
};

class fd_t {
public:
    fd_t() = default;
    explicit fd_t(int fd): m_fd(fd) {}
    ~fd_t() { close(); }

    fd_t(const fd_t& other) = delete;
    fd_t& operator=(const fd_t& other) = delete;

    fd_t(fd_t&& other) noexcept: m_fd(std::exchange(other.m_fd, -1)) {}
    fd_t& operator=(fd_t&& other) noexcept {
        if (this != &other) {
            close();
            m_fd = std::exchange(other.m_fd, -1);
        }
        return *this;
    }

    int get() const { return m_fd; }
    bool valid() const { return m_fd != -1; }

    void close() {
        if (m_fd != -1) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd = -1;
};

struct pipe_t {
    fd_t read;
    fd_t write;
};

static pipe_t make_pipe(const char* what) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        throw std::runtime_error(std::format("process::run: failed to create {} pipe: {}", what, std::strerror(errno)));
    }

    return pipe_t { fd_t(fds[0]), fd_t(fds[1]) };
}

/**
 * Kills the child's process group and reaps the child unless release() was called.
 * The child leads its own process group, so whatever it spawned is killed with it.
 */
class child_guard_t {
public:
    explicit child_guard_t(pid_t pid): m_pid(pid) {}
    ~child_guard_t() {
        if (m_pid <= 0) {
            return ;
        }

        if (::kill(-m_pid, SIGKILL) == -1) {
            ::kill(m_pid, SIGKILL);
        }
        while (waitpid(m_pid, nullptr, 0) == -1 && errno == EINTR) {
        }
    }

    child_guard_t(const child_guard_t& other) = delete;
    child_guard_t& operator=(const child_guard_t& other) = delete;

    pid_t release() { return std::exchange(m_pid, -1); }

private:
    pid_t m_pid;
};

static std::string arg_to_string(const process_arg_t& arg) {
    return std::visit(
        [](auto&& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, filesystem::path_t>) {
                return v.string();
            } else {
                static_assert(false, "non-exhaustive visitor!");
            }
        },
        arg
    );
}

static std::string arg_to_pretty_string(const process_arg_t& arg) {
    return std::visit(
        [](auto&& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, filesystem::path_t>) {
                return filesystem::pretty_path_t(v).string();
            } else {
                static_assert(false, "non-exhaustive visitor!");
            }
        },
        arg
    );
}

static std::vector<std::string> make_environment(const command_t& command) {
    std::vector<std::string> result;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        result.emplace_back(*entry);
    }

    for (const auto& [key, value] : command.env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            throw std::runtime_error(std::format("process::run: invalid environment variable name '{}'", key));
        }

        const auto prefix = key + "=";
        std::erase_if(result, [&](const std::string& entry) {
            return entry.starts_with(prefix);
        });
        result.push_back(prefix + value);
    }

    return result;
}

static std::string lookup_path_variable(const std::vector<std::string>& environment) {
    for (const auto& entry : environment) {
        if (entry.starts_with("PATH=")) {
            return entry.substr(5);
        }
    }

    return "/usr/local/bin:/usr/bin:/bin";
}

static bool is_executable_file(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

static std::string resolve_program(const std::string& program, const std::vector<std::string>& environment) {
    if (program.empty()) {
        throw launch_error_t("process::run: empty program name");
    }

    if (program.find('/') != std::string::npos) {
        return program;
    }

    const auto search_path = lookup_path_variable(environment);
    std::string_view paths(search_path);
    while (true) {
        const auto pos = paths.find(':');
        const auto dir = paths.substr(0, pos);
        const auto candidate = std::format("{}/{}", dir.empty() ? "." : dir, program);
        if (is_executable_file(candidate)) {
            return candidate;
        }
        if (pos == std::string_view::npos) {
            break ;
        }
        paths.remove_prefix(pos + 1);
    }

    throw launch_error_t(std::format("process::run: failed to launch '{}': program not found on PATH", program));
}

[[noreturn]] static void child_fail(int error_fd, child_stage_t stage) {
    const child_failure_t failure = { stage, errno };
    [[maybe_unused]] const auto written = ::write(error_fd, &failure, sizeof(failure));
    _exit(127);
}

static void append_available(int fd, std::string& out, bool& open) {
    std::array<char, 4096> buffer;
    const auto n = ::read(fd, buffer.data(), buffer.size());
    if (n == -1) {
        if (errno == EINTR || errno == EAGAIN) {
            return ;
        }
        throw std::runtime_error(std::format("process::run: read failed: {}", std::strerror(errno)));
    }

    if (n == 0) {
        open = false;
    } else {
        out.append(buffer.data(), static_cast<size_t>(n));
    }
}

static int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }

    throw std::runtime_error(std::format("process::run: unreachable state reached after waitpid, status: {}", status));
}

command_t& command_t::arg(process_arg_t value) {
    args.push_back(std::move(value));
    return *this;
}

command_t& command_t::set_env(std::string key, std::string value) {
    env.emplace_back(std::move(key), std::move(value));
    return *this;
}

bool output_t::success() const {
    return exit_code == 0;
}

std::string to_string(const command_t& command) {
    std::string result;
    for (const auto& [key, value] : command.env) {
        result += std::format("{}={} ", key, value);
    }

    result += command.program;
    for (const auto& arg : command.args) {
        result += " ";
        result += arg_to_pretty_string(arg);
    }

    if (command.working_dir.has_value()) {
        result += std::format(" (in {})", filesystem::pretty_path_t(command.working_dir.value()));
    }

    return result;
}

output_t run(const command_t& command) {
    // Everything the child needs is prepared here, only async-signal-safe calls happen after fork
    const auto environment = make_environment(command);
    const auto program = resolve_program(command.program, environment);

    std::vector<std::string> arg_strings;
    arg_strings.reserve(command.args.size() + 1);
    arg_strings.push_back(command.program);
    for (const auto& arg : command.args) {
        arg_strings.push_back(arg_to_string(arg));
    }

    std::vector<char*> argv;
    for (auto& arg : arg_strings) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (const auto& entry : environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    fd_t null_fd(::open("/dev/null", O_RDWR | O_CLOEXEC));
    if (!null_fd.valid()) {
        throw std::runtime_error(std::format("process::run: failed to open /dev/null: {}", std::strerror(errno)));
    }

    auto stdout_pipe = make_pipe("stdout");
    auto error_pipe = make_pipe("error");
    pipe_t stderr_pipe;
    if (command.stderr_mode == stderr_mode_t::CAPTURE) {
        stderr_pipe = make_pipe("stderr");
    }

    if (logging::verbose()) {
        logging::info("{}", to_string(command));
    }

    const pid_t pid = fork();
    if (pid == -1) {
        throw std::runtime_error(std::format("process::run: fork failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        const int error_fd = error_pipe.write.get();
        if (::setpgid(0, 0) == -1) {
            child_fail(error_fd, child_stage_t::EXEC);
        }
        if (::dup2(null_fd.get(), STDIN_FILENO) == -1 || ::dup2(stdout_pipe.write.get(), STDOUT_FILENO) == -1) {
            child_fail(error_fd, child_stage_t::EXEC);
        }

        switch (command.stderr_mode) {
            case stderr_mode_t::INHERIT: {
            } break ;
            case stderr_mode_t::CAPTURE: {
                if (::dup2(stderr_pipe.write.get(), STDERR_FILENO) == -1) {
                    child_fail(error_fd, child_stage_t::EXEC);
                }
            } break ;
            case stderr_mode_t::DISCARD: {
                if (::dup2(null_fd.get(), STDERR_FILENO) == -1) {
                    child_fail(error_fd, child_stage_t::EXEC);
                }
            } break ;
        }

        if (command.working_dir.has_value() && ::chdir(command.working_dir->c_str()) == -1) {
            child_fail(error_fd, child_stage_t::CHDIR);
        }

        ::execve(program.c_str(), argv.data(), envp.data());
        child_fail(error_fd, child_stage_t::EXEC);
    }

    child_guard_t child_guard(pid);

    stdout_pipe.write.close();
    stderr_pipe.write.close();
    error_pipe.write.close();

    // The error pipe is close-on-exec: EOF means execve succeeded
    child_failure_t failure;
    ssize_t n_failure_bytes;
    do {
        n_failure_bytes = ::read(error_pipe.read.get(), &failure, sizeof(failure));
    } while (n_failure_bytes == -1 && errno == EINTR);

    if (n_failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
        switch (failure.stage) {
            case child_stage_t::CHDIR: {
                throw launch_error_t(std::format("process::run: failed to launch '{}': cannot enter working directory '{}': {}", command.program, command.working_dir->string(), std::strerror(failure.err)));
            } break ;
            case child_stage_t::EXEC: {
                throw launch_error_t(std::format("process::run: failed to launch '{}': {}", command.program, std::strerror(failure.err)));
            } break ;
        }
    }

    output_t output = {
        .exit_code = 0,
        .stdout_bytes = {},
        .stderr_bytes = {}
    };

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (command.timeout.has_value()) {
        // Saturate instead of overflowing the clock for very long timeouts
        const auto now = std::chrono::steady_clock::now();
        const auto max_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::time_point::max() - now);
        deadline = now + std::min(command.timeout.value(), max_timeout);
    }

    bool stdout_open = true;
    bool stderr_open = stderr_pipe.read.valid();
    while (stdout_open || stderr_open) {
        std::array<pollfd, 2> pollfds;
        nfds_t n_pollfds = 0;
        if (stdout_open) {
            pollfds[n_pollfds++] = pollfd { stdout_pipe.read.get(), POLLIN, 0 };
        }
        if (stderr_open) {
            pollfds[n_pollfds++] = pollfd { stderr_pipe.read.get(), POLLIN, 0 };
        }

        int poll_timeout_ms = -1;
        if (deadline.has_value()) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline.value() - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                throw timeout_error_t(std::format("process::run: '{}' did not finish within {} ms", command.program, command.timeout->count()));
            }
            poll_timeout_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(remaining.count(), std::numeric_limits<int>::max()));
        }

        const int poll_result = ::poll(pollfds.data(), n_pollfds, poll_timeout_ms);
        if (poll_result == -1) {
            if (errno == EINTR) {
                continue ;
            }
            throw std::runtime_error(std::format("process::run: poll failed: {}", std::strerror(errno)));
        }

        for (nfds_t i = 0; i < n_pollfds; ++i) {
            if ((pollfds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue ;
            }

            if (pollfds[i].fd == stdout_pipe.read.get()) {
                append_available(pollfds[i].fd, output.stdout_bytes, stdout_open);
            } else {
                append_available(pollfds[i].fd, output.stderr_bytes, stderr_open);
            }
        }
    }

    // Both pipes are closed but the child may still be running, e.g. after closing its stdout
    int status = 0;
    while (true) {
        const pid_t wait_result = ::waitpid(pid, &status, deadline.has_value() ? WNOHANG : 0);
        if (wait_result == pid) {
            break ;
        }
        if (wait_result == -1) {
            if (errno == EINTR) {
                continue ;
            }
            throw std::runtime_error(std::format("process::run: waitpid failed: {}", std::strerror(errno)));
        }

        if (deadline.value() <= std::chrono::steady_clock::now()) {
            throw timeout_error_t(std::format("process::run: '{}' did not finish within {} ms", command.program, command.timeout->count()));
        }
        ::usleep(1000);
    }
    child_guard.release();

    output.exit_code = decode_wait_status(status);
    return output;
}

} // namespace process
