#ifndef CARGO_LOADER_LOGGING_LOGGING_H
# define CARGO_LOADER_LOGGING_LOGGING_H

# include <format>
# include <string_view>
# include <utility>

namespace logging {

inline const constexpr char* PREFIX = "cargo_loader";
inline const constexpr char* VERBOSE_ENV = "CARGO_LOADER_VERBOSE";

/**
 * True when CARGO_LOADER_VERBOSE is set to anything other than "" or "0".
 * Read on every call so hosts may toggle it at runtime.
 */
bool verbose();

/**
 * Writes "[cargo_loader] <msg>" to standard error.
 * Standard output is never used, it carries results.
 */
void write(std::string_view msg);

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (!verbose()) {
        return ;
    }

    write(std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging

#endif // CARGO_LOADER_LOGGING_LOGGING_H
