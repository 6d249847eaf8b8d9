#include <cargo_loader/logging/logging.h>

#include <cstdlib>
#include <iostream>

namespace logging {

bool verbose() {
    const char* value = std::getenv(VERBOSE_ENV);
    if (value == nullptr) {
        return false;
    }

    const auto value_view = std::string_view(value);
    return !value_view.empty() && value_view != "0";
}

void write(std::string_view msg) {
    std::cerr << std::format("[{}] {}", PREFIX, msg) << std::endl;
}

} // namespace logging
