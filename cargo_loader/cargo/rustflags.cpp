#include <cargo_loader/cargo/rustflags.h>

#include <cstdlib>

namespace rustflags {

static const char* const IGNORED_LINTS[] = {
    "dead_code"
};

std::vector<std::string> make_vec() {
    std::vector<std::string> result = { "--cfg", "cargo_loader" };
    for (const char* lint : IGNORED_LINTS) {
        result.push_back("-A");
        result.push_back(lint);
    }

    return result;
}

void set_env(process::command_t& command) {
    const char* inherited = std::getenv(RUSTFLAGS_ENV);
    if (inherited == nullptr) {
        return ;
    }

    std::string value(inherited);
    for (const auto& flag : make_vec()) {
        if (!value.empty()) {
            value += " ";
        }
        value += flag;
    }

    command.set_env(RUSTFLAGS_ENV, value);
}

} // namespace rustflags
