#include <cargo_loader/cargo/cargo.h>
#include <cargo_loader/cargo/features.h>
#include <cargo_loader/loader/loader.h>

#include <charconv>
#include <chrono>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

static const constexpr unsigned long MAX_TIMEOUT_SECONDS = 7 * 24 * 60 * 60;

struct options_t {
    std::optional<std::vector<std::string>> features;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::string> symbol;
    std::vector<std::string> positional;
};

class usage_error_t : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

static void print_usage(const char* argv0) {
    std::cerr << std::format("usage: {} build <project_dir> [--features a,b] [--timeout <seconds>] [--symbol <name>]", argv0) << std::endl;
    std::cerr << std::format("       {} self [--timeout <seconds>] [--symbol <name>]", argv0) << std::endl;
    std::cerr << std::format("       {} example <name> [--timeout <seconds>]", argv0) << std::endl;
    std::cerr << std::format("       {} metadata [<dir>]", argv0) << std::endl;
}

static std::chrono::milliseconds parse_timeout(const std::string& value) {
    unsigned long seconds = 0;
    const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
    if (ec != std::errc() || end != value.data() + value.size() || seconds == 0) {
        throw usage_error_t(std::format("invalid --timeout '{}', expected a positive number of seconds", value));
    }
    if (MAX_TIMEOUT_SECONDS < seconds) {
        throw usage_error_t(std::format("invalid --timeout '{}', at most {} seconds are allowed", value, MAX_TIMEOUT_SECONDS));
    }

    return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(seconds));
}

static options_t parse_options(int argc, char** argv, int first) {
    options_t options;
    for (int i = first; i < argc; ++i) {
        const auto arg = std::string(argv[i]);
        const bool has_value = i + 1 < argc;
        if (arg == "--features") {
            if (!has_value) {
                throw usage_error_t("--features requires a value");
            }
            options.features = features::split(argv[++i]);
        } else if (arg == "--timeout") {
            if (!has_value) {
                throw usage_error_t("--timeout requires a value");
            }
            options.timeout = parse_timeout(argv[++i]);
        } else if (arg == "--symbol") {
            if (!has_value) {
                throw usage_error_t("--symbol requires a value");
            }
            options.symbol = argv[++i];
        } else if (arg.starts_with("--")) {
            throw usage_error_t(std::format("unknown option '{}'", arg));
        } else {
            options.positional.push_back(arg);
        }
    }

    return options;
}

static void expect_positional(const options_t& options, size_t min, size_t max) {
    if (options.positional.size() < min || max < options.positional.size()) {
        throw usage_error_t("wrong number of arguments");
    }
}

static void smoke_test(const shared_library::shared_library_t& library, const std::string& symbol) {
    const auto resolved = library.resolve(symbol.c_str());
    std::cerr << std::format("resolved '{}' at {}", symbol, resolved.address()) << std::endl;
    std::cout << library.path().string() << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        const auto subcommand = std::string(argv[1]);
        const auto options = parse_options(argc, argv, 2);

        if (subcommand == "build") {
            expect_positional(options, 1, 1);
            const cargo::project_t project = {
                .dir = filesystem::path_t(options.positional[0]),
                .features = options.features,
                .timeout = options.timeout
            };
            if (options.symbol.has_value()) {
                smoke_test(loader::load_cdylib(project), options.symbol.value());
            } else {
                std::cout << cargo::build_cdylib(project).string() << std::endl;
            }
        } else if (subcommand == "self") {
            expect_positional(options, 0, 0);
            if (options.symbol.has_value()) {
                smoke_test(loader::load_self_cdylib({}, options.timeout), options.symbol.value());
            } else {
                std::cout << cargo::build_self_cdylib(options.timeout).string() << std::endl;
            }
        } else if (subcommand == "example") {
            expect_positional(options, 1, 1);
            std::cout << cargo::build_example(options.positional[0], options.timeout).string() << std::endl;
        } else if (subcommand == "metadata") {
            expect_positional(options, 0, 1);
            std::optional<filesystem::path_t> dir;
            if (!options.positional.empty()) {
                dir = filesystem::path_t(options.positional[0]);
            }
            const auto metadata = cargo::metadata(dir);
            std::cout << std::format("target_directory: {}", metadata.target_directory.string()) << std::endl;
            std::cout << std::format("workspace_root: {}", metadata.workspace_root.string()) << std::endl;
        } else {
            throw usage_error_t(std::format("unknown command '{}'", subcommand));
        }
    } catch (const usage_error_t& e) {
        std::cerr << std::format("{}: {}", argv[0], e.what()) << std::endl;
        print_usage(argv[0]);
        return 1;
    } catch (const cargo::error_t& e) {
        std::cerr << std::format("{}: {}: {}", argv[0], cargo::to_string(e.kind()), e.what()) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << std::format("{}: {}", argv[0], e.what()) << std::endl;
        return 1;
    }

    return 0;
}
