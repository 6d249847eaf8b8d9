#include <cargo_loader/cargo/cargo.h>
#include <cargo_loader/cargo/features.h>
#include <cargo_loader/cargo/rustflags.h>
#include <cargo_loader/logging/logging.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace cargo {

static process::command_t raw_cargo() {
    return process::command_t { .program = program() };
}

static std::filesystem::path run_build(const process::command_t& command) {
    process::output_t output;
    try {
        output = process::run(command);
    } catch (const process::launch_error_t& e) {
        throw error_t(error_kind_t::PROCESS_LAUNCH, e.what());
    } catch (const process::timeout_error_t& e) {
        throw error_t(error_kind_t::BUILD_FAILED, e.what());
    }

    return parse_output(output);
}

static std::filesystem::path required_path(const nlohmann::json& json, const char* key) {
    const auto it = json.find(key);
    if (it == json.end()) {
        throw error_t(error_kind_t::METADATA_DECODE, std::format("cargo metadata: missing field '{}'", key));
    }
    if (!it->is_string()) {
        throw error_t(error_kind_t::METADATA_DECODE, std::format("cargo metadata: field '{}' is not a string", key));
    }

    return std::filesystem::path(it->get<std::string>());
}

static nlohmann::json parse_metadata_document(std::string_view document) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(document.begin(), document.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw error_t(error_kind_t::METADATA_DECODE, std::format("cargo metadata: not a json document: {}", e.what()));
    }

    if (!json.is_object()) {
        throw error_t(error_kind_t::METADATA_DECODE, "cargo metadata: document is not a json object");
    }

    return json;
}

static std::vector<std::string> package_features(const nlohmann::json& package) {
    const auto it = package.find("features");
    if (it == package.end() || !it->is_object()) {
        throw error_t(error_kind_t::METADATA_DECODE, "cargo metadata: package has no 'features' object");
    }

    std::vector<std::string> result;
    for (const auto& item : it->items()) {
        result.push_back(item.key());
    }

    return result;
}

/**
 * Runs `cargo metadata` with the extra arguments and decodes its output with `decode`.
 * Cargo's stderr is attached to decode errors.
 */
template <typename T>
static T query_metadata(const std::vector<std::string>& extra_args, const std::optional<filesystem::path_t>& dir, const std::function<T(std::string_view)>& decode) {
    auto command = raw_cargo();
    command.arg("metadata");
    for (const auto& arg : extra_args) {
        command.arg(arg);
    }
    command.arg("--format-version=1");
    command.working_dir = dir;
    command.stderr_mode = process::stderr_mode_t::CAPTURE;

    process::output_t output;
    try {
        output = process::run(command);
    } catch (const process::launch_error_t& e) {
        throw error_t(error_kind_t::PROCESS_LAUNCH, e.what());
    }

    try {
        return decode(output.stdout_bytes);
    } catch (const error_t& e) {
        if (output.success() && output.stderr_bytes.empty()) {
            throw;
        }
        throw error_t(e.kind(), std::format("{} (cargo exited with code {}: {})", e.what(), output.exit_code, output.stderr_bytes));
    }
}

static std::optional<std::vector<std::string>> discover_features() {
    return features::find([] {
        const auto dir = filesystem::current_path();
        auto declared = query_metadata<std::vector<std::string>>({ "--no-deps" }, dir, [&](std::string_view document) {
            return parse_declared_features(document, dir);
        });
        logging::info("crate in {} declares {} features", dir, declared.size());
        return declared;
    });
}

std::string program() {
    const char* cargo = std::getenv(CARGO_ENV);
    if (cargo == nullptr || *cargo == '\0') {
        return DEFAULT_CARGO;
    }

    return cargo;
}

bool supports_offline() {
    static std::mutex cache_mutex;
    static std::unordered_map<std::string, bool> cache;

    auto probe = raw_cargo();
    probe.arg("--version").arg("--offline");
    probe.stderr_mode = process::stderr_mode_t::DISCARD;

    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        const auto it = cache.find(probe.program);
        if (it != cache.end()) {
            return it->second;
        }
    }

    bool supported = false;
    try {
        supported = process::run(probe).success();
    } catch (const std::exception& e) {
        logging::info("offline probe failed, building without --offline: {}", e.what());
    }

    std::lock_guard<std::mutex> lock(cache_mutex);
    cache.emplace(probe.program, supported);
    return supported;
}

std::vector<std::string> feature_args(const std::optional<std::vector<std::string>>& features) {
    if (!features.has_value()) {
        return {};
    }

    std::string csv;
    for (const auto& feature : features.value()) {
        if (!csv.empty()) {
            csv += ",";
        }
        csv += feature;
    }

    return { "--no-default-features", "--features", csv };
}

process::command_t build_command(const std::optional<std::vector<std::string>>& features) {
    auto command = raw_cargo();
    if (supports_offline()) {
        command.arg("--offline");
    }

    command.arg("build").arg("--message-format=json");
    for (auto& arg : feature_args(features)) {
        command.arg(std::move(arg));
    }

    rustflags::set_env(command);
    return command;
}

std::filesystem::path build_cdylib(const project_t& project) {
    if (!filesystem::is_directory(project.dir)) {
        throw error_t(error_kind_t::PROCESS_LAUNCH, std::format("build_cdylib: project directory '{}' does not exist", project.dir));
    }

    auto command = build_command(project.features);
    command.working_dir = project.dir;
    command.set_env(CARGO_TARGET_DIR_ENV, (project.dir / "target").string());
    command.timeout = project.timeout;

    return run_build(command);
}

std::filesystem::path build_self_cdylib(std::optional<std::chrono::milliseconds> timeout) {
    auto command = build_command(discover_features());
    command.arg("--lib");
    command.timeout = timeout;

    return run_build(command);
}

std::filesystem::path build_example(const std::string& name, std::optional<std::chrono::milliseconds> timeout) {
    auto command = build_command(discover_features());
    command.arg("--example").arg(name);
    command.timeout = timeout;

    return run_build(command);
}

metadata_t parse_metadata(std::string_view document) {
    const auto json = parse_metadata_document(document);

    return metadata_t {
        .target_directory = required_path(json, "target_directory"),
        .workspace_root = required_path(json, "workspace_root")
    };
}

std::vector<std::string> parse_declared_features(std::string_view document, const filesystem::path_t& dir) {
    const auto json = parse_metadata_document(document);

    const auto packages = json.find("packages");
    if (packages == json.end() || !packages->is_array()) {
        throw error_t(error_kind_t::METADATA_DECODE, "cargo metadata: missing 'packages' array");
    }

    for (const auto& package : *packages) {
        if (!package.is_object()) {
            throw error_t(error_kind_t::METADATA_DECODE, "cargo metadata: package is not a json object");
        }
        if (filesystem::path_t(required_path(package, "manifest_path")).parent() == dir) {
            return package_features(package);
        }
    }

    if (packages->size() == 1) {
        return package_features(packages->front());
    }

    throw error_t(error_kind_t::METADATA_DECODE, std::format("cargo metadata: no package with its manifest in '{}'", dir));
}

metadata_t metadata(const std::optional<filesystem::path_t>& dir) {
    return query_metadata<metadata_t>({}, dir, parse_metadata);
}

} // namespace cargo
