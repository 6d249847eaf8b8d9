#include <cargo_loader/cargo/message.h>
#include <cargo_loader/cargo/error.h>
#include <cargo_loader/logging/logging.h>

#include <nlohmann/json.hpp>

#include <format>
#include <iostream>

namespace cargo {

static constexpr size_t MAX_QUOTED_LINE_LENGTH = 120;

static std::string quote_line(std::string_view line) {
    if (line.size() <= MAX_QUOTED_LINE_LENGTH) {
        return std::string(line);
    }

    return std::format("{}...", line.substr(0, MAX_QUOTED_LINE_LENGTH));
}

[[noreturn]] static void throw_decode_error(std::string_view reason, std::string_view detail) {
    throw error_t(error_kind_t::MESSAGE_DECODE, std::format("invalid '{}' message: {}", reason, detail));
}

static std::optional<std::string> optional_string(const nlohmann::json& object, const char* key, std::string_view reason) {
    const auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw_decode_error(reason, std::format("'{}' is not a string", key));
    }

    return it->get<std::string>();
}

static compiler_message_t decode_compiler_message(const nlohmann::json& json) {
    const auto message_it = json.find("message");
    if (message_it == json.end() || !message_it->is_object()) {
        throw_decode_error(REASON_COMPILER_MESSAGE, "missing 'message' object");
    }

    const auto text = optional_string(*message_it, "message", REASON_COMPILER_MESSAGE);
    if (!text.has_value()) {
        throw_decode_error(REASON_COMPILER_MESSAGE, "missing 'message.message' string");
    }

    return compiler_message_t {
        .message = text.value(),
        .rendered = optional_string(*message_it, "rendered", REASON_COMPILER_MESSAGE)
    };
}

static compiler_artifact_t decode_compiler_artifact(const nlohmann::json& json) {
    const auto filenames_it = json.find("filenames");
    if (filenames_it == json.end() || !filenames_it->is_array()) {
        throw_decode_error(REASON_COMPILER_ARTIFACT, "missing 'filenames' array");
    }

    compiler_artifact_t artifact;
    for (const auto& filename : filenames_it->get_ref<const nlohmann::json::array_t&>()) {
        if (!filename.is_string()) {
            throw_decode_error(REASON_COMPILER_ARTIFACT, "'filenames' array must contain only strings");
        }
        artifact.filenames.emplace_back(filename.get<std::string>());
    }

    const auto target_it = json.find("target");
    if (target_it != json.end() && target_it->is_object()) {
        artifact.target_name = optional_string(*target_it, "name", REASON_COMPILER_ARTIFACT);
    }

    return artifact;
}

static build_finished_t decode_build_finished(const nlohmann::json& json) {
    const auto success_it = json.find("success");
    if (success_it == json.end() || !success_it->is_boolean()) {
        throw_decode_error(REASON_BUILD_FINISHED, "missing 'success' boolean");
    }

    return build_finished_t { .success = success_it->get<bool>() };
}

const std::string& compiler_message_t::text() const {
    return rendered.has_value() ? rendered.value() : message;
}

message_t parse_message(std::string_view line) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw error_t(error_kind_t::MESSAGE_DECODE, std::format("not a json document: {}", e.what()));
    }

    if (!json.is_object()) {
        throw error_t(error_kind_t::MESSAGE_DECODE, "message is not a json object");
    }

    const auto reason_it = json.find("reason");
    if (reason_it == json.end() || !reason_it->is_string()) {
        throw error_t(error_kind_t::MESSAGE_DECODE, "message has no 'reason' string");
    }

    const auto& reason = reason_it->get_ref<const std::string&>();
    if (reason == REASON_COMPILER_MESSAGE) {
        return decode_compiler_message(json);
    } else if (reason == REASON_COMPILER_ARTIFACT) {
        return decode_compiler_artifact(json);
    } else if (reason == REASON_BUILD_SCRIPT_EXECUTED) {
        return build_script_executed_t {};
    } else if (reason == REASON_BUILD_FINISHED) {
        return decode_build_finished(json);
    }

    return unknown_message_t { .reason = reason };
}

void parse_stream(std::string_view bytes, const std::function<void(message_t&& message)>& on_message) {
    size_t line_number = 0;
    while (!bytes.empty()) {
        const auto pos = bytes.find('\n');
        auto line = bytes.substr(0, pos);
        bytes.remove_prefix(pos == std::string_view::npos ? bytes.size() : pos + 1);
        ++line_number;

        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        if (line.find_first_not_of(" \t") == std::string_view::npos) {
            continue ;
        }

        message_t message;
        try {
            message = parse_message(line);
        } catch (const error_t& e) {
            throw error_t(e.kind(), std::format("cargo message stream, line {}: {} (line: '{}')", line_number, e.what(), quote_line(line)));
        }

        on_message(std::move(message));
    }
}

bool is_cdylib(const std::filesystem::path& filename) {
    const auto extension = filename.extension();
    return extension == ".dll" || extension == ".dylib" || extension == ".so";
}

std::filesystem::path parse_output(const process::output_t& output) {
    std::optional<compiler_artifact_t> artifact;

    parse_stream(output.stdout_bytes, [&](message_t&& message) {
        std::visit(
            [&](auto&& m) {
                using T = std::decay_t<decltype(m)>;
                if constexpr (std::is_same_v<T, compiler_message_t>) {
                    std::cerr << m.text() << std::endl;
                } else if constexpr (std::is_same_v<T, compiler_artifact_t>) {
                    artifact = std::move(m);
                } else if constexpr (std::is_same_v<T, unknown_message_t>) {
                    logging::info("ignoring cargo message with reason '{}'", m.reason);
                }
            },
            std::move(message)
        );
    });

    if (!output.success()) {
        if (output.exit_code < 0) {
            throw error_t(error_kind_t::BUILD_FAILED, std::format("cargo build terminated by signal {}", -output.exit_code));
        }
        throw error_t(error_kind_t::BUILD_FAILED, std::format("cargo build failed with exit code {}", output.exit_code));
    }

    if (!artifact.has_value()) {
        throw error_t(error_kind_t::BUILD_FAILED, "cargo build succeeded but reported no compiler artifact");
    }

    for (const auto& filename : artifact->filenames) {
        if (is_cdylib(filename)) {
            logging::info("selected dynamic library '{}'", filename.string());
            return filename;
        }
    }

    throw error_t(error_kind_t::CDYLIB_NOT_FOUND, std::format("artifact{} has no dynamic library among its {} output file(s), is crate-type \"cdylib\" set?", artifact->target_name.has_value() ? std::format(" '{}'", artifact->target_name.value()) : "", artifact->filenames.size()));
}

} // namespace cargo
