#include <cargo_loader/cargo/error.h>

#include <format>
#include <type_traits>

namespace cargo {

std::string_view to_string(error_kind_t kind) {
    switch (kind) {
        case error_kind_t::PROCESS_LAUNCH: return "process launch error";
        case error_kind_t::MESSAGE_DECODE: return "message decode error";
        case error_kind_t::BUILD_FAILED: return "build failed";
        case error_kind_t::CDYLIB_NOT_FOUND: return "cdylib not found";
        case error_kind_t::METADATA_DECODE: return "metadata decode error";
        default: throw std::runtime_error(std::format("cargo::to_string: unknown error_kind {}", static_cast<std::underlying_type_t<error_kind_t>>(kind)));
    }
}

error_t::error_t(error_kind_t kind, const std::string& what):
    std::runtime_error(what),
    m_kind(kind)
{
}

error_kind_t error_t::kind() const noexcept {
    return m_kind;
}

} // namespace cargo
