#include <cargo_loader/loader/loader.h>
#include <cargo_loader/logging/logging.h>

namespace loader {

shared_library::shared_library_t load_cdylib(const cargo::project_t& project, const shared_library::load_policy_t& load_policy) {
    const auto cdylib = cargo::build_cdylib(project);
    logging::info("loading '{}'", cdylib.string());

    return shared_library::shared_library_t(cdylib, load_policy);
}

shared_library::shared_library_t load_self_cdylib(const shared_library::load_policy_t& load_policy, std::optional<std::chrono::milliseconds> timeout) {
    const auto cdylib = cargo::build_self_cdylib(timeout);
    logging::info("loading '{}'", cdylib.string());

    return shared_library::shared_library_t(cdylib, load_policy);
}

} // namespace loader
