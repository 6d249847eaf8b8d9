#include <cargo_loader/cargo/features.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

extern char** environ;

namespace features {

static bool any_feature_variable() {
    const auto prefix = std::string_view(CARGO_FEATURE_ENV_PREFIX);
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        if (std::string_view(*entry).starts_with(prefix)) {
            return true;
        }
    }

    return false;
}

std::vector<std::string> split(const std::string& csv) {
    std::vector<std::string> result;
    std::string_view rest(csv);
    while (true) {
        const auto pos = rest.find(',');
        const auto item = rest.substr(0, pos);
        if (!item.empty()) {
            result.emplace_back(item);
        }
        if (pos == std::string_view::npos) {
            break ;
        }
        rest.remove_prefix(pos + 1);
    }

    return result;
}

std::string env_name(std::string_view feature) {
    std::string result(CARGO_FEATURE_ENV_PREFIX);
    for (char c : feature) {
        result.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    return result;
}

std::optional<std::vector<std::string>> find(const std::function<std::vector<std::string>()>& declared) {
    if (const char* explicit_features = std::getenv(FEATURES_ENV); explicit_features != nullptr) {
        return split(explicit_features);
    }

    if (!any_feature_variable()) {
        return std::nullopt;
    }

    std::vector<std::string> result;
    for (const auto& feature : declared()) {
        if (feature != "default" && std::getenv(env_name(feature).c_str()) != nullptr) {
            result.push_back(feature);
        }
    }

    if (result.empty()) {
        return std::nullopt;
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

} // namespace features
