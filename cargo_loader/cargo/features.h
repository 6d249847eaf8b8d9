#ifndef CARGO_LOADER_CARGO_FEATURES_H
# define CARGO_LOADER_CARGO_FEATURES_H

# include <functional>
# include <optional>
# include <string>
# include <string_view>
# include <vector>

namespace features {

inline const constexpr char* FEATURES_ENV = "CARGO_LOADER_FEATURES";
inline const constexpr char* CARGO_FEATURE_ENV_PREFIX = "CARGO_FEATURE_";

/**
 * Discovers the feature set for builds of the host crate and its examples.
 *
 * In order of precedence:
 * - CARGO_LOADER_FEATURES: comma separated, empty items dropped, "" selects no features
 * - CARGO_FEATURE_<NAME> variables exported by cargo: the features returned by `declared`
 *   whose variable is set, sorted, "default" dropped
 * - std::nullopt: the crate's default features
 *
 * cargo upper-cases feature names and turns '-' into '_', so "foo-bar" and "foo_bar" share a
 * variable and the spelling has to come from the crate's declared features.
 * `declared` is only called when some CARGO_FEATURE_ variable is set.
 */
std::optional<std::vector<std::string>> find(const std::function<std::vector<std::string>()>& declared);

/**
 * The variable cargo sets for an enabled feature, e.g. "std-alloc" -> "CARGO_FEATURE_STD_ALLOC".
 */
std::string env_name(std::string_view feature);

/**
 * Splits "a,b,,c" into {"a", "b", "c"}.
 */
std::vector<std::string> split(const std::string& csv);

} // namespace features

#endif // CARGO_LOADER_CARGO_FEATURES_H
