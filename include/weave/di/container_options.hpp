#pragma once

#include <string>

namespace weave::di {

/**
 * @brief What build_provider() does with an inferred name shared by several
 * services
 */
enum class AliasAmbiguityPolicy {
    DEFER,  // Leave the name out of the provider; fail only if a dependency uses it
    EAGER   // Fail the build
};

std::string to_string(AliasAmbiguityPolicy policy);

/// @throws std::invalid_argument for anything but "defer" or "eager"
AliasAmbiguityPolicy alias_policy_from_string(const std::string& value);

struct ContainerOptions {
    /// Disables alias inference and name-based dependency resolution
    bool strict = false;
    AliasAmbiguityPolicy alias_ambiguity = AliasAmbiguityPolicy::DEFER;
};

}  // namespace weave::di
