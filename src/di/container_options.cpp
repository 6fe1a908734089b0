#include "weave/di/container_options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace weave::di {

std::string to_string(AliasAmbiguityPolicy policy) {
    switch (policy) {
        case AliasAmbiguityPolicy::DEFER:
            return "defer";
        case AliasAmbiguityPolicy::EAGER:
            return "eager";
    }
    return "unknown";
}

AliasAmbiguityPolicy alias_policy_from_string(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "defer") return AliasAmbiguityPolicy::DEFER;
    if (lower == "eager") return AliasAmbiguityPolicy::EAGER;

    throw std::invalid_argument("Invalid alias ambiguity policy: " + value);
}

}  // namespace weave::di
