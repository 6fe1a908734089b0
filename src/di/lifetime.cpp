#include "weave/di/lifetime.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace weave::di {

std::string to_string(ServiceLifetime lifetime) {
    switch (lifetime) {
        case ServiceLifetime::TRANSIENT:
            return "transient";
        case ServiceLifetime::SCOPED:
            return "scoped";
        case ServiceLifetime::SINGLETON:
            return "singleton";
    }
    return "unknown";
}

ServiceLifetime lifetime_from_string(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "transient") return ServiceLifetime::TRANSIENT;
    if (lower == "scoped") return ServiceLifetime::SCOPED;
    if (lower == "singleton") return ServiceLifetime::SINGLETON;

    throw std::invalid_argument("Invalid service lifetime: " + value);
}

}  // namespace weave::di
