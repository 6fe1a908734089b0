#pragma once

#include <string>

namespace weave::di {

/**
 * @brief Service lifetime scope
 */
enum class ServiceLifetime {
    TRANSIENT,  // New instance every time
    SCOPED,     // Single instance per activation scope
    SINGLETON   // Single instance per service provider
};

std::string to_string(ServiceLifetime lifetime);

/**
 * @brief Parse "transient", "scoped" or "singleton" (case-insensitive)
 * @throws std::invalid_argument for any other value
 */
ServiceLifetime lifetime_from_string(const std::string& value);

}  // namespace weave::di
