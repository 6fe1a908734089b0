#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <typeindex>
#include <variant>

namespace weave::di {

/**
 * @brief Identifies a registration: either a C++ type or a free-text name
 *
 * Type keys carry a canonical name derived from the demangled type name with
 * namespace and enclosing-scope qualifiers stripped, so that
 * `app::db::SqlRepo` is known as "SqlRepo".
 */
class ServiceKey {
public:
    ServiceKey(std::type_index type) : value_(type) {}
    ServiceKey(std::string name) : value_(std::move(name)) {}
    ServiceKey(const char* name) : value_(std::string(name)) {}

    bool is_type() const {
        return std::holds_alternative<std::type_index>(value_);
    }
    bool is_name() const { return !is_type(); }

    /// Only valid when is_type()
    std::type_index type() const { return std::get<std::type_index>(value_); }

    /// Canonical name: short type name, or the string itself
    std::string name() const;

    /// Fully qualified demangled type name, or the string itself
    std::string full_name() const;

    /// True for template instantiations, which are never indexed by name
    bool is_generic() const;

    bool operator==(const ServiceKey& other) const {
        return value_ == other.value_;
    }
    bool operator!=(const ServiceKey& other) const {
        return !(*this == other);
    }

    std::size_t hash() const noexcept;

private:
    std::variant<std::type_index, std::string> value_;
};

template <typename T>
ServiceKey key_of() {
    return ServiceKey(std::type_index(typeid(T)));
}

std::ostream& operator<<(std::ostream& os, const ServiceKey& key);

/**
 * @brief Demangled name of a type, without namespace qualifiers
 */
std::string class_name(std::type_index type);

/**
 * @brief Normalize a CamelCase name to snake_case
 *
 * "HTTPResponse" becomes "http_response"; a leading "i_" (interface prefix)
 * collapses to "i", so "ICatsRepository" becomes "icats_repository".
 */
std::string to_standard_param_name(const std::string& name);

}  // namespace weave::di

template <>
struct std::hash<weave::di::ServiceKey> {
    std::size_t operator()(const weave::di::ServiceKey& key) const noexcept {
        return key.hash();
    }
};
