#include "weave/di/service_key.hpp"

#include <algorithm>
#include <boost/core/demangle.hpp>
#include <cctype>
#include <regex>

namespace weave::di {

namespace {

// Strips qualifiers at nesting depth zero: "a::b<c::d>::E" -> "E"
std::string strip_qualifiers(const std::string& full) {
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < full.size(); ++i) {
        char c = full[i];
        if (c == '<' || c == '(') {
            ++depth;
        } else if (c == '>' || c == ')') {
            --depth;
        } else if (depth == 0 && c == ':' && i + 1 < full.size() &&
                   full[i + 1] == ':') {
            start = i + 2;
            ++i;
        }
    }
    return full.substr(start);
}

}  // namespace

std::string class_name(std::type_index type) {
    return strip_qualifiers(boost::core::demangle(type.name()));
}

std::string ServiceKey::name() const {
    if (is_type()) {
        return class_name(type());
    }
    return std::get<std::string>(value_);
}

std::string ServiceKey::full_name() const {
    if (is_type()) {
        return boost::core::demangle(type().name());
    }
    return std::get<std::string>(value_);
}

bool ServiceKey::is_generic() const {
    return is_type() && full_name().find('<') != std::string::npos;
}

std::size_t ServiceKey::hash() const noexcept {
    if (is_type()) {
        return std::hash<std::type_index>{}(type());
    }
    // Distinguish a name from a type that happens to hash the same
    return std::hash<std::string>{}(std::get<std::string>(value_)) ^
           0x9e3779b97f4a7c15ull;
}

std::ostream& operator<<(std::ostream& os, const ServiceKey& key) {
    return os << key.name();
}

std::string to_standard_param_name(const std::string& name) {
    static const std::regex first_cap_re("(.)([A-Z][a-z]+)");
    static const std::regex all_cap_re("([a-z0-9])([A-Z])");

    std::string value = std::regex_replace(
        std::regex_replace(name, first_cap_re, "$1_$2"), all_cap_re, "$1_$2");
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (value.rfind("i_", 0) == 0) {
        return "i" + value.substr(2);
    }
    return value;
}

}  // namespace weave::di
