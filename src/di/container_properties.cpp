#include "weave/di/container_properties.hpp"

namespace weave::di {

void ContainerProperties::from_ptree(const boost::property_tree::ptree& pt) {
    strict = get_value(pt, "strict", strict);

    if (auto policy = get_optional_value<std::string>(pt, "alias_ambiguity")) {
        alias_ambiguity = alias_policy_from_string(*policy);
    }
}

ContainerOptions ContainerProperties::to_options() const {
    ContainerOptions options;
    options.strict = strict;
    options.alias_ambiguity = alias_ambiguity;
    return options;
}

}  // namespace weave::di
