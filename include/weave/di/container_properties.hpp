#pragma once

#include <string>

#include "weave/config/config.hpp"
#include "weave/di/container_options.hpp"

namespace weave::di {

// Container configuration, loaded from the "di" section
class ContainerProperties : public config::ConfigurationProperties {
public:
    bool strict = false;
    AliasAmbiguityPolicy alias_ambiguity = AliasAmbiguityPolicy::DEFER;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    std::string properties_name() const override { return "di"; }

    ContainerOptions to_options() const;
};

}  // namespace weave::di
