#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "weave/di/service_key.hpp"

namespace weave::di {

/**
 * @brief Name tables used to resolve dependencies that only carry a name
 *
 * Inferred aliases map a name to every key registered under it, in
 * registration order; exact aliases map a name to exactly one key and take
 * precedence. Both tables keep insertion order so that provider builds are
 * deterministic.
 */
class AliasIndex {
public:
    /**
     * @brief Index a registered key under its name variants
     *
     * The canonical name, its lower-case form and its snake_case form are
     * added. Generic types are skipped.
     */
    void infer(const ServiceKey& key);

    /// @throws AliasAlreadyDefined if name is an inferred or exact alias
    void add_alias(const std::string& name, const ServiceKey& key);

    /// @throws AliasAlreadyDefined if name is an exact alias and !override_existing
    void set_alias(const std::string& name, const ServiceKey& key,
                   bool override_existing = false);

    /// @return nullptr if name has no exact alias
    const ServiceKey* exact(const std::string& name) const;

    /// @return nullptr if name has no inferred alias
    const std::vector<ServiceKey>* inferred(const std::string& name) const;

    bool is_defined(const std::string& name) const;

    /// Inferred names in first-insertion order
    const std::vector<std::string>& inferred_names() const {
        return inferred_order_;
    }

    /// Exact names in first-insertion order
    const std::vector<std::string>& exact_names() const { return exact_order_; }

    void clear();

private:
    void add_inferred(const std::string& name, const ServiceKey& key);

    std::unordered_map<std::string, std::vector<ServiceKey>> inferred_;
    std::vector<std::string> inferred_order_;
    std::unordered_map<std::string, ServiceKey> exact_;
    std::vector<std::string> exact_order_;
};

}  // namespace weave::di
