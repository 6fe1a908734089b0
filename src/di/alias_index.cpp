#include "weave/di/alias_index.hpp"

#include <algorithm>
#include <cctype>

#include "weave/di/exceptions.hpp"

namespace weave::di {

void AliasIndex::infer(const ServiceKey& key) {
    if (key.is_generic()) {
        return;
    }

    std::string name = key.name();
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    add_inferred(name, key);
    add_inferred(lower, key);
    add_inferred(to_standard_param_name(name), key);
}

void AliasIndex::add_alias(const std::string& name, const ServiceKey& key) {
    if (is_defined(name)) {
        throw AliasAlreadyDefined(name);
    }
    add_inferred(name, key);
}

void AliasIndex::set_alias(const std::string& name, const ServiceKey& key,
                           bool override_existing) {
    auto it = exact_.find(name);
    if (it != exact_.end()) {
        if (!override_existing) {
            throw AliasAlreadyDefined(name);
        }
        it->second = key;
        return;
    }
    exact_.emplace(name, key);
    exact_order_.push_back(name);
}

const ServiceKey* AliasIndex::exact(const std::string& name) const {
    auto it = exact_.find(name);
    return it == exact_.end() ? nullptr : &it->second;
}

const std::vector<ServiceKey>* AliasIndex::inferred(
    const std::string& name) const {
    auto it = inferred_.find(name);
    return it == inferred_.end() ? nullptr : &it->second;
}

bool AliasIndex::is_defined(const std::string& name) const {
    return inferred_.count(name) > 0 || exact_.count(name) > 0;
}

void AliasIndex::clear() {
    inferred_.clear();
    inferred_order_.clear();
    exact_.clear();
    exact_order_.clear();
}

void AliasIndex::add_inferred(const std::string& name, const ServiceKey& key) {
    auto [it, inserted] = inferred_.try_emplace(name);
    if (inserted) {
        inferred_order_.push_back(name);
    }
    auto& keys = it->second;
    if (std::find(keys.begin(), keys.end(), key) == keys.end()) {
        keys.push_back(key);
    }
}

}  // namespace weave::di
