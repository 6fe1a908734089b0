#include "weave/di/resolution_context.hpp"

#include <algorithm>

#include "weave/di/exceptions.hpp"
#include "weave/di/resolvers.hpp"
#include "weave/log/logger.hpp"

namespace weave::di {

ProducerPtr ResolutionContext::compile(const ServiceKey& key) {
    auto it = resolved_.find(key);
    if (it != resolved_.end()) {
        return it->second;
    }

    if (in_chain(key)) {
        std::string path;
        for (const auto& name : chain_names()) {
            path += name + " -> ";
        }
        WEAVE_LOG_ERROR << "Circular dependency detected: " << path
                        << key.name();
        throw CircularDependencyException(chain_.front(), key);
    }

    const Resolver* resolver = registry_.find_resolver(key);
    if (!resolver) {
        throw CannotResolveTypeException(key);
    }

    ResolutionGuard guard(*this, key);
    auto producer = resolver->resolve(*this);
    resolved_.emplace(key, producer);
    return producer;
}

bool ResolutionContext::in_chain(const ServiceKey& key) const {
    return std::find(chain_.begin(), chain_.end(), key) != chain_.end();
}

std::vector<std::string> ResolutionContext::chain_names() const {
    std::vector<std::string> names;
    names.reserve(chain_.size());
    for (const auto& key : chain_) {
        names.push_back(key.name());
    }
    return names;
}

}  // namespace weave::di
