#pragma once

#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "weave/di/alias_index.hpp"
#include "weave/di/container_options.hpp"
#include "weave/di/descriptor.hpp"
#include "weave/di/producers.hpp"
#include "weave/di/service_key.hpp"

namespace weave::di {

class Resolver;

/**
 * @brief Read-only view of a registry, as seen by resolvers during a build
 */
class ServiceRegistry {
public:
    virtual ~ServiceRegistry() = default;

    /// @return nullptr if key is not registered
    virtual const Resolver* find_resolver(const ServiceKey& key) const = 0;
    virtual const AliasIndex& aliases() const = 0;
    virtual const ContainerOptions& options() const = 0;

    /// @return nullptr if the type has no descriptor
    virtual const TypeDescriptor* find_descriptor(std::type_index type) const = 0;
};

/**
 * @brief State of one build pass: compiled producers and the active chain
 *
 * Every key is compiled at most once per pass; a key met again while it is
 * still on the chain is a circular dependency.
 */
class ResolutionContext {
public:
    explicit ResolutionContext(const ServiceRegistry& registry)
        : registry_(registry) {}

    /**
     * @brief Return the producer for a registered key, compiling it if needed
     * @throws CircularDependencyException if key is on the active chain
     * @throws CannotResolveTypeException if key is not registered
     */
    ProducerPtr compile(const ServiceKey& key);

    bool is_resolved(const ServiceKey& key) const {
        return resolved_.count(key) > 0;
    }

    bool in_chain(const ServiceKey& key) const;

    void push(const ServiceKey& key) { chain_.push_back(key); }
    void pop() {
        if (!chain_.empty()) {
            chain_.pop_back();
        }
    }
    void clear_chain() { chain_.clear(); }

    /// Keys currently being compiled, outermost first
    const std::vector<ServiceKey>& chain() const { return chain_; }

    std::vector<std::string> chain_names() const;

    const ServiceRegistry& registry() const { return registry_; }

private:
    const ServiceRegistry& registry_;
    std::unordered_map<ServiceKey, ProducerPtr> resolved_;
    std::vector<ServiceKey> chain_;
};

/**
 * @brief RAII guard keeping a key on the chain while it compiles
 */
class ResolutionGuard {
public:
    ResolutionGuard(ResolutionContext& context, const ServiceKey& key)
        : context_(context) {
        context_.push(key);
    }

    ~ResolutionGuard() { context_.pop(); }

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;

private:
    ResolutionContext& context_;
};

}  // namespace weave::di
