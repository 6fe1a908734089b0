#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>

#include "weave/di/factory.hpp"
#include "weave/di/lifetime.hpp"
#include "weave/di/producers.hpp"
#include "weave/di/resolution_context.hpp"
#include "weave/di/service_key.hpp"

namespace weave::di {

/// Converts a pointer to a concrete type into a pointer to the registered base
using Upcast = std::function<std::shared_ptr<void>(std::shared_ptr<void>)>;

template <typename Base, typename Concrete>
Upcast upcast_to() {
    static_assert(std::is_convertible_v<Concrete*, Base*>,
                  "Concrete must derive from Base");
    if constexpr (std::is_same_v<Base, Concrete>) {
        return {};
    } else {
        return [](std::shared_ptr<void> instance) -> std::shared_ptr<void> {
            return std::shared_ptr<Base>(
                std::static_pointer_cast<Concrete>(std::move(instance)));
        };
    }
}

/**
 * @brief Registration strategy; turns a registry entry into a producer
 */
class Resolver {
public:
    virtual ~Resolver() = default;

    virtual ProducerPtr resolve(ResolutionContext& context) const = 0;
    virtual std::type_index value_type() const = 0;
    virtual ServiceLifetime lifetime() const = 0;

    /// True when resolve() walks constructor dependencies
    virtual bool is_dynamic() const { return false; }
};

/**
 * @brief Builds a concrete type from its descriptor, resolving each
 * dependency by declared type or, failing that, by name
 */
class DynamicResolver : public Resolver {
public:
    DynamicResolver(ServiceKey key, std::type_index concrete,
                    ServiceLifetime lifetime, Upcast upcast = {});

    ProducerPtr resolve(ResolutionContext& context) const override;
    std::type_index value_type() const override { return value_type_; }
    ServiceLifetime lifetime() const override { return lifetime_; }
    bool is_dynamic() const override { return true; }

    std::type_index concrete_type() const { return concrete_; }

private:
    ProducerPtr resolve_parameter(const ParameterInfo& parameter,
                                  ResolutionContext& context) const;

    ServiceKey key_;
    std::type_index concrete_;
    ServiceLifetime lifetime_;
    Upcast upcast_;
    std::type_index value_type_;
};

class FactoryResolver : public Resolver {
public:
    FactoryResolver(ServiceKey key, Factory factory, ServiceLifetime lifetime,
                    std::type_index value_type);

    ProducerPtr resolve(ResolutionContext& context) const override;
    std::type_index value_type() const override { return value_type_; }
    ServiceLifetime lifetime() const override { return lifetime_; }

private:
    ServiceKey key_;
    Factory factory_;
    ServiceLifetime lifetime_;
    std::type_index value_type_;
};

class InstanceResolver : public Resolver {
public:
    InstanceResolver(std::shared_ptr<void> instance, std::type_index value_type)
        : instance_(std::move(instance)), value_type_(value_type) {}

    ProducerPtr resolve(ResolutionContext& context) const override;
    std::type_index value_type() const override { return value_type_; }
    ServiceLifetime lifetime() const override {
        return ServiceLifetime::SINGLETON;
    }

private:
    std::shared_ptr<void> instance_;
    std::type_index value_type_;
};

}  // namespace weave::di
