#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <typeindex>
#include <utility>
#include <vector>

#include "weave/di/activation_scope.hpp"
#include "weave/di/descriptor.hpp"
#include "weave/di/factory.hpp"
#include "weave/di/lifetime.hpp"
#include "weave/di/service_key.hpp"

namespace weave::di {

/**
 * @brief Compiled recipe that yields one service instance
 *
 * Producers are built once by the container and shared by every provider
 * lookup afterwards; they must be safe to call from several threads.
 */
class Producer {
public:
    explicit Producer(std::type_index value_type) : value_type_(value_type) {}
    virtual ~Producer() = default;

    /**
     * @brief Produce the service
     * @param requesting key of the service this one is produced for
     */
    virtual std::shared_ptr<void> produce(ActivationScope& scope,
                                          const ServiceKey& requesting) = 0;

    /// Static type the produced pointer refers to; void when unknown
    std::type_index value_type() const { return value_type_; }

private:
    std::type_index value_type_;
};

using ProducerPtr = std::shared_ptr<Producer>;

// ============================================================================
// Activations
// ============================================================================

/// Constructor or field set without dependencies
struct PlainActivation {
    std::function<std::shared_ptr<void>()> create;

    std::shared_ptr<void> operator()(ActivationScope&, const ServiceKey&) const {
        return create();
    }
};

/// Constructor or field set fed by one producer per dependency
struct ArgsActivation {
    ServiceKey concrete;
    TypeDescriptor::Activator create;
    std::vector<ProducerPtr> dependencies;

    std::shared_ptr<void> operator()(ActivationScope& scope,
                                     const ServiceKey&) const {
        Arguments args;
        args.reserve(dependencies.size());
        for (const auto& dependency : dependencies) {
            args.push_back(dependency->produce(scope, concrete));
        }
        return create(args);
    }
};

struct FactoryActivation {
    Factory factory;

    std::shared_ptr<void> operator()(ActivationScope& scope,
                                     const ServiceKey& requesting) const {
        return factory(scope, requesting);
    }
};

// ============================================================================
// Producers
// ============================================================================

template <typename Activation>
class TransientProducer : public Producer {
public:
    TransientProducer(std::type_index value_type, Activation activation)
        : Producer(value_type), activation_(std::move(activation)) {}

    std::shared_ptr<void> produce(ActivationScope& scope,
                                  const ServiceKey& requesting) override {
        return activation_(scope, requesting);
    }

private:
    Activation activation_;
};

template <typename Activation>
class ScopedProducer : public Producer {
public:
    ScopedProducer(ServiceKey key, std::type_index value_type,
                   Activation activation)
        : Producer(value_type),
          key_(std::move(key)),
          activation_(std::move(activation)) {}

    std::shared_ptr<void> produce(ActivationScope& scope,
                                  const ServiceKey& requesting) override {
        return scope.get_or_create_scoped(
            key_, [&] { return activation_(scope, requesting); });
    }

private:
    ServiceKey key_;
    Activation activation_;
};

template <typename Activation>
class SingletonProducer : public Producer {
public:
    SingletonProducer(std::type_index value_type, Activation activation)
        : Producer(value_type), activation_(std::move(activation)) {}

    std::shared_ptr<void> produce(ActivationScope& scope,
                                  const ServiceKey& requesting) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!created_) {
            instance_ = activation_(scope, requesting);
            created_ = true;
        }
        return instance_;
    }

private:
    std::mutex mutex_;
    Activation activation_;
    std::shared_ptr<void> instance_;
    bool created_ = false;
};

class InstanceProducer : public Producer {
public:
    InstanceProducer(std::type_index value_type, std::shared_ptr<void> instance)
        : Producer(value_type), instance_(std::move(instance)) {}

    std::shared_ptr<void> produce(ActivationScope&, const ServiceKey&) override {
        return instance_;
    }

private:
    std::shared_ptr<void> instance_;
};

/**
 * @brief Wrap an activation into the producer matching a lifetime
 */
template <typename Activation>
ProducerPtr make_producer(ServiceLifetime lifetime, const ServiceKey& key,
                          std::type_index value_type, Activation activation) {
    switch (lifetime) {
        case ServiceLifetime::SINGLETON:
            return std::make_shared<SingletonProducer<Activation>>(
                value_type, std::move(activation));
        case ServiceLifetime::SCOPED:
            return std::make_shared<ScopedProducer<Activation>>(
                key, value_type, std::move(activation));
        case ServiceLifetime::TRANSIENT:
            break;
    }
    return std::make_shared<TransientProducer<Activation>>(value_type,
                                                           std::move(activation));
}

}  // namespace weave::di
