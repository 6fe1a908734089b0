#include "weave/di/service_provider.hpp"

#include "weave/di/exceptions.hpp"
#include "weave/log/logger.hpp"

namespace weave::di {

ServiceProvider::ServiceProvider(ProducerMap producers)
    : producers_(std::move(producers)) {}

std::shared_ptr<void> ServiceProvider::get_as(const ServiceKey& key,
                                              std::type_index value_type,
                                              ActivationScope* scope) const {
    if (scope) {
        std::shared_ptr<void> cached;
        if (scope->find_scoped(key, cached)) {
            return cached;
        }
    }

    ProducerPtr producer;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = producers_.find(key);
        if (it != producers_.end()) {
            producer = it->second;
        }
    }
    if (!producer) {
        throw CannotResolveTypeException(key);
    }

    const std::type_index unknown(typeid(void));
    if (value_type != unknown && producer->value_type() != unknown &&
        producer->value_type() != value_type) {
        throw CannotResolveTypeException(
            key, "the service is registered as '" +
                     class_name(producer->value_type()) +
                     "', requested as '" + class_name(value_type) + "'");
    }

    if (scope) {
        return producer->produce(*scope, key);
    }
    ActivationScope one_shot(shared_self());
    return producer->produce(one_shot, key);
}

std::shared_ptr<void> ServiceProvider::get_or(const ServiceKey& key,
                                              std::shared_ptr<void> default_value,
                                              ActivationScope* scope) const {
    if (scope) {
        std::shared_ptr<void> cached;
        if (scope->find_scoped(key, cached)) {
            return cached;
        }
    }
    if (!contains(key)) {
        return default_value;
    }
    return get(key, scope);
}

bool ServiceProvider::contains(const ServiceKey& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return producers_.count(key) > 0;
}

void ServiceProvider::set(const ServiceKey& key, std::shared_ptr<void> value,
                          std::type_index value_type) {
    if (key.is_type() && value_type == std::type_index(typeid(void))) {
        value_type = key.type();
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (producers_.count(key) > 0) {
        throw OverridingServiceException(key);
    }
    const ServiceKey name_key(key.name());
    if (key.is_type() && producers_.count(name_key) > 0) {
        throw OverridingServiceException(name_key);
    }

    auto producer = std::make_shared<InstanceProducer>(value_type, std::move(value));
    producers_.emplace(key, producer);
    if (key.is_type()) {
        producers_.emplace(name_key, producer);
    }
    WEAVE_LOG_DEBUG << "Service '" << key.name() << "' set on provider";
}

std::size_t ServiceProvider::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return producers_.size();
}

std::unique_ptr<ActivationScope> ServiceProvider::create_scope(
    ScopedServices scoped_services) const {
    return std::make_unique<ActivationScope>(shared_self(),
                                             std::move(scoped_services));
}

std::size_t ServiceProvider::executor_plan_count() const {
    std::lock_guard<std::mutex> lock(plans_mutex_);
    return plans_.size();
}

std::shared_ptr<const ServiceProvider> ServiceProvider::shared_self() const {
    if (auto owner = weak_from_this().lock()) {
        return owner;
    }
    // Not owned by a shared_ptr: hand out a non-owning pointer
    return std::shared_ptr<const ServiceProvider>(
        std::shared_ptr<const ServiceProvider>(), this);
}

std::shared_ptr<const ExecutorPlan> ServiceProvider::cached_plan(
    const std::string& id, const std::function<ExecutorPlan()>& build) const {
    std::lock_guard<std::mutex> lock(plans_mutex_);
    auto it = plans_.find(id);
    if (it != plans_.end()) {
        return it->second;
    }
    auto plan = std::make_shared<const ExecutorPlan>(build());
    plans_.emplace(id, plan);
    return plan;
}

}  // namespace weave::di
