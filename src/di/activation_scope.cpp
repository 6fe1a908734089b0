#include "weave/di/activation_scope.hpp"

#include "weave/di/exceptions.hpp"
#include "weave/di/service_provider.hpp"

namespace weave::di {

ActivationScope::ActivationScope(std::shared_ptr<const ServiceProvider> provider,
                                 ScopedServices scoped_services)
    : provider_(std::move(provider)),
      scoped_services_(std::move(scoped_services)) {}

ActivationScope::~ActivationScope() { dispose(); }

std::shared_ptr<void> ActivationScope::get(const ServiceKey& key) {
    return get_typed(key, std::type_index(typeid(void)));
}

std::shared_ptr<void> ActivationScope::get_typed(const ServiceKey& key,
                                                 std::type_index value_type) {
    auto owner = provider();
    return owner->get_as(key, value_type, this);
}

bool ActivationScope::find_scoped(const ServiceKey& key,
                                  std::shared_ptr<void>& out) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_active();
    auto it = scoped_services_.find(key);
    if (it == scoped_services_.end()) {
        return false;
    }
    out = it->second;
    return true;
}

std::size_t ActivationScope::scoped_count() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return scoped_services_.size();
}

bool ActivationScope::is_disposed() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return disposed_;
}

void ActivationScope::dispose() {
    ScopedServices released;
    std::shared_ptr<const ServiceProvider> provider;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (disposed_) {
            return;
        }
        disposed_ = true;
        released.swap(scoped_services_);
        provider.swap(provider_);
    }
    // Scoped instances are destroyed outside the lock
}

std::shared_ptr<const ServiceProvider> ActivationScope::provider() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    ensure_active();
    return provider_;
}

void ActivationScope::ensure_active() const {
    if (disposed_) {
        throw ScopeDisposedException();
    }
}

}  // namespace weave::di
