#pragma once

#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>

#include "weave/di/service_key.hpp"

namespace weave::di {

class ServiceProvider;

using ScopedServices = std::unordered_map<ServiceKey, std::shared_ptr<void>>;

/**
 * @brief Unit of work for service activation
 *
 * Owns the cache of scoped services produced while it is alive. The
 * destructor disposes the scope; any use after dispose() throws
 * ScopeDisposedException. A scope is meant to be used from one thread.
 */
class ActivationScope {
public:
    explicit ActivationScope(std::shared_ptr<const ServiceProvider> provider,
                             ScopedServices scoped_services = {});
    ~ActivationScope();

    ActivationScope(const ActivationScope&) = delete;
    ActivationScope& operator=(const ActivationScope&) = delete;

    /**
     * @brief Resolve a service inside this scope
     * @throws CannotResolveTypeException if the key is not registered
     */
    std::shared_ptr<void> get(const ServiceKey& key);

    template <typename T>
    std::shared_ptr<T> get() {
        return std::static_pointer_cast<T>(
            get_typed(key_of<T>(), std::type_index(typeid(T))));
    }

    template <typename T>
    std::shared_ptr<T> get(const ServiceKey& key) {
        return std::static_pointer_cast<T>(
            get_typed(key, std::type_index(typeid(T))));
    }

    /**
     * @brief Look up a value already cached in this scope
     * @return false if the key has no cached value
     */
    bool find_scoped(const ServiceKey& key, std::shared_ptr<void>& out) const;

    /**
     * @brief Return the cached value for key, or create and cache it
     *
     * The check and the insertion happen under the scope lock, so a key is
     * created at most once per scope. Creation may re-enter the scope for
     * other keys.
     */
    template <typename Create>
    std::shared_ptr<void> get_or_create_scoped(const ServiceKey& key,
                                               Create&& create) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        ensure_active();
        auto it = scoped_services_.find(key);
        if (it != scoped_services_.end()) {
            return it->second;
        }
        auto instance = create();
        scoped_services_.insert_or_assign(key, instance);
        return instance;
    }

    std::size_t scoped_count() const;

    bool is_disposed() const;

    /**
     * @brief Clear the scoped cache and release the provider
     */
    void dispose();

    /// @throws ScopeDisposedException after dispose()
    std::shared_ptr<const ServiceProvider> provider() const;

private:
    std::shared_ptr<void> get_typed(const ServiceKey& key,
                                    std::type_index value_type);
    void ensure_active() const;

    mutable std::recursive_mutex mutex_;
    std::shared_ptr<const ServiceProvider> provider_;
    ScopedServices scoped_services_;
    bool disposed_ = false;
};

}  // namespace weave::di
