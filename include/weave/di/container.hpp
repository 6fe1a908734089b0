#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "weave/di/activation_scope.hpp"
#include "weave/di/alias_index.hpp"
#include "weave/di/container_options.hpp"
#include "weave/di/descriptor.hpp"
#include "weave/di/exceptions.hpp"
#include "weave/di/factory.hpp"
#include "weave/di/lifetime.hpp"
#include "weave/di/resolution_context.hpp"
#include "weave/di/resolvers.hpp"
#include "weave/di/service_key.hpp"
#include "weave/di/service_provider.hpp"

namespace weave::di {

/**
 * @brief Registry of services, compiled into a ServiceProvider
 *
 * Registration is single-threaded; the provider returned by
 * build_provider() is safe to share between threads.
 *
 * @code
 * Container container;
 * container.add_singleton<ISettings, Settings>()
 *          .add_scoped<UserService>()
 *          .add_transient_by_factory([] { return std::make_shared<Clock>(); });
 * auto provider = container.build_provider();
 * auto users = provider->get<UserService>();
 * @endcode
 */
class Container : public ServiceRegistry {
public:
    explicit Container(ContainerOptions options = {});
    ~Container() override;

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&);
    Container& operator=(Container&&);

    bool strict() const { return options_.strict; }

    // ========================================================================
    // Type registration
    // ========================================================================

    template <typename TBase, typename TConcrete = TBase>
    Container& add_transient() {
        return bind_concrete<TBase, TConcrete>(ServiceLifetime::TRANSIENT);
    }

    template <typename TBase, typename TConcrete = TBase>
    Container& add_scoped() {
        return bind_concrete<TBase, TConcrete>(ServiceLifetime::SCOPED);
    }

    template <typename TBase, typename TConcrete = TBase>
    Container& add_singleton() {
        return bind_concrete<TBase, TConcrete>(ServiceLifetime::SINGLETON);
    }

    /**
     * @brief Register a concrete type under a key without compile-time types
     *
     * The concrete type must be described (describe() or a descriptor
     * provider) before build_provider(). `upcast` converts a pointer to the
     * concrete type into a pointer to the type behind `key`; it may be empty
     * when both are the same.
     *
     * @throws OverridingServiceException if key is already registered
     */
    Container& bind_types(const ServiceKey& key, std::type_index concrete,
                          ServiceLifetime lifetime, Upcast upcast = {});

    // ========================================================================
    // Instances
    // ========================================================================

    /**
     * @brief Register an existing instance, as a singleton
     *
     * The instance is registered under TDeclared, or under its own type when
     * TDeclared is omitted.
     */
    template <typename TDeclared = void, typename T>
    Container& add_instance(std::shared_ptr<T> instance) {
        using Declared = std::conditional_t<std::is_void_v<TDeclared>, T, TDeclared>;
        std::shared_ptr<Declared> declared = std::move(instance);
        return add_instance(key_of<Declared>(), std::move(declared),
                            std::type_index(typeid(Declared)));
    }

    Container& add_instance(const ServiceKey& key, std::shared_ptr<void> instance,
                            std::type_index value_type = std::type_index(typeid(void)));

    // ========================================================================
    // Factories
    // ========================================================================

    /**
     * @brief Register a factory
     *
     * The key is return_key when given, else the factory's declared return
     * type.
     *
     * @throws MissingTypeException if neither is known
     * @throws InvalidFactory if return_key is a type other than the declared
     *         return type; use make_factory<TReturn> to declare it
     */
    Container& register_factory(Factory factory,
                                const std::optional<ServiceKey>& return_key,
                                ServiceLifetime lifetime);

    template <typename TReturn = void, typename F>
    Container& add_transient_by_factory(F&& fn) {
        return register_factory(make_factory<TReturn>(std::forward<F>(fn)),
                                std::nullopt, ServiceLifetime::TRANSIENT);
    }

    template <typename TReturn = void, typename F>
    Container& add_scoped_by_factory(F&& fn) {
        return register_factory(make_factory<TReturn>(std::forward<F>(fn)),
                                std::nullopt, ServiceLifetime::SCOPED);
    }

    template <typename TReturn = void, typename F>
    Container& add_singleton_by_factory(F&& fn) {
        return register_factory(make_factory<TReturn>(std::forward<F>(fn)),
                                std::nullopt, ServiceLifetime::SINGLETON);
    }

    // ========================================================================
    // Aliases
    // ========================================================================

    /// @throws InvalidOperationInStrictMode, AliasAlreadyDefined
    Container& add_alias(const std::string& name, const ServiceKey& key);
    Container& add_aliases(const std::map<std::string, ServiceKey>& aliases);

    /// @throws InvalidOperationInStrictMode, AliasAlreadyDefined
    Container& set_alias(const std::string& name, const ServiceKey& key,
                         bool override_existing = false);
    Container& set_aliases(const std::map<std::string, ServiceKey>& aliases,
                           bool override_existing = false);

    // ========================================================================
    // Descriptors
    // ========================================================================

    /**
     * @brief Describe how to build T, replacing any descriptor it carries
     */
    template <typename T>
    Container& describe(TypeDescriptor descriptor) {
        descriptor.type = std::type_index(typeid(T));
        return describe(std::move(descriptor));
    }

    Container& describe(TypeDescriptor descriptor);

    /**
     * @brief Install a descriptor source consulted before the container's own
     */
    Container& set_descriptor_provider(
        std::shared_ptr<const DescriptorProvider> provider);

    // ========================================================================
    // Queries
    // ========================================================================

    bool contains(const ServiceKey& key) const;

    template <typename T>
    bool contains() const {
        return contains(key_of<T>());
    }

    std::size_t size() const { return registrations_.size(); }

    /// Registered keys, in registration order
    std::vector<ServiceKey> keys() const;

    // ========================================================================
    // Build
    // ========================================================================

    /**
     * @brief Compile every registration into a new provider
     *
     * Every graph error (missing dependency, cycle, union parameter, alias
     * misconfiguration) is raised here.
     */
    std::shared_ptr<ServiceProvider> build_provider() const;

    /// Provider built on first use and rebuilt after any registration change
    std::shared_ptr<ServiceProvider> provider();

    template <typename T>
    std::shared_ptr<T> resolve(ActivationScope* scope = nullptr) {
        return provider()->get<T>(scope);
    }

    // ServiceRegistry
    const Resolver* find_resolver(const ServiceKey& key) const override;
    const AliasIndex& aliases() const override { return aliases_; }
    const ContainerOptions& options() const override { return options_; }
    const TypeDescriptor* find_descriptor(std::type_index type) const override;

private:
    struct Registration {
        ServiceKey key;
        std::unique_ptr<Resolver> resolver;
    };

    template <typename TBase, typename TConcrete>
    Container& bind_concrete(ServiceLifetime lifetime) {
        static_assert(!std::is_abstract_v<TConcrete>,
                      "cannot register an abstract type as the concrete type");
        if (auto descriptor = intrinsic_descriptor<TConcrete>()) {
            descriptors_.add_default(std::move(*descriptor));
        }
        return bind_types(key_of<TBase>(), std::type_index(typeid(TConcrete)),
                          lifetime, upcast_to<TBase, TConcrete>());
    }

    void bind(const ServiceKey& key, std::unique_ptr<Resolver> resolver);
    void ensure_not_strict() const;

    // More than one inferred candidate and no exact alias
    bool is_ambiguous_name(const std::string& name) const;
    void add_name_entries(ResolutionContext& context, ProducerMap& producers) const;

    ContainerOptions options_;
    std::vector<Registration> registrations_;
    std::unordered_map<ServiceKey, std::size_t> index_;
    AliasIndex aliases_;
    DescriptorTable descriptors_;
    std::shared_ptr<const DescriptorProvider> external_descriptors_;
    std::shared_ptr<ServiceProvider> provider_;
};

}  // namespace weave::di
