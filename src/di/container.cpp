#include "weave/di/container.hpp"

#include "weave/log/logger.hpp"

namespace weave::di {

Container::Container(ContainerOptions options) : options_(options) {
    weave::log::Logger::install_default_filter();
}

Container::~Container() = default;

Container::Container(Container&&) = default;

Container& Container::operator=(Container&&) = default;

// ============================================================================
// Registration
// ============================================================================

Container& Container::bind_types(const ServiceKey& key, std::type_index concrete,
                                 ServiceLifetime lifetime, Upcast upcast) {
    bind(key, std::make_unique<DynamicResolver>(key, concrete, lifetime,
                                                std::move(upcast)));
    WEAVE_LOG_DEBUG << "Registered " << to_string(lifetime) << " service '"
                    << key.name() << "' -> '" << class_name(concrete) << "'";
    return *this;
}

Container& Container::add_instance(const ServiceKey& key,
                                   std::shared_ptr<void> instance,
                                   std::type_index value_type) {
    if (key.is_type() && value_type == std::type_index(typeid(void))) {
        value_type = key.type();
    }
    bind(key, std::make_unique<InstanceResolver>(std::move(instance), value_type));
    WEAVE_LOG_DEBUG << "Registered instance '" << key.name() << "'";
    return *this;
}

Container& Container::register_factory(Factory factory,
                                       const std::optional<ServiceKey>& return_key,
                                       ServiceLifetime lifetime) {
    std::optional<ServiceKey> key = return_key;
    if (!key && factory.return_type()) {
        key = ServiceKey(*factory.return_type());
    }
    if (!key) {
        throw MissingTypeException();
    }
    if (key->is_type() && factory.return_type() &&
        *factory.return_type() != key->type()) {
        throw InvalidFactory(*key, *factory.return_type());
    }

    std::type_index value_type = std::type_index(typeid(void));
    if (factory.return_type()) {
        value_type = *factory.return_type();
    } else if (key->is_type()) {
        value_type = key->type();
    }

    const int arity = factory.arity();
    bind(*key, std::make_unique<FactoryResolver>(*key, std::move(factory),
                                                 lifetime, value_type));
    WEAVE_LOG_DEBUG << "Registered " << to_string(lifetime) << " factory for '"
                    << key->name() << "' taking " << arity << " argument(s)";
    return *this;
}

void Container::bind(const ServiceKey& key, std::unique_ptr<Resolver> resolver) {
    if (index_.count(key) > 0) {
        throw OverridingServiceException(key);
    }

    index_.emplace(key, registrations_.size());
    registrations_.push_back(Registration{key, std::move(resolver)});

    if (!options_.strict) {
        aliases_.infer(key);
    }
    provider_.reset();
}

// ============================================================================
// Aliases
// ============================================================================

void Container::ensure_not_strict() const {
    if (options_.strict) {
        throw InvalidOperationInStrictMode();
    }
}

Container& Container::add_alias(const std::string& name, const ServiceKey& key) {
    ensure_not_strict();
    aliases_.add_alias(name, key);
    provider_.reset();
    return *this;
}

Container& Container::add_aliases(const std::map<std::string, ServiceKey>& aliases) {
    for (const auto& [name, key] : aliases) {
        add_alias(name, key);
    }
    return *this;
}

Container& Container::set_alias(const std::string& name, const ServiceKey& key,
                                bool override_existing) {
    ensure_not_strict();
    aliases_.set_alias(name, key, override_existing);
    provider_.reset();
    return *this;
}

Container& Container::set_aliases(const std::map<std::string, ServiceKey>& aliases,
                                  bool override_existing) {
    for (const auto& [name, key] : aliases) {
        set_alias(name, key, override_existing);
    }
    return *this;
}

// ============================================================================
// Descriptors
// ============================================================================

Container& Container::describe(TypeDescriptor descriptor) {
    descriptors_.add(std::move(descriptor));
    provider_.reset();
    return *this;
}

Container& Container::set_descriptor_provider(
    std::shared_ptr<const DescriptorProvider> provider) {
    external_descriptors_ = std::move(provider);
    provider_.reset();
    return *this;
}

const TypeDescriptor* Container::find_descriptor(std::type_index type) const {
    if (external_descriptors_) {
        if (const auto* descriptor = external_descriptors_->find_descriptor(type)) {
            return descriptor;
        }
    }
    return descriptors_.find_descriptor(type);
}

// ============================================================================
// Queries
// ============================================================================

bool Container::contains(const ServiceKey& key) const {
    return index_.count(key) > 0;
}

std::vector<ServiceKey> Container::keys() const {
    std::vector<ServiceKey> result;
    result.reserve(registrations_.size());
    for (const auto& registration : registrations_) {
        result.push_back(registration.key);
    }
    return result;
}

const Resolver* Container::find_resolver(const ServiceKey& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    return registrations_[it->second].resolver.get();
}

// ============================================================================
// Build
// ============================================================================

std::shared_ptr<ServiceProvider> Container::build_provider() const {
    WEAVE_LOG_DEBUG << "Building service provider from " << registrations_.size()
                    << " registration(s)" << (options_.strict ? " (strict)" : "");

    ResolutionContext context(*this);
    ProducerMap producers;

    try {
        for (const auto& registration : registrations_) {
            const ServiceKey& key = registration.key;
            if (!context.is_resolved(key) && registration.resolver->is_dynamic()) {
                context.clear_chain();
            }

            auto producer = context.compile(key);
            producers.insert_or_assign(key, producer);

            if (key.is_type() && !key.is_generic() &&
                !is_ambiguous_name(key.name())) {
                producers.try_emplace(ServiceKey(key.name()), producer);
            }
        }

        add_name_entries(context, producers);
    } catch (const DIException& e) {
        WEAVE_LOG_DEBUG << "Service provider build failed: " << e.what();
        throw;
    }

    WEAVE_LOG_DEBUG << "Service provider built with " << producers.size()
                    << " entries";
    return std::make_shared<ServiceProvider>(std::move(producers));
}

bool Container::is_ambiguous_name(const std::string& name) const {
    if (aliases_.exact(name)) {
        return false;
    }
    const auto* keys = aliases_.inferred(name);
    return keys && keys->size() > 1;
}

void Container::add_name_entries(ResolutionContext& context,
                                 ProducerMap& producers) const {
    if (options_.strict) {
        return;
    }

    for (const auto& name : aliases_.inferred_names()) {
        if (aliases_.exact(name) || index_.count(ServiceKey(name)) > 0) {
            continue;
        }

        const auto& keys = *aliases_.inferred(name);
        if (is_ambiguous_name(name)) {
            if (options_.alias_ambiguity == AliasAmbiguityPolicy::EAGER) {
                throw AmbiguousReferenceNameException(name);
            }
            WEAVE_LOG_WARN << "Name '" << name << "' refers to " << keys.size()
                           << " services; it is not resolvable by name";
            continue;
        }

        const ServiceKey& target = keys.front();
        if (!context.is_resolved(target)) {
            throw AliasConfigurationError(name, target);
        }
        producers.insert_or_assign(ServiceKey(name), context.compile(target));
    }

    for (const auto& name : aliases_.exact_names()) {
        const ServiceKey& target = *aliases_.exact(name);
        if (!context.is_resolved(target)) {
            throw AliasConfigurationError(name, target);
        }
        producers.insert_or_assign(ServiceKey(name), context.compile(target));
    }
}

std::shared_ptr<ServiceProvider> Container::provider() {
    if (!provider_) {
        provider_ = build_provider();
    }
    return provider_;
}

}  // namespace weave::di
