#include "weave/di/resolvers.hpp"

#include "weave/di/exceptions.hpp"
#include "weave/log/logger.hpp"

namespace weave::di {

namespace {

bool same_value_type(std::type_index expected, std::type_index actual) {
    const std::type_index unknown(typeid(void));
    return expected == unknown || actual == unknown || expected == actual;
}

}  // namespace

// ============================================================================
// DynamicResolver
// ============================================================================

DynamicResolver::DynamicResolver(ServiceKey key, std::type_index concrete,
                                 ServiceLifetime lifetime, Upcast upcast)
    : key_(std::move(key)),
      concrete_(concrete),
      lifetime_(lifetime),
      upcast_(std::move(upcast)),
      value_type_(key_.is_type() ? key_.type() : concrete) {}

ProducerPtr DynamicResolver::resolve(ResolutionContext& context) const {
    const TypeDescriptor* descriptor =
        context.registry().find_descriptor(concrete_);
    if (!descriptor || !descriptor->activator) {
        throw MissingDescriptorException(ServiceKey(concrete_));
    }

    TypeDescriptor::Activator create = descriptor->activator;
    if (upcast_) {
        create = [create, upcast = upcast_](const Arguments& args) {
            return upcast(create(args));
        };
    }

    if (descriptor->parameters.empty()) {
        WEAVE_LOG_TRACE << "Compiled " << to_string(lifetime_) << " service '"
                        << key_.name() << "' without dependencies";
        return make_producer(lifetime_, key_, value_type_,
                             PlainActivation{[create] {
                                 return create(Arguments{});
                             }});
    }

    std::vector<ProducerPtr> dependencies;
    dependencies.reserve(descriptor->parameters.size());
    for (const auto& parameter : descriptor->parameters) {
        dependencies.push_back(resolve_parameter(parameter, context));
    }

    WEAVE_LOG_TRACE << "Compiled " << to_string(lifetime_) << " service '"
                    << key_.name() << "' with " << dependencies.size()
                    << (descriptor->kind == TypeDescriptor::Kind::FIELDS
                            ? " injected fields"
                            : " constructor dependencies");
    return make_producer(lifetime_, key_, value_type_,
                         ArgsActivation{ServiceKey(concrete_), std::move(create),
                                        std::move(dependencies)});
}

ProducerPtr DynamicResolver::resolve_parameter(const ParameterInfo& parameter,
                                               ResolutionContext& context) const {
    const ServiceRegistry& registry = context.registry();
    const ServiceKey concrete(concrete_);

    if (parameter.is_union()) {
        throw UnsupportedUnionTypeException(parameter.name, concrete);
    }

    ServiceKey target = parameter.is_name_only() ? ServiceKey(parameter.name)
                                                 : parameter.alternatives.front();

    if (parameter.is_name_only()) {
        if (registry.options().strict) {
            throw CannotResolveParameterException(
                parameter.name, concrete,
                "the parameter has no declared type and name-based "
                "resolution is disabled in strict mode");
        }

        const AliasIndex& aliases = registry.aliases();
        if (const ServiceKey* exact = aliases.exact(parameter.name)) {
            target = *exact;
        } else if (const auto* inferred = aliases.inferred(parameter.name);
                   inferred && !inferred->empty()) {
            if (inferred->size() > 1) {
                throw AmbiguousReferenceNameException(parameter.name);
            }
            target = inferred->front();
        } else {
            throw CannotResolveParameterException(parameter.name, concrete);
        }
    }

    if (!registry.find_resolver(target)) {
        throw CannotResolveParameterException(
            parameter.name, concrete,
            "no service is registered for '" + target.name() + "'");
    }

    ProducerPtr producer = context.compile(target);

    if (!same_value_type(parameter.value_type, producer->value_type())) {
        throw CannotResolveParameterException(
            parameter.name, concrete,
            "'" + target.name() + "' is registered as '" +
                class_name(producer->value_type()) + "' but '" +
                class_name(parameter.value_type) + "' is expected");
    }
    return producer;
}

// ============================================================================
// FactoryResolver
// ============================================================================

FactoryResolver::FactoryResolver(ServiceKey key, Factory factory,
                                 ServiceLifetime lifetime,
                                 std::type_index value_type)
    : key_(std::move(key)),
      factory_(std::move(factory)),
      lifetime_(lifetime),
      value_type_(value_type) {}

ProducerPtr FactoryResolver::resolve(ResolutionContext&) const {
    WEAVE_LOG_TRACE << "Compiled " << to_string(lifetime_) << " factory for '"
                    << key_.name() << "'";
    return make_producer(lifetime_, key_, value_type_,
                         FactoryActivation{factory_});
}

// ============================================================================
// InstanceResolver
// ============================================================================

ProducerPtr InstanceResolver::resolve(ResolutionContext&) const {
    return std::make_shared<InstanceProducer>(value_type_, instance_);
}

}  // namespace weave::di
