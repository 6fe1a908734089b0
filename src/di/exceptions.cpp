#include "weave/di/exceptions.hpp"

namespace weave::di {

OverridingServiceException::OverridingServiceException(const ServiceKey& key)
    : DIException("A service with key '" + key.name() +
                  "' is already registered and would be overridden."),
      key_(key) {}

CannotResolveParameterException::CannotResolveParameterException(
    const std::string& param_name, const ServiceKey& desired_type,
    const std::string& reason)
    : DIException("Unable to resolve parameter '" + param_name +
                  "' when resolving '" + desired_type.name() + "'" +
                  (reason.empty() ? "" : ": " + reason)),
      param_name_(param_name),
      desired_type_(desired_type) {}

CannotResolveTypeException::CannotResolveTypeException(
    const ServiceKey& key, const std::string& reason)
    : DIException("Unable to resolve the type '" + key.name() + "'" +
                  (reason.empty() ? "." : ": " + reason)),
      key_(key) {}

UnsupportedUnionTypeException::UnsupportedUnionTypeException(
    const std::string& param_name, const ServiceKey& desired_type)
    : DIException(
          "Union or Optional type declaration is not supported. Cannot "
          "resolve parameter '" +
          param_name + "' when resolving '" + desired_type.name() + "'") {}

CircularDependencyException::CircularDependencyException(
    const ServiceKey& expected_type, const ServiceKey& desired_type)
    : DIException("A circular dependency was detected for the service of type '" +
                  expected_type.name() + "' for '" + desired_type.name() +
                  "'"),
      expected_type_(expected_type),
      desired_type_(desired_type) {}

AliasAlreadyDefined::AliasAlreadyDefined(const std::string& name)
    : DIException("Cannot define alias '" + name +
                  "'. An alias with given name is already defined.") {}

AliasConfigurationError::AliasConfigurationError(const std::string& name,
                                                 const ServiceKey& key)
    : DIException("An alias '" + name + "' for type '" + key.name() +
                  "' was defined, but the type was not configured in the "
                  "Container.") {}

AmbiguousReferenceNameException::AmbiguousReferenceNameException(
    const std::string& name)
    : DIException("The name '" + name +
                  "' refers to more than one registered service; define an "
                  "exact alias to disambiguate it.") {}

InvalidOperationInStrictMode::InvalidOperationInStrictMode()
    : DIException(
          "The services are configured in strict mode, the operation is "
          "invalid.") {}

MissingTypeException::MissingTypeException()
    : DIException(
          "Please specify the factory return type or return a typed "
          "std::shared_ptr from the factory.") {}

InvalidFactory::InvalidFactory(const std::string& type_name)
    : DIException("The factory specified for type " + type_name +
                  " is not valid, it must be callable with either no "
                  "arguments, (ActivationScope&), or (ActivationScope&, const "
                  "ServiceKey&).") {}

InvalidFactory::InvalidFactory(const ServiceKey& key, std::type_index returned)
    : DIException("The factory registered for type " + key.name() +
                  " returns " + class_name(returned) +
                  "; declare the registered type with make_factory<" +
                  key.name() + ">.") {}

MissingDescriptorException::MissingDescriptorException(const ServiceKey& key)
    : DIException("No constructor descriptor is available for type '" +
                  key.full_name() +
                  "'; describe it or make it default constructible.") {}

ScopeDisposedException::ScopeDisposedException()
    : DIException(
          "This ActivationScope is disposed and not bound to any provider.") {}

}  // namespace weave::di
