#pragma once

#include <stdexcept>
#include <string>

#include "weave/di/service_key.hpp"

namespace weave::di {

/**
 * @brief Base class of every error raised by the container
 */
class DIException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A key is registered twice
 */
class OverridingServiceException : public DIException {
public:
    explicit OverridingServiceException(const ServiceKey& key);

    const ServiceKey& key() const { return key_; }

private:
    ServiceKey key_;
};

/**
 * @brief A dependency of a type cannot be satisfied by any registration
 */
class CannotResolveParameterException : public DIException {
public:
    CannotResolveParameterException(const std::string& param_name,
                                    const ServiceKey& desired_type,
                                    const std::string& reason = {});

    const std::string& param_name() const { return param_name_; }
    const ServiceKey& desired_type() const { return desired_type_; }

private:
    std::string param_name_;
    ServiceKey desired_type_;
};

/**
 * @brief A key requested from a provider is not registered
 */
class CannotResolveTypeException : public DIException {
public:
    explicit CannotResolveTypeException(const ServiceKey& key,
                                        const std::string& reason = {});

    const ServiceKey& key() const { return key_; }

private:
    ServiceKey key_;
};

class UnsupportedUnionTypeException : public DIException {
public:
    UnsupportedUnionTypeException(const std::string& param_name,
                                  const ServiceKey& desired_type);
};

class CircularDependencyException : public DIException {
public:
    CircularDependencyException(const ServiceKey& expected_type,
                                const ServiceKey& desired_type);

    const ServiceKey& expected_type() const { return expected_type_; }
    const ServiceKey& desired_type() const { return desired_type_; }

private:
    ServiceKey expected_type_;
    ServiceKey desired_type_;
};

class AliasAlreadyDefined : public DIException {
public:
    explicit AliasAlreadyDefined(const std::string& name);
};

/**
 * @brief An alias points to a key that was never registered
 */
class AliasConfigurationError : public DIException {
public:
    AliasConfigurationError(const std::string& name, const ServiceKey& key);
};

/**
 * @brief A name matches more than one registered key and no exact alias
 * disambiguates it
 */
class AmbiguousReferenceNameException : public DIException {
public:
    explicit AmbiguousReferenceNameException(const std::string& name);
};

class InvalidOperationInStrictMode : public DIException {
public:
    InvalidOperationInStrictMode();
};

/**
 * @brief A factory was registered without an explicit or inferable
 * return type
 */
class MissingTypeException : public DIException {
public:
    MissingTypeException();
};

class InvalidFactory : public DIException {
public:
    explicit InvalidFactory(const std::string& type_name);

    /// The factory returns `returned` but is registered under type `key`
    InvalidFactory(const ServiceKey& key, std::type_index returned);
};

/**
 * @brief No descriptor is available for a concrete type that needs one
 */
class MissingDescriptorException : public DIException {
public:
    explicit MissingDescriptorException(const ServiceKey& key);
};

class ScopeDisposedException : public DIException {
public:
    ScopeDisposedException();
};

}  // namespace weave::di
