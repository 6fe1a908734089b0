#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "weave/di/service_key.hpp"

namespace weave::di {

using Arguments = std::vector<std::shared_ptr<void>>;

/**
 * @brief One dependency of a constructor or one injectable field
 *
 * `alternatives` holds the declared type: empty for a name-only parameter,
 * one key for a typed parameter, several keys for a union declaration.
 */
struct ParameterInfo {
    std::string name;
    std::vector<ServiceKey> alternatives;
    std::type_index value_type = std::type_index(typeid(void));

    bool is_name_only() const { return alternatives.empty(); }
    bool is_union() const { return alternatives.size() > 1; }
};

/**
 * @brief Describes how to build a concrete type
 *
 * The activator receives one argument per parameter, in order, and returns
 * a pointer to a new instance of `type`.
 */
struct TypeDescriptor {
    enum class Kind { CONSTRUCTOR, FIELDS };
    using Activator = std::function<std::shared_ptr<void>(const Arguments&)>;

    Kind kind = Kind::CONSTRUCTOR;
    std::type_index type = std::type_index(typeid(void));
    std::vector<ParameterInfo> parameters;
    Activator activator;
};

/**
 * @brief Typed dependency used by the descriptor builders
 */
template <typename T>
struct Dependency {
    ParameterInfo info;
};

/// Parameter resolved by its declared type
template <typename T>
Dependency<T> inject(std::string name) {
    return Dependency<T>{ParameterInfo{
        std::move(name), {key_of<T>()}, std::type_index(typeid(T))}};
}

/// Parameter resolved only by its name, through the alias tables
template <typename T>
Dependency<T> named(std::string name) {
    return Dependency<T>{
        ParameterInfo{std::move(name), {}, std::type_index(typeid(T))}};
}

/// Parameter declared as one of several types; never resolvable
template <typename T, typename U, typename... More>
Dependency<T> either(std::string name) {
    return Dependency<T>{ParameterInfo{
        std::move(name),
        {key_of<T>(), key_of<U>(), key_of<More>()...},
        std::type_index(typeid(void))}};
}

namespace detail {

template <typename T, typename... Deps, std::size_t... I>
std::shared_ptr<void> construct(const Arguments& args,
                                std::index_sequence<I...>) {
    return std::make_shared<T>(std::static_pointer_cast<Deps>(args[I])...);
}

}  // namespace detail

/**
 * @brief Describe a type built by calling its constructor
 *
 * @code
 * constructor<UserService>(inject<UserRepository>("repository"),
 *                          named<Settings>("settings"));
 * @endcode
 */
template <typename T, typename... Deps>
TypeDescriptor constructor(Dependency<Deps>... deps) {
    static_assert(std::is_constructible_v<T, std::shared_ptr<Deps>...>,
                  "type is not constructible from the declared dependencies");

    TypeDescriptor descriptor;
    descriptor.kind = TypeDescriptor::Kind::CONSTRUCTOR;
    descriptor.type = std::type_index(typeid(T));
    descriptor.parameters = {std::move(deps.info)...};
    descriptor.activator = [](const Arguments& args) {
        return detail::construct<T, Deps...>(
            args, std::index_sequence_for<Deps...>{});
    };
    return descriptor;
}

/**
 * @brief Describe a default-constructible type whose members are injected
 *
 * @code
 * fields<Controller>()
 *     .field("users", &Controller::users)
 *     .named_field("settings", &Controller::settings)
 *     .build();
 * @endcode
 */
template <typename T>
class FieldsBuilder {
public:
    template <typename U>
    FieldsBuilder& field(std::string name, std::shared_ptr<U> T::*member) {
        return add(inject<U>(std::move(name)).info, member);
    }

    template <typename U>
    FieldsBuilder& named_field(std::string name, std::shared_ptr<U> T::*member) {
        return add(named<U>(std::move(name)).info, member);
    }

    TypeDescriptor build() const {
        static_assert(std::is_default_constructible_v<T>,
                      "field injection requires a default constructor");

        TypeDescriptor descriptor;
        descriptor.kind = TypeDescriptor::Kind::FIELDS;
        descriptor.type = std::type_index(typeid(T));
        descriptor.parameters = parameters_;
        descriptor.activator = [assigners = assigners_](const Arguments& args) {
            auto instance = std::make_shared<T>();
            for (std::size_t i = 0; i < assigners.size(); ++i) {
                assigners[i](*instance, args[i]);
            }
            return std::shared_ptr<void>(instance);
        };
        return descriptor;
    }

    operator TypeDescriptor() const { return build(); }

private:
    using Assigner = std::function<void(T&, const std::shared_ptr<void>&)>;

    template <typename U>
    FieldsBuilder& add(ParameterInfo info, std::shared_ptr<U> T::*member) {
        parameters_.push_back(std::move(info));
        assigners_.push_back(
            [member](T& instance, const std::shared_ptr<void>& value) {
                instance.*member = std::static_pointer_cast<U>(value);
            });
        return *this;
    }

    std::vector<ParameterInfo> parameters_;
    std::vector<Assigner> assigners_;
};

template <typename T>
FieldsBuilder<T> fields() {
    return FieldsBuilder<T>();
}

/**
 * @brief Source of type descriptors consulted by the container at build time
 */
class DescriptorProvider {
public:
    virtual ~DescriptorProvider() = default;

    /// @return nullptr if the type is unknown to this provider
    virtual const TypeDescriptor* find_descriptor(std::type_index type) const = 0;
};

/**
 * @brief Descriptor registry keyed by concrete type
 */
class DescriptorTable : public DescriptorProvider {
public:
    /// Add or replace the descriptor of descriptor.type
    void add(TypeDescriptor descriptor);

    /// Add the descriptor only if the type has none yet
    bool add_default(TypeDescriptor descriptor);

    const TypeDescriptor* find_descriptor(std::type_index type) const override;

    bool contains(std::type_index type) const;
    std::size_t size() const { return descriptors_.size(); }

private:
    std::unordered_map<std::type_index, TypeDescriptor> descriptors_;
};

/**
 * @brief Descriptor a type carries by itself
 *
 * Self-described types (WEAVE_INJECT) use their own descriptor; any other
 * default-constructible type is built with no dependencies.
 */
template <typename T>
std::optional<TypeDescriptor> intrinsic_descriptor() {
    if constexpr (requires { T::weave_descriptor(); }) {
        return T::weave_descriptor();
    } else if constexpr (std::is_default_constructible_v<T>) {
        return constructor<T>();
    } else {
        return std::nullopt;
    }
}

}  // namespace weave::di

/**
 * @brief Declare the constructor dependencies of a class inside its body
 *
 * @code
 * class UserService {
 * public:
 *     WEAVE_INJECT(UserService, weave::di::inject<UserRepository>("repository"))
 *     explicit UserService(std::shared_ptr<UserRepository> repository);
 * };
 * @endcode
 */
#define WEAVE_INJECT(ClassName, ...)                                \
    static ::weave::di::TypeDescriptor weave_descriptor() {         \
        return ::weave::di::constructor<ClassName>(__VA_ARGS__);    \
    }
