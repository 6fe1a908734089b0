#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <typeindex>
#include <utility>

#include "weave/di/activation_scope.hpp"
#include "weave/di/exceptions.hpp"
#include "weave/di/service_key.hpp"

namespace weave::di {

/**
 * @brief User-supplied callable producing a service
 *
 * A factory takes no arguments, the active scope, or the active scope and
 * the key of the service that requested it. The three shapes are wrapped
 * into one call signature when the factory is created, so producers never
 * branch on the shape.
 *
 * A factory may return null; the null value is delivered as the service.
 */
class Factory {
public:
    enum class Kind { NO_ARGS, WITH_SCOPE, WITH_SCOPE_AND_TYPE };

    using NoArgs = std::function<std::shared_ptr<void>()>;
    using WithScope = std::function<std::shared_ptr<void>(ActivationScope&)>;
    using WithScopeAndType =
        std::function<std::shared_ptr<void>(ActivationScope&, const ServiceKey&)>;

    /// @throws InvalidFactory if fn is empty
    Factory(NoArgs fn, std::optional<std::type_index> return_type = std::nullopt);
    Factory(WithScope fn, std::optional<std::type_index> return_type = std::nullopt);
    Factory(WithScopeAndType fn,
            std::optional<std::type_index> return_type = std::nullopt);

    std::shared_ptr<void> operator()(ActivationScope& scope,
                                     const ServiceKey& requesting) const {
        return invoke_(scope, requesting);
    }

    Kind kind() const { return kind_; }

    /// Number of parameters the wrapped callable takes (0, 1 or 2)
    int arity() const { return static_cast<int>(kind_); }

    /// Type the factory is declared to return, if known
    const std::optional<std::type_index>& return_type() const {
        return return_type_;
    }

private:
    Kind kind_;
    WithScopeAndType invoke_;
    std::optional<std::type_index> return_type_;
};

namespace detail {

template <typename F>
struct is_nullable_callable : std::is_pointer<F> {};

template <typename Signature>
struct is_nullable_callable<std::function<Signature>> : std::true_type {};

template <typename R>
struct pointer_result : std::false_type {
    using element_type = std::decay_t<R>;
};

template <typename X>
struct pointer_result<std::shared_ptr<X>> : std::true_type {
    using element_type = X;
};

template <typename X, typename D>
struct pointer_result<std::unique_ptr<X, D>> : std::true_type {
    using element_type = X;
};

// Converts a factory result to a pointer to TReturn (when given), erased
template <typename TReturn, typename R>
std::shared_ptr<void> erase_result(R&& value) {
    using Result = pointer_result<std::decay_t<R>>;
    using Element = typename Result::element_type;

    if constexpr (Result::value) {
        if constexpr (std::is_void_v<TReturn> || std::is_void_v<Element>) {
            return std::shared_ptr<void>(std::forward<R>(value));
        } else {
            return std::shared_ptr<TReturn>(std::forward<R>(value));
        }
    } else {
        auto instance = std::make_shared<Element>(std::forward<R>(value));
        if constexpr (std::is_void_v<TReturn>) {
            return instance;
        } else {
            return std::shared_ptr<TReturn>(std::move(instance));
        }
    }
}

template <typename TReturn, typename R>
std::optional<std::type_index> declared_return() {
    using Element = typename pointer_result<std::decay_t<R>>::element_type;

    if constexpr (!std::is_void_v<TReturn>) {
        return std::type_index(typeid(TReturn));
    } else if constexpr (std::is_void_v<Element>) {
        return std::nullopt;
    } else {
        return std::type_index(typeid(Element));
    }
}

template <typename TReturn>
std::string factory_type_name() {
    if constexpr (std::is_void_v<TReturn>) {
        return "<unknown>";
    } else {
        return class_name(std::type_index(typeid(TReturn)));
    }
}

}  // namespace detail

/**
 * @brief Wrap a callable into a Factory, deducing its shape and return type
 *
 * TReturn overrides the deduced return type; the result is converted to
 * std::shared_ptr<TReturn> before it is erased.
 *
 * @throws InvalidFactory if the callable matches none of the three shapes
 */
template <typename TReturn = void, typename F>
Factory make_factory(F&& fn) {
    using Fn = std::decay_t<F>;
    Fn callable(std::forward<F>(fn));

    if constexpr (detail::is_nullable_callable<Fn>::value) {
        if (!static_cast<bool>(callable)) {
            throw InvalidFactory(detail::factory_type_name<TReturn>());
        }
    }

    if constexpr (std::is_invocable_v<Fn&>) {
        using R = std::invoke_result_t<Fn&>;
        static_assert(!std::is_void_v<R>, "a factory must return a value");
        return Factory(Factory::NoArgs([callable]() mutable {
                           return detail::erase_result<TReturn>(callable());
                       }),
                       detail::declared_return<TReturn, R>());
    } else if constexpr (std::is_invocable_v<Fn&, ActivationScope&>) {
        using R = std::invoke_result_t<Fn&, ActivationScope&>;
        static_assert(!std::is_void_v<R>, "a factory must return a value");
        return Factory(Factory::WithScope([callable](ActivationScope& scope) mutable {
                           return detail::erase_result<TReturn>(callable(scope));
                       }),
                       detail::declared_return<TReturn, R>());
    } else if constexpr (std::is_invocable_v<Fn&, ActivationScope&,
                                             const ServiceKey&>) {
        using R = std::invoke_result_t<Fn&, ActivationScope&, const ServiceKey&>;
        static_assert(!std::is_void_v<R>, "a factory must return a value");
        return Factory(
            Factory::WithScopeAndType(
                [callable](ActivationScope& scope,
                           const ServiceKey& requesting) mutable {
                    return detail::erase_result<TReturn>(
                        callable(scope, requesting));
                }),
            detail::declared_return<TReturn, R>());
    } else {
        throw InvalidFactory(detail::factory_type_name<TReturn>());
    }
}

}  // namespace weave::di
