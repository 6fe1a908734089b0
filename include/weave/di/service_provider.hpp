#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "weave/di/activation_scope.hpp"
#include "weave/di/producers.hpp"
#include "weave/di/service_key.hpp"

namespace weave::di {

using ProducerMap = std::unordered_map<ServiceKey, ProducerPtr>;

namespace detail {

template <typename T>
struct callable_traits : callable_traits<decltype(&T::operator())> {};

template <typename R, typename... Args>
struct callable_traits<R(Args...)> {
    using result_type = R;
    using args_tuple = std::tuple<Args...>;
    static constexpr std::size_t arity = sizeof...(Args);
};

template <typename R, typename... Args>
struct callable_traits<R (*)(Args...)> : callable_traits<R(Args...)> {};

template <typename R, typename... Args>
struct callable_traits<R (*)(Args...) noexcept> : callable_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...)> : callable_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const> : callable_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) noexcept> : callable_traits<R(Args...)> {};

template <typename C, typename R, typename... Args>
struct callable_traits<R (C::*)(Args...) const noexcept>
    : callable_traits<R(Args...)> {};

template <typename T>
struct always_false : std::false_type {};

template <typename P>
struct injected_service {
    static_assert(always_false<P>::value,
                  "executor parameters must be std::shared_ptr<T>");
};

template <typename U>
struct injected_service<std::shared_ptr<U>> {
    using type = U;
};

template <typename Arg>
using injected_service_t = typename injected_service<std::decay_t<Arg>>::type;

}  // namespace detail

/**
 * @brief Parameter of an executor: how to resolve one argument
 */
struct ExecutorParameter {
    ServiceKey key;
    std::type_index value_type;
};

using ExecutorPlan = std::vector<ExecutorParameter>;

/**
 * @brief Immutable result of Container::build_provider()
 *
 * Maps every registered key, canonical name and alias to its compiled
 * producer. Lookups never re-inspect types. Providers are normally held by
 * std::shared_ptr; executors keep their provider alive through it.
 */
class ServiceProvider : public std::enable_shared_from_this<ServiceProvider> {
public:
    ServiceProvider() = default;
    explicit ServiceProvider(ProducerMap producers);

    ServiceProvider(const ServiceProvider&) = delete;
    ServiceProvider& operator=(const ServiceProvider&) = delete;

    /**
     * @brief Resolve a service
     *
     * The scope's cache is consulted first. Without a scope a one-shot scope
     * is used for the call.
     *
     * @throws CannotResolveTypeException if key is not registered
     */
    std::shared_ptr<void> get(const ServiceKey& key,
                              ActivationScope* scope = nullptr) const {
        return get_as(key, std::type_index(typeid(void)), scope);
    }

    template <typename T>
    std::shared_ptr<T> get(ActivationScope* scope = nullptr) const {
        return std::static_pointer_cast<T>(
            get_as(key_of<T>(), std::type_index(typeid(T)), scope));
    }

    template <typename T>
    std::shared_ptr<T> get(const ServiceKey& key,
                           ActivationScope* scope = nullptr) const {
        return std::static_pointer_cast<T>(
            get_as(key, std::type_index(typeid(T)), scope));
    }

    /**
     * @brief Resolve a service whose producer must yield value_type
     * @throws CannotResolveTypeException if key is unknown or yields another type
     */
    std::shared_ptr<void> get_as(const ServiceKey& key, std::type_index value_type,
                                 ActivationScope* scope) const;

    std::shared_ptr<void> get_or(const ServiceKey& key,
                                 std::shared_ptr<void> default_value,
                                 ActivationScope* scope = nullptr) const;

    /// Null when T is not registered
    template <typename T>
    std::shared_ptr<T> try_get(ActivationScope* scope = nullptr) const {
        if (!contains(key_of<T>())) {
            return nullptr;
        }
        return get<T>(scope);
    }

    std::shared_ptr<void> operator[](const ServiceKey& key) const {
        return get(key);
    }

    bool contains(const ServiceKey& key) const;

    template <typename T>
    bool contains() const {
        return contains(key_of<T>());
    }

    /**
     * @brief Register an instance after the build
     *
     * A type key is also made reachable by its canonical name.
     *
     * @throws OverridingServiceException if the key or its name is taken
     */
    void set(const ServiceKey& key, std::shared_ptr<void> value,
             std::type_index value_type = std::type_index(typeid(void)));

    template <typename T>
    void set(std::shared_ptr<T> value) {
        set(key_of<T>(), std::move(value), std::type_index(typeid(T)));
    }

    std::size_t size() const;

    std::unique_ptr<ActivationScope> create_scope(
        ScopedServices scoped_services = {}) const;

    /**
     * @brief Wrap a callable whose parameters are std::shared_ptr<T> services
     *
     * Each parameter is resolved by its type, or by the matching entry of
     * `names` when that entry is not empty. The returned function runs the
     * callable in a fresh scope seeded with the services it is given.
     */
    template <typename F>
    auto get_executor(F fn, const std::vector<std::string>& names = {}) const {
        using Traits = detail::callable_traits<std::decay_t<F>>;
        using Result = typename Traits::result_type;

        auto plan = executor_plan<F>(names);
        auto self = shared_self();
        return std::function<Result(ScopedServices)>(
            [self, plan, fn = std::move(fn)](ScopedServices scoped) mutable -> Result {
                ActivationScope scope(self, std::move(scoped));
                auto args = self->resolve_arguments(
                    *plan, scope,
                    static_cast<typename Traits::args_tuple*>(nullptr),
                    std::make_index_sequence<Traits::arity>{});
                return std::apply(fn, std::move(args));
            });
    }

    /**
     * @brief Resolve the callable's parameters and run it in a new scope
     */
    template <typename F>
    auto exec(F fn, ScopedServices scoped = {},
              const std::vector<std::string>& names = {}) const {
        return get_executor(std::move(fn), names)(std::move(scoped));
    }

    /**
     * @brief Resolve the parameters now and run the callable asynchronously
     *
     * The scope stays alive until the task completes.
     */
    template <typename F>
    auto exec_async(F fn, ScopedServices scoped = {},
                    const std::vector<std::string>& names = {}) const {
        using Traits = detail::callable_traits<std::decay_t<F>>;

        auto plan = executor_plan<F>(names);
        auto scope = std::make_shared<ActivationScope>(shared_self(),
                                                       std::move(scoped));
        auto args = resolve_arguments(
            *plan, *scope, static_cast<typename Traits::args_tuple*>(nullptr),
            std::make_index_sequence<Traits::arity>{});

        return std::async(std::launch::async,
                          [scope, fn = std::move(fn), args = std::move(args)]() mutable {
                              return std::apply(fn, std::move(args));
                          });
    }

    /// Number of memoized executor plans
    std::size_t executor_plan_count() const;

private:
    std::shared_ptr<const ServiceProvider> shared_self() const;

    std::shared_ptr<const ExecutorPlan> cached_plan(
        const std::string& id, const std::function<ExecutorPlan()>& build) const;

    template <typename F>
    std::shared_ptr<const ExecutorPlan> executor_plan(
        const std::vector<std::string>& names) const {
        using Traits = detail::callable_traits<std::decay_t<F>>;

        std::string id = typeid(std::decay_t<F>).name();
        for (const auto& name : names) {
            id += '\x1f';
            id += name;
        }
        return cached_plan(id, [&names] {
            if (names.size() > Traits::arity) {
                throw std::invalid_argument(
                    "More parameter names than callable parameters");
            }
            return make_plan(names,
                             static_cast<typename Traits::args_tuple*>(nullptr));
        });
    }

    template <typename... Args>
    static ExecutorPlan make_plan(const std::vector<std::string>& names,
                                  std::tuple<Args...>*) {
        ExecutorPlan plan;
        plan.reserve(sizeof...(Args));
        std::size_t index = 0;
        (plan.push_back(plan_parameter<Args>(names, index++)), ...);
        return plan;
    }

    template <typename Arg>
    static ExecutorParameter plan_parameter(const std::vector<std::string>& names,
                                            std::size_t index) {
        using Service = detail::injected_service_t<Arg>;
        std::type_index value_type(typeid(Service));
        if (index < names.size() && !names[index].empty()) {
            return ExecutorParameter{ServiceKey(names[index]), value_type};
        }
        return ExecutorParameter{key_of<Service>(), value_type};
    }

    template <typename... Args, std::size_t... I>
    std::tuple<std::decay_t<Args>...> resolve_arguments(
        const ExecutorPlan& plan, ActivationScope& scope, std::tuple<Args...>*,
        std::index_sequence<I...>) const {
        // Braced initialization resolves arguments left to right
        return std::tuple<std::decay_t<Args>...>{
            std::static_pointer_cast<detail::injected_service_t<Args>>(
                get_as(plan[I].key, plan[I].value_type, &scope))...};
    }

    mutable std::shared_mutex mutex_;
    ProducerMap producers_;

    mutable std::mutex plans_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<const ExecutorPlan>>
        plans_;
};

}  // namespace weave::di
