// tests/di/test_service_provider.cpp
#define BOOST_TEST_MODULE ServiceProviderTests
#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "weave/di/container.hpp"

using namespace weave::di;

namespace {

class Example {
public:
    std::string name = "example";
};

class RequestContext {
public:
    std::string user = "anonymous";
};

class Repository {
public:
    WEAVE_INJECT(Repository, inject<RequestContext>("context"))
    explicit Repository(std::shared_ptr<RequestContext> context)
        : context(std::move(context)) {}
    std::shared_ptr<RequestContext> context;
};

std::string describe_example(std::shared_ptr<Example> example) {
    return example->name;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(ServiceProviderTestSuite)

// ============================================================================
// Lookup
// ============================================================================

BOOST_AUTO_TEST_CASE(test_get_by_type_and_name) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    auto example = provider->get<Example>();
    BOOST_CHECK(provider->get<Example>("Example") == example);
    BOOST_CHECK(std::static_pointer_cast<Example>((*provider)["example"]) == example);
    BOOST_CHECK(provider->contains<Example>());
    BOOST_CHECK(provider->contains("example"));
    BOOST_CHECK(!provider->contains<RequestContext>());
}

BOOST_AUTO_TEST_CASE(test_get_with_default) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    auto fallback = std::make_shared<RequestContext>();
    BOOST_CHECK(provider->get_or(key_of<RequestContext>(), fallback) == fallback);
    BOOST_CHECK(provider->get_or(key_of<Example>(), fallback) != fallback);
    BOOST_CHECK(provider->try_get<RequestContext>() == nullptr);
    BOOST_CHECK(provider->try_get<Example>() != nullptr);
}

BOOST_AUTO_TEST_CASE(test_get_with_default_prefers_scoped_value) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    auto seeded = std::make_shared<RequestContext>();
    auto fallback = std::make_shared<RequestContext>();
    ActivationScope scope(provider, {{ServiceKey("request"), seeded}});

    BOOST_CHECK(provider->get_or("request", fallback, &scope) == seeded);
    BOOST_CHECK(provider->get("request", &scope) == seeded);
    BOOST_CHECK(provider->get_or("request", fallback) == fallback);
}

BOOST_AUTO_TEST_CASE(test_typed_lookup_of_another_type_fails) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    BOOST_CHECK_THROW(provider->get<RequestContext>("example"),
                      CannotResolveTypeException);
}

// ============================================================================
// Set
// ============================================================================

BOOST_AUTO_TEST_CASE(test_set_on_empty_provider) {
    auto provider = std::make_shared<ServiceProvider>();
    auto example = std::make_shared<Example>();

    provider->set(example);

    BOOST_CHECK(provider->get<Example>() == example);
    BOOST_CHECK(provider->get("Example") == example);
    BOOST_CHECK_EQUAL(provider->size(), 2u);
}

BOOST_AUTO_TEST_CASE(test_set_named_value) {
    auto provider = std::make_shared<ServiceProvider>();
    provider->set("greeting", std::make_shared<std::string>("hello"));

    BOOST_CHECK_EQUAL(*provider->get<std::string>("greeting"), "hello");
}

BOOST_AUTO_TEST_CASE(test_set_existing_key_throws) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    BOOST_CHECK_THROW(provider->set(std::make_shared<Example>()),
                      OverridingServiceException);
    BOOST_CHECK_THROW(provider->set("example", std::make_shared<Example>()),
                      OverridingServiceException);
}

BOOST_AUTO_TEST_CASE(test_provider_without_shared_owner) {
    ServiceProvider provider;
    provider.set(std::make_shared<Example>());

    BOOST_CHECK_EQUAL(provider.get<Example>()->name, "example");
}

// ============================================================================
// Scopes
// ============================================================================

BOOST_AUTO_TEST_CASE(test_scope_seeded_values_take_precedence) {
    Container container;
    container.add_scoped<RequestContext>().add_transient<Repository>();
    auto provider = container.build_provider();

    auto context = std::make_shared<RequestContext>();
    context->user = "alice";

    ActivationScope scope(provider, {{key_of<RequestContext>(), context}});
    BOOST_CHECK(scope.get<Repository>()->context == context);
    BOOST_CHECK_EQUAL(scope.scoped_count(), 1u);
}

BOOST_AUTO_TEST_CASE(test_scope_dispose) {
    Container container;
    container.add_scoped<RequestContext>();
    auto provider = container.build_provider();

    auto scope = provider->create_scope();
    std::weak_ptr<RequestContext> context = scope->get<RequestContext>();
    BOOST_CHECK_EQUAL(scope->scoped_count(), 1u);

    scope->dispose();

    BOOST_CHECK(scope->is_disposed());
    BOOST_CHECK(context.expired());
    BOOST_CHECK_THROW(scope->get<RequestContext>(), ScopeDisposedException);
    BOOST_CHECK_THROW(scope->provider(), ScopeDisposedException);
    BOOST_CHECK_THROW(provider->get<RequestContext>(scope.get()),
                      ScopeDisposedException);
    BOOST_CHECK_NO_THROW(scope->dispose());
}

BOOST_AUTO_TEST_CASE(test_scope_destructor_releases_instances) {
    Container container;
    container.add_scoped<RequestContext>();
    auto provider = container.build_provider();

    std::weak_ptr<RequestContext> context;
    {
        ActivationScope scope(provider);
        context = scope.get<RequestContext>();
        BOOST_CHECK(!context.expired());
    }
    BOOST_CHECK(context.expired());
}

// ============================================================================
// Executors
// ============================================================================

BOOST_AUTO_TEST_CASE(test_exec_resolves_parameters_by_type) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    auto result = provider->exec(describe_example);
    BOOST_CHECK_EQUAL(result, "example");
}

BOOST_AUTO_TEST_CASE(test_exec_resolves_parameters_by_name) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    auto result = provider->exec(
        [](std::shared_ptr<Example> example) { return example->name + "!"; }, {},
        {"example"});
    BOOST_CHECK_EQUAL(result, "example!");
}

BOOST_AUTO_TEST_CASE(test_exec_with_seeded_scope) {
    Container container;
    container.add_scoped<RequestContext>().add_transient<Repository>();
    auto provider = container.build_provider();

    auto context = std::make_shared<RequestContext>();
    context->user = "bob";

    auto user = provider->exec(
        [](std::shared_ptr<Repository> repository,
           const std::shared_ptr<RequestContext>& context) {
            BOOST_CHECK(repository->context == context);
            return context->user;
        },
        {{key_of<RequestContext>(), context}});
    BOOST_CHECK_EQUAL(user, "bob");
}

BOOST_AUTO_TEST_CASE(test_executor_runs_each_call_in_a_new_scope) {
    Container container;
    container.add_scoped<RequestContext>();
    auto provider = container.build_provider();

    std::vector<std::shared_ptr<RequestContext>> seen;
    auto executor = provider->get_executor(
        [&seen](std::shared_ptr<RequestContext> a, std::shared_ptr<RequestContext> b) {
            BOOST_CHECK(a == b);
            seen.push_back(a);
        });

    executor({});
    executor({});

    BOOST_REQUIRE_EQUAL(seen.size(), 2u);
    BOOST_CHECK(seen[0] != seen[1]);
}

BOOST_AUTO_TEST_CASE(test_executor_plans_are_memoized) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    for (int i = 0; i < 3; ++i) {
        provider->exec(describe_example);
    }
    BOOST_CHECK_EQUAL(provider->executor_plan_count(), 1u);
}

BOOST_AUTO_TEST_CASE(test_exec_unknown_parameter) {
    Container container;
    container.add_singleton<Example>();
    auto provider = container.build_provider();

    BOOST_CHECK_THROW(
        provider->exec([](std::shared_ptr<RequestContext>) { return 0; }),
        CannotResolveTypeException);
}

BOOST_AUTO_TEST_CASE(test_exec_async) {
    Container container;
    container.add_singleton<Example>().add_scoped<RequestContext>();
    auto provider = container.build_provider();

    auto future = provider->exec_async(
        [](std::shared_ptr<Example> example, std::shared_ptr<RequestContext> context) {
            return example->name + ":" + context->user;
        });

    BOOST_CHECK_EQUAL(future.get(), "example:anonymous");
}

// ============================================================================
// Concurrency
// ============================================================================

BOOST_AUTO_TEST_CASE(test_concurrent_scopes_are_isolated) {
    Container container;
    container.add_scoped<RequestContext>().add_transient<Repository>();
    auto provider = container.build_provider();

    std::vector<int> consistent(8, 0);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < consistent.size(); ++i) {
        threads.emplace_back([&, i] {
            ActivationScope scope(provider);
            auto first = scope.get<Repository>();
            auto second = scope.get<Repository>();
            consistent[i] = first != second && first->context == second->context;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (int value : consistent) {
        BOOST_CHECK(value);
    }
}

BOOST_AUTO_TEST_SUITE_END()
