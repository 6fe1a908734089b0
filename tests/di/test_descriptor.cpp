// tests/di/test_descriptor.cpp
#define BOOST_TEST_MODULE DescriptorTests
#include <boost/test/unit_test.hpp>

#include <memory>
#include <string>

#include "weave/di/container.hpp"
#include "weave/di/descriptor.hpp"

using namespace weave::di;

namespace {

class Settings {
public:
    std::string url = "sqlite://memory";
};

class Repository {
public:
    explicit Repository(std::shared_ptr<Settings> settings)
        : settings(std::move(settings)) {}
    std::shared_ptr<Settings> settings;
};

class Service {
public:
    WEAVE_INJECT(Service, inject<Repository>("repository"),
                 named<Settings>("settings"))

    Service(std::shared_ptr<Repository> repository,
            std::shared_ptr<Settings> settings)
        : repository(std::move(repository)), settings(std::move(settings)) {}

    std::shared_ptr<Repository> repository;
    std::shared_ptr<Settings> settings;
};

class Controller {
public:
    std::shared_ptr<Repository> repository;
    std::shared_ptr<Settings> settings;
};

class Clock {};

// External descriptor source
class StaticDescriptors : public DescriptorProvider {
public:
    StaticDescriptors() {
        table_.add(constructor<Repository>(inject<Settings>("settings")));
    }

    const TypeDescriptor* find_descriptor(std::type_index type) const override {
        ++lookups;
        return table_.find_descriptor(type);
    }

    mutable int lookups = 0;

private:
    DescriptorTable table_;
};

}  // namespace

BOOST_AUTO_TEST_SUITE(DescriptorTestSuite)

// ============================================================================
// Builders
// ============================================================================

BOOST_AUTO_TEST_CASE(test_constructor_descriptor) {
    auto descriptor = constructor<Repository>(inject<Settings>("settings"));

    BOOST_CHECK(descriptor.kind == TypeDescriptor::Kind::CONSTRUCTOR);
    BOOST_CHECK(descriptor.type == std::type_index(typeid(Repository)));
    BOOST_REQUIRE_EQUAL(descriptor.parameters.size(), 1u);
    BOOST_CHECK_EQUAL(descriptor.parameters[0].name, "settings");
    BOOST_CHECK(!descriptor.parameters[0].is_name_only());
    BOOST_CHECK(descriptor.parameters[0].alternatives[0] == key_of<Settings>());

    auto settings = std::make_shared<Settings>();
    auto instance = std::static_pointer_cast<Repository>(
        descriptor.activator(Arguments{settings}));
    BOOST_CHECK(instance->settings == settings);
}

BOOST_AUTO_TEST_CASE(test_self_described_type) {
    auto descriptor = intrinsic_descriptor<Service>();

    BOOST_REQUIRE(descriptor.has_value());
    BOOST_REQUIRE_EQUAL(descriptor->parameters.size(), 2u);
    BOOST_CHECK_EQUAL(descriptor->parameters[0].name, "repository");
    BOOST_CHECK(!descriptor->parameters[0].is_name_only());
    BOOST_CHECK_EQUAL(descriptor->parameters[1].name, "settings");
    BOOST_CHECK(descriptor->parameters[1].is_name_only());
    BOOST_CHECK(descriptor->parameters[1].value_type ==
                std::type_index(typeid(Settings)));
}

BOOST_AUTO_TEST_CASE(test_default_constructible_has_no_dependencies) {
    auto descriptor = intrinsic_descriptor<Clock>();

    BOOST_REQUIRE(descriptor.has_value());
    BOOST_CHECK(descriptor->parameters.empty());
    BOOST_CHECK(descriptor->activator(Arguments{}) != nullptr);
}

BOOST_AUTO_TEST_CASE(test_undescribed_type_has_no_descriptor) {
    BOOST_CHECK(!intrinsic_descriptor<Repository>().has_value());
}

BOOST_AUTO_TEST_CASE(test_fields_descriptor) {
    TypeDescriptor descriptor = fields<Controller>()
                                    .field("repository", &Controller::repository)
                                    .named_field("settings", &Controller::settings);

    BOOST_CHECK(descriptor.kind == TypeDescriptor::Kind::FIELDS);
    BOOST_REQUIRE_EQUAL(descriptor.parameters.size(), 2u);
    BOOST_CHECK(descriptor.parameters[1].is_name_only());

    auto settings = std::make_shared<Settings>();
    auto repository = std::make_shared<Repository>(settings);
    auto controller = std::static_pointer_cast<Controller>(
        descriptor.activator(Arguments{repository, settings}));
    BOOST_CHECK(controller->repository == repository);
    BOOST_CHECK(controller->settings == settings);
}

BOOST_AUTO_TEST_CASE(test_union_parameter) {
    auto parameter = either<Settings, Clock>("source").info;

    BOOST_CHECK(parameter.is_union());
    BOOST_CHECK_EQUAL(parameter.alternatives.size(), 2u);
}

// ============================================================================
// Descriptor table
// ============================================================================

BOOST_AUTO_TEST_CASE(test_descriptor_table) {
    DescriptorTable table;

    BOOST_CHECK(table.add_default(constructor<Clock>()));
    BOOST_CHECK(!table.add_default(constructor<Clock>()));
    BOOST_CHECK(table.contains(typeid(Clock)));
    BOOST_CHECK(table.find_descriptor(typeid(Settings)) == nullptr);

    table.add(constructor<Repository>(inject<Settings>("settings")));
    BOOST_CHECK_EQUAL(table.size(), 2u);
    BOOST_CHECK_EQUAL(
        table.find_descriptor(typeid(Repository))->parameters.size(), 1u);
}

// ============================================================================
// Descriptors seen by the container
// ============================================================================

BOOST_AUTO_TEST_CASE(test_container_uses_described_constructor) {
    Container container;
    container.add_singleton<Settings>()
        .add_transient<Repository>()
        .describe<Repository>(constructor<Repository>(inject<Settings>("settings")));

    auto provider = container.build_provider();
    auto repository = provider->get<Repository>();
    BOOST_CHECK(repository->settings == provider->get<Settings>());
}

BOOST_AUTO_TEST_CASE(test_missing_descriptor_fails_build) {
    Container container;
    container.add_singleton<Settings>();
    container.bind_types(key_of<Repository>(), typeid(Repository),
                         ServiceLifetime::TRANSIENT);

    BOOST_CHECK_THROW(container.build_provider(), MissingDescriptorException);
}

BOOST_AUTO_TEST_CASE(test_descriptor_provider_consulted_first) {
    auto descriptors = std::make_shared<StaticDescriptors>();

    Container container;
    container.set_descriptor_provider(descriptors);
    container.add_singleton<Settings>();
    container.bind_types(key_of<Repository>(), typeid(Repository),
                         ServiceLifetime::TRANSIENT);

    auto provider = container.build_provider();
    BOOST_CHECK(provider->get<Repository>()->settings != nullptr);
    BOOST_CHECK(descriptors->lookups >= 2);
}

BOOST_AUTO_TEST_CASE(test_fields_injection_through_container) {
    Container container;
    container.add_singleton<Settings>()
        .add_transient<Repository>()
        .add_transient<Controller>()
        .describe<Repository>(constructor<Repository>(inject<Settings>("settings")))
        .describe<Controller>(fields<Controller>()
                                  .field("repository", &Controller::repository)
                                  .named_field("settings", &Controller::settings));

    auto provider = container.build_provider();
    auto controller = provider->get<Controller>();
    BOOST_REQUIRE(controller->repository);
    BOOST_CHECK(controller->settings == provider->get<Settings>());
}

BOOST_AUTO_TEST_SUITE_END()
