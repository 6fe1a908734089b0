// tests/di/test_service_key.cpp
#define BOOST_TEST_MODULE ServiceKeyTests
#include <boost/test/unit_test.hpp>

#include <stdexcept>
#include <unordered_set>

#include "weave/di/container_options.hpp"
#include "weave/di/lifetime.hpp"
#include "weave/di/service_key.hpp"

using namespace weave::di;

namespace app::db {
class SqlRepository {};

struct Outer {
    struct Inner {};
};

template <typename T>
class Box {};
}  // namespace app::db

BOOST_AUTO_TEST_SUITE(ServiceKeyTestSuite)

// ============================================================================
// Canonical names
// ============================================================================

BOOST_AUTO_TEST_CASE(test_type_key_name_drops_namespaces) {
    auto key = key_of<app::db::SqlRepository>();

    BOOST_CHECK(key.is_type());
    BOOST_CHECK_EQUAL(key.name(), "SqlRepository");
    BOOST_CHECK_EQUAL(key.full_name(), "app::db::SqlRepository");
}

BOOST_AUTO_TEST_CASE(test_nested_type_name) {
    BOOST_CHECK_EQUAL(key_of<app::db::Outer::Inner>().name(), "Inner");
}

BOOST_AUTO_TEST_CASE(test_name_key) {
    ServiceKey key("connection_string");

    BOOST_CHECK(key.is_name());
    BOOST_CHECK_EQUAL(key.name(), "connection_string");
    BOOST_CHECK_EQUAL(key.full_name(), "connection_string");
    BOOST_CHECK(!key.is_generic());
}

BOOST_AUTO_TEST_CASE(test_generic_type) {
    auto key = key_of<app::db::Box<app::db::SqlRepository>>();

    BOOST_CHECK(key.is_generic());
    BOOST_CHECK(!key_of<app::db::SqlRepository>().is_generic());
    // Template arguments keep their qualifiers
    BOOST_CHECK(key.name().find("Box<") == 0);
}

// ============================================================================
// Equality and hashing
// ============================================================================

BOOST_AUTO_TEST_CASE(test_type_and_name_keys_differ) {
    auto type_key = key_of<app::db::SqlRepository>();
    ServiceKey name_key("SqlRepository");

    BOOST_CHECK(type_key != name_key);
    BOOST_CHECK(type_key == key_of<app::db::SqlRepository>());
    BOOST_CHECK(name_key == ServiceKey(std::string("SqlRepository")));

    std::unordered_set<ServiceKey> keys{type_key, name_key};
    BOOST_CHECK_EQUAL(keys.size(), 2u);
    BOOST_CHECK(keys.count(key_of<app::db::SqlRepository>()) == 1);
}

// ============================================================================
// Normalized names
// ============================================================================

BOOST_AUTO_TEST_CASE(test_standard_param_name) {
    BOOST_CHECK_EQUAL(to_standard_param_name("UserService"), "user_service");
    BOOST_CHECK_EQUAL(to_standard_param_name("HTTPResponse"), "http_response");
    BOOST_CHECK_EQUAL(to_standard_param_name("ICatsRepository"),
                      "icats_repository");
    BOOST_CHECK_EQUAL(to_standard_param_name("settings"), "settings");
    BOOST_CHECK_EQUAL(to_standard_param_name("Get2Cats"), "get2_cats");
}

// ============================================================================
// Enumerations
// ============================================================================

BOOST_AUTO_TEST_CASE(test_lifetime_strings) {
    BOOST_CHECK(lifetime_from_string("Singleton") == ServiceLifetime::SINGLETON);
    BOOST_CHECK(lifetime_from_string("scoped") == ServiceLifetime::SCOPED);
    BOOST_CHECK(lifetime_from_string("TRANSIENT") == ServiceLifetime::TRANSIENT);
    BOOST_CHECK_EQUAL(to_string(ServiceLifetime::SCOPED), "scoped");
    BOOST_CHECK_THROW(lifetime_from_string("pooled"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_alias_policy_strings) {
    BOOST_CHECK(alias_policy_from_string("EAGER") == AliasAmbiguityPolicy::EAGER);
    BOOST_CHECK(alias_policy_from_string("defer") == AliasAmbiguityPolicy::DEFER);
    BOOST_CHECK_EQUAL(to_string(AliasAmbiguityPolicy::EAGER), "eager");
    BOOST_CHECK_THROW(alias_policy_from_string("lenient"), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
