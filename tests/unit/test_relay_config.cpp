#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "courier/configuration/relay_config.hpp"
#include "courier/core/constants.hpp"
#include <cstdlib>
using namespace courier::protocol;
using courier::protocol::configuration::RelayConfig;
using Catch::Matchers::ContainsSubstring;
namespace {
    struct ScopedVariable {
        ScopedVariable(const char* name, const char* value) : name(name) {
            ::setenv(name, value, 1);
        }
        ~ScopedVariable() {
            ::unsetenv(name);
        }
        const char* name;
    };
}
TEST_CASE("RelayConfig - Push timeout", "[config][relay]") {
    SECTION("Defaults to ten seconds") {
        REQUIRE(RelayConfig::Default().push_timeout.count() == RelayConstants::DEFAULT_PUSH_TIMEOUT_MS);
    }
    SECTION("Read from the environment") {
        ScopedVariable timeout("RELAY_PUSH_TIMEOUT_MS", "250");
        REQUIRE(RelayConfig::FromEnvironment().Unwrap().push_timeout.count() == 250);
    }
    SECTION("Zero and garbage are rejected") {
        {
            ScopedVariable timeout("RELAY_PUSH_TIMEOUT_MS", "0");
            auto config = RelayConfig::FromEnvironment();
            REQUIRE(config.IsErr());
            REQUIRE(config.UnwrapErr().type == RelayFailureType::Validation);
        }
        ScopedVariable timeout("RELAY_PUSH_TIMEOUT_MS", "soon");
        REQUIRE_THAT(RelayConfig::FromEnvironment().UnwrapErr().message, ContainsSubstring("RELAY_PUSH_TIMEOUT_MS"));
    }
}
