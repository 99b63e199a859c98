#include "EnvGuard.hpp"
#include "config/CseOptions.hpp"

#include <doctest/doctest.h>

#include <iostream>
#include <sstream>

using namespace M2M;
using M2M::Testing::EnvBlock;
using M2M::Testing::EnvGuard;

namespace {

auto makeBaselineEnvBlock() -> EnvBlock {
    return EnvBlock{
        {"M2M_CSE_ID", nullptr},
        {"M2M_CSE_RI", nullptr},
        {"M2M_CSE_RN", nullptr},
        {"M2M_CSE_SPID", nullptr},
        {"M2M_CSE_ADMIN", nullptr},
        {"M2M_CSE_ENABLE_TRANSIT", nullptr},
        {"M2M_CSE_ENABLE_ACP_CHECKS", nullptr},
        {"M2M_CSE_ALLOWED_AE_ORIGINATORS", nullptr},
        {"M2M_CSE_EXPIRATION_SECONDS", nullptr},
    };
}

// Silences the diagnostics printed for rejected values
struct StderrSilencer {
    StderrSilencer() : original(std::cerr.rdbuf(buffer.rdbuf())) {}
    ~StderrSilencer() { std::cerr.rdbuf(original); }

    std::ostringstream buffer;
    std::streambuf*    original;
};

} // namespace

TEST_SUITE("config.cse_options") {

TEST_CASE("defaults are valid") {
    CseOptions options;
    CHECK_FALSE(ValidateCseOptions(options).has_value());
    CHECK(options.cseId == "/id-in");
    CHECK(options.cseResourceName == "cse-in");
    CHECK_FALSE(options.enableTransitRequests);
    CHECK(options.enableAcpChecks);
}

TEST_CASE("validation names the first invalid field") {
    CseOptions options;
    options.cseId = "id-in";
    CHECK(ValidateCseOptions(options).has_value());

    options       = {};
    options.cseId = "/a/b";
    CHECK(ValidateCseOptions(options).has_value());

    options                 = {};
    options.cseResourceName = "cse/in";
    auto message            = ValidateCseOptions(options);
    REQUIRE(message.has_value());
    CHECK(message->find("cseResourceName") != std::string::npos);

    options                 = {};
    options.cseResourceName = "~";
    CHECK(ValidateCseOptions(options).has_value());

    options                 = {};
    options.adminOriginator = "";
    CHECK(ValidateCseOptions(options).has_value());

    options                   = {};
    options.maxDiscoveryLevel = -1;
    CHECK(ValidateCseOptions(options).has_value());
}

TEST_CASE("environment overrides are applied") {
    auto env = makeBaselineEnvBlock();
    EnvGuard cseId("M2M_CSE_ID", "mn-cse");
    EnvGuard rn("M2M_CSE_RN", "cse-mn");
    EnvGuard transit("M2M_CSE_ENABLE_TRANSIT", "yes");
    EnvGuard acp("M2M_CSE_ENABLE_ACP_CHECKS", "off");
    EnvGuard patterns("M2M_CSE_ALLOWED_AE_ORIGINATORS", " Cdemo* , S* ,");
    EnvGuard expiration("M2M_CSE_EXPIRATION_SECONDS", "3600");

    CseOptions options;
    CHECK(ApplyCseEnvOverrides(options));
    CHECK(options.cseId == "/mn-cse");
    CHECK(options.cseResourceName == "cse-mn");
    CHECK(options.enableTransitRequests);
    CHECK_FALSE(options.enableAcpChecks);
    CHECK(options.allowedAEOriginators == std::vector<std::string>{"Cdemo*", "S*"});
    CHECK(options.defaultExpirationSeconds == 3600);
}

TEST_CASE("invalid environment values are rejected") {
    auto           env = makeBaselineEnvBlock();
    StderrSilencer silence;

    SUBCASE("boolean") {
        EnvGuard transit("M2M_CSE_ENABLE_TRANSIT", "maybe");
        CseOptions options;
        CHECK_FALSE(ApplyCseEnvOverrides(options));
    }
    SUBCASE("segment") {
        EnvGuard ri("M2M_CSE_RI", "a/b");
        CseOptions options;
        CHECK_FALSE(ApplyCseEnvOverrides(options));
    }
    SUBCASE("expiration") {
        EnvGuard expiration("M2M_CSE_EXPIRATION_SECONDS", "0");
        CseOptions options;
        CHECK_FALSE(ApplyCseEnvOverrides(options));
        CHECK(options.defaultExpirationSeconds == CseOptions{}.defaultExpirationSeconds);
    }
}

TEST_CASE("originator patterns split on commas") {
    CHECK(SplitOriginatorPatterns("").empty());
    CHECK(SplitOriginatorPatterns("C*") == std::vector<std::string>{"C*"});
    CHECK(SplitOriginatorPatterns("a, b ,,c") == std::vector<std::string>{"a", "b", "c"});
}

}
