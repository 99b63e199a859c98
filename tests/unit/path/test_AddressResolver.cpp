#include "DispatcherTestHelper.hpp"
#include "path/AddressResolver.hpp"

#include <doctest/doctest.h>

using namespace M2M;
using namespace M2M::Testing;

namespace {

struct ResolverFixture {
    ResolverFixture()
        : resolver(options, store) {
        root = seedCseBase(store, options);
        auto cnt = ResourceFromJson(Json{{"m2m:cnt", {{"ri", "cnt123"}, {"rn", "cnt"}}}}, ResourceType::CNT, root->ri(), 60);
        cnt->setStructuredPath("cse-in/cnt");
        container = *store.create(std::move(*cnt));
    }

    CseOptions          options;
    MemoryResourceStore store;
    AddressResolver     resolver;
    ResourcePtr         root;
    ResourcePtr         container;
};

} // namespace

TEST_SUITE("path.address_resolver") {

TEST_CASE("addressing modes are detected from the first segment") {
    CHECK(addressingModeOf("~/id-in/cse-in") == AddressingMode::SpRelative);
    CHECK(addressingModeOf("/~/id-in/cse-in") == AddressingMode::SpRelative);
    CHECK(addressingModeOf("_/sp/id-in/cse-in") == AddressingMode::Absolute);
    CHECK(addressingModeOf("cse-in/cnt") == AddressingMode::CseRelative);
    CHECK(addressingModeOf("~cnt") == AddressingMode::CseRelative);
}

TEST_CASE("structured classification counts segments beyond the minimum") {
    CHECK_FALSE(isStructured("cnt123"));
    CHECK(isStructured("cse-in/cnt"));
    CHECK_FALSE(isStructured("~/id-in/cnt123"));
    CHECK(isStructured("~/id-in/cse-in/cnt"));
    CHECK_FALSE(isStructured("_/sp/id-in/cnt123"));
    CHECK(isStructured("_/sp/id-in/cse-in/cnt"));
}

TEST_CASE("CSE-relative addresses") {
    ResolverFixture f;

    SUBCASE("single segment is a resource id") {
        auto parsed = f.resolver.parse("cnt123");
        REQUIRE(parsed.has_value());
        CHECK(parsed->resourceId == "cnt123");
        CHECK(parsed->structuredPath.empty());
        CHECK(parsed->cseId == "/id-in");
        CHECK_FALSE(parsed->remote);
    }
    SUBCASE("the CSE name alone is a structured path") {
        auto resolved = f.resolver.resolve("cse-in");
        REQUIRE(resolved.has_value());
        CHECK(resolved->structuredPath == "cse-in");
        CHECK(resolved->resourceId == "id-in");
    }
    SUBCASE("the CSE resource id is unstructured") {
        auto resolved = f.resolver.resolve("id-in");
        REQUIRE(resolved.has_value());
        CHECK(resolved->resourceId == "id-in");
        CHECK(resolved->structuredPath.empty());
    }
    SUBCASE("multi segment paths map to the bound resource") {
        auto resolved = f.resolver.resolve("/cse-in/cnt");
        REQUIRE(resolved.has_value());
        CHECK(resolved->resourceId == "cnt123");
        CHECK(resolved->structuredPath == "cse-in/cnt");
    }
    SUBCASE("unbound paths keep an empty resource id") {
        auto resolved = f.resolver.resolve("cse-in/missing");
        REQUIRE(resolved.has_value());
        CHECK(resolved->resourceId.empty());
        CHECK_FALSE(resolved->empty());
    }
}

TEST_CASE("SP-relative addresses") {
    ResolverFixture f;

    auto unstructured = f.resolver.resolve("~/id-in/cnt123");
    REQUIRE(unstructured.has_value());
    CHECK(unstructured->resourceId == "cnt123");
    CHECK(unstructured->cseId == "/id-in");

    auto structured = f.resolver.resolve("~/id-in/cse-in/cnt");
    REQUIRE(structured.has_value());
    CHECK(structured->structuredPath == "cse-in/cnt");
    CHECK(structured->resourceId == "cnt123");

    auto tooShort = f.resolver.parse("~/id-in");
    REQUIRE_FALSE(tooShort.has_value());
    CHECK(tooShort.error().code == Error::Code::NotFound);

    // Four segments that do not start at the CSE name are invalid
    auto invalid = f.resolver.parse("~/id-in/other/cnt");
    REQUIRE_FALSE(invalid.has_value());
    CHECK(invalid.error().code == Error::Code::NotFound);
}

TEST_CASE("absolute addresses") {
    ResolverFixture f;

    auto unstructured = f.resolver.resolve("_/acme.example.com/id-in/cnt123");
    REQUIRE(unstructured.has_value());
    CHECK(unstructured->resourceId == "cnt123");

    auto structured = f.resolver.resolve("_/acme.example.com/id-in/cse-in/cnt");
    REQUIRE(structured.has_value());
    CHECK(structured->resourceId == "cnt123");

    auto parsed = f.resolver.parse("_/acme.example.com/id-in/cnt123");
    REQUIRE(parsed.has_value());
    CHECK(parsed->spId == "acme.example.com");
    CHECK(parsed->mode == AddressingMode::Absolute);

    CHECK_FALSE(f.resolver.parse("_/acme.example.com/id-in").has_value());
}

TEST_CASE("remote CSE addresses are not looked up locally") {
    ResolverFixture f;

    auto byId = f.resolver.resolve("~/id-mn/cnt9");
    REQUIRE(byId.has_value());
    CHECK(byId->remote);
    CHECK(byId->cseId == "/id-mn");
    CHECK(byId->resourceId == "cnt9");

    auto byPath = f.resolver.resolve("~/id-mn/cse-mn/cnt");
    REQUIRE(byPath.has_value());
    CHECK(byPath->remote);
    CHECK(byPath->structuredPath == "cse-mn/cnt");
    CHECK(byPath->resourceId.empty());
}

TEST_CASE("malformed addresses are unresolvable") {
    ResolverFixture f;
    CHECK_FALSE(f.resolver.parse("").has_value());
    CHECK_FALSE(f.resolver.parse("/").has_value());
    CHECK_FALSE(f.resolver.parse("cse-in//cnt").has_value());
}

TEST_CASE("structured paths round trip through the store") {
    ResolverFixture f;
    for (std::string const path : {"cse-in", "cse-in/cnt"}) {
        auto resolved = f.resolver.resolve(path);
        REQUIRE(resolved.has_value());
        auto record = f.store.get(resolved->resourceId);
        REQUIRE(record != nullptr);
        CHECK(record->structuredPath() == path);
    }
}

}
