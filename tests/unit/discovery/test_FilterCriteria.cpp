#include "discovery/FilterCriteria.hpp"
#include "resource/ResourceFactory.hpp"

#include <doctest/doctest.h>

using namespace M2M;

namespace {

auto instance() -> Resource {
    Json attributes{{"rn", "reading"},
                    {"lbl", {"loc:kitchen", "kind:temp"}},
                    {"cnf", "text/plain:0"},
                    {"con", "21.5"},
                    {"cs", 4},
                    {"st", 3},
                    {"ct", "20260101T120000"},
                    {"lt", "20260102T120000"},
                    {"et", "20270101T000000"}};
    auto resource = ResourceFromJson(Json{{"m2m:cin", attributes}}, ResourceType::CIN, "cnt1", 60);
    REQUIRE(resource.has_value());
    return std::move(*resource);
}

} // namespace

TEST_SUITE("discovery.filter") {

TEST_CASE("no conditions match everything") {
    FilterCriteria fc;
    CHECK(fc.empty());
    CHECK(fc.matches(instance()));
}

TEST_CASE("time and size bounds") {
    auto const cin = instance();
    FilterCriteria fc;

    fc.createdAfter = "20251231T000000";
    CHECK(fc.matches(cin));
    fc.createdBefore = "20260101T000000";
    CHECK_FALSE(fc.matches(cin));

    FilterCriteria size;
    size.sizeAbove = 4;
    CHECK(size.matches(cin));
    size.sizeBelow = 4;
    CHECK_FALSE(size.matches(cin));

    FilterCriteria state;
    state.stateTagBigger = 2;
    state.expireBefore   = "20280101T000000";
    CHECK(state.matches(cin));
}

TEST_CASE("labels any versus all") {
    auto const cin = instance();
    FilterCriteria any;
    any.labels = {"loc:garage", "kind:temp"};
    CHECK(any.matches(cin));

    FilterCriteria all;
    all.labelsQuery = {"loc:kitchen", "kind:hum"};
    CHECK_FALSE(all.matches(cin));
    all.labelsQuery.pop_back();
    CHECK(all.matches(cin));
}

TEST_CASE("type and content type lists are alternatives") {
    auto const cin = instance();
    FilterCriteria fc;
    fc.resourceTypes = {ResourceType::CNT, ResourceType::CIN};
    CHECK(fc.matches(cin));
    fc.contentTypes = {"application/json"};
    CHECK_FALSE(fc.matches(cin));
    fc.contentTypes.push_back("text/plain");
    CHECK(fc.matches(cin));
}

TEST_CASE("attribute predicates use wildcards") {
    auto const cin = instance();
    FilterCriteria fc;
    fc.attributes = {{"con", "21*"}};
    CHECK(fc.matches(cin));
    fc.attributes = {{"cs", "4"}};
    CHECK(fc.matches(cin));
    fc.attributes = {{"missing", "*"}};
    CHECK_FALSE(fc.matches(cin));
    fc.attributes = {{"lbl", "loc:*"}};
    CHECK(fc.matches(cin));
}

TEST_CASE("filter operation combines set conditions") {
    auto const cin = instance();
    FilterCriteria fc;
    fc.labels        = {"nope"};
    fc.resourceTypes = {ResourceType::CIN};
    CHECK_FALSE(fc.matches(cin));
    fc.filterOperation = FilterOperation::Or;
    CHECK(fc.matches(cin));
    fc.resourceTypes = {ResourceType::AE};
    CHECK_FALSE(fc.matches(cin));
}

TEST_CASE("attribute value comparison") {
    CHECK(attributeMatches(Json(true), "true"));
    CHECK_FALSE(attributeMatches(Json(false), "true"));
    CHECK(attributeMatches(Json(42), "42"));
    CHECK_FALSE(attributeMatches(Json(42), "42x"));
    CHECK(attributeMatches(Json::array({"a", "b"}), "b"));
    CHECK(attributeMatches(Json("sensor-7"), "sensor-?"));
}

}
