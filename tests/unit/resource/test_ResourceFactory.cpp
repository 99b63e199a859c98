#include "resource/ResourceFactory.hpp"

#include <doctest/doctest.h>

using namespace M2M;

TEST_SUITE("resource.factory") {

TEST_CASE("wrapped payload yields a typed resource") {
    auto cnt = ResourceFromJson(Json{{"m2m:cnt", {{"rn", "temp"}, {"lbl", {"a"}}}}}, ResourceType::CNT, "cb1", 60);
    REQUIRE(cnt.has_value());
    CHECK(cnt->type() == ResourceType::CNT);
    CHECK(cnt->tag() == "m2m:cnt");
    CHECK(cnt->rn() == "temp");
    CHECK(cnt->ri().starts_with("cnt"));
    CHECK(cnt->parentId() == "cb1");
    CHECK(cnt->intAttribute("ty") == 3);
    CHECK(cnt->hasAttribute("ct"));
    CHECK(cnt->hasAttribute("et"));
    CHECK(cnt->labels() == std::vector<std::string>{"a"});
}

TEST_CASE("name defaults to the generated id") {
    auto ae = ResourceFromJson(Json{{"m2m:ae", {{"api", "Nsensor"}}}}, ResourceType::AE, "cb1", 60);
    REQUIRE(ae.has_value());
    CHECK(ae->rn() == ae->ri());
}

TEST_CASE("type information must agree") {
    auto mismatch = ResourceFromJson(Json{{"m2m:cnt", {{"rn", "x"}}}}, ResourceType::AE, "cb1", 60);
    REQUIRE_FALSE(mismatch.has_value());
    CHECK(mismatch.error().code == Error::Code::BadRequest);

    auto embedded = ResourceFromJson(Json{{"m2m:cnt", {{"ty", 4}}}}, ResourceType::Unknown, "cb1", 60);
    REQUIRE_FALSE(embedded.has_value());

    auto unknown = ResourceFromJson(Json{{"m2m:nope", {{"rn", "x"}}}}, ResourceType::Unknown, "cb1", 60);
    REQUIRE_FALSE(unknown.has_value());

    auto undetermined = ResourceFromJson(Json{{"rn", "x"}, {"lbl", Json::array()}}, ResourceType::Unknown, "cb1", 60);
    REQUIRE_FALSE(undetermined.has_value());

    auto unwrapped = ResourceFromJson(Json{{"rn", "x"}, {"ty", 3}}, ResourceType::Unknown, "cb1", 60);
    REQUIRE(unwrapped.has_value());
    CHECK(unwrapped->type() == ResourceType::CNT);
}

TEST_CASE("virtual types and invalid names are rejected") {
    auto la = ResourceFromJson(Json{{"m2m:la", Json::object()}}, ResourceType::CNT_LA, "cnt1", 60);
    REQUIRE_FALSE(la.has_value());
    CHECK(la.error().code == Error::Code::BadRequest);

    for (auto const* name : {"a/b", "~", "_"}) {
        auto bad = ResourceFromJson(Json{{"m2m:cnt", {{"rn", name}}}}, ResourceType::CNT, "cb1", 60);
        CAPTURE(name);
        CHECK_FALSE(bad.has_value());
    }
}

TEST_CASE("management objects take their tag from mgd") {
    auto battery = ResourceFromJson(Json{{"m2m:bat", {{"mgd", 1006}, {"btl", 80}}}}, ResourceType::MgmtObj, "nod1", 60);
    REQUIRE(battery.has_value());
    CHECK(battery->tag() == "m2m:bat");

    auto missing = ResourceFromJson(Json{{"m2m:bat", {{"btl", 80}}}}, ResourceType::MgmtObj, "nod1", 60);
    CHECK_FALSE(missing.has_value());

    auto wrongTag = ResourceFromJson(Json{{"m2m:fwr", {{"mgd", 1006}}}}, ResourceType::MgmtObj, "nod1", 60);
    CHECK_FALSE(wrongTag.has_value());
}

TEST_CASE("flexContainers need a custom tag") {
    auto fcnt = ResourceFromJson(Json{{"cod:tempe", {{"rn", "t"}, {"curT0", 21}}}}, ResourceType::FCNT, "cb1", 60);
    REQUIRE(fcnt.has_value());
    CHECK(fcnt->tag() == "cod:tempe");

    auto asContainer = ResourceFromJson(Json{{"cod:tempe", {{"rn", "t"}}}}, ResourceType::CNT, "cb1", 60);
    CHECK_FALSE(asContainer.has_value());
}

TEST_CASE("internal attributes are stripped and toJson hides bookkeeping") {
    auto cnt = ResourceFromJson(Json{{"m2m:cnt", {{"rn", "c"}, {"__srn__", "evil"}}}}, ResourceType::CNT, "cb1", 60);
    REQUIRE(cnt.has_value());
    CHECK(cnt->structuredPath().empty());

    cnt->setStructuredPath("cse-in/c");
    cnt->setOriginator("Cowner");
    auto const json = cnt->toJson();
    REQUIRE(json.contains("m2m:cnt"));
    CHECK_FALSE(json["m2m:cnt"].contains("__srn__"));
    CHECK_FALSE(json["m2m:cnt"].contains("__originator__"));
    CHECK(cnt->originator() == "Cowner");
}

TEST_CASE("virtual children are named after their type") {
    auto cnt = ResourceFromJson(Json{{"m2m:cnt", {{"rn", "c"}}}}, ResourceType::CNT, "cb1", 60);
    REQUIRE(cnt.has_value());
    cnt->setStructuredPath("cse-in/c");

    auto la = MakeVirtualResource(ResourceType::CNT_LA, *cnt);
    REQUIRE(la.has_value());
    CHECK(la->rn() == "la");
    CHECK(la->structuredPath() == "cse-in/c/la");
    CHECK(la->parentId() == cnt->ri());
    CHECK(la->isVirtual());

    CHECK_FALSE(MakeVirtualResource(ResourceType::CNT, *cnt).has_value());
}

TEST_CASE("attribute diff reports changed and new keys") {
    Json before{{"lbl", {"a"}}, {"mni", 5}, {"__srn__", "x"}};
    Json after{{"lbl", {"a"}}, {"mni", 6}, {"mbs", 10}, {"__srn__", "y"}};
    Json expected{{"mni", 6}, {"mbs", 10}};
    CHECK(attributeDiff(before, after) == expected);
}

TEST_CASE("type lookups") {
    CHECK(resourceTypeFromInt(3) == ResourceType::CNT);
    CHECK_FALSE(resourceTypeFromInt(0).has_value());
    CHECK(resourceTypeFromTag("m2m:dvi") == ResourceType::MgmtObj);
    CHECK(isCustomTag("cod:tempe"));
    CHECK_FALSE(isCustomTag("m2m:cnt"));
    CHECK_FALSE(isCustomTag("plain"));
    CHECK(isLatestOldestType(ResourceType::FCNT_OL));
    CHECK_FALSE(isLatestOldestType(ResourceType::GRP_FOPT));
    CHECK(resourceTypeTraits(ResourceType::CIN).readOnly);
}

}
