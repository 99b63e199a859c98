#include "runtime/CseRuntime.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace M2M;

namespace {

auto makeRequest(Operation operation, std::string to, std::string originator) -> Request {
    Request request;
    request.operation             = operation;
    request.to                    = std::move(to);
    request.originator            = std::move(originator);
    request.arguments.resultContent = DefaultResultContent(operation, FilterUsage::ConditionalRetrieval);
    return request;
}

auto makeCreate(std::string to, std::string originator, ResourceType type, Json content) -> Request {
    auto request         = makeRequest(Operation::Create, std::move(to), std::move(originator));
    request.contentType  = "application/json";
    request.resourceType = type;
    request.content      = std::move(content);
    return request;
}

auto startedRuntime(CseOptions options = {}, RequestSender sender = {}) -> std::unique_ptr<CseRuntime> {
    auto runtime = std::make_unique<CseRuntime>(std::move(options), std::move(sender));
    REQUIRE(runtime->start().has_value());
    return runtime;
}

} // namespace

TEST_SUITE("runtime.cse") {

TEST_CASE("start creates the root and the administrative policy") {
    auto runtime = startedRuntime();
    CHECK(runtime->started());

    auto root = runtime->store().getByPath("cse-in");
    REQUIRE(root != nullptr);
    CHECK(root->type() == ResourceType::CSEBase);
    CHECK(root->ri() == "id-in");
    CHECK(root->acpi() == std::vector<std::string>{std::string{CseRuntime::AdminPolicyId}});
    CHECK_FALSE(root->hasAttribute("et"));
    CHECK(runtime->store().resolveCseId("/id-in") == "id-in");

    auto policy = runtime->store().getByPath("cse-in/acpAdmin");
    REQUIRE(policy != nullptr);
    CHECK(policy->type() == ResourceType::ACP);
}

TEST_CASE("a second start conflicts") {
    auto runtime = startedRuntime();
    auto again   = runtime->start();
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == Error::Code::Conflict);
}

TEST_CASE("invalid options refuse to start") {
    CseOptions options;
    options.cseId = "id-in";
    CseRuntime runtime(options);
    auto       started = runtime.start();
    REQUIRE_FALSE(started.has_value());
    CHECK(started.error().code == Error::Code::BadRequest);
    CHECK_FALSE(runtime.started());
}

TEST_CASE("the administrative policy separates admin and public access") {
    auto        runtime = startedRuntime();
    auto const& admin   = runtime->options().adminOriginator;

    CHECK(runtime->handle(makeRequest(Operation::Retrieve, "cse-in", "Canyone")).ok());

    auto refused = runtime->handle(makeCreate("cse-in", "Canyone", ResourceType::CNT, Json{{"m2m:cnt", {{"rn", "c"}}}}));
    CHECK(refused.status == ResponseStatusCode::OriginatorHasNoPrivilege);

    auto created = runtime->handle(makeCreate("cse-in", admin, ResourceType::CNT, Json{{"m2m:cnt", {{"rn", "c"}}}}));
    CHECK(created.status == ResponseStatusCode::Created);
}

TEST_CASE("AE registration binds the resource id to the originator") {
    auto runtime = startedRuntime();
    Json ae{{"m2m:ae", {{"rn", "sensor"}, {"api", "Nsensor"}, {"rr", true}}}};

    auto registered = runtime->handle(makeCreate("cse-in", "Csensor", ResourceType::AE, ae));
    REQUIRE(registered.status == ResponseStatusCode::Created);
    CHECK(registered.content->at("m2m:ae").at("ri") == "Csensor");
    CHECK(registered.content->at("m2m:ae").at("aei") == "Csensor");

    Json other{{"m2m:ae", {{"rn", "sensor2"}, {"api", "Nsensor"}}}};
    auto duplicate = runtime->handle(makeCreate("cse-in", "Csensor", ResourceType::AE, other));
    CHECK(duplicate.status == ResponseStatusCode::OriginatorHasAlreadyRegistered);

    auto refused = runtime->handle(makeCreate("cse-in", "Xsensor", ResourceType::AE, other));
    CHECK(refused.status == ResponseStatusCode::SecurityAssociationRequired);

    auto generated = runtime->handle(makeCreate("cse-in", "C", ResourceType::AE, other));
    REQUIRE(generated.status == ResponseStatusCode::Created);
    auto const aei = generated.content->at("m2m:ae").at("aei").get<std::string>();
    CHECK(aei.starts_with("C"));
    CHECK(aei.size() > 1);
}

TEST_CASE("an AE owns the resources it creates") {
    auto runtime = startedRuntime();
    REQUIRE(runtime->handle(makeCreate("cse-in", "Cowner", ResourceType::AE, Json{{"m2m:ae", {{"rn", "app"}, {"api", "Napp"}}}})).ok());

    auto cnt = runtime->handle(makeCreate("cse-in/app", "Cowner", ResourceType::CNT, Json{{"m2m:cnt", {{"rn", "data"}}}}));
    REQUIRE(cnt.status == ResponseStatusCode::Created);

    auto cin = runtime->handle(makeCreate("cse-in/app/data", "Cowner", ResourceType::CIN,
                                          Json{{"m2m:cin", {{"rn", "v1"}, {"cnf", "text/plain:0"}, {"con", "42"}}}}));
    REQUIRE(cin.status == ResponseStatusCode::Created);

    CHECK(runtime->handle(makeRequest(Operation::Retrieve, "cse-in/app/data/la", "Cowner")).ok());
    // Everybody may read through the root policy, nobody else may delete
    CHECK(runtime->handle(makeRequest(Operation::Retrieve, "cse-in/app/data", "Cstranger")).ok());
    CHECK(runtime->handle(makeRequest(Operation::Delete, "cse-in/app/data", "Cstranger")).status
          == ResponseStatusCode::OriginatorHasNoPrivilege);
    CHECK(runtime->handle(makeRequest(Operation::Delete, "cse-in/app", "Cowner")).status == ResponseStatusCode::Deleted);
    CHECK(runtime->store().getByPath("cse-in/app/data/v1") == nullptr);
}

TEST_CASE("transit requests reach registered remote CSEs") {
    CseOptions options;
    options.enableTransitRequests = true;
    options.allowedCSROriginators = {"/id-mn"};

    std::vector<std::string> delivered;
    auto runtime = startedRuntime(options, [&](Resource const& remote, Request const& request) {
        delivered.push_back(remote.ri() + " " + request.to);
        return Response{ResponseStatusCode::OK, Json{{"m2m:cnt", {{"ri", "remote-cnt"}}}}, std::nullopt};
    });

    auto unregistered = runtime->handle(makeRequest(Operation::Retrieve, "~/id-mn/cnt1", "Cx"));
    CHECK(unregistered.status == ResponseStatusCode::NotFound);

    Json csr{{"m2m:csr", {{"rn", "mn"}, {"csi", "/id-mn"}, {"cb", "/id-mn/cse-mn"}}}};
    auto registered = runtime->handle(makeCreate("cse-in", "/id-mn", ResourceType::CSR, csr));
    REQUIRE(registered.status == ResponseStatusCode::Created);
    CHECK(registered.content->at("m2m:csr").at("ri") == "id-mn");

    auto forwarded = runtime->handle(makeRequest(Operation::Retrieve, "~/id-mn/cnt1", "Cx"));
    CHECK(forwarded.status == ResponseStatusCode::OK);
    CHECK(delivered == std::vector<std::string>{"id-mn ~/id-mn/cnt1"});
}

TEST_CASE("remote CSE registration is gated by originator patterns") {
    auto runtime = startedRuntime();
    Json csr{{"m2m:csr", {{"rn", "mn"}, {"csi", "/id-mn"}}}};
    auto refused = runtime->handle(makeCreate("cse-in", "/id-mn", ResourceType::CSR, csr));
    CHECK(refused.status == ResponseStatusCode::OriginatorHasNoPrivilege);
}

TEST_CASE("transit without a transport is unreachable") {
    CseOptions options;
    options.enableTransitRequests = true;
    options.allowedCSROriginators = {"/id-*"};
    auto runtime = startedRuntime(options);
    REQUIRE(runtime->handle(makeCreate("cse-in", "/id-mn", ResourceType::CSR, Json{{"m2m:csr", {{"rn", "mn"}, {"csi", "/id-mn"}}}})).ok());
    CHECK(runtime->handle(makeRequest(Operation::Retrieve, "~/id-mn/x", "Cx")).status == ResponseStatusCode::TargetNotReachable);
}

}
