#include "runtime/CseRuntime.hpp"
#include "log/TaggedLogger.hpp"
#include "resource/ResourceFactory.hpp"

namespace M2M {

CseRuntime::CseRuntime(CseOptions options, RequestSender sender)
    : options_(std::move(options)),
      access_(this->options_, this->store_),
      registration_(this->options_, this->store_),
      remote_(this->options_, this->store_, std::move(sender)),
      dispatcher_(this->options_, this->store_, this->access_, this->registration_, this->remote_, this->types_) {}

auto CseRuntime::start() -> Expected<void> {
    std::lock_guard<std::mutex> guard(this->startMutex_);
    if (this->started_)
        return std::unexpected(Error{Error::Code::Conflict, "CSE already started"});
    if (auto invalid = ValidateCseOptions(this->options_))
        return std::unexpected(Error{Error::Code::BadRequest, *invalid});

    auto cseBase = this->createCseBase();
    if (!cseBase)
        return std::unexpected(cseBase.error());
    auto policy = this->createAdminPolicy(**cseBase);
    if (!policy)
        return std::unexpected(policy.error());

    Resource root = **cseBase;
    root.setAttribute("acpi", Json::array({(*policy)->ri()}));
    if (auto stored = this->store_.put(std::move(root)); !stored)
        return std::unexpected(stored.error());

    this->started_ = true;
    m2m_log("CSE " + this->options_.cseId + " started as " + this->options_.cseResourceName, "Runtime", "INFO");
    return {};
}

auto CseRuntime::started() const -> bool {
    std::lock_guard<std::mutex> guard(this->startMutex_);
    return this->started_;
}

auto CseRuntime::handle(Request const& request) -> Response {
    return this->dispatcher_.handleRequest(request);
}

auto CseRuntime::setEventSink(std::weak_ptr<EventSink> sink) -> void {
    this->dispatcher_.setEventSink(std::move(sink));
}

auto CseRuntime::createCseBase() -> Expected<ResourcePtr> {
    if (this->store_.exists(this->options_.cseResourceId, this->options_.cseResourceName))
        return std::unexpected(Error{Error::Code::Conflict, "CSEBase already present"});

    Json payload = Json::object();
    payload["m2m:cb"] = Json{{"ri", this->options_.cseResourceId},
                             {"rn", this->options_.cseResourceName},
                             {"csi", this->options_.cseId},
                             {"cst", 1},
                             {"srt", Json::array({1, 2, 3, 4, 5, 9, 13, 14, 16, 23, 28})}};
    auto cseBase = ResourceFromJson(payload, ResourceType::CSEBase, std::string{}, this->options_.defaultExpirationSeconds);
    if (!cseBase)
        return std::unexpected(cseBase.error());
    cseBase->removeAttribute("et");
    cseBase->setStructuredPath(this->options_.cseResourceName);
    cseBase->setOriginator(this->options_.adminOriginator);
    return this->store_.create(std::move(*cseBase));
}

auto CseRuntime::createAdminPolicy(Resource const& cseBase) -> Expected<ResourcePtr> {
    auto const& admin = this->options_.adminOriginator;
    Json adminRule{{"acor", Json::array({admin})}, {"acop", permissionBits(Permission::All)}};
    Json publicRule{{"acor", Json::array({"all"})},
                    {"acop", permissionBits(Permission::Retrieve) | permissionBits(Permission::Discovery)}};

    Json payload = Json::object();
    payload["m2m:acp"] = Json{{"ri", std::string{AdminPolicyId}},
                              {"rn", std::string{AdminPolicyId}},
                              {"pv", Json{{"acr", Json::array({adminRule, publicRule})}}},
                              {"pvs", Json{{"acr", Json::array({adminRule})}}}};
    auto policy = ResourceFromJson(payload, ResourceType::ACP, cseBase.ri(), this->options_.defaultExpirationSeconds);
    if (!policy)
        return std::unexpected(policy.error());
    return this->dispatcher_.createResource(std::move(*policy), cseBase, admin);
}

} // namespace M2M
