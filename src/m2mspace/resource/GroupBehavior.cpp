#include "log/TaggedLogger.hpp"
#include "resource/Behaviors.hpp"
#include "resource/ResourceFactory.hpp"

#include <algorithm>

namespace M2M {

namespace {

constexpr int MixedMemberType = 24;

auto find_member(ResourceStore const& store, std::string const& member) -> ResourcePtr {
    if (auto byId = store.get(member))
        return byId;
    std::string_view path{member};
    if (path.starts_with('/'))
        path.remove_prefix(1);
    return store.getByPath(std::string{path});
}

} // namespace

GroupBehavior::GroupBehavior()
    : ResourceBehavior({ResourceType::SUB, ResourceType::GRP_FOPT}) {}

auto GroupBehavior::validateMembers(ResourceContext& context, Resource& resource) const -> Expected<void> {
    auto const* mid = resource.attribute("mid");
    if (mid == nullptr || !mid->is_array())
        return std::unexpected(Error{Error::Code::BadRequest, "group requires mid"});

    auto const memberType = resource.intAttribute("mt").value_or(MixedMemberType);

    std::vector<std::string> members;
    for (auto const& entry : *mid) {
        if (!entry.is_string())
            return std::unexpected(Error{Error::Code::BadRequest, "mid entries must be strings"});
        auto const id = entry.get<std::string>();
        if (std::find(members.begin(), members.end(), id) != members.end())
            continue;
        auto member = find_member(context.store(), id);
        if (!member) {
            m2m_log("Dropping unknown group member " + id, "Resource", "INFO");
            continue;
        }
        if (member->isVirtual()) {
            m2m_log("Dropping virtual group member " + id, "Resource", "INFO");
            continue;
        }
        if (memberType != MixedMemberType && memberType != 0 && toInt(member->type()) != memberType) {
            m2m_log("Dropping group member " + id + " of mismatching type", "Resource", "INFO");
            continue;
        }
        members.push_back(id);
    }

    if (auto const maxMembers = resource.intAttribute("mnm"); maxMembers && static_cast<std::int64_t>(members.size()) > *maxMembers)
        return std::unexpected(Error{Error::Code::MaxNumberOfMemberExceeded, "group exceeds mnm"});

    resource.setAttribute("cnm", static_cast<std::int64_t>(members.size()));
    resource.setAttribute("mid", std::move(members));
    return {};
}

auto GroupBehavior::activate(ResourceContext& context, Resource& resource, Resource const&, std::string const& originator) const
        -> Expected<void> {
    if (auto valid = this->validateMembers(context, resource); !valid)
        return valid;
    auto fanOutPoint = MakeVirtualResource(ResourceType::GRP_FOPT, resource);
    if (!fanOutPoint)
        return std::unexpected(fanOutPoint.error());
    if (auto created = context.createResource(std::move(*fanOutPoint), resource, originator); !created)
        return std::unexpected(created.error());
    return {};
}

auto GroupBehavior::update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const&) const
        -> Expected<void> {
    if (auto merged = mergeAttributes(resource, attributes); !merged)
        return merged;
    if (attributes.contains("mid") || attributes.contains("mnm") || attributes.contains("mt"))
        return this->validateMembers(context, resource);
    return {};
}

auto FanOutPointBehavior::fanOut(ResourceContext& context, Resource const& fanOutPoint, Request const& request, std::string const& remainder) const
        -> Response {
    auto const groupId = fanOutPoint.parentId();
    auto const group   = groupId ? context.store().get(*groupId) : nullptr;
    if (!group)
        return Response{ResponseStatusCode::NotFound, std::nullopt, "fan-out point without group"};

    if (!context.hasAccess(request.originator, *group, permissionFor(request.operation)))
        return Response{ResponseStatusCode::OriginatorHasNoPrivilege, std::nullopt, "no privilege on group " + group->ri()};

    auto const& trail = request.fanOutTrail;
    if (std::find(trail.begin(), trail.end(), fanOutPoint.ri()) != trail.end()) {
        m2m_log("Fan-out loop through " + fanOutPoint.ri() + " refused", "Resource", "WARN");
        return Response{ResponseStatusCode::OperationNotAllowed, std::nullopt, "fan-out loop through " + fanOutPoint.ri()};
    }

    Json responses = Json::array();
    if (auto const* mid = group->attribute("mid"); mid != nullptr && mid->is_array()) {
        for (auto const& entry : *mid) {
            if (!entry.is_string())
                continue;
            auto const memberId = entry.get<std::string>();
            auto const member   = find_member(context.store(), memberId);
            auto       target   = member ? member->structuredPath() : memberId;
            target.append(remainder);

            Request memberRequest = request;
            memberRequest.to      = target;
            memberRequest.fanOutTrail.push_back(fanOutPoint.ri());
            m2m_log("Fan-out " + std::string{operationToString(request.operation)} + " to " + target, "Resource");
            auto const response = context.handleRequest(memberRequest);

            Json item{{"rsc", static_cast<int>(response.status)}, {"to", target}};
            if (response.content)
                item["pc"] = *response.content;
            responses.push_back(std::move(item));
        }
    }

    Json aggregated = Json::object();
    aggregated["m2m:agr"]["m2m:rsp"] = std::move(responses);
    return Response::withContent(ResponseStatusCode::OK, std::move(aggregated));
}

} // namespace M2M
