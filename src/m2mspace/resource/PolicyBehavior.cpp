#include "core/Types.hpp"
#include "resource/Behaviors.hpp"

namespace M2M {

namespace {

auto validate_rules(Json const& privileges, std::string const& name) -> Expected<void> {
    auto invalid = [&](std::string const& what) {
        return std::unexpected(Error{Error::Code::BadRequest, name + ": " + what});
    };
    if (!privileges.is_object())
        return invalid("must be an object");
    auto rules = privileges.find("acr");
    if (rules == privileges.end())
        return {};
    if (!rules->is_array())
        return invalid("acr must be a list");
    for (auto const& rule : *rules) {
        if (!rule.is_object())
            return invalid("access control rule must be an object");
        auto originators = rule.find("acor");
        if (originators == rule.end() || !originators->is_array())
            return invalid("acor must be a list");
        for (auto const& originator : *originators) {
            if (!originator.is_string())
                return invalid("acor entries must be strings");
        }
        auto operations = rule.find("acop");
        if (operations == rule.end() || !operations->is_number_integer())
            return invalid("acop must be an integer");
        auto const bits = operations->get<int>();
        if (bits < 0 || bits > permissionBits(Permission::All))
            return invalid("acop out of range");
    }
    return {};
}

auto validate_policy(Resource const& resource) -> Expected<void> {
    auto const* selfPrivileges = resource.attribute("pvs");
    if (selfPrivileges == nullptr)
        return std::unexpected(Error{Error::Code::BadRequest, "accessControlPolicy requires pvs"});
    if (auto valid = validate_rules(*selfPrivileges, "pvs"); !valid)
        return valid;
    if (auto const* privileges = resource.attribute("pv"))
        return validate_rules(*privileges, "pv");
    return {};
}

} // namespace

AccessControlPolicyBehavior::AccessControlPolicyBehavior()
    : ResourceBehavior({ResourceType::SUB}) {}

auto AccessControlPolicyBehavior::activate(ResourceContext&, Resource& resource, Resource const&, std::string const&) const
        -> Expected<void> {
    return validate_policy(resource);
}

auto AccessControlPolicyBehavior::update(ResourceContext&, Resource& resource, Json const& attributes, std::string const&) const
        -> Expected<void> {
    Resource candidate = resource;
    if (auto merged = mergeAttributes(candidate, attributes); !merged)
        return merged;
    if (auto valid = validate_policy(candidate); !valid)
        return valid;
    resource = std::move(candidate);
    return {};
}

auto SubscriptionBehavior::activate(ResourceContext&, Resource& resource, Resource const&, std::string const&) const -> Expected<void> {
    auto const* targets = resource.attribute("nu");
    if (targets == nullptr || !targets->is_array() || targets->empty())
        return std::unexpected(Error{Error::Code::BadRequest, "subscription requires nu"});
    resource.setAttribute("nct", 1, false);
    return {};
}

RemoteCseBehavior::RemoteCseBehavior()
    : ResourceBehavior({ResourceType::CNT, ResourceType::FCNT, ResourceType::GRP, ResourceType::ACP, ResourceType::SUB}) {}

auto RemoteCseBehavior::activate(ResourceContext&, Resource& resource, Resource const&, std::string const&) const -> Expected<void> {
    auto const csi = resource.stringAttribute("csi");
    if (!csi || csi->size() < 2 || csi->front() != '/')
        return std::unexpected(Error{Error::Code::BadRequest, "remoteCSE requires csi"});
    return {};
}

} // namespace M2M
