#include "security/AcpAccessFilter.hpp"
#include "log/TaggedLogger.hpp"
#include "path/utils.hpp"

#include <algorithm>

namespace M2M {

namespace {

// Guards against malformed trees; the real tree depth is far below this.
constexpr int MaxInheritanceDepth = 64;

} // namespace

AcpAccessFilter::AcpAccessFilter(CseOptions options, ResourceStore const& store)
    : options_(std::move(options)), store_(store) {}

auto AcpAccessFilter::originatorMatches(std::string const& pattern, std::string const& originator) -> bool {
    if (pattern == "all" || pattern == originator)
        return true;
    return is_glob(pattern) && match_names(pattern, originator);
}

auto AcpAccessFilter::privilegesGrant(Json const& privileges, std::string const& originator, Permission permission) -> bool {
    if (!privileges.is_object())
        return false;
    auto rules = privileges.find("acr");
    if (rules == privileges.end() || !rules->is_array())
        return false;
    for (auto const& rule : *rules) {
        auto originators = rule.find("acor");
        auto operations  = rule.find("acop");
        if (originators == rule.end() || operations == rule.end() || !originators->is_array() || !operations->is_number_integer())
            continue;
        if ((operations->get<int>() & permissionBits(permission)) == 0)
            continue;
        bool const matched = std::any_of(originators->begin(), originators->end(), [&](Json const& entry) {
            return entry.is_string() && originatorMatches(entry.get<std::string>(), originator);
        });
        if (matched)
            return true;
    }
    return false;
}

auto AcpAccessFilter::registrationAllowed(std::string const& originator, ResourceType type) const -> bool {
    auto const& patterns = type == ResourceType::AE ? this->options_.allowedAEOriginators : this->options_.allowedCSROriginators;
    // An empty originator asks the CSE to assign one
    if (type == ResourceType::AE && originator.empty())
        return true;
    return std::any_of(patterns.begin(), patterns.end(), [&](std::string const& pattern) { return match_names(pattern, originator); });
}

auto AcpAccessFilter::hasAccess(std::string const&   originator,
                                Resource const&      resource,
                                Permission           permission,
                                AccessContext const& context) const -> bool {
    if (!this->options_.enableAcpChecks)
        return true;
    if (originator == this->options_.adminOriginator)
        return true;

    if (context.isCreateRequest && context.childType
        && (*context.childType == ResourceType::AE || *context.childType == ResourceType::CSR)) {
        bool const allowed = this->registrationAllowed(originator, *context.childType);
        m2m_log("Registration of " + originator + (allowed ? " allowed" : " refused"), "Security");
        return allowed;
    }

    bool const granted = this->evaluate(originator, resource, permission, context.checkSelf, 0);
    if (!granted)
        m2m_log("Originator " + originator + " lacks permission " + std::to_string(permissionBits(permission)) + " on " + resource.ri(),
                "Security");
    return granted;
}

auto AcpAccessFilter::evaluate(std::string const& originator, Resource const& resource, Permission permission, bool checkSelf, int depth) const
        -> bool {
    if (depth > MaxInheritanceDepth)
        return false;

    if (resource.type() == ResourceType::ACP) {
        auto const* selfPrivileges = resource.attribute("pvs");
        return selfPrivileges != nullptr && privilegesGrant(*selfPrivileges, originator, permission);
    }

    auto const policies = resource.acpi();
    if (resource.inheritsAccessControl() || policies.empty()) {
        if (!originator.empty() && resource.originator() == originator)
            return true;
        auto const parentId = resource.parentId();
        if (!parentId)
            return false;
        auto parent = this->store_.get(*parentId);
        return parent && this->evaluate(originator, *parent, permission, false, depth + 1);
    }

    for (auto const& policyId : policies) {
        auto policy = this->store_.get(policyId);
        if (!policy) {
            std::string_view path{policyId};
            if (path.starts_with('/'))
                path.remove_prefix(1);
            policy = this->store_.getByPath(std::string{path});
        }
        if (!policy || policy->type() != ResourceType::ACP)
            continue;
        auto const* privileges = policy->attribute(checkSelf ? "pvs" : "pv");
        if (privileges != nullptr && privilegesGrant(*privileges, originator, permission))
            return true;
    }
    return false;
}

} // namespace M2M
