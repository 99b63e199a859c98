#pragma once
#include "config/CseOptions.hpp"
#include "security/AccessFilter.hpp"
#include "store/ResourceStore.hpp"

#include <string>
#include <vector>

namespace M2M {

/**
 * @brief Access decisions driven by accessControlPolicy resources.
 *
 * Evaluation order:
 * 1. checks disabled or admin originator: granted
 * 2. creation of an AE or remoteCSE: originator must match the allowed patterns
 * 3. an ACP is judged by its own self-privileges (pvs)
 * 4. resources inheriting access control or without acpi: granted to their
 *    creator, otherwise decided by the parent
 * 5. otherwise any referenced ACP rule (pv, or pvs for self checks) whose
 *    originator list matches and whose acop contains the permission
 */
class AcpAccessFilter final : public AccessFilter {
public:
    AcpAccessFilter(CseOptions options, ResourceStore const& store);

    [[nodiscard]] auto hasAccess(std::string const&   originator,
                                 Resource const&      resource,
                                 Permission           permission,
                                 AccessContext const& context = {}) const -> bool override;

    [[nodiscard]] static auto originatorMatches(std::string const& pattern, std::string const& originator) -> bool;

    /** @brief True when any rule of a pv/pvs object grants the permission to the originator. */
    [[nodiscard]] static auto privilegesGrant(Json const& privileges, std::string const& originator, Permission permission) -> bool;

private:
    [[nodiscard]] auto registrationAllowed(std::string const& originator, ResourceType type) const -> bool;
    [[nodiscard]] auto evaluate(std::string const& originator, Resource const& resource, Permission permission, bool checkSelf, int depth) const
            -> bool;

    CseOptions           options_;
    ResourceStore const& store_;
};

} // namespace M2M
