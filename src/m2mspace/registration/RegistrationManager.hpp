#pragma once
#include "config/CseOptions.hpp"
#include "registration/Registration.hpp"
#include "store/ResourceStore.hpp"

namespace M2M {

/**
 * @brief Default registration bookkeeping for AEs and remote CSEs.
 *
 * - AE: "C"/"S" prefixes or an empty originator get a generated AE-ID; an
 *   AE-ID that is already registered is refused. The AE's aei and ri are
 *   bound to the effective originator.
 * - CSR: the resource id is derived from its csi.
 * - every resource records its creating originator.
 */
class RegistrationManager final : public Registration {
public:
    RegistrationManager(CseOptions options, ResourceStore const& store);

    auto checkCreation(Resource& resource, std::string const& originator, Resource const& parent) -> Expected<std::string> override;
    auto checkDeletion(Resource const& resource, std::string const& originator) -> Expected<void> override;

private:
    auto registerAE(Resource& resource, std::string const& originator) -> Expected<std::string>;
    auto registerCSR(Resource& resource, std::string const& originator) -> Expected<std::string>;

    CseOptions           options_;
    ResourceStore const& store_;
};

} // namespace M2M
