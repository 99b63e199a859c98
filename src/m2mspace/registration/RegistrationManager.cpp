#include "registration/RegistrationManager.hpp"
#include "log/TaggedLogger.hpp"
#include "resource/ResourceFactory.hpp"

namespace M2M {

RegistrationManager::RegistrationManager(CseOptions options, ResourceStore const& store)
    : options_(std::move(options)), store_(store) {}

auto RegistrationManager::checkCreation(Resource& resource, std::string const& originator, Resource const&) -> Expected<std::string> {
    Expected<std::string> effective = originator;
    switch (resource.type()) {
    case ResourceType::AE:
        effective = this->registerAE(resource, originator);
        break;
    case ResourceType::CSR:
        effective = this->registerCSR(resource, originator);
        break;
    default:
        break;
    }
    if (!effective)
        return effective;
    resource.setOriginator(*effective);
    return effective;
}

auto RegistrationManager::registerAE(Resource& resource, std::string const& originator) -> Expected<std::string> {
    std::string assigned = originator;
    if (assigned.empty() || assigned == "C")
        assigned = UniqueAEI("C");
    else if (assigned == "S")
        assigned = UniqueAEI("S");

    if (this->store_.get(assigned)) {
        m2m_log("AE already registered: " + assigned, "Registration", "WARN");
        return std::unexpected(Error{Error::Code::OriginatorHasAlreadyRegistered, "originator already registered: " + assigned});
    }

    resource.setAttribute("aei", assigned);
    resource.setAttribute("ri", assigned);
    m2m_log("Registered AE " + assigned, "Registration");
    return assigned;
}

auto RegistrationManager::registerCSR(Resource& resource, std::string const& originator) -> Expected<std::string> {
    auto const csi = resource.stringAttribute("csi");
    if (!csi || csi->size() < 2 || csi->front() != '/')
        return std::unexpected(Error{Error::Code::BadRequest, "remoteCSE requires csi"});
    if (*csi == this->options_.cseId)
        return std::unexpected(Error{Error::Code::Conflict, "remoteCSE cannot use the local CSE-ID"});
    if (this->store_.resolveCseId(*csi))
        return std::unexpected(Error{Error::Code::OriginatorHasAlreadyRegistered, "CSE already registered: " + *csi});

    resource.setAttribute("ri", csi->substr(1));
    m2m_log("Registered remote CSE " + *csi, "Registration");
    return originator.empty() ? *csi : originator;
}

auto RegistrationManager::checkDeletion(Resource const& resource, std::string const&) -> Expected<void> {
    if (resource.type() == ResourceType::AE || resource.type() == ResourceType::CSR)
        m2m_log("Deregistered " + resource.ri(), "Registration");
    return {};
}

} // namespace M2M
