#pragma once
#include "core/Error.hpp"
#include "resource/Resource.hpp"

#include <string>

namespace M2M {

/**
 * @brief Registration bookkeeping consulted on creation and deletion.
 */
class Registration {
public:
    virtual ~Registration() = default;

    /**
     * @brief Validate a new resource and return the effective originator.
     *
     * May rewrite the resource (for example binding an AE's id to a generated
     * AE-ID) and the originator. Errors are reported to the caller unchanged.
     */
    virtual auto checkCreation(Resource& resource, std::string const& originator, Resource const& parent) -> Expected<std::string> = 0;

    /** @brief Pre-deletion deregistration; a failure aborts the deletion. */
    virtual auto checkDeletion(Resource const& resource, std::string const& originator) -> Expected<void> = 0;
};

} // namespace M2M
