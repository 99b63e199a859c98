#pragma once
#include "config/CseOptions.hpp"
#include "core/Error.hpp"
#include "core/Types.hpp"
#include "request/Request.hpp"
#include "resource/Resource.hpp"
#include "store/ResourceStore.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace M2M {

/**
 * @brief Services the dispatcher offers to type hooks.
 *
 * Internal operations skip access control and request-level locking; they run
 * under the locks of the request that triggered the hook.
 */
class ResourceContext {
public:
    virtual ~ResourceContext() = default;

    [[nodiscard]] virtual auto store() -> ResourceStore&             = 0;
    [[nodiscard]] virtual auto options() const -> CseOptions const& = 0;

    virtual auto createResource(Resource resource, Resource const& parent, std::string const& originator) -> Expected<ResourcePtr> = 0;
    virtual auto deleteResource(Resource const& resource, std::string const& originator, bool withDeregistration) -> Expected<void> = 0;

    /** @brief Full request path including security checks; used by fan-out. */
    virtual auto handleRequest(Request const& request) -> Response = 0;

    [[nodiscard]] virtual auto hasAccess(std::string const& originator, Resource const& resource, Permission permission) const -> bool = 0;
};

/**
 * @brief Type-specific behaviour of a resource variant.
 *
 * Stateless; one instance per type is shared by all requests.
 */
class ResourceBehavior {
public:
    explicit ResourceBehavior(std::initializer_list<ResourceType> allowedChildren = {});
    virtual ~ResourceBehavior() = default;

    [[nodiscard]] virtual auto canHaveChild(Resource const& parent, ResourceType childType) const -> bool;

    /** @brief Runs after the first persist; may mutate attributes and create auxiliary children. */
    virtual auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void>;

    /** @brief Validate and merge an update payload into the resource. */
    virtual auto update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const& originator) const
            -> Expected<void>;

    /** @brief Cleanup before removal; the generic version deletes all children. */
    virtual auto deactivate(ResourceContext& context, Resource const& resource, std::string const& originator) const -> void;

    virtual auto childAdded(ResourceContext& context, Resource const& parent, Resource const& child, std::string const& originator) const
            -> void;
    virtual auto childRemoved(ResourceContext& context, Resource const& parent, Resource const& child, std::string const& originator) const
            -> void;

    // Virtual resources override these; stored resources never see them.
    virtual auto handleRetrieve(ResourceContext& context, ResourcePtr const& resource) const -> Expected<ResourcePtr>;
    virtual auto handleCreate(ResourceContext& context, Resource const& resource, Request const& request) const -> Response;
    virtual auto handleUpdate(ResourceContext& context, Resource const& resource, Request const& request) const -> Response;
    virtual auto handleDelete(ResourceContext& context, Resource const& resource, Request const& request) const -> Response;

protected:
    std::vector<ResourceType> allowedChildren_;
};

/**
 * @brief Merge an update payload into the attributes: null removes, immutable keys are refused.
 */
auto mergeAttributes(Resource& resource, Json const& attributes) -> Expected<void>;

class ResourceTypeRegistry {
public:
    ResourceTypeRegistry();

    [[nodiscard]] auto behavior(ResourceType type) const -> ResourceBehavior const&;

    auto registerBehavior(ResourceType type, std::shared_ptr<ResourceBehavior const> behavior) -> void;

private:
    std::unordered_map<ResourceType, std::shared_ptr<ResourceBehavior const>> behaviors_;
    std::shared_ptr<ResourceBehavior const>                                   fallback_;
};

} // namespace M2M
