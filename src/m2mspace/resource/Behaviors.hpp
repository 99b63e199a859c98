#pragma once
#include "resource/ResourceBehavior.hpp"

#include <string>

namespace M2M {

/**
 * Containers that hold ordered instances (contentInstances or
 * flexContainerInstances) and keep the counters cni (number of instances),
 * cbs (bytes held) and st (state tag) in step with their children. The
 * limits mni and mbs are enforced by evicting the oldest instances.
 */
class InstanceContainerBehavior : public ResourceBehavior {
public:
    InstanceContainerBehavior(ResourceType instanceType, std::initializer_list<ResourceType> allowedChildren);

    auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void> override;
    auto update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const& originator) const
            -> Expected<void> override;
    auto childAdded(ResourceContext& context, Resource const& parent, Resource const& child, std::string const& originator) const
            -> void override;
    auto childRemoved(ResourceContext& context, Resource const& parent, Resource const& child, std::string const& originator) const
            -> void override;

protected:
    auto createLatestOldest(ResourceContext& context, Resource const& resource, std::string const& originator) const -> Expected<void>;
    auto enforceLimits(ResourceContext& context, Resource const& container, std::string const& originator) const -> void;
    auto refreshCounters(ResourceContext& context, Resource& container) const -> void;
    auto persistCounters(ResourceContext& context, std::string const& containerId) const -> void;

    ResourceType instanceType_;
    ResourceType latestType_;
    ResourceType oldestType_;
};

class ContainerBehavior final : public InstanceContainerBehavior {
public:
    ContainerBehavior();
};

/**
 * FlexContainers snapshot their custom attributes into a new instance on
 * every update once mni is set.
 */
class FlexContainerBehavior final : public InstanceContainerBehavior {
public:
    FlexContainerBehavior();

    auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void> override;
    auto update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const& originator) const
            -> Expected<void> override;

private:
    auto addInstance(ResourceContext& context, Resource const& resource, std::string const& originator) const -> Expected<void>;
};

class ContentInstanceBehavior final : public ResourceBehavior {
public:
    auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void> override;
};

/**
 * The "la" and "ol" virtual children of instance containers.
 */
class LatestOldestBehavior final : public ResourceBehavior {
public:
    LatestOldestBehavior(bool latest, ResourceType instanceType);

    auto handleRetrieve(ResourceContext& context, ResourcePtr const& resource) const -> Expected<ResourcePtr> override;
    auto handleDelete(ResourceContext& context, Resource const& resource, Request const& request) const -> Response override;

private:
    auto instance(ResourceContext& context, Resource const& resource) const -> Expected<ResourcePtr>;

    bool         latest_;
    ResourceType instanceType_;
};

class GroupBehavior final : public ResourceBehavior {
public:
    GroupBehavior();

    auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void> override;
    auto update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const& originator) const
            -> Expected<void> override;

private:
    auto validateMembers(ResourceContext& context, Resource& resource) const -> Expected<void>;
};

/**
 * The "fopt" virtual child of a group. Every operation addressed at or below
 * it is repeated for each group member and the responses are aggregated.
 */
class FanOutPointBehavior final : public ResourceBehavior {
public:
    /**
     * @param remainder path below the fan-out point, empty or starting with '/'
     *
     * A request whose fanOutTrail already holds this fan-out point is refused
     * with OperationNotAllowed instead of being expanded again.
     */
    auto fanOut(ResourceContext& context, Resource const& fanOutPoint, Request const& request, std::string const& remainder) const
            -> Response;
};

class AccessControlPolicyBehavior final : public ResourceBehavior {
public:
    AccessControlPolicyBehavior();

    auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void> override;
    auto update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const& originator) const
            -> Expected<void> override;
};

class SubscriptionBehavior final : public ResourceBehavior {
public:
    auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void> override;
};

class RemoteCseBehavior final : public ResourceBehavior {
public:
    RemoteCseBehavior();

    auto activate(ResourceContext& context, Resource& resource, Resource const& parent, std::string const& originator) const
            -> Expected<void> override;
};

} // namespace M2M
