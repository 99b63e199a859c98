#include "resource/ResourceBehavior.hpp"
#include "core/Timestamp.hpp"
#include "log/TaggedLogger.hpp"
#include "resource/Behaviors.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace M2M {

namespace {

constexpr std::array<std::string_view, 6> ImmutableAttributes{"ri", "rn", "pi", "ty", "ct", "csi"};

auto not_allowed(Resource const& resource) -> Response {
    return Response{ResponseStatusCode::OperationNotAllowed,
                    std::nullopt,
                    "operation not allowed on " + std::string{resourceTypeTraits(resource.type()).shortName}};
}

} // namespace

ResourceBehavior::ResourceBehavior(std::initializer_list<ResourceType> allowedChildren)
    : allowedChildren_(allowedChildren) {}

auto ResourceBehavior::canHaveChild(Resource const&, ResourceType childType) const -> bool {
    return std::find(this->allowedChildren_.begin(), this->allowedChildren_.end(), childType) != this->allowedChildren_.end();
}

auto ResourceBehavior::activate(ResourceContext&, Resource&, Resource const&, std::string const&) const -> Expected<void> {
    return {};
}

auto ResourceBehavior::update(ResourceContext&, Resource& resource, Json const& attributes, std::string const&) const
        -> Expected<void> {
    return mergeAttributes(resource, attributes);
}

auto ResourceBehavior::deactivate(ResourceContext& context, Resource const& resource, std::string const& originator) const -> void {
    for (auto const& child : context.store().children(resource.ri())) {
        if (auto removed = context.deleteResource(*child, originator, false); !removed) {
            m2m_log("Failed to remove child " + child->ri() + " of " + resource.ri() + ": " + describeError(removed.error()),
                    "Resource", "WARN");
        }
    }
}

auto ResourceBehavior::childAdded(ResourceContext&, Resource const&, Resource const&, std::string const&) const -> void {}

auto ResourceBehavior::childRemoved(ResourceContext&, Resource const&, Resource const&, std::string const&) const -> void {}

auto ResourceBehavior::handleRetrieve(ResourceContext&, ResourcePtr const& resource) const -> Expected<ResourcePtr> {
    return resource;
}

auto ResourceBehavior::handleCreate(ResourceContext&, Resource const& resource, Request const&) const -> Response {
    return not_allowed(resource);
}

auto ResourceBehavior::handleUpdate(ResourceContext&, Resource const& resource, Request const&) const -> Response {
    return not_allowed(resource);
}

auto ResourceBehavior::handleDelete(ResourceContext&, Resource const& resource, Request const&) const -> Response {
    return not_allowed(resource);
}

auto mergeAttributes(Resource& resource, Json const& attributes) -> Expected<void> {
    if (!attributes.is_object())
        return std::unexpected(Error{Error::Code::BadRequest, "update content must be an object"});

    for (auto const& [key, value] : attributes.items()) {
        if (Resource::isInternalAttribute(key))
            continue;
        bool const immutable = std::find(ImmutableAttributes.begin(), ImmutableAttributes.end(), key) != ImmutableAttributes.end();
        if (immutable) {
            auto const* current = resource.attribute(key);
            if (current == nullptr || *current != value)
                return std::unexpected(Error{Error::Code::BadRequest, "attribute " + key + " cannot be updated"});
            continue;
        }
        if (value.is_null())
            resource.removeAttribute(key);
        else
            resource.setAttribute(key, value);
    }
    resource.setAttribute("lt", timestampNow());
    return {};
}

ResourceTypeRegistry::ResourceTypeRegistry()
    : fallback_(std::make_shared<ResourceBehavior>()) {
    using T = ResourceType;
    this->registerBehavior(T::CSEBase,
                           std::make_shared<ResourceBehavior>(std::initializer_list<ResourceType>{
                                   T::ACP, T::AE, T::CNT, T::FCNT, T::GRP, T::CSR, T::NOD, T::SUB, T::REQ}));
    this->registerBehavior(T::AE, std::make_shared<ResourceBehavior>(std::initializer_list<ResourceType>{T::ACP, T::CNT, T::FCNT, T::GRP, T::SUB}));
    this->registerBehavior(T::NOD, std::make_shared<ResourceBehavior>(std::initializer_list<ResourceType>{T::MgmtObj, T::SUB}));
    this->registerBehavior(T::MgmtObj, std::make_shared<ResourceBehavior>(std::initializer_list<ResourceType>{T::SUB}));
    this->registerBehavior(T::REQ, std::make_shared<ResourceBehavior>());
    this->registerBehavior(T::ACP, std::make_shared<AccessControlPolicyBehavior>());
    this->registerBehavior(T::SUB, std::make_shared<SubscriptionBehavior>());
    this->registerBehavior(T::CSR, std::make_shared<RemoteCseBehavior>());
    this->registerBehavior(T::CNT, std::make_shared<ContainerBehavior>());
    this->registerBehavior(T::CIN, std::make_shared<ContentInstanceBehavior>());
    this->registerBehavior(T::FCNT, std::make_shared<FlexContainerBehavior>());
    this->registerBehavior(T::FCI, std::make_shared<ContentInstanceBehavior>());
    this->registerBehavior(T::GRP, std::make_shared<GroupBehavior>());
    this->registerBehavior(T::GRP_FOPT, std::make_shared<FanOutPointBehavior>());
    this->registerBehavior(T::CNT_LA, std::make_shared<LatestOldestBehavior>(true, T::CIN));
    this->registerBehavior(T::CNT_OL, std::make_shared<LatestOldestBehavior>(false, T::CIN));
    this->registerBehavior(T::FCNT_LA, std::make_shared<LatestOldestBehavior>(true, T::FCI));
    this->registerBehavior(T::FCNT_OL, std::make_shared<LatestOldestBehavior>(false, T::FCI));
}

auto ResourceTypeRegistry::behavior(ResourceType type) const -> ResourceBehavior const& {
    auto it = this->behaviors_.find(type);
    if (it == this->behaviors_.end())
        return *this->fallback_;
    return *it->second;
}

auto ResourceTypeRegistry::registerBehavior(ResourceType type, std::shared_ptr<ResourceBehavior const> behavior) -> void {
    this->behaviors_[type] = std::move(behavior);
}

} // namespace M2M
