#include "log/TaggedLogger.hpp"
#include "resource/Behaviors.hpp"
#include "resource/ResourceFactory.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace M2M {

namespace {

constexpr std::array<std::string_view, 22> FlexContainerCommonAttributes{
        "ri", "rn", "pi", "ty", "ct", "lt", "et", "st", "acpi", "lbl", "at",
        "aa", "daci", "cr", "cnd", "or", "cs", "cni", "cbs", "mni", "mbs", "mia"};

auto content_size(Resource const& instance) -> std::int64_t {
    return instance.intAttribute("cs").value_or(0);
}

auto validate_limits(Json const& attributes) -> Expected<void> {
    for (auto const* key : {"mni", "mbs", "mia"}) {
        auto it = attributes.find(key);
        if (it == attributes.end() || it->is_null())
            continue;
        if (!it->is_number_integer() || it->get<std::int64_t>() < 0)
            return std::unexpected(Error{Error::Code::BadRequest, std::string{key} + " must be a non-negative integer"});
    }
    return {};
}

auto state_tag(ResourceStore const& store, std::string const& resourceId) -> std::int64_t {
    if (auto stored = store.get(resourceId))
        return stored->intAttribute("st").value_or(0);
    return 0;
}

} // namespace

InstanceContainerBehavior::InstanceContainerBehavior(ResourceType instanceType, std::initializer_list<ResourceType> allowedChildren)
    : ResourceBehavior(allowedChildren),
      instanceType_(instanceType),
      latestType_(instanceType == ResourceType::FCI ? ResourceType::FCNT_LA : ResourceType::CNT_LA),
      oldestType_(instanceType == ResourceType::FCI ? ResourceType::FCNT_OL : ResourceType::CNT_OL) {}

auto InstanceContainerBehavior::activate(ResourceContext& context, Resource& resource, Resource const&, std::string const& originator) const
        -> Expected<void> {
    if (auto valid = validate_limits(resource.attributes()); !valid)
        return valid;
    resource.setAttribute("cni", 0);
    resource.setAttribute("cbs", 0);
    resource.setAttribute("st", 0);
    return this->createLatestOldest(context, resource, originator);
}

auto InstanceContainerBehavior::update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const& originator) const
        -> Expected<void> {
    if (auto valid = validate_limits(attributes); !valid)
        return valid;
    if (auto merged = mergeAttributes(resource, attributes); !merged)
        return merged;
    this->enforceLimits(context, resource, originator);
    this->refreshCounters(context, resource);
    resource.setAttribute("st", state_tag(context.store(), resource.ri()) + 1);
    return {};
}

auto InstanceContainerBehavior::childAdded(ResourceContext& context, Resource const& parent, Resource const& child, std::string const& originator) const
        -> void {
    if (child.type() != this->instanceType_)
        return;
    this->enforceLimits(context, parent, originator);
    this->persistCounters(context, parent.ri());
}

auto InstanceContainerBehavior::childRemoved(ResourceContext& context, Resource const& parent, Resource const& child, std::string const&) const
        -> void {
    if (child.type() != this->instanceType_)
        return;
    this->persistCounters(context, parent.ri());
}

auto InstanceContainerBehavior::createLatestOldest(ResourceContext& context, Resource const& resource, std::string const& originator) const
        -> Expected<void> {
    for (auto const type : {this->latestType_, this->oldestType_}) {
        auto node = MakeVirtualResource(type, resource);
        if (!node)
            return std::unexpected(node.error());
        if (auto created = context.createResource(std::move(*node), resource, originator); !created)
            return std::unexpected(created.error());
    }
    return {};
}

auto InstanceContainerBehavior::enforceLimits(ResourceContext& context, Resource const& container, std::string const& originator) const
        -> void {
    auto maxInstances = container.intAttribute("mni");
    if (!maxInstances && context.options().maxNumberOfInstances > 0)
        maxInstances = context.options().maxNumberOfInstances;
    auto const maxBytes = container.intAttribute("mbs");
    if (!maxInstances && !maxBytes)
        return;

    auto const   instances = context.store().children(container.ri(), this->instanceType_);
    std::int64_t count     = static_cast<std::int64_t>(instances.size());
    std::int64_t bytes     = 0;
    for (auto const& instance : instances)
        bytes += content_size(*instance);

    // Oldest first
    for (auto const& oldest : instances) {
        bool const tooMany  = maxInstances && count > *maxInstances;
        bool const tooLarge = maxBytes && bytes > *maxBytes;
        if (!tooMany && !tooLarge)
            break;
        bytes -= content_size(*oldest);
        --count;
        if (auto removed = context.deleteResource(*oldest, originator, false); !removed) {
            m2m_log("Failed to evict " + oldest->ri() + ": " + describeError(removed.error()), "Resource", "WARN");
        }
    }
}

auto InstanceContainerBehavior::refreshCounters(ResourceContext& context, Resource& container) const -> void {
    auto const   instances = context.store().children(container.ri(), this->instanceType_);
    std::int64_t bytes     = 0;
    for (auto const& instance : instances)
        bytes += content_size(*instance);
    container.setAttribute("cni", static_cast<std::int64_t>(instances.size()));
    container.setAttribute("cbs", bytes);
}

auto InstanceContainerBehavior::persistCounters(ResourceContext& context, std::string const& containerId) const -> void {
    // Always work on the stored record, never on a caller's snapshot
    auto current = context.store().get(containerId);
    if (!current)
        return;
    Resource updated = *current;
    this->refreshCounters(context, updated);
    updated.setAttribute("st", updated.intAttribute("st").value_or(0) + 1);
    if (auto stored = context.store().put(std::move(updated)); !stored) {
        m2m_log("Failed to update counters of " + containerId + ": " + describeError(stored.error()), "Resource", "WARN");
    }
}

ContainerBehavior::ContainerBehavior()
    : InstanceContainerBehavior(ResourceType::CIN,
                                {ResourceType::CNT, ResourceType::CIN, ResourceType::FCNT, ResourceType::SUB, ResourceType::CNT_LA,
                                 ResourceType::CNT_OL}) {}

FlexContainerBehavior::FlexContainerBehavior()
    : InstanceContainerBehavior(ResourceType::FCI,
                                {ResourceType::CNT, ResourceType::FCNT, ResourceType::SUB, ResourceType::FCI, ResourceType::FCNT_LA,
                                 ResourceType::FCNT_OL}) {}

auto FlexContainerBehavior::activate(ResourceContext& context, Resource& resource, Resource const&, std::string const& originator) const
        -> Expected<void> {
    if (!resource.stringAttribute("cnd"))
        return std::unexpected(Error{Error::Code::BadRequest, "flexContainer requires cnd"});
    if (auto valid = validate_limits(resource.attributes()); !valid)
        return valid;
    resource.setAttribute("st", 0);
    if (!resource.hasAttribute("mni"))
        return {};

    if (auto created = this->createLatestOldest(context, resource, originator); !created)
        return created;
    if (auto added = this->addInstance(context, resource, originator); !added)
        return added;
    this->refreshCounters(context, resource);
    return {};
}

auto FlexContainerBehavior::update(ResourceContext& context, Resource& resource, Json const& attributes, std::string const& originator) const
        -> Expected<void> {
    if (auto valid = validate_limits(attributes); !valid)
        return valid;
    if (auto merged = mergeAttributes(resource, attributes); !merged)
        return merged;

    if (resource.hasAttribute("mni")) {
        if (context.store().children(resource.ri(), this->latestType_).empty()) {
            if (auto created = this->createLatestOldest(context, resource, originator); !created)
                return created;
        }
        if (auto added = this->addInstance(context, resource, originator); !added)
            return added;
        this->enforceLimits(context, resource, originator);
        this->refreshCounters(context, resource);
    }
    resource.setAttribute("st", state_tag(context.store(), resource.ri()) + 1);
    return {};
}

auto FlexContainerBehavior::addInstance(ResourceContext& context, Resource const& resource, std::string const& originator) const
        -> Expected<void> {
    Json custom = Json::object();
    for (auto const& [key, value] : resource.attributes().items()) {
        if (Resource::isInternalAttribute(key))
            continue;
        if (std::find(FlexContainerCommonAttributes.begin(), FlexContainerCommonAttributes.end(), key) != FlexContainerCommonAttributes.end())
            continue;
        custom[key] = value;
    }
    custom["cs"] = static_cast<std::int64_t>(custom.dump().size());
    if (auto const* labels = resource.attribute("lbl"))
        custom["lbl"] = *labels;

    Json payload  = Json::object();
    payload[resource.tag()] = std::move(custom);
    auto instance = ResourceFromJson(payload, ResourceType::FCI, resource.ri(), context.options().defaultExpirationSeconds);
    if (!instance)
        return std::unexpected(instance.error());
    if (auto created = context.createResource(std::move(*instance), resource, originator); !created)
        return std::unexpected(created.error());
    return {};
}

auto ContentInstanceBehavior::activate(ResourceContext&, Resource& resource, Resource const& parent, std::string const&) const
        -> Expected<void> {
    if (resource.type() == ResourceType::CIN) {
        auto const* content = resource.attribute("con");
        if (content == nullptr)
            return std::unexpected(Error{Error::Code::BadRequest, "contentInstance requires con"});
        auto const size = content->is_string() ? content->get<std::string>().size() : content->dump().size();
        resource.setAttribute("cs", static_cast<std::int64_t>(size));
    } else if (!resource.hasAttribute("cs")) {
        resource.setAttribute("cs", static_cast<std::int64_t>(resource.toJson(false).dump().size()));
    }

    auto const maxBytes = parent.intAttribute("mbs");
    if (maxBytes && content_size(resource) > *maxBytes)
        return std::unexpected(Error{Error::Code::BadRequest, "content size exceeds the container's mbs"});
    resource.setAttribute("st", parent.intAttribute("st").value_or(0));
    return {};
}

LatestOldestBehavior::LatestOldestBehavior(bool latest, ResourceType instanceType)
    : latest_(latest), instanceType_(instanceType) {}

auto LatestOldestBehavior::instance(ResourceContext& context, Resource const& resource) const -> Expected<ResourcePtr> {
    auto const parentId = resource.parentId();
    if (!parentId)
        return std::unexpected(Error{Error::Code::NotFound, "virtual resource without parent"});
    auto const instances = context.store().children(*parentId, this->instanceType_);
    if (instances.empty())
        return std::unexpected(Error{Error::Code::NotFound, "container has no instances"});
    return this->latest_ ? instances.back() : instances.front();
}

auto LatestOldestBehavior::handleRetrieve(ResourceContext& context, ResourcePtr const& resource) const -> Expected<ResourcePtr> {
    return this->instance(context, *resource);
}

auto LatestOldestBehavior::handleDelete(ResourceContext& context, Resource const& resource, Request const& request) const -> Response {
    auto target = this->instance(context, resource);
    if (!target)
        return Response::fromError(target.error());
    if (auto removed = context.deleteResource(**target, request.originator, true); !removed)
        return Response::fromError(removed.error());
    return Response::withContent(ResponseStatusCode::Deleted, (*target)->toJson());
}

} // namespace M2M
