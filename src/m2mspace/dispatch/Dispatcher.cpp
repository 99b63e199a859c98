#include "dispatch/Dispatcher.hpp"
#include "log/TaggedLogger.hpp"
#include "path/utils.hpp"
#include "resource/ResourceFactory.hpp"

#include <exception>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace M2M {

namespace {

auto failure(Error::Code code, std::string message) -> Response {
    return Response::fromError(Error{code, std::move(message)});
}

auto no_privilege(std::string const& originator, Resource const& resource) -> Response {
    return failure(Error::Code::OriginatorHasNoPrivilege, "originator " + originator + " has no privilege on " + resource.ri());
}

// Exception boundary of the public entry points
template <typename F>
auto guarded(Request const& request, F&& body) -> Response {
    try {
        return std::forward<F>(body)();
    } catch (nlohmann::json::exception const& e) {
        m2m_log("Malformed content in " + std::string{operationToString(request.operation)} + " " + request.to + ": " + e.what(),
                "Dispatcher", "ERROR");
        return failure(Error::Code::BadRequest, std::string{"malformed content: "} + e.what());
    } catch (std::exception const& e) {
        m2m_log("Internal error in " + std::string{operationToString(request.operation)} + " " + request.to + ": " + e.what(),
                "Dispatcher", "ERROR");
        return failure(Error::Code::InternalServerError, e.what());
    }
}

auto permitted(AccessFilter const& access, std::vector<ResourcePtr> resources, std::string const& originator, Permission permission)
        -> std::vector<ResourcePtr> {
    std::erase_if(resources, [&](ResourcePtr const& resource) { return !access.hasAccess(originator, *resource, permission); });
    return resources;
}

} // namespace

Dispatcher::Dispatcher(CseOptions                  options,
                       ResourceStore&              store,
                       AccessFilter const&         access,
                       Registration&               registration,
                       Federation&                 federation,
                       ResourceTypeRegistry const& types)
    : options_(std::move(options)),
      store_(store),
      access_(access),
      registration_(registration),
      federation_(federation),
      types_(types),
      resolver_(this->options_, store),
      discovery_(this->options_, store),
      results_(this->options_.cseId) {}

auto Dispatcher::setEventSink(std::weak_ptr<EventSink> sink) -> void {
    this->sink_ = std::move(sink);
}

auto Dispatcher::handleRequest(Request const& request) -> Response {
    switch (request.operation) {
    case Operation::Retrieve:
    case Operation::Discovery:
        return this->retrieve(request);
    case Operation::Create:
        return this->create(request);
    case Operation::Update:
        return this->update(request);
    case Operation::Delete:
        return this->remove(request);
    case Operation::Notify:
        break;
    }
    return failure(Error::Code::NotImplemented, std::string{operationToString(request.operation)} + " is not supported");
}

auto Dispatcher::retrieve(Request const& request) -> Response {
    return guarded(request, [&]() -> Response {
        auto routed = this->route(request);
        if (!routed)
            return std::move(routed.error());
        if (routed->resource->isVirtual())
            return this->handleVirtual(request, routed->resource);
        return this->retrieveResource(request, routed->resource);
    });
}

auto Dispatcher::create(Request const& request) -> Response {
    return guarded(request, [&]() -> Response {
        auto routed = this->route(request);
        if (!routed)
            return std::move(routed.error());
        if (routed->resource->isVirtual())
            return this->handleVirtual(request, routed->resource);
        return this->createChild(request, routed->resource);
    });
}

auto Dispatcher::update(Request const& request) -> Response {
    return guarded(request, [&]() -> Response {
        auto routed = this->route(request);
        if (!routed)
            return std::move(routed.error());
        if (routed->resource->isVirtual())
            return this->handleVirtual(request, routed->resource);
        return this->updateResource(request, routed->resource);
    });
}

auto Dispatcher::remove(Request const& request) -> Response {
    return guarded(request, [&]() -> Response {
        auto routed = this->route(request);
        if (!routed)
            return std::move(routed.error());
        if (routed->resource->isVirtual())
            return this->handleVirtual(request, routed->resource);
        return this->deleteTarget(request, routed->resource);
    });
}

auto Dispatcher::route(Request const& request) -> Routed {
    auto resolved = this->resolver_.resolve(request.to);
    if (!resolved)
        return std::unexpected(Response::fromError(resolved.error()));
    if (resolved->empty())
        return std::unexpected(failure(Error::Code::NotFound, "cannot resolve " + request.to));

    if (this->federation_.isRemoteTarget(resolved->cseId)) {
        if (!this->options_.enableTransitRequests) {
            m2m_log("Transit request to " + resolved->cseId + " refused", "Dispatcher", "WARN");
            return std::unexpected(failure(Error::Code::OperationNotAllowed, "transit requests are disabled"));
        }
        m2m_log("Forwarding " + std::string{operationToString(request.operation)} + " " + request.to + " to " + resolved->cseId,
                "Dispatcher");
        return std::unexpected(this->federation_.forward(request, resolved->cseId));
    }

    if (!resolved->structuredPath.empty()) {
        auto [fanOutPoint, remainder] = this->fanOutTarget(resolved->structuredPath);
        if (fanOutPoint) {
            m2m_log("Fan-out of " + request.to + " through " + fanOutPoint->ri(), "Dispatcher");
            return std::unexpected(this->fanOut_.fanOut(*this, *fanOutPoint, request, remainder));
        }
    }

    if (resolved->resourceId.empty())
        return std::unexpected(failure(Error::Code::NotFound, "no resource at " + request.to));
    auto resource = this->store_.get(resolved->resourceId);
    if (!resource)
        return std::unexpected(failure(Error::Code::NotFound, "resource " + resolved->resourceId + " not found"));

    // A fan-out point addressed by its resource id
    if (resource->type() == ResourceType::GRP_FOPT) {
        m2m_log("Fan-out of " + request.to + " through " + resource->ri(), "Dispatcher");
        return std::unexpected(this->fanOut_.fanOut(*this, *resource, request, std::string{}));
    }
    return Target{std::move(*resolved), std::move(resource)};
}

auto Dispatcher::fanOutTarget(std::string const& structuredPath) const -> std::pair<ResourcePtr, std::string> {
    auto const segments = split_path(structuredPath);
    for (std::size_t idx = 1; idx < segments.size(); ++idx) {
        if (segments[idx] != "fopt")
            continue;
        std::vector<std::string_view> const head(segments.begin(), segments.begin() + static_cast<std::ptrdiff_t>(idx + 1));
        auto record = this->store_.getByPath(join_path(head, 0));
        if (!record || record->type() != ResourceType::GRP_FOPT)
            continue;
        auto rest = join_path(segments, idx + 1);
        return {std::move(record), rest.empty() ? std::string{} : "/" + rest};
    }
    return {nullptr, std::string{}};
}

auto Dispatcher::retrieveResource(Request const& request, ResourcePtr const& resource) -> Response {
    auto const& arguments = request.arguments;
    if (arguments.filterUsage == FilterUsage::Discovery && arguments.resultContent != ResultContent::Attributes)
        return this->discoverResources(request, resource);

    if (!this->access_.hasAccess(request.originator, *resource, Permission::Retrieve))
        return no_privilege(request.originator, *resource);

    switch (arguments.resultContent) {
    case ResultContent::Attributes:
        return Response::withContent(ResponseStatusCode::OK, resource->toJson());
    case ResultContent::AttributesAndChildResources:
    case ResultContent::AttributesAndChildResourceReferences:
    case ResultContent::ChildResourceReferences:
        break;
    default:
        return failure(Error::Code::InvalidArguments, "unsupported result content for retrieve");
    }

    auto found = this->discovery_.discover(*resource, arguments.handling, arguments.conditions);
    if (!found)
        return Response::fromError(found.error());
    auto allowed = permitted(this->access_, std::move(*found), request.originator, Permission::Retrieve);
    auto const drt = arguments.desiredIdentifierResultType;

    Json content;
    switch (arguments.resultContent) {
    case ResultContent::AttributesAndChildResources: {
        auto built = this->results_.resourceTree(std::move(allowed), resource->ri());
        content    = this->results_.withTree(*resource, built.tree);
        break;
    }
    case ResultContent::AttributesAndChildResourceReferences:
        content = this->results_.childReferences(allowed, resource.get(), drt);
        break;
    default:
        content = this->results_.uriList(allowed, drt);
        break;
    }
    return Response::withContent(ResponseStatusCode::OK, std::move(content));
}

auto Dispatcher::discoverResources(Request const& request, ResourcePtr const& root) -> Response {
    auto const& arguments = request.arguments;
    switch (arguments.resultContent) {
    case ResultContent::AttributesAndChildResources:
    case ResultContent::AttributesAndChildResourceReferences:
    case ResultContent::ChildResourceReferences:
    case ResultContent::ChildResources:
    case ResultContent::DiscoveryResultReferences:
        break;
    default:
        return failure(Error::Code::InvalidArguments, "unsupported result content for discovery");
    }

    if (!this->access_.hasAccess(request.originator, *root, Permission::Discovery))
        return no_privilege(request.originator, *root);

    auto found = this->discovery_.discover(*root, arguments.handling, arguments.conditions);
    if (!found)
        return Response::fromError(found.error());
    auto allowed = permitted(this->access_, std::move(*found), request.originator, Permission::Discovery);
    m2m_log("Discovery below " + root->ri() + " returned " + std::to_string(allowed.size()) + " permitted resources", "Dispatcher");
    auto const drt = arguments.desiredIdentifierResultType;

    Json content;
    switch (arguments.resultContent) {
    case ResultContent::ChildResourceReferences:
        content = this->results_.childReferences(allowed, nullptr, drt);
        break;
    case ResultContent::DiscoveryResultReferences:
        content = this->results_.uriList(allowed, drt);
        break;
    case ResultContent::AttributesAndChildResourceReferences:
        content = this->results_.childReferences(allowed, root.get(), drt);
        break;
    case ResultContent::AttributesAndChildResources:
        content = this->results_.withTree(*root, this->results_.resourceTree(std::move(allowed), std::nullopt).tree);
        break;
    default:
        content = this->results_.resourceTree(std::move(allowed), std::nullopt).tree;
        break;
    }
    return Response::withContent(ResponseStatusCode::OK, std::move(content));
}

auto Dispatcher::handleVirtual(Request const& request, ResourcePtr const& resource) -> Response {
    auto const& behavior = this->types_.behavior(resource->type());
    switch (request.operation) {
    case Operation::Retrieve:
    case Operation::Discovery: {
        if (!this->access_.hasAccess(request.originator, *resource, Permission::Retrieve))
            return no_privilege(request.originator, *resource);
        auto target = behavior.handleRetrieve(*this, resource);
        if (!target)
            return Response::fromError(target.error());
        return Response::withContent(ResponseStatusCode::OK, (*target)->toJson());
    }
    case Operation::Create:
        if (!this->access_.hasAccess(request.originator, *resource, Permission::Create))
            return no_privilege(request.originator, *resource);
        return behavior.handleCreate(*this, *resource, request);
    case Operation::Update:
        if (!this->access_.hasAccess(request.originator, *resource, Permission::Update))
            return no_privilege(request.originator, *resource);
        return behavior.handleUpdate(*this, *resource, request);
    case Operation::Delete: {
        if (!this->access_.hasAccess(request.originator, *resource, Permission::Delete))
            return no_privilege(request.originator, *resource);
        std::unique_lock tree{this->treeMutex_};
        auto             guard = this->locks_.lock({resource->parentId().value_or(std::string{}), resource->ri()});
        return behavior.handleDelete(*this, *resource, request);
    }
    case Operation::Notify:
        break;
    }
    return failure(Error::Code::OperationNotAllowed, "operation not allowed on virtual resource " + resource->ri());
}

auto Dispatcher::createChild(Request const& request, ResourcePtr const& parent) -> Response {
    if (!request.contentType || !request.resourceType)
        return failure(Error::Code::BadRequest, "content type and resource type are required");
    if (!request.content)
        return failure(Error::Code::BadRequest, "missing content");
    auto const type = *request.resourceType;

    AccessContext const context{.isCreateRequest = true, .childType = type};
    if (!this->access_.hasAccess(request.originator, *parent, Permission::Create, context)) {
        if (type == ResourceType::AE)
            return failure(Error::Code::SecurityAssociationRequired, "originator " + request.originator + " may not register");
        return no_privilege(request.originator, *parent);
    }

    std::shared_lock tree{this->treeMutex_};
    auto             guard   = this->locks_.lock({parent->ri()});
    auto             current = this->store_.get(parent->ri());
    if (!current)
        return failure(Error::Code::NotFound, "parent " + parent->ri() + " not found");

    auto resource = ResourceFromJson(*request.content, type, current->ri(), this->options_.defaultExpirationSeconds);
    if (!resource)
        return Response::fromError(resource.error());

    if (!this->types_.behavior(current->type()).canHaveChild(*current, type)) {
        if (type == ResourceType::SUB)
            return failure(Error::Code::TargetNotSubscribable, current->ri() + " cannot be subscribed to");
        return failure(Error::Code::InvalidChildResourceType,
                       std::string{resourceTypeTraits(type).shortName} + " is not a valid child of " + current->ri());
    }

    resource->setStructuredPath(ChildStructuredPath(current->structuredPath(), resource->rn()));
    if (this->store_.exists(resource->ri(), resource->structuredPath()))
        return failure(Error::Code::Conflict, "resource " + resource->structuredPath() + " already exists");

    auto originator = this->registration_.checkCreation(*resource, request.originator, *current);
    if (!originator)
        return Response::fromError(originator.error());

    auto created = this->persistAndActivate(std::move(*resource), *current, *originator, true);
    if (!created)
        return Response::fromError(created.error());

    m2m_log("Created " + (*created)->ri() + " at " + (*created)->structuredPath(), "Dispatcher");
    if (request.arguments.resultContent == ResultContent::Nothing)
        return Response{ResponseStatusCode::Created, std::nullopt, std::nullopt};
    return Response::withContent(ResponseStatusCode::Created, (*created)->toJson());
}

auto Dispatcher::updateResource(Request const& request, ResourcePtr const& resource) -> Response {
    if (resource->readOnly())
        return failure(Error::Code::OperationNotAllowed, resource->ri() + " is read-only");
    if (!request.contentType)
        return failure(Error::Code::BadRequest, "content type is required");

    auto const& tag = resource->tag();
    if (!request.content || !request.content->is_object() || request.content->size() != 1 || !request.content->contains(tag))
        return failure(Error::Code::BadRequest, "content must be wrapped in " + tag);
    auto const& attributes = request.content->at(tag);
    if (!attributes.is_object())
        return failure(Error::Code::BadRequest, "attributes of " + tag + " must be an object");

    auto const resultContent = request.arguments.resultContent;
    if (resultContent != ResultContent::Attributes && resultContent != ResultContent::ModifiedAttributes
        && resultContent != ResultContent::Nothing)
        return failure(Error::Code::NotImplemented, "unsupported result content for update");

    AccessContext const context{.checkSelf = attributes.contains("acpi")};
    if (!this->access_.hasAccess(request.originator, *resource, Permission::Update, context))
        return no_privilege(request.originator, *resource);

    std::shared_lock tree{this->treeMutex_};
    auto             guard   = this->locks_.lock({resource->ri()});
    auto             current = this->store_.get(resource->ri());
    if (!current)
        return failure(Error::Code::NotFound, "resource " + resource->ri() + " not found");

    Resource updated = *current;
    if (auto valid = this->types_.behavior(updated.type()).update(*this, updated, attributes, request.originator); !valid)
        return Response::fromError(valid.error());
    auto stored = this->store_.put(std::move(updated));
    if (!stored)
        return Response::fromError(stored.error());
    this->emitUpdated(**stored);
    m2m_log("Updated " + (*stored)->ri(), "Dispatcher");

    switch (resultContent) {
    case ResultContent::Nothing:
        return Response{ResponseStatusCode::Updated, std::nullopt, std::nullopt};
    case ResultContent::ModifiedAttributes: {
        Json modified = Json::object();
        modified[tag] = attributeDiff(current->attributes(), (*stored)->attributes());
        return Response::withContent(ResponseStatusCode::Updated, std::move(modified));
    }
    default:
        return Response::withContent(ResponseStatusCode::Updated, (*stored)->toJson());
    }
}

auto Dispatcher::deleteTarget(Request const& request, ResourcePtr const& resource) -> Response {
    if (!this->access_.hasAccess(request.originator, *resource, Permission::Delete))
        return no_privilege(request.originator, *resource);

    // The whole subtree goes, so no other mutation may run below it meanwhile
    std::unique_lock tree{this->treeMutex_};
    auto             guard   = this->locks_.lock({resource->parentId().value_or(std::string{}), resource->ri()});
    auto             current = this->store_.get(resource->ri());
    if (!current)
        return failure(Error::Code::NotFound, "resource " + resource->ri() + " not found");

    if (auto deregistered = this->registration_.checkDeletion(*current, request.originator); !deregistered) {
        m2m_log("Deregistration of " + current->ri() + " refused: " + describeError(deregistered.error()), "Dispatcher", "WARN");
        return failure(Error::Code::BadRequest, "deregistration refused: " + describeError(deregistered.error()));
    }
    if (auto removed = this->deleteResource(*current, request.originator, false); !removed)
        return Response::fromError(removed.error());

    m2m_log("Deleted " + current->ri(), "Dispatcher");
    if (request.arguments.resultContent == ResultContent::Nothing)
        return Response{ResponseStatusCode::Deleted, std::nullopt, std::nullopt};
    return Response::withContent(ResponseStatusCode::Deleted, current->toJson());
}

auto Dispatcher::createResource(Resource resource, Resource const& parent, std::string const& originator) -> Expected<ResourcePtr> {
    if (resource.structuredPath().empty())
        resource.setStructuredPath(ChildStructuredPath(parent.structuredPath(), resource.rn()));
    if (resource.originator().empty())
        resource.setOriginator(originator);
    if (this->store_.exists(resource.ri(), resource.structuredPath()))
        return std::unexpected(Error{Error::Code::Conflict, "resource " + resource.structuredPath() + " already exists"});
    return this->persistAndActivate(std::move(resource), parent, originator, false);
}

auto Dispatcher::deleteResource(Resource const& resource, std::string const& originator, bool withDeregistration) -> Expected<void> {
    if (withDeregistration) {
        if (auto deregistered = this->registration_.checkDeletion(resource, originator); !deregistered)
            return std::unexpected(deregistered.error());
    }

    // The parent is captured before anything is removed
    auto const parentId = resource.parentId();
    auto const parent   = parentId ? this->store_.get(*parentId) : nullptr;

    this->types_.behavior(resource.type()).deactivate(*this, resource, originator);
    if (auto removed = this->store_.remove(resource.ri()); !removed)
        return std::unexpected(removed.error());
    this->emitDeleted(resource);

    if (parent)
        this->types_.behavior(parent->type()).childRemoved(*this, *parent, resource, originator);
    return {};
}

auto Dispatcher::hasAccess(std::string const& originator, Resource const& resource, Permission permission) const -> bool {
    return this->access_.hasAccess(originator, resource, permission);
}

auto Dispatcher::persistAndActivate(Resource resource, Resource const& parent, std::string const& originator, bool withDeregistration)
        -> Expected<ResourcePtr> {
    if (auto stored = this->store_.create(resource); !stored) {
        m2m_log("Persisting " + resource.ri() + " failed: " + describeError(stored.error()), "Dispatcher", "WARN");
        if (withDeregistration)
            this->deregister(resource, originator);
        return std::unexpected(stored.error());
    }

    auto const& behavior = this->types_.behavior(resource.type());
    if (auto activated = behavior.activate(*this, resource, parent, originator); !activated) {
        m2m_log("Activation of " + resource.ri() + " failed: " + describeError(activated.error()), "Dispatcher", "WARN");
        this->discard(resource, originator, withDeregistration);
        return std::unexpected(activated.error());
    }

    auto const resourceId = resource.ri();
    auto persisted        = this->store_.put(std::move(resource));
    if (!persisted) {
        if (auto stale = this->store_.get(resourceId))
            this->discard(*stale, originator, withDeregistration);
        return std::unexpected(persisted.error());
    }

    // Reload so hooks never work on a parent snapshot older than this request
    if (auto current = this->store_.get(parent.ri()))
        this->types_.behavior(current->type()).childAdded(*this, *current, **persisted, originator);
    this->emitCreated(**persisted);

    if (auto latest = this->store_.get(resourceId))
        return latest;
    return *persisted;
}

auto Dispatcher::discard(Resource const& resource, std::string const& originator, bool withDeregistration) -> void {
    for (auto const& child : this->store_.children(resource.ri()))
        this->discard(*child, originator, false);
    if (auto removed = this->store_.remove(resource.ri()); !removed)
        m2m_log("Rollback of " + resource.ri() + " failed: " + describeError(removed.error()), "Dispatcher", "ERROR");
    if (withDeregistration)
        this->deregister(resource, originator);
}

auto Dispatcher::deregister(Resource const& resource, std::string const& originator) -> void {
    if (auto deregistered = this->registration_.checkDeletion(resource, originator); !deregistered)
        m2m_log("Deregistration of " + resource.ri() + " failed: " + describeError(deregistered.error()), "Dispatcher", "ERROR");
}

auto Dispatcher::emitCreated(Resource const& resource) const -> void {
    if (auto sink = this->sink_.lock())
        sink->resourceCreated(resource);
}

auto Dispatcher::emitUpdated(Resource const& resource) const -> void {
    if (auto sink = this->sink_.lock())
        sink->resourceUpdated(resource);
}

auto Dispatcher::emitDeleted(Resource const& resource) const -> void {
    if (auto sink = this->sink_.lock())
        sink->resourceDeleted(resource);
}

} // namespace M2M
