#pragma once
#include "config/CseOptions.hpp"
#include "discovery/DiscoveryEngine.hpp"
#include "dispatch/ResourceLocks.hpp"
#include "events/EventSink.hpp"
#include "path/AddressResolver.hpp"
#include "registration/Registration.hpp"
#include "remote/Federation.hpp"
#include "request/Request.hpp"
#include "resource/Behaviors.hpp"
#include "resource/ResourceBehavior.hpp"
#include "result/ResultTreeBuilder.hpp"
#include "security/AccessFilter.hpp"
#include "store/ResourceStore.hpp"

#include <expected>
#include <memory>
#include <shared_mutex>
#include <string>

namespace M2M {

/**
 * @brief Entry points for the CRUD operations of the resource tree.
 *
 * Every request runs Resolve → Redirect? → Authorize → Execute → Notify/Rollback:
 * the address is resolved, requests for another CSE are forwarded (when
 * transit is enabled), addresses at or below a group's fan-out point are
 * broadcast to the members, virtual resources are handed to their type
 * handler, and everything else runs the generic algorithm of the operation.
 *
 * Failures are returned as a Response carrying the status code and a debug
 * message; no exception leaves the public entry points.
 *
 * The collaborators are borrowed and must outlive the dispatcher.
 */
class Dispatcher final : public ResourceContext {
public:
    Dispatcher(CseOptions                  options,
               ResourceStore&              store,
               AccessFilter const&         access,
               Registration&               registration,
               Federation&                 federation,
               ResourceTypeRegistry const& types);

    /** @brief Receives creation, update and deletion events; held weakly. Set before serving requests. */
    auto setEventSink(std::weak_ptr<EventSink> sink) -> void;

    auto retrieve(Request const& request) -> Response;
    auto create(Request const& request) -> Response;
    auto update(Request const& request) -> Response;
    auto remove(Request const& request) -> Response;

    // ResourceContext
    auto handleRequest(Request const& request) -> Response override;
    [[nodiscard]] auto store() -> ResourceStore& override { return this->store_; }
    [[nodiscard]] auto options() const -> CseOptions const& override { return this->options_; }
    auto createResource(Resource resource, Resource const& parent, std::string const& originator) -> Expected<ResourcePtr> override;
    auto deleteResource(Resource const& resource, std::string const& originator, bool withDeregistration) -> Expected<void> override;
    [[nodiscard]] auto hasAccess(std::string const& originator, Resource const& resource, Permission permission) const -> bool override;

private:
    struct Target {
        ResolvedAddress address;
        ResourcePtr     resource;
    };

    // Either a resolved local target or the final response of a redirected request
    using Routed = std::expected<Target, Response>;

    auto route(Request const& request) -> Routed;
    auto fanOutTarget(std::string const& structuredPath) const -> std::pair<ResourcePtr, std::string>;

    auto retrieveResource(Request const& request, ResourcePtr const& resource) -> Response;
    auto discoverResources(Request const& request, ResourcePtr const& root) -> Response;
    auto createChild(Request const& request, ResourcePtr const& parent) -> Response;
    auto updateResource(Request const& request, ResourcePtr const& resource) -> Response;
    auto deleteTarget(Request const& request, ResourcePtr const& resource) -> Response;
    auto handleVirtual(Request const& request, ResourcePtr const& resource) -> Response;

    auto persistAndActivate(Resource resource, Resource const& parent, std::string const& originator, bool withDeregistration)
            -> Expected<ResourcePtr>;
    auto discard(Resource const& resource, std::string const& originator, bool withDeregistration) -> void;
    auto deregister(Resource const& resource, std::string const& originator) -> void;

    auto emitCreated(Resource const& resource) const -> void;
    auto emitUpdated(Resource const& resource) const -> void;
    auto emitDeleted(Resource const& resource) const -> void;

    CseOptions                  options_;
    ResourceStore&              store_;
    AccessFilter const&         access_;
    Registration&               registration_;
    Federation&                 federation_;
    ResourceTypeRegistry const& types_;
    AddressResolver             resolver_;
    DiscoveryEngine             discovery_;
    ResultTreeBuilder           results_;
    FanOutPointBehavior         fanOut_;
    ResourceLocks               locks_;
    // DELETE holds it exclusively, CREATE and UPDATE shared
    std::shared_mutex           treeMutex_;
    std::weak_ptr<EventSink>    sink_;
};

} // namespace M2M
