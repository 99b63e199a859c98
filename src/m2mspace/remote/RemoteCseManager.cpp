#include "remote/RemoteCseManager.hpp"
#include "log/TaggedLogger.hpp"

namespace M2M {

RemoteCseManager::RemoteCseManager(CseOptions options, ResourceStore const& store, RequestSender sender)
    : options_(std::move(options)), store_(store), sender_(std::move(sender)) {}

auto RemoteCseManager::isRemoteTarget(std::string const& cseId) const -> bool {
    return !cseId.empty() && cseId != this->options_.cseId;
}

auto RemoteCseManager::forward(Request const& request, std::string const& cseId) -> Response {
    auto const remoteId = this->store_.resolveCseId(cseId);
    auto const remote   = remoteId ? this->store_.get(*remoteId) : nullptr;
    if (!remote) {
        m2m_log("No registration for remote CSE " + cseId, "Remote", "WARN");
        return Response{ResponseStatusCode::NotFound, std::nullopt, "remote CSE not registered: " + cseId};
    }
    if (!this->sender_) {
        return Response{ResponseStatusCode::TargetNotReachable, std::nullopt, "no transport for remote CSE " + cseId};
    }
    m2m_log("Forwarding " + std::string{operationToString(request.operation)} + " " + request.to + " to " + cseId, "Remote");
    return this->sender_(*remote, request);
}

} // namespace M2M
