#include "store/MemoryResourceStore.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <utility>

namespace M2M {

namespace {

auto csi_of(Resource const& resource) -> std::optional<std::string> {
    if (resource.type() != ResourceType::CSR && resource.type() != ResourceType::CSEBase)
        return std::nullopt;
    auto csi = resource.stringAttribute("csi");
    if (!csi || csi->empty())
        return std::nullopt;
    return csi;
}

} // namespace

auto MemoryResourceStore::get(std::string const& resourceId) const -> ResourcePtr {
    ResourcePtr found;
    this->records_.if_contains(resourceId, [&](auto const& entry) { found = entry.second; });
    return found;
}

auto MemoryResourceStore::getByPath(std::string const& structuredPath) const -> ResourcePtr {
    std::string resourceId;
    if (!this->paths_.if_contains(structuredPath, [&](auto const& entry) { resourceId = entry.second; }))
        return nullptr;
    return this->get(resourceId);
}

auto MemoryResourceStore::exists(std::string const& resourceId, std::string const& structuredPath) const -> bool {
    if (!resourceId.empty() && this->records_.contains(resourceId))
        return true;
    return !structuredPath.empty() && this->paths_.contains(structuredPath);
}

auto MemoryResourceStore::create(Resource resource) -> Expected<ResourcePtr> {
    auto const resourceId = resource.ri();
    auto const path       = resource.structuredPath();
    if (resourceId.empty())
        return std::unexpected(Error{Error::Code::BadRequest, "resource has no id"});

    auto record = std::make_shared<Resource const>(std::move(resource));
    if (!this->records_.try_emplace(resourceId, record).second)
        return std::unexpected(Error{Error::Code::Conflict, "resource id already exists: " + resourceId});

    if (!path.empty() && !this->paths_.try_emplace(path, resourceId).second) {
        this->records_.erase(resourceId);
        return std::unexpected(Error{Error::Code::Conflict, "structured path already exists: " + path});
    }

    if (auto csi = csi_of(*record)) {
        if (!this->cseIds_.try_emplace(*csi, resourceId).second) {
            if (!path.empty())
                this->paths_.erase(path);
            this->records_.erase(resourceId);
            return std::unexpected(Error{Error::Code::Conflict, "CSE-ID already registered: " + *csi});
        }
    }

    if (auto parentId = record->parentId()) {
        this->children_.try_emplace_l(
                *parentId,
                [&](auto& entry) { entry.second.push_back(resourceId); },
                std::vector<std::string>{resourceId});
    }

    m2m_log("Stored " + resourceId + " at " + path, "Store");
    return record;
}

auto MemoryResourceStore::put(Resource resource) -> Expected<ResourcePtr> {
    auto const resourceId = resource.ri();
    auto       record     = std::make_shared<Resource const>(std::move(resource));
    bool const replaced   = this->records_.modify_if(resourceId, [&](auto& entry) { entry.second = record; });
    if (!replaced)
        return std::unexpected(Error{Error::Code::NotFound, "no such resource: " + resourceId});
    m2m_log("Updated " + resourceId, "Store");
    return record;
}

auto MemoryResourceStore::remove(std::string const& resourceId) -> Expected<void> {
    auto record = this->get(resourceId);
    if (!record)
        return std::unexpected(Error{Error::Code::NotFound, "no such resource: " + resourceId});

    if (auto parentId = record->parentId()) {
        this->children_.modify_if(*parentId, [&](auto& entry) { std::erase(entry.second, resourceId); });
    }
    if (auto csi = csi_of(*record)) {
        this->cseIds_.erase_if(*csi, [&](auto const& entry) { return entry.second == resourceId; });
    }
    if (auto const path = record->structuredPath(); !path.empty()) {
        this->paths_.erase_if(path, [&](auto const& entry) { return entry.second == resourceId; });
    }
    this->children_.erase(resourceId);
    this->records_.erase(resourceId);
    m2m_log("Removed " + resourceId, "Store");
    return {};
}

auto MemoryResourceStore::childIds(std::string const& parentId) const -> std::vector<std::string> {
    std::vector<std::string> ids;
    this->children_.if_contains(parentId, [&](auto const& entry) { ids = entry.second; });
    return ids;
}

auto MemoryResourceStore::children(std::string const& parentId, std::optional<ResourceType> type) const
        -> std::vector<ResourcePtr> {
    std::vector<ResourcePtr> out;
    for (auto const& id : this->childIds(parentId)) {
        auto child = this->get(id);
        if (!child)
            continue;
        if (type && child->type() != *type)
            continue;
        out.push_back(std::move(child));
    }
    return out;
}

auto MemoryResourceStore::queryDescendants(std::string const& rootId, DescendantQuery const& query) const
        -> std::vector<ResourcePtr> {
    std::vector<ResourcePtr> out;
    if (!this->records_.contains(rootId))
        return out;

    std::size_t const maxLevel = query.level.value_or(0);
    std::size_t const limit    = query.limit.value_or(0);
    std::size_t       toSkip   = query.offset.value_or(0) > 1 ? *query.offset - 1 : 0;

    struct Frame {
        std::string id;
        std::size_t depth;
    };
    // Pre-order walk; children are pushed in reverse so creation order is kept.
    std::vector<Frame> stack;
    auto push_children = [&](std::string const& parentId, std::size_t depth) {
        auto ids = this->childIds(parentId);
        for (auto it = ids.rbegin(); it != ids.rend(); ++it)
            stack.push_back(Frame{*it, depth});
    };
    push_children(rootId, 1);

    while (!stack.empty()) {
        auto frame = std::move(stack.back());
        stack.pop_back();

        auto record = this->get(frame.id);
        if (!record)
            continue;

        if (!query.matches || query.matches(*record)) {
            if (toSkip > 0) {
                --toSkip;
            } else {
                out.push_back(record);
                if (limit != 0 && out.size() >= limit)
                    break;
            }
        }

        if (maxLevel == 0 || frame.depth < maxLevel)
            push_children(frame.id, frame.depth + 1);
    }
    return out;
}

auto MemoryResourceStore::resolveCseId(std::string const& cseId) const -> std::optional<std::string> {
    std::optional<std::string> resourceId;
    this->cseIds_.if_contains(cseId, [&](auto const& entry) { resourceId = entry.second; });
    return resourceId;
}

auto MemoryResourceStore::size() const -> std::size_t {
    return this->records_.size();
}

} // namespace M2M
