#include "result/ResultTreeBuilder.hpp"

#include <algorithm>
#include <functional>
#include <unordered_set>

namespace M2M {

namespace {

auto excluded(Resource const& resource) -> bool {
    return isLatestOldestType(resource.type());
}

auto without_excluded(std::vector<ResourcePtr> pool) -> std::vector<ResourcePtr> {
    std::erase_if(pool, [](ResourcePtr const& r) { return !r || excluded(*r); });
    return pool;
}

using ChildPredicate = std::function<bool(Resource const&)>;

// Builds one level below the node described by isChild and returns the
// unconsumed part of the pool.
auto build_level(std::vector<ResourcePtr> pool, ChildPredicate const& isChild) -> TreeBuildResult {
    TreeBuildResult level;
    while (true) {
        auto first = std::find_if(pool.begin(), pool.end(), [&](ResourcePtr const& r) { return isChild(*r); });
        if (first == pool.end())
            break;

        auto const tag = (*first)->tag();
        std::vector<ResourcePtr> selected;
        std::vector<ResourcePtr> rest;
        for (auto& entry : pool) {
            if (entry->tag() == tag && isChild(*entry))
                selected.push_back(std::move(entry));
            else
                rest.push_back(std::move(entry));
        }
        pool = std::move(rest);

        Json items = Json::array();
        for (auto const& entry : selected) {
            auto const parentId = entry->ri();
            auto       sub      = build_level(std::move(pool), [&parentId](Resource const& r) { return r.parentId() == parentId; });
            pool                = std::move(sub.remaining);

            Json item = entry->toJson(false);
            for (auto& [key, value] : sub.tree.items())
                item[key] = std::move(value);
            items.push_back(std::move(item));
        }
        level.tree[tag] = std::move(items);
    }
    level.remaining = std::move(pool);
    return level;
}

} // namespace

ResultTreeBuilder::ResultTreeBuilder(std::string cseId)
    : cseId_(std::move(cseId)) {}

auto ResultTreeBuilder::uriList(std::vector<ResourcePtr> const& resources, DesiredIdentifierResultType drt) const -> Json {
    Json uris = Json::array();
    for (auto const& resource : resources) {
        if (!resource || excluded(*resource))
            continue;
        if (drt == DesiredIdentifierResultType::Structured)
            uris.push_back(resource->structuredPath());
        else
            uris.push_back(this->cseId_ + "/" + resource->ri());
    }
    return Json{{"m2m:uril", std::move(uris)}};
}

auto ResultTreeBuilder::references(std::vector<ResourcePtr> const& resources, DesiredIdentifierResultType drt) const -> Json {
    Json refs = Json::array();
    for (auto const& resource : resources) {
        if (!resource || excluded(*resource))
            continue;
        Json ref{{"nm", resource->rn()},
                 {"typ", toInt(resource->type())},
                 {"val", drt == DesiredIdentifierResultType::Structured ? resource->structuredPath() : resource->ri()}};
        if (resource->type() == ResourceType::FCNT) {
            if (auto const* specialization = resource->attribute("cnd"))
                ref["spty"] = *specialization;
        }
        refs.push_back(std::move(ref));
    }
    return refs;
}

auto ResultTreeBuilder::childReferences(std::vector<ResourcePtr> const& resources, Resource const* target, DesiredIdentifierResultType drt) const
        -> Json {
    auto refs = this->references(resources, drt);
    if (target == nullptr) {
        Json out = Json::object();
        if (!refs.empty())
            out["m2m:ch"] = std::move(refs);
        return out;
    }
    Json out = target->toJson();
    if (!refs.empty())
        out[target->tag()]["ch"] = std::move(refs);
    return out;
}

auto ResultTreeBuilder::resourceTree(std::vector<ResourcePtr> pool, std::optional<std::string> const& rootId) const -> TreeBuildResult {
    pool = without_excluded(std::move(pool));

    if (rootId) {
        auto const id = *rootId;
        return build_level(std::move(pool), [id](Resource const& r) { return r.parentId() == id; });
    }

    std::unordered_set<std::string> members;
    for (auto const& entry : pool)
        members.insert(entry->ri());
    return build_level(std::move(pool), [members = std::move(members)](Resource const& r) {
        auto const parentId = r.parentId();
        return !parentId || !members.contains(*parentId);
    });
}

auto ResultTreeBuilder::withTree(Resource const& target, Json const& tree) const -> Json {
    Json out = target.toJson();
    for (auto const& [key, value] : tree.items())
        out[target.tag()][key] = value;
    return out;
}

} // namespace M2M
