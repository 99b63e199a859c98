#include "discovery/DiscoveryEngine.hpp"
#include "log/TaggedLogger.hpp"
#include "resource/ResourceFactory.hpp"

#include <unordered_set>

namespace M2M {

namespace {

auto to_size(std::optional<std::int64_t> const& value) -> std::optional<std::size_t> {
    if (!value || *value <= 0)
        return std::nullopt;
    return static_cast<std::size_t>(*value);
}

} // namespace

DiscoveryEngine::DiscoveryEngine(CseOptions const& options, ResourceStore const& store)
    : maxLevel_(options.maxDiscoveryLevel), defaultLimit_(options.defaultDiscoveryLimit), store_(store) {}

auto DiscoveryEngine::discover(Resource const& root, FilterHandling const& handling, FilterCriteria const& conditions) const
        -> Expected<std::vector<ResourcePtr>> {
    if (root.ri().empty())
        return std::unexpected(Error{Error::Code::NotFound, "discovery root has no id"});

    DescendantQuery query;
    query.limit  = to_size(handling.limit ? handling.limit : std::optional<std::int64_t>{this->defaultLimit_});
    query.offset = to_size(handling.offset);
    query.level  = to_size(handling.level);
    if (this->maxLevel_ > 0 && (!query.level || *query.level > static_cast<std::size_t>(this->maxLevel_)))
        query.level = static_cast<std::size_t>(this->maxLevel_);
    if (!conditions.empty())
        query.matches = [&conditions](Resource const& resource) { return conditions.matches(resource); };

    auto matches = this->store_.queryDescendants(root.ri(), query);
    m2m_log("Discovery below " + root.ri() + " matched " + std::to_string(matches.size()), "Discovery");

    if (handling.applicableRelativePath)
        matches = this->applyRelativePath(std::move(matches), *handling.applicableRelativePath);
    return matches;
}

auto DiscoveryEngine::applyRelativePath(std::vector<ResourcePtr> matches, std::string const& relativePath) const
        -> std::vector<ResourcePtr> {
    std::vector<ResourcePtr>        out;
    std::unordered_set<std::string> seen;
    for (auto const& match : matches) {
        auto target = this->store_.getByPath(ChildStructuredPath(match->structuredPath(), relativePath));
        if (target && seen.insert(target->ri()).second)
            out.push_back(std::move(target));
    }
    return out;
}

} // namespace M2M
