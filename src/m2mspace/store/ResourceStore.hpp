#pragma once
#include "core/Error.hpp"
#include "resource/Resource.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace M2M {

using ResourcePtr = std::shared_ptr<Resource const>;

/**
 * @brief Constraints of a descendant enumeration.
 *
 * level 1 yields direct children only; offset is 1-based (values <= 1 start at
 * the first match); limit caps the number of returned matches. Zero or an
 * absent value means "no constraint".
 */
struct DescendantQuery {
    std::function<bool(Resource const&)> matches;
    std::optional<std::size_t>           limit;
    std::optional<std::size_t>           level;
    std::optional<std::size_t>           offset;
};

/**
 * @brief Persistence contract of the resource tree.
 *
 * Records handed out are immutable snapshots; a writer replaces the whole
 * record so readers see either the previous or the new version.
 */
class ResourceStore {
public:
    virtual ~ResourceStore() = default;

    [[nodiscard]] virtual auto get(std::string const& resourceId) const -> ResourcePtr                = 0;
    [[nodiscard]] virtual auto getByPath(std::string const& structuredPath) const -> ResourcePtr      = 0;
    [[nodiscard]] virtual auto exists(std::string const& resourceId, std::string const& structuredPath) const -> bool = 0;

    /** @brief Insert a new record; Conflict when the id or structured path is taken. */
    virtual auto create(Resource resource) -> Expected<ResourcePtr> = 0;
    /** @brief Replace an existing record; NotFound when the id is unknown. */
    virtual auto put(Resource resource) -> Expected<ResourcePtr> = 0;
    virtual auto remove(std::string const& resourceId) -> Expected<void> = 0;

    /** @brief Direct children in creation order, optionally of one type. */
    [[nodiscard]] virtual auto children(std::string const& parentId, std::optional<ResourceType> type = std::nullopt) const
            -> std::vector<ResourcePtr> = 0;

    /** @brief Depth-first, creation-ordered descendants of rootId (the root itself excluded). */
    [[nodiscard]] virtual auto queryDescendants(std::string const& rootId, DescendantQuery const& query) const
            -> std::vector<ResourcePtr> = 0;

    /** @brief Resource id of the registration record of a CSE-ID. */
    [[nodiscard]] virtual auto resolveCseId(std::string const& cseId) const -> std::optional<std::string> = 0;

    [[nodiscard]] virtual auto size() const -> std::size_t = 0;
};

} // namespace M2M
