#pragma once
#include "core/Types.hpp"
#include "resource/Resource.hpp"
#include "store/ResourceStore.hpp"

#include <optional>
#include <string>
#include <vector>

namespace M2M {

struct TreeBuildResult {
    // Object whose keys are type tags mapping to arrays of resources
    Json                     tree = Json::object();
    // Entries that could not be placed below the requested root
    std::vector<ResourcePtr> remaining;
};

/**
 * @brief Shapes flat, permission-filtered resource sets into response bodies.
 *
 * The virtual "la"/"ol" children of containers never appear in any output.
 */
class ResultTreeBuilder {
public:
    explicit ResultTreeBuilder(std::string cseId);

    /** @brief {"m2m:uril": [...]} of structured paths or "<cseId>/<ri>". */
    [[nodiscard]] auto uriList(std::vector<ResourcePtr> const& resources, DesiredIdentifierResultType drt) const -> Json;

    /** @brief Reference entries {"nm", "typ", "val"}. */
    [[nodiscard]] auto references(std::vector<ResourcePtr> const& resources, DesiredIdentifierResultType drt) const -> Json;

    /**
     * @brief Attach references as "ch" of the target's public form, or as a
     *        top-level "m2m:ch" when no target is given.
     */
    [[nodiscard]] auto childReferences(std::vector<ResourcePtr> const& resources, Resource const* target, DesiredIdentifierResultType drt) const
            -> Json;

    /**
     * @brief Nested full tree.
     *
     * With a rootId only its direct children start the tree; without one the
     * entries whose parent is not part of the set do. Each level is
     * partitioned by type tag, every placed entry is removed from the pool
     * before recursing, so each resource is placed exactly once.
     */
    [[nodiscard]] auto resourceTree(std::vector<ResourcePtr> pool, std::optional<std::string> const& rootId) const -> TreeBuildResult;

    /** @brief The target's public form with a nested tree merged into its attributes. */
    [[nodiscard]] auto withTree(Resource const& target, Json const& tree) const -> Json;

private:
    std::string cseId_;
};

} // namespace M2M
