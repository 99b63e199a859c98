#pragma once
#include "config/CseOptions.hpp"
#include "core/Error.hpp"
#include "discovery/FilterCriteria.hpp"
#include "request/RequestArguments.hpp"
#include "store/ResourceStore.hpp"

#include <vector>

namespace M2M {

/**
 * @brief Evaluates filter criteria below a root resource.
 *
 * Returns matches in depth-first creation order. Permission filtering is the
 * caller's responsibility.
 */
class DiscoveryEngine {
public:
    DiscoveryEngine(CseOptions const& options, ResourceStore const& store);

    [[nodiscard]] auto discover(Resource const& root, FilterHandling const& handling, FilterCriteria const& conditions) const
            -> Expected<std::vector<ResourcePtr>>;

private:
    [[nodiscard]] auto applyRelativePath(std::vector<ResourcePtr> matches, std::string const& relativePath) const
            -> std::vector<ResourcePtr>;

    std::int64_t         maxLevel_;
    std::int64_t         defaultLimit_;
    ResourceStore const& store_;
};

} // namespace M2M
