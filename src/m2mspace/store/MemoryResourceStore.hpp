#pragma once
#include "store/ResourceStore.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace M2M {

struct TransparentStringHash {
    using is_transparent = void;

    auto operator()(std::string_view value) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(value);
    }
};

/**
 * In-process resource store.
 *
 * - Records are immutable snapshots swapped on write.
 * - Indices (records by id, id by structured path, id by CSE-ID, children by
 *   parent) are phmap::parallel_node_hash_map instances with internal sharding
 *   and a std::mutex per submap.
 * - Cross-index consistency for a single record is established in the order
 *   records -> paths -> cse ids -> children on create, reversed on remove.
 */
class MemoryResourceStore final : public ResourceStore {
public:
    static constexpr int DefaultSubmaps = 12;

    template <typename Value>
    using Index = phmap::parallel_node_hash_map<std::string,
                                                Value,
                                                TransparentStringHash,
                                                std::equal_to<>,
                                                std::allocator<std::pair<const std::string, Value>>,
                                                DefaultSubmaps,
                                                std::mutex>;

    MemoryResourceStore()  = default;
    ~MemoryResourceStore() override = default;

    MemoryResourceStore(MemoryResourceStore const&)            = delete;
    MemoryResourceStore& operator=(MemoryResourceStore const&) = delete;

    [[nodiscard]] auto get(std::string const& resourceId) const -> ResourcePtr override;
    [[nodiscard]] auto getByPath(std::string const& structuredPath) const -> ResourcePtr override;
    [[nodiscard]] auto exists(std::string const& resourceId, std::string const& structuredPath) const -> bool override;

    auto create(Resource resource) -> Expected<ResourcePtr> override;
    auto put(Resource resource) -> Expected<ResourcePtr> override;
    auto remove(std::string const& resourceId) -> Expected<void> override;

    [[nodiscard]] auto children(std::string const& parentId, std::optional<ResourceType> type = std::nullopt) const
            -> std::vector<ResourcePtr> override;
    [[nodiscard]] auto queryDescendants(std::string const& rootId, DescendantQuery const& query) const
            -> std::vector<ResourcePtr> override;
    [[nodiscard]] auto resolveCseId(std::string const& cseId) const -> std::optional<std::string> override;
    [[nodiscard]] auto size() const -> std::size_t override;

private:
    [[nodiscard]] auto childIds(std::string const& parentId) const -> std::vector<std::string>;

    Index<ResourcePtr>              records_;
    Index<std::string>              paths_;
    Index<std::string>              cseIds_;
    Index<std::vector<std::string>> children_;
};

} // namespace M2M
