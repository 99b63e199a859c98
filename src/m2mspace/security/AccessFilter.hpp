#pragma once
#include "core/Types.hpp"
#include "resource/Resource.hpp"

#include <optional>
#include <string>

namespace M2M {

struct AccessContext {
    bool                        isCreateRequest{false};
    std::optional<ResourceType> childType;
    // Evaluate the resource's own ACP self-privileges instead of its privileges
    bool                        checkSelf{false};
};

/**
 * @brief Decides whether an originator holds a permission on a resource.
 */
class AccessFilter {
public:
    virtual ~AccessFilter() = default;

    [[nodiscard]] virtual auto hasAccess(std::string const&   originator,
                                         Resource const&      resource,
                                         Permission           permission,
                                         AccessContext const& context = {}) const -> bool = 0;
};

} // namespace M2M
