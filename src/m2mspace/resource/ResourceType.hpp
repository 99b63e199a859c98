#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace M2M {

/**
 * @brief Closed enumeration of the resource variants known to the engine.
 *
 * Positive values are the oneM2M resource type numbers; negative values are
 * the virtual, non-stored types addressed below their parent.
 */
enum class ResourceType : int {
    Unknown   = 0,
    ACP       = 1,
    AE        = 2,
    CNT       = 3,
    CIN       = 4,
    CSEBase   = 5,
    GRP       = 9,
    MgmtObj   = 13,
    NOD       = 14,
    CSR       = 16,
    REQ       = 17,
    SUB       = 23,
    FCNT      = 28,
    FCI       = 58,
    CNT_LA    = -20001,
    CNT_OL    = -20002,
    GRP_FOPT  = -20003,
    FCNT_LA   = -20004,
    FCNT_OL   = -20005
};

struct ResourceTypeTraits {
    ResourceType     type;
    std::string_view tag;
    std::string_view shortName;
    std::string_view idPrefix;
    bool             isVirtual;
    bool             readOnly;
    // Access control is taken from the parent instead of an own acpi
    bool             inheritsAccessControl;
};

[[nodiscard]] auto resourceTypeTraits(ResourceType type) -> ResourceTypeTraits const&;

[[nodiscard]] auto resourceTypeFromInt(int value) -> std::optional<ResourceType>;

[[nodiscard]] auto resourceTypeFromTag(std::string_view tag) -> std::optional<ResourceType>;

[[nodiscard]] auto isVirtualType(ResourceType type) -> bool;

[[nodiscard]] auto isLatestOldestType(ResourceType type) -> bool;

[[nodiscard]] auto toInt(ResourceType type) -> int;

/**
 * @brief Type tag of a management object selected by its mgd specialization.
 */
[[nodiscard]] auto mgmtObjTagFor(int mgd) -> std::optional<std::string_view>;

[[nodiscard]] auto isMgmtObjTag(std::string_view tag) -> bool;

/**
 * @brief FlexContainer and its instances use custom "domain:name" tags.
 */
[[nodiscard]] auto isCustomTag(std::string_view tag) -> bool;

} // namespace M2M
