#pragma once
#include <cstdint>
#include <string_view>

namespace M2M {

enum class Operation {
    Retrieve,
    Create,
    Update,
    Delete,
    Notify,
    Discovery
};

/**
 * @brief Access-control operation bits as carried in an ACP rule's acop attribute.
 */
enum class Permission : std::uint8_t {
    None      = 0,
    Create    = 1,
    Retrieve  = 2,
    Update    = 4,
    Delete    = 8,
    Notify    = 16,
    Discovery = 32,
    All       = 63
};

[[nodiscard]] constexpr auto permissionBits(Permission p) -> int {
    return static_cast<int>(p);
}

[[nodiscard]] constexpr auto permissionFor(Operation op) -> Permission {
    switch (op) {
    case Operation::Retrieve:
        return Permission::Retrieve;
    case Operation::Create:
        return Permission::Create;
    case Operation::Update:
        return Permission::Update;
    case Operation::Delete:
        return Permission::Delete;
    case Operation::Notify:
        return Permission::Notify;
    case Operation::Discovery:
        return Permission::Discovery;
    }
    return Permission::None;
}

enum class ResultContent : int {
    Nothing                             = 0,
    Attributes                          = 1,
    AttributesAndChildResources         = 4,
    AttributesAndChildResourceReferences = 5,
    ChildResourceReferences             = 6,
    ChildResources                      = 8,
    ModifiedAttributes                  = 9,
    DiscoveryResultReferences           = 11
};

enum class DesiredIdentifierResultType : int {
    Structured   = 1,
    Unstructured = 2
};

enum class FilterUsage : int {
    Discovery            = 1,
    ConditionalRetrieval = 2
};

enum class FilterOperation : int {
    And = 1,
    Or  = 2
};

[[nodiscard]] constexpr auto operationToString(Operation op) -> std::string_view {
    switch (op) {
    case Operation::Retrieve:
        return "RETRIEVE";
    case Operation::Create:
        return "CREATE";
    case Operation::Update:
        return "UPDATE";
    case Operation::Delete:
        return "DELETE";
    case Operation::Notify:
        return "NOTIFY";
    case Operation::Discovery:
        return "DISCOVERY";
    }
    return "UNKNOWN";
}

} // namespace M2M
