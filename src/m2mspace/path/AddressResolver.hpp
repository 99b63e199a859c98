#pragma once
#include "config/CseOptions.hpp"
#include "core/Error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace M2M {

class ResourceStore;

enum class AddressingMode {
    CseRelative,
    SpRelative,
    Absolute
};

/**
 * @brief Result of parsing an address without consulting the store.
 *
 * Exactly one of resourceId and structuredPath is set. cseId is the target
 * CSE-ID with a leading '/' (the local one for CSE-relative addresses).
 */
struct ParsedAddress {
    AddressingMode mode{AddressingMode::CseRelative};
    std::string    resourceId;
    std::string    structuredPath;
    std::string    cseId;
    std::string    spId;
    bool           remote{false};
};

struct ResolvedAddress {
    std::string resourceId;
    std::string cseId;
    std::string structuredPath;
    bool        remote{false};

    [[nodiscard]] auto empty() const -> bool { return this->resourceId.empty() && this->structuredPath.empty(); }
};

[[nodiscard]] auto addressingModeOf(std::string_view address) -> AddressingMode;

/** @brief Number of segments of an unstructured address in the given mode. */
[[nodiscard]] auto minimumSegments(AddressingMode mode) -> std::size_t;

/** @brief True when the address has more segments than its mode's minimum. */
[[nodiscard]] auto isStructured(std::string_view address) -> bool;

/**
 * @brief Turns external addresses into (resource id, CSE-ID, structured path).
 *
 * Three addressing modes are recognised after stripping one leading '/':
 * - SP-relative  "~/<csi>/<ri>" or "~/<csi>/<cse rn>/..."
 * - Absolute     "_/<spid>/<csi>/<ri>" or "_/<spid>/<csi>/<cse rn>/..."
 * - CSE-relative "<ri>" or "<cse rn>/..."
 *
 * Addresses of another CSE are not looked up locally; for those, exactly the
 * minimum segment count yields a resource id and anything longer a structured
 * path relative to the remote CSE.
 */
class AddressResolver {
public:
    AddressResolver(CseOptions const& options, ResourceStore const& store);

    [[nodiscard]] auto parse(std::string_view address) const -> Expected<ParsedAddress>;

    /**
     * @brief Parse and map a local structured path to its resource id.
     *
     * A structured path that is not bound to a resource keeps an empty
     * resourceId; callers decide whether that is NotFound or a virtual route.
     */
    [[nodiscard]] auto resolve(std::string_view address) const -> Expected<ResolvedAddress>;

private:
    [[nodiscard]] auto isLocalCse(std::string_view cseId) const -> bool;

    std::string          cseId_;
    std::string          cseResourceId_;
    std::string          cseResourceName_;
    ResourceStore const& store_;
};

} // namespace M2M
