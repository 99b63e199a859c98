#pragma once
#include "core/Error.hpp"
#include "resource/Resource.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace M2M {

/**
 * @brief Build a new, not yet persisted resource from a request payload.
 *
 * The payload is either wrapped in a single key naming the type tag
 * ({"m2m:cnt": {...}}) or carries the attributes directly. The tag, an
 * embedded "ty" and the declared type must agree. Virtual types cannot be
 * created from payloads.
 *
 * @param parentId id of the parent; empty for the tree root
 * @param expirationSeconds lifetime used when the payload carries no "et"
 */
[[nodiscard]] auto ResourceFromJson(Json const&        payload,
                                    ResourceType       declaredType,
                                    std::string const& parentId,
                                    std::int64_t       expirationSeconds) -> Expected<Resource>;

/**
 * @brief Build the fixed-name virtual child ("la", "ol", "fopt") of a parent.
 */
[[nodiscard]] auto MakeVirtualResource(ResourceType type, Resource const& parent) -> Expected<Resource>;

[[nodiscard]] auto UniqueResourceId(std::string_view prefix) -> std::string;

[[nodiscard]] auto UniqueAEI(std::string_view prefix) -> std::string;

/**
 * @brief Structured path of a child: parent path + "/" + name, or the name alone at the root.
 */
[[nodiscard]] auto ChildStructuredPath(std::string const& parentPath, std::string const& name) -> std::string;

} // namespace M2M
