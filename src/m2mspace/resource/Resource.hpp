#pragma once
#include "resource/ResourceType.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace M2M {

using Json = nlohmann::json;

/**
 * @brief A typed node of the resource tree.
 *
 * Attributes are kept as a flat JSON object without the type-tag wrapper.
 * Keys starting with "__" are internal bookkeeping (structured path,
 * creating originator) and never leave the engine.
 */
class Resource {
public:
    static constexpr std::string_view StructuredPathKey = "__srn__";
    static constexpr std::string_view OriginatorKey     = "__originator__";

    Resource() = default;
    Resource(ResourceType type, std::string tag, Json attributes);

    [[nodiscard]] auto type() const -> ResourceType { return this->type_; }
    [[nodiscard]] auto tag() const -> std::string const& { return this->tag_; }

    [[nodiscard]] auto ri() const -> std::string;
    [[nodiscard]] auto rn() const -> std::string;
    [[nodiscard]] auto parentId() const -> std::optional<std::string>;
    [[nodiscard]] auto structuredPath() const -> std::string;
    [[nodiscard]] auto acpi() const -> std::vector<std::string>;
    [[nodiscard]] auto labels() const -> std::vector<std::string>;
    [[nodiscard]] auto originator() const -> std::string;

    [[nodiscard]] auto isVirtual() const -> bool;
    [[nodiscard]] auto readOnly() const -> bool;
    [[nodiscard]] auto inheritsAccessControl() const -> bool;

    [[nodiscard]] auto hasAttribute(std::string_view key) const -> bool;
    [[nodiscard]] auto attribute(std::string_view key) const -> Json const*;
    [[nodiscard]] auto stringAttribute(std::string_view key) const -> std::optional<std::string>;
    [[nodiscard]] auto intAttribute(std::string_view key) const -> std::optional<std::int64_t>;

    auto setAttribute(std::string_view key, Json value, bool overwrite = true) -> void;
    auto removeAttribute(std::string_view key) -> void;
    auto setStructuredPath(std::string path) -> void;
    auto setOriginator(std::string originator) -> void;

    [[nodiscard]] auto attributes() const -> Json const& { return this->attributes_; }
    [[nodiscard]] auto attributes() -> Json& { return this->attributes_; }

    /**
     * @brief Public representation.
     * @param embedded wrap the attributes in a single-key object keyed by the type tag
     */
    [[nodiscard]] auto toJson(bool embedded = true) const -> Json;

    [[nodiscard]] static auto isInternalAttribute(std::string_view key) -> bool;

private:
    ResourceType type_{ResourceType::Unknown};
    std::string  tag_;
    Json         attributes_ = Json::object();
};

/**
 * @brief Attributes whose values changed or are newly present in `after`,
 *        skipping internal attributes.
 */
[[nodiscard]] auto attributeDiff(Json const& before, Json const& after) -> Json;

} // namespace M2M
