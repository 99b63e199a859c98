#include "resource/Resource.hpp"

namespace M2M {

namespace {

auto stringList(Json const* value) -> std::vector<std::string> {
    std::vector<std::string> out;
    if (value == nullptr || !value->is_array())
        return out;
    for (auto const& entry : *value) {
        if (entry.is_string())
            out.push_back(entry.get<std::string>());
    }
    return out;
}

} // namespace

Resource::Resource(ResourceType type, std::string tag, Json attributes)
    : type_(type), tag_(std::move(tag)), attributes_(std::move(attributes)) {
    if (!this->attributes_.is_object())
        this->attributes_ = Json::object();
}

auto Resource::ri() const -> std::string {
    return this->stringAttribute("ri").value_or(std::string{});
}

auto Resource::rn() const -> std::string {
    return this->stringAttribute("rn").value_or(std::string{});
}

auto Resource::parentId() const -> std::optional<std::string> {
    auto pi = this->stringAttribute("pi");
    if (!pi || pi->empty())
        return std::nullopt;
    return pi;
}

auto Resource::structuredPath() const -> std::string {
    return this->stringAttribute(StructuredPathKey).value_or(std::string{});
}

auto Resource::acpi() const -> std::vector<std::string> {
    return stringList(this->attribute("acpi"));
}

auto Resource::labels() const -> std::vector<std::string> {
    return stringList(this->attribute("lbl"));
}

auto Resource::originator() const -> std::string {
    return this->stringAttribute(OriginatorKey).value_or(std::string{});
}

auto Resource::isVirtual() const -> bool {
    return resourceTypeTraits(this->type_).isVirtual;
}

auto Resource::readOnly() const -> bool {
    return resourceTypeTraits(this->type_).readOnly;
}

auto Resource::inheritsAccessControl() const -> bool {
    return resourceTypeTraits(this->type_).inheritsAccessControl;
}

auto Resource::hasAttribute(std::string_view key) const -> bool {
    return this->attribute(key) != nullptr;
}

auto Resource::attribute(std::string_view key) const -> Json const* {
    auto it = this->attributes_.find(std::string{key});
    if (it == this->attributes_.end() || it->is_null())
        return nullptr;
    return &*it;
}

auto Resource::stringAttribute(std::string_view key) const -> std::optional<std::string> {
    auto const* value = this->attribute(key);
    if (value == nullptr || !value->is_string())
        return std::nullopt;
    return value->get<std::string>();
}

auto Resource::intAttribute(std::string_view key) const -> std::optional<std::int64_t> {
    auto const* value = this->attribute(key);
    if (value == nullptr || !value->is_number_integer())
        return std::nullopt;
    return value->get<std::int64_t>();
}

auto Resource::setAttribute(std::string_view key, Json value, bool overwrite) -> void {
    std::string const name{key};
    if (!overwrite && this->attributes_.contains(name))
        return;
    this->attributes_[name] = std::move(value);
}

auto Resource::removeAttribute(std::string_view key) -> void {
    this->attributes_.erase(std::string{key});
}

auto Resource::setStructuredPath(std::string path) -> void {
    this->setAttribute(StructuredPathKey, std::move(path));
}

auto Resource::setOriginator(std::string originator) -> void {
    this->setAttribute(OriginatorKey, std::move(originator));
}

auto Resource::toJson(bool embedded) const -> Json {
    Json visible = Json::object();
    for (auto const& [key, value] : this->attributes_.items()) {
        if (!isInternalAttribute(key))
            visible[key] = value;
    }
    if (!embedded)
        return visible;
    Json wrapped = Json::object();
    wrapped[this->tag_] = std::move(visible);
    return wrapped;
}

auto Resource::isInternalAttribute(std::string_view key) -> bool {
    return key.starts_with("__");
}

auto attributeDiff(Json const& before, Json const& after) -> Json {
    Json diff = Json::object();
    if (!after.is_object())
        return diff;
    bool const hasBefore = before.is_object();
    for (auto const& [key, value] : after.items()) {
        if (Resource::isInternalAttribute(key))
            continue;
        if (!hasBefore || !before.contains(key) || before.at(key) != value)
            diff[key] = value;
    }
    return diff;
}

} // namespace M2M
