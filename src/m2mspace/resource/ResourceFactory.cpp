#include "resource/ResourceFactory.hpp"
#include "core/Timestamp.hpp"
#include "log/TaggedLogger.hpp"

#include <random>

namespace M2M {

namespace {

auto random_suffix(std::size_t length) -> std::string {
    static constexpr std::string_view alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937_64      engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);

    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i)
        out.push_back(alphabet[pick(engine)]);
    return out;
}

struct Unwrapped {
    std::string tag;
    Json        attributes;
};

auto unwrap(Json const& payload) -> Unwrapped {
    if (payload.size() == 1) {
        auto it = payload.begin();
        if (it.key() != "pi" && it.value().is_object())
            return Unwrapped{it.key(), it.value()};
    }
    return Unwrapped{std::string{}, payload};
}

auto resolve_type(Unwrapped const& unwrapped, ResourceType declaredType) -> Expected<ResourceType> {
    auto type = declaredType;

    if (!unwrapped.tag.empty()) {
        if (auto const fromTag = resourceTypeFromTag(unwrapped.tag)) {
            if (type != ResourceType::Unknown && type != *fromTag)
                return std::unexpected(Error{Error::Code::BadRequest, "type tag " + unwrapped.tag + " does not match declared type"});
            type = *fromTag;
        } else if (isCustomTag(unwrapped.tag)) {
            if (type != ResourceType::FCNT && type != ResourceType::FCI)
                return std::unexpected(Error{Error::Code::BadRequest, "custom tag " + unwrapped.tag + " requires a flexContainer type"});
        } else {
            return std::unexpected(Error{Error::Code::BadRequest, "unknown type tag " + unwrapped.tag});
        }
    }

    if (auto ty = unwrapped.attributes.find("ty"); ty != unwrapped.attributes.end() && !ty->is_null()) {
        if (!ty->is_number_integer())
            return std::unexpected(Error{Error::Code::BadRequest, "ty must be an integer"});
        auto const embedded = resourceTypeFromInt(ty->get<int>());
        if (!embedded)
            return std::unexpected(Error{Error::Code::BadRequest, "unknown resource type " + ty->dump()});
        if (type != ResourceType::Unknown && type != *embedded)
            return std::unexpected(Error{Error::Code::BadRequest, "ty does not match declared type"});
        type = *embedded;
    }

    if (type == ResourceType::Unknown)
        return std::unexpected(Error{Error::Code::BadRequest, "resource type could not be determined"});
    return type;
}

auto resolve_tag(ResourceType type, Unwrapped const& unwrapped) -> Expected<std::string> {
    auto const& traits = resourceTypeTraits(type);
    if (type == ResourceType::MgmtObj) {
        auto mgd = unwrapped.attributes.find("mgd");
        if (mgd == unwrapped.attributes.end() || !mgd->is_number_integer())
            return std::unexpected(Error{Error::Code::BadRequest, "management object requires mgd"});
        auto const tag = mgmtObjTagFor(mgd->get<int>());
        if (!tag)
            return std::unexpected(Error{Error::Code::BadRequest, "unsupported mgd " + mgd->dump()});
        if (!unwrapped.tag.empty() && unwrapped.tag != *tag)
            return std::unexpected(Error{Error::Code::BadRequest, "type tag does not match mgd"});
        return std::string{*tag};
    }
    if (type == ResourceType::FCNT || type == ResourceType::FCI) {
        if (unwrapped.tag.empty() || !isCustomTag(unwrapped.tag))
            return std::unexpected(Error{Error::Code::BadRequest, "flexContainer payload requires a custom type tag"});
        return unwrapped.tag;
    }
    return std::string{traits.tag};
}

} // namespace

auto UniqueResourceId(std::string_view prefix) -> std::string {
    std::string id{prefix};
    id.append(random_suffix(10));
    return id;
}

auto UniqueAEI(std::string_view prefix) -> std::string {
    std::string id{prefix};
    id.append(random_suffix(12));
    return id;
}

auto ChildStructuredPath(std::string const& parentPath, std::string const& name) -> std::string {
    if (parentPath.empty())
        return name;
    return parentPath + "/" + name;
}

auto ResourceFromJson(Json const&        payload,
                      ResourceType       declaredType,
                      std::string const& parentId,
                      std::int64_t       expirationSeconds) -> Expected<Resource> {
    if (!payload.is_object() || payload.empty())
        return std::unexpected(Error{Error::Code::BadRequest, "payload must be a non-empty object"});

    auto const unwrapped = unwrap(payload);
    if (!unwrapped.attributes.is_object())
        return std::unexpected(Error{Error::Code::BadRequest, "resource attributes must be an object"});

    auto type = resolve_type(unwrapped, declaredType);
    if (!type)
        return std::unexpected(type.error());
    if (isVirtualType(*type))
        return std::unexpected(Error{Error::Code::BadRequest, "virtual resources cannot be created"});

    auto tag = resolve_tag(*type, unwrapped);
    if (!tag)
        return std::unexpected(tag.error());

    Json attributes = Json::object();
    for (auto const& [key, value] : unwrapped.attributes.items()) {
        if (Resource::isInternalAttribute(key))
            continue;
        attributes[key] = value;
    }

    auto const& traits = resourceTypeTraits(*type);
    if (auto ri = attributes.find("ri"); ri == attributes.end() || !ri->is_string() || ri->get<std::string>().empty())
        attributes["ri"] = UniqueResourceId(traits.idPrefix);
    if (auto rn = attributes.find("rn"); rn == attributes.end() || !rn->is_string() || rn->get<std::string>().empty())
        attributes["rn"] = attributes["ri"];

    auto const name = attributes["rn"].get<std::string>();
    if (name.find('/') != std::string::npos || name == "~" || name == "_")
        return std::unexpected(Error{Error::Code::BadRequest, "invalid resource name " + name});

    attributes["ty"] = toInt(*type);
    if (parentId.empty())
        attributes.erase("pi");
    else
        attributes["pi"] = parentId;

    auto const now = timestampNow();
    attributes["ct"] = now;
    attributes["lt"] = now;
    if (auto et = attributes.find("et"); et == attributes.end() || !et->is_string())
        attributes["et"] = timestampAfter(expirationSeconds);

    m2m_log("Constructed " + std::string{traits.shortName} + " " + attributes["ri"].get<std::string>(), "Resource");
    return Resource{*type, std::move(*tag), std::move(attributes)};
}

auto MakeVirtualResource(ResourceType type, Resource const& parent) -> Expected<Resource> {
    std::string name;
    switch (type) {
    case ResourceType::CNT_LA:
    case ResourceType::FCNT_LA:
        name = "la";
        break;
    case ResourceType::CNT_OL:
    case ResourceType::FCNT_OL:
        name = "ol";
        break;
    case ResourceType::GRP_FOPT:
        name = "fopt";
        break;
    default:
        return std::unexpected(Error{Error::Code::InternalServerError, "not a virtual resource type"});
    }

    auto const& traits = resourceTypeTraits(type);
    auto const  now    = timestampNow();
    Json        attributes{
            {"ri", UniqueResourceId(traits.idPrefix)},
            {"rn", name},
            {"pi", parent.ri()},
            {"ty", toInt(type)},
            {"ct", now},
            {"lt", now},
    };
    if (auto const* et = parent.attribute("et"))
        attributes["et"] = *et;

    Resource resource{type, std::string{traits.tag}, std::move(attributes)};
    resource.setStructuredPath(ChildStructuredPath(parent.structuredPath(), name));
    return resource;
}

} // namespace M2M
