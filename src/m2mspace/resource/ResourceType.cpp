#include "resource/ResourceType.hpp"

#include <array>

namespace M2M {

namespace {

constexpr std::array<ResourceTypeTraits, 19> TypeTable{{
        {ResourceType::Unknown, "", "unknown", "unk", false, false, false},
        {ResourceType::ACP, "m2m:acp", "ACP", "acp", false, false, false},
        {ResourceType::AE, "m2m:ae", "AE", "ae", false, false, false},
        {ResourceType::CNT, "m2m:cnt", "CNT", "cnt", false, false, false},
        {ResourceType::CIN, "m2m:cin", "CIN", "cin", false, true, true},
        {ResourceType::CSEBase, "m2m:cb", "CSEBase", "cb", false, false, false},
        {ResourceType::GRP, "m2m:grp", "GRP", "grp", false, false, false},
        {ResourceType::MgmtObj, "m2m:mgo", "MgmtObj", "mgo", false, false, false},
        {ResourceType::NOD, "m2m:nod", "NOD", "nod", false, false, false},
        {ResourceType::CSR, "m2m:csr", "CSR", "csr", false, false, false},
        {ResourceType::REQ, "m2m:req", "REQ", "req", false, false, false},
        {ResourceType::SUB, "m2m:sub", "SUB", "sub", false, false, false},
        {ResourceType::FCNT, "", "FCNT", "fcnt", false, false, false},
        {ResourceType::FCI, "", "FCI", "fci", false, true, true},
        {ResourceType::CNT_LA, "m2m:la", "CNT_LA", "la", true, true, true},
        {ResourceType::CNT_OL, "m2m:ol", "CNT_OL", "ol", true, true, true},
        {ResourceType::GRP_FOPT, "m2m:fopt", "GRP_FOPT", "fopt", true, false, true},
        {ResourceType::FCNT_LA, "m2m:fcla", "FCNT_LA", "fcla", true, true, true},
        {ResourceType::FCNT_OL, "m2m:fcol", "FCNT_OL", "fcol", true, true, true},
}};

struct MgmtObjTag {
    int              mgd;
    std::string_view tag;
};

constexpr std::array<MgmtObjTag, 10> MgmtObjTags{{
        {1001, "m2m:fwr"},
        {1002, "m2m:swr"},
        {1003, "m2m:mem"},
        {1004, "m2m:ani"},
        {1005, "m2m:andi"},
        {1006, "m2m:bat"},
        {1007, "m2m:dvi"},
        {1008, "m2m:dvc"},
        {1009, "m2m:rbo"},
        {1010, "m2m:evl"},
}};

} // namespace

auto resourceTypeTraits(ResourceType type) -> ResourceTypeTraits const& {
    for (auto const& traits : TypeTable) {
        if (traits.type == type)
            return traits;
    }
    return TypeTable.front();
}

auto resourceTypeFromInt(int value) -> std::optional<ResourceType> {
    for (auto const& traits : TypeTable) {
        if (traits.type != ResourceType::Unknown && static_cast<int>(traits.type) == value)
            return traits.type;
    }
    return std::nullopt;
}

auto resourceTypeFromTag(std::string_view tag) -> std::optional<ResourceType> {
    if (tag.empty())
        return std::nullopt;
    for (auto const& traits : TypeTable) {
        if (!traits.tag.empty() && traits.tag == tag)
            return traits.type;
    }
    if (isMgmtObjTag(tag))
        return ResourceType::MgmtObj;
    return std::nullopt;
}

auto isVirtualType(ResourceType type) -> bool {
    return resourceTypeTraits(type).isVirtual;
}

auto isLatestOldestType(ResourceType type) -> bool {
    return type == ResourceType::CNT_LA || type == ResourceType::CNT_OL || type == ResourceType::FCNT_LA
           || type == ResourceType::FCNT_OL;
}

auto toInt(ResourceType type) -> int {
    return static_cast<int>(type);
}

auto mgmtObjTagFor(int mgd) -> std::optional<std::string_view> {
    for (auto const& entry : MgmtObjTags) {
        if (entry.mgd == mgd)
            return entry.tag;
    }
    return std::nullopt;
}

auto isMgmtObjTag(std::string_view tag) -> bool {
    for (auto const& entry : MgmtObjTags) {
        if (entry.tag == tag)
            return true;
    }
    return false;
}

auto isCustomTag(std::string_view tag) -> bool {
    auto const colon = tag.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == tag.size())
        return false;
    return tag.substr(0, colon) != "m2m";
}

} // namespace M2M
