#pragma once
#include "core/Types.hpp"
#include "resource/Resource.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace M2M {

/**
 * @brief Discovery conditions evaluated against persisted attribute values.
 *
 * Resource-type and content-type lists are OR'd internally. All other set
 * conditions, including each attribute predicate, are combined with
 * filterOperation. Unset conditions are ignored; no conditions match everything.
 */
struct FilterCriteria {
    std::optional<std::string>  createdBefore;     // crb: ct < value
    std::optional<std::string>  createdAfter;      // cra: ct > value
    std::optional<std::string>  modifiedSince;     // ms:  lt > value
    std::optional<std::string>  unmodifiedSince;   // us:  lt < value
    std::optional<std::int64_t> stateTagSmaller;   // sts: st < value
    std::optional<std::int64_t> stateTagBigger;    // stb: st > value
    std::optional<std::string>  expireBefore;      // exb: et < value
    std::optional<std::string>  expireAfter;       // exa: et > value
    std::vector<std::string>    labels;            // lbl: any label shared
    std::vector<std::string>    labelsQuery;       // lbq: all listed labels present
    std::optional<std::int64_t> sizeAbove;         // sza: cs >= value
    std::optional<std::int64_t> sizeBelow;         // szb: cs < value
    std::vector<std::string>    contentTypes;      // cty
    std::vector<ResourceType>   resourceTypes;     // ty
    std::vector<std::pair<std::string, std::string>> attributes;
    FilterOperation             filterOperation{FilterOperation::And};

    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto matches(Resource const& resource) const -> bool;
};

/**
 * @brief Compare an attribute value against a textual predicate; strings may use wildcards.
 */
[[nodiscard]] auto attributeMatches(Json const& value, std::string const& pattern) -> bool;

} // namespace M2M
