#include "discovery/FilterCriteria.hpp"
#include "path/utils.hpp"

#include <algorithm>
#include <charconv>

namespace M2M {

namespace {

// Tri-state result of a single condition: absent conditions do not vote.
enum class Vote {
    Absent,
    Match,
    Miss
};

auto vote(bool matched) -> Vote {
    return matched ? Vote::Match : Vote::Miss;
}

template <typename Compare>
auto compare_string(Resource const& resource, std::string_view key, std::optional<std::string> const& bound, Compare cmp) -> Vote {
    if (!bound)
        return Vote::Absent;
    auto value = resource.stringAttribute(key);
    return vote(value && cmp(*value, *bound));
}

template <typename Compare>
auto compare_int(Resource const& resource, std::string_view key, std::optional<std::int64_t> const& bound, Compare cmp) -> Vote {
    if (!bound)
        return Vote::Absent;
    auto value = resource.intAttribute(key);
    return vote(value && cmp(*value, *bound));
}

auto media_type_of(Resource const& resource) -> std::optional<std::string> {
    auto cnf = resource.stringAttribute("cnf");
    if (!cnf)
        return std::nullopt;
    // contentInfo is "<media type>:<encoding>"
    auto const colon = cnf->find(':');
    return colon == std::string::npos ? *cnf : cnf->substr(0, colon);
}

} // namespace

auto attributeMatches(Json const& value, std::string const& pattern) -> bool {
    if (value.is_string())
        return match_names(pattern, value.get<std::string>());
    if (value.is_boolean())
        return (pattern == "true" && value.get<bool>()) || (pattern == "false" && !value.get<bool>());
    if (value.is_number_integer()) {
        std::int64_t parsed = 0;
        auto result = std::from_chars(pattern.data(), pattern.data() + pattern.size(), parsed);
        return result.ec == std::errc{} && result.ptr == pattern.data() + pattern.size() && parsed == value.get<std::int64_t>();
    }
    if (value.is_array()) {
        return std::any_of(value.begin(), value.end(), [&](Json const& entry) { return attributeMatches(entry, pattern); });
    }
    return value.dump() == pattern;
}

auto FilterCriteria::empty() const -> bool {
    return !createdBefore && !createdAfter && !modifiedSince && !unmodifiedSince && !stateTagSmaller && !stateTagBigger
           && !expireBefore && !expireAfter && labels.empty() && labelsQuery.empty() && !sizeAbove && !sizeBelow
           && contentTypes.empty() && resourceTypes.empty() && attributes.empty();
}

auto FilterCriteria::matches(Resource const& resource) const -> bool {
    std::vector<Vote> votes;
    votes.reserve(16 + this->attributes.size());

    auto const less    = [](auto const& a, auto const& b) { return a < b; };
    auto const greater = [](auto const& a, auto const& b) { return a > b; };

    votes.push_back(compare_string(resource, "ct", this->createdBefore, less));
    votes.push_back(compare_string(resource, "ct", this->createdAfter, greater));
    votes.push_back(compare_string(resource, "lt", this->modifiedSince, greater));
    votes.push_back(compare_string(resource, "lt", this->unmodifiedSince, less));
    votes.push_back(compare_int(resource, "st", this->stateTagSmaller, less));
    votes.push_back(compare_int(resource, "st", this->stateTagBigger, greater));
    votes.push_back(compare_string(resource, "et", this->expireBefore, less));
    votes.push_back(compare_string(resource, "et", this->expireAfter, greater));
    votes.push_back(compare_int(resource, "cs", this->sizeAbove, [](auto a, auto b) { return a >= b; }));
    votes.push_back(compare_int(resource, "cs", this->sizeBelow, less));

    if (!this->labels.empty() || !this->labelsQuery.empty()) {
        auto const own = resource.labels();
        auto const has = [&](std::string const& label) { return std::find(own.begin(), own.end(), label) != own.end(); };
        if (!this->labels.empty())
            votes.push_back(vote(std::any_of(this->labels.begin(), this->labels.end(), has)));
        if (!this->labelsQuery.empty())
            votes.push_back(vote(std::all_of(this->labelsQuery.begin(), this->labelsQuery.end(), has)));
    }

    if (!this->resourceTypes.empty()) {
        auto const type = resource.type();
        votes.push_back(vote(std::find(this->resourceTypes.begin(), this->resourceTypes.end(), type) != this->resourceTypes.end()));
    }

    if (!this->contentTypes.empty()) {
        auto const mediaType = media_type_of(resource);
        votes.push_back(vote(mediaType && std::find(this->contentTypes.begin(), this->contentTypes.end(), *mediaType) != this->contentTypes.end()));
    }

    for (auto const& [key, pattern] : this->attributes) {
        auto const* value = resource.attribute(key);
        votes.push_back(vote(value != nullptr && attributeMatches(*value, pattern)));
    }

    bool anyVote  = false;
    bool anyMatch = false;
    bool anyMiss  = false;
    for (auto const v : votes) {
        if (v == Vote::Absent)
            continue;
        anyVote = true;
        if (v == Vote::Match)
            anyMatch = true;
        else
            anyMiss = true;
    }
    if (!anyVote)
        return true;
    return this->filterOperation == FilterOperation::Or ? anyMatch : !anyMiss;
}

} // namespace M2M
