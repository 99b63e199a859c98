#include "request/RequestArguments.hpp"

#include <charconv>
#include <limits>
#include <string_view>

namespace M2M {

namespace {

auto invalid(std::string const& key, std::string const& value) -> Error {
    return Error{Error::Code::InvalidArguments, "invalid value for " + key + ": " + value};
}

auto parse_int(std::string const& key, std::string const& value) -> Expected<std::int64_t> {
    std::int64_t parsed = 0;
    auto         result = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || result.ec != std::errc{} || result.ptr != value.data() + value.size())
        return std::unexpected(invalid(key, value));
    return parsed;
}

auto parse_non_negative(std::string const& key, std::string const& value) -> Expected<std::int64_t> {
    auto parsed = parse_int(key, value);
    if (parsed && *parsed < 0)
        return std::unexpected(invalid(key, value));
    return parsed;
}

auto split_spaces(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> out;
    std::size_t              pos = 0;
    while (pos < text.size()) {
        auto const start = text.find_first_not_of(' ', pos);
        if (start == std::string_view::npos)
            break;
        auto const end = text.find(' ', start);
        out.emplace_back(text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start));
        pos = end == std::string_view::npos ? text.size() : end;
    }
    return out;
}

auto is_result_content(std::int64_t value) -> bool {
    switch (value) {
    case 0:
    case 1:
    case 4:
    case 5:
    case 6:
    case 8:
    case 9:
    case 11:
        return true;
    default:
        return false;
    }
}

} // namespace

auto DefaultResultContent(Operation operation, FilterUsage filterUsage) -> ResultContent {
    if (operation == Operation::Retrieve && filterUsage == FilterUsage::Discovery)
        return ResultContent::ChildResourceReferences;
    return ResultContent::Attributes;
}

auto ParseRequestArguments(Operation operation, QueryParameters const& query) -> Expected<RequestArguments> {
    RequestArguments             args;
    std::optional<ResultContent> resultContent;
    auto&                        fc = args.conditions;

    for (auto const& [key, value] : query) {
        if (key == "fu") {
            auto parsed = parse_int(key, value);
            if (!parsed || (*parsed != 1 && *parsed != 2))
                return std::unexpected(invalid(key, value));
            args.filterUsage = static_cast<FilterUsage>(*parsed);
        } else if (key == "drt") {
            auto parsed = parse_int(key, value);
            if (!parsed || (*parsed != 1 && *parsed != 2))
                return std::unexpected(invalid(key, value));
            args.desiredIdentifierResultType = static_cast<DesiredIdentifierResultType>(*parsed);
        } else if (key == "rcn") {
            auto parsed = parse_int(key, value);
            if (!parsed || !is_result_content(*parsed))
                return std::unexpected(invalid(key, value));
            resultContent = static_cast<ResultContent>(*parsed);
        } else if (key == "fo") {
            auto parsed = parse_int(key, value);
            if (!parsed || (*parsed != 1 && *parsed != 2))
                return std::unexpected(invalid(key, value));
            fc.filterOperation = static_cast<FilterOperation>(*parsed);
        } else if (key == "lim" || key == "lvl" || key == "ofst") {
            auto parsed = parse_non_negative(key, value);
            if (!parsed)
                return std::unexpected(parsed.error());
            if (key == "lim")
                args.handling.limit = *parsed;
            else if (key == "lvl")
                args.handling.level = *parsed;
            else
                args.handling.offset = *parsed;
        } else if (key == "arp") {
            if (value.empty() || value.front() == '/')
                return std::unexpected(invalid(key, value));
            args.handling.applicableRelativePath = value;
        } else if (key == "crb") {
            fc.createdBefore = value;
        } else if (key == "cra") {
            fc.createdAfter = value;
        } else if (key == "ms") {
            fc.modifiedSince = value;
        } else if (key == "us") {
            fc.unmodifiedSince = value;
        } else if (key == "exb") {
            fc.expireBefore = value;
        } else if (key == "exa") {
            fc.expireAfter = value;
        } else if (key == "sts" || key == "stb" || key == "sza" || key == "szb") {
            auto parsed = parse_non_negative(key, value);
            if (!parsed)
                return std::unexpected(parsed.error());
            if (key == "sts")
                fc.stateTagSmaller = *parsed;
            else if (key == "stb")
                fc.stateTagBigger = *parsed;
            else if (key == "sza")
                fc.sizeAbove = *parsed;
            else
                fc.sizeBelow = *parsed;
        } else if (key == "lbl") {
            for (auto& label : split_spaces(value))
                fc.labels.push_back(std::move(label));
        } else if (key == "lbq") {
            for (auto& label : split_spaces(value))
                fc.labelsQuery.push_back(std::move(label));
        } else if (key == "cty") {
            for (auto& type : split_spaces(value))
                fc.contentTypes.push_back(std::move(type));
        } else if (key == "ty") {
            for (auto const& token : split_spaces(value)) {
                auto parsed = parse_int(key, token);
                if (!parsed)
                    return std::unexpected(parsed.error());
                auto type = resourceTypeFromInt(static_cast<int>(*parsed));
                if (!type)
                    return std::unexpected(invalid(key, token));
                fc.resourceTypes.push_back(*type);
            }
        } else {
            fc.attributes.emplace_back(key, value);
        }
    }

    args.resultContent = resultContent.value_or(DefaultResultContent(operation, args.filterUsage));
    return args;
}

} // namespace M2M
