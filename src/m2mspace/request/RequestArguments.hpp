#pragma once
#include "core/Error.hpp"
#include "core/Types.hpp"
#include "discovery/FilterCriteria.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace M2M {

struct FilterHandling {
    std::optional<std::int64_t> limit;   // lim
    std::optional<std::int64_t> level;   // lvl
    std::optional<std::int64_t> offset;  // ofst
    std::optional<std::string>  applicableRelativePath; // arp
};

struct RequestArguments {
    FilterUsage                 filterUsage{FilterUsage::ConditionalRetrieval};
    DesiredIdentifierResultType desiredIdentifierResultType{DesiredIdentifierResultType::Structured};
    ResultContent               resultContent{ResultContent::Attributes};
    FilterHandling              handling;
    FilterCriteria              conditions;
};

using QueryParameters = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Convert transport-neutral query pairs into request arguments.
 *
 * Unknown keys become attribute predicates. "ty" and "cty" may repeat and
 * carry space separated lists. Malformed or out-of-range values report
 * InvalidArguments.
 */
[[nodiscard]] auto ParseRequestArguments(Operation operation, QueryParameters const& query) -> Expected<RequestArguments>;

/** @brief Default result content of an operation when none is given. */
[[nodiscard]] auto DefaultResultContent(Operation operation, FilterUsage filterUsage) -> ResultContent;

} // namespace M2M
