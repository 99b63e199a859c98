#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace M2M {

/**
 * @brief Identity and feature switches of one CSE instance.
 *
 * Passed by value into the dispatcher and its collaborators at construction;
 * nothing in the engine reads configuration from global state.
 */
struct CseOptions {
    std::string              cseId{"/id-in"};
    std::string              cseResourceId{"id-in"};
    std::string              cseResourceName{"cse-in"};
    std::string              spId{"acme.example.com"};
    std::string              adminOriginator{"CAdmin"};
    bool                     enableTransitRequests{false};
    bool                     enableAcpChecks{true};
    std::vector<std::string> allowedAEOriginators{"C*", "S*"};
    std::vector<std::string> allowedCSROriginators{};
    std::int64_t             defaultExpirationSeconds{60 * 60 * 24 * 365};
    std::int64_t             maxDiscoveryLevel{0};
    std::int64_t             defaultDiscoveryLimit{0};
    std::int64_t             maxNumberOfInstances{0};
};

bool ApplyCseEnvOverrides(CseOptions& options);

auto ValidateCseOptions(CseOptions const& options) -> std::optional<std::string>;

[[nodiscard]] auto SplitOriginatorPatterns(std::string_view list) -> std::vector<std::string>;

} // namespace M2M
