#include "config/CseOptions.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <limits>

namespace M2M {

namespace {

template <typename T>
bool parse_integer_in_range(std::string_view text, T min, T max, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    if (value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

bool is_segment(std::string_view value) {
    return !value.empty() && value.find('/') == std::string_view::npos;
}

} // namespace

auto SplitOriginatorPatterns(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> patterns;
    std::size_t              start = 0;
    while (start <= list.size()) {
        auto end = list.find(',', start);
        if (end == std::string_view::npos) {
            end = list.size();
        }
        auto token = list.substr(start, end - start);
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front()))) {
            token.remove_prefix(1);
        }
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
            token.remove_suffix(1);
        }
        if (!token.empty()) {
            patterns.emplace_back(token);
        }
        start = end + 1;
    }
    return patterns;
}

auto ValidateCseOptions(CseOptions const& options) -> std::optional<std::string> {
    if (options.cseId.size() < 2 || options.cseId.front() != '/' || options.cseId.find('/', 1) != std::string::npos) {
        return std::string{"cseId must be a single segment prefixed with '/'"};
    }
    if (!is_segment(options.cseResourceId)) {
        return std::string{"cseResourceId must be a non-empty segment without '/'"};
    }
    if (!is_segment(options.cseResourceName)) {
        return std::string{"cseResourceName must be a non-empty segment without '/'"};
    }
    if (options.cseResourceName == "~" || options.cseResourceName == "_") {
        return std::string{"cseResourceName must not be an addressing prefix"};
    }
    if (options.adminOriginator.empty()) {
        return std::string{"adminOriginator must not be empty"};
    }
    if (options.defaultExpirationSeconds <= 0) {
        return std::string{"defaultExpirationSeconds must be > 0"};
    }
    if (options.maxDiscoveryLevel < 0) {
        return std::string{"maxDiscoveryLevel must be >= 0"};
    }
    if (options.defaultDiscoveryLimit < 0) {
        return std::string{"defaultDiscoveryLimit must be >= 0"};
    }
    if (options.maxNumberOfInstances < 0) {
        return std::string{"maxNumberOfInstances must be >= 0"};
    }
    return std::nullopt;
}

bool ApplyCseEnvOverrides(CseOptions& options) {
    auto apply_segment_env = [&](char const* key, std::string& target) {
        return apply_env(key, [&](std::string_view value) {
            if (!is_segment(value)) {
                std::cerr << key << " must be a non-empty segment without '/'\n";
                return false;
            }
            target = std::string{value};
            return true;
        });
    };

    if (!apply_env("M2M_CSE_ID", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "M2M_CSE_ID must not be empty\n";
                return false;
            }
            options.cseId = value.front() == '/' ? std::string{value} : "/" + std::string{value};
            return true;
        })) {
        return false;
    }

    if (!apply_segment_env("M2M_CSE_RI", options.cseResourceId)) {
        return false;
    }
    if (!apply_segment_env("M2M_CSE_RN", options.cseResourceName)) {
        return false;
    }
    if (!apply_segment_env("M2M_CSE_SPID", options.spId)) {
        return false;
    }

    if (!apply_env("M2M_CSE_ADMIN", [&](std::string_view value) {
            if (value.empty()) {
                std::cerr << "M2M_CSE_ADMIN must not be empty\n";
                return false;
            }
            options.adminOriginator = std::string{value};
            return true;
        })) {
        return false;
    }

    auto apply_bool_env = [&](char const* key, bool& target) {
        return apply_env(key, [&](std::string_view value) {
            auto parsed = parse_bool(value);
            if (!parsed.has_value()) {
                std::cerr << key << " must be a boolean (true/false, 1/0, yes/no)\n";
                return false;
            }
            target = *parsed;
            return true;
        });
    };

    if (!apply_bool_env("M2M_CSE_ENABLE_TRANSIT", options.enableTransitRequests)) {
        return false;
    }
    if (!apply_bool_env("M2M_CSE_ENABLE_ACP_CHECKS", options.enableAcpChecks)) {
        return false;
    }

    if (!apply_env("M2M_CSE_ALLOWED_AE_ORIGINATORS", [&](std::string_view value) {
            options.allowedAEOriginators = SplitOriginatorPatterns(value);
            return true;
        })) {
        return false;
    }

    if (!apply_env("M2M_CSE_EXPIRATION_SECONDS", [&](std::string_view value) {
            std::int64_t parsed = options.defaultExpirationSeconds;
            if (!parse_integer_in_range<std::int64_t>(value, 1, std::numeric_limits<std::int64_t>::max(), parsed)) {
                std::cerr << "M2M_CSE_EXPIRATION_SECONDS must be > 0\n";
                return false;
            }
            options.defaultExpirationSeconds = parsed;
            return true;
        })) {
        return false;
    }

    return true;
}

} // namespace M2M
