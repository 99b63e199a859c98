#pragma once
#include "core/Error.hpp"
#include "core/ResponseStatusCode.hpp"
#include "core/Types.hpp"
#include "request/RequestArguments.hpp"
#include "resource/Resource.hpp"

#include <optional>
#include <string>
#include <vector>

namespace M2M {

/**
 * @brief One inbound operation, already stripped of any transport framing.
 */
struct Request {
    Operation                   operation{Operation::Retrieve};
    std::string                 to;
    std::string                 originator;
    std::optional<std::string>  contentType;
    std::optional<ResourceType> resourceType;
    std::optional<Json>         content;
    RequestArguments            arguments;
    // Fan-out points this request was expanded from, outermost first
    std::vector<std::string>    fanOutTrail;
};

struct Response {
    ResponseStatusCode         status{ResponseStatusCode::OK};
    std::optional<Json>        content;
    std::optional<std::string> debugMessage;

    [[nodiscard]] auto ok() const -> bool { return isSuccess(this->status); }

    [[nodiscard]] static auto fromError(Error const& error) -> Response {
        return Response{statusCodeFor(error.code), std::nullopt, error.message};
    }

    [[nodiscard]] static auto withContent(ResponseStatusCode status, Json content) -> Response {
        return Response{status, std::move(content), std::nullopt};
    }
};

/** @brief Serialized form {"rsc", "pc"?, "dbg"?} used by tools and fan-out aggregation. */
[[nodiscard]] auto responseToJson(Response const& response) -> Json;

} // namespace M2M
