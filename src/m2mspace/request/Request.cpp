#include "request/Request.hpp"

namespace M2M {

auto responseToJson(Response const& response) -> Json {
    Json out{{"rsc", static_cast<int>(response.status)}};
    if (response.content)
        out["pc"] = *response.content;
    if (response.debugMessage)
        out["dbg"] = *response.debugMessage;
    return out;
}

} // namespace M2M
