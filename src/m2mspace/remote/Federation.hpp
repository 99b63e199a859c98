#pragma once
#include "request/Request.hpp"

#include <string>

namespace M2M {

/**
 * @brief Forwarding of requests whose target lives on another CSE.
 */
class Federation {
public:
    virtual ~Federation() = default;

    [[nodiscard]] virtual auto isRemoteTarget(std::string const& cseId) const -> bool = 0;

    /**
     * @brief Forward the request unchanged; the response is returned verbatim.
     * @param cseId target CSE-ID with leading '/'
     */
    virtual auto forward(Request const& request, std::string const& cseId) -> Response = 0;
};

} // namespace M2M
