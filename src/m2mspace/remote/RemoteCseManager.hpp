#pragma once
#include "config/CseOptions.hpp"
#include "remote/Federation.hpp"
#include "store/ResourceStore.hpp"

#include <functional>

namespace M2M {

/**
 * @brief Transport used to deliver a forwarded request to a registered remote CSE.
 */
using RequestSender = std::function<Response(Resource const& remoteCse, Request const& request)>;

class RemoteCseManager final : public Federation {
public:
    RemoteCseManager(CseOptions options, ResourceStore const& store, RequestSender sender = {});

    [[nodiscard]] auto isRemoteTarget(std::string const& cseId) const -> bool override;
    auto forward(Request const& request, std::string const& cseId) -> Response override;

private:
    CseOptions           options_;
    ResourceStore const& store_;
    RequestSender        sender_;
};

} // namespace M2M
