#pragma once
#include "core/Error.hpp"

#include <string_view>

namespace M2M {

/**
 * @brief Numeric oneM2M response status codes returned by the dispatch entry points.
 */
enum class ResponseStatusCode : int {
    OK                             = 2000,
    Created                        = 2001,
    Deleted                        = 2002,
    Updated                        = 2004,
    BadRequest                     = 4000,
    NotFound                       = 4004,
    OperationNotAllowed            = 4005,
    OriginatorHasNoPrivilege       = 4103,
    Conflict                       = 4105,
    SecurityAssociationRequired    = 4107,
    InvalidChildResourceType       = 4108,
    OriginatorHasAlreadyRegistered = 4117,
    InternalServerError            = 5000,
    NotImplemented                 = 5001,
    TargetNotReachable             = 5103,
    TargetNotSubscribable          = 5203,
    MaxNumberOfMemberExceeded      = 6010,
    InvalidArguments               = 6023
};

[[nodiscard]] constexpr auto statusCodeFor(Error::Code code) -> ResponseStatusCode {
    switch (code) {
    case Error::Code::NotFound:
        return ResponseStatusCode::NotFound;
    case Error::Code::BadRequest:
        return ResponseStatusCode::BadRequest;
    case Error::Code::InvalidArguments:
        return ResponseStatusCode::InvalidArguments;
    case Error::Code::Conflict:
        return ResponseStatusCode::Conflict;
    case Error::Code::OriginatorHasNoPrivilege:
        return ResponseStatusCode::OriginatorHasNoPrivilege;
    case Error::Code::SecurityAssociationRequired:
        return ResponseStatusCode::SecurityAssociationRequired;
    case Error::Code::OperationNotAllowed:
        return ResponseStatusCode::OperationNotAllowed;
    case Error::Code::TargetNotSubscribable:
        return ResponseStatusCode::TargetNotSubscribable;
    case Error::Code::InvalidChildResourceType:
        return ResponseStatusCode::InvalidChildResourceType;
    case Error::Code::NotImplemented:
        return ResponseStatusCode::NotImplemented;
    case Error::Code::InternalServerError:
        return ResponseStatusCode::InternalServerError;
    case Error::Code::OriginatorHasAlreadyRegistered:
        return ResponseStatusCode::OriginatorHasAlreadyRegistered;
    case Error::Code::MaxNumberOfMemberExceeded:
        return ResponseStatusCode::MaxNumberOfMemberExceeded;
    case Error::Code::TargetNotReachable:
        return ResponseStatusCode::TargetNotReachable;
    }
    return ResponseStatusCode::InternalServerError;
}

[[nodiscard]] constexpr auto isSuccess(ResponseStatusCode status) -> bool {
    auto const value = static_cast<int>(status);
    return value >= 2000 && value < 3000;
}

[[nodiscard]] auto statusCodeToString(ResponseStatusCode status) -> std::string_view;

} // namespace M2M
