#include "core/ResponseStatusCode.hpp"

namespace M2M {

auto statusCodeToString(ResponseStatusCode status) -> std::string_view {
    switch (status) {
    case ResponseStatusCode::OK:
        return "OK";
    case ResponseStatusCode::Created:
        return "CREATED";
    case ResponseStatusCode::Deleted:
        return "DELETED";
    case ResponseStatusCode::Updated:
        return "UPDATED";
    case ResponseStatusCode::BadRequest:
        return "BAD_REQUEST";
    case ResponseStatusCode::NotFound:
        return "NOT_FOUND";
    case ResponseStatusCode::OperationNotAllowed:
        return "OPERATION_NOT_ALLOWED";
    case ResponseStatusCode::OriginatorHasNoPrivilege:
        return "ORIGINATOR_HAS_NO_PRIVILEGE";
    case ResponseStatusCode::Conflict:
        return "CONFLICT";
    case ResponseStatusCode::SecurityAssociationRequired:
        return "SECURITY_ASSOCIATION_REQUIRED";
    case ResponseStatusCode::InvalidChildResourceType:
        return "INVALID_CHILD_RESOURCE_TYPE";
    case ResponseStatusCode::OriginatorHasAlreadyRegistered:
        return "ORIGINATOR_HAS_ALREADY_REGISTERED";
    case ResponseStatusCode::InternalServerError:
        return "INTERNAL_SERVER_ERROR";
    case ResponseStatusCode::NotImplemented:
        return "NOT_IMPLEMENTED";
    case ResponseStatusCode::TargetNotReachable:
        return "TARGET_NOT_REACHABLE";
    case ResponseStatusCode::TargetNotSubscribable:
        return "TARGET_NOT_SUBSCRIBABLE";
    case ResponseStatusCode::MaxNumberOfMemberExceeded:
        return "MAX_NUMBER_OF_MEMBER_EXCEEDED";
    case ResponseStatusCode::InvalidArguments:
        return "INVALID_ARGUMENTS";
    }
    return "UNKNOWN";
}

} // namespace M2M
