#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace M2M {

struct Error {
    enum class Code {
        NotFound = 0,
        BadRequest,
        InvalidArguments,
        Conflict,
        OriginatorHasNoPrivilege,
        SecurityAssociationRequired,
        OperationNotAllowed,
        TargetNotSubscribable,
        InvalidChildResourceType,
        NotImplemented,
        InternalServerError,
        OriginatorHasAlreadyRegistered,
        MaxNumberOfMemberExceeded,
        TargetNotReachable
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    explicit Error(Code c)
        : code(c) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::BadRequest:
        return "bad_request";
    case Error::Code::InvalidArguments:
        return "invalid_arguments";
    case Error::Code::Conflict:
        return "conflict";
    case Error::Code::OriginatorHasNoPrivilege:
        return "originator_has_no_privilege";
    case Error::Code::SecurityAssociationRequired:
        return "security_association_required";
    case Error::Code::OperationNotAllowed:
        return "operation_not_allowed";
    case Error::Code::TargetNotSubscribable:
        return "target_not_subscribable";
    case Error::Code::InvalidChildResourceType:
        return "invalid_child_resource_type";
    case Error::Code::NotImplemented:
        return "not_implemented";
    case Error::Code::InternalServerError:
        return "internal_server_error";
    case Error::Code::OriginatorHasAlreadyRegistered:
        return "originator_has_already_registered";
    case Error::Code::MaxNumberOfMemberExceeded:
        return "max_number_of_member_exceeded";
    case Error::Code::TargetNotReachable:
        return "target_not_reachable";
    }
    return "internal_server_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label);
        description.push_back(':');
        description.append(*error.message);
        return description;
    }
    return std::string(label);
}

} // namespace M2M
