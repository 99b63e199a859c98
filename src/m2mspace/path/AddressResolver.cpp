#include "path/AddressResolver.hpp"
#include "log/TaggedLogger.hpp"
#include "path/utils.hpp"
#include "store/ResourceStore.hpp"

#include <algorithm>

namespace M2M {

namespace {

auto strip_leading_slash(std::string_view address) -> std::string_view {
    if (!address.empty() && address.front() == '/')
        address.remove_prefix(1);
    return address;
}

auto unresolvable(std::string_view address, std::string_view reason) -> Error {
    return Error{Error::Code::NotFound, std::string{reason} + ": " + std::string{address}};
}

} // namespace

auto addressingModeOf(std::string_view address) -> AddressingMode {
    address = strip_leading_slash(address);
    if (address == "~" || address.starts_with("~/"))
        return AddressingMode::SpRelative;
    if (address == "_" || address.starts_with("_/"))
        return AddressingMode::Absolute;
    return AddressingMode::CseRelative;
}

auto minimumSegments(AddressingMode mode) -> std::size_t {
    switch (mode) {
    case AddressingMode::SpRelative:
        return 3;
    case AddressingMode::Absolute:
        return 4;
    case AddressingMode::CseRelative:
        return 1;
    }
    return 1;
}

auto isStructured(std::string_view address) -> bool {
    auto const mode     = addressingModeOf(address);
    auto const stripped = strip_leading_slash(address);
    if (stripped.empty())
        return false;
    auto const segments = static_cast<std::size_t>(std::count(stripped.begin(), stripped.end(), '/')) + 1;
    return segments > minimumSegments(mode);
}

AddressResolver::AddressResolver(CseOptions const& options, ResourceStore const& store)
    : cseId_(options.cseId), cseResourceId_(options.cseResourceId), cseResourceName_(options.cseResourceName), store_(store) {}

auto AddressResolver::isLocalCse(std::string_view cseId) const -> bool {
    return cseId == this->cseId_;
}

auto AddressResolver::parse(std::string_view address) const -> Expected<ParsedAddress> {
    auto const stripped = strip_leading_slash(address);
    if (stripped.empty())
        return std::unexpected(unresolvable(address, "empty address"));

    auto const segments = split_path(stripped);
    if (std::any_of(segments.begin(), segments.end(), [](auto const& s) { return s.empty(); }))
        return std::unexpected(unresolvable(address, "empty path segment"));

    ParsedAddress parsed;
    parsed.mode = addressingModeOf(stripped);

    if (parsed.mode == AddressingMode::CseRelative) {
        parsed.cseId = this->cseId_;
        if (segments.size() == 1 && (segments[0] != this->cseResourceName_ || segments[0] == this->cseResourceId_))
            parsed.resourceId = std::string{segments[0]};
        else
            parsed.structuredPath = std::string{stripped};
        return parsed;
    }

    auto const minimum = minimumSegments(parsed.mode);
    if (segments.size() < minimum)
        return std::unexpected(unresolvable(address, "too few segments"));

    // Index of the segment following the CSE-ID
    std::size_t const first = minimum - 1;
    if (parsed.mode == AddressingMode::SpRelative) {
        parsed.cseId = "/" + std::string{segments[1]};
    } else {
        parsed.spId  = std::string{segments[1]};
        parsed.cseId = "/" + std::string{segments[2]};
    }
    parsed.remote = !this->isLocalCse(parsed.cseId);

    if (parsed.remote) {
        if (segments.size() == minimum)
            parsed.resourceId = std::string{segments[first]};
        else
            parsed.structuredPath = join_path(segments, first);
        return parsed;
    }

    if (segments[first] == this->cseResourceName_)
        parsed.structuredPath = join_path(segments, first);
    else if (segments.size() == minimum)
        parsed.resourceId = std::string{segments[first]};
    else
        return std::unexpected(unresolvable(address, "structured path does not start at the CSE root"));
    return parsed;
}

auto AddressResolver::resolve(std::string_view address) const -> Expected<ResolvedAddress> {
    auto parsed = this->parse(address);
    if (!parsed)
        return std::unexpected(parsed.error());

    ResolvedAddress resolved{.resourceId     = parsed->resourceId,
                             .cseId          = parsed->cseId,
                             .structuredPath = parsed->structuredPath,
                             .remote         = parsed->remote};

    if (!resolved.remote && resolved.resourceId.empty() && !resolved.structuredPath.empty()) {
        if (auto record = this->store_.getByPath(resolved.structuredPath))
            resolved.resourceId = record->ri();
    }
    m2m_log("Resolved " + std::string{address} + " -> ri=" + resolved.resourceId + " srn=" + resolved.structuredPath
                    + " csi=" + resolved.cseId,
            "Address");
    return resolved;
}

} // namespace M2M
