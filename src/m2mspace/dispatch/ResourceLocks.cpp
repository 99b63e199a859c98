#include "dispatch/ResourceLocks.hpp"

#include <algorithm>
#include <functional>

namespace M2M {

auto ResourceLocks::stripeOf(std::string const& resourceId) -> std::size_t {
    return std::hash<std::string>{}(resourceId) % StripeCount;
}

auto ResourceLocks::lock(std::initializer_list<std::string> resourceIds) -> Guard {
    std::vector<std::size_t> stripes;
    stripes.reserve(resourceIds.size());
    for (auto const& id : resourceIds) {
        if (!id.empty())
            stripes.push_back(stripeOf(id));
    }
    std::sort(stripes.begin(), stripes.end());
    stripes.erase(std::unique(stripes.begin(), stripes.end()), stripes.end());

    Guard guard;
    guard.locks_.reserve(stripes.size());
    for (auto stripe : stripes)
        guard.locks_.emplace_back(this->stripes_[stripe]);
    return guard;
}

} // namespace M2M
