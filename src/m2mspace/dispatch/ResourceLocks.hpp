#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>
#include <mutex>
#include <string>
#include <vector>

namespace M2M {

/**
 * @brief Fixed set of mutexes striped by resource id.
 *
 * Several ids are locked in ascending stripe order with duplicates collapsed,
 * so two requests locking overlapping id sets cannot deadlock.
 */
class ResourceLocks {
public:
    static constexpr std::size_t StripeCount = 64;

    class Guard {
    public:
        Guard() = default;
        Guard(Guard&&) noexcept = default;
        auto operator=(Guard&&) noexcept -> Guard& = default;
        Guard(Guard const&)                        = delete;
        auto operator=(Guard const&) -> Guard&     = delete;

    private:
        friend class ResourceLocks;
        std::vector<std::unique_lock<std::mutex>> locks_;
    };

    [[nodiscard]] auto lock(std::initializer_list<std::string> resourceIds) -> Guard;

    [[nodiscard]] static auto stripeOf(std::string const& resourceId) -> std::size_t;

private:
    std::array<std::mutex, StripeCount> stripes_;
};

} // namespace M2M
