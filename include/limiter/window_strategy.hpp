#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "store/window_store.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace edgeguard {

/**
 * @brief Base for the windowed counting algorithms.
 *
 * hit() derives the keys, then issues exactly one store operation that checks
 * the ban flag, counts and records offenses atomically on the store side (see
 * scripts::fixed_window and friends). Nothing is read back and rewritten from
 * here, so concurrent callers in any number of processes cannot race.
 *
 * Thread-safety: stateless apart from atomic counters; safe to share.
 */
class WindowStrategy {
public:
    WindowStrategy(std::shared_ptr<IWindowStore> store, BanPolicy policy);
    virtual ~WindowStrategy() = default;

    [[nodiscard]] virtual StrategyKind kind() const = 0;

    /**
     * @brief Count one request for identifier against rule
     * @return HitResult, or STORE_UNAVAILABLE when the store operation failed
     */
    [[nodiscard]] Result<HitResult> hit(const std::string& identifier, const Rule& rule);

    /// Same as above for a limit that is not tied to a configured rule.
    [[nodiscard]] Result<HitResult> hit(const std::string& identifier,
                                        uint32_t limit, uint32_t window_seconds);

    [[nodiscard]] const BanPolicy& ban_policy() const { return policy_; }

    struct Stats {
        uint64_t hits = 0;
        uint64_t denials = 0;
        uint64_t bans_issued = 0;
        uint64_t banned_hits = 0;
        uint64_t store_errors = 0;
    };

    [[nodiscard]] Stats get_stats() const;

protected:
    /// The store operation of this algorithm.
    [[nodiscard]] virtual HitResult run(IWindowStore& store, const WindowKeys& keys,
                                        WindowArgs& args) = 0;

private:
    [[nodiscard]] Result<HitResult> hit_key(const std::string& identifier, const std::string& rate_key,
                                            uint32_t limit, uint32_t window_seconds);

    std::shared_ptr<IWindowStore> store_;
    BanPolicy policy_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> denials_{0};
    std::atomic<uint64_t> bans_issued_{0};
    std::atomic<uint64_t> banned_hits_{0};
    std::atomic<uint64_t> store_errors_{0};
};

/**
 * @brief Epoch-aligned fixed window.
 *
 * Up to 2x limit may pass across one boundary (end of one window plus start
 * of the next); that is inherent to the algorithm.
 */
class FixedWindowStrategy : public WindowStrategy {
public:
    using WindowStrategy::WindowStrategy;

    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::FIXED; }

protected:
    [[nodiscard]] HitResult run(IWindowStore& store, const WindowKeys& keys, WindowArgs& args) override;
};

/**
 * @brief Exact sliding log: one sorted-set member per admitted request.
 *
 * Storage grows with requests in the window; in exchange the count over any
 * (t - window, t] interval never exceeds the limit.
 */
class SlidingLogStrategy : public WindowStrategy {
public:
    using WindowStrategy::WindowStrategy;

    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::SLIDING_LOG; }

protected:
    [[nodiscard]] HitResult run(IWindowStore& store, const WindowKeys& keys, WindowArgs& args) override;
};

/**
 * @brief Moving window: current and previous epoch buckets, previous one
 * weighted by the fraction of it still inside the window.
 */
class MovingWindowStrategy : public WindowStrategy {
public:
    using WindowStrategy::WindowStrategy;

    [[nodiscard]] StrategyKind kind() const override { return StrategyKind::MOVING; }

protected:
    [[nodiscard]] HitResult run(IWindowStore& store, const WindowKeys& keys, WindowArgs& args) override;
};

/// Build the strategy for kind, sharing store and ban policy.
[[nodiscard]] std::shared_ptr<WindowStrategy> make_window_strategy(
    StrategyKind kind, std::shared_ptr<IWindowStore> store, const BanPolicy& policy);

} // namespace edgeguard
