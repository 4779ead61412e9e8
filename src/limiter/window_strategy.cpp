#include "limiter/window_strategy.hpp"
#include "limiter/key_space.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace edgeguard {

WindowStrategy::WindowStrategy(std::shared_ptr<IWindowStore> store, BanPolicy policy)
    : store_(std::move(store))
    , policy_(policy) {}

Result<HitResult> WindowStrategy::hit(const std::string& identifier,
                                      uint32_t limit, uint32_t window_seconds) {
    return hit_key(identifier, KeySpace::rate_key(identifier, kind(), limit, window_seconds),
                   limit, window_seconds);
}

Result<HitResult> WindowStrategy::hit(const std::string& identifier, const Rule& rule) {
    Rule keyed = rule;
    keyed.strategy = kind();
    return hit_key(identifier, KeySpace::rate_key(identifier, keyed),
                   rule.limit, rule.window_seconds);
}

Result<HitResult> WindowStrategy::hit_key(const std::string& identifier, const std::string& rate_key,
                                          uint32_t limit, uint32_t window_seconds) {
    if (window_seconds == 0) {
        return Result<HitResult>::error(ErrorCategory::CONFIG_ERROR,
            std::format("zero-length window for {}", rate_key));
    }

    hits_.fetch_add(1, std::memory_order_relaxed);

    WindowKeys keys;
    keys.rate_key = rate_key;
    keys.ban_key = KeySpace::ban_key(identifier, rate_key, policy_.site_wide);
    keys.meta_key = KeySpace::meta_key(policy_.site_wide ? keys.ban_key : keys.rate_key);

    WindowArgs args;
    args.limit = limit;
    args.window_seconds = window_seconds;
    args.bans = policy_;

    HitResult out;
    try {
        out = run(*store_, keys, args);
    } catch (const std::exception& e) {
        store_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Window store operation failed ({} {}): {}",
            strategy_kind_tag(kind()), rate_key, e.what()));
        return Result<HitResult>::error(ErrorCategory::STORE_UNAVAILABLE, e.what());
    }

    if (out.ban_ttl > 0 && !out.ban_issued) {
        banned_hits_.fetch_add(1, std::memory_order_relaxed);
    } else if (!out.allowed) {
        denials_.fetch_add(1, std::memory_order_relaxed);
        if (out.ban_issued) {
            bans_issued_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Ban issued: client={} key={} duration={}s",
                KeySpace::hash_identifier(identifier), keys.ban_key, out.ban_ttl));
        }
    }

    return Result<HitResult>::ok(out);
}

WindowStrategy::Stats WindowStrategy::get_stats() const {
    return {
        .hits = hits_.load(std::memory_order_relaxed),
        .denials = denials_.load(std::memory_order_relaxed),
        .bans_issued = bans_issued_.load(std::memory_order_relaxed),
        .banned_hits = banned_hits_.load(std::memory_order_relaxed),
        .store_errors = store_errors_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Strategies
// ============================================================================

HitResult FixedWindowStrategy::run(IWindowStore& store, const WindowKeys& keys, WindowArgs& args) {
    return store.fixed_window_hit(keys, args);
}

HitResult SlidingLogStrategy::run(IWindowStore& store, const WindowKeys& keys, WindowArgs& args) {
    // Several requests can share one second, so each gets its own member
    args.member = utils::generate_uuid();
    return store.sliding_log_hit(keys, args);
}

HitResult MovingWindowStrategy::run(IWindowStore& store, const WindowKeys& keys, WindowArgs& args) {
    return store.moving_window_hit(keys, args);
}

std::shared_ptr<WindowStrategy> make_window_strategy(
    StrategyKind kind, std::shared_ptr<IWindowStore> store, const BanPolicy& policy) {
    switch (kind) {
        case StrategyKind::FIXED:
            return std::make_shared<FixedWindowStrategy>(std::move(store), policy);
        case StrategyKind::SLIDING_LOG:
            return std::make_shared<SlidingLogStrategy>(std::move(store), policy);
        case StrategyKind::MOVING:
            return std::make_shared<MovingWindowStrategy>(std::move(store), policy);
    }
    throw std::invalid_argument("unknown strategy kind");
}

} // namespace edgeguard
