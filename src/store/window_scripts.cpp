#include "store/window_scripts.hpp"
#include "limiter/ban_state_machine.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>

namespace edgeguard::scripts {

namespace {

// Counting step: fills allowed, remaining and reset_at
using CountFn = HitResult (*)(IStoreTransaction&, const std::string&, const WindowArgs&, int64_t);
// reset_at reported while banned, read-only
using BannedResetFn = int64_t (*)(IStoreTransaction&, const std::string&, int64_t, int64_t);

HitResult run_window(IStoreTransaction& tx, const WindowKeys& keys, const WindowArgs& args,
                     CountFn count, BannedResetFn banned_reset_at) {
    if (args.window_seconds == 0) {
        throw StoreError(std::format("zero-length window for key '{}'", keys.rate_key));
    }

    const BanStateMachine bans(args.bans);
    const int64_t now = tx.time();
    const int64_t window = args.window_seconds;

    if (const uint32_t ttl = bans.active_ban_ttl(tx, keys.ban_key); ttl > 0) {
        HitResult out;
        out.ban_ttl = ttl;
        out.reset_at = banned_reset_at(tx, keys.rate_key, window, now);
        out.server_now = now;
        return out;
    }

    HitResult out = count(tx, keys.rate_key, args, now);
    out.server_now = now;

    if (!out.allowed) {
        out.remaining = 0;
        out.ban_ttl = bans.record_offense(tx, keys.ban_key, keys.meta_key, args.window_seconds);
        out.ban_issued = out.ban_ttl > 0;
    }
    return out;
}

// ============================================================================
// Fixed window
// ============================================================================

HitResult fixed_count(IStoreTransaction& tx, const std::string& rate_key,
                      const WindowArgs& args, int64_t now) {
    const int64_t window = args.window_seconds;
    const int64_t limit = args.limit;
    const int64_t window_end = now - (now % window) + window;
    const std::string key = fixed_bucket_key(rate_key, window, now);

    HitResult r;
    r.reset_at = window_end;

    const int64_t current = tx.get(key).value_or(0);
    if (current < limit) {
        const int64_t updated = tx.incr(key);
        tx.expire_at(key, window_end);
        r.allowed = true;
        r.remaining = static_cast<uint32_t>(limit - updated);
    }
    return r;
}

int64_t fixed_banned_reset_at(IStoreTransaction& /*tx*/, const std::string& /*rate_key*/,
                              int64_t window, int64_t now) {
    return now - (now % window) + window;
}

// ============================================================================
// Sliding log
// ============================================================================

HitResult sliding_count(IStoreTransaction& tx, const std::string& rate_key,
                        const WindowArgs& args, int64_t now) {
    const int64_t window = args.window_seconds;
    // Entries at or before now - window have left the window
    tx.zremrangebyscore(rate_key, now - window);
    const size_t in_window = tx.zcard(rate_key);

    HitResult r;
    if (in_window < args.limit) {
        // Members are unique per request, several requests can share one second
        tx.zadd(rate_key, now, args.member);
        tx.expire(rate_key, window + kSlidingLogExpiryGraceSeconds);

        r.allowed = true;
        r.remaining = static_cast<uint32_t>(args.limit - in_window - 1);
    }
    r.reset_at = tx.zmin_score(rate_key).value_or(now) + window;
    return r;
}

int64_t sliding_banned_reset_at(IStoreTransaction& tx, const std::string& rate_key,
                                int64_t window, int64_t now) {
    return tx.zmin_score(rate_key).value_or(now) + window;
}

// ============================================================================
// Moving window
// ============================================================================

HitResult moving_count(IStoreTransaction& tx, const std::string& rate_key,
                       const WindowArgs& args, int64_t now) {
    const int64_t window = args.window_seconds;
    const int64_t limit = args.limit;
    const int64_t epoch = now / window;
    const std::string current_key = moving_bucket_key(rate_key, epoch);
    const std::string previous_key = moving_bucket_key(rate_key, epoch - 1);

    const int64_t current = tx.get(current_key).value_or(0);
    const int64_t previous = tx.get(previous_key).value_or(0);

    // Share of the previous bucket still covered by the window ending at now
    const int64_t overlap = window - (now % window);
    const auto weighted = [&](int64_t cur) {
        return previous * overlap / window + cur;
    };

    HitResult r;
    r.reset_at = (epoch + 1) * window;

    if (weighted(current) < limit) {
        const int64_t updated = tx.incr(current_key);
        // Survives into the next epoch, where it becomes the weighted bucket
        tx.expire(current_key, window * 2);

        r.allowed = true;
        r.remaining = static_cast<uint32_t>(
            std::max<int64_t>(0, limit - weighted(updated)));
    }
    return r;
}

int64_t moving_banned_reset_at(IStoreTransaction& /*tx*/, const std::string& /*rate_key*/,
                               int64_t window, int64_t now) {
    return (now / window + 1) * window;
}

} // anonymous namespace

std::string fixed_bucket_key(const std::string& rate_key, int64_t window, int64_t now) {
    return std::format("{}:{}", rate_key, now / window);
}

std::string moving_bucket_key(const std::string& rate_key, int64_t epoch) {
    return std::format("{}:{}", rate_key, epoch);
}

HitResult fixed_window(IStoreTransaction& tx, const WindowKeys& keys, const WindowArgs& args) {
    return run_window(tx, keys, args, fixed_count, fixed_banned_reset_at);
}

HitResult sliding_log(IStoreTransaction& tx, const WindowKeys& keys, const WindowArgs& args) {
    return run_window(tx, keys, args, sliding_count, sliding_banned_reset_at);
}

HitResult moving_window(IStoreTransaction& tx, const WindowKeys& keys, const WindowArgs& args) {
    return run_window(tx, keys, args, moving_count, moving_banned_reset_at);
}

} // namespace edgeguard::scripts
