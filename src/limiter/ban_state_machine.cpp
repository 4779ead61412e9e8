#include "limiter/ban_state_machine.hpp"

#include <algorithm>

namespace edgeguard {

BanStateMachine::BanStateMachine(BanPolicy policy)
    : policy_(policy) {}

uint32_t BanStateMachine::active_ban_ttl(IStoreTransaction& tx, const std::string& ban_key) const {
    const int64_t ttl = tx.ttl(ban_key);
    return ttl > 0 ? static_cast<uint32_t>(ttl) : 0;
}

uint32_t BanStateMachine::record_offense(IStoreTransaction& tx,
                                         const std::string& ban_key,
                                         const std::string& meta_key,
                                         uint32_t window_seconds) const {
    if (!policy_.enabled) return 0;

    const int64_t offenses = tx.hincrby(meta_key, kOffenseField, 1);
    tx.expire(meta_key, static_cast<int64_t>(window_seconds) * 2);

    if (offenses < static_cast<int64_t>(policy_.threshold)) {
        return 0;
    }

    const int64_t bans = tx.hincrby(meta_key, kBanCountField, 1);
    const uint32_t duration = ban_duration(policy_, bans);

    tx.set(ban_key, 1, duration);
    tx.hset(meta_key, kOffenseField, 0);
    // Escalation state outlives the ban and decays only after inactivity
    tx.expire(meta_key, std::max<int64_t>(duration, policy_.decay_window_seconds));
    return duration;
}

uint32_t BanStateMachine::ban_duration(const BanPolicy& policy, int64_t consecutive_bans) {
    const int64_t shift = std::max<int64_t>(consecutive_bans, 1) - 1;
    const uint64_t cap = policy.max_ban_seconds;
    if (shift >= 32) {
        return static_cast<uint32_t>(cap);
    }
    const uint64_t scaled = static_cast<uint64_t>(policy.initial_ban_seconds) << shift;
    return static_cast<uint32_t>(std::min(scaled, cap));
}

} // namespace edgeguard
