#pragma once

#include "core/types.hpp"
#include "store/store_transaction.hpp"

#include <cstdint>
#include <string>

namespace edgeguard {

/**
 * @brief Offense tracking and ban escalation.
 *
 * Runs inside the caller's store transaction, never on its own. State lives in
 * two keys:
 *   meta  hash { off: offenses since the last ban, bc: consecutive bans }
 *   ban   flag whose TTL is the remaining ban time
 *
 * States: Clean -> Accumulating(off) -> Banned(ttl) -> Clean once the flag
 * expires. bc only resets when the meta key itself expires, so offenses that
 * recur within the decay window escalate the next ban:
 *   duration = min(initial * 2^(bc-1), max)
 */
class BanStateMachine {
public:
    static constexpr const char* kOffenseField = "off";
    static constexpr const char* kBanCountField = "bc";

    explicit BanStateMachine(BanPolicy policy);

    /// Remaining TTL of a live ban flag, 0 when not banned.
    [[nodiscard]] uint32_t active_ban_ttl(IStoreTransaction& tx, const std::string& ban_key) const;

    /**
     * @brief Record one over-limit hit.
     * @return Duration of the ban issued by this offense, 0 if none
     */
    uint32_t record_offense(IStoreTransaction& tx,
                            const std::string& ban_key,
                            const std::string& meta_key,
                            uint32_t window_seconds) const;

    /// Ban length for the Nth consecutive ban (N >= 1).
    [[nodiscard]] static uint32_t ban_duration(const BanPolicy& policy, int64_t consecutive_bans);

    [[nodiscard]] const BanPolicy& policy() const { return policy_; }

private:
    BanPolicy policy_;
};

} // namespace edgeguard
