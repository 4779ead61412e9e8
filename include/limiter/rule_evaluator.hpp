#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "limiter/window_strategy.hpp"
#include "store/window_store.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace edgeguard {

/**
 * @brief Combines the verdicts of every rule matched for one request.
 *
 * Rules are evaluated in order and ALL must allow (AND semantics):
 * - first rule reporting a ban        -> Banned(ttl), stop
 * - first rule denying                -> RateLimited(retry_after), stop
 * - all allow                         -> Allowed, headers from the rule with
 *                                        the smallest remaining (first wins)
 *
 * Retry-after values of one request are computed against a single store
 * timestamp (the first hit's server_now).
 */
class RuleEvaluator {
public:
    /// One strategy instance per kind, all sharing store and ban policy.
    RuleEvaluator(std::shared_ptr<IWindowStore> store, const BanPolicy& policy);

    [[nodiscard]] Result<AdmissionDecision> evaluate(const std::string& identifier,
                                                     const std::vector<Rule>& rules);

    [[nodiscard]] const std::shared_ptr<WindowStrategy>& strategy(StrategyKind kind) const;

    /// max(1, reset_at - now)
    [[nodiscard]] static uint32_t retry_after(int64_t reset_at, int64_t now);

private:
    std::array<std::shared_ptr<WindowStrategy>, 3> strategies_;
};

} // namespace edgeguard
