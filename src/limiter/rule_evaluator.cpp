#include "limiter/rule_evaluator.hpp"

#include <algorithm>
#include <optional>

namespace edgeguard {

namespace {

constexpr size_t slot(StrategyKind kind) {
    return static_cast<size_t>(kind);
}

} // anonymous namespace

RuleEvaluator::RuleEvaluator(std::shared_ptr<IWindowStore> store, const BanPolicy& policy) {
    for (const auto kind : {StrategyKind::FIXED, StrategyKind::SLIDING_LOG, StrategyKind::MOVING}) {
        strategies_[slot(kind)] = make_window_strategy(kind, store, policy);
    }
}

const std::shared_ptr<WindowStrategy>& RuleEvaluator::strategy(StrategyKind kind) const {
    return strategies_[slot(kind)];
}

uint32_t RuleEvaluator::retry_after(int64_t reset_at, int64_t now) {
    return static_cast<uint32_t>(std::max<int64_t>(1, reset_at - now));
}

Result<AdmissionDecision> RuleEvaluator::evaluate(const std::string& identifier,
                                                  const std::vector<Rule>& rules) {
    if (rules.empty()) {
        return Result<AdmissionDecision>::ok(AdmissionDecision::allowed());
    }

    std::optional<int64_t> request_now;
    std::optional<PolicyHeaders> best;

    for (const auto& rule : rules) {
        auto hit = strategy(rule.strategy)->hit(identifier, rule);
        if (hit.is_error()) {
            return Result<AdmissionDecision>::error(hit.error_category(), hit.error_message());
        }
        const HitResult& h = hit.value();
        if (!request_now) {
            request_now = h.server_now;
        }

        if (h.ban_ttl > 0) {
            return Result<AdmissionDecision>::ok(AdmissionDecision::banned(h.ban_ttl));
        }

        if (!h.allowed) {
            return Result<AdmissionDecision>::ok(AdmissionDecision::rate_limited(
                retry_after(h.reset_at, *request_now), rule.limit, rule.window_seconds));
        }

        if (!best || h.remaining < best->remaining) {
            best = PolicyHeaders{
                .limit = rule.limit,
                .window_seconds = rule.window_seconds,
                .remaining = h.remaining,
                .reset_seconds = retry_after(h.reset_at, *request_now),
            };
        }
    }

    return Result<AdmissionDecision>::ok(AdmissionDecision::allowed(best));
}

} // namespace edgeguard
