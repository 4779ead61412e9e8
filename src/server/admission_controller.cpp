#include "server/admission_controller.hpp"

namespace edgeguard {

AdmissionController::AdmissionController(const Config& config, std::shared_ptr<IWindowStore> store)
    : matcher_(config.rules, config.exempt)
    , evaluator_(std::move(store), config.bans)
    , identity_(config.client) {}

Result<AdmissionDecision> AdmissionController::check(std::string_view path,
                                                     std::string_view peer_addr,
                                                     std::string_view forwarded_for) {
    checks_.fetch_add(1, std::memory_order_relaxed);

    if (matcher_.is_exempt(path)) {
        exempt_.fetch_add(1, std::memory_order_relaxed);
        return Result<AdmissionDecision>::ok(AdmissionDecision::allowed());
    }

    const auto rules = matcher_.match_rules(path);
    if (rules.empty()) {
        allowed_.fetch_add(1, std::memory_order_relaxed);
        return Result<AdmissionDecision>::ok(AdmissionDecision::allowed());
    }

    const std::string identifier = identity_.resolve(peer_addr, forwarded_for);
    auto result = evaluator_.evaluate(identifier, rules);
    if (result.is_error()) {
        store_errors_.fetch_add(1, std::memory_order_relaxed);
        return result;
    }

    switch (result.value().verdict) {
        case Verdict::ALLOWED:
            allowed_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Verdict::RATE_LIMITED:
            rate_limited_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Verdict::BANNED:
            banned_.fetch_add(1, std::memory_order_relaxed);
            break;
    }
    return result;
}

AdmissionController::Stats AdmissionController::get_stats() const {
    return {
        .checks = checks_.load(std::memory_order_relaxed),
        .exempt = exempt_.load(std::memory_order_relaxed),
        .allowed = allowed_.load(std::memory_order_relaxed),
        .rate_limited = rate_limited_.load(std::memory_order_relaxed),
        .banned = banned_.load(std::memory_order_relaxed),
        .store_errors = store_errors_.load(std::memory_order_relaxed),
    };
}

} // namespace edgeguard
