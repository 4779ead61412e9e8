#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "limiter/rule_evaluator.hpp"
#include "limiter/rule_matcher.hpp"
#include "server/client_identity.hpp"
#include "store/window_store.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace edgeguard {

/**
 * @brief Request pre-filter: exemptions, identity, rule match, evaluation.
 *
 * The only mutable state is in the window store; configuration is fixed at
 * construction, so one instance serves every worker thread.
 *
 * A store failure surfaces as STORE_UNAVAILABLE; whether to fail open or
 * closed is the caller's decision.
 */
class AdmissionController {
public:
    struct Config {
        std::vector<RuleSpec> rules;
        std::vector<std::string> exempt;
        BanPolicy bans;
        ClientIdentity::Config client;
    };

    /**
     * @throws std::invalid_argument on invalid rules or trusted proxies
     */
    AdmissionController(const Config& config, std::shared_ptr<IWindowStore> store);

    /**
     * @brief Full admission check for one request
     * @param path Request path (trailing '/' ignored)
     * @param peer_addr Address of the connecting peer
     * @param forwarded_for Raw X-Forwarded-For header, empty if absent
     */
    [[nodiscard]] Result<AdmissionDecision> check(std::string_view path,
                                                  std::string_view peer_addr,
                                                  std::string_view forwarded_for = {});

    [[nodiscard]] std::vector<Rule> match_rules(std::string_view path) const {
        return matcher_.match_rules(path);
    }

    [[nodiscard]] bool is_exempt(std::string_view path) const {
        return matcher_.is_exempt(path);
    }

    [[nodiscard]] Result<AdmissionDecision> evaluate(const std::string& identifier,
                                                     const std::vector<Rule>& rules) {
        return evaluator_.evaluate(identifier, rules);
    }

    [[nodiscard]] const RuleMatcher& matcher() const { return matcher_; }
    [[nodiscard]] const RuleEvaluator& evaluator() const { return evaluator_; }
    [[nodiscard]] const ClientIdentity& identity() const { return identity_; }

    struct Stats {
        uint64_t checks;
        uint64_t exempt;
        uint64_t allowed;
        uint64_t rate_limited;
        uint64_t banned;
        uint64_t store_errors;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    RuleMatcher matcher_;
    RuleEvaluator evaluator_;
    ClientIdentity identity_;

    std::atomic<uint64_t> checks_{0};
    std::atomic<uint64_t> exempt_{0};
    std::atomic<uint64_t> allowed_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> banned_{0};
    std::atomic<uint64_t> store_errors_{0};
};

} // namespace edgeguard
