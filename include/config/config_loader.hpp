#pragma once

#include "core/types.hpp"
#include "limiter/rule_matcher.hpp"
#include "server/admission_controller.hpp"
#include "server/client_identity.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace edgeguard {

// ============================================================================
// Store Config
// ============================================================================

struct StoreConfig {
    std::string backend = "memory";
    uint32_t purge_interval = 1000;
};

// ============================================================================
// EdgeguardConfig - Complete parsed configuration
// ============================================================================

struct EdgeguardConfig {
    std::vector<RuleSpec> rules;
    std::vector<std::string> exempt;
    BanPolicy bans;
    ClientIdentity::Config client;
    StoreConfig store;

    [[nodiscard]] AdmissionController::Config admission_config() const {
        return {.rules = rules, .exempt = exempt, .bans = bans, .client = client};
    }
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EdgeguardConfig config;

        static LoadResult ok(EdgeguardConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to edgeguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, empty when the config is usable.
    [[nodiscard]] static std::vector<std::string> validate_config(const EdgeguardConfig& config);

private:
    static std::vector<RuleSpec> extract_rules(const toml::table& root);
    static BanPolicy extract_bans(const toml::table& root);
    static ClientIdentity::Config extract_client(const toml::table& root);
    static StoreConfig extract_store(const toml::table& root);
    static EdgeguardConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(EdgeguardConfig config);
};

} // namespace edgeguard
