#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <limits>
#include <stdexcept>

using namespace std::string_literals;

namespace edgeguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Negative or oversized values collapse to 0 so validation reports them
uint32_t toml_u32(const toml::table& tbl, const std::string_view key, const uint32_t fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    const int64_t v = node.value_or(int64_t{-1});
    if (v < 0 || v > std::numeric_limits<uint32_t>::max()) return 0;
    return static_cast<uint32_t>(v);
}

// Accepts an integer (seconds) or a duration string ("5m", "1h", "1d")
uint32_t toml_duration(const toml::table& tbl, const std::string_view key, const uint32_t fallback) {
    const auto node = tbl[key];
    if (!node) return fallback;
    if (const auto* s = node.as_string()) {
        const uint64_t secs = utils::parse_duration(s->get());
        return secs > std::numeric_limits<uint32_t>::max() ? 0 : static_cast<uint32_t>(secs);
    }
    return toml_u32(tbl, key, fallback);
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

std::vector<RuleSpec> ConfigLoader::extract_rules(const toml::table& root) {
    std::vector<RuleSpec> rules;
    const auto* arr = root["rules"].as_array();
    if (!arr) return rules;

    rules.reserve(arr->size());
    for (const auto& elem : *arr) {
        const auto* r = elem.as_table();
        if (!r) continue;
        RuleSpec spec;
        spec.path = (*r)["path"].value_or(""s);
        spec.limit = toml_u32(*r, "limit", 0);
        spec.window_seconds = toml_duration(*r, "window", 0);
        spec.strategy = (*r)["strategy"].value_or("fixed"s);
        rules.emplace_back(std::move(spec));
    }
    return rules;
}

BanPolicy ConfigLoader::extract_bans(const toml::table& root) {
    BanPolicy policy;
    const auto* bans_node = root["bans"].as_table();
    if (!bans_node) return policy;
    const auto& b = *bans_node;

    policy.enabled = b["enabled"].value_or(true);
    policy.threshold = toml_u32(b, "offenses", policy.threshold);
    policy.initial_ban_seconds = toml_duration(b, "length", policy.initial_ban_seconds);
    policy.max_ban_seconds = toml_duration(b, "max_length", policy.max_ban_seconds);
    policy.decay_window_seconds = toml_duration(b, "counter_reset", policy.decay_window_seconds);
    policy.site_wide = b["site_wide"].value_or(true);
    return policy;
}

ClientIdentity::Config ConfigLoader::extract_client(const toml::table& root) {
    ClientIdentity::Config cfg;
    const auto* client = root["client"].as_table();
    if (!client) return cfg;

    cfg.trust_forwarded_for = (*client)["trust_forwarded_for"].value_or(false);
    cfg.trusted_proxies = toml_string_array(*client, "trusted_proxies");
    return cfg;
}

StoreConfig ConfigLoader::extract_store(const toml::table& root) {
    StoreConfig cfg;
    const auto* store = root["store"].as_table();
    if (!store) return cfg;

    cfg.backend = utils::to_lower((*store)["backend"].value_or("memory"s));
    cfg.purge_interval = toml_u32(*store, "purge_interval", cfg.purge_interval);
    return cfg;
}

EdgeguardConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    EdgeguardConfig config;
    config.rules = extract_rules(root);
    config.exempt = toml_string_array(root, "exempt");
    config.bans = extract_bans(root);
    config.client = extract_client(root);
    config.store = extract_store(root);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EdgeguardConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EdgeguardConfig& config) {
    std::vector<std::string> errors;

    for (size_t i = 0; i < config.rules.size(); ++i) {
        const auto& rule = config.rules[i];
        if (rule.path.empty()) {
            errors.push_back(std::format("rules[{}].path must not be empty", i));
        }
        if (rule.limit == 0) {
            errors.push_back(std::format("rules[{}].limit must be > 0", i));
        }
        if (rule.window_seconds == 0) {
            errors.push_back(std::format("rules[{}].window must be > 0 seconds", i));
        }
        if (!parse_strategy_kind(rule.strategy)) {
            errors.push_back(std::format(
                "rules[{}].strategy '{}' is not one of fixed, sliding, moving", i, rule.strategy));
        }
    }

    if (config.bans.enabled) {
        if (config.bans.threshold == 0) {
            errors.push_back("bans.offenses must be > 0 when bans are enabled");
        }
        if (config.bans.initial_ban_seconds == 0) {
            errors.push_back("bans.length must be > 0 seconds");
        }
        if (config.bans.max_ban_seconds == 0) {
            errors.push_back("bans.max_length must be > 0 seconds");
        }
    }

    for (const auto& entry : config.client.trusted_proxies) {
        ClientIdentity::CidrRange range;
        if (!ClientIdentity::parse_cidr(entry, range)) {
            errors.push_back(std::format("client.trusted_proxies entry '{}' is not an IPv4 address or CIDR", entry));
        }
    }

    if (config.store.backend != "memory") {
        errors.push_back(std::format("store.backend '{}' is not supported (expected memory)",
            config.store.backend));
    }

    return errors;
}

} // namespace edgeguard
