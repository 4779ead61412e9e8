#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "server/admission_controller.hpp"
#include "server/rate_limit_response.hpp"
#include "store/in_memory_window_store.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

using namespace edgeguard;

namespace {

std::atomic<bool> g_stop{false};

void signal_handler(int /*signal*/) {
    g_stop.store(true, std::memory_order_relaxed);
}

void print_usage(const char* prog) {
    std::cerr << std::format(
        "Usage: {} [--config <path>]\n"
        "Reads '<peer> <path> [x-forwarded-for]' lines from stdin and prints\n"
        "one admission decision per line.\n", prog);
}

// One output line per request: verdict, status, then whatever headers apply
std::string format_decision(std::string_view path, const RateLimitResponse& response,
                            const AdmissionDecision& decision) {
    std::string line = std::format("{} {} {}", response.status,
                                   verdict_to_string(decision.verdict), path);
    for (const auto& [name, value] : response.headers) {
        line += std::format(" [{}: {}]", name, value);
    }
    if (!response.body.empty()) {
        line += ' ';
        line += response.body;
    }
    return line;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/edgeguard.toml";
        for (int i = 1; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_file = argv[++i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                print_usage(argv[0]);
                return 2;
            }
        }

        utils::log::info(std::format("Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const auto& cfg = config_result.config;
        utils::log::info(std::format("Config loaded: {} rules, {} exempt paths, bans={}",
            cfg.rules.size(), cfg.exempt.size(), utils::booltostr(cfg.bans.enabled)));

        auto store = std::make_shared<InMemoryWindowStore>(
            InMemoryWindowStore::Config{.purge_interval = cfg.store.purge_interval});
        AdmissionController controller(cfg.admission_config(), store);

        std::string raw;
        while (!g_stop.load(std::memory_order_relaxed) && std::getline(std::cin, raw)) {
            const std::string line = utils::trim(raw);
            if (line.empty() || line.front() == '#') continue;

            std::istringstream iss(line);
            std::string peer, path;
            if (!(iss >> peer >> path)) {
                utils::log::warn(std::format("Skipping malformed line: '{}'", line));
                continue;
            }
            std::string forwarded_for;
            std::getline(iss, forwarded_for);
            forwarded_for = utils::trim(forwarded_for);

            auto result = controller.check(path, peer, forwarded_for);
            if (result.is_error()) {
                utils::log::error(std::format("{}: {}",
                    error_category_to_string(result.error_category()), result.error_message()));
                std::cout << std::format("error {} {}\n",
                    error_category_to_string(result.error_category()), path);
                continue;
            }

            const auto& decision = result.value();
            const auto response = RateLimitResponse::from_decision(decision);
            std::cout << format_decision(path, response, decision) << '\n';
        }

        const auto stats = controller.get_stats();
        utils::log::info(std::format(
            "Done: {} checks, {} exempt, {} allowed, {} rate limited, {} banned, {} store errors",
            stats.checks, stats.exempt, stats.allowed, stats.rate_limited,
            stats.banned, stats.store_errors));
        return 0;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return 1;
    }
}
