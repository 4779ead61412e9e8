#pragma once

#include "store/store_transaction.hpp"
#include "store/window_store.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace edgeguard {

/**
 * @brief In-process window store for single-node deployments and tests.
 *
 * Each window operation runs its scripts:: body inside one transaction.
 * Transactions are serialized by one mutex. Writes are staged per transaction
 * and committed only when the script returns, so a throwing script leaves no
 * trace.
 *
 * Expiry is the store's own business, as with any key-value server: keys are
 * dead from their expiry time on (lazy check on access), and the memory of
 * dead keys is reclaimed every purge_interval transactions, the counterpart
 * of a server's active expire cycle. The limiter relies only on the lazy
 * check.
 */
class InMemoryWindowStore : public IWindowStore {
public:
    using ClockFn = std::function<int64_t()>;

    struct Config {
        uint32_t purge_interval = 1000;   // 0 = never reclaim dead keys
    };

    InMemoryWindowStore();
    explicit InMemoryWindowStore(Config config, ClockFn clock = {});

    HitResult fixed_window_hit(const WindowKeys& keys, const WindowArgs& args) override;
    HitResult sliding_log_hit(const WindowKeys& keys, const WindowArgs& args) override;
    HitResult moving_window_hit(const WindowKeys& keys, const WindowArgs& args) override;

    /// Run script as one atomic transaction.
    void execute(const StoreScript& script);

    /// Reclaim every expired key now.
    void purge_expired();

    /// Number of keys that are still live at the current clock reading.
    [[nodiscard]] size_t live_key_count() const;

    [[nodiscard]] uint64_t transaction_count() const {
        return transactions_.load(std::memory_order_relaxed);
    }

    struct Entry {
        enum class Type { VALUE, HASH, ZSET };

        Type type = Type::VALUE;
        int64_t value = 0;
        std::unordered_map<std::string, int64_t> hash;
        std::set<std::pair<int64_t, std::string>> zset;
        std::unordered_map<std::string, int64_t> zscores;   // member -> score
        int64_t expires_at = 0;                              // 0 = no expiry

        [[nodiscard]] bool expired(int64_t now) const {
            return expires_at != 0 && expires_at <= now;
        }
    };

private:
    class Transaction;

    void purge_expired_locked(int64_t now);

    Config config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

    std::atomic<uint64_t> transactions_{0};
};

} // namespace edgeguard
