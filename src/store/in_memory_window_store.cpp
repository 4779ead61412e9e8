#include "store/in_memory_window_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "store/window_scripts.hpp"

#include <format>
#include <optional>

namespace edgeguard {

// ============================================================================
// Transaction: staged view over the committed entries
// ============================================================================

class InMemoryWindowStore::Transaction : public IStoreTransaction {
public:
    Transaction(std::unordered_map<std::string, Entry>& base, int64_t now)
        : base_(base), now_(now) {}

    [[nodiscard]] int64_t time() const override { return now_; }

    [[nodiscard]] std::optional<int64_t> get(const std::string& key) override {
        const Entry* e = find(key);
        if (!e) return std::nullopt;
        check_type(*e, Entry::Type::VALUE, key);
        return e->value;
    }

    int64_t incr(const std::string& key) override {
        Entry& e = create_or_get(key, Entry::Type::VALUE);
        return ++e.value;
    }

    void set(const std::string& key, int64_t value, int64_t ttl_seconds) override {
        if (ttl_seconds <= 0) {
            throw StoreError(std::format("invalid expire time {} for key '{}'", ttl_seconds, key));
        }
        Entry e;
        e.type = Entry::Type::VALUE;
        e.value = value;
        e.expires_at = now_ + ttl_seconds;
        staged_[key] = std::move(e);
    }

    [[nodiscard]] int64_t ttl(const std::string& key) override {
        const Entry* e = find(key);
        if (!e) return -2;
        if (e->expires_at == 0) return -1;
        return e->expires_at - now_;
    }

    void expire(const std::string& key, int64_t seconds) override {
        Entry* e = find_for_write(key);
        if (!e) return;
        if (seconds <= 0) {
            remove(key);
            return;
        }
        e->expires_at = now_ + seconds;
    }

    void expire_at(const std::string& key, int64_t unix_seconds) override {
        Entry* e = find_for_write(key);
        if (!e) return;
        if (unix_seconds <= now_) {
            remove(key);
            return;
        }
        e->expires_at = unix_seconds;
    }

    int64_t hincrby(const std::string& key, const std::string& field, int64_t delta) override {
        Entry& e = create_or_get(key, Entry::Type::HASH);
        return e.hash[field] += delta;
    }

    void hset(const std::string& key, const std::string& field, int64_t value) override {
        Entry& e = create_or_get(key, Entry::Type::HASH);
        e.hash[field] = value;
    }

    [[nodiscard]] std::optional<int64_t> hget(const std::string& key,
                                              const std::string& field) override {
        const Entry* e = find(key);
        if (!e) return std::nullopt;
        check_type(*e, Entry::Type::HASH, key);
        const auto it = e->hash.find(field);
        if (it == e->hash.end()) return std::nullopt;
        return it->second;
    }

    void zadd(const std::string& key, int64_t score, const std::string& member) override {
        Entry& e = create_or_get(key, Entry::Type::ZSET);
        if (const auto it = e.zscores.find(member); it != e.zscores.end()) {
            e.zset.erase(std::make_pair(it->second, member));
        }
        e.zset.emplace(score, member);
        e.zscores[member] = score;
    }

    size_t zremrangebyscore(const std::string& key, int64_t max_score) override {
        Entry* e = find_for_write(key);
        if (!e) return 0;
        check_type(*e, Entry::Type::ZSET, key);

        size_t removed = 0;
        auto it = e->zset.begin();
        while (it != e->zset.end() && it->first <= max_score) {
            e->zscores.erase(it->second);
            it = e->zset.erase(it);
            ++removed;
        }
        if (e->zset.empty()) {
            remove(key);
        }
        return removed;
    }

    [[nodiscard]] size_t zcard(const std::string& key) override {
        const Entry* e = find(key);
        if (!e) return 0;
        check_type(*e, Entry::Type::ZSET, key);
        return e->zset.size();
    }

    [[nodiscard]] std::optional<int64_t> zmin_score(const std::string& key) override {
        const Entry* e = find(key);
        if (!e) return std::nullopt;
        check_type(*e, Entry::Type::ZSET, key);
        if (e->zset.empty()) return std::nullopt;
        return e->zset.begin()->first;
    }

    void commit() {
        for (auto& [key, staged] : staged_) {
            if (staged) {
                base_.insert_or_assign(key, std::move(*staged));
            } else {
                base_.erase(key);
            }
        }
        staged_.clear();
    }

private:
    static void check_type(const Entry& e, Entry::Type expected, const std::string& key) {
        if (e.type != expected) {
            throw StoreError(std::format(
                "WRONGTYPE operation against key '{}' holding the wrong kind of value", key));
        }
    }

    // Live entry (staged first, then committed), nullptr if missing or expired
    const Entry* find(const std::string& key) {
        if (const auto it = staged_.find(key); it != staged_.end()) {
            if (!it->second || it->second->expired(now_)) return nullptr;
            return &*it->second;
        }
        const auto it = base_.find(key);
        if (it == base_.end() || it->second.expired(now_)) return nullptr;
        return &it->second;
    }

    // Staged copy of a live entry, nullptr if missing or expired
    Entry* find_for_write(const std::string& key) {
        if (const auto it = staged_.find(key); it != staged_.end()) {
            if (!it->second || it->second->expired(now_)) return nullptr;
            return &*it->second;
        }
        const auto it = base_.find(key);
        if (it == base_.end() || it->second.expired(now_)) return nullptr;
        auto& slot = staged_[key];
        slot = it->second;
        return &*slot;
    }

    Entry& create_or_get(const std::string& key, Entry::Type type) {
        if (Entry* e = find_for_write(key)) {
            check_type(*e, type, key);
            return *e;
        }
        Entry fresh;
        fresh.type = type;
        auto& slot = staged_[key];
        slot = std::move(fresh);
        return *slot;
    }

    void remove(const std::string& key) {
        staged_[key] = std::nullopt;
    }

    std::unordered_map<std::string, Entry>& base_;
    std::unordered_map<std::string, std::optional<Entry>> staged_;
    const int64_t now_;
};

// ============================================================================
// InMemoryWindowStore
// ============================================================================

InMemoryWindowStore::InMemoryWindowStore() : InMemoryWindowStore(Config{}) {}

InMemoryWindowStore::InMemoryWindowStore(Config config, ClockFn clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : ClockFn(utils::unix_seconds)) {}

void InMemoryWindowStore::execute(const StoreScript& script) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = clock_();

    Transaction tx(entries_, now);
    script(tx);
    tx.commit();

    const uint64_t n = transactions_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (config_.purge_interval > 0 && n % config_.purge_interval == 0) {
        purge_expired_locked(now);
    }
}

HitResult InMemoryWindowStore::fixed_window_hit(const WindowKeys& keys, const WindowArgs& args) {
    HitResult out;
    execute([&](IStoreTransaction& tx) { out = scripts::fixed_window(tx, keys, args); });
    return out;
}

HitResult InMemoryWindowStore::sliding_log_hit(const WindowKeys& keys, const WindowArgs& args) {
    HitResult out;
    execute([&](IStoreTransaction& tx) { out = scripts::sliding_log(tx, keys, args); });
    return out;
}

HitResult InMemoryWindowStore::moving_window_hit(const WindowKeys& keys, const WindowArgs& args) {
    HitResult out;
    execute([&](IStoreTransaction& tx) { out = scripts::moving_window(tx, keys, args); });
    return out;
}

void InMemoryWindowStore::purge_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(clock_());
}

void InMemoryWindowStore::purge_expired_locked(int64_t now) {
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->second.expired(now)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t InMemoryWindowStore::live_key_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = clock_();
    size_t count = 0;
    for (const auto& [key, entry] : entries_) {
        if (!entry.expired(now)) ++count;
    }
    return count;
}

} // namespace edgeguard
