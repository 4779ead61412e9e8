#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace edgeguard {

/**
 * @brief Command set visible to one atomic store script.
 *
 * Mirrors the primitives of a key-value server with expiring keys, hashes and
 * sorted sets. All calls made through one transaction observe a single
 * consistent state and a single clock reading.
 *
 * Implementations throw StoreError on a wrong-type access or an invalid
 * argument; the surrounding script is then discarded as a whole.
 */
class IStoreTransaction {
public:
    virtual ~IStoreTransaction() = default;

    /// Authoritative store clock in Unix seconds, fixed for the transaction.
    [[nodiscard]] virtual int64_t time() const = 0;

    // ---- plain counters ----------------------------------------------------

    [[nodiscard]] virtual std::optional<int64_t> get(const std::string& key) = 0;
    virtual int64_t incr(const std::string& key) = 0;
    virtual void set(const std::string& key, int64_t value, int64_t ttl_seconds) = 0;

    // ---- expiry ------------------------------------------------------------

    /// -2 when the key is missing, -1 when it has no expiry, else seconds left.
    [[nodiscard]] virtual int64_t ttl(const std::string& key) = 0;
    virtual void expire(const std::string& key, int64_t seconds) = 0;
    virtual void expire_at(const std::string& key, int64_t unix_seconds) = 0;

    // ---- hashes ------------------------------------------------------------

    virtual int64_t hincrby(const std::string& key, const std::string& field, int64_t delta) = 0;
    virtual void hset(const std::string& key, const std::string& field, int64_t value) = 0;
    [[nodiscard]] virtual std::optional<int64_t> hget(const std::string& key,
                                                      const std::string& field) = 0;

    // ---- sorted sets -------------------------------------------------------

    virtual void zadd(const std::string& key, int64_t score, const std::string& member) = 0;

    /// Remove members with score <= max_score. Returns the number removed.
    virtual size_t zremrangebyscore(const std::string& key, int64_t max_score) = 0;
    [[nodiscard]] virtual size_t zcard(const std::string& key) = 0;

    /// Score of the lowest-ranked member, if any.
    [[nodiscard]] virtual std::optional<int64_t> zmin_score(const std::string& key) = 0;
};

/// Body of one in-process transaction.
using StoreScript = std::function<void(IStoreTransaction&)>;

} // namespace edgeguard
