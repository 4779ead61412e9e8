#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>

namespace edgeguard {

/**
 * @brief Keys one window hit touches, derived by the caller.
 */
struct WindowKeys {
    std::string rate_key;
    std::string ban_key;
    std::string meta_key;
};

/**
 * @brief Arguments of one window hit.
 *
 * member is the unique sliding-log entry for this request; the other
 * strategies ignore it.
 */
struct WindowArgs {
    uint32_t limit = 0;
    uint32_t window_seconds = 0;
    BanPolicy bans;
    std::string member;
};

/**
 * @brief Shared state store used by every worker.
 *
 * Each call is one store-side atomic operation: ban check, counting step and
 * offense bookkeeping run against a single clock reading of the store, with
 * no other caller interleaving and no partial effect on failure. A networked
 * implementation maps each call onto one server-side script invocation; the
 * caller never reads state and writes it back.
 *
 * Throws StoreError when the store cannot be reached or the operation fails.
 */
class IWindowStore {
public:
    virtual ~IWindowStore() = default;

    virtual HitResult fixed_window_hit(const WindowKeys& keys, const WindowArgs& args) = 0;
    virtual HitResult sliding_log_hit(const WindowKeys& keys, const WindowArgs& args) = 0;
    virtual HitResult moving_window_hit(const WindowKeys& keys, const WindowArgs& args) = 0;
};

} // namespace edgeguard
