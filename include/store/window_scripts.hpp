#pragma once

#include "core/types.hpp"
#include "store/store_transaction.hpp"
#include "store/window_store.hpp"

#include <cstdint>
#include <string>

namespace edgeguard::scripts {

/**
 * @brief Store-side bodies of the three window operations.
 *
 * Each function is the complete atomic unit behind one IWindowStore call and
 * must run inside a single store transaction:
 *   1. read the store clock once,
 *   2. return immediately if the ban flag is live (window state untouched),
 *   3. run the counting step,
 *   4. on denial, record an offense, which may issue a ban.
 */

// Extra lifetime on a sliding log so concurrent pruning never drops live entries
inline constexpr int64_t kSlidingLogExpiryGraceSeconds = 60;

[[nodiscard]] HitResult fixed_window(IStoreTransaction& tx, const WindowKeys& keys, const WindowArgs& args);
[[nodiscard]] HitResult sliding_log(IStoreTransaction& tx, const WindowKeys& keys, const WindowArgs& args);
[[nodiscard]] HitResult moving_window(IStoreTransaction& tx, const WindowKeys& keys, const WindowArgs& args);

/// Fixed window counter of the window containing now.
[[nodiscard]] std::string fixed_bucket_key(const std::string& rate_key, int64_t window, int64_t now);

/// Moving window counter of the given epoch (now / window).
[[nodiscard]] std::string moving_bucket_key(const std::string& rate_key, int64_t epoch);

} // namespace edgeguard::scripts
