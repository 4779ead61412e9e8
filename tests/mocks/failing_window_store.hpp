#pragma once

#include "core/error.hpp"
#include "store/window_store.hpp"

#include <atomic>
#include <string>

namespace edgeguard::testing {

/**
 * @brief Window store that is unreachable: every operation throws StoreError
 */
class FailingWindowStore : public IWindowStore {
public:
    explicit FailingWindowStore(std::string reason = "connection refused")
        : reason_(std::move(reason)) {}

    HitResult fixed_window_hit(const WindowKeys& /*keys*/, const WindowArgs& /*args*/) override {
        fail();
    }

    HitResult sliding_log_hit(const WindowKeys& /*keys*/, const WindowArgs& /*args*/) override {
        fail();
    }

    HitResult moving_window_hit(const WindowKeys& /*keys*/, const WindowArgs& /*args*/) override {
        fail();
    }

    [[nodiscard]] int attempts() const { return attempts_.load(); }

private:
    [[noreturn]] void fail() {
        attempts_.fetch_add(1, std::memory_order_relaxed);
        throw StoreError(reason_);
    }

    std::string reason_;
    std::atomic<int> attempts_{0};
};

} // namespace edgeguard::testing
