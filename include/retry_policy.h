// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "device_error.h"

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace printlink {

/**
 * @brief Caller-owned abort flag shared with running operations
 *
 * Copies share the same flag. Checked between poll attempts, before each
 * RPC, and while waiting; a cancelled operation still closes its connection.
 */
class CancellationToken {
  public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() {
        flag_->store(true);
    }

    bool is_cancelled() const {
        return flag_->load();
    }

  private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/// Blocking wait used between attempts; injectable so tests never sleep.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper backed by std::this_thread::sleep_for
Sleeper default_sleeper();

/**
 * @brief Wait for a duration, waking early when cancelled
 *
 * Without a token the sleeper is called once with the full duration.
 * With a token the wait is split into slices of at most 100 ms.
 *
 * @return false if the token was cancelled before or during the wait
 */
bool wait_for(const Sleeper& sleeper, std::chrono::milliseconds duration,
              const CancellationToken* cancel);

/**
 * @brief Bounded retry parameters
 *
 * max_attempts == 0 means unbounded; every call site in this library passes
 * a finite cap.
 */
struct RetryPolicy {
    std::chrono::milliseconds delay{0}; ///< Wait between consecutive attempts
    int max_attempts = 0;               ///< Total attempts including the first

    static RetryPolicy bounded(int attempts, std::chrono::milliseconds between) {
        RetryPolicy p;
        p.max_attempts = attempts;
        p.delay = between;
        return p;
    }

    bool is_unbounded() const {
        return max_attempts <= 0;
    }
};

/**
 * @brief Repeat an action until a predicate accepts its result
 *
 * Attempt n (1-based) is invoked, then:
 *  - an error result aborts the loop and is returned as-is
 *  - a result accepted by is_done is returned
 *  - otherwise, if n reached max_attempts, on_exhausted(n) is returned
 *  - otherwise the policy delay elapses and attempt n+1 runs
 *
 * The delay separates attempts; none is taken before the first or after the
 * last, so a never-accepting device costs (max_attempts - 1) * delay.
 * An exception thrown by a callback or the sleeper ends the loop with
 * PROTOCOL_ERROR.
 */
template <typename T>
DeviceResult<T> poll_until(const RetryPolicy& policy,
                           const std::function<DeviceResult<T>(int attempt)>& action,
                           const std::function<bool(const T&)>& is_done,
                           const std::function<DeviceError(int attempts)>& on_exhausted,
                           const CancellationToken* cancel = nullptr,
                           const Sleeper& sleeper = default_sleeper()) {
    try {
        for (int attempt = 1;; ++attempt) {
            if (cancel && cancel->is_cancelled()) {
                return DeviceError::cancelled();
            }

            DeviceResult<T> result = action(attempt);
            if (!result) {
                return result;
            }
            if (is_done(result.value())) {
                return result;
            }
            if (!policy.is_unbounded() && attempt >= policy.max_attempts) {
                return on_exhausted(attempt);
            }

            if (policy.delay.count() > 0) {
                if (!wait_for(sleeper, policy.delay, cancel)) {
                    return DeviceError::cancelled();
                }
            }
        }
    } catch (const std::exception& e) {
        return DeviceError::protocol_error(std::string("polling aborted: ") + e.what());
    }
}

} // namespace printlink
