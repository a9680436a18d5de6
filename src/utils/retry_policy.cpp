// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "retry_policy.h"

#include <algorithm>
#include <thread>

namespace printlink {

namespace {
constexpr std::chrono::milliseconds kCancelCheckSlice{100};
} // namespace

Sleeper default_sleeper() {
    return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

bool wait_for(const Sleeper& sleeper, std::chrono::milliseconds duration,
              const CancellationToken* cancel) {
    if (cancel && cancel->is_cancelled()) {
        return false;
    }
    if (duration.count() <= 0) {
        return true;
    }

    Sleeper sleep = sleeper ? sleeper : default_sleeper();

    if (!cancel) {
        sleep(duration);
        return true;
    }

    auto remaining = duration;
    while (remaining.count() > 0) {
        auto slice = std::min(remaining, kCancelCheckSlice);
        sleep(slice);
        remaining -= slice;
        if (cancel->is_cancelled()) {
            return false;
        }
    }
    return true;
}

} // namespace printlink
