#pragma once
#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace NWorkspace {

    struct TRetryPolicy {
        size_t MaxAttempts = 3;
        std::chrono::milliseconds BaseDelay{200};
        std::chrono::milliseconds MaxDelay{2000};

        // Delay before retry number `retry` (0-based): BaseDelay * 2^retry, capped.
        std::chrono::milliseconds DelayFor(size_t retry) const {
            auto delay = BaseDelay;
            for (size_t i = 0; i < retry && delay < MaxDelay; ++i) {
                delay *= 2;
            }
            return std::min(delay, MaxDelay);
        }
    };

    using TSleeper = std::function<void(std::chrono::milliseconds)>;

    inline TSleeper ThreadSleeper() {
        return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }

    // Runs fn, retrying only failures that report IsRetryable().
    template <class TFunc>
    auto RetryTransient(const TRetryPolicy& policy, const TSleeper& sleep, const std::string& what, TFunc&& fn) -> decltype(fn()) {
        const size_t attempts = std::max<size_t>(policy.MaxAttempts, 1);
        for (size_t attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const TWorkspaceError& e) {
                if (!e.IsRetryable() || attempt >= attempts) {
                    throw;
                }
                auto delay = policy.DelayFor(attempt - 1);
                spdlog::warn("{} failed (attempt {}/{}): {}; retrying in {} ms", what, attempt, attempts, e.what(), delay.count());
                if (sleep) {
                    sleep(delay);
                }
            }
        }
    }

} // namespace NWorkspace
