#ifndef SHARDCACHE_RETRY_H
#define SHARDCACHE_RETRY_H

#include "status.h"
#include <algorithm>
#include <chrono>
#include <thread>

namespace ShardCache
{
    // RetryPolicy re-runs an attempt that reported Busy until it succeeds or
    // the budget elapses. Attempts must be atomic: a Busy attempt has no
    // effect, so running it again is always safe.
    class RetryPolicy
    {
    public:
        using Clock = std::chrono::steady_clock;

        static constexpr std::chrono::milliseconds kInitialBackoff{1};
        static constexpr std::chrono::milliseconds kMaxBackoff{10};

        // timeout is the budget in seconds; 0 allows exactly one attempt.
        // Budgets too large for Clock::duration, including infinity, are
        // clamped; NaN and negative budgets count as 0.
        explicit RetryPolicy(double timeout) : budget_(to_budget(timeout)) {}

        // Without retry, a Busy attempt is reported as Timeout immediately.
        template <typename F>
        Status Run(bool retry, F &&attempt) const
        {
            auto deadline = Clock::now() + budget_;
            Clock::duration backoff = kInitialBackoff;
            while (true)
            {
                Status status = attempt();
                if (!status.busy())
                {
                    return status;
                }
                auto now = Clock::now();
                if (!retry || now >= deadline)
                {
                    return Status::Timeout(status.msg());
                }
                std::this_thread::sleep_for(std::min<Clock::duration>(backoff, deadline - now));
                backoff = std::min<Clock::duration>(backoff * 2, kMaxBackoff);
            }
        }

        Clock::duration budget() const { return budget_; }

    private:
        Clock::duration budget_;

        static Clock::duration to_budget(double timeout)
        {
            constexpr auto kMaxBudget = Clock::duration::max() / 4;
            if (!(timeout > 0))
            {
                return Clock::duration::zero();
            }
            if (timeout >= std::chrono::duration<double>(kMaxBudget).count())
            {
                return kMaxBudget;
            }
            return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(timeout));
        }
    };
}

#endif
