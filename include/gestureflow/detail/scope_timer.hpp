#pragma once

#include <chrono>

namespace gestureflow::detail
{
    // Adds the lifetime of the scope, in seconds, to the referenced counter.
    class AccumulatingScopeTimer
    {
    public:
        explicit AccumulatingScopeTimer(double& accumulator)
            : accumulator_{ &accumulator },
              start_{ Clock::now() }
        {
        }

        AccumulatingScopeTimer(const AccumulatingScopeTimer&) = delete;
        AccumulatingScopeTimer& operator=(const AccumulatingScopeTimer&) = delete;

        ~AccumulatingScopeTimer()
        {
            const std::chrono::duration<double> elapsed = Clock::now() - start_;
            *accumulator_ += elapsed.count();
        }

    private:
        using Clock = std::chrono::steady_clock;

        double* accumulator_{ nullptr };
        Clock::time_point start_{};
    };
} // namespace gestureflow::detail
