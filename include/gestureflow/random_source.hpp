#pragma once

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <utility>
#include <vector>

namespace gestureflow
{
    // Single seeded stream behind every stochastic decision of the simulation.
    // Two sources built from the same seed and asked the same questions in the
    // same order produce identical answers.
    class RandomSource
    {
    public:
        static constexpr std::uint32_t default_seed = 5489u;

        RandomSource()
            : RandomSource(default_seed)
        {
        }

        explicit RandomSource(std::uint32_t seed)
            : m_seed(seed),
              m_engine(seed)
        {
        }

        void reseed(std::uint32_t seed)
        {
            m_seed = seed;
            m_engine.seed(seed);
        }

        [[nodiscard]] std::uint32_t seed() const noexcept { return m_seed; }

        // Uniform in [lo, hi); returns lo for an empty range.
        float uniform(float lo, float hi)
        {
            if (!(hi > lo))
            {
                return lo;
            }
            std::uniform_real_distribution<float> dist(lo, hi);
            return dist(m_engine);
        }

        float gaussian(float mean, float stddev)
        {
            if (!(stddev > 0.0f))
            {
                return mean;
            }
            std::normal_distribution<float> dist(mean, stddev);
            return dist(m_engine);
        }

        bool chance(float probability)
        {
            if (probability <= 0.0f) return false;
            if (probability >= 1.0f) return true;
            return uniform(0.0f, 1.0f) < probability;
        }

        // Uniform index in [0, n); n must be non-zero.
        std::size_t pick(std::size_t n)
        {
            if (n <= 1)
            {
                return 0;
            }
            std::uniform_int_distribution<std::size_t> dist(0, n - 1);
            return dist(m_engine);
        }

        // k distinct indices drawn from [0, n) without replacement, in draw order.
        std::vector<std::size_t> sample_indices(std::size_t n, std::size_t k)
        {
            if (k > n) k = n;

            std::vector<std::size_t> pool(n);
            std::iota(pool.begin(), pool.end(), std::size_t{ 0 });

            for (std::size_t i = 0; i < k; ++i)
            {
                std::uniform_int_distribution<std::size_t> dist(i, n - 1);
                std::swap(pool[i], pool[dist(m_engine)]);
            }

            pool.resize(k);
            return pool;
        }

        std::mt19937& engine() noexcept { return m_engine; }

    private:
        std::uint32_t m_seed{ default_seed };
        std::mt19937 m_engine;
    };
} // namespace gestureflow
