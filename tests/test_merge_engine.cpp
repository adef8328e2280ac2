// Merge engine: conservation, bubble promotion, one merge per particle, gating

#include <gestureflow/merge_engine.hpp>
#include <gestureflow/particle_store.hpp>
#include <gestureflow/random_source.hpp>
#include <gestureflow/spatial_index.hpp>

#include "check.hpp"

#include <cstddef>

using namespace gestureflow;

namespace
{
    ParticleStore make_store(std::size_t capacity)
    {
        return ParticleStore{ capacity, 1000.0f, 1000.0f, StoreParameters{}, SpawnParameters{}, *PaletteSet::builtin().find("default") };
    }

    void place(ParticleStore& store, RandomSource& rng, float x, float y, float size, Vec2 velocity = {}, Hsv color = { 100.0f, 0.5f, 0.5f })
    {
        SpawnOptions options{};
        options.velocity = velocity;
        options.size = size;
        options.color = color;
        store.spawn(x, y, rng, options);
    }
}

static void testTwoParticleMerge()
{
    testing::section("two particles at distance 5");
    RandomSource rng(1);
    auto store = make_store(8);
    SpatialHashGrid grid(1000.0f, 1000.0f, 50.0f);
    place(store, rng, 500.0f, 500.0f, 10.0f);
    place(store, rng, 505.0f, 500.0f, 10.0f);

    MergeEngine engine{};
    const auto stats = engine.run_pass(store, grid, rng);

    CHECK_EQ(stats.merges, std::size_t{ 1 }, "one merge");
    CHECK_EQ(store.size(), std::size_t{ 1 }, "count reduced by one");
    CHECK_NEAR(store.sizes()[0], 13.0, 1e-5, "size is 10 + 10 * 0.3");
    CHECK_NEAR(store.masses()[0], 1.3, 1e-5, "mass recomputed from size");
    CHECK(!store.is_bubble(0), "below the bubble threshold");
    CHECK_EQ(stats.new_bubbles, std::size_t{ 0 }, "no bubble formed");
}

static void testMassWeightedAverage()
{
    testing::section("mass-weighted position and velocity");
    RandomSource rng(2);
    auto store = make_store(8);
    SpatialHashGrid grid(1000.0f, 1000.0f, 50.0f);
    place(store, rng, 400.0f, 400.0f, 12.0f, Vec2{ 1.0f, 0.0f }, Hsv{ 10.0f, 1.0f, 0.2f });
    place(store, rng, 404.0f, 400.0f, 4.0f, Vec2{ -2.0f, 3.0f }, Hsv{ 50.0f, 0.0f, 0.6f });

    MergeEngine engine{};
    engine.run_pass(store, grid, rng);

    CHECK_EQ(store.size(), std::size_t{ 1 }, "merged into one");
    // Masses 1.2 and 0.4.
    CHECK_NEAR(store.positions()[0].x, (400.0 * 1.2 + 404.0 * 0.4) / 1.6, 1e-3, "position is mass weighted");
    CHECK_NEAR(store.velocities()[0].x, (1.0 * 1.2 - 2.0 * 0.4) / 1.6, 1e-5, "velocity x is mass weighted");
    CHECK_NEAR(store.velocities()[0].y, (3.0 * 0.4) / 1.6, 1e-5, "velocity y is mass weighted");
    CHECK_NEAR(store.colors()[0].hue, 30.0, 1e-4, "hue is a plain average");
    CHECK_NEAR(store.colors()[0].sat, 0.5, 1e-6, "saturation is a plain average");
    CHECK_NEAR(store.colors()[0].val, 0.4, 1e-6, "value is a plain average");
    CHECK_NEAR(store.sizes()[0], 12.0 + 4.0 * 0.3, 1e-5, "sub-linear growth");
}

static void testBubblePromotionAndCap()
{
    testing::section("bubble promotion and size cap");
    RandomSource rng(3);
    auto store = make_store(8);
    SpatialHashGrid grid(1000.0f, 1000.0f, 50.0f);
    place(store, rng, 300.0f, 300.0f, 38.0f);
    place(store, rng, 310.0f, 300.0f, 30.0f);
    store.temperatures()[0] = 0.4f;

    MergeEngine engine{};
    const auto stats = engine.run_pass(store, grid, rng);

    CHECK_EQ(store.size(), std::size_t{ 1 }, "merged");
    CHECK_NEAR(store.sizes()[0], 40.0, 1e-6, "growth capped at the maximum size");
    CHECK(store.is_bubble(0), "crossing the threshold makes a bubble");
    CHECK_NEAR(store.temperatures()[0], 0.6, 1e-5, "bubble heats up");
    CHECK_EQ(stats.new_bubbles, std::size_t{ 1 }, "new bubble reported");
}

static void testTooFarApart()
{
    testing::section("no merge beyond the threshold");
    RandomSource rng(4);
    auto store = make_store(8);
    SpatialHashGrid grid(1000.0f, 1000.0f, 50.0f);
    place(store, rng, 500.0f, 500.0f, 10.0f);
    place(store, rng, 510.0f, 500.0f, 10.0f); // distance == threshold

    MergeEngine engine{};
    CHECK_EQ(engine.run_pass(store, grid, rng).merges, std::size_t{ 0 }, "distance equal to the threshold does not merge");
    CHECK_EQ(store.size(), std::size_t{ 2 }, "both particles survive");
}

static void testAtMostOneMergePerParticle()
{
    testing::section("at most one merge per particle per pass");
    RandomSource rng(5);
    auto store = make_store(8);
    SpatialHashGrid grid(1000.0f, 1000.0f, 50.0f);
    // A large particle overlapped by four small ones that do not overlap each other.
    place(store, rng, 500.0f, 500.0f, 30.0f);
    place(store, rng, 510.0f, 500.0f, 4.0f);
    place(store, rng, 500.0f, 510.0f, 4.0f);
    place(store, rng, 490.0f, 500.0f, 4.0f);
    place(store, rng, 500.0f, 490.0f, 4.0f);

    MergeEngine engine{};
    const auto stats = engine.run_pass(store, grid, rng);

    CHECK_EQ(stats.sampled, std::size_t{ 5 }, "every particle sampled");
    CHECK_EQ(stats.merges, std::size_t{ 1 }, "the large particle absorbs only one neighbour");
    CHECK_EQ(store.size(), std::size_t{ 4 }, "one particle consumed");
    CHECK_NEAR(store.sizes()[0], 30.0 + 4.0 * 0.3, 1e-5, "single growth step");
}

static void testFewerThanTwo()
{
    testing::section("fewer than two particles");
    RandomSource rng(6);
    auto store = make_store(8);
    SpatialHashGrid grid(1000.0f, 1000.0f, 50.0f);
    MergeEngine engine{};

    CHECK_EQ(engine.run_pass(store, grid, rng).merges, std::size_t{ 0 }, "empty store");
    place(store, rng, 1.0f, 1.0f, 10.0f);
    const auto probe = RandomSource(rng).uniform(0.0f, 1.0f);
    CHECK_EQ(engine.run_pass(store, grid, rng).sampled, std::size_t{ 0 }, "single particle is a no-op");
    CHECK_EQ(rng.uniform(0.0f, 1.0f), probe, "no random draws for a no-op pass");
}

static void testSampleLimit()
{
    testing::section("bounded sampling");
    RandomSource rng(7);
    auto store = make_store(400);
    SpatialHashGrid grid(1000.0f, 1000.0f, 50.0f);
    for (int i = 0; i < 400; ++i)
    {
        place(store, rng, 20.0f + static_cast<float>(i % 20) * 48.0f, 20.0f + static_cast<float>(i / 20) * 48.0f, 4.0f);
    }

    MergeParameters parameters{};
    parameters.sample_limit = 150;
    MergeEngine engine{ parameters };
    const auto stats = engine.run_pass(store, grid, rng);
    CHECK_EQ(stats.sampled, std::size_t{ 150 }, "sample bounded by the limit");
    CHECK_EQ(stats.merges, std::size_t{ 0 }, "sparse lattice does not merge");
    CHECK_EQ(grid.size(), std::size_t{ 400 }, "index rebuilt from every live particle");
}

static void testGate()
{
    testing::section("frame gate");
    RandomSource rng(8);
    MergeParameters always{};
    always.probability = 1.0f;
    MergeParameters never{};
    never.probability = 0.0f;

    CHECK(MergeEngine{ always }.should_run(rng), "probability 1 always runs");
    CHECK(!MergeEngine{ never }.should_run(rng), "probability 0 never runs");

    MergeEngine engine{};
    int runs = 0;
    for (int i = 0; i < 10000; ++i)
    {
        runs += engine.should_run(rng) ? 1 : 0;
    }
    CHECK_NEAR(runs / 10000.0, 0.3, 0.03, "default gate runs on about 30% of frames");
}

int main()
{
    testTwoParticleMerge();
    testMassWeightedAverage();
    testBubblePromotionAndCap();
    testTooFarApart();
    testAtMostOneMergePerParticle();
    testFewerThanTwo();
    testSampleLimit();
    testGate();
    return testing::report("merge_engine");
}
