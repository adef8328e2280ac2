// Particle store: capacity, spawn defaults, swap removal, resize, stable ids

#include <gestureflow/config.hpp>
#include <gestureflow/particle_store.hpp>
#include <gestureflow/random_source.hpp>

#include "check.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

using namespace gestureflow;

namespace
{
    ParticleStore make_store(std::size_t capacity, float width = 1000.0f, float height = 800.0f)
    {
        return ParticleStore{ capacity, width, height, StoreParameters{}, SpawnParameters{}, *PaletteSet::builtin().find("default") };
    }
}

static void testCapacityInvariant()
{
    testing::section("capacity invariant");
    RandomSource rng(11);
    auto store = make_store(5);

    std::size_t accepted = 0;
    for (int i = 0; i < 12; ++i)
    {
        if (store.spawn(100.0f + i, 100.0f, rng))
        {
            ++accepted;
        }
        CHECK(store.size() <= store.capacity(), "count never exceeds capacity");
    }
    CHECK_EQ(accepted, std::size_t{ 5 }, "only capacity spawns accepted");
    CHECK(store.full(), "store reports full");

    const auto before = store.snapshot();
    const auto seed_probe = RandomSource(rng).uniform(0.0f, 1.0f);
    CHECK(!store.spawn(10.0f, 10.0f, rng), "spawn at capacity fails");
    CHECK(before.positions == store.snapshot().positions, "failed spawn leaves positions untouched");
    CHECK(before.ids == store.snapshot().ids, "failed spawn leaves ids untouched");
    CHECK_EQ(rng.uniform(0.0f, 1.0f), seed_probe, "failed spawn draws no random numbers");
}

static void testSpawnDefaults()
{
    testing::section("spawn defaults");
    RandomSource rng(3);
    auto store = make_store(200);
    const SpawnParameters spawn{};
    const StoreParameters params{};

    for (int i = 0; i < 200; ++i)
    {
        store.spawn(500.0f, 400.0f, rng);
    }

    bool sizes_ok = true;
    bool masses_ok = true;
    bool temps_ok = true;
    bool drift_ok = true;
    bool hue_ok = true;
    bool flags_ok = true;
    for (std::size_t i = 0; i < store.size(); ++i)
    {
        const float size = store.sizes()[i];
        sizes_ok = sizes_ok && size >= spawn.size_min && size <= spawn.size_max;
        masses_ok = masses_ok && std::abs(store.masses()[i] - size * params.mass_per_size) < 1e-6f;
        const float t = store.temperatures()[i];
        temps_ok = temps_ok && t >= spawn.temperature_min && t <= spawn.temperature_max;
        const auto v = store.velocities()[i];
        drift_ok = drift_ok && std::abs(v.x) <= spawn.drift_speed && std::abs(v.y) <= spawn.drift_speed;
        const auto c = store.colors()[i];
        const auto target = store.target_colors()[i];
        hue_ok = hue_ok && c.hue >= 0.0f && c.hue < 360.0f && target.hue >= 0.0f && target.hue < 360.0f;
        flags_ok = flags_ok && !store.is_bubble(i) && store.trail_alpha()[i] == 1.0f;
    }
    CHECK(sizes_ok, "default size within the spawn range");
    CHECK(masses_ok, "mass is size * mass_per_size");
    CHECK(temps_ok, "temperature within [0.3, 1]");
    CHECK(drift_ok, "default velocity is a small drift");
    CHECK(hue_ok, "hues wrapped into [0, 360)");
    CHECK(flags_ok, "new particles are not bubbles and fully opaque");
}

static void testSpawnOverrides()
{
    testing::section("spawn overrides");
    RandomSource rng(5);
    auto store = make_store(4);

    SpawnOptions options{};
    options.velocity = Vec2{ 3.0f, -2.0f };
    options.color = Hsv{ 370.0f, 0.5f, 0.25f };
    options.size = 100.0f;
    CHECK(store.spawn(1.0f, 2.0f, rng, options), "spawn with overrides");

    CHECK(store.velocities()[0] == (Vec2{ 3.0f, -2.0f }), "explicit velocity kept");
    CHECK_NEAR(store.colors()[0].hue, 10.0, 1e-4, "explicit hue wrapped");
    CHECK_NEAR(store.colors()[0].sat, 0.5, 1e-6, "explicit saturation kept");
    CHECK_NEAR(store.sizes()[0], 40.0, 1e-6, "size clamped to the maximum");
    CHECK_NEAR(store.masses()[0], 4.0, 1e-5, "mass follows the clamped size");
}

static void testSpawnCluster()
{
    testing::section("spawn cluster");
    RandomSource rng(9);
    auto store = make_store(10);
    store.spawn(0.0f, 0.0f, rng);

    const auto spawned = store.spawn_cluster(300.0f, 300.0f, 20, 25.0f, rng);
    CHECK_EQ(spawned, std::size_t{ 9 }, "cluster stops at capacity");
    CHECK_EQ(store.size(), std::size_t{ 10 }, "store full after the cluster");

    auto zero = make_store(10);
    CHECK_EQ(zero.spawn_cluster(300.0f, 300.0f, 0, 25.0f, rng), std::size_t{ 0 }, "empty cluster spawns nothing");
}

static void testSwapRemoval()
{
    testing::section("swap removal");
    RandomSource rng(1);
    auto store = make_store(10);
    for (int i = 0; i < 6; ++i)
    {
        SpawnOptions options{};
        options.velocity = Vec2{ static_cast<float>(i), 0.0f };
        store.spawn(static_cast<float>(i) * 10.0f, 0.0f, rng, options);
    }
    const auto ids = std::vector<ParticleId>(store.ids().begin(), store.ids().end());

    store.remove({ 1, 4, 4, 99 });
    CHECK_EQ(store.size(), std::size_t{ 4 }, "two distinct valid indices removed");

    std::vector<float> xs;
    for (const auto& p : store.positions())
    {
        xs.push_back(p.x);
    }
    // Index 4 goes first and row 5 takes its place; index 1 then takes that same row.
    CHECK(xs == std::vector<float>({ 0.0f, 50.0f, 20.0f, 30.0f }), "rows compacted by swap-with-last in descending order");

    CHECK(!store.find(ids[1]).has_value(), "removed id no longer resolves");
    CHECK(!store.find(ids[4]).has_value(), "second removed id no longer resolves");
    const auto moved = store.find(ids[5]);
    CHECK(moved.has_value() && *moved == 1, "id of the moved row follows it");
    CHECK(store.velocities()[1] == (Vec2{ 5.0f, 0.0f }), "all columns move together");

    store.remove({});
    CHECK_EQ(store.size(), std::size_t{ 4 }, "empty removal is a no-op");
}

static void testResize()
{
    testing::section("resize");
    RandomSource rng(2);
    auto store = make_store(50, 800.0f, 600.0f);
    for (int i = 0; i < 50; ++i)
    {
        store.spawn(rng.uniform(0.0f, 800.0f), rng.uniform(0.0f, 600.0f), rng);
    }
    const auto before = std::vector<Vec2>(store.positions().begin(), store.positions().end());

    CHECK(store.resize(1600.0f, 1200.0f), "resize accepted");
    bool doubled = true;
    for (std::size_t i = 0; i < store.size(); ++i)
    {
        doubled = doubled && store.positions()[i].x == before[i].x * 2.0f && store.positions()[i].y == before[i].y * 2.0f;
    }
    CHECK(doubled, "positions scale exactly 2x on both axes");
    CHECK_EQ(store.width(), 1600.0f, "width updated");

    CHECK(!store.resize(0.0f, 100.0f), "non-positive new width rejected");
    CHECK(!store.resize(100.0f, -5.0f), "negative new height rejected");
    CHECK_EQ(store.width(), 1600.0f, "rejected resize leaves the world unchanged");

    auto degenerate = make_store(4, 0.0f, 600.0f);
    degenerate.spawn(25.0f, 30.0f, rng);
    CHECK(degenerate.resize(200.0f, 1200.0f), "resize from a zero-width world");
    CHECK_EQ(degenerate.positions()[0].x, 25.0f, "zero prior width keeps x unscaled");
    CHECK_EQ(degenerate.positions()[0].y, 60.0f, "y still scales");
}

static void testIdsAndClear()
{
    testing::section("ids and clear");
    RandomSource rng(4);
    auto store = make_store(8);
    store.spawn(1.0f, 1.0f, rng);
    store.spawn(2.0f, 2.0f, rng);
    CHECK_EQ(store.ids()[0], ParticleId{ 1 }, "ids start at 1");
    CHECK_EQ(store.ids()[1], ParticleId{ 2 }, "ids are monotonic");

    store.remove({ 0 });
    store.spawn(3.0f, 3.0f, rng);
    CHECK_EQ(store.ids()[1], ParticleId{ 3 }, "ids are not reused after removal");

    store.clear();
    CHECK(store.empty(), "clear empties the store");
    store.spawn(4.0f, 4.0f, rng);
    CHECK_EQ(store.ids()[0], ParticleId{ 1 }, "clear restarts ids");
}

static void testPaletteSwitch()
{
    testing::section("palette switch");
    RandomSource rng(6);
    auto store = make_store(30);
    for (int i = 0; i < 30; ++i)
    {
        store.spawn(10.0f, 10.0f, rng);
    }
    const auto colors = std::vector<Hsv>(store.colors().begin(), store.colors().end());

    store.set_palette(*PaletteSet::builtin().find("monochrome"), rng);
    CHECK(colors == std::vector<Hsv>(store.colors().begin(), store.colors().end()), "current colors untouched");

    bool grey_targets = true;
    for (const auto& target : store.target_colors())
    {
        grey_targets = grey_targets && target.sat == 0.0f;
    }
    CHECK(grey_targets, "targets drawn from the new palette");
    CHECK_EQ(store.palette().name, std::string("monochrome"), "active palette recorded");
}

static void testHeatAndSize()
{
    testing::section("heat and size");
    RandomSource rng(8);
    auto store = make_store(2);
    SpawnOptions options{};
    options.size = 10.0f;
    store.spawn(0.0f, 0.0f, rng, options);

    store.heat(0, 5.0f);
    CHECK_EQ(store.temperatures()[0], 1.0f, "heat saturates at 1");

    store.set_size(0, 0.01f);
    CHECK_EQ(store.sizes()[0], 1.0f, "size clamped to the minimum");
    CHECK_NEAR(store.masses()[0], 0.1, 1e-6, "mass recomputed");
}

int main()
{
    testCapacityInvariant();
    testSpawnDefaults();
    testSpawnOverrides();
    testSpawnCluster();
    testSwapRemoval();
    testResize();
    testIdsAndClear();
    testPaletteSwitch();
    testHeatAndSize();
    return testing::report("particle_store");
}
