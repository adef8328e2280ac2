#pragma once

#include "vec2.hpp"
#include "random_source.hpp"
#include "color.hpp"
#include "config.hpp"
#include "spatial_index.hpp"
#include "particle_store.hpp"
#include "force_field.hpp"
#include "merge_engine.hpp"
#include "color_drift.hpp"
#include "bubble_dynamics.hpp"
#include "boundary.hpp"
#include "idle_flow.hpp"
#include "simulation.hpp"
#include "interaction.hpp"

/*
 * GestureFlow - a header-only 2D particle core for gesture-driven fluid art.
 *
 * Features:
 *  - Dense columnar particle store with swap-remove and stable particle ids.
 *  - Grid-hash proximity index behind an abstract query interface.
 *  - Attract, repel, vortex, flow and two-point gather force fields.
 *  - Stochastic proximity merging into buoyant, shrinking bubbles.
 *  - Palette-driven "lava lamp" color drift and an autonomous idle flow.
 *  - A command variant and gesture bindings that decouple the input layer
 *    from the physics.
 *  - Every stochastic choice comes from one seeded source, so identical
 *    seeds and command sequences replay identically.
 *  - C++23, depending only on the standard library and the shared safe_io
 *    console utilities.
 */
