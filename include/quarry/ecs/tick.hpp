#pragma once

/// @file tick.hpp
/// @brief Change-detection ticks for quarry_ecs
///
/// The world advances a 32-bit change tick. Every component row records the
/// tick it was added at and the tick it was last mutably fetched at. A query
/// call sees a (last_run, this_run) window and reports rows whose tick falls
/// inside it. Comparisons are done on wrapping differences so the counter may
/// overflow, as long as `World::check_change_ticks` runs often enough to clamp
/// ticks older than MAX_CHANGE_AGE.

#include "fwd.hpp"
#include <cstdint>

namespace quarry_ecs {

/// How far the world tick may advance before a clamp pass is due
inline constexpr std::uint32_t CHECK_TICK_THRESHOLD = 518'400'000u;

/// Ticks older than this (relative to the current tick) are clamped
inline constexpr std::uint32_t MAX_CHANGE_AGE = 0xFFFFFFFFu - (2 * CHECK_TICK_THRESHOLD - 1);

// =============================================================================
// Tick
// =============================================================================

struct Tick {
    std::uint32_t tick;

    constexpr explicit Tick(std::uint32_t t = 0) noexcept : tick(t) {}

    [[nodiscard]] constexpr std::uint32_t get() const noexcept { return tick; }

    /// True if this tick happened after `last_run`, as seen from `this_run`
    [[nodiscard]] constexpr bool is_newer_than(Tick last_run, Tick this_run) const noexcept {
        std::uint32_t ticks_since_insert = this_run.tick - tick;
        std::uint32_t ticks_since_system = this_run.tick - last_run.tick;
        if (ticks_since_insert > MAX_CHANGE_AGE) ticks_since_insert = MAX_CHANGE_AGE;
        if (ticks_since_system > MAX_CHANGE_AGE) ticks_since_system = MAX_CHANGE_AGE;
        return ticks_since_system > ticks_since_insert;
    }

    /// Clamp a tick that has fallen too far behind `current`
    /// @return true if the tick was changed
    constexpr bool check_tick(Tick current) noexcept {
        if (current.tick - tick > MAX_CHANGE_AGE) {
            tick = current.tick - MAX_CHANGE_AGE;
            return true;
        }
        return false;
    }

    [[nodiscard]] constexpr bool operator==(const Tick& other) const noexcept { return tick == other.tick; }
    [[nodiscard]] constexpr bool operator!=(const Tick& other) const noexcept { return tick != other.tick; }
};

// =============================================================================
// ComponentTicks
// =============================================================================

/// Added and last-changed ticks of one component row
struct ComponentTicks {
    Tick added;
    Tick changed;

    constexpr ComponentTicks() noexcept = default;
    constexpr explicit ComponentTicks(Tick at) noexcept : added(at), changed(at) {}

    [[nodiscard]] constexpr bool is_added(Tick last_run, Tick this_run) const noexcept {
        return added.is_newer_than(last_run, this_run);
    }

    [[nodiscard]] constexpr bool is_changed(Tick last_run, Tick this_run) const noexcept {
        return changed.is_newer_than(last_run, this_run);
    }

    constexpr void set_changed(Tick at) noexcept { changed = at; }
};

// =============================================================================
// Ticks
// =============================================================================

/// The change window of one query call
struct Ticks {
    Tick last_run;
    Tick this_run;
};

} // namespace quarry_ecs
