#pragma once

#include <chrono>
#include <cstdint>

namespace core {

using seat_index_t = int8_t;
using ply_t = int32_t;

// Utility of a terminal state from one seat's perspective. The two seats' utilities sum to zero.
using utility_t = float;

// Every game supported by this library is a two-player game.
constexpr int kNumPlayers = 2;

using steady_clock_t = std::chrono::steady_clock;
using time_point_t = steady_clock_t::time_point;
using duration_t = std::chrono::nanoseconds;

inline seat_index_t opponent_of(seat_index_t seat) { return 1 - seat; }

}  // namespace core
