#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace search {

namespace concepts {

template <typename S>
concept HashableState = requires(const S& state) {
  { std::hash<S>{}(state) } -> std::convertible_to<std::size_t>;
};

}  // namespace concepts

struct PerftResult {
  double nodes_per_second() const;

  // e.g. "512.00 n/s", "1.25 Kn/s", "3.40 Mn/s"
  std::string nodes_per_second_str() const;

  int depth = 0;
  uint64_t leaf_nodes = 0;
  std::size_t table_size = 0;  // transposition table entries at the end of the count
  core::duration_t elapsed{0};
};

// Maps a perft depth to the number of plies below the root whose subtree counts are cached.
using table_depth_func_t = std::function<int(int depth)>;

/*
 * Counts the leaves of the game tree rooted at state, depth plies deep. A terminal state reached
 * before depth plies counts as a single leaf.
 *
 * perft(init_state, 9) for tic-tac-toe is 255168, the number of distinct complete games.
 */
template <core::concepts::Game Game>
PerftResult perft(const typename Game::State& state, int depth);

/*
 * Same count as perft(), but subtree counts of positions within table_depth plies of the root are
 * cached in a transposition table keyed by (state, remaining depth). A position reached again by
 * a different move order is then counted once and reused.
 *
 * table_depth 0 disables the table.
 */
template <core::concepts::Game Game>
  requires concepts::HashableState<typename Game::State>
PerftResult perft_with_table(const typename Game::State& state, int depth, int table_depth);

/*
 * perft_with_table() for every depth in [min_depth, max_depth], each with a fresh table. By
 * default the table covers the whole tree.
 */
template <core::concepts::Game Game>
  requires concepts::HashableState<typename Game::State>
std::vector<PerftResult> incremental_perft(
  const typename Game::State& state, int min_depth, int max_depth,
  table_depth_func_t table_depth = [](int depth) { return depth; });

std::string format_nodes_per_second(double nodes_per_second);

}  // namespace search

#include "inline/search/Perft.inl"
