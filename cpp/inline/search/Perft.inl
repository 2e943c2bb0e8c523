#include "search/Perft.hpp"

#include "util/Asserts.hpp"

#include <boost/functional/hash.hpp>

#include <type_traits>
#include <unordered_map>

namespace search {

namespace detail {

template <typename State>
struct PerftTableKey {
  bool operator==(const PerftTableKey& other) const = default;

  State state;
  int depth;
};

template <typename State>
struct PerftTableKeyHasher {
  std::size_t operator()(const PerftTableKey<State>& key) const {
    std::size_t seed = std::hash<State>{}(key.state);
    boost::hash_combine(seed, key.depth);
    return seed;
  }
};

template <typename State>
using perft_table_t =
  std::unordered_map<PerftTableKey<State>, uint64_t, PerftTableKeyHasher<State>>;

// Table is void when no transposition table is used.
template <core::concepts::Game Game, typename Table>
uint64_t perft_helper(const typename Game::State& state, int depth, Table* table,
                      int table_depth) {
  using Rules = Game::Rules;
  using State = Game::State;

  if (Rules::is_terminal(state)) return 1;

  auto actions = Rules::get_legal_actions(state);
  if (depth == 1) return actions.size();

  uint64_t count = 0;
  for (const auto& action : actions) {
    State child = Rules::apply(state, action);
    if constexpr (std::is_void_v<Table>) {
      count += perft_helper<Game, void>(child, depth - 1, nullptr, 0);
    } else {
      if (table_depth <= 0) {
        count += perft_helper<Game, void>(child, depth - 1, nullptr, 0);
        continue;
      }

      typename Table::key_type key{child, depth - 1};
      auto it = table->find(key);
      if (it == table->end()) {
        uint64_t child_count = perft_helper<Game, Table>(child, depth - 1, table, table_depth - 1);
        it = table->emplace(key, child_count).first;
      }
      count += it->second;
    }
  }
  return count;
}

}  // namespace detail

template <core::concepts::Game Game>
PerftResult perft(const typename Game::State& state, int depth) {
  RELEASE_ASSERT(depth >= 0, "perft depth must be non-negative (got {})", depth);

  PerftResult result;
  result.depth = depth;
  if (depth == 0) {
    result.leaf_nodes = 1;
    return result;
  }

  core::time_point_t start = core::steady_clock_t::now();
  result.leaf_nodes = detail::perft_helper<Game, void>(state, depth, nullptr, 0);
  result.elapsed = core::steady_clock_t::now() - start;
  return result;
}

template <core::concepts::Game Game>
  requires concepts::HashableState<typename Game::State>
PerftResult perft_with_table(const typename Game::State& state, int depth, int table_depth) {
  RELEASE_ASSERT(depth >= 0, "perft depth must be non-negative (got {})", depth);
  RELEASE_ASSERT(table_depth >= 0, "perft table depth must be non-negative (got {})",
                 table_depth);

  PerftResult result;
  result.depth = depth;
  if (depth == 0) {
    result.leaf_nodes = 1;
    return result;
  }

  detail::perft_table_t<typename Game::State> table;
  core::time_point_t start = core::steady_clock_t::now();
  result.leaf_nodes = detail::perft_helper<Game>(state, depth, &table, table_depth);
  result.elapsed = core::steady_clock_t::now() - start;
  result.table_size = table.size();
  return result;
}

template <core::concepts::Game Game>
  requires concepts::HashableState<typename Game::State>
std::vector<PerftResult> incremental_perft(const typename Game::State& state, int min_depth,
                                           int max_depth, table_depth_func_t table_depth) {
  RELEASE_ASSERT(0 <= min_depth && min_depth <= max_depth, "invalid perft depth range [{}, {}]",
                 min_depth, max_depth);

  std::vector<PerftResult> results;
  for (int depth = min_depth; depth <= max_depth; ++depth) {
    results.push_back(perft_with_table<Game>(state, depth, table_depth(depth)));
  }
  return results;
}

}  // namespace search
