#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <cstdint>
#include <optional>

namespace search {

// Summary of one MinimaxAgent::search() call.
template <core::concepts::Game Game>
struct SearchResults {
  using Action = Game::Action;

  std::optional<Action> best_action;
  core::utility_t value = 0;  // from the root mover's perspective, at completed_depth
  int completed_depth = 0;    // deepest iteration that finished before the deadline
  int64_t num_nodes = 0;
  bool aborted = false;     // the deadline cut an iteration short
  bool exhaustive = false;  // the last completed iteration reached only terminal leaves
  core::duration_t elapsed{0};
};

}  // namespace search
