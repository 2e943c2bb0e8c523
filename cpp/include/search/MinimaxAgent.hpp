#pragma once

#include "core/AbstractAgent.hpp"
#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "search/AbstractEvaluator.hpp"
#include "search/MinimaxParams.hpp"
#include "search/SearchResults.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace search {

/*
 * Depth- and time-bounded minimax search with alpha-beta pruning.
 *
 * Values are always taken from the perspective of the seat to move at the root: nodes where that
 * seat moves maximize, all others minimize. Terminal nodes are valued by Rules::get_utility(), and
 * non-terminal nodes at the depth limit by the evaluator.
 *
 * The search deepens iteratively from depth 1 to params.max_search_depth, stopping early once an
 * iteration reaches only terminal leaves. The deadline is checked at every node. An iteration cut
 * short by the deadline is discarded, and the best action of the deepest completed iteration is
 * returned. If not even depth 1 completes, the first legal action is returned.
 *
 * All search state lives in a per-call context, so one agent can safely play both seats.
 */
template <core::concepts::Game Game>
class MinimaxAgent : public core::AbstractAgent<Game> {
 public:
  using Params = MinimaxParams;
  using State = Game::State;
  using Action = Game::Action;
  using Rules = Game::Rules;
  using IO = Game::IO;
  using Evaluator = AbstractEvaluator<Game>;
  using Evaluator_sptr = std::shared_ptr<const Evaluator>;
  using SearchResults = search::SearchResults<Game>;
  using action_vec_t = std::vector<Action>;

  /*
   * Throws core::ContestError of kind kConfigurationError if params are invalid or evaluator is
   * null.
   */
  MinimaxAgent(const Params& params = Params(),
               Evaluator_sptr evaluator = std::make_shared<NeutralEvaluator<Game>>());

  /*
   * Throws core::ContestError of kind kGameAlreadyOver if state is terminal.
   */
  Action decide(const State& state, core::duration_t time_budget) override;

  /*
   * Same as decide(), but with an absolute deadline, and reporting the search statistics.
   */
  SearchResults search(const State& state, core::time_point_t deadline);

  std::string get_name() const override;
  const Params& params() const { return params_; }

 private:
  struct SearchContext {
    core::seat_index_t root_seat;
    core::time_point_t deadline;
    int64_t num_nodes = 0;
    bool aborted = false;
    bool hit_depth_limit = false;
  };

  struct RootResult {
    Action action;
    core::utility_t value;
  };

  static const Params& validated(const Params& params);

  std::optional<RootResult> search_root(SearchContext& context, const State& state,
                                        const action_vec_t& actions, int depth);
  core::utility_t alphabeta(SearchContext& context, const State& state, int depth,
                            core::utility_t alpha, core::utility_t beta);
  const Action& break_tie(const action_vec_t& tied_actions);

  const Params params_;
  const Evaluator_sptr evaluator_;

  std::mutex prng_mutex_;
  std::mt19937 prng_;
};

}  // namespace search

#include "inline/search/MinimaxAgent.inl"
