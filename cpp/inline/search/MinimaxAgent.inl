#include "search/MinimaxAgent.hpp"

#include "core/ContestError.hpp"
#include "util/CppUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace search {

template <core::concepts::Game Game>
MinimaxAgent<Game>::MinimaxAgent(const Params& params, Evaluator_sptr evaluator)
    : params_(validated(params)),
      evaluator_(evaluator),
      prng_(util::Random::make_prng(params.seed)) {
  if (!evaluator_) {
    throw core::ContestError(core::ErrorKind::kConfigurationError, "null evaluator");
  }
}

template <core::concepts::Game Game>
typename Game::Action MinimaxAgent<Game>::decide(const State& state,
                                                 core::duration_t time_budget) {
  core::time_point_t deadline = util::saturating_add(core::steady_clock_t::now(), time_budget);
  SearchResults results = search(state, deadline);

  if (params_.verbose) {
    double ms = std::chrono::duration<double, std::milli>(results.elapsed).count();
    LOG_INFO("{} {}: {} value={:.3f} depth={}{} nodes={} time={:.1f}ms", get_name(),
             IO::player_to_str(Rules::get_current_player(state)),
             IO::action_to_str(*results.best_action), results.value, results.completed_depth,
             results.aborted ? " (aborted)" : "", results.num_nodes, ms);
  }
  return *results.best_action;
}

template <core::concepts::Game Game>
typename MinimaxAgent<Game>::SearchResults MinimaxAgent<Game>::search(
  const State& state, core::time_point_t deadline) {
  core::time_point_t start = core::steady_clock_t::now();

  action_vec_t actions = this->get_legal_actions_or_throw(state);
  SearchContext context{Rules::get_current_player(state), deadline};
  SearchResults results;

  for (int depth = 1; depth <= params_.max_search_depth; ++depth) {
    context.hit_depth_limit = false;
    std::optional<RootResult> root = search_root(context, state, actions, depth);
    if (!root) {
      results.aborted = true;
      break;
    }

    results.best_action = root->action;
    results.value = root->value;
    results.completed_depth = depth;
    LOG_TRACE("{} depth={} best={} value={:.3f} nodes={}", get_name(), depth,
              IO::action_to_str(root->action), root->value, context.num_nodes);

    if (!context.hit_depth_limit) {
      results.exhaustive = true;
      break;
    }
  }

  if (!results.best_action) {
    results.best_action = actions[0];
  }
  results.num_nodes = context.num_nodes;
  results.elapsed = core::steady_clock_t::now() - start;
  return results;
}

template <core::concepts::Game Game>
std::string MinimaxAgent<Game>::get_name() const {
  return fmt::format("Minimax-d{}", params_.max_search_depth);
}

template <core::concepts::Game Game>
const MinimaxParams& MinimaxAgent<Game>::validated(const Params& params) {
  params.validate();
  return params;
}

template <core::concepts::Game Game>
std::optional<typename MinimaxAgent<Game>::RootResult> MinimaxAgent<Game>::search_root(
  SearchContext& context, const State& state, const action_vec_t& actions, int depth) {
  constexpr core::utility_t kInf = std::numeric_limits<core::utility_t>::infinity();

  core::utility_t best = -kInf;
  action_vec_t best_actions;

  for (const Action& action : actions) {
    // For random tie-breaks, lower the window just below best so that children equal to best come
    // back as exact values rather than as bounds.
    core::utility_t alpha = best;
    if (params_.tie_break_policy == kRandom && !best_actions.empty()) {
      alpha = std::nextafter(best, -kInf);
    }

    core::utility_t value = alphabeta(context, Rules::apply(state, action), depth - 1, alpha, kInf);
    if (context.aborted) return std::nullopt;

    if (value > best) {
      best = value;
      best_actions.clear();
      best_actions.push_back(action);
    } else if (value == best && params_.tie_break_policy == kRandom) {
      best_actions.push_back(action);
    }
  }

  return RootResult{break_tie(best_actions), best};
}

template <core::concepts::Game Game>
core::utility_t MinimaxAgent<Game>::alphabeta(SearchContext& context, const State& state,
                                              int depth, core::utility_t alpha,
                                              core::utility_t beta) {
  if (core::steady_clock_t::now() >= context.deadline) {
    context.aborted = true;
    return 0;
  }
  context.num_nodes++;

  if (Rules::is_terminal(state)) {
    return Rules::get_utility(state, context.root_seat);
  }
  if (depth == 0) {
    context.hit_depth_limit = true;
    return evaluator_->evaluate(state, context.root_seat);
  }

  constexpr core::utility_t kInf = std::numeric_limits<core::utility_t>::infinity();
  bool maximizing = Rules::get_current_player(state) == context.root_seat;
  core::utility_t value = maximizing ? -kInf : kInf;

  for (const Action& action : Rules::get_legal_actions(state)) {
    core::utility_t child = alphabeta(context, Rules::apply(state, action), depth - 1, alpha, beta);
    if (context.aborted) return 0;

    if (maximizing) {
      value = std::max(value, child);
      alpha = std::max(alpha, value);
    } else {
      value = std::min(value, child);
      beta = std::min(beta, value);
    }
    if (alpha >= beta) break;
  }
  return value;
}

template <core::concepts::Game Game>
const typename Game::Action& MinimaxAgent<Game>::break_tie(const action_vec_t& tied_actions) {
  if (tied_actions.size() == 1) return tied_actions[0];

  std::lock_guard lock(prng_mutex_);
  return tied_actions[util::Random::uniform_sample(prng_, size_t(0), tied_actions.size())];
}

}  // namespace search
