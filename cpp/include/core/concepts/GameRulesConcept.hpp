#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <vector>

namespace core {
namespace concepts {

/*
 * States are values: apply() returns the successor and never modifies its input.
 *
 * get_legal_actions() must return an empty vector iff is_terminal() is true, and must enumerate in
 * a stable order. apply() on an action outside get_legal_actions() must throw.
 *
 * get_utility() is only defined for terminal states, and must be zero-sum across the two seats.
 */
template <typename GR, typename State, typename Action>
concept GameRules = requires(const State& state, const Action& action, core::seat_index_t seat) {
  { GR::init_state() } -> std::same_as<State>;
  { GR::get_current_player(state) } -> std::same_as<core::seat_index_t>;
  { GR::get_legal_actions(state) } -> std::same_as<std::vector<Action>>;
  { GR::apply(state, action) } -> std::same_as<State>;
  { GR::is_terminal(state) } -> std::same_as<bool>;
  { GR::get_utility(state, seat) } -> std::same_as<core::utility_t>;
};

}  // namespace concepts
}  // namespace core
