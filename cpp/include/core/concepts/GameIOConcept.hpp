#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <ostream>
#include <string>

namespace core {
namespace concepts {

template <typename GI, typename State, typename Action>
concept GameIO = requires(std::ostream& ss, const State& state, const Action& action) {
  { GI::action_to_str(action) } -> std::same_as<std::string>;
  { GI::player_to_str(core::seat_index_t{}) } -> std::same_as<std::string>;
  { GI::print_state(ss, state) };

  // compact_state_repr is used in logging and in test failure messages
  { GI::compact_state_repr(state) } -> std::same_as<std::string>;
};

}  // namespace concepts
}  // namespace core
