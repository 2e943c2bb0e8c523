#pragma once

#include "core/BasicTypes.hpp"
#include "util/CppUtil.hpp"

#include <concepts>

namespace core {
namespace concepts {

template <class GC>
concept GameConstants = requires {
  // The name of the game, used in log messages.
  { util::decay_copy(GC::kGameName) } -> std::same_as<const char*>;

  // kNumPlayers is the number of players in the game. Must be core::kNumPlayers.
  { util::decay_copy(GC::kNumPlayers) } -> std::same_as<int>;
  requires GC::kNumPlayers == core::kNumPlayers;

  // kMaxUtility is the utility a decisive win awards the winner (the loser gets -kMaxUtility). A
  // forfeit is scored the same way.
  { util::decay_copy(GC::kMaxUtility) } -> std::same_as<core::utility_t>;
  requires GC::kMaxUtility > 0;
};

}  // namespace concepts
}  // namespace core
