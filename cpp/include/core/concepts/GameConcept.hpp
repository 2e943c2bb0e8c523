#pragma once

#include "core/concepts/GameConstantsConcept.hpp"
#include "core/concepts/GameIOConcept.hpp"
#include "core/concepts/GameRulesConcept.hpp"

#include <concepts>

namespace core {

namespace concepts {

/*
 * All Game classes G must satisfy core::concepts::Game<G>.
 */
template <class G>
concept Game = requires {
  requires core::concepts::GameConstants<typename G::Constants>;

  requires std::copyable<typename G::State>;
  requires std::equality_comparable<typename G::State>;
  requires std::copyable<typename G::Action>;
  requires std::equality_comparable<typename G::Action>;

  requires core::concepts::GameRules<typename G::Rules, typename G::State, typename G::Action>;
  requires core::concepts::GameIO<typename G::IO, typename G::State, typename G::Action>;

  // Any game-specific one-time static-initialization code should be placed in a static method
  // called static_init(). It may be called more than once.
  { G::static_init() };
};

}  // namespace concepts

}  // namespace core
