#pragma once

#include "core/AbstractAgent.hpp"
#include "core/concepts/GameConcept.hpp"

#include <string>

namespace generic {

/*
 * FirstLegalAgent always chooses the first action in Rules::get_legal_actions() order.
 */
template <core::concepts::Game Game>
class FirstLegalAgent : public core::AbstractAgent<Game> {
 public:
  using State = Game::State;
  using Action = Game::Action;

  Action decide(const State& state, core::duration_t) override {
    return this->get_legal_actions_or_throw(state)[0];
  }

  std::string get_name() const override { return "FirstLegal"; }
};

}  // namespace generic
