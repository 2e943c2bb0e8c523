#pragma once

#include "core/AbstractAgent.hpp"
#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <condition_variable>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>

namespace core {

/*
 * Runs one AbstractAgent::decide() call on its own thread, and waits for it for at most
 * time_budget + tolerance.
 *
 * The thread is detached. If the wait expires, the call is abandoned: the thread keeps running
 * until decide() returns, holding its own copies of the agent pointer and the state, and its
 * eventual result is discarded. Nothing the caller owns is touched after run() returns.
 */
template <concepts::Game Game>
class DecisionTask {
 public:
  using State = Game::State;
  using Action = Game::Action;
  using Agent_sptr = AbstractAgent_sptr<Game>;

  enum status_t : int8_t { kDecided, kFailed, kTimedOut };

  struct Result {
    status_t status;
    std::optional<Action> action;  // set iff kDecided
    std::exception_ptr exception;  // set iff kFailed
    duration_t elapsed;
  };

  static Result run(Agent_sptr agent, const State& state, duration_t time_budget,
                    duration_t tolerance);

 private:
  struct Channel {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::optional<Action> action;
    std::exception_ptr exception;
    duration_t elapsed{0};
  };
};

}  // namespace core

#include "inline/core/DecisionTask.inl"
