#include "core/DecisionTask.hpp"

#include "util/CppUtil.hpp"

#include <thread>

namespace core {

template <concepts::Game Game>
typename DecisionTask<Game>::Result DecisionTask<Game>::run(Agent_sptr agent, const State& state,
                                                            duration_t time_budget,
                                                            duration_t tolerance) {
  auto channel = std::make_shared<Channel>();
  time_point_t start = steady_clock_t::now();

  std::thread thread([agent, state, time_budget, channel, start]() {
    std::optional<Action> action;
    std::exception_ptr exception;
    try {
      action = agent->decide(state, time_budget);
    } catch (...) {
      // Handed to the waiting thread, which rethrows it.
      exception = std::current_exception();
    }

    std::unique_lock lock(channel->mutex);
    channel->action = action;
    channel->exception = exception;
    channel->elapsed = steady_clock_t::now() - start;
    channel->done = true;
    lock.unlock();
    channel->cv.notify_all();
  });
  thread.detach();

  time_point_t deadline = util::saturating_add(util::saturating_add(start, time_budget), tolerance);
  duration_t limit = deadline - start;

  std::unique_lock lock(channel->mutex);
  bool done = channel->cv.wait_until(lock, deadline, [&] { return channel->done; });

  if (!done || channel->elapsed > limit) {
    duration_t elapsed = done ? channel->elapsed : duration_t(steady_clock_t::now() - start);
    return Result{kTimedOut, std::nullopt, nullptr, elapsed};
  }
  if (channel->exception) {
    return Result{kFailed, std::nullopt, channel->exception, channel->elapsed};
  }
  return Result{kDecided, channel->action, nullptr, channel->elapsed};
}

}  // namespace core
