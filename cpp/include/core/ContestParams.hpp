#pragma once

#include "core/BasicTypes.hpp"

#include <optional>

namespace core {

/*
 * Configuration of one contest. Immutable for the life of the contest.
 *
 * forfeit_on_violation has no default: leaving it unset is a configuration error, and on the
 * command line --forfeit-on-violation is a required option.
 */
struct ContestParams {
  auto make_options_description();

  // Throws core::ContestError of kind kConfigurationError if any field is invalid.
  void validate() const;

  duration_t time_budget() const;
  duration_t tolerance() const;

  double time_budget_per_move = 1.0;  // seconds
  double timeout_tolerance = 0.05;    // seconds
  std::optional<bool> forfeit_on_violation;
  bool announce_results = false;
  bool print_states = false;
};

}  // namespace core

#include "inline/core/ContestParams.inl"
