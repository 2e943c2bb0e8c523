#include "search/Perft.hpp"

#include <spdlog/fmt/fmt.h>

#include <chrono>

namespace search {

double PerftResult::nodes_per_second() const {
  double seconds = std::chrono::duration<double>(elapsed).count();
  if (seconds <= 0) return 0;
  return leaf_nodes / seconds;
}

std::string PerftResult::nodes_per_second_str() const {
  return format_nodes_per_second(nodes_per_second());
}

std::string format_nodes_per_second(double nodes_per_second) {
  constexpr const char* kUnits[] = {"n/s", "Kn/s", "Mn/s", "Gn/s", "Tn/s", "Pn/s", "En/s"};
  constexpr int kNumUnits = sizeof(kUnits) / sizeof(kUnits[0]);

  double value = nodes_per_second;
  int unit = 0;
  while (value >= 1000.0 && unit < kNumUnits - 1) {
    value /= 1000.0;
    ++unit;
  }
  return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

}  // namespace search
