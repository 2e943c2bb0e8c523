#include "core/ContestError.hpp"

#include <utility>

namespace core {

template <typename... Ts>
ContestError::ContestError(ErrorKind kind, seat_index_t seat, ply_t ply,
                           fmt::format_string<Ts...> fmt, Ts&&... ts) {
  init(kind, seat, ply, fmt::format(fmt, std::forward<Ts>(ts)...));
}

template <typename... Ts>
ContestError::ContestError(ErrorKind kind, fmt::format_string<Ts...> fmt, Ts&&... ts) {
  init(kind, -1, -1, fmt::format(fmt, std::forward<Ts>(ts)...));
}

inline ContestError ContestError::attributed_to(seat_index_t seat, ply_t ply) const {
  return ContestError(kind_, seat, ply, "{}", detail_);
}

}  // namespace core
