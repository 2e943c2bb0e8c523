#include "core/ContestError.hpp"

#include <magic_enum/magic_enum.hpp>

namespace core {

std::string to_str(ErrorKind kind) { return std::string(magic_enum::enum_name(kind)); }

void ContestError::init(ErrorKind kind, seat_index_t seat, ply_t ply, const std::string& detail) {
  kind_ = kind;
  seat_ = seat;
  ply_ = ply;
  detail_ = detail;

  std::string what = to_str(kind);
  if (seat >= 0) what += fmt::format(" seat={}", seat);
  if (ply >= 0) what += fmt::format(" ply={}", ply);
  what += ": ";
  what += detail;
  set_what(what);
}

}  // namespace core
