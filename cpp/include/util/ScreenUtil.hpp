#pragma once

namespace util {

// Width of the attached terminal, or 80 if stdout is not a terminal.
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
