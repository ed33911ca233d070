#include "input.hpp"
#include <algorithm>

bool Input::consume_double(int ch, int op) {
  if (ch != op) { op_ = 0; return false; }
  if (op_ == op) { op_ = 0; return true; }
  op_ = op;
  return false;
}

bool Input::consume_digit(int ch) {
  // a leading 0 is not a count
  if (ch < '0' || ch > '9' || (ch == '0' && count_ == 0)) return false;
  count_ = std::min(count_ * 10 + static_cast<size_t>(ch - '0'), kMaxCount);
  return true;
}

size_t Input::take_count(size_t fallback) {
  size_t c = count_ > 0 ? count_ : fallback;
  count_ = 0;
  return c;
}

void Input::reset() {
  op_ = 0;
  count_ = 0;
}
