#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: pending key state of the list view: a count prefix ("3j") and a
 *          doubled operator key ("dd", "2dd").
 */

class Input {
public:
  // counts saturate here
  static constexpr size_t kMaxCount = 99999;

  // true when ch repeats the pending operator key
  bool consume_double(int ch, int op);
  bool consume_digit(int ch);
  bool has_count() const { return count_ > 0; }
  // pending count or `fallback` when none was typed; clears it
  size_t take_count(size_t fallback = 1);
  bool pending_op() const { return op_ != 0; }
  void reset();
private:
  int op_ = 0;
  size_t count_ = 0;
};
