#pragma once
/*
 * InputField
 *
 * Purpose: single/multi-line ASCII text field with an insertion cursor;
 *          lays its text out with text_wrap and maps the cursor offset to a
 *          screen cell.
 * Constraint: holds only the text and the offset. Lines and cursor cells are
 *             recomputed on every call so they always match the buffer.
 */
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include "gap_buffer.hpp"
#include "iterminal.hpp"
#include "layout.hpp"
#include "text_wrap.hpp"

struct CursorPos {
  uint16_t x = 0;
  uint16_t y = 0;
  bool operator==(const CursorPos& o) const { return x == o.x && y == o.y; }
};

// Screen cell of the character at `index` in the laid-out text.
CursorPos cursor_at(const std::vector<std::string>& lines, size_t text_len,
                    const Rect& area, size_t index);

class InputField {
public:
  InputField() = default;
  explicit InputField(WrapMode wrapping) : wrapping_(wrapping) {}

  bool set_input(const std::string& input, std::string& msg);
  std::string text() const { return buf_.text(); }
  size_t length() const { return buf_.length(); }
  bool empty() const { return buf_.empty(); }

  void set_wrapping(WrapMode wrapping) { wrapping_ = wrapping; }
  WrapMode wrapping() const { return wrapping_; }

  size_t cursor() const { return cursor_; }
  void set_cursor(size_t offset);

  bool insert_char(int ch);
  bool backspace();
  bool delete_char();
  void move_left();
  void move_right();
  void move_home();
  void move_end();

  std::vector<std::string> lines(const Rect& area) const;
  CursorPos cursor_at(const Rect& area, size_t index) const;
  CursorPos cursor_pos(const Rect& area) const { return cursor_at(area, cursor_); }
  void render(ITerminal& term, const Rect& area) const;

private:
  GapBuffer buf_;
  size_t cursor_ = 0;
  WrapMode wrapping_ = WrapMode::Word;
};
