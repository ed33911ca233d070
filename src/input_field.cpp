#include "input_field.hpp"
#include <algorithm>
#include <cctype>

CursorPos cursor_at(const std::vector<std::string>& lines, size_t text_len,
                    const Rect& area, size_t index) {
  if (text_len == 0) return {area.x, area.y};
  index = std::min(index, text_len - 1);
  uint16_t y = 0;
  for (const auto& line : lines) {
    if (index >= line.size()) {
      index -= line.size();
      y++;
      continue;
    }
    return {static_cast<uint16_t>(area.x + index), static_cast<uint16_t>(area.y + y)};
  }
  // index lies past a truncated last line
  uint16_t w = area.width > 0 ? area.width - 1 : 0;
  uint16_t h = area.height > 0 ? area.height - 1 : 0;
  return {static_cast<uint16_t>(area.x + w), static_cast<uint16_t>(area.y + h)};
}

bool InputField::set_input(const std::string& input, std::string& msg) {
  if (!is_ascii_text(input)) { msg = "input field accepts ascii text only"; return false; }
  buf_.assign(input);
  cursor_ = std::min(cursor_, buf_.length());
  return true;
}

void InputField::set_cursor(size_t offset) { cursor_ = std::min(offset, buf_.length()); }

bool InputField::insert_char(int ch) {
  if (ch != '\n' && (ch < 32 || ch > 126)) return false;
  char c = static_cast<char>(ch);
  buf_.insert_at(cursor_, std::string_view(&c, 1));
  cursor_++;
  return true;
}

bool InputField::backspace() {
  if (cursor_ == 0) return false;
  buf_.erase_range(cursor_ - 1, 1);
  cursor_--;
  return true;
}

bool InputField::delete_char() {
  if (cursor_ >= buf_.length()) return false;
  buf_.erase_range(cursor_, 1);
  return true;
}

void InputField::move_left() { if (cursor_ > 0) cursor_--; }
void InputField::move_right() { if (cursor_ < buf_.length()) cursor_++; }
void InputField::move_home() { cursor_ = 0; }
void InputField::move_end() { cursor_ = buf_.length(); }

std::vector<std::string> InputField::lines(const Rect& area) const {
  std::vector<std::string> out;
  std::string msg;
  // the buffer only ever holds ascii, so wrapping cannot fail here
  if (!wrap_text(wrapping_, buf_.text(), area.width, area.height, out, msg)) out.clear();
  return out;
}

CursorPos InputField::cursor_at(const Rect& area, size_t index) const {
  return ::cursor_at(lines(area), buf_.length(), area, index);
}

void InputField::render(ITerminal& term, const Rect& area) const {
  int row = area.y;
  for (const auto& line : lines(area)) {
    term.draw_text(row, area.x, line);
    row++;
  }
}
