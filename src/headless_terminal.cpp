#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols),
    cells_(rows, std::string(cols, ' ')),
    hl_(rows, std::vector<bool>(cols, false)) {}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  for (auto& r : cells_) r.assign(cols_, ' ');
  for (auto& r : hl_) r.assign(cols_, false);
}

void HeadlessTerminal::put(int row, int col, const std::string& text, bool hl) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    cells_[row][c] = text[i];
    hl_[row][c] = hl;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, false); }

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text) { put(row, col, text, true); }

void HeadlessTerminal::draw_box(const Rect& area, const std::string& title) {
  if (area.width < 2 || area.height < 2) return;
  int top = area.y, left = area.x;
  int bottom = area.y + area.height - 1, right = area.x + area.width - 1;
  std::string edge = "+" + std::string(area.width - 2, '-') + "+";
  put(top, left, edge, false);
  put(bottom, left, edge, false);
  for (int r = top + 1; r < bottom; ++r) {
    put(r, left, "|", false);
    put(r, right, "|", false);
  }
  if (!title.empty()) {
    int len = std::min<int>((int)title.size(), area.width - 2);
    put(top, left + 1 + (area.width - 2 - len) / 2, title.substr(0, len), false);
  }
}

void HeadlessTerminal::draw_hline(int row, int col, int len) {
  if (len > 0) put(row, col, std::string(len, '-'), false);
}

void HeadlessTerminal::move_cursor(int row, int col) { cursor_row_ = row; cursor_col_ = col; }

void HeadlessTerminal::show_cursor(bool visible) { cursor_visible_ = visible; }

void HeadlessTerminal::refresh() { refresh_count_++; }

bool HeadlessTerminal::read_key(int& ch) {
  if (keys_.empty()) return false;
  ch = keys_.front();
  keys_.pop_front();
  return true;
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (unsigned char c : keys) keys_.push_back(c);
}

void HeadlessTerminal::push_key(int ch) { keys_.push_back(ch); }

const std::string& HeadlessTerminal::row_text(int row) const {
  static const std::string empty;
  if (row < 0 || row >= rows_) return empty;
  return cells_[row];
}

bool HeadlessTerminal::contains(const std::string& needle) const {
  for (const auto& r : cells_) if (r.find(needle) != std::string::npos) return true;
  return false;
}

bool HeadlessTerminal::highlighted(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return false;
  return hl_[row][col];
}
