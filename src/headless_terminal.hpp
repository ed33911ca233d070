#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render checks.
 * Records every cell drawn and which cells were highlighted; keys are
 * replayed from a script and read_key() reports end of input when it runs dry.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text) override;
  void draw_box(const Rect& area, const std::string& title) override;
  void draw_hline(int row, int col, int len) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  bool read_key(int& ch) override;

  void push_keys(const std::string& keys);
  void push_key(int ch);

  const std::string& row_text(int row) const;
  bool contains(const std::string& needle) const;
  bool highlighted(int row, int col) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, const std::string& text, bool hl);

  int rows_;
  int cols_;
  std::vector<std::string> cells_;
  std::vector<std::vector<bool>> hl_;
  std::deque<int> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = true;
  int refresh_count_ = 0;
};
