#include "input_field.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <cstdint>
#include <limits>
#include <string>

static InputField make_field(const std::string& text, WrapMode mode = WrapMode::Word) {
  InputField f(mode);
  std::string msg;
  bool ok = f.set_input(text, msg);
  assert(ok);
  return f;
}

static void test_cursor_scenarios() {
  Rect area{1, 1, 5, 5};
  InputField f = make_field("A wrap occurs");
  assert((f.cursor_at(area, 0) == CursorPos{1, 1}));
  assert((f.cursor_at(area, 6) == CursorPos{5, 2}));
  assert((f.cursor_at(area, 12) == CursorPos{1, 4}));
  assert((f.cursor_at(area, std::numeric_limits<size_t>::max()) == CursorPos{1, 4}));
  assert((f.cursor_at(area, 13) == f.cursor_at(area, 12)));

  InputField empty;
  assert((empty.cursor_at(area, 1) == CursorPos{1, 1}));
  assert((empty.cursor_at(area, 0) == CursorPos{1, 1}));
}

static void test_cursor_monotonic() {
  Rect area{2, 3, 6, 20};
  InputField f = make_field("the quick brown fox jumps over a lazy dog again");
  auto lines = f.lines(area);
  size_t len = f.length();
  for (size_t i = 0; i + 1 < len; ++i) {
    CursorPos a = f.cursor_at(area, i);
    CursorPos b = f.cursor_at(area, i + 1);
    bool same_row = b.y == a.y && b.x == a.x + 1;
    bool next_row = b.y == a.y + 1 && b.x == area.x;
    assert(same_row || next_row);
    assert(a.x >= area.x && a.x < area.x + area.width);
    assert(a.y >= area.y && a.y < area.y + area.height);
  }
  assert(lines.size() <= area.height);
}

static void test_cursor_past_truncation() {
  Rect area{0, 0, 5, 2};
  InputField f = make_field("aaa bbb ccc");
  auto lines = f.lines(area);
  assert(lines.size() == 2);
  assert(lines[1] == "bbb c");
  assert((f.cursor_at(area, 8) == CursorPos{4, 1}));
  // 'c' at 9 and 10 were dropped by the truncated last line
  assert((f.cursor_at(area, 9) == CursorPos{4, 1}));
  assert((f.cursor_at(area, 10) == CursorPos{4, 1}));

  // degenerate area clamps to its origin
  Rect none{3, 4, 0, 0};
  assert((f.cursor_at(none, 2) == CursorPos{3, 4}));
}

static void test_character_mode_cursor() {
  Rect area{0, 0, 3, 3};
  InputField f = make_field("abcdefg", WrapMode::Character);
  assert((f.cursor_at(area, 4) == CursorPos{1, 1}));
  assert((f.cursor_at(area, 6) == CursorPos{0, 2}));
}

static void test_editing() {
  InputField f;
  assert(f.insert_char('h'));
  assert(f.insert_char('i'));
  assert(f.text() == "hi");
  assert(f.cursor() == 2);
  f.move_home();
  assert(f.insert_char('>'));
  assert(f.text() == ">hi");
  assert(f.cursor() == 1);
  f.move_end();
  assert(f.backspace());
  assert(f.text() == ">h");
  f.move_left();
  assert(f.delete_char());
  assert(f.text() == ">");
  assert(!f.delete_char());
  f.move_home();
  assert(!f.backspace());
  f.move_left();
  assert(f.cursor() == 0);
  f.move_right(); f.move_right();
  assert(f.cursor() == 1);

  assert(!f.insert_char(200));
  assert(!f.insert_char('\t'));
  assert(f.insert_char('\n'));
  assert(f.text() == ">\n");
}

static void test_set_input() {
  InputField f = make_field("abc");
  f.move_end();
  std::string msg;
  assert(!f.set_input("\xe2\x9c\x93 done", msg));
  assert(!msg.empty());
  assert(f.text() == "abc");
  assert(f.set_input("x", msg));
  assert(f.cursor() == 1);
  f.set_cursor(99);
  assert(f.cursor() == 1);
}

static void test_render() {
  HeadlessTerminal term(6, 10);
  InputField f = make_field("A wrap occurs");
  f.render(term, Rect{1, 1, 5, 5});
  assert(term.row_text(1).substr(1, 5) == "A    ");
  assert(term.row_text(2).substr(1, 5) == "wrap ");
  assert(term.row_text(3).substr(1, 5) == "occur");
  assert(term.row_text(4).substr(1, 5) == "s    ");
}

int main() {
  test_cursor_scenarios();
  test_cursor_monotonic();
  test_cursor_past_truncation();
  test_character_mode_cursor();
  test_editing();
  test_set_input();
  test_render();
  return 0;
}
