#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "layout.hpp"

struct TermSize { int rows; int cols; };

// key codes shared by all backends; ncurses KEY_* values are translated
namespace keys {
constexpr int Tab = 9;
constexpr int Enter = 10;
constexpr int Esc = 27;
constexpr int Backspace = 127;
constexpr int Up = 0x101;
constexpr int Down = 0x102;
constexpr int Left = 0x103;
constexpr int Right = 0x104;
constexpr int Home = 0x105;
constexpr int End = 0x106;
constexpr int Delete = 0x107;
constexpr int Resize = 0x108;
constexpr int Unknown = 0x1ff;
}

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text) = 0;
  virtual void draw_box(const Rect& area, const std::string& title) = 0;
  virtual void draw_hline(int row, int col, int len) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
  // false once no more input can arrive
  virtual bool read_key(int& ch) = 0;
};
