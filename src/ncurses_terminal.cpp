#include "ncurses_terminal.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kTextPair, -1, -1);
      init_pair(kBorderPair, COLOR_WHITE, -1);
    } else {
      init_pair(kTextPair, COLOR_WHITE, COLOR_BLACK); // fallback
      init_pair(kBorderPair, COLOR_WHITE, COLOR_BLACK);
    }
    colors_ = true;
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (colors_) attron(COLOR_PAIR(kTextPair));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(kTextPair));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text) {
  attron(A_REVERSE | A_BOLD);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE | A_BOLD);
}

void NcursesTerminal::draw_box(const Rect& area, const std::string& title) {
  if (area.width < 2 || area.height < 2) return;
  int top = area.y, left = area.x;
  int bottom = area.y + area.height - 1, right = area.x + area.width - 1;
  if (colors_) attron(COLOR_PAIR(kBorderPair));
  mvhline(top, left + 1, ACS_HLINE, area.width - 2);
  mvhline(bottom, left + 1, ACS_HLINE, area.width - 2);
  mvvline(top + 1, left, ACS_VLINE, area.height - 2);
  mvvline(top + 1, right, ACS_VLINE, area.height - 2);
  mvaddch(top, left, ACS_ULCORNER);
  mvaddch(top, right, ACS_URCORNER);
  mvaddch(bottom, left, ACS_LLCORNER);
  mvaddch(bottom, right, ACS_LRCORNER);
  if (!title.empty() && area.width > 2) {
    int len = std::min<int>((int)title.size(), area.width - 2);
    int col = left + 1 + (area.width - 2 - len) / 2;
    mvaddnstr(top, col, title.c_str(), len);
  }
  if (colors_) attroff(COLOR_PAIR(kBorderPair));
}

void NcursesTerminal::draw_hline(int row, int col, int len) {
  if (len <= 0) return;
  mvhline(row, col, ACS_HLINE, len);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

bool NcursesTerminal::read_key(int& ch) {
  int c = getch();
  switch (c) {
    case ERR: ch = keys::Unknown; return true;
    case KEY_UP: ch = keys::Up; break;
    case KEY_DOWN: ch = keys::Down; break;
    case KEY_LEFT: ch = keys::Left; break;
    case KEY_RIGHT: ch = keys::Right; break;
    case KEY_HOME: ch = keys::Home; break;
    case KEY_END: ch = keys::End; break;
    case KEY_DC: ch = keys::Delete; break;
    case KEY_BACKSPACE: case 8: ch = keys::Backspace; break;
    case KEY_ENTER: case '\r': ch = keys::Enter; break;
    case KEY_RESIZE: ch = keys::Resize; break;
    default: ch = (c >= 0 && c < 128) ? c : keys::Unknown; break;
  }
  return true;
}
