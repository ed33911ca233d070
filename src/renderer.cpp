#include "renderer.hpp"
#include <algorithm>
#include "config.hpp"

Rect main_area(const TermSize& sz) {
  int rows = std::max(0, sz.rows - 1);
  int cols = std::max(0, sz.cols);
  return Rect{0, 0, static_cast<uint16_t>(cols), static_cast<uint16_t>(rows)};
}

Rect list_inner_area(const Rect& area) {
  return inset(inset(area, 1, 1), 2, 1);
}

EditLayout edit_layout(const Rect& area) {
  EditLayout l;
  l.dialog = centered_area(area, MTODO_EDIT_WIDTH, MTODO_EDIT_HEIGHT);
  std::vector<Rect> rows;
  split_rows(inset(l.dialog, 1, 0),
             {RowConstraint::length(1), RowConstraint::length(2), RowConstraint::fill(1), RowConstraint::length(1)},
             rows);
  l.header = rows[0];
  l.todo = rows[1];
  l.info = rows[2];
  l.footer = rows[3];
  // the todo rows are one line of text over a rule
  if (l.todo.height > 0) {
    l.separator = l.todo;
    l.separator.y = static_cast<uint16_t>(l.todo.y + l.todo.height - 1);
    l.separator.height = 1;
    l.todo.height = static_cast<uint16_t>(l.todo.height - 1);
  }
  return l;
}

void Renderer::render_list(ITerminal& term, const Rect& area, const TodoList& list, Viewport& vp) {
  Rect border = inset(area, 1, 1);
  term.draw_box(border, " TODO ");
  Rect inner = list_inner_area(area);
  if (inner.empty()) return;
  int max_rows = inner.height;
  if (auto sel = list.selected()) {
    int row = static_cast<int>(*sel);
    if (row < vp.top_line) vp.top_line = row;
    if (row >= vp.top_line + max_rows) vp.top_line = row - max_rows + 1;
  }
  vp.top_line = std::clamp(vp.top_line, 0, std::max(0, static_cast<int>(list.size()) - max_rows));
  for (int i = 0; i < max_rows; ++i) {
    size_t idx = static_cast<size_t>(vp.top_line + i);
    if (idx >= list.size()) break;
    std::string line = display_line(list.at(idx));
    if (line.size() > inner.width) line.resize(inner.width);
    if (list.selected() && *list.selected() == idx) {
      line.resize(inner.width, ' ');
      term.draw_highlighted(inner.y + i, inner.x, line);
    } else {
      term.draw_text(inner.y + i, inner.x, line);
    }
  }
}

void Renderer::render_edit(ITerminal& term, const Rect& area, const EditView& ev,
                           const InputField& todo, const InputField& info) {
  EditLayout l = edit_layout(area);
  if (l.dialog.empty()) return;
  term.draw_box(l.dialog, "");
  std::string title = ev.target ? " EDIT TODO " : " NEW TODO ";
  if (!l.header.empty()) term.draw_text(l.header.y, l.header.x, title.substr(0, l.header.width));
  if (!l.separator.empty()) term.draw_hline(l.separator.y, l.separator.x, l.separator.width);
  todo.render(term, l.todo);
  info.render(term, l.info);
  std::string mode = ev.mode == EditMode::Normal ? " NORMAL Mode " : " INSERT Mode ";
  if (!l.footer.empty()) term.draw_text(l.footer.y, l.footer.x, mode.substr(0, l.footer.width));
}

void Renderer::render(ITerminal& term, const RenderState& st) {
  TermSize sz = term.getSize();
  term.clear();
  Rect area = main_area(sz);
  const EditView* ev = st.view ? std::get_if<EditView>(st.view) : nullptr;
  if (ev && st.todo_field && st.info_field) {
    render_edit(term, area, *ev, *st.todo_field, *st.info_field);
  } else if (st.list && st.vp) {
    render_list(term, area, *st.list, *st.vp);
  }

  std::string status = st.command_active ? ":" + st.cmdline : st.message;
  if (sz.cols > 0 && status.size() > static_cast<size_t>(sz.cols)) status.resize(sz.cols);
  if (sz.rows > 0) term.draw_text(sz.rows - 1, 0, status);

  if (st.command_active) {
    term.show_cursor(true);
    term.move_cursor(sz.rows - 1, std::min<int>(static_cast<int>(status.size()), std::max(0, sz.cols - 1)));
  } else if (ev && st.todo_field && st.info_field) {
    EditLayout l = edit_layout(area);
    const InputField& f = ev->focus == Field::Todo ? *st.todo_field : *st.info_field;
    const Rect& r = ev->focus == Field::Todo ? l.todo : l.info;
    CursorPos p = f.cursor_pos(r);
    term.show_cursor(true);
    term.move_cursor(p.y, p.x);
  } else {
    term.show_cursor(false);
  }
  term.refresh();
}
