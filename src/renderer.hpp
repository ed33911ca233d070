#pragma once
/*
 * Renderer
 *
 * Purpose: draw the list view, the edit dialog and the status line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless apart from the list viewport it scrolls; receives
 *             snapshots from App to render.
 */
#include <string>
#include "input_field.hpp"
#include "iterminal.hpp"
#include "layout.hpp"
#include "todo_list.hpp"
#include "types.hpp"

struct EditLayout {
  Rect dialog;
  Rect header;
  Rect todo;
  Rect separator;
  Rect info;
  Rect footer;
};

// screen minus the status row
Rect main_area(const TermSize& sz);
Rect list_inner_area(const Rect& area);
EditLayout edit_layout(const Rect& area);

struct RenderState {
  const TodoList* list = nullptr;
  Viewport* vp = nullptr;
  const ViewState* view = nullptr;
  const InputField* todo_field = nullptr;
  const InputField* info_field = nullptr;
  bool command_active = false;
  std::string cmdline;
  std::string message;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderState& st);
private:
  void render_list(ITerminal& term, const Rect& area, const TodoList& list, Viewport& vp);
  void render_edit(ITerminal& term, const Rect& area, const EditView& ev,
                   const InputField& todo, const InputField& info);
};
