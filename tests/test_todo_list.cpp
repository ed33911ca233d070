#include "todo_list.hpp"
#include <cassert>
#include <string>
#include <vector>

static TodoList three() {
  return TodoList({{Status::Todo, "one", ""}, {Status::Completed, "two", "b"}, {Status::Todo, "three", "c"}});
}

static void test_selection() {
  TodoList l = three();
  assert(!l.selected());
  l.select_next();
  assert(l.selected() && *l.selected() == 0);
  l.select_next(); l.select_next(); l.select_next();
  assert(*l.selected() == 2);
  l.select_previous();
  assert(*l.selected() == 1);
  l.select_first();
  assert(*l.selected() == 0);
  l.select_previous();
  assert(*l.selected() == 0);
  l.select_last();
  assert(*l.selected() == 2);
  l.select(7);
  assert(*l.selected() == 2);
  l.select(std::nullopt);
  l.select_previous();
  assert(*l.selected() == 2);

  TodoList empty;
  empty.select_next();
  assert(!empty.selected());
  empty.select_last();
  assert(!empty.selected());
  assert(!empty.toggle_status());
  assert(!empty.remove_selected());
}

static void test_toggle_and_display() {
  TodoList l = three();
  assert(!l.toggle_status());
  l.select(1);
  assert(display_line(l.at(1)) == "[x] two");
  assert(l.toggle_status());
  assert(l.at(1).status == Status::Todo);
  assert(display_line(l.at(1)) == "[ ] two");
  assert(l.selected_item() == &l.at(1));
}

static void test_add_replace_remove() {
  TodoList l = three();
  size_t idx = l.add({Status::Todo, "four", "d"});
  assert(idx == 3 && l.size() == 4);
  assert(*l.selected() == 3);
  assert(l.replace(0, {Status::Completed, "uno", "x"}));
  assert(l.at(0).todo == "uno" && l.at(0).status == Status::Completed);
  assert(!l.replace(9, {}));

  l.select(0);
  assert(l.remove_selected());
  assert(l.size() == 3 && *l.selected() == 0);
  assert(l.at(0).todo == "two");
  l.select_last();
  assert(l.remove_selected());
  assert(*l.selected() == 1);
  assert(l.remove_selected() && l.remove_selected());
  assert(l.empty() && !l.selected());

  l.assign({{Status::Todo, "a", ""}});
  assert(l.size() == 1 && *l.selected() == 0);
  l.assign({});
  assert(!l.selected());
}

int main() {
  test_selection();
  test_toggle_and_display();
  test_add_replace_remove();
  return 0;
}
