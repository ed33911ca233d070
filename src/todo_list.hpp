#pragma once
/*
 * TodoList
 *
 * Purpose: todo items plus the list selection the list view scrolls through.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class Status { Todo, Completed };

struct TodoItem {
  Status status = Status::Todo;
  std::string todo;
  std::string info;
};

std::string display_line(const TodoItem& item);

class TodoList {
public:
  TodoList() = default;
  explicit TodoList(std::vector<TodoItem> items);

  const std::vector<TodoItem>& items() const { return items_; }
  size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const TodoItem& at(size_t i) const { return items_[i]; }

  std::optional<size_t> selected() const { return selected_; }
  const TodoItem* selected_item() const;
  void select(std::optional<size_t> index);
  void select_next();
  void select_previous();
  void select_first();
  void select_last();

  bool toggle_status();
  size_t add(TodoItem item);
  bool replace(size_t index, TodoItem item);
  bool remove_selected();
  void assign(std::vector<TodoItem> items);

private:
  std::vector<TodoItem> items_;
  std::optional<size_t> selected_;
};
