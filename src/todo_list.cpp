#include "todo_list.hpp"
#include <algorithm>
#include <utility>

std::string display_line(const TodoItem& item) {
  return (item.status == Status::Completed ? "[x] " : "[ ] ") + item.todo;
}

TodoList::TodoList(std::vector<TodoItem> items) : items_(std::move(items)) {}

const TodoItem* TodoList::selected_item() const {
  if (!selected_ || *selected_ >= items_.size()) return nullptr;
  return &items_[*selected_];
}

void TodoList::select(std::optional<size_t> index) {
  if (index && *index >= items_.size()) index = items_.empty() ? std::nullopt : std::optional<size_t>(items_.size() - 1);
  selected_ = index;
}

void TodoList::select_next() {
  if (items_.empty()) { selected_.reset(); return; }
  if (!selected_) { selected_ = 0; return; }
  selected_ = std::min(*selected_ + 1, items_.size() - 1);
}

void TodoList::select_previous() {
  if (items_.empty()) { selected_.reset(); return; }
  if (!selected_) { selected_ = items_.size() - 1; return; }
  selected_ = *selected_ > 0 ? *selected_ - 1 : 0;
}

void TodoList::select_first() {
  if (items_.empty()) { selected_.reset(); return; }
  selected_ = 0;
}

void TodoList::select_last() {
  if (items_.empty()) { selected_.reset(); return; }
  selected_ = items_.size() - 1;
}

bool TodoList::toggle_status() {
  if (!selected_ || *selected_ >= items_.size()) return false;
  TodoItem& it = items_[*selected_];
  it.status = it.status == Status::Todo ? Status::Completed : Status::Todo;
  return true;
}

size_t TodoList::add(TodoItem item) {
  items_.push_back(std::move(item));
  selected_ = items_.size() - 1;
  return items_.size() - 1;
}

bool TodoList::replace(size_t index, TodoItem item) {
  if (index >= items_.size()) return false;
  items_[index] = std::move(item);
  return true;
}

bool TodoList::remove_selected() {
  if (!selected_ || *selected_ >= items_.size()) return false;
  size_t idx = *selected_;
  items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(idx));
  if (items_.empty()) selected_.reset();
  else selected_ = idx > 0 ? idx - 1 : 0;
  return true;
}

void TodoList::assign(std::vector<TodoItem> items) {
  items_ = std::move(items);
  if (items_.empty()) selected_.reset();
  else selected_ = 0;
}
