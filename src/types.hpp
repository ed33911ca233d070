#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight view state (list / edit, edit mode, focus).
 * Principle: the edit mode exists only inside EditView, so a list view can
 *            never carry a stale or missing editor mode.
 */
#include <cstddef>
#include <optional>
#include <variant>

enum class EditMode { Normal, Insert };
enum class Field { Todo, Info };

struct ListView {};

struct EditView {
  EditMode mode = EditMode::Insert;
  Field focus = Field::Todo;
  std::optional<size_t> target; // item being edited; empty for a new item
};

using ViewState = std::variant<ListView, EditView>;

struct Viewport { int top_line = 0; };
