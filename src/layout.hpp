#pragma once
/*
 * Layout
 *
 * Purpose: screen rectangles and the few splits the views need
 *          (margins, centered dialog, stacked rows).
 */
#include <cstdint>
#include <vector>

struct Rect {
  uint16_t x = 0;
  uint16_t y = 0;
  uint16_t width = 0;
  uint16_t height = 0;

  bool empty() const { return width == 0 || height == 0; }
};

struct RowConstraint {
  enum class Type { Length, Fill };
  Type type = Type::Length;
  uint16_t value = 0; // rows for Length, weight for Fill

  static RowConstraint length(uint16_t n) { return {Type::Length, n}; }
  static RowConstraint fill(uint16_t weight) { return {Type::Fill, weight}; }
};

Rect inset(const Rect& area, uint16_t h_margin, uint16_t v_margin);
Rect centered_area(const Rect& area, uint16_t width, uint16_t height);
void split_rows(const Rect& area, const std::vector<RowConstraint>& rows, std::vector<Rect>& out);
