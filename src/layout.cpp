#include "layout.hpp"
#include <algorithm>

Rect inset(const Rect& area, uint16_t h_margin, uint16_t v_margin) {
  Rect r = area;
  int w = static_cast<int>(area.width) - 2 * h_margin;
  int h = static_cast<int>(area.height) - 2 * v_margin;
  if (w <= 0 || h <= 0) return Rect{area.x, area.y, 0, 0};
  r.x = static_cast<uint16_t>(area.x + h_margin);
  r.y = static_cast<uint16_t>(area.y + v_margin);
  r.width = static_cast<uint16_t>(w);
  r.height = static_cast<uint16_t>(h);
  return r;
}

Rect centered_area(const Rect& area, uint16_t width, uint16_t height) {
  uint16_t w = std::min(width, area.width);
  uint16_t h = std::min(height, area.height);
  Rect r;
  r.x = static_cast<uint16_t>(area.x + (area.width - w) / 2);
  r.y = static_cast<uint16_t>(area.y + (area.height - h) / 2);
  r.width = w;
  r.height = h;
  return r;
}

// Length rows are served top-down first; whatever is left is shared by the
// Fill rows in proportion to their weight, the last Fill row taking the rest.
void split_rows(const Rect& area, const std::vector<RowConstraint>& rows, std::vector<Rect>& out) {
  out.clear();
  if (rows.empty()) return;
  int remaining = area.height;
  std::vector<int> heights(rows.size(), 0);
  int fill_weight = 0;
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i].type == RowConstraint::Type::Length) {
      heights[i] = std::min<int>(rows[i].value, remaining);
      remaining -= heights[i];
    } else {
      fill_weight += rows[i].value;
    }
  }
  if (fill_weight > 0) {
    int pool = remaining;
    int last_fill = -1;
    for (size_t i = 0; i < rows.size(); ++i) {
      if (rows[i].type != RowConstraint::Type::Fill) continue;
      heights[i] = pool * rows[i].value / fill_weight;
      remaining -= heights[i];
      last_fill = static_cast<int>(i);
    }
    if (last_fill >= 0) heights[last_fill] += remaining;
  }
  int y = area.y;
  for (int h : heights) {
    out.push_back(Rect{area.x, static_cast<uint16_t>(y), area.width, static_cast<uint16_t>(h)});
    y += h;
  }
}
