#include "layout.hpp"
#include "renderer.hpp"
#include <cassert>
#include <vector>

static bool same(const Rect& a, const Rect& b) {
  return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

static void test_inset() {
  Rect screen{0, 0, 80, 23};
  assert(same(inset(screen, 1, 1), Rect{1, 1, 78, 21}));
  assert(same(inset(screen, 2, 0), Rect{2, 0, 76, 23}));
  assert(inset(Rect{5, 5, 3, 3}, 2, 2).empty());
}

static void test_centered_area() {
  Rect screen{0, 0, 80, 23};
  assert(same(centered_area(screen, 40, 15), Rect{20, 4, 40, 15}));
  Rect small{2, 2, 10, 5};
  assert(same(centered_area(small, 40, 15), small));
}

static void test_split_rows() {
  std::vector<Rect> rs;
  Rect area{1, 4, 38, 15};
  split_rows(area, {RowConstraint::length(1), RowConstraint::length(2),
                    RowConstraint::fill(1), RowConstraint::length(1)}, rs);
  assert(rs.size() == 4);
  assert(rs[0].y == 4 && rs[0].height == 1);
  assert(rs[1].y == 5 && rs[1].height == 2);
  assert(rs[2].y == 7 && rs[2].height == 11);
  assert(rs[3].y == 18 && rs[3].height == 1);
  for (const auto& r : rs) assert(r.x == 1 && r.width == 38);

  split_rows(Rect{0, 0, 10, 7}, {RowConstraint::fill(1), RowConstraint::fill(2)}, rs);
  assert(rs.size() == 2);
  assert(rs[0].height + rs[1].height == 7);
  assert(rs[0].height == 2 && rs[1].height == 5);

  // lengths are served first and clipped to the space that exists
  split_rows(Rect{0, 0, 10, 2}, {RowConstraint::length(3), RowConstraint::fill(1)}, rs);
  assert(rs[0].height == 2 && rs[1].height == 0);
}

static void test_view_layouts() {
  Rect area = main_area(TermSize{24, 80});
  assert(same(area, Rect{0, 0, 80, 23}));
  assert(same(list_inner_area(area), Rect{3, 2, 74, 19}));
  EditLayout l = edit_layout(area);
  assert(same(l.dialog, Rect{20, 4, 40, 15}));
  assert(same(l.todo, Rect{21, 5, 38, 1}));
  assert(same(l.separator, Rect{21, 6, 38, 1}));
  assert(same(l.info, Rect{21, 7, 38, 11}));
  assert(l.footer.y == 18);
}

int main() {
  test_inset();
  test_centered_area();
  test_split_rows();
  test_view_layouts();
  return 0;
}
