#pragma once
/*
 * GapBuffer
 *
 * Purpose: byte buffer behind the input field; edits cluster at the cursor,
 *          so the gap follows the last edit position.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

class GapBuffer {
public:
  size_t length() const;
  bool empty() const { return length() == 0; }
  void assign(std::string_view text);
  void insert_at(size_t pos, std::string_view text);
  void erase_range(size_t pos, size_t len);
  std::string text() const;

private:
  void move_gap_to(size_t pos);
  void ensure_gap(size_t need);

  std::vector<char> buf_;
  size_t gap_start_ = 0;
  size_t gap_end_ = 0;
};
