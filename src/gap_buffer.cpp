#include "gap_buffer.hpp"
#include <algorithm>

static constexpr size_t kMinGap = 16;

size_t GapBuffer::length() const { return buf_.size() - (gap_end_ - gap_start_); }

void GapBuffer::assign(std::string_view text) {
  buf_.assign(text.begin(), text.end());
  buf_.resize(text.size() + kMinGap);
  gap_start_ = text.size();
  gap_end_ = buf_.size();
}

void GapBuffer::ensure_gap(size_t need) {
  size_t avail = gap_end_ - gap_start_;
  if (avail >= need) return;
  size_t grow = std::max(need - avail, kMinGap);
  size_t right = buf_.size() - gap_end_;
  std::vector<char> nb(buf_.size() + grow * 2);
  std::copy(buf_.begin(), buf_.begin() + gap_start_, nb.begin());
  size_t nge = nb.size() - right;
  std::copy(buf_.begin() + gap_end_, buf_.end(), nb.begin() + nge);
  buf_.swap(nb);
  gap_end_ = nge;
}

void GapBuffer::move_gap_to(size_t pos) {
  if (pos == gap_start_) return;
  if (pos < gap_start_) {
    size_t delta = gap_start_ - pos;
    std::copy_backward(buf_.begin() + pos, buf_.begin() + gap_start_, buf_.begin() + gap_end_);
    gap_start_ -= delta; gap_end_ -= delta;
  } else {
    size_t delta = pos - gap_start_;
    std::copy(buf_.begin() + gap_end_, buf_.begin() + gap_end_ + delta, buf_.begin() + gap_start_);
    gap_start_ += delta; gap_end_ += delta;
  }
}

void GapBuffer::insert_at(size_t pos, std::string_view text) {
  if (text.empty()) return;
  pos = std::min(pos, length());
  move_gap_to(pos);
  ensure_gap(text.size());
  std::copy(text.begin(), text.end(), buf_.begin() + gap_start_);
  gap_start_ += text.size();
}

void GapBuffer::erase_range(size_t pos, size_t len) {
  size_t n = length();
  if (pos >= n || len == 0) return;
  len = std::min(len, n - pos);
  move_gap_to(pos);
  gap_end_ += len;
}

std::string GapBuffer::text() const {
  std::string out;
  out.reserve(length());
  out.append(buf_.data(), gap_start_);
  out.append(buf_.data() + gap_end_, buf_.size() - gap_end_);
  return out;
}
