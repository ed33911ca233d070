#include "text_wrap.hpp"
#include <algorithm>
#include <cctype>

static inline bool is_space(unsigned char c) {
  return std::isspace(c) != 0;
}

// Logical lines split on '\n'. A trailing '\n' does not open a further line.
static std::vector<std::string_view> split_logical_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t st = 0;
  while (st < text.size()) {
    size_t pos = text.find('\n', st);
    if (pos == std::string_view::npos) { lines.push_back(text.substr(st)); break; }
    lines.push_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  return lines;
}

bool is_ascii_text(std::string_view text) {
  for (unsigned char c : text) { if (c >= 128) return false; }
  return true;
}

bool tokenize_ascii(std::string_view line, std::vector<Token>& out, std::string& msg) {
  out.clear();
  if (line.empty()) return true;
  size_t start = 0;
  bool in_space = is_space(static_cast<unsigned char>(line[0]));
  for (size_t i = 0; i < line.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(line[i]);
    if (c >= 128) {
      out.clear();
      msg = "non-ascii character at byte " + std::to_string(i);
      return false;
    }
    if (is_space(c) != in_space) {
      out.push_back({start, i});
      start = i;
      in_space = !in_space;
    }
  }
  if (start < line.size()) out.push_back({start, line.size()});
  return true;
}

bool wrap_words(std::string_view text, uint16_t width, uint16_t height,
                std::vector<std::string>& out, std::string& msg) {
  out.clear();
  if (!is_ascii_text(text)) { msg = "cannot wrap non-ascii text"; return false; }
  if (width == 0 || height == 0) return true;
  const size_t w = width;
  const size_t h = height;
  std::vector<Token> tokens;

  for (std::string_view raw_line : split_logical_lines(text)) {
    if (out.size() >= h) return true;
    if (!tokenize_ascii(raw_line, tokens, msg)) { out.clear(); return false; }
    bool pending = false;
    size_t line_start = 0;
    size_t line_end = 0;
    size_t current_len = 0;
    auto flush = [&]() {
      if (pending) out.emplace_back(raw_line.substr(line_start, line_end - line_start));
      pending = false;
      current_len = 0;
    };

    for (const Token& t : tokens) {
      size_t token_len = t.length();
      bool fits = current_len + token_len <= w;

      // the h-th line is never wrapped: extend it to w columns and stop
      if (out.size() + 1 == h && !fits) {
        size_t ls = pending ? line_start : t.start;
        size_t le = std::min(ls + w, t.end);
        out.emplace_back(raw_line.substr(ls, le - ls));
        return true;
      }

      if (token_len > w) {
        flush();
        if (out.size() >= h) return true;
        size_t pos = t.start;
        while (pos < t.end) {
          size_t chunk_end = std::min(pos + w, t.end);
          if (chunk_end < t.end) {
            out.emplace_back(raw_line.substr(pos, chunk_end - pos));
            if (out.size() >= h) return true;
          } else {
            pending = true;
            line_start = pos;
            line_end = chunk_end;
            current_len = chunk_end - pos;
          }
          pos = chunk_end;
        }
        continue;
      }

      if (!fits) {
        flush();
        if (out.size() >= h) return true;
        pending = true;
        line_start = t.start;
        line_end = t.end;
        current_len = token_len;
      } else {
        if (!pending) { pending = true; line_start = t.start; }
        line_end = t.end;
        current_len += token_len;
      }
    }
    flush();
  }
  return true;
}

bool wrap_chars(std::string_view text, uint16_t width, uint16_t height,
                std::vector<std::string>& out, std::string& msg) {
  out.clear();
  if (!is_ascii_text(text)) { msg = "cannot wrap non-ascii text"; return false; }
  if (width == 0 || height == 0) return true;
  for (std::string_view raw_line : split_logical_lines(text)) {
    if (raw_line.empty()) {
      out.emplace_back();
      if (out.size() >= height) return true;
      continue;
    }
    for (size_t pos = 0; pos < raw_line.size(); pos += width) {
      out.emplace_back(raw_line.substr(pos, width));
      if (out.size() >= height) return true;
    }
  }
  return true;
}

bool wrap_none(std::string_view text, uint16_t width, uint16_t height,
               std::vector<std::string>& out, std::string& msg) {
  out.clear();
  if (!is_ascii_text(text)) { msg = "cannot wrap non-ascii text"; return false; }
  if (width == 0 || height == 0) return true;
  for (std::string_view raw_line : split_logical_lines(text)) {
    out.emplace_back(raw_line.substr(0, width));
    if (out.size() >= height) break;
  }
  return true;
}

bool wrap_text(WrapMode mode, std::string_view text, uint16_t width, uint16_t height,
               std::vector<std::string>& out, std::string& msg) {
  switch (mode) {
    case WrapMode::None: return wrap_none(text, width, height, out, msg);
    case WrapMode::Character: return wrap_chars(text, width, height, out, msg);
    case WrapMode::Word: return wrap_words(text, width, height, out, msg);
  }
  out.clear();
  msg = "unknown wrap mode";
  return false;
}

std::string_view wrap_mode_name(WrapMode mode) {
  switch (mode) {
    case WrapMode::None: return "none";
    case WrapMode::Character: return "char";
    case WrapMode::Word: return "word";
  }
  return "unknown";
}

bool parse_wrap_mode(std::string_view name, WrapMode& out) {
  if (name == "none" || name == "nowrap") { out = WrapMode::None; return true; }
  if (name == "char" || name == "character") { out = WrapMode::Character; return true; }
  if (name == "word") { out = WrapMode::Word; return true; }
  return false;
}
