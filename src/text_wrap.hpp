#pragma once
/*
 * TextWrap
 *
 * Purpose: lay out an ASCII text buffer into a fixed width x height grid of
 *          physical lines (word / character / no wrapping).
 * Constraint: pure functions; the layout is recomputed per call, never cached.
 * Contract: ASCII only. Non-ASCII input fails with a message, nothing is
 *           tokenized or wrapped.
 */
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class WrapMode { None, Character, Word };

// half-open byte range [start, end) inside one logical line
struct Token {
  size_t start = 0;
  size_t end = 0;
  size_t length() const { return end - start; }
};

bool is_ascii_text(std::string_view text);

// Alternating whitespace / non-whitespace runs. Empty line -> no tokens.
bool tokenize_ascii(std::string_view line, std::vector<Token>& out, std::string& msg);

bool wrap_words(std::string_view text, uint16_t width, uint16_t height,
                std::vector<std::string>& out, std::string& msg);
bool wrap_chars(std::string_view text, uint16_t width, uint16_t height,
                std::vector<std::string>& out, std::string& msg);
bool wrap_none(std::string_view text, uint16_t width, uint16_t height,
               std::vector<std::string>& out, std::string& msg);

bool wrap_text(WrapMode mode, std::string_view text, uint16_t width, uint16_t height,
               std::vector<std::string>& out, std::string& msg);

std::string_view wrap_mode_name(WrapMode mode);
bool parse_wrap_mode(std::string_view name, WrapMode& out);
