#pragma once
/*
 * Unicode width
 *
 * Purpose: UTF-8 decode, split text into graphemes, report terminal column width.
 * Note: locale independent table; zero-width code points join the previous grapheme.
 */
#include <string>
#include <string_view>
#include <vector>

struct Grapheme {
  std::string symbol;
  int width = 1;
};

// bytes consumed (>=1); invalid sequences decode to U+FFFD and consume one byte
int utf8_decode(std::string_view s, size_t pos, char32_t& out);
int char_width(char32_t cp);
int symbol_width(std::string_view symbol);
int display_width(std::string_view text);
std::vector<Grapheme> split_graphemes(std::string_view text);
