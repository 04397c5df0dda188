#include "unicode_width.hpp"

namespace {

struct Range { char32_t lo; char32_t hi; };

constexpr Range kZeroWidth[] = {
  {0x0300, 0x036F}, {0x0483, 0x0489}, {0x0591, 0x05BD}, {0x0610, 0x061A},
  {0x064B, 0x065F}, {0x0E31, 0x0E31}, {0x0E34, 0x0E3A}, {0x0E47, 0x0E4E},
  {0x1AB0, 0x1AFF}, {0x1DC0, 0x1DFF}, {0x200B, 0x200F}, {0x2028, 0x202E},
  {0x2060, 0x206F}, {0x20D0, 0x20FF}, {0xFE00, 0xFE0F}, {0xFE20, 0xFE2F},
  {0xFEFF, 0xFEFF}, {0x1F3FB, 0x1F3FF}, {0xE0100, 0xE01EF},
};

constexpr Range kWide[] = {
  {0x1100, 0x115F}, {0x2E80, 0x303E}, {0x3041, 0x33FF}, {0x3400, 0x4DBF},
  {0x4E00, 0x9FFF}, {0xA000, 0xA4CF}, {0xA960, 0xA97F}, {0xAC00, 0xD7A3},
  {0xF900, 0xFAFF}, {0xFE30, 0xFE4F}, {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6},
  {0x1F300, 0x1F64F}, {0x1F680, 0x1F6FF}, {0x1F900, 0x1F9FF}, {0x1FA70, 0x1FAFF},
  {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

template <size_t N>
bool in_table(const Range (&table)[N], char32_t cp) {
  size_t lo = 0, hi = N;
  while (lo < hi) {
    size_t mid = (lo + hi) / 2;
    if (cp < table[mid].lo) hi = mid;
    else if (cp > table[mid].hi) lo = mid + 1;
    else return true;
  }
  return false;
}

} // namespace

int utf8_decode(std::string_view s, size_t pos, char32_t& out) {
  unsigned char c = static_cast<unsigned char>(s[pos]);
  size_t rem = s.size() - pos;
  auto cont = [&](size_t i) { return (static_cast<unsigned char>(s[pos + i]) & 0xC0) == 0x80; };
  if (c < 0x80) { out = c; return 1; }
  if ((c & 0xE0) == 0xC0 && rem >= 2 && cont(1)) {
    out = (char32_t(c & 0x1F) << 6) | (s[pos + 1] & 0x3F);
    return 2;
  }
  if ((c & 0xF0) == 0xE0 && rem >= 3 && cont(1) && cont(2)) {
    out = (char32_t(c & 0x0F) << 12) | (char32_t(s[pos + 1] & 0x3F) << 6) | (s[pos + 2] & 0x3F);
    return 3;
  }
  if ((c & 0xF8) == 0xF0 && rem >= 4 && cont(1) && cont(2) && cont(3)) {
    out = (char32_t(c & 0x07) << 18) | (char32_t(s[pos + 1] & 0x3F) << 12) |
          (char32_t(s[pos + 2] & 0x3F) << 6) | (s[pos + 3] & 0x3F);
    return 4;
  }
  out = 0xFFFD;
  return 1;
}

int char_width(char32_t cp) {
  if (cp == 0) return 0;
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 0;
  if (cp == 0x00AD) return 0;
  if (in_table(kZeroWidth, cp)) return 0;
  if (in_table(kWide, cp)) return 2;
  return 1;
}

int symbol_width(std::string_view symbol) {
  // first non-zero code point decides; the rest are combining marks or joiners
  for (size_t i = 0; i < symbol.size();) {
    char32_t cp = 0;
    i += static_cast<size_t>(utf8_decode(symbol, i, cp));
    int w = char_width(cp);
    if (w > 0) return w;
  }
  return 0;
}

int display_width(std::string_view text) {
  int total = 0;
  for (const auto& g : split_graphemes(text)) total += g.width;
  return total;
}

std::vector<Grapheme> split_graphemes(std::string_view text) {
  std::vector<Grapheme> out;
  bool join_next = false;
  for (size_t i = 0; i < text.size();) {
    char32_t cp = 0;
    int len = utf8_decode(text, i, cp);
    std::string_view bytes = text.substr(i, static_cast<size_t>(len));
    if (cp == 0xFFFD && len == 1) bytes = "\xEF\xBF\xBD"; // store the replacement, not the bad byte
    i += static_cast<size_t>(len);
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) { join_next = false; continue; }
    int w = char_width(cp);
    if ((w == 0 || join_next) && !out.empty()) {
      out.back().symbol.append(bytes);
      join_next = (cp == 0x200D);
      continue;
    }
    join_next = false;
    if (w == 0) continue;
    out.push_back(Grapheme{std::string(bytes), w});
  }
  return out;
}
