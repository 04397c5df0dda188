#pragma once
/*
 * Style
 *
 * Purpose: minimal cell style model (fg/bg color + text modifiers).
 * Note: color values follow the curses numbering; Reset means terminal default.
 */
#include <cstdint>
#include <cstddef>

enum class Color : short {
  Reset = -1,
  Black = 0,
  Red = 1,
  Green = 2,
  Yellow = 3,
  Blue = 4,
  Magenta = 5,
  Cyan = 6,
  White = 7,
};

enum Modifier : std::uint16_t {
  ModNone = 0,
  ModBold = 1 << 0,
  ModDim = 1 << 1,
  ModItalic = 1 << 2,
  ModUnderline = 1 << 3,
  ModBlink = 1 << 4,
  ModReverse = 1 << 5,
};

struct Style {
  Color fg = Color::Reset;
  Color bg = Color::Reset;
  std::uint16_t add_modifier = ModNone;

  Style& set_fg(Color c) { fg = c; return *this; }
  Style& set_bg(Color c) { bg = c; return *this; }
  Style& add(std::uint16_t m) { add_modifier = static_cast<std::uint16_t>(add_modifier | m); return *this; }
  Style& remove(std::uint16_t m) { add_modifier = static_cast<std::uint16_t>(add_modifier & ~m); return *this; }
  bool has(std::uint16_t m) const { return (add_modifier & m) == m; }

  // overlay: non-Reset colors of `other` win, modifiers accumulate
  Style patch(const Style& other) const;
};

inline bool operator==(const Style& a, const Style& b) {
  return a.fg == b.fg && a.bg == b.bg && a.add_modifier == b.add_modifier;
}
inline bool operator!=(const Style& a, const Style& b) { return !(a == b); }

std::size_t hash_style(const Style& s);
