#include "style.hpp"

Style Style::patch(const Style& other) const {
  Style s = *this;
  if (other.fg != Color::Reset) s.fg = other.fg;
  if (other.bg != Color::Reset) s.bg = other.bg;
  s.add_modifier = static_cast<std::uint16_t>(s.add_modifier | other.add_modifier);
  return s;
}

std::size_t hash_style(const Style& s) {
  std::size_t h = static_cast<std::size_t>(static_cast<short>(s.fg) + 1);
  h = h * 31 + static_cast<std::size_t>(static_cast<short>(s.bg) + 1);
  h = h * 31 + s.add_modifier;
  return h;
}
