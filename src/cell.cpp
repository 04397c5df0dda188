#include "cell.hpp"
#include "unicode_width.hpp"
#include <functional>

int Cell::width() const {
  if (symbol.empty()) return 0;
  // symbols are stored already split, so an ASCII first byte means one column
  if (static_cast<unsigned char>(symbol[0]) < 0x80) return 1;
  return symbol_width(symbol);
}

std::size_t hash_cell(const Cell& c) {
  return std::hash<std::string>{}(c.symbol) * 31 + hash_style(c.style);
}
