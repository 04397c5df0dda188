#include "ncurses_terminal.hpp"
#include "unicode_width.hpp"
#include <spdlog/spdlog.h>
#define NCURSES_NOMACROS
#include <ncurses.h>

NcursesTerminal::NcursesTerminal(bool enable_color) {
  if (enable_color && has_colors()) {
    start_color();
    if (use_default_colors() != OK) {
      spdlog::debug("ncurses: terminal has no default colors, Reset maps to white on black");
    }
    color_ = true;
  }
}


TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

bool NcursesTerminal::fail(std::string what) {
  error_ = std::move(what);
  return false;
}

bool NcursesTerminal::clear() {
  if (erase() == ERR) return fail("erase failed");
  return true;
}

bool NcursesTerminal::move_cursor(int row, int col) {
  if (move(row, col) == ERR) {
    return fail("move to " + std::to_string(row) + "," + std::to_string(col) + " failed");
  }
  return true;
}

short NcursesTerminal::pair_for(Color fg, Color bg) {
  if (!color_) return 0;
  if (fg == Color::Reset && bg == Color::Reset) return 0;
  auto key = std::make_pair(static_cast<short>(fg), static_cast<short>(bg));
  if (auto it = pairs_.find(key); it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0;
  short fg_c = static_cast<short>(fg), bg_c = static_cast<short>(bg);
  if (init_pair(next_pair_, fg_c, bg_c) == ERR) {
    // no default colors: fall back to white on black for Reset
    if (fg_c < 0) fg_c = COLOR_WHITE;
    if (bg_c < 0) bg_c = COLOR_BLACK;
    if (init_pair(next_pair_, fg_c, bg_c) == ERR) return 0;
  }
  pairs_[key] = next_pair_;
  return next_pair_++;
}

static attr_t attrs_for(const Style& style) {
  attr_t a = A_NORMAL;
  if (style.has(ModBold)) a |= A_BOLD;
  if (style.has(ModDim)) a |= A_DIM;
  if (style.has(ModItalic)) a |= A_ITALIC;
  if (style.has(ModUnderline)) a |= A_UNDERLINE;
  if (style.has(ModBlink)) a |= A_BLINK;
  if (style.has(ModReverse)) a |= A_REVERSE;
  return a;
}

bool NcursesTerminal::write_text(const std::string& text, const Style& style) {
  short pair = pair_for(style.fg, style.bg);
  if (attr_set(attrs_for(style), pair, nullptr) == ERR) return fail("attr_set failed");
  int row, col; getyx(stdscr, row, col);
  int rc = addnstr(text.c_str(), static_cast<int>(text.size()));
  if (attr_set(A_NORMAL, 0, nullptr) == ERR) return fail("attr_set failed");
  if (rc == ERR) {
    // addstr reports ERR after filling the bottom-right cell since it cannot scroll
    TermSize sz = get_size();
    if (row == sz.rows - 1 && col + display_width(text) == sz.cols) return true;
    return fail("write at " + std::to_string(row) + "," + std::to_string(col) + " failed");
  }
  return true;
}

bool NcursesTerminal::show_cursor() {
  if (curs_set(1) == ERR) spdlog::debug("ncurses: terminal cannot change cursor visibility");
  return true;
}

bool NcursesTerminal::hide_cursor() {
  if (curs_set(0) == ERR) spdlog::debug("ncurses: terminal cannot change cursor visibility");
  return true;
}

bool NcursesTerminal::refresh() {
  if (::refresh() == ERR) return fail("refresh failed");
  return true;
}
