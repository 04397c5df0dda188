#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, write, cursor, clear, flush).
 * Goal: keep the renderer independent of ncurses/headless impls, enable testing.
 * Errors: mutating calls return false and leave the reason in last_error().
 */
#include <string>
#include "style.hpp"
#include "types.hpp"

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual bool clear() = 0;
  virtual bool move_cursor(int row, int col) = 0;
  // writes at the current position and advances it by the text's column width
  virtual bool write_text(const std::string& text, const Style& style) = 0;
  virtual bool show_cursor() = 0;
  virtual bool hide_cursor() = 0;
  virtual bool refresh() = 0;
  virtual const std::string& last_error() const = 0;

  bool draw_text(int row, int col, const std::string& text, const Style& style) {
    return move_cursor(row, col) && write_text(text, style);
  }
};
