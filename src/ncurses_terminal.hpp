#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation on top of ncurses (wide build for UTF-8).
 * Note: initscr/endwin belong to the Terminal RAII wrapper; construct this after it.
 *       <ncurses.h> stays out of this header, its macros clash with member names.
 */
#include "iterminal.hpp"
#include <map>
#include <utility>

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(bool enable_color = true);
  TermSize get_size() const override;
  bool clear() override;
  bool move_cursor(int row, int col) override;
  bool write_text(const std::string& text, const Style& style) override;
  bool show_cursor() override;
  bool hide_cursor() override;
  bool refresh() override;
  const std::string& last_error() const override { return error_; }

private:
  bool fail(std::string what);
  short pair_for(Color fg, Color bg);

  bool color_ = false;
  std::map<std::pair<short, short>, short> pairs_;
  short next_pair_ = 1;
  std::string error_;
};
