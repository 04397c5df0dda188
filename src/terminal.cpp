#include "terminal.hpp"
#include <spdlog/spdlog.h>
#include <locale.h>
#define NCURSES_NOMACROS
#include <ncurses.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  if (!initscr()) {
    spdlog::error("initscr failed");
    return;
  }
  ok_ = true;
  cbreak();
  noecho();
  keypad(stdscr, TRUE);
  nonl();
  ESCDELAY = 25;
  spdlog::debug("ncurses session started ({}x{})", COLS, LINES);
}

Terminal::~Terminal() {
  if (ok_) endwin();
}

int Terminal::poll_key(int timeout_ms) {
  if (!ok_) return -1;
  wtimeout(stdscr, timeout_ms);
  int ch = wgetch(stdscr);
  return ch == ERR ? -1 : ch;
}
