#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Model: a cell grid plus cursor position/visibility, updated the way a real
 *        terminal would be; writes past the right edge are dropped, no wrap.
 * Extras: op log and counters for call-order assertions, fault injection for
 *         the io-failure paths.
 */
#include <string>
#include <vector>
#include "canvas.hpp"
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int cols, int rows);

  TermSize get_size() const override { return size_; }
  bool clear() override;
  bool move_cursor(int row, int col) override;
  bool write_text(const std::string& text, const Style& style) override;
  bool show_cursor() override;
  bool hide_cursor() override;
  bool refresh() override;
  const std::string& last_error() const override { return error_; }

  // simulates a window resize; the screen model is blanked like a fresh tty
  void set_size(int cols, int rows);
  // seed the screen model, e.g. with the canvas a patch is computed against
  void load(const Canvas& screen);
  const Canvas& screen() const { return screen_; }

  Position cursor() const { return Position{col_, row_}; }
  bool cursor_visible() const { return cursor_visible_; }

  // fail the write after `n` more successful writes; -1 disables
  void fail_writes_after(int n) { fail_after_ = n; }
  void fail_refresh(bool on) { fail_refresh_ = on; }
  // the next clear() fails, later ones succeed
  void fail_next_clear() { fail_clear_ = true; }

  const std::vector<std::string>& ops() const { return ops_; }
  void clear_ops() { ops_.clear(); writes_ = moves_ = refreshes_ = 0; }
  int writes() const { return writes_; }
  int moves() const { return moves_; }
  int refreshes() const { return refreshes_; }

private:
  TermSize size_{};
  Canvas screen_;
  int row_ = 0;
  int col_ = 0;
  bool cursor_visible_ = true;
  int fail_after_ = -1;
  bool fail_refresh_ = false;
  bool fail_clear_ = false;
  std::vector<std::string> ops_;
  int writes_ = 0;
  int moves_ = 0;
  int refreshes_ = 0;
  std::string error_;
};
