#pragma once
/*
 * Terminal
 *
 * Purpose: RAII ncurses session. Starts curses mode (locale, cbreak, noecho,
 *          keypad) on construction and restores the tty on destruction.
 * Input: poll_key doubles as the demo's frame clock.
 */
class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
  bool ok() const { return ok_; }
  // waits up to timeout_ms for a key; -1 when none arrived
  int poll_key(int timeout_ms);
private:
  bool ok_ = false;
};
