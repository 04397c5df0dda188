#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int cols, int rows)
  : size_{rows, cols}, screen_(Rect{0, 0, cols, rows}) {}

bool HeadlessTerminal::clear() {
  if (fail_clear_) {
    fail_clear_ = false;
    error_ = "clear: i/o error";
    return false;
  }
  screen_.reset();
  ops_.push_back("clear");
  return true;
}

bool HeadlessTerminal::move_cursor(int row, int col) {
  if (row < 0 || row >= size_.rows || col < 0 || col >= size_.cols) {
    error_ = "move to " + std::to_string(row) + "," + std::to_string(col) + " outside screen";
    return false;
  }
  row_ = row;
  col_ = col;
  ++moves_;
  ops_.push_back("move " + std::to_string(row) + " " + std::to_string(col));
  return true;
}

bool HeadlessTerminal::write_text(const std::string& text, const Style& style) {
  if (fail_after_ == 0) {
    error_ = "write: broken pipe";
    return false;
  }
  if (fail_after_ > 0) --fail_after_;
  // the canvas applies the same wide-glyph rules a terminal does
  col_ = screen_.set_text(col_, row_, text, style);
  if (col_ > size_.cols) col_ = size_.cols;
  ++writes_;
  ops_.push_back("write " + text);
  return true;
}

bool HeadlessTerminal::show_cursor() {
  cursor_visible_ = true;
  ops_.push_back("show");
  return true;
}

bool HeadlessTerminal::hide_cursor() {
  cursor_visible_ = false;
  ops_.push_back("hide");
  return true;
}

bool HeadlessTerminal::refresh() {
  if (fail_refresh_) {
    error_ = "flush: device not ready";
    return false;
  }
  ++refreshes_;
  ops_.push_back("flush");
  return true;
}

void HeadlessTerminal::set_size(int cols, int rows) {
  size_ = TermSize{rows, cols};
  screen_.resize(Rect{0, 0, cols, rows});
  row_ = col_ = 0;
}

void HeadlessTerminal::load(const Canvas& screen) {
  screen_ = screen;
}
