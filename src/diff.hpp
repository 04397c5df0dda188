#pragma once
/*
 * Diff (reconciler)
 *
 * Purpose: compare the canvas that is on screen with the one just drawn and
 *          produce the smallest ordered set of writes that turns one into the
 *          other.
 *
 * Steps:
 *   1. diff_canvases: row-major walk, one CellUpdate per cell that must be
 *      (re)written. Different areas mean every cell of `next` is written.
 *   2. build_patch: coalesce updates into Runs. Adjacent updates on a row with
 *      the same style become one run; a style change starts a new run that
 *      needs no cursor move. `reposition` is set only when a run does not
 *      start where the previous one ended.
 *   3. apply_patch: replay the runs on an ITerminal.
 *
 * Wide glyphs: a cell hidden under a 2-column glyph of `next` is never written
 * on its own; cells that sat under a 2-column glyph of `prev` are rewritten
 * even when equal, because the old glyph must be overpainted.
 */
#include <string>
#include <vector>
#include "canvas.hpp"
#include "iterminal.hpp"

struct CellUpdate {
  int x = 0;
  int y = 0;
  const Cell* cell = nullptr; // points into the `next` canvas
};

struct Run {
  int x = 0;
  int y = 0;
  int width = 0; // columns covered
  Style style{};
  std::string text;
  bool reposition = true;
};

struct Patch {
  std::vector<Run> runs;
  bool full_repaint = false;
  size_t cells = 0;

  bool empty() const { return runs.empty(); }
};

std::vector<CellUpdate> diff_canvases(const Canvas& prev, const Canvas& next);
std::vector<CellUpdate> full_repaint(const Canvas& next);
Patch build_patch(const std::vector<CellUpdate>& updates);
Patch compute_patch(const Canvas& prev, const Canvas& next);
bool apply_patch(ITerminal& term, const Patch& patch, std::string& msg);
