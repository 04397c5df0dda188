#pragma once
/*
 * SplitTree
 *
 * Purpose: carves a Rect into numbered slots by repeated two-way splits.
 * Storage: nodes live in a flat vector and refer to each other by index;
 *          removed nodes are only marked dead.
 * Sizing: a split gives round(total * ratio) cells to the first part, but
 *         each part keeps at least one cell while the total allows it.
 * Note: ratio-only splits; there is no constraint solving here.
 */
#include <utility>
#include <vector>
#include "types.hpp"

enum class SplitAxis {
  Vertical,   // side by side
  Horizontal, // stacked
};

struct SlotRect {
  int slot = 0;
  Rect rect;
};

class SplitTree {
public:
  SplitTree(); // one slot, id 0

  // the new slot gets the right/bottom part; returns its id, -1 when `slot` is unknown
  int split(int slot, SplitAxis axis, float ratio);
  // the last remaining slot cannot be removed
  bool remove(int slot);
  bool contains(int slot) const { return find_leaf(slot) >= 0; }
  int slot_count() const;

  // slots in drawing order (first part before second), empty parts omitted
  std::vector<SlotRect> layout(const Rect& area) const;

private:
  struct Node {
    int slot = -1; // >= 0 for a leaf
    SplitAxis axis = SplitAxis::Vertical;
    float ratio = 0.5f;
    int first = -1;
    int second = -1;
    int parent = -1;
    bool live = true;
  };

  int find_leaf(int slot) const;

  std::vector<Node> nodes_;
  int root_ = 0;
  int next_slot_ = 1;
};

std::pair<Rect, Rect> split_rect(const Rect& area, SplitAxis axis, float ratio);
