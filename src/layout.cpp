#include "layout.hpp"
#include <algorithm>
#include <cmath>

std::pair<Rect, Rect> split_rect(const Rect& area, SplitAxis axis, float ratio) {
  int total = axis == SplitAxis::Vertical ? area.width : area.height;
  int lead = total;
  if (total >= 2) lead = std::clamp(static_cast<int>(std::lround(total * ratio)), 1, total - 1);
  Rect a = area, b = area;
  if (axis == SplitAxis::Vertical) {
    a.width = lead;
    b.x += lead;
    b.width = total - lead;
  } else {
    a.height = lead;
    b.y += lead;
    b.height = total - lead;
  }
  return {a, b};
}

SplitTree::SplitTree() {
  Node root;
  root.slot = 0;
  nodes_.push_back(root);
}

int SplitTree::find_leaf(int slot) const {
  if (slot < 0) return -1;
  for (size_t i = 0; i < nodes_.size(); ++i) {
    if (nodes_[i].live && nodes_[i].slot == slot) return static_cast<int>(i);
  }
  return -1;
}

int SplitTree::split(int slot, SplitAxis axis, float ratio) {
  int leaf = find_leaf(slot);
  if (leaf < 0) return -1;
  int id = next_slot_++;

  Node first, second;
  first.slot = slot;
  first.parent = leaf;
  second.slot = id;
  second.parent = leaf;
  nodes_.push_back(first);
  nodes_.push_back(second);

  Node& n = nodes_[static_cast<size_t>(leaf)];
  n.slot = -1;
  n.axis = axis;
  n.ratio = std::clamp(ratio, 0.0f, 1.0f);
  n.first = static_cast<int>(nodes_.size()) - 2;
  n.second = static_cast<int>(nodes_.size()) - 1;
  return id;
}

bool SplitTree::remove(int slot) {
  int leaf = find_leaf(slot);
  if (leaf < 0 || leaf == root_) return false;
  Node& gone = nodes_[static_cast<size_t>(leaf)];
  Node& parent = nodes_[static_cast<size_t>(gone.parent)];
  int sibling = parent.first == leaf ? parent.second : parent.first;

  // the sibling moves up into the parent's place
  int grand = parent.parent;
  nodes_[static_cast<size_t>(sibling)].parent = grand;
  if (grand < 0) {
    root_ = sibling;
  } else {
    Node& g = nodes_[static_cast<size_t>(grand)];
    if (g.first == gone.parent) g.first = sibling;
    else g.second = sibling;
  }
  parent.live = false;
  gone.live = false;
  return true;
}

int SplitTree::slot_count() const {
  return static_cast<int>(std::count_if(nodes_.begin(), nodes_.end(),
                                        [](const Node& n) { return n.live && n.slot >= 0; }));
}

std::vector<SlotRect> SplitTree::layout(const Rect& area) const {
  std::vector<SlotRect> out;
  std::vector<std::pair<int, Rect>> todo{{root_, area}};
  while (!todo.empty()) {
    auto [i, r] = todo.back();
    todo.pop_back();
    if (r.empty()) continue;
    const Node& n = nodes_[static_cast<size_t>(i)];
    if (n.slot >= 0) {
      out.push_back(SlotRect{n.slot, r});
      continue;
    }
    auto [a, b] = split_rect(r, n.axis, n.ratio);
    todo.emplace_back(n.second, b);
    todo.emplace_back(n.first, a);
  }
  return out;
}
