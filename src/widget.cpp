#include "widget.hpp"

void render_str(std::string_view text, const Rect& area, Canvas& buf, const Style& style) {
  if (area.empty()) return;
  buf.set_text_n(area.x, area.y, text, area.width, style);
}

void Label::render_ref(const Rect& area, Canvas& buf) const {
  render_str(text_, area, buf, style_);
}

void Clear::render_ref(const Rect& area, Canvas& buf) const {
  Rect r = buf.area().intersection(area);
  for (int y = r.top(); y < r.bottom(); ++y)
    for (int x = r.left(); x < r.right(); ++x)
      buf.cell_mut(x, y)->reset();
}

SplitView::SplitView(std::shared_ptr<const WidgetRef> first) {
  children_.push_back(std::move(first));
}

int SplitView::attach(int id, std::shared_ptr<const WidgetRef> child) {
  if (id < 0) return -1;
  if (children_.size() <= static_cast<size_t>(id)) children_.resize(static_cast<size_t>(id) + 1);
  children_[static_cast<size_t>(id)] = std::move(child);
  return id;
}

int SplitView::split_vertical(int target_slot, std::shared_ptr<const WidgetRef> child, float ratio) {
  return attach(tree_.split(target_slot, SplitAxis::Vertical, ratio), std::move(child));
}

int SplitView::split_horizontal(int target_slot, std::shared_ptr<const WidgetRef> child, float ratio) {
  return attach(tree_.split(target_slot, SplitAxis::Horizontal, ratio), std::move(child));
}

bool SplitView::remove(int slot) {
  if (!tree_.remove(slot)) return false;
  // slot ids are never reused; only drop the reference
  children_[static_cast<size_t>(slot)].reset();
  return true;
}

void SplitView::render_ref(const Rect& area, Canvas& buf) const {
  for (const auto& sr : tree_.layout(area)) {
    if (sr.slot >= static_cast<int>(children_.size())) continue;
    if (const auto& child = children_[static_cast<size_t>(sr.slot)]) child->render_ref(sr.rect, buf);
  }
}
