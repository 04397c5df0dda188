#pragma once
/*
 * Widget / WidgetRef
 *
 * Purpose: draw contract for anything that paints into a Canvas.
 *   Widget     consuming draw: called on an rvalue, renders once, then gone.
 *   WidgetRef  reference draw: const, reusable, storable behind a pointer;
 *              it satisfies Widget by forwarding render() to render_ref().
 * Contract: stay inside `area` (the Canvas drops anything outside it), do not
 *           keep the Canvas after returning, never fail.
 */
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "canvas.hpp"
#include "layout.hpp"
#include "style.hpp"
#include "types.hpp"

class Widget {
public:
  virtual ~Widget() = default;
  virtual void render(const Rect& area, Canvas& buf) && = 0;
};

class WidgetRef : public Widget {
public:
  virtual void render_ref(const Rect& area, Canvas& buf) const = 0;
  void render(const Rect& area, Canvas& buf) && final { render_ref(area, buf); }
};

// text primitive: one style, left aligned at the area origin, clipped to area width
void render_str(std::string_view text, const Rect& area, Canvas& buf, const Style& style = {});

class Label : public WidgetRef {
public:
  explicit Label(std::string text, Style style = {}) : text_(std::move(text)), style_(style) {}
  void render_ref(const Rect& area, Canvas& buf) const override;
  const std::string& text() const { return text_; }
private:
  std::string text_;
  Style style_;
};

// resets its area to default cells; draw it first to overpaint stale content
class Clear : public WidgetRef {
public:
  void render_ref(const Rect& area, Canvas& buf) const override;
};

/*
 * SplitView
 *
 * Container: lays out slots with a split tree and draws the child bound to
 * each slot. Children are shared, the view only borrows them while drawing.
 */
class SplitView : public WidgetRef {
public:
  explicit SplitView(std::shared_ptr<const WidgetRef> first);

  // returns the new slot id, or -1 when target does not exist
  int split_vertical(int target_slot, std::shared_ptr<const WidgetRef> child, float ratio = 0.5f);
  int split_horizontal(int target_slot, std::shared_ptr<const WidgetRef> child, float ratio = 0.5f);
  bool remove(int slot);
  int slot_count() const { return tree_.slot_count(); }
  void render_ref(const Rect& area, Canvas& buf) const override;

private:
  int attach(int id, std::shared_ptr<const WidgetRef> child);

  SplitTree tree_;
  std::vector<std::shared_ptr<const WidgetRef>> children_; // index == slot id
};
