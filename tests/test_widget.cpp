#include "frame.hpp"
#include "widget.hpp"
#include <cassert>
#include <memory>
#include <string>
#include <vector>

// consuming draw: owns its text and gives it up while rendering
class Banner : public Widget {
public:
  explicit Banner(std::string text) : text_(std::move(text)) {}
  void render(const Rect& area, Canvas& buf) && override {
    std::string taken = std::move(text_);
    render_str(taken, area, buf, Style{}.add(ModUnderline));
  }
private:
  std::string text_;
};

static void test_consuming_draw() {
  Canvas c(Rect{0, 0, 6, 1});
  Banner("news").render(c.area(), c);
  assert(canvas_to_string(c) == "news  ");
  assert(c.cell_at(0, 0)->style.has(ModUnderline));

  Canvas d(Rect{0, 0, 6, 1});
  Frame f(d, d.area(), 7);
  f.render_widget(Banner("hi"), Rect{2, 0, 4, 1});
  assert(canvas_to_string(d) == "  hi  ");
  assert(f.count() == 7);
  assert(!f.cursor());
}

static void test_reference_draw() {
  const Label label("abc", Style{}.set_fg(Color::Green));
  Canvas a(Rect{0, 0, 3, 1});
  Canvas b(Rect{0, 0, 3, 1});
  label.render_ref(a.area(), a);
  label.render_ref(b.area(), b);
  assert(a == b);
  assert(a.cell_at(1, 0)->style.fg == Color::Green);

  // a reference drawable is also usable where a consuming one is expected
  Canvas c(Rect{0, 0, 3, 1});
  Label tmp("xyz");
  std::move(tmp).render(c.area(), c);
  assert(canvas_to_string(c) == "xyz");
  assert(tmp.text() == "xyz");
}

static void test_heterogeneous_collection() {
  std::vector<std::unique_ptr<WidgetRef>> widgets;
  widgets.push_back(std::make_unique<Label>("12345"));
  widgets.push_back(std::make_unique<Clear>());
  widgets.push_back(std::make_unique<Label>("ab"));
  Canvas c(Rect{0, 0, 5, 2});
  widgets[0]->render_ref(Rect{0, 0, 5, 1}, c);
  widgets[0]->render_ref(Rect{0, 1, 5, 1}, c);
  widgets[1]->render_ref(Rect{1, 0, 3, 2}, c);
  widgets[2]->render_ref(Rect{1, 1, 3, 1}, c);
  assert(canvas_to_string(c) == "1   5\n1ab 5");
}

static void test_text_primitive_clips() {
  Canvas c(Rect{0, 0, 6, 2});
  Label("abcdef").render_ref(Rect{1, 0, 3, 1}, c);
  assert(canvas_to_string(c) == " abc  \n      ");
  Label("zz").render_ref(Rect{10, 10, 3, 1}, c);
  Label("zz").render_ref(Rect{0, 0, 0, 1}, c);
  assert(canvas_to_string(c) == " abc  \n      ");

  Canvas d(Rect{0, 0, 6, 1});
  Frame f(d, d.area(), 0);
  f.render_text("clipped", Rect{0, 0, 4, 1});
  assert(canvas_to_string(d) == "clip  ");
}

static void test_split_view() {
  auto a = std::make_shared<Label>("A");
  auto b = std::make_shared<Label>("B");
  auto c = std::make_shared<Label>("C");
  SplitView view(a);
  assert(view.slot_count() == 1);
  int sb = view.split_vertical(0, b);
  assert(sb == 1);
  int sc = view.split_horizontal(sb, c);
  assert(sc == 2);
  assert(view.split_vertical(9, c) == -1);
  assert(view.slot_count() == 3);

  Canvas canvas(Rect{0, 0, 4, 2});
  Frame f(canvas, canvas.area(), 0);
  f.render_widget_ref(view, f.size());
  assert(canvas_to_string(canvas) == "A B \n  C ");

  assert(view.remove(sc));
  assert(!view.remove(sc));
  assert(view.slot_count() == 2);
  Canvas after(Rect{0, 0, 4, 2});
  view.render_ref(after.area(), after);
  assert(canvas_to_string(after) == "A B \n    ");

  // the last slot cannot be removed
  assert(view.remove(sb));
  assert(!view.remove(0));
  assert(view.slot_count() == 1);
}

int main() {
  test_consuming_draw();
  test_reference_draw();
  test_heterogeneous_collection();
  test_text_primitive_clips();
  test_split_view();
  return 0;
}
