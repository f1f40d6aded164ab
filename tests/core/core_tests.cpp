#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "core/animation.hpp"
#include "core/clock.hpp"
#include "core/icons.hpp"
#include "core/layout.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "../test_support.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace wk_test;

namespace {
// Fixed-size block for layout tests.
class Block : public Widget {
public:
    Block(int w, int h) { set_fixed_size(w, h); }
    bool handle_event(const SDL_Event& e) override {
        if (!wk::is_left_press(e)) return false;
        if (!wk::point_in(rect_, wk::event_point(e))) return false;
        ++presses;
        return true;
    }
    void render(SDL_Renderer*) const override {}
    int presses = 0;
};

class Animated : public AnimatedWidget {
public:
    void render(SDL_Renderer*) const override {}
};
}

TEST_CASE("Timer fires once when single shot and re-arms when repeating") {
    reset_environment();
    int fired = 0;
    Timer once;
    once.set_on_timeout([&] { ++fired; });
    once.start(100);
    CHECK(once.remaining() == 100);
    wk::Clock::advance(99);
    CHECK_FALSE(once.poll());
    wk::Clock::advance(1);
    CHECK(once.poll());
    CHECK_FALSE(once.is_active());
    wk::Clock::advance(500);
    CHECK_FALSE(once.poll());
    CHECK(fired == 1);

    Timer repeating(false);
    int ticks = 0;
    repeating.set_on_timeout([&] { ++ticks; });
    repeating.start(50);
    for (int i = 0; i < 4; ++i) {
        wk::Clock::advance(50);
        repeating.poll();
    }
    CHECK(ticks == 4);
    CHECK(repeating.is_active());
    repeating.stop();
    CHECK(repeating.remaining() == 0);
}

TEST_CASE("Tween eases between endpoints and a zero duration completes immediately") {
    reset_environment();
    Tween t;
    bool finished = false;
    t.set_on_finished([&] { finished = true; });
    t.start(0.0f, 10.0f, 100, Easing::Linear);
    wk::Clock::advance(50);
    CHECK(t.update());
    CHECK(t.value() == doctest::Approx(5.0f));
    wk::Clock::advance(50);
    CHECK_FALSE(t.update());
    CHECK(t.value() == doctest::Approx(10.0f));
    CHECK(finished);

    Tween instant;
    instant.start(3.0f, 7.0f, 0);
    CHECK_FALSE(instant.update());
    CHECK(instant.value() == doctest::Approx(7.0f));

    CHECK(wk::ease(Easing::OutCubic, 0.0f) == doctest::Approx(0.0f));
    CHECK(wk::ease(Easing::OutCubic, 1.0f) == doctest::Approx(1.0f));
    CHECK(wk::ease(Easing::InOutQuad, 0.5f) == doctest::Approx(0.5f));
    CHECK(wk::ease(Easing::OutBack, 1.0f) == doctest::Approx(1.0f));
}

TEST_CASE("Keyed animations replace each other and chain through finished callbacks") {
    reset_environment();
    Animated p;
    float v = 0.0f;
    p.animate("x", 0.0f, 1.0f, 100, [&](float f) { v = f; });
    p.animate("x", 5.0f, 6.0f, 100, [&](float f) { v = f; });
    CHECK(p.animation_count() == 1);
    CHECK(v == doctest::Approx(5.0f));

    bool second_done = false;
    p.animate("x", 0.0f, 1.0f, 100, [&](float f) { v = f; }, [&] {
        p.animate("x", 1.0f, 0.0f, 100, [&](float f) { v = f; }, [&] { second_done = true; });
    });
    advance(&p, 100);
    CHECK(p.is_animating("x"));
    advance(&p, 100);
    CHECK_FALSE(p.is_animating());
    CHECK(second_done);
    CHECK(v == doctest::Approx(0.0f));
}

TEST_CASE("Animation helpers drive opacity, height and scale") {
    reset_environment();
    Animated p;
    p.set_rect(SDL_Rect{ 100, 0, 50, 80 });

    AnimationHelpers::fade_in(p);
    CHECK(p.opacity() == doctest::Approx(0.0f));
    advance(&p, 300);
    CHECK(p.opacity() == doctest::Approx(1.0f));

    bool faded = false;
    AnimationHelpers::fade_out(p, 300, [&] { faded = true; });
    advance(&p, 300);
    CHECK(faded);
    CHECK(p.opacity() == doctest::Approx(0.0f));

    AnimationHelpers::expand_height(p, 120);
    CHECK(p.height_limit() == 0);
    advance(&p, 300);
    CHECK(p.height_limit() == -1);

    AnimationHelpers::collapse_height(p);
    advance(&p, 300);
    CHECK(p.height_limit() == 0);

    AnimationHelpers::slide_in_from_left(p);
    CHECK(p.offset().x == -150);
    advance(&p, 300);
    CHECK(p.offset().x == 0);

    bool bounced = false;
    AnimationHelpers::bounce_effect(p, 1.1f, 200, [&] { bounced = true; });
    advance(&p, 100);
    CHECK(p.scale() == doctest::Approx(1.1f));
    advance(&p, 100);
    CHECK(p.scale() == doctest::Approx(1.0f));
    CHECK(bounced);
}

TEST_CASE("Vertical box layout stacks children and shares stretch") {
    reset_environment();
    BoxLayout box(BoxLayout::Direction::Vertical, 10);
    box.set_margins(5);
    auto* a = box.add_widget(std::make_unique<Block>(40, 20));
    auto* b = box.add_widget(std::make_unique<Block>(60, 30), 1);
    auto* c = box.add_widget(std::make_unique<Block>(10, 10));

    CHECK(box.preferred_width() == 70);
    CHECK(box.height_for_width(200) == 5 + 20 + 10 + 30 + 10 + 10 + 5);

    box.set_rect(SDL_Rect{ 0, 0, 200, 200 });
    CHECK(a->rect().y == 5);
    CHECK(a->rect().w == 190);
    CHECK(b->rect().y == 35);
    CHECK(b->rect().h == 30 + (190 - 80));
    CHECK(c->rect().y + c->rect().h == 195);

    b->hide();
    box.update();
    CHECK(c->rect().y == 35);

    CHECK(box.count() == 3);
    CHECK(box.index_of(c) == 2);
    auto taken = box.take(a);
    REQUIRE(taken);
    CHECK(taken->parent() == nullptr);
    CHECK(box.count() == 2);
    CHECK(box.at(0) == b);
}

TEST_CASE("Horizontal box layout gives leftover space to stretch items and routes events") {
    reset_environment();
    BoxLayout row(BoxLayout::Direction::Horizontal, 0);
    auto* left = row.add_widget(std::make_unique<Block>(50, 20));
    row.add_stretch();
    auto* right = row.add_widget(std::make_unique<Block>(30, 20));
    row.set_rect(SDL_Rect{ 0, 0, 300, 40 });
    CHECK(left->rect().x == 0);
    CHECK(right->rect().x == 270);
    CHECK(left->rect().y == 10);

    CHECK(row.handle_event(mouse_down(280, 20)));
    CHECK(right->presses == 1);
    CHECK(left->presses == 0);
    CHECK_FALSE(row.handle_event(mouse_down(150, 20)));

    row.insert(1, std::make_unique<Block>(20, 20));
    CHECK(row.count() == 3);
    CHECK(row.index_of(right) == 2);
}

TEST_CASE("Scroll area clamps its offset and follows the bottom") {
    reset_environment();
    auto content = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    BoxLayout* list = content.get();
    for (int i = 0; i < 10; ++i) list->add(std::make_unique<Block>(100, 50));
    ScrollArea area(std::move(content));
    area.set_rect(SDL_Rect{ 0, 0, 200, 200 });

    CHECK(area.content_height() == 500);
    CHECK(area.max_scroll() == 300);
    area.set_scroll(1000);
    CHECK(area.scroll() == 300);
    area.set_scroll(-5);
    CHECK(area.scroll() == 0);

    area.handle_event(wheel(-1));
    CHECK(area.scroll() == ScrollArea::kWheelStep);
    area.scroll_to_bottom();
    CHECK(area.scroll() == 300);
    CHECK(list->rect().y == -300);

    area.ensure_visible(SDL_Rect{ 0, -250, 10, 50 });
    CHECK(area.scroll() == 50);

    area.set_follow_bottom(true);
    area.scroll_to_bottom();
    list->add(std::make_unique<Block>(100, 50));
    area.update();
    CHECK(area.scroll() == 350);

    CHECK_FALSE(area.handle_event(mouse_down(100, 250)));
}

TEST_CASE("Overlay manager routes events by mode and keeps groups exclusive") {
    reset_environment();
    OverlayManager& om = OverlayManager::instance();
    Block page(10, 10);
    Block a(100, 100);
    a.set_rect(SDL_Rect{ 0, 0, 100, 100 });
    Block b(100, 100);
    b.set_rect(SDL_Rect{ 200, 0, 100, 100 });

    int dismissed = 0;
    om.open(&a, OverlayManager::Mode::LightDismiss, [&] { ++dismissed; });
    CHECK(om.is_open(&a));
    CHECK(om.top() == &a);

    CHECK(om.handle_event(mouse_down(50, 50)));
    CHECK(a.presses == 1);
    CHECK(om.handle_event(mouse_down(500, 500)));
    CHECK(dismissed == 1);
    CHECK_FALSE(om.is_open(&a));

    om.open(&a, OverlayManager::Mode::Passive);
    CHECK_FALSE(om.handle_event(mouse_down(500, 500)));
    om.open(&b, OverlayManager::Mode::Modal);
    CHECK(om.has_modal());
    CHECK(om.handle_event(mouse_down(50, 50)));
    CHECK(a.presses == 1);
    CHECK(om.close(&b));
    CHECK_FALSE(om.close(&b));

    om.clear();
    om.open(&a, OverlayManager::Mode::Passive, {}, "panels");
    a.show();
    om.open(&b, OverlayManager::Mode::Passive, {}, "panels");
    CHECK_FALSE(om.is_open(&a));
    CHECK_FALSE(a.is_visible());
    CHECK(om.count() == 1);

    b.hide();
    om.update();
    CHECK(om.count() == 0);

    const SDL_Rect clamped = om.clamp_to_screen(SDL_Rect{ 1250, 700, 100, 50 });
    CHECK(clamped.x == 1180);
    CHECK(clamped.y == 670);
}

TEST_CASE("Text helpers measure, wrap and elide") {
    reset_environment();
    const LabelStyle st = ThemeManager::instance().font("default");
    CHECK(wk_text::line_height(st) > 0);
    CHECK(wk_text::width(st, "") == 0);
    CHECK(wk_text::width(st, "wide text") > wk_text::width(st, "w"));

    const auto lines = wk_text::wrap_lines(st, "one two three four five six", wk_text::width(st, "one two"));
    CHECK(lines.size() >= 3);
    CHECK(wk_text::wrap_lines(st, "a\nb", 1000).size() == 2);

    const std::string long_text = "A long sentence that will not fit in the space";
    const std::string cut = wk_text::elide(st, long_text, wk_text::width(st, "A long s"));
    CHECK(cut.size() < long_text.size());
    CHECK(cut.substr(cut.size() - 3) == "...");
    CHECK(wk_text::elide(st, "fits", 1000) == "fits");

    CHECK(wk_text::utf8_length("h\xC3\xA9llo") == 5);
    CHECK(wk_text::utf8_prefix("h\xC3\xA9llo", 2) == "h\xC3\xA9");
    CHECK(wk_text::to_lower("MiXeD") == "mixed");
    CHECK(wk_text::trim("  padded \n") == "padded");
}

TEST_CASE("Icon registry knows the stock names and draws without a target crash") {
    reset_environment();
    CHECK(wk_icons::has("close"));
    CHECK(wk_icons::has("chevron-down"));
    CHECK_FALSE(wk_icons::has("no-such-icon"));
    CHECK(wk_icons::names().size() > 20);

    SoftwareCanvas canvas(64, 64);
    wk_icons::draw(canvas.renderer(), "star", SDL_Rect{ 0, 0, 32, 32 }, wk::rgba(255, 0, 0));
    wk_icons::draw(canvas.renderer(), "\xE2\x98\x85", SDL_Rect{ 32, 32, 32, 32 }, wk::rgba(0, 0, 0));
}
