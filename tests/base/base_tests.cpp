#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/base_button.hpp"
#include "base/base_card.hpp"
#include "base/base_popup.hpp"
#include "base/controls.hpp"
#include "../test_support.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace wk_test;

TEST_CASE("Button emits clicked only for a press and release inside") {
    reset_environment();
    BaseButton button("Save");
    button.set_rect(SDL_Rect{ 10, 10, 100, 32 });
    int clicks = 0;
    button.set_on_clicked([&] { ++clicks; });

    CHECK(click(button));
    CHECK(clicks == 1);

    button.handle_event(mouse_down(20, 20));
    CHECK(button.is_pressed());
    button.handle_event(mouse_up(500, 500));
    CHECK(clicks == 1);

    button.set_enabled(false);
    CHECK_FALSE(click(button));
    CHECK(clicks == 1);
}

TEST_CASE("Button press animation scales down and back") {
    reset_environment();
    BaseButton button("Go");
    button.set_rect(SDL_Rect{ 0, 0, 100, 40 });
    button.handle_event(mouse_down(50, 20));
    advance(&button, 100);
    CHECK(button.scale() == doctest::Approx(0.95f));
    advance(&button, 100);
    CHECK(button.scale() == doctest::Approx(1.0f));
    CHECK_FALSE(button.is_animating());
}

TEST_CASE("Loading state swaps the text and disables the button") {
    reset_environment();
    BaseButton button("Submit");
    button.set_loading(true);
    CHECK(button.text() == "Loading...");
    CHECK_FALSE(button.is_enabled());
    button.set_loading(false);
    CHECK(button.text() == "Submit");
    CHECK(button.is_enabled());
}

TEST_CASE("Button sizes enforce their minimum geometry") {
    reset_environment();
    BaseButton small("x", ButtonVariant::Primary, ButtonSize::Small);
    BaseButton large("x", ButtonVariant::Primary, ButtonSize::Large);
    CHECK(small.preferred_width() >= 60);
    CHECK(small.height_for_width(0) >= 24);
    CHECK(large.preferred_width() >= 120);
    CHECK(large.height_for_width(0) >= 44);
    IconButton icon("close");
    CHECK(icon.preferred_width() == 32);
    CHECK(icon.height_for_width(0) == 32);
}

TEST_CASE("Toggle buttons in a group stay mutually exclusive") {
    reset_environment();
    ToggleButton a("A");
    ToggleButton b("B");
    ToggleButton c("C");
    a.set_rect(SDL_Rect{ 0, 0, 80, 32 });
    b.set_rect(SDL_Rect{ 90, 0, 80, 32 });
    c.set_rect(SDL_Rect{ 180, 0, 80, 32 });
    ButtonGroup group;
    group.add_button(&a);
    group.add_button(&b);
    group.add_button(&c);
    std::vector<int> clicked;
    group.set_on_button_clicked([&](int i) { clicked.push_back(i); });
    std::vector<bool> toggles;
    b.set_on_toggled([&](bool on) { toggles.push_back(on); });

    click(a);
    CHECK(a.is_checked());
    CHECK(a.variant() == ButtonVariant::Primary);
    click(b);
    CHECK(b.is_checked());
    CHECK_FALSE(a.is_checked());
    CHECK(a.variant() == ButtonVariant::Secondary);
    CHECK(group.checked_index() == 1);
    CHECK(group.checked_button() == &b);
    REQUIRE(clicked.size() == 2);
    CHECK(clicked[1] == 1);
    REQUIRE(toggles.size() == 1);
    CHECK(toggles[0]);

    group.set_checked_index(2);
    CHECK(c.is_checked());
    CHECK_FALSE(b.is_checked());
    CHECK(toggles.size() == 1);

    {
        ToggleButton temp("T");
        group.add_button(&temp);
        CHECK(group.buttons().size() == 4);
    }
    CHECK(group.buttons().size() == 3);
}

TEST_CASE("Text box edits with keys and text input") {
    reset_environment();
    TextBox box;
    box.set_rect(SDL_Rect{ 0, 0, 200, 32 });
    std::vector<std::string> changes;
    std::string submitted;
    box.set_on_text_changed([&](const std::string& t) { changes.push_back(t); });
    box.set_on_submitted([&](const std::string& t) { submitted = t; });

    CHECK_FALSE(box.handle_event(text_input("x")));
    CHECK(box.handle_event(mouse_down(10, 10)));
    CHECK(box.has_focus());
    box.handle_event(text_input("hello"));
    CHECK(box.text() == "hello");
    box.handle_event(key_down(SDLK_LEFT));
    box.handle_event(key_down(SDLK_BACKSPACE));
    CHECK(box.text() == "helo");
    box.handle_event(key_down(SDLK_HOME));
    box.handle_event(key_down(SDLK_DELETE));
    CHECK(box.text() == "elo");
    box.handle_event(key_down(SDLK_END));
    CHECK(box.caret() == 3);
    box.handle_event(key_down(SDLK_RETURN));
    CHECK(submitted == "elo");
    CHECK(changes.size() == 3);

    box.set_text("elo");
    CHECK(changes.size() == 3);

    CHECK_FALSE(box.handle_event(mouse_down(500, 500)));
    CHECK_FALSE(box.has_focus());
}

TEST_CASE("Text box limits, masks and multi-line entry") {
    reset_environment();
    TextBox box("", "Type...");
    box.set_max_length(4);
    box.set_text("abcdef");
    CHECK(box.text() == "abcd");
    box.set_focus(true);
    box.handle_event(text_input("z"));
    CHECK(box.text() == "abcd");

    box.set_text("a\nb");
    CHECK(box.text() == "ab");

    TextBox notes("", "", true);
    notes.set_focus(true);
    std::string submitted;
    notes.set_on_submitted([&](const std::string& t) { submitted = t; });
    notes.handle_event(text_input("one"));
    notes.handle_event(key_down(SDLK_RETURN));
    notes.handle_event(text_input("two"));
    CHECK(notes.text() == "one\ntwo");
    notes.handle_event(key_down(SDLK_UP));
    CHECK(notes.caret() == 3);
    notes.handle_event(key_down(SDLK_RETURN, KMOD_LCTRL));
    CHECK(submitted == "one\ntwo");

    TextBox locked("fixed");
    locked.set_read_only(true);
    locked.set_focus(true);
    locked.handle_event(text_input("x"));
    locked.handle_event(key_down(SDLK_BACKSPACE));
    CHECK(locked.text() == "fixed");

    bool escaped = false;
    TextBox esc;
    esc.set_focus(true);
    CHECK_FALSE(esc.handle_event(key_down(SDLK_ESCAPE)));
    esc.set_on_escape([&] { escaped = true; });
    CHECK(esc.handle_event(key_down(SDLK_ESCAPE)));
    CHECK(escaped);
}

TEST_CASE("Checkbox toggles two-state and cycles tri-state") {
    reset_environment();
    Checkbox cb("Accept");
    cb.set_rect(SDL_Rect{ 0, 0, 120, 28 });
    std::vector<bool> toggled;
    cb.set_on_toggled([&](bool on) { toggled.push_back(on); });
    click(cb);
    CHECK(cb.is_checked());
    click(cb);
    CHECK_FALSE(cb.is_checked());
    CHECK(toggled.size() == 2);

    cb.set_user_tristate(true);
    click(cb);
    CHECK(cb.state() == CheckState::Partial);
    CHECK(toggled.size() == 2);
    click(cb);
    CHECK(cb.state() == CheckState::Checked);
    CHECK(toggled.size() == 3);
    cb.set_checked(true);
    CHECK(toggled.size() == 3);
}

TEST_CASE("Dropdown opens an overlay list and picks an option") {
    reset_environment();
    Dropdown dd({ "Red", "Green", "Blue" });
    dd.set_rect(SDL_Rect{ 10, 10, 150, 32 });
    std::vector<std::string> picked;
    dd.set_on_changed([&](int, const std::string& t) { picked.push_back(t); });

    CHECK(dd.selected() == 0);
    dd.set_selected(7);
    CHECK(dd.selected() == 0);
    CHECK(picked.empty());

    CHECK(dd.handle_event(mouse_down(20, 20)));
    CHECK(dd.expanded());
    CHECK(OverlayManager::instance().is_open(dd.list()));

    const SDL_Rect row = dd.list()->item_rect(2);
    CHECK(OverlayManager::instance().handle_event(mouse_down(row.x + 5, row.y + 5)));
    CHECK(dd.selected() == 2);
    CHECK(dd.selected_text() == "Blue");
    CHECK_FALSE(dd.expanded());
    REQUIRE(picked.size() == 1);

    dd.open_list();
    OverlayManager::instance().handle_event(key_down(SDLK_UP));
    OverlayManager::instance().handle_event(key_down(SDLK_RETURN));
    CHECK(dd.selected() == 1);

    dd.open_list();
    OverlayManager::instance().handle_event(mouse_down(900, 600));
    CHECK_FALSE(dd.expanded());
    CHECK(dd.selected() == 1);

    dd.set_options({});
    CHECK(dd.selected() == -1);
    CHECK(dd.selected_text().empty());
}

TEST_CASE("Progress bar clamps its value") {
    reset_environment();
    ProgressBar bar(150);
    CHECK(bar.value() == 100);
    bar.set_value(-4);
    CHECK(bar.value() == 0);
    bar.set_show_text(true);
    CHECK(bar.height_for_width(100) == 20);
    SoftwareCanvas canvas;
    bar.set_rect(SDL_Rect{ 0, 0, 100, 20 });
    bar.set_indeterminate(true);
    bar.update();
    bar.render(canvas.renderer());
}

TEST_CASE("Card sections appear when set and selection follows clicks") {
    reset_environment();
    BaseCard card;
    CHECK_FALSE(card.header()->is_visible());
    CHECK_FALSE(card.footer()->is_visible());
    card.set_body(std::make_unique<Label>("Body text"));
    const int body_only = card.height_for_width(300);

    card.set_title("Title");
    CHECK(card.header()->is_visible());
    CHECK(card.title() == "Title");
    CHECK(card.height_for_width(300) > body_only);
    card.add_footer_widget(std::make_unique<BaseButton>("OK"));
    CHECK(card.footer()->is_visible());

    card.set_rect(SDL_Rect{ 0, 0, 300, card.height_for_width(300) });
    std::vector<bool> selection;
    int clicked = 0;
    card.set_on_selection_changed([&](bool s) { selection.push_back(s); });
    card.set_on_clicked([&] { ++clicked; });

    card.set_selected(true);
    CHECK_FALSE(card.is_selected());

    card.set_selectable(true);
    const SDL_Rect body = card.body()->rect();
    click_at(card, body.x + 2, body.y + 2);
    CHECK(card.is_selected());
    CHECK(clicked == 1);
    click_at(card, body.x + 2, body.y + 2);
    CHECK_FALSE(card.is_selected());
    CHECK(selection.size() == 2);
}

TEST_CASE("Card header buttons consume their own clicks") {
    reset_environment();
    BaseCard card;
    card.set_title("Actions");
    auto* action = static_cast<BaseButton*>(card.add_header_action(std::make_unique<BaseButton>("Edit")));
    int card_clicks = 0;
    int action_clicks = 0;
    card.set_on_clicked([&] { ++card_clicks; });
    action->set_on_clicked([&] { ++action_clicks; });
    card.set_rect(SDL_Rect{ 0, 0, 400, card.height_for_width(400) });
    card.update();
    click(*action);
    CHECK(action_clicks == 1);
    const SDL_Rect ar = action->rect();
    click_at(card, ar.x + ar.w / 2, ar.y + ar.h / 2);
    CHECK(action_clicks == 2);
    CHECK(card_clicks == 0);
}

TEST_CASE("Card lifts while hovered") {
    reset_environment();
    BaseCard card;
    card.set_body(std::make_unique<Label>("Lift"));
    card.set_rect(SDL_Rect{ 0, 0, 200, 80 });
    int entered = 0;
    int left = 0;
    card.set_on_hover_entered([&] { ++entered; });
    card.set_on_hover_left([&] { ++left; });
    card.handle_event(mouse_move(50, 40));
    advance(&card, BaseCard::kHoverLiftMs);
    CHECK(card.offset().y == -BaseCard::kHoverLift);
    card.handle_event(mouse_move(500, 500));
    advance(&card, BaseCard::kHoverLiftMs);
    CHECK(card.offset().y == 0);
    CHECK(entered == 1);
    CHECK(left == 1);
}

TEST_CASE("Popup fades in, closes on Escape and reports closed") {
    reset_environment();
    BasePopup popup(true);
    popup.add_widget(std::make_unique<Label>("Are you sure?"));
    int closed = 0;
    popup.set_on_closed([&] { ++closed; });

    popup.show_centered();
    CHECK(popup.is_visible());
    CHECK(OverlayManager::instance().is_open(&popup));
    CHECK(popup.opacity() == doctest::Approx(0.0f));
    advance(nullptr, BasePopup::kFadeMs);
    CHECK(popup.opacity() == doctest::Approx(1.0f));
    const SDL_Rect r = popup.rect();
    CHECK(r.x + r.w / 2 == doctest::Approx(640).epsilon(0.01));

    OverlayManager::instance().handle_event(key_down(SDLK_ESCAPE));
    CHECK_FALSE(popup.is_visible());
    CHECK(closed == 1);
    CHECK_FALSE(OverlayManager::instance().is_open(&popup));

    popup.show_at_position(100, 100);
    OverlayManager::instance().handle_event(mouse_down(5, 5));
    CHECK_FALSE(popup.is_visible());
    CHECK(closed == 2);
}

TEST_CASE("Popup positions clamp to the screen and auto close animates out") {
    reset_environment();
    BasePopup popup(false);
    popup.set_fixed_size(200, 100);
    popup.show_at_position(1200, 700);
    CHECK(popup.rect().x == 1080);
    CHECK(popup.rect().y == 620);

    int closed = 0;
    popup.set_on_closed([&] { ++closed; });
    popup.auto_close(500);
    advance(nullptr, 500);
    CHECK(popup.is_closing());
    CHECK(popup.is_visible());
    advance(nullptr, BasePopup::kFadeMs + 16);
    CHECK_FALSE(popup.is_visible());
    CHECK(closed == 1);
}

TEST_CASE("Toast popup anchors to corners with a margin") {
    reset_environment();
    ToastPopup toast("Saved", 1000);
    toast.show_toast(PopupPosition::TopRight);
    CHECK(toast.rect().w == ToastPopup::kWidth);
    CHECK(toast.rect().h == ToastPopup::kHeight);
    CHECK(toast.rect().x == 1280 - 300 - 20);
    CHECK(toast.rect().y == 20);
    CHECK_FALSE(OverlayManager::instance().handle_event(mouse_down(5, 5)));

    toast.show_toast(PopupPosition::BottomLeft);
    CHECK(toast.rect().x == 20);
    CHECK(toast.rect().y == 720 - 60 - 20);
    advance(nullptr, 1000 + BasePopup::kFadeMs + 32);
    CHECK_FALSE(toast.is_visible());

    CHECK(wk::parse_popup_position("bottom-center") == PopupPosition::BottomCenter);
    CHECK(wk::parse_popup_position("nowhere") == PopupPosition::Center);
}

TEST_CASE("Context menu runs an action and closes") {
    reset_environment();
    ContextMenuPopup menu;
    int copied = 0;
    menu.add_action("Copy", [&] { ++copied; }, "copy");
    menu.add_separator();
    menu.add_action("Paste");
    CHECK(menu.action_count() == 2);
    menu.show_at_position(50, 50);
    advance(nullptr, BasePopup::kFadeMs);
    menu.update();

    MenuAction* copy = menu.action(0);
    REQUIRE(copy != nullptr);
    const SDL_Rect r = copy->rect();
    OverlayManager::instance().handle_event(mouse_down(r.x + 5, r.y + 5));
    OverlayManager::instance().handle_event(mouse_up(r.x + 5, r.y + 5));
    CHECK(copied == 1);
    CHECK(menu.is_closing());
    advance(nullptr, BasePopup::kFadeMs + 16);
    CHECK_FALSE(menu.is_visible());
}
