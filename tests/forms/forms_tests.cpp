#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "forms/date_range_picker.hpp"
#include "forms/form_stepper.hpp"
#include "forms/inline_edit.hpp"
#include "forms/search_box.hpp"
#include "forms/slider.hpp"
#include "forms/tag_input.hpp"
#include "forms/toggle_switch.hpp"
#include "../test_support.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace wk_test;

namespace {
SDL_Point center(const SDL_Rect& r) {
    return SDL_Point{ r.x + r.w / 2, r.y + r.h / 2 };
}

void type(Widget& w, const std::string& s) {
    w.handle_event(text_input(s));
}
}

TEST_CASE("Toggle switch emits only on change and animates its thumb") {
    reset_environment();
    ToggleSwitch sw;
    sw.set_rect(SDL_Rect{ 0, 0, 50, 24 });
    std::vector<bool> seen;
    sw.set_on_toggled([&](bool c) { seen.push_back(c); });

    sw.set_checked(false);
    CHECK(seen.empty());
    sw.set_checked(true);
    CHECK(seen == std::vector<bool>{ true });
    CHECK(sw.thumb_position() == doctest::Approx(0.0f));
    advance(&sw, 100);
    CHECK(sw.thumb_position() > 0.0f);
    CHECK(sw.thumb_position() < 1.0f);
    advance(&sw, 100);
    CHECK(sw.thumb_position() == doctest::Approx(1.0f));
    CHECK(sw.thumb_rect().x == 2 + 26);

    CHECK(click(sw));
    CHECK_FALSE(sw.is_checked());
    CHECK(seen == std::vector<bool>{ true, false });
}

TEST_CASE("Toggle switch with text puts the switch on the right") {
    reset_environment();
    ToggleSwitch sw(true, "Wi-Fi");
    CHECK(sw.preferred_width() == 150);
    CHECK(sw.thumb_position() == doctest::Approx(1.0f));
    sw.set_rect(SDL_Rect{ 10, 0, 200, 30 });
    CHECK(sw.switch_rect().x == 160);
    CHECK(sw.switch_rect().y == 3);
}

TEST_CASE("Labeled and icon toggle switches follow their state") {
    reset_environment();
    LabeledToggleSwitch labeled("Yes", "No");
    std::vector<bool> seen;
    labeled.set_on_toggled([&](bool c) { seen.push_back(c); });
    CHECK(labeled.on_label()->text() == "Yes");
    CHECK(labeled.off_label()->text() == "No");
    labeled.set_checked(true);
    CHECK(labeled.is_checked());
    CHECK(seen == std::vector<bool>{ true });
    labeled.set_labels("On", "Off");
    CHECK(labeled.on_label()->text() == "On");

    IconToggleSwitch icons;
    CHECK(icons.current_icon() == "close");
    icons.toggle();
    CHECK(icons.current_icon() == "check");
}

TEST_CASE("Toggle switch group reports states by key") {
    reset_environment();
    ToggleSwitchGroup group;
    ToggleSwitch* wifi = group.add_switch("wifi", "Wi-Fi", true);
    group.add_switch("bt", "Bluetooth");
    CHECK(group.add_switch("wifi", "Other") == wifi);
    CHECK(group.count() == 2);

    std::vector<std::pair<std::string, bool>> changes;
    group.set_on_state_changed([&](const std::string& k, bool c) { changes.emplace_back(k, c); });
    CHECK(group.set_state("bt", true));
    CHECK_FALSE(group.set_state("nfc", true));
    std::map<std::string, bool> expected{ { "wifi", true }, { "bt", true } };
    CHECK(group.get_states() == expected);
    group.set_states({ { "wifi", false } });
    CHECK_FALSE(group.get_switch("wifi")->is_checked());
    REQUIRE(changes.size() == 2);
    CHECK(changes[0].first == "bt");
    CHECK(changes[1] == std::make_pair(std::string("wifi"), false));
}

TEST_CASE("Slider clamps values and maps the track") {
    reset_environment();
    Slider slider(0, 100, 150);
    CHECK(slider.value() == 100);
    slider.set_rect(SDL_Rect{ 0, 0, 300, 50 });
    std::vector<int> seen;
    slider.set_on_value_changed([&](int v) { seen.push_back(v); });

    slider.set_value(100);
    CHECK(seen.empty());
    slider.set_value(-5);
    CHECK(slider.value() == 0);

    const SDL_Rect track = slider.track_rect();
    CHECK(track.w == 240);
    CHECK(slider.value_for_x(track.x + 6) == 0);
    CHECK(slider.value_for_x(track.x + track.w - 6) == 100);
    CHECK(slider.value_for_x(-50) == 0);

    const int y = track.y + track.h / 2;
    slider.handle_event(mouse_down(track.x + 6 + 114, y));
    CHECK(slider.value() == 50);
    CHECK(slider.is_dragging());
    slider.handle_event(mouse_move(track.x + track.w, y));
    CHECK(slider.value() == 100);
    slider.handle_event(mouse_up(track.x + track.w, y));
    CHECK_FALSE(slider.is_dragging());
    CHECK(seen == std::vector<int>{ 0, 50, 100 });
}

TEST_CASE("Slider value box edits the value") {
    reset_environment();
    Slider slider(0, 100, 20);
    slider.set_rect(SDL_Rect{ 0, 0, 300, 50 });
    const SDL_Point v = center(slider.value_rect());
    CHECK(slider.handle_event(mouse_down(v.x, v.y)));
    REQUIRE(slider.is_editing());
    slider.edit_box()->set_text("75");
    CHECK(slider.handle_event(key_down(SDLK_RETURN)));
    CHECK_FALSE(slider.is_editing());
    CHECK(slider.value() == 75);

    slider.handle_event(mouse_down(v.x, v.y));
    slider.edit_box()->set_text("12");
    slider.handle_event(key_down(SDLK_ESCAPE));
    CHECK(slider.value() == 75);

    slider.handle_event(mouse_down(v.x, v.y));
    slider.edit_box()->set_text("oops");
    slider.handle_event(key_down(SDLK_RETURN));
    CHECK(slider.value() == 75);
}

TEST_CASE("Integer parsing accepts whole numbers only") {
    int v = 0;
    CHECK(wk::parse_int(" 42 ", v));
    CHECK(v == 42);
    CHECK(wk::parse_int("-7", v));
    CHECK(v == -7);
    CHECK_FALSE(wk::parse_int("4x", v));
    CHECK_FALSE(wk::parse_int("", v));
    CHECK_FALSE(wk::parse_int("99999999999", v));
}

TEST_CASE("Slider with input keeps the box and the slider in sync") {
    reset_environment();
    SliderWithInput s(0, 100, 30, "%");
    s.set_rect(SDL_Rect{ 0, 0, 400, 80 });
    std::vector<int> seen;
    s.set_on_value_changed([&](int v) { seen.push_back(v); });
    CHECK(s.input()->text() == "30");

    s.slider()->set_value(42);
    CHECK(s.input()->text() == "42");

    s.input()->set_focus(true);
    s.input()->set_text("abc");
    s.input()->handle_event(key_down(SDLK_RETURN));
    CHECK(s.value() == 42);
    CHECK(s.input()->text() == "42");

    s.input()->set_text("150");
    s.input()->handle_event(key_down(SDLK_RETURN));
    CHECK(s.value() == 100);
    CHECK(s.input()->text() == "100");

    s.input()->set_text("7");
    s.input()->set_focus(false);
    CHECK(s.value() == 7);
    CHECK(seen == std::vector<int>{ 42, 100, 7 });

    s.set_range(10, 20);
    CHECK(s.value() == 10);
    CHECK(s.input()->text() == "10");
}

TEST_CASE("Range slider keeps low at or below high") {
    reset_environment();
    RangeSlider range(0, 100, 20, 80);
    std::vector<std::pair<int, int>> seen;
    range.set_on_range_changed([&](int lo, int hi) { seen.emplace_back(lo, hi); });

    range.set_low(90);
    CHECK(range.low() == 80);
    range.set_high(10);
    CHECK(range.high() == 80);
    range.set_values(70, 30);
    CHECK(range.low() == 30);
    CHECK(range.high() == 70);
    range.set_values(-10, 500);
    CHECK(range.low() == 0);
    CHECK(range.high() == 100);
    CHECK(seen.size() == 3);
    CHECK(seen.back() == std::make_pair(0, 100));
}

TEST_CASE("Range slider drags the knob under the pointer") {
    reset_environment();
    RangeSlider range(0, 100, 20, 80);
    range.set_rect(SDL_Rect{ 0, 0, 300, 40 });
    const SDL_Point lo = center(range.low_knob_rect());
    range.handle_event(mouse_down(lo.x, lo.y));
    range.handle_event(mouse_move(range.track_rect().x + range.track_rect().w, lo.y));
    CHECK(range.low() == 80);
    range.handle_event(mouse_up(0, 0));

    const SDL_Point hl = center(range.high_label_rect());
    range.handle_event(mouse_down(hl.x, hl.y, SDL_BUTTON_LEFT, 2));
    REQUIRE(range.is_editing());
    range.edit_box()->set_text("95");
    range.handle_event(key_down(SDLK_RETURN));
    CHECK(range.high() == 95);
}

TEST_CASE("Tag input rejects empty, duplicate and over-limit tags") {
    reset_environment();
    TagInput tags("Add tags...", {}, 3);
    std::vector<std::string> added;
    int changes = 0;
    tags.set_on_tag_added([&](const std::string& t) { added.push_back(t); });
    tags.set_on_tags_changed([&](const std::vector<std::string>&) { ++changes; });

    CHECK(tags.add_tag("c++"));
    CHECK_FALSE(tags.add_tag(""));
    CHECK_FALSE(tags.add_tag("c++"));
    CHECK(tags.add_tag("sdl"));
    CHECK(tags.add_tag("json"));
    CHECK_FALSE(tags.add_tag("ttf"));
    CHECK(tags.tags() == std::vector<std::string>{ "c++", "sdl", "json" });
    CHECK(added.size() == 3);
    CHECK(changes == 3);
    CHECK(tags.input()->placeholder() == "Add more tags...");

    std::vector<std::string> removed;
    tags.set_on_tag_removed([&](const std::string& t) { removed.push_back(t); });
    tags.set_max_tags(1);
    CHECK(tags.tags() == std::vector<std::string>{ "c++" });
    CHECK(removed == std::vector<std::string>{ "json", "sdl" });

    tags.clear_tags();
    CHECK(tags.tags().empty());
    CHECK(tags.input()->placeholder() == "Add tags...");
}

TEST_CASE("Tag input commits typed text and removes with Backspace") {
    reset_environment();
    TagInput tags;
    tags.set_rect(SDL_Rect{ 0, 0, 300, 120 });
    tags.input()->set_focus(true);

    type(tags, "red, green;");
    CHECK(tags.tags() == std::vector<std::string>{ "red", "green" });
    CHECK(tags.input()->text().empty());

    type(tags, "  blue  ");
    tags.handle_event(key_down(SDLK_RETURN));
    CHECK(tags.tags().back() == "blue");

    tags.handle_event(key_down(SDLK_BACKSPACE));
    CHECK(tags.tags() == std::vector<std::string>{ "red", "green" });

    TagChip* chip = tags.chip("red");
    REQUIRE(chip != nullptr);
    const SDL_Point x = center(chip->close_rect());
    click_at(tags, x.x, x.y);
    CHECK(tags.tags() == std::vector<std::string>{ "green" });
    CHECK(tags.chip("red") == nullptr);
}

TEST_CASE("Tag input suggestions filter and pick with the keyboard") {
    reset_environment();
    TagInput tags("Add tags...", { "apple", "apricot", "banana" });
    tags.set_rect(SDL_Rect{ 0, 0, 300, 200 });
    tags.input()->set_focus(true);

    type(tags, "AP");
    CHECK(tags.visible_suggestions() == std::vector<std::string>{ "apple", "apricot" });
    tags.handle_event(key_down(SDLK_DOWN));
    tags.handle_event(key_down(SDLK_DOWN));
    CHECK(tags.highlighted_suggestion() == 1);
    tags.handle_event(key_down(SDLK_RETURN));
    CHECK(tags.tags() == std::vector<std::string>{ "apricot" });
    CHECK(tags.input()->text().empty());

    type(tags, "a");
    CHECK(tags.visible_suggestions() == std::vector<std::string>{ "apple", "banana" });
    const SDL_Point row = center(tags.suggestion_rect(1));
    CHECK(click_at(tags, row.x, row.y));
    CHECK(tags.has_tag("banana"));
}

TEST_CASE("Compact and colored tag inputs") {
    reset_environment();
    CompactTagInput compact;
    for (int i = 0; i < 7; ++i) compact.add_tag("t" + std::to_string(i));
    CHECK(compact.tags().size() == 5);

    ColoredTagInput colored({ { "urgent", wk::rgba(220, 53, 69) } });
    colored.add_tag("urgent");
    colored.add_tag("later");
    CHECK(colored.chip("urgent")->has_color());
    CHECK_FALSE(colored.chip("later")->has_color());
    colored.set_tag_color("later", wk::rgba(0, 0, 255));
    CHECK(colored.chip("later")->has_color());
    SDL_Color c{};
    CHECK(colored.tag_color("later", c));
    CHECK(c.b == 255);

    TagDisplay display({ "one", "two" });
    display.set_rect(SDL_Rect{ 0, 0, 300, 40 });
    std::string clicked;
    display.set_on_tag_clicked([&](const std::string& t) { clicked = t; });
    click(display);
    CHECK(display.tags().size() == 2);
}

TEST_CASE("Inline edit commits trimmed text on Enter") {
    reset_environment();
    InlineEditLabel label("Title");
    label.set_rect(SDL_Rect{ 0, 0, 200, 32 });
    int started = 0;
    std::vector<std::string> changed;
    std::vector<std::string> finished;
    label.set_on_editing_started([&] { ++started; });
    label.set_on_text_changed([&](const std::string& t) { changed.push_back(t); });
    label.set_on_editing_finished([&](const std::string& t) { finished.push_back(t); });

    click(label);
    CHECK_FALSE(label.is_editing());
    double_click(label);
    REQUIRE(label.is_editing());
    CHECK(started == 1);
    CHECK(label.editor()->has_focus());

    label.editor()->set_text("  New title  ");
    label.handle_event(key_down(SDLK_RETURN));
    CHECK_FALSE(label.is_editing());
    CHECK(label.text() == "New title");

    label.start_editing();
    label.handle_event(key_down(SDLK_RETURN));
    CHECK(changed == std::vector<std::string>{ "New title" });
    CHECK(finished == std::vector<std::string>{ "New title", "New title" });
}

TEST_CASE("Inline edit Escape and focus loss") {
    reset_environment();
    InlineEditLabel label("Keep");
    label.set_rect(SDL_Rect{ 0, 0, 200, 32 });
    int finished = 0;
    label.set_on_editing_finished([&](const std::string&) { ++finished; });

    label.start_editing();
    label.editor()->set_text("Discard");
    label.handle_event(key_down(SDLK_ESCAPE));
    CHECK_FALSE(label.is_editing());
    CHECK(label.text() == "Keep");
    CHECK(finished == 0);

    label.start_editing();
    label.editor()->set_text("Blurred");
    label.handle_event(mouse_down(500, 500));
    CHECK_FALSE(label.is_editing());
    CHECK(label.text() == "Blurred");
    CHECK(finished == 1);
}

TEST_CASE("Validated inline edit keeps editing on bad input") {
    reset_environment();
    ValidatedInlineEdit email("a@b.com", "email");
    CHECK(email.placeholder() == "Enter email address");
    email.set_rect(SDL_Rect{ 0, 0, 200, 32 });
    email.start_editing();
    email.editor()->set_text("not an email");
    CHECK_FALSE(email.finish_editing());
    CHECK(email.is_editing());
    CHECK(email.is_invalid());
    CHECK(email.text() == "a@b.com");
    email.editor()->set_text("x@example.org");
    CHECK(email.finish_editing());
    CHECK(email.text() == "x@example.org");

    const auto phone = ValidatedInlineEdit::validator_for("phone");
    CHECK(phone("+1 (555) 123-4567"));
    CHECK_FALSE(phone("555-1234"));
    const auto number = ValidatedInlineEdit::validator_for("number");
    CHECK(number("-3.5"));
    CHECK_FALSE(number("3.5kg"));
    const auto url = ValidatedInlineEdit::validator_for("url");
    CHECK(url("https://example.com/x"));
    CHECK_FALSE(url("example.com"));
    CHECK_FALSE(ValidatedInlineEdit::validator_for("text"));
}

TEST_CASE("Quick edit starts on a single click and groups collect values") {
    reset_environment();
    QuickEditLabel quick("Fast");
    quick.set_rect(SDL_Rect{ 0, 0, 200, 32 });
    click(quick);
    CHECK(quick.is_editing());

    MultilineInlineEdit notes("line one");
    CHECK(notes.height_for_width(200) >= 60);

    InlineEditGroup group;
    group.add_field("name", "Name", "Ada");
    group.add_field("mail", "Email", "ada@example.com", "email");
    CHECK(group.add_field("name", "Again") == group.get_editor("name"));
    std::map<std::string, std::string> last;
    group.set_on_group_changed([&](const std::map<std::string, std::string>& v) { last = v; });

    InlineEditLabel* name = group.get_editor("name");
    name->start_editing();
    name->editor()->set_text("Grace");
    name->finish_editing();
    CHECK(last["name"] == "Grace");
    CHECK(last["mail"] == "ada@example.com");

    group.set_values({ { "mail", "grace@example.com" }, { "unknown", "x" } });
    CHECK(group.values().at("mail") == "grace@example.com");
    CHECK(group.values().size() == 2);
}

TEST_CASE("Search box filters suggestions and debounces searches") {
    reset_environment();
    SearchBoxWithSuggestions box;
    box.set_rect(SDL_Rect{ 10, 10, 300, 32 });
    box.set_suggestions({ "Apple", "Apricot", "Banana", "Grape" });
    std::vector<std::string> searches;
    box.set_on_search_requested([&](const std::string& q) { searches.push_back(q); });
    std::vector<std::string> typed;
    box.set_on_text_changed([&](const std::string& t) { typed.push_back(t); });

    box.input()->set_focus(true);
    type(box, "ap");
    CHECK(typed == std::vector<std::string>{ "ap" });
    CHECK(box.filtered_suggestions() == std::vector<std::string>{ "Apple", "Apricot", "Grape" });
    CHECK(box.is_list_open());
    CHECK(box.list()->rect().y >= 42);

    advance(&box, 299);
    CHECK(searches.empty());
    advance(&box, 1);
    CHECK(searches == std::vector<std::string>{ "ap" });

    box.set_max_suggestions(1);
    type(box, "r");
    CHECK(box.filtered_suggestions() == std::vector<std::string>{ "Apricot" });

    box.handle_event(key_down(SDLK_ESCAPE));
    CHECK_FALSE(box.is_list_open());
}

TEST_CASE("Search box keyboard selection") {
    reset_environment();
    SearchBoxWithSuggestions box;
    box.set_rect(SDL_Rect{ 10, 10, 300, 32 });
    box.set_suggestions({ "Apple", "Apricot", "Banana" });
    std::vector<std::string> picked;
    std::vector<std::string> searches;
    box.set_on_suggestion_selected([&](const std::string& s) { picked.push_back(s); });
    box.set_on_search_requested([&](const std::string& q) { searches.push_back(q); });

    box.input()->set_focus(true);
    type(box, "a");
    box.handle_event(key_down(SDLK_DOWN));
    box.handle_event(key_down(SDLK_DOWN));
    CHECK(box.list()->highlighted() == 1);
    box.handle_event(key_down(SDLK_UP));
    box.handle_event(key_down(SDLK_UP));
    CHECK(box.list()->highlighted() == 2);
    box.handle_event(key_down(SDLK_RETURN));
    CHECK(picked == std::vector<std::string>{ "Banana" });
    CHECK(box.text() == "Banana");
    CHECK_FALSE(box.is_list_open());

    advance(&box, 400);
    CHECK(searches.empty());

    box.handle_event(key_down(SDLK_RETURN));
    CHECK(searches == std::vector<std::string>{ "Banana" });
}

TEST_CASE("Search box list rows can be clicked through the overlay layer") {
    reset_environment();
    SearchBoxWithSuggestions box;
    box.set_rect(SDL_Rect{ 10, 10, 300, 32 });
    box.set_suggestions({ "One", "Only", "Other" });
    std::string picked;
    box.set_on_suggestion_selected([&](const std::string& s) { picked = s; });
    box.input()->set_focus(true);
    type(box, "o");
    REQUIRE(box.is_list_open());
    const SDL_Point row = center(box.list()->row_rect(1));
    CHECK(OverlayManager::instance().handle_event(mouse_down(row.x, row.y)));
    CHECK(picked == "Only");
    CHECK_FALSE(box.is_list_open());
}

TEST_CASE("Search respects the minimum query length") {
    reset_environment();
    SearchBoxWithSuggestions box;
    box.set_rect(SDL_Rect{ 0, 0, 300, 32 });
    box.set_min_chars(3);
    box.set_suggestions({ "Apple" });
    int searches = 0;
    box.set_on_search_requested([&](const std::string&) { ++searches; });
    box.input()->set_focus(true);
    type(box, "ap");
    CHECK_FALSE(box.is_list_open());
    advance(&box, 500);
    box.search();
    CHECK(searches == 0);
    type(box, "p");
    CHECK(box.is_list_open());
    box.search();
    CHECK(searches == 1);
}

TEST_CASE("Recent and history search boxes remember queries") {
    reset_environment();
    RecentSearchBox recent;
    recent.set_rect(SDL_Rect{ 0, 0, 300, 32 });
    for (const char* q : { "one", "two", "one" }) {
        recent.set_text(q);
        recent.search();
    }
    CHECK(recent.recent_searches() == std::vector<std::string>{ "one", "two" });
    for (const char* q : { "a", "b", "c", "d", "e" }) {
        recent.set_text(q);
        recent.search();
    }
    CHECK(recent.recent_searches() == std::vector<std::string>{ "e", "d", "c", "b", "a" });

    recent.clear();
    recent.input()->set_focus(true);
    CHECK(recent.is_list_open());
    REQUIRE(recent.list()->rows().size() == 6);
    CHECK(recent.list()->rows()[0].header);
    CHECK(recent.list()->rows()[0].text == "Recent searches");
    recent.handle_event(key_down(SDLK_DOWN));
    CHECK(recent.list()->highlighted() == 1);

    HistorySearchBox history;
    std::vector<std::string> loaded;
    for (int i = 0; i < 25; ++i) loaded.push_back("q" + std::to_string(i));
    history.load_history(loaded);
    CHECK(history.history().size() == 20);
    history.set_text("q5");
    history.search();
    CHECK(history.history().front() == "q5");
    CHECK(history.history().size() == 20);
}

TEST_CASE("Categorized search prefixes results with the category") {
    reset_environment();
    CategorizedSearchBox box;
    box.set_rect(SDL_Rect{ 0, 0, 500, 32 });
    box.add_category("Fruit", { "Apple", "Banana" });
    box.add_category("Tech", { "Apple Watch", "Laptop" });
    CHECK(box.categories() == std::vector<std::string>{ "Fruit", "Tech" });
    CHECK(box.input()->rect().x == CategorizedSearchBox::kSelectorWidth + 8);

    std::string category = "unset";
    box.set_on_category_changed([&](const std::string& c) { category = c; });
    box.input()->set_focus(true);
    type(box, "apple");
    CHECK(box.filtered_suggestions() == std::vector<std::string>{ "Fruit: Apple", "Tech: Apple Watch" });

    box.set_category("Tech");
    CHECK(category == "Tech");
    CHECK(box.filtered_suggestions() == std::vector<std::string>{ "Tech: Apple Watch" });
    box.set_category("Nope");
    CHECK(box.category() == "Tech");
    box.set_category("");
    CHECK(category.empty());
    CHECK(box.filtered_suggestions().size() == 2);
}

TEST_CASE("Form stepper validates before advancing") {
    reset_environment();
    FormStepper stepper;
    stepper.set_rect(SDL_Rect{ 0, 0, 600, 400 });
    bool details_ok = false;
    stepper.add_step("Account", std::make_unique<Label>("a"));
    stepper.add_step("Details", std::make_unique<Label>("b"), "About you", [&] { return details_ok; });
    stepper.add_step("Confirm", std::make_unique<Label>("c"));
    CHECK(stepper.step_count() == 3);
    CHECK(stepper.indicator()->step_count() == 3);
    CHECK_FALSE(stepper.previous_button()->is_enabled());

    std::vector<int> changed;
    std::vector<int> completed;
    stepper.set_on_step_changed([&](int i) { changed.push_back(i); });
    stepper.set_on_step_completed([&](int i) { completed.push_back(i); });

    CHECK(click(*stepper.next_button()));
    CHECK(stepper.current_step() == 1);
    CHECK(stepper.is_step_completed(0));
    CHECK(stepper.previous_button()->is_enabled());

    CHECK_FALSE(stepper.next_step());
    CHECK(stepper.current_step() == 1);
    details_ok = true;
    CHECK(stepper.next_step());
    CHECK(stepper.current_step() == 2);
    CHECK_FALSE(stepper.next_button()->is_visible());
    CHECK(stepper.finish_button()->is_visible());
    CHECK_FALSE(stepper.next_step());

    CHECK(changed == std::vector<int>{ 1, 2 });
    CHECK(completed == std::vector<int>{ 0, 1 });
    CHECK(stepper.indicator()->is_completed(1));
    CHECK(stepper.indicator()->current_step() == 2);
}

TEST_CASE("Form stepper finish emits all step data") {
    reset_environment();
    FormStepper stepper;
    stepper.add_step("One", std::make_unique<Label>("1"));
    stepper.add_step("Two", std::make_unique<Label>("2"));
    stepper.set_step_data(0, { { "name", "Ada" } });
    stepper.set_step_data(1, { { "age", 36 } });
    CHECK(stepper.get_step_data(5) == nlohmann::json::object());

    nlohmann::json result;
    stepper.set_on_form_completed([&](const nlohmann::json& j) { result = j; });
    stepper.go_to_step(1);
    CHECK(stepper.finish());
    CHECK(result["0"]["name"] == "Ada");
    CHECK(result["1"]["age"] == 36);
    CHECK(stepper.is_step_completed(1));

    stepper.reset_form();
    CHECK(stepper.current_step() == 0);
    CHECK_FALSE(stepper.is_step_completed(1));
    CHECK(stepper.get_all_data().empty());
}

TEST_CASE("Removing steps clamps the current step") {
    reset_environment();
    FormStepper stepper;
    stepper.add_step("A", std::make_unique<Label>("a"));
    stepper.add_step("B", std::make_unique<Label>("b"));
    stepper.add_step("C", std::make_unique<Label>("c"));
    stepper.go_to_step(2);
    stepper.go_to_step(7);
    CHECK(stepper.current_step() == 2);
    stepper.remove_step(2);
    CHECK(stepper.current_step() == 1);
    CHECK(stepper.step_title(1) == "B");
    CHECK(stepper.finish_button()->is_visible());
    stepper.remove_step(0);
    stepper.remove_step(0);
    CHECK(stepper.step_count() == 0);
    CHECK(stepper.current_step() == 0);
    stepper.remove_step(0);
    CHECK_FALSE(stepper.finish());
}

TEST_CASE("Step progress indicator spreads circles across its width") {
    reset_environment();
    StepProgressIndicator indicator;
    indicator.add_step("A");
    indicator.add_step("B");
    indicator.add_step("C");
    indicator.set_rect(SDL_Rect{ 0, 0, 440, 80 });
    CHECK(indicator.height_for_width(440) == 80);
    CHECK(indicator.circle_center(0).x == 20);
    CHECK(indicator.circle_center(1).x == 220);
    CHECK(indicator.circle_center(2).x == 420);
    CHECK(indicator.circle_center(1).y == 25);
}

TEST_CASE("Simple form stepper reports its position") {
    reset_environment();
    SimpleFormStepper simple({ "Start", "Middle", "End" });
    CHECK(simple.step_text() == "Step 1 of 3: Start");
    CHECK_FALSE(simple.previous_step());
    CHECK(simple.next_step());
    CHECK(simple.progress_bar()->value() == 50);
    CHECK(simple.next_step());
    CHECK_FALSE(simple.next_step());
    CHECK(simple.step_text() == "Step 3 of 3: End");
}

TEST_CASE("Civil date arithmetic") {
    CHECK(Date(1970, 1, 1).to_days() == 0);
    CHECK(Date(2000, 3, 1).to_days() == 11017);
    CHECK(Date::from_days(19797) == Date(2024, 3, 15));
    CHECK(Date(2024, 1, 1).weekday() == 1);
    CHECK(Date(1970, 1, 1).weekday() == 4);
    CHECK(Date(2024, 3, 1).add_days(-1) == Date(2024, 2, 29));
    CHECK(Date(2023, 12, 31).add_days(1) == Date(2024, 1, 1));
    CHECK(Date::days_in_month(1900, 2) == 28);
    CHECK(Date::days_in_month(2000, 2) == 29);
    CHECK_FALSE(Date(2023, 2, 29).is_valid());
    CHECK(Date().is_null());

    Date d;
    CHECK(Date::parse("2024-02-29", d));
    CHECK(d.to_string() == "2024-02-29");
    CHECK_FALSE(Date::parse("2023-02-29", d));
    CHECK_FALSE(Date::parse("2024-2-9", d));
    CHECK(d == Date(2024, 2, 29));
    CHECK(Date(2024, 1, 31) < Date(2024, 2, 1));
}

TEST_CASE("Date presets relative to today") {
    const Date today(2024, 3, 15);
    CHECK(wk::preset_range(DatePreset::Today, today) == std::make_pair(today, today));
    CHECK(wk::preset_range(DatePreset::Yesterday, today).first == Date(2024, 3, 14));
    CHECK(wk::preset_range(DatePreset::Last7Days, today).first == Date(2024, 3, 9));
    CHECK(wk::preset_range(DatePreset::Last30Days, today).first == Date(2024, 2, 15));
    CHECK(wk::preset_range(DatePreset::ThisMonth, today).first == Date(2024, 3, 1));
    const auto last_month = wk::preset_range(DatePreset::LastMonth, today);
    CHECK(last_month.first == Date(2024, 2, 1));
    CHECK(last_month.second == Date(2024, 2, 29));
    CHECK(wk::preset_range(DatePreset::LastMonth, Date(2024, 1, 10)).first == Date(2023, 12, 1));
    CHECK(wk::preset_range(DatePreset::ThisYear, today).first == Date(2024, 1, 1));
    CHECK(wk::date_presets().size() == 7);
    CHECK(wk::preset_name(DatePreset::Last30Days) == "Last 30 days");
}

TEST_CASE("Date range picker keeps the start before the end") {
    reset_environment();
    DateRangePicker picker;
    std::vector<std::pair<Date, Date>> ranges;
    picker.set_on_range_changed([&](const Date& s, const Date& e) { ranges.emplace_back(s, e); });

    picker.set_start_date(Date(2024, 3, 10));
    CHECK(ranges.empty());
    CHECK(picker.days_in_range() == 0);
    picker.set_end_date(Date(2024, 3, 20));
    CHECK(picker.days_in_range() == 11);
    CHECK(picker.start_input()->text() == "2024-03-10");
    CHECK(picker.end_input()->text() == "2024-03-20");

    picker.set_start_date(Date(2024, 3, 25));
    CHECK(picker.end_date() == Date(2024, 3, 25));
    CHECK(picker.days_in_range() == 1);
    picker.set_end_date(Date(2024, 3, 1));
    CHECK(picker.start_date() == Date(2024, 3, 1));

    picker.set_date_range(Date(2024, 4, 30), Date(2024, 4, 1));
    CHECK(picker.start_date() == Date(2024, 4, 1));
    CHECK(picker.days_in_range() == 30);
    const size_t before = ranges.size();
    picker.set_date_range(Date(2024, 4, 1), Date(2024, 4, 30));
    CHECK(ranges.size() == before);
    picker.set_start_date(Date());
    CHECK(picker.start_date() == Date(2024, 4, 1));

    picker.apply_preset(DatePreset::Last7Days, Date(2024, 3, 15));
    CHECK(picker.start_date() == Date(2024, 3, 9));
    CHECK(picker.days_in_range() == 7);

    picker.clear();
    CHECK_FALSE(picker.has_range());
    CHECK(picker.start_input()->text().empty());
}

TEST_CASE("Date range picker calendar popup selects a range") {
    reset_environment();
    DateRangePicker picker;
    picker.set_rect(SDL_Rect{ 10, 10, 420, 32 });
    const SDL_Point start_box = center(picker.start_input()->box_rect());
    CHECK(picker.handle_event(mouse_down(start_box.x, start_box.y)));
    REQUIRE(picker.is_calendar_open());
    CHECK(picker.selecting_start());

    DateRangeCalendarPopup* cal = picker.calendar();
    cal->click_date(Date(2024, 5, 20));
    CHECK(picker.start_date() == Date(2024, 5, 20));
    cal->click_date(Date(2024, 5, 5));
    CHECK(cal->pending_start() == Date(2024, 5, 5));
    CHECK(cal->pending_end() == Date(2024, 5, 20));
    cal->apply_selection();
    CHECK_FALSE(picker.is_calendar_open());
    CHECK(picker.start_date() == Date(2024, 5, 5));
    CHECK(picker.end_date() == Date(2024, 5, 20));

    picker.open_calendar(false);
    CHECK(cal->grid()->month() == 5);
    cal->previous_month();
    CHECK(cal->month_title() == "April 2024");
    cal->next_month();
    cal->next_month();
    CHECK(cal->month_title() == "June 2024");
    cal->clear_selection();
    CHECK_FALSE(picker.has_range());
    CHECK_FALSE(picker.is_calendar_open());
}

TEST_CASE("Calendar grid maps points to days of the shown month") {
    reset_environment();
    CalendarGrid grid;
    grid.set_month(2024, 5);
    grid.set_rect(SDL_Rect{ 0, 0, 224, 24 + 6 * 32 });
    CHECK(grid.first_cell_date() == Date(2024, 4, 28));
    const SDL_Point may1 = center(grid.date_rect(Date(2024, 5, 1)));
    CHECK(grid.date_at(may1) == Date(2024, 5, 1));
    CHECK(grid.date_at(SDL_Point{ 5, 30 }).is_null());
    CHECK(grid.date_at(SDL_Point{ 5, 5 }).is_null());

    Date clicked;
    grid.set_on_date_clicked([&](const Date& d) { clicked = d; });
    CHECK(grid.handle_event(mouse_down(may1.x, may1.y)));
    CHECK(clicked == Date(2024, 5, 1));
}

TEST_CASE("Forms widgets render without a window") {
    reset_environment();
    SoftwareCanvas canvas;
    std::vector<std::unique_ptr<Widget>> widgets;
    widgets.push_back(std::make_unique<ToggleSwitch>(true, "Switch"));
    widgets.push_back(std::make_unique<IconToggleSwitch>());
    widgets.push_back(std::make_unique<SliderWithInput>(0, 10, 5, "px", "Size"));
    widgets.push_back(std::make_unique<RangeSlider>());
    auto tags = std::make_unique<ColoredTagInput>();
    tags->add_tag("x");
    widgets.push_back(std::move(tags));
    widgets.push_back(std::make_unique<MultilineInlineEdit>("text"));
    widgets.push_back(std::make_unique<CategorizedSearchBox>());
    auto stepper = std::make_unique<FormStepper>();
    stepper->add_step("One", std::make_unique<Label>("1"));
    stepper->add_step("Two", std::make_unique<Label>("2"));
    stepper->next_step();
    widgets.push_back(std::move(stepper));
    widgets.push_back(std::make_unique<DateRangePicker>());
    int y = 0;
    for (auto& w : widgets) {
        const int h = w->height_for_width(400);
        w->set_rect(SDL_Rect{ 0, y, 400, h });
        w->update();
        w->render(canvas.renderer());
        y += h;
    }
    CalendarGrid grid;
    grid.set_rect(SDL_Rect{ 0, 0, 224, 216 });
    grid.set_selection(Date(2024, 5, 3), Date(2024, 5, 9));
    grid.render(canvas.renderer());
    CHECK(y > 0);
}
