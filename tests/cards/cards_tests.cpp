#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/controls.hpp"
#include "cards/expandable_card.hpp"
#include "cards/hover_action_card.hpp"
#include "cards/image_card.hpp"
#include "cards/info_card.hpp"
#include "cards/profile_card.hpp"
#include "cards/selectable_card.hpp"
#include "cards/stat_card.hpp"
#include "user/user_avatar.hpp"
#include "../test_support.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace wk_test;

namespace {
void place(Widget& w, int x = 0, int y = 0, int width = 320) {
    w.set_rect(SDL_Rect{ x, y, width, w.height_for_width(width) });
}
}

TEST_CASE("Number parsing and change formatting") {
    double v = 0.0;
    CHECK(wk::parse_number("1,250.5", v));
    CHECK(v == doctest::Approx(1250.5));
    CHECK(wk::parse_number(" 42 ", v));
    CHECK(v == doctest::Approx(42.0));
    CHECK_FALSE(wk::parse_number("12 apples", v));
    CHECK_FALSE(wk::parse_number("", v));

    CHECK(wk::format_change(12.5) == "+12.5%");
    CHECK(wk::format_change(-3.0) == "-3.0%");
    CHECK(wk::format_change(0.0) == "0%");

    CHECK(wk::parse_trend("up") == Trend::Up);
    CHECK(wk::parse_trend("down") == Trend::Down);
    CHECK(wk::parse_trend("sideways") == Trend::Flat);
}

TEST_CASE("Metric card formats its trend from a percentage") {
    reset_environment();
    MetricCard card("Revenue", "$12,400", "", Trend::Up, 12.5);
    CHECK(card.trend() == Trend::Up);
    CHECK(card.trend_text() == "+12.5%");

    card.set_trend(Trend::Down, 4.0);
    CHECK(card.trend_text() == "-4.0%");
    CHECK(card.percent() == doctest::Approx(4.0));

    std::string seen;
    card.set_on_value_changed([&](const std::string& v) { seen = v; });
    card.set_value("$13,000");
    CHECK(seen == "$13,000");
    CHECK(card.value() == "$13,000");
}

TEST_CASE("Comparison card derives the change from both values") {
    reset_environment();
    ComparisonStatCard card("Visitors", "150", "100");
    CHECK(card.change_percent() == doctest::Approx(50.0));
    CHECK(card.trend() == Trend::Up);
    CHECK(card.trend_text() == "+50.0%");

    card.set_comparison_values("80", "100");
    CHECK(card.change_percent() == doctest::Approx(-20.0));
    CHECK(card.trend() == Trend::Down);
    CHECK(card.trend_text() == "-20.0%");
    CHECK(card.value() == "80");

    card.set_comparison_values("80", "0");
    CHECK(card.change_percent() == doctest::Approx(0.0));

    card.set_comparison_values("n/a", "100");
    CHECK(card.trend() == Trend::Flat);
    CHECK(card.trend_text() == "N/A");
}

TEST_CASE("Progress stat card clamps its percentage") {
    reset_environment();
    ProgressStatCard card("Storage", "75", "200", "GB");
    CHECK(card.progress_percentage() == 37);

    card.set_value("250");
    CHECK(card.progress_percentage() == 100);

    card.set_value("-5");
    CHECK(card.progress_percentage() == 0);

    card.set_value("50");
    card.set_max_value("unknown");
    CHECK(card.progress_percentage() == 0);
}

TEST_CASE("Info and status cards") {
    reset_environment();
    InfoCard info("Tip", "Drag cards to reorder them", "info");
    CHECK(info.title() == "Tip");
    CHECK(info.icon() == "info");
    info.set_subtitle("Kanban");
    CHECK(info.subtitle() == "Kanban");
    info.set_content("Updated");
    CHECK(info.content() == "Updated");

    StatusCard status("Server", "active", "All systems go");
    CHECK(StatusCard::color_role_for("active") == "success");
    CHECK(StatusCard::color_role_for("warning") == "warning");
    CHECK(StatusCard::color_role_for("error") == "danger");
    CHECK(StatusCard::color_role_for("pending") == "info");
    CHECK(StatusCard::color_role_for("inactive") == "text_secondary");
    status.set_status("error");
    CHECK(status.status() == "error");
}

TEST_CASE("Expandable card animates its body height") {
    reset_environment();
    ExpandableCard card("Details", "Hidden until opened");
    place(card);
    const int closed_h = card.height_for_width(320);
    CHECK_FALSE(card.is_expanded());
    CHECK(card.expand_progress() == doctest::Approx(0.0f));

    std::vector<bool> changes;
    card.set_on_expanded_changed([&](bool e) { changes.push_back(e); });
    card.set_expanded(true);
    CHECK(card.is_expanded());
    advance(&card, 150);
    CHECK(card.expand_progress() > 0.0f);
    CHECK(card.expand_progress() < 1.0f);
    advance(&card, 200);
    CHECK(card.expand_progress() == doctest::Approx(1.0f));
    CHECK(card.height_for_width(320) > closed_h);

    card.set_expanded(false, false);
    CHECK(card.expand_progress() == doctest::Approx(0.0f));
    CHECK(card.height_for_width(320) == closed_h);
    CHECK(changes == std::vector<bool>{ true, false });
}

TEST_CASE("Clicking the header toggles an expandable card") {
    reset_environment();
    ExpandableCard card("Details", "Body text");
    place(card);
    const SDL_Rect header = card.header()->rect();
    click_at(card, header.x + 10, header.y + header.h / 2);
    CHECK(card.is_expanded());
    advance(&card, 320);
    place(card);
    const SDL_Rect body = card.body()->rect();
    click_at(card, body.x + 10, body.y + body.h / 2);
    CHECK(card.is_expanded());
}

TEST_CASE("Accordion keeps one section open unless multiple are allowed") {
    reset_environment();
    AccordionCard accordion("FAQ");
    accordion.add_section("Shipping", "Three to five days");
    accordion.add_section("Returns", "Thirty days");
    accordion.add_section("Support", std::make_unique<Label>("Mail us"));
    CHECK(accordion.section_count() == 3);

    std::vector<std::pair<size_t, bool>> toggles;
    accordion.set_on_section_toggled([&](size_t i, bool e) { toggles.emplace_back(i, e); });

    accordion.expand_section(0);
    accordion.expand_section(1);
    CHECK(accordion.expanded_sections() == std::vector<size_t>{ 1 });
    CHECK(toggles.size() == 3);

    accordion.set_allow_multiple(true);
    accordion.expand_section(2);
    CHECK(accordion.expanded_sections() == std::vector<size_t>{ 1, 2 });

    accordion.set_allow_multiple(false);
    CHECK(accordion.expanded_sections() == std::vector<size_t>{ 1 });

    accordion.collapse_all();
    CHECK(accordion.expanded_sections().empty());
    accordion.expand_section(7);
    CHECK(accordion.expanded_sections().empty());
}

TEST_CASE("Step card reports its status") {
    reset_environment();
    StepCard step(2, "Configure", StepStatus::Current);
    CHECK(step.step_number() == 2);
    CHECK(step.status() == StepStatus::Current);
    CHECK_FALSE(step.is_completed());
    step.set_completed(true);
    CHECK(step.is_completed());
    CHECK(StepCard::status_text(StepStatus::Completed) == "Completed");
    CHECK(StepCard::status_text(StepStatus::Pending) == "Pending");
}

TEST_CASE("Selectable card toggles on click and falls back to its title") {
    reset_environment();
    SelectableCard card("Basic plan", "For individuals");
    place(card);
    std::vector<bool> states;
    card.set_on_selection_changed([&](bool s) { states.push_back(s); });
    click(card);
    CHECK(card.is_selected());
    click(card);
    CHECK_FALSE(card.is_selected());
    CHECK(states == std::vector<bool>{ true, false });
    CHECK(card.value() == "Basic plan");
    card.set_value("basic");
    CHECK(card.value() == "basic");
}

TEST_CASE("Option cards in a group behave like radio buttons") {
    reset_environment();
    OptionCard a("Small", "", "s");
    OptionCard b("Large", "", "l");
    place(a, 0, 0);
    place(b, 0, 200);
    OptionCardGroup group;
    group.add_card(&a);
    group.add_card(&b);

    std::string picked;
    group.set_on_selection_changed([&](int, const std::string& v) { picked = v; });

    click(a);
    CHECK(a.is_selected());
    click(a);
    CHECK(a.is_selected());
    click(b);
    CHECK(b.is_selected());
    CHECK_FALSE(a.is_selected());
    CHECK(picked == "l");
    CHECK(group.selected_index() == 1);

    group.set_selected_index(0);
    CHECK(group.selected_value() == "s");
    group.set_selected_index(5);
    CHECK(group.selected_index() == 0);
}

TEST_CASE("Multi select card honours its cap") {
    reset_environment();
    MultiSelectCard card("Toppings");
    card.add_option("Cheese");
    card.add_option("Olives", "olive");
    card.add_option("Peppers");
    card.add_option("Onions");
    place(card);

    std::vector<std::string> last;
    card.set_on_selection_changed([&](const std::vector<std::string>& v) { last = v; });

    card.set_max_selection(2);
    card.select_all();
    CHECK(card.selected_values() == std::vector<std::string>{ "Cheese", "olive" });
    CHECK(last == card.selected_values());

    click(*card.option(2));
    CHECK_FALSE(card.option(2)->is_checked());
    CHECK(card.selected_values().size() == 2);

    click(*card.option(0));
    CHECK(card.selected_values() == std::vector<std::string>{ "olive" });
    click(*card.option(3));
    CHECK(card.selected_values() == std::vector<std::string>{ "olive", "Onions" });

    card.set_max_selection(1);
    CHECK(card.selected_values() == std::vector<std::string>{ "olive" });

    card.clear_selection();
    CHECK(card.selected_values().empty());
}

TEST_CASE("Filter card groups active chips by category") {
    reset_environment();
    FilterCard card;
    card.add_filter("Color", "Red");
    card.add_filter("Color", "Blue");
    card.add_filter("Size", "M", true);
    CHECK(card.categories() == std::vector<std::string>{ "Color", "Size" });

    int changes = 0;
    FilterCard::Filters last;
    card.set_on_filters_changed([&](const FilterCard::Filters& f) {
        ++changes;
        last = f;
    });

    CHECK(card.set_filter_active("Color", "Blue", true));
    CHECK_FALSE(card.set_filter_active("Color", "Green", true));
    CHECK(changes == 1);
    CHECK(last["Color"] == std::vector<std::string>{ "Blue" });
    CHECK(last["Size"] == std::vector<std::string>{ "M" });

    card.add_filter("Color", "Red")->click();
    CHECK(card.is_filter_active("Color", "Red"));
    CHECK(card.active_filters()["Color"] == std::vector<std::string>{ "Red", "Blue" });

    card.clear_filters();
    CHECK(card.active_filters().empty());
    CHECK(last.empty());
}

TEST_CASE("Hover action card reveals its actions while hovered") {
    reset_environment();
    HoverActionCard card("Report", "Quarterly numbers");
    std::vector<std::string> triggered;
    card.set_on_action_triggered([&](const std::string& n) { triggered.push_back(n); });
    int direct = 0;
    card.add_action("Share", [&] { ++direct; });
    card.add_action("Delete", {}, "delete", ButtonVariant::Destructive);
    place(card);
    CHECK(card.action_names() == std::vector<std::string>{ "Share", "delete" });
    CHECK_FALSE(card.actions_shown());
    CHECK(card.footer()->opacity() == doctest::Approx(0.0f));

    BaseButton* share = card.action("Share");
    REQUIRE(share);
    const SDL_Rect sr = share->rect();
    click_at(card, sr.x + sr.w / 2, sr.y + sr.h / 2);
    CHECK(direct == 0);

    card.handle_event(mouse_move(10, 10));
    CHECK(card.actions_shown());
    advance(&card, 220);
    CHECK(card.footer()->opacity() == doctest::Approx(1.0f));

    click_at(card, sr.x + sr.w / 2, sr.y + sr.h / 2);
    CHECK(direct == 1);
    CHECK(triggered == std::vector<std::string>{ "Share" });

    card.handle_event(mouse_move(2000, 2000));
    CHECK_FALSE(card.actions_shown());
    advance(&card, 200);
    CHECK(card.footer()->opacity() == doctest::Approx(0.0f));

    CHECK(card.remove_action("delete"));
    CHECK_FALSE(card.remove_action("delete"));
    card.clear_actions();
    CHECK(card.action_names().empty());
}

TEST_CASE("Media and project cards") {
    reset_environment();
    MediaCard media("Intro", "Two minutes");
    std::vector<bool> playback;
    media.set_on_playback_changed([&](bool p) { playback.push_back(p); });
    media.toggle_playback();
    media.set_playing(true);
    media.toggle_playback();
    CHECK(playback == std::vector<bool>{ true, false });
    media.set_progress(140);
    CHECK(media.progress() == 100);

    ProjectCard project("Website", "Relaunch", "paused", 150, 1);
    CHECK(project.progress() == 100);
    CHECK(project.status() == "paused");
    CHECK(ProjectCard::color_role_for("paused") == "warning");
    CHECK(ProjectCard::color_role_for("completed") == "info");
    CHECK(project.action_names() == std::vector<std::string>{ "open", "edit", "settings" });
    project.set_team_count(-3);
    CHECK(project.team_count() == 0);
}

TEST_CASE("Quick action card is clickable as a whole") {
    reset_environment();
    QuickActionCard card("New file", "file", "Create an empty file");
    place(card);
    int clicks = 0;
    card.set_on_clicked([&] { ++clicks; });
    click(card);
    CHECK(clicks == 1);
    CHECK(card.icon() == "file");
}

TEST_CASE("Gallery card pages with wrap around") {
    reset_environment();
    GalleryCard gallery("Trip", { "a.png", "b.png", "c.png" });
    CHECK(gallery.current_index() == 0);
    CHECK(gallery.counter_text() == "1 / 3");

    std::vector<int> seen;
    gallery.set_on_image_changed([&](int i, const std::string&) { seen.push_back(i); });
    gallery.previous_image();
    CHECK(gallery.current_index() == 2);
    gallery.next_image();
    CHECK(gallery.current_index() == 0);
    gallery.set_current_index(0);
    gallery.set_current_index(9);
    CHECK(seen == std::vector<int>{ 2, 0 });
    CHECK(gallery.image_path() == "a.png");

    CHECK(gallery.remove_image(0));
    CHECK(gallery.image_count() == 2);
    CHECK(gallery.current_index() == 0);
    CHECK(gallery.image_path() == "b.png");

    gallery.set_images({});
    CHECK(gallery.current_index() == -1);
    CHECK(gallery.counter_text() == "0 / 0");
    gallery.next_image();
    CHECK(gallery.current_index() == -1);
}

TEST_CASE("Product card shows the discount against the original price") {
    reset_environment();
    ProductCard product("Headphones", 75.0, "", 100.0, 4.5);
    CHECK(product.name() == "Headphones");
    CHECK(product.price_text() == "$75.00");
    CHECK(product.discount_percentage() == 25);
    CHECK(product.discount_text() == "-25%");
    CHECK(product.rating() == doctest::Approx(4.5));

    product.set_original_price(50.0);
    CHECK(product.discount_percentage() == 0);
    CHECK(product.discount_text().empty());

    product.set_currency("EUR ");
    CHECK(product.price_text() == "EUR 75.00");
    product.set_rating(9.0);
    CHECK(product.rating() == doctest::Approx(5.0));

    int added = 0;
    product.set_on_add_to_cart([&] { ++added; });
    product.cart_button()->click();
    CHECK(added == 1);
}

TEST_CASE("Image card falls back to a placeholder") {
    reset_environment();
    ImageCard card("Missing", "/nonexistent/picture.png", "Nothing here");
    CHECK_FALSE(card.image_view()->has_image());
    CHECK(card.description() == "Nothing here");
    int clicks = 0;
    card.set_on_image_clicked([&] { ++clicks; });
    place(card);
    click(*card.image_view());
    CHECK(clicks == 1);
}

TEST_CASE("Profile cards keep stats, actions and status") {
    reset_environment();
    ProfileCard profile("Ada Lovelace", "Engineer");
    profile.add_stat("Posts", "12");
    profile.add_stat("Followers", "3.4k");
    profile.add_stat("Posts", "13");
    CHECK(profile.stat_count() == 2);
    CHECK(profile.stat("Posts") == "13");
    CHECK(profile.stat("Likes").empty());
    CHECK(profile.avatar()->initials() == "AL");

    std::string action;
    profile.set_on_action_clicked([&](const std::string& a) { action = a; });
    profile.add_action("Message")->click();
    CHECK(action == "Message");
    CHECK(profile.remove_action("Message"));
    CHECK(profile.action_count() == 0);

    profile.set_email("ada@example.com");
    CHECK(profile.email() == "ada@example.com");
    profile.set_name("Grace Hopper");
    CHECK(profile.avatar()->initials() == "GH");

    TeamMemberCard member("Linus", "Maintainer", "", "busy");
    CHECK(member.status() == "busy");
    CHECK(member.avatar()->status() == "busy");
    CHECK(TeamMemberCard::status_text("away") == "Away");
    CHECK(TeamMemberCard::status_text("gone") == "Offline");
}

TEST_CASE("Every card renders without a font or image") {
    reset_environment();
    SoftwareCanvas canvas;
    std::vector<std::unique_ptr<Widget>> cards;
    cards.push_back(std::make_unique<InfoCard>("Info", "Text", "info"));
    cards.push_back(std::make_unique<MetricCard>("Users", "1,024", "", Trend::Up, 3.0));
    cards.push_back(std::make_unique<IconStatCard>("Orders", "88", "", "chart"));
    cards.push_back(std::make_unique<ExpandableCard>("More", "Text", true));
    cards.push_back(std::make_unique<StepCard>(1, "Start", StepStatus::Completed));
    cards.push_back(std::make_unique<OptionCard>("Option", "Text"));
    cards.push_back(std::make_unique<ProductCard>("Lamp", 20.0, "", 30.0, 3.5));
    cards.push_back(std::make_unique<TeamMemberCard>("Sam Doe", "Design"));
    for (auto& c : cards) {
        place(*c, 10, 10, 300);
        c->render(canvas.renderer());
    }
    CHECK(cards.size() == 8);
}
