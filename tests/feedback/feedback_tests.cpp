#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "feedback/badge_label.hpp"
#include "feedback/empty_state.hpp"
#include "feedback/notification_toast.hpp"
#include "feedback/progress_overlay.hpp"
#include "feedback/snackbar.hpp"
#include "feedback/status_chip.hpp"
#include "feedback/tooltip.hpp"
#include "../test_support.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace wk_test;

namespace {
// Steps the clock, running the tooltip manager and the overlay layer.
void run(TooltipManager& tm, Uint32 ms) {
    for (Uint32 done = 0; done < ms; done += 16) {
        wk::Clock::advance(16);
        tm.update();
        OverlayManager::instance().update();
    }
}
}

TEST_CASE("Badge count clamps and caps its text") {
    reset_environment();
    BadgeLabel badge(5, 99);
    CHECK(badge.badge_visible());
    CHECK(badge.badge_text() == "5");
    CHECK(badge.badge_width() == 18);

    std::vector<int> seen;
    badge.set_on_count_changed([&](int n) { seen.push_back(n); });
    badge.set_count(5);
    CHECK(seen.empty());
    badge.set_count(42);
    CHECK(badge.badge_width() == 22);
    badge.set_count(150);
    CHECK(badge.badge_text() == "99+");
    CHECK(badge.badge_width() == 24);
    badge.set_count(-3);
    CHECK(badge.count() == 0);
    CHECK(seen == std::vector<int>{ 42, 150, 0 });

    CHECK_FALSE(badge.badge_visible());
    CHECK(badge.preferred_width() == 0);
    badge.set_show_zero(true);
    CHECK(badge.badge_visible());
    CHECK(badge.badge_text() == "0");

    badge.set_max_count(0);
    CHECK(badge.max_count() == 1);
}

TEST_CASE("Badge bounces only when the count grows") {
    reset_environment();
    BadgeLabel badge(1);
    badge.increment();
    CHECK(badge.is_animating("scale"));
    advance(&badge, 400);
    CHECK_FALSE(badge.is_animating("scale"));
    badge.decrement();
    CHECK_FALSE(badge.is_animating("scale"));

    badge.set_animated(false);
    badge.increment();
    CHECK_FALSE(badge.is_animating("scale"));
}

TEST_CASE("Badge colour roles") {
    reset_environment();
    BadgeLabel badge(1);
    const ThemeManager& theme = ThemeManager::instance();
    badge.set_badge_color("error");
    CHECK(wk::same_color(badge.badge_color(), theme.color("danger")));
    badge.set_badge_color("secondary");
    CHECK(wk::same_color(badge.badge_color(), theme.color("text_secondary")));
    badge.set_badge_color(wk::rgba(1, 2, 3));
    CHECK(wk::same_color(badge.badge_color(), wk::rgba(1, 2, 3)));
}

TEST_CASE("Badged widget pins the badge to the child's top-right corner") {
    reset_environment();
    BadgedWidget badged(std::make_unique<IconButton>("bell", 32), 3);
    const int w = badged.preferred_width();
    CHECK(w == 32 + 9);
    badged.set_rect(SDL_Rect{ 10, 10, w, badged.height_for_width(w) });

    const SDL_Rect child = badged.child()->rect();
    CHECK(child.y == 10 + BadgeLabel::kHeight / 2);
    const SDL_Rect badge = badged.badge_rect();
    CHECK(badge.x + badge.w / 2 == child.x + child.w);
    CHECK(badge.y == child.y - BadgeLabel::kHeight / 2);

    badged.badge()->set_count(120);
    badged.update();
    CHECK(badged.badge()->rect().w == badged.badge()->badge_width());
}

TEST_CASE("Status chip colours") {
    reset_environment();
    CHECK(wk::same_color(StatusChip::colors_for("active").bg, wk::parse_hex("#10B981")));
    CHECK(wk::same_color(StatusChip::colors_for("pending").fg, wk::rgba(255, 255, 255)));
    CHECK(wk::same_color(StatusChip::colors_for("error").fg, Styles::Status("error").fg));
    CHECK(wk::same_color(StatusChip::colors_for("whatever").bg, Styles::Status("neutral").bg));
}

TEST_CASE("Closable chip asks to close, clickable chip reports clicks") {
    reset_environment();
    StatusChip chip("Beta", "info");
    chip.set_clickable(true);
    chip.set_closable(true);
    const int w = chip.preferred_width();
    chip.set_rect(SDL_Rect{ 0, 0, w, chip.height_for_width(w) });

    int clicks = 0;
    int closes = 0;
    chip.set_on_clicked([&]() { ++clicks; });
    chip.set_on_close_requested([&]() { ++closes; });

    const SDL_Rect x = chip.close_rect();
    click_at(chip, x.x + x.w / 2, x.y + x.h / 2);
    CHECK(closes == 1);
    CHECK(clicks == 0);
    click_at(chip, 6, chip.rect().h / 2);
    CHECK(clicks == 1);
}

TEST_CASE("Chip group adds, finds and removes chips") {
    reset_environment();
    StatusChipGroup group;
    group.add_chip("Open", "info", true);
    group.add_chip("Blocked", "error", true);
    CHECK(group.chips().size() == 2);
    group.set_rect(SDL_Rect{ 0, 0, 400, group.height_for_width(400) });

    std::string text;
    std::string status;
    group.set_on_chip_clicked([&](const std::string& t, const std::string& s) {
        text = t;
        status = s;
    });
    StatusChip* blocked = group.find_chip("Blocked");
    REQUIRE(blocked != nullptr);
    click(*blocked);
    CHECK(text == "Blocked");
    CHECK(status == "error");

    CHECK(group.remove_chip("Open"));
    CHECK_FALSE(group.remove_chip("Open"));
    CHECK(group.chips().size() == 1);
    group.clear();
    CHECK(group.chips().empty());
}

TEST_CASE("Interactive chip cycles through its statuses") {
    reset_environment();
    InteractiveStatusChip chip("Task", { "pending", "active", "success" }, 1);
    CHECK(chip.status() == "active");
    std::vector<std::string> seen;
    chip.set_on_status_changed([&](const std::string& s) { seen.push_back(s); });
    chip.cycle();
    chip.cycle();
    CHECK(chip.current_index() == 0);
    CHECK(seen == std::vector<std::string>{ "success", "pending" });

    const int w = chip.preferred_width();
    chip.set_rect(SDL_Rect{ 0, 0, w, chip.height_for_width(w) });
    click(chip);
    CHECK(chip.status() == "active");
}

TEST_CASE("Animated and counter chips") {
    reset_environment();
    AnimatedStatusChip animated("Sync", "info");
    animated.set_status("info");
    CHECK_FALSE(animated.is_animating("scale"));
    animated.set_status("success");
    CHECK(animated.is_animating("scale"));

    CounterStatusChip counter("Inbox", 3, "info");
    CHECK(counter.text() == "Inbox (3)");
    counter.increment();
    CHECK(counter.text() == "Inbox (4)");
    counter.set_count(-2);
    CHECK(counter.count() == 0);
    counter.decrement();
    CHECK(counter.count() == 0);
    counter.set_label("");
    CHECK(counter.text() == "0");
}

TEST_CASE("Snackbar slides up, waits and slides away") {
    reset_environment();
    Snackbar bar("Saved", "UNDO", 2000);
    bool closed = false;
    bar.set_on_closed([&]() { closed = true; });
    bar.show_snackbar();
    CHECK(bar.is_visible());
    CHECK(bar.rect().y == 720);
    advance(nullptr, Snackbar::kSlideInMs + 32);
    CHECK(bar.rect().y == 720 - Snackbar::kBottomOffset);
    CHECK(bar.rect().h == Snackbar::kHeight);
    CHECK(bar.rect().w >= Snackbar::kMinWidth);
    CHECK(std::abs(bar.rect().x + bar.rect().w / 2 - 640) <= 1);

    advance(nullptr, 1500);
    CHECK_FALSE(bar.is_closing());
    advance(nullptr, 200);
    CHECK(bar.is_closing());
    advance(nullptr, Snackbar::kSlideOutMs + 32);
    CHECK_FALSE(bar.is_visible());
    CHECK(closed);
}

TEST_CASE("Snackbar action runs its callback and closes") {
    reset_environment();
    Snackbar bar("Deleted", "UNDO", 0);
    int undone = 0;
    bar.set_on_action_clicked([&]() { ++undone; });
    bar.show_snackbar();
    advance(nullptr, 400);
    bar.action_button()->click();
    CHECK(undone == 1);
    CHECK(bar.is_closing());

    Snackbar plain("No action");
    CHECK_FALSE(plain.action_button()->is_visible());
}

TEST_CASE("Snackbar manager queues and presents in order") {
    reset_environment();
    SnackbarManager manager;
    Snackbar* first = manager.show_undo_snackbar("Archived", []() {});
    REQUIRE(first != nullptr);
    CHECK(first->action_text() == "UNDO");
    CHECK(manager.show_retry_snackbar("Upload failed", []() {}) == nullptr);
    CHECK(manager.queue_length() == 1);

    advance(nullptr, 400);
    manager.close_current();
    advance(nullptr, Snackbar::kSlideOutMs + 32);
    manager.update();
    REQUIRE(manager.current() != nullptr);
    CHECK(manager.current()->message() == "Upload failed");
    CHECK(manager.current()->duration() == 6000);
    CHECK(manager.queue_length() == 0);

    manager.show_snackbar("Later");
    manager.clear_queue();
    CHECK(manager.queue_length() == 0);
}

TEST_CASE("Toast slides into place and closes after its duration") {
    reset_environment();
    NotificationToast toast("Saved", "All changes stored", "success", 1000);
    toast.show_toast(PopupPosition::TopRight);
    advance(nullptr, NotificationToast::kSlideMs + 32);
    CHECK(toast.rect().x == 1280 - NotificationToast::kWidth - ToastManager::kMargin);
    CHECK(toast.rect().y == ToastManager::kMargin);
    CHECK(toast.rect().w == NotificationToast::kWidth);

    advance(nullptr, 1000 + BasePopup::kFadeMs + 32);
    CHECK_FALSE(toast.is_visible());
}

TEST_CASE("Toast actions and progress") {
    reset_environment();
    NotificationToast toast("Upload", "report.pdf", "info", 0);
    std::string picked;
    toast.set_on_action_clicked([&](const std::string& name) { picked = name; });
    BaseButton* open = toast.add_action("Open", "open");
    CHECK(toast.action_count() == 1);
    toast.show_toast();
    advance(nullptr, 400);
    open->click();
    CHECK(picked == "open");
    CHECK(toast.is_closing());

    NotificationToast progress("Upload", "", "info", 0);
    progress.show_toast();
    progress.set_progress(150);
    CHECK(progress.progress() == 100);
    advance(nullptr, 1000 + BasePopup::kFadeMs + 64);
    CHECK_FALSE(progress.is_visible());
    progress.set_progress(-1);
    CHECK(progress.progress() == -1);

    CHECK(NotificationToast::color_role_for("error") == "danger");
    CHECK(NotificationToast::icon_for("unknown") == "info");
}

TEST_CASE("Toast manager stacks by position and caps the count") {
    reset_environment();
    ToastManager manager;
    NotificationToast* a = manager.show_info("One");
    NotificationToast* b = manager.show_info("Two");
    advance(nullptr, 400);
    CHECK(b->rect().y == a->rect().y + a->rect().h + ToastManager::kSpacing);

    NotificationToast* c = manager.show_toast("Three", "", "info", 3000, PopupPosition::BottomLeft);
    advance(nullptr, 400);
    CHECK(c->rect().x == ToastManager::kMargin);
    CHECK(c->rect().y + c->rect().h == 720 - ToastManager::kMargin);

    CHECK(manager.show_error("Boom")->duration() == 5000);
    CHECK(manager.active_count() == 4);
    manager.set_max_toasts(2);
    CHECK(manager.active_count() == 2);
    CHECK(manager.active_toasts().back()->title() == "Boom");

    manager.clear_all();
    CHECK(manager.active_count() == 0);
    advance(nullptr, BasePopup::kFadeMs + 32);
    manager.update();
    CHECK(manager.active_toasts().empty());
}

TEST_CASE("Tooltip sits above its target and flips below near the top") {
    reset_environment();
    Tooltip tip("Save the document");
    tip.show_for(SDL_Rect{ 200, 300, 80, 30 });
    CHECK(tip.is_visible());
    CHECK(tip.rect().y + tip.rect().h + Tooltip::kGap == 300);
    CHECK(tip.rect().x + tip.rect().w / 2 == 240);
    CHECK(tip.rect().w <= Tooltip::kMaxWidth);
    tip.close();

    tip.show_for(SDL_Rect{ 200, 2, 80, 30 });
    CHECK(tip.rect().y == 2 + 30 + Tooltip::kGap);
    tip.close();

    tip.show_for(SDL_Rect{ 200, 300, 80, 30 }, TooltipSide::Right);
    CHECK(tip.rect().x == 280 + Tooltip::kGap);
}

TEST_CASE("Tooltip manager shows after the delay and hides on leave") {
    reset_environment();
    Label target("Hover me");
    target.set_rect(SDL_Rect{ 100, 200, 80, 24 });
    TooltipManager manager;
    manager.register_widget(&target, "Helpful text", "info");
    CHECK(manager.is_registered(&target));

    manager.handle_event(mouse_move(120, 210));
    CHECK(manager.hovered_widget() == &target);
    run(manager, 400);
    CHECK_FALSE(manager.is_showing());
    run(manager, 150);
    REQUIRE(manager.is_showing());
    CHECK(manager.current_tooltip()->text() == "Helpful text");
    CHECK(manager.current_tooltip()->icon() == "info");

    manager.handle_event(mouse_move(600, 600));
    CHECK(manager.hovered_widget() == nullptr);
    run(manager, BasePopup::kFadeMs + 32);
    CHECK_FALSE(manager.is_showing());
    CHECK(manager.current_tooltip() == nullptr);
}

TEST_CASE("Tooltip manager hides on press and forgets unregistered widgets") {
    reset_environment();
    Label target("Hover me");
    target.set_rect(SDL_Rect{ 100, 200, 80, 24 });
    TooltipManager manager;
    manager.set_delay(100);
    manager.register_widget(&target, "Text");
    manager.handle_event(mouse_move(120, 210));
    run(manager, 120);
    REQUIRE(manager.is_showing());
    manager.handle_event(mouse_down(120, 210));
    CHECK_FALSE(manager.is_showing());

    manager.handle_event(mouse_move(600, 600));
    manager.handle_event(mouse_move(120, 210));
    manager.unregister_widget(&target);
    run(manager, 200);
    CHECK_FALSE(manager.is_showing());
    CHECK(manager.count() == 0);
}

TEST_CASE("Custom tooltips use their own delay") {
    reset_environment();
    Label target("Status");
    target.set_rect(SDL_Rect{ 100, 200, 80, 24 });
    TooltipManager manager;
    manager.register_widget(&target, std::make_unique<StatusTooltip>("error", "Disk full"));
    manager.handle_event(mouse_move(110, 210));
    run(manager, StatusTooltip::kDelay + 20);
    REQUIRE(manager.is_showing());
    auto* status = dynamic_cast<StatusTooltip*>(manager.current_tooltip());
    REQUIRE(status != nullptr);
    CHECK(status->status() == "error");
    CHECK(status->text() == "Disk full");
}

TEST_CASE("Status and rich tooltip content") {
    reset_environment();
    CHECK(StatusTooltip::color_role_for("error") == "danger");
    CHECK(StatusTooltip::color_role_for("loading") == "primary");
    CHECK(StatusTooltip::color_role_for("other") == "dark");
    CHECK(StatusTooltip::icon_for("warning") == "warning");
    StatusTooltip tip("success", "Synced");
    CHECK(tip.delay() == StatusTooltip::kDelay);
    CHECK(tip.icon() == "success");
    tip.set_status("info");
    CHECK(tip.icon() == "info");

    RichTooltip rich("Save", "Writes the file to disk");
    Label* shortcut = rich.add_shortcut("Ctrl+S");
    CHECK(shortcut->text() == "Shortcut: Ctrl+S");
    rich.add_separator();

    HelpTooltip help("Filters", "Narrow the list", "Ctrl+F");
    CHECK(help.icon() == "help");
}

TEST_CASE("Interactive tooltip stays open while hovered") {
    reset_environment();
    InteractiveTooltip tip("Pick an option");
    std::string picked;
    tip.set_on_action_clicked([&](const std::string& name) { picked = name; });
    BaseButton* more = tip.add_action("More", "more");
    tip.show_for(SDL_Rect{ 300, 300, 80, 30 });
    advance(&tip, 50);

    tip.target_left();
    CHECK(tip.hide_pending());
    const SDL_Rect r = tip.rect();
    tip.handle_event(mouse_move(r.x + r.w / 2, r.y + r.h / 2));
    CHECK_FALSE(tip.hide_pending());
    advance(&tip, 500);
    CHECK(tip.is_visible());

    more->click();
    CHECK(picked == "more");

    tip.handle_event(mouse_move(5, 5));
    CHECK(tip.hide_pending());
    advance(&tip, InteractiveTooltip::kHideDelay + BasePopup::kFadeMs + 64);
    CHECK_FALSE(tip.is_visible());
}

TEST_CASE("Help icon shows its tooltip after hovering") {
    reset_environment();
    HelpIcon icon("Units", "Values are in metres");
    icon.set_rect(SDL_Rect{ 50, 50, 16, 16 });
    icon.handle_event(mouse_move(55, 55));
    advance(&icon, Tooltip::kDefaultDelay + 20);
    CHECK(icon.help_tooltip()->is_visible());
    CHECK(icon.help_tooltip()->rect().y >= 66);
    icon.handle_event(mouse_move(400, 400));
    advance(&icon, BasePopup::kFadeMs + 32);
    CHECK_FALSE(icon.help_tooltip()->is_visible());
}

TEST_CASE("Help icon keeps its popup apart from the plain tooltip text") {
    reset_environment();
    HelpIcon icon("Units", "Values are in metres");
    CHECK(icon.tooltip().empty());
    HelpTooltip* popup = icon.help_tooltip();
    REQUIRE(popup != nullptr);

    Widget& base = icon;
    base.set_tooltip("Measurement units");
    CHECK(icon.tooltip() == "Measurement units");
    CHECK(base.tooltip() == "Measurement units");
    CHECK(icon.help_tooltip() == popup);
}

TEST_CASE("Progress overlay blocks input and hides after completing") {
    reset_environment();
    ProgressOverlay overlay("Saving...", ProgressKind::Bar);
    overlay.show_overlay();
    CHECK(overlay.is_visible());
    CHECK(OverlayManager::instance().has_modal());
    CHECK(overlay.box_rect().w == ProgressOverlay::kBoxWidth);
    CHECK(overlay.box_rect().h == ProgressOverlay::kBoxHeight);
    CHECK(OverlayManager::instance().handle_event(mouse_down(5, 5)));

    overlay.handle_event(key_down(SDLK_ESCAPE));
    CHECK(overlay.is_visible());

    overlay.set_progress(40);
    CHECK(overlay.bar()->value() == 40);
    overlay.set_progress(250);
    CHECK(overlay.progress() == 100);
    advance(nullptr, ProgressOverlay::kDoneHideMs + BasePopup::kFadeMs + 64);
    CHECK_FALSE(overlay.is_visible());
}

TEST_CASE("Cancelable progress overlay") {
    reset_environment();
    ProgressOverlay overlay("Exporting", ProgressKind::Spinner, true);
    REQUIRE(overlay.cancel_button() != nullptr);
    CHECK(overlay.box_rect().h > ProgressOverlay::kBoxHeight);
    int cancelled = 0;
    overlay.set_on_cancelled([&]() { ++cancelled; });
    overlay.show_overlay(SDL_Rect{ 100, 100, 400, 300 });
    CHECK(overlay.rect().x == 100);
    CHECK(overlay.box_rect().x == 100 + (400 - ProgressOverlay::kBoxWidth) / 2);

    overlay.handle_event(key_down(SDLK_ESCAPE));
    CHECK(cancelled == 1);
    CHECK(overlay.is_closing());
}

TEST_CASE("Progress indicators animate") {
    reset_environment();
    ProgressOverlay spinning("Loading...");
    spinning.show_overlay();
    advance(nullptr, 250);
    REQUIRE(spinning.spinner() != nullptr);
    CHECK(spinning.spinner()->angle() == doctest::Approx(90.0f));
    spinning.close();

    ProgressOverlay dots("Loading...", ProgressKind::Dots);
    dots.show_overlay();
    REQUIRE(dots.dots() != nullptr);
    CHECK(dots.dots()->active_dot() == 0);
    advance(nullptr, DotsIndicator::kStepMs + 16);
    CHECK(dots.dots()->active_dot() == 1);
    advance(nullptr, 2 * DotsIndicator::kStepMs);
    CHECK(dots.dots()->active_dot() == 0);
}

TEST_CASE("Progress overlay manager") {
    reset_environment();
    ProgressOverlayManager manager;
    manager.show_progress("sync", "Syncing", ProgressKind::Bar);
    CHECK(manager.is_showing("sync"));
    CHECK(manager.update_progress("sync", 30, "Syncing files"));
    CHECK(manager.overlay("sync")->progress() == 30);
    CHECK(manager.overlay("sync")->message() == "Syncing files");
    CHECK(manager.update_progress("sync", 35));
    CHECK(manager.overlay("sync")->message() == "Syncing files");
    CHECK_FALSE(manager.update_progress("missing", 10));
    CHECK_FALSE(manager.hide_progress("missing"));

    manager.show_progress("index", "Indexing", ProgressKind::Spinner, SDL_Rect{ 0, 0, 300, 200 });
    CHECK(manager.count() == 2);
    CHECK(manager.hide_progress("sync"));
    CHECK_FALSE(manager.is_showing("sync"));
    advance(nullptr, BasePopup::kFadeMs + 32);
    manager.update();
    CHECK(manager.count() == 1);

    manager.hide_all();
    advance(nullptr, BasePopup::kFadeMs + 32);
    manager.update();
    CHECK(manager.count() == 0);
}

TEST_CASE("Empty state actions") {
    reset_environment();
    EmptyState state("inbox", "Nothing here", "Messages appear here", "Compose");
    CHECK(state.action_count() == 1);
    std::vector<std::string> seen;
    state.set_on_action_clicked([&](const std::string& name) { seen.push_back(name); });
    CHECK(state.trigger_action("Compose"));
    state.add_action("Import", "import", ButtonVariant::Secondary);
    state.add_action("Import again", "import");
    CHECK(state.action_count() == 2);
    CHECK(state.action("import")->text() == "Import again");
    CHECK(state.trigger_action("import"));
    CHECK_FALSE(state.trigger_action("missing"));
    CHECK(seen == std::vector<std::string>{ "Compose", "import" });

    CHECK(state.remove_action("Compose"));
    CHECK_FALSE(state.remove_action("Compose"));
    state.clear_actions();
    CHECK(state.action_count() == 0);

    state.set_rect(SDL_Rect{ 0, 0, 480, 360 });
    SoftwareCanvas canvas;
    state.render(canvas.renderer());
}

TEST_CASE("Empty state presets") {
    reset_environment();
    NoDataEmptyState no_data("projects");
    CHECK(no_data.title() == "No projects found");
    CHECK(no_data.description() == "There are no projects to display right now.");
    REQUIRE(no_data.action("add_item") != nullptr);
    CHECK(no_data.action("add_item")->text() == "Add project");

    NoSearchResultsEmptyState search("kittens");
    CHECK(search.title() == "No results for 'kittens'");
    CHECK(search.action("clear_search")->variant() == ButtonVariant::Secondary);
    CHECK(search.action("browse_all")->variant() == ButtonVariant::Primary);
    search.set_query("");
    CHECK(search.title() == "No search results");

    ErrorEmptyState error;
    CHECK(error.title() == "Something went wrong");
    CHECK(error.description() == "We encountered an error while loading the data.");
    int retries = 0;
    std::string last;
    error.set_on_retry([&]() { ++retries; });
    error.set_on_action_clicked([&](const std::string& name) { last = name; });
    error.trigger_action("retry");
    CHECK(retries == 1);
    CHECK(last == "retry");
    error.trigger_action("report");
    CHECK(retries == 1);
    CHECK(last == "report");

    LoadingEmptyState loading;
    CHECK(loading.title() == "Loading...");
    CHECK(loading.action_count() == 0);
    CHECK(loading.dots()->is_running());

    PermissionEmptyState permission("the billing page");
    CHECK(permission.description() == "You don't have permission to view the billing page.");
    FirstTimeEmptyState first("Reports");
    CHECK(first.title() == "Welcome to Reports!");
    CHECK(first.action_count() == 2);
}

TEST_CASE("Feedback widgets render") {
    reset_environment();
    SoftwareCanvas canvas;
    SDL_Renderer* r = canvas.renderer();

    BadgedWidget badged(std::make_unique<IconButton>("mail", 32), 7);
    badged.set_rect(SDL_Rect{ 10, 10, 48, 48 });
    badged.render(r);

    StatusChip chip("Live", "active", ChipSize::Large);
    chip.set_icon("dot");
    chip.set_closable(true);
    chip.set_rect(SDL_Rect{ 10, 80, chip.preferred_width(), 32 });
    chip.render(r);

    ProgressOverlay overlay("Working", ProgressKind::Dots, true);
    overlay.show_overlay(SDL_Rect{ 0, 0, 640, 480 });
    advance(nullptr, 100);
    overlay.render(r);

    StatusTooltip tip("warning", "Almost out of space");
    tip.show_for(SDL_Rect{ 200, 200, 50, 20 });
    tip.render(r);
}
