#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "navigation/accordion_menu.hpp"
#include "navigation/breadcrumb_bar.hpp"
#include "navigation/command_palette.hpp"
#include "navigation/dockable_panel.hpp"
#include "navigation/floating_panel_manager.hpp"
#include "navigation/pagination.hpp"
#include "navigation/sidebar_nav.hpp"
#include "navigation/tab_bar.hpp"
#include "../test_support.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace wk_test;

namespace {
SDL_Point center(const SDL_Rect& r) {
    return SDL_Point{ r.x + r.w / 2, r.y + r.h / 2 };
}

bool click_rect(Widget& w, const SDL_Rect& r) {
    const SDL_Point p = center(r);
    return click_at(w, p.x, p.y);
}

// Overlays first, then the page, the way the gallery loop dispatches.
bool dispatch(Widget& page, const SDL_Event& e) {
    if (OverlayManager::instance().handle_event(e)) return true;
    return page.handle_event(e);
}

void reset_navigation() {
    reset_environment();
    FloatingPanelManager::instance().clear();
}
}

TEST_CASE("Breadcrumb elides the middle and truncates on click") {
    reset_environment();
    BreadcrumbBar bar;
    bar.set_rect(SDL_Rect{ 0, 0, 800, 40 });
    bar.set_paths({ "Home", "Docs", "Api", "V2", "Widgets", "Button" });

    const std::vector<std::string> expected{ "Home", "...", "V2", "Widgets", "Button" };
    CHECK(bar.visible_items() == expected);
    CHECK(bar.full_path() == "Home/Docs/Api/V2/Widgets/Button");
    CHECK(bar.current_path() == "Button");
    SDL_Rect hidden = bar.item_rect(1);
    CHECK(hidden.w == 0);

    std::vector<std::pair<int, std::string>> clicks;
    bar.set_on_path_clicked([&](int i, const std::string& p) { clicks.emplace_back(i, p); });

    // The last segment is the current location and is not a link.
    click_rect(bar, bar.item_rect(5));
    CHECK(clicks.empty());
    CHECK(bar.paths().size() == 6);

    click_rect(bar, bar.item_rect(3));
    REQUIRE(clicks.size() == 1);
    CHECK(clicks[0].first == 3);
    CHECK(clicks[0].second == "V2");
    CHECK(bar.paths().size() == 4);
    CHECK(bar.visible_items().size() == 4);

    bar.set_max_items(1);
    CHECK(bar.max_items() == 3);
    bar.remove_last_path();
    CHECK(bar.current_path() == "Api");
    bar.clear();
    CHECK(bar.current_path().empty());
}

TEST_CASE("File and web breadcrumbs parse their paths") {
    reset_environment();
    FileBreadcrumb file;
    file.set_file_path("/usr/local/../share/./doc");
    const std::vector<std::string> parts{ "usr", "share", "doc" };
    CHECK(file.paths() == parts);
    CHECK(file.file_path() == "/usr/share/doc");
    CHECK(file.separator() == " / ");

    file.set_file_path("C:\\Users\\me\\notes.txt");
    CHECK(file.current_path() == "notes.txt");
    CHECK(file.file_path() == "C:/Users/me/notes.txt");

    WebBreadcrumb web;
    web.set_url("http://example.com/products/shoes?color=red#top");
    const std::vector<std::string> segs{ "example.com", "products", "shoes" };
    CHECK(web.paths() == segs);
    CHECK(web.url() == "http://example.com/products/shoes");
    web.navigate_to_index(1);
    CHECK(web.url() == "http://example.com/products");
    web.clear();
    CHECK(web.url().empty());
}

TEST_CASE("Tab bar keeps a sensible current tab as tabs are removed") {
    reset_environment();
    TabBar bar;
    bar.set_rect(SDL_Rect{ 0, 0, 900, 40 });
    std::vector<int> changes;
    bar.set_on_current_changed([&](int i) { changes.push_back(i); });

    CHECK(bar.current_index() == -1);
    bar.add_tab("One");
    bar.add_tab("Two");
    bar.add_tab("Three");
    bar.add_tab("Four");
    CHECK(bar.current_index() == 0);
    REQUIRE(changes.size() == 1);

    bar.set_current_index(2);
    bar.set_current_index(2);
    bar.set_current_index(9);
    CHECK(changes.size() == 2);

    // Removing a tab before the current one only shifts the index.
    bar.remove_tab(0);
    CHECK(bar.current_index() == 1);
    CHECK(bar.tab_text(1) == "Three");
    CHECK(changes.size() == 2);

    bar.remove_tab(1);
    CHECK(bar.current_index() == 0);
    CHECK(changes.back() == 0);

    bar.remove_tab(0);
    bar.remove_tab(0);
    CHECK(bar.count() == 0);
    CHECK(bar.current_index() == -1);
    CHECK(changes.back() == -1);
}

TEST_CASE("Tab bar click selects, close button only requests and indicator slides") {
    reset_environment();
    TabBar bar;
    bar.set_rect(SDL_Rect{ 0, 0, 900, 40 });
    bar.add_tab("Inbox", false);
    bar.add_tab("Drafts", true, "edit");
    bar.add_tab("Sent", true);
    CHECK(bar.tab_rect(0).w >= TabBar::kMinTabWidth);
    CHECK(bar.close_rect(0).w == 0);
    CHECK(bar.close_rect(1).w == TabBar::kCloseSize);

    std::vector<int> close_requests;
    bar.set_on_tab_close_requested([&](int i) { close_requests.push_back(i); });

    const SDL_Rect tab2 = bar.tab_rect(2);
    click_at(bar, tab2.x + 10, tab2.y + tab2.h / 2);
    CHECK(bar.current_index() == 2);
    CHECK(bar.indicator_rect().x < tab2.x);
    advance(&bar, TabBar::kIndicatorMs);
    CHECK(bar.indicator_rect().x == tab2.x);
    CHECK(bar.indicator_rect().w == tab2.w);

    click_rect(bar, bar.close_rect(1));
    REQUIRE(close_requests.size() == 1);
    CHECK(close_requests[0] == 1);
    CHECK(bar.count() == 3);
    CHECK(bar.current_index() == 2);

    bar.set_add_button_visible(true);
    click_rect(bar, bar.add_button_rect());
    CHECK(bar.count() == 4);
    CHECK(bar.tab_text(3) == "Tab 4");
    CHECK(bar.current_index() == 3);
}

TEST_CASE("Tab container keeps pages in step with tabs") {
    reset_environment();
    TabContainer tabs;
    tabs.set_rect(SDL_Rect{ 0, 0, 800, 500 });
    Label* first = tabs.add_page("General", std::make_unique<Label>("general"));
    Label* second = tabs.add_page("Advanced", std::make_unique<Label>("advanced"));
    Label* third = tabs.add_page("About", std::make_unique<Label>("about"));
    CHECK(tabs.count() == 3);
    CHECK(tabs.current_page() == first);

    tabs.set_current_index(2);
    CHECK(tabs.current_page() == third);

    std::vector<std::pair<int, std::string>> closed;
    tabs.set_on_tab_closed([&](int i, const std::string& t) { closed.emplace_back(i, t); });
    TabBar& bar = tabs.tab_bar();
    click_rect(tabs, bar.close_rect(2));
    REQUIRE(closed.size() == 1);
    CHECK(closed[0].first == 2);
    CHECK(closed[0].second == "About");
    CHECK(tabs.count() == 2);
    CHECK(tabs.current_index() == 1);
    CHECK(tabs.current_page() == second);

    tabs.remove_tab(0);
    CHECK(tabs.page(0) == second);
    tabs.clear();
    CHECK(tabs.count() == 0);
    CHECK(tabs.current_page() == nullptr);
}

TEST_CASE("Sidebar groups items, reports clicks and collapses to icons") {
    reset_environment();
    SidebarNav nav("Workspace");
    nav.set_rect(SDL_Rect{ 0, 0, 220, 600 });
    nav.add_section("Main");
    nav.add_item("home", "Home", "home", "Main");
    nav.add_item("inbox", "Inbox", "mail", "Main");
    nav.add_item("reports", "Reports", "chart", "Insights");
    nav.add_item("help", "Help", "help");

    const std::vector<std::string> ids{ "home", "inbox", "reports", "help" };
    CHECK(nav.item_ids() == ids);
    const auto sections = nav.sections();
    REQUIRE(sections.size() >= 2);
    CHECK(sections[0] == "Main");
    CHECK(sections[1] == "Insights");

    nav.set_badge("inbox", 4);
    CHECK(nav.badge("inbox") == 4);
    nav.set_badge("inbox", 0);
    CHECK(nav.badge("inbox") == 0);

    std::vector<std::string> clicked;
    nav.set_on_item_clicked([&](const std::string& id) { clicked.push_back(id); });
    click_rect(nav, nav.item_rect("inbox"));
    REQUIRE(clicked.size() == 1);
    CHECK(clicked[0] == "inbox");
    CHECK(nav.current_item() == "inbox");

    std::vector<std::pair<std::string, bool>> toggles;
    nav.set_on_section_toggled([&](const std::string& t, bool e) { toggles.emplace_back(t, e); });
    click_rect(nav, nav.section_rect("Insights"));
    REQUIRE(toggles.size() == 1);
    CHECK_FALSE(nav.is_section_expanded("Insights"));
    CHECK(nav.item_rect("reports").h == 0);

    std::vector<bool> collapsed;
    nav.set_on_collapsed_changed([&](bool c) { collapsed.push_back(c); });
    click_rect(nav, nav.toggle_rect());
    REQUIRE(collapsed.size() == 1);
    CHECK(collapsed[0]);
    CHECK(nav.current_width() > SidebarNav::kCollapsedWidth);
    advance(&nav, SidebarNav::kCollapseMs);
    CHECK(nav.current_width() == SidebarNav::kCollapsedWidth);
    CHECK(nav.preferred_width() == SidebarNav::kCollapsedWidth);

    nav.set_collapsed(false, false);
    CHECK(nav.current_width() == SidebarNav::kExpandedWidth);

    CHECK(nav.remove_item("help"));
    CHECK_FALSE(nav.has_item("help"));
}

TEST_CASE("Accordion opens one section at a time unless multiple are allowed") {
    reset_environment();
    AccordionMenu menu;
    menu.set_rect(SDL_Rect{ 0, 0, 260, 500 });
    menu.add_section("Files", { "Open", "Save" }, "folder");
    menu.add_section("Edit", { "Cut", "Copy", "Paste" }, "edit");

    std::vector<std::pair<std::string, bool>> toggles;
    menu.set_on_section_toggled([&](const std::string& t, bool e) { toggles.emplace_back(t, e); });

    menu.expand_section("Files");
    CHECK(menu.section_progress("Files") == doctest::Approx(0.0f));
    advance(&menu, AccordionMenu::kAnimMs);
    CHECK(menu.section_progress("Files") == doctest::Approx(1.0f));
    CHECK(menu.item_rect("Files", "Save").h == AccordionMenu::kItemHeight);

    menu.expand_section("Edit");
    CHECK_FALSE(menu.is_section_expanded("Files"));
    CHECK(menu.is_section_expanded("Edit"));
    REQUIRE(toggles.size() == 3);
    CHECK(toggles[1].first == "Files");
    CHECK_FALSE(toggles[1].second);
    advance(&menu, AccordionMenu::kAnimMs);
    CHECK(menu.item_rect("Files", "Open").h == 0);

    std::vector<std::pair<std::string, std::string>> clicks;
    menu.set_on_item_clicked([&](const std::string& s, const std::string& i) { clicks.emplace_back(s, i); });
    click_rect(menu, menu.item_rect("Edit", "Copy"));
    REQUIRE(clicks.size() == 1);
    CHECK(clicks[0].second == "Copy");
    CHECK(menu.active_section() == "Edit");
    CHECK(menu.active_item() == "Copy");

    click_rect(menu, menu.header_rect("Edit"));
    CHECK_FALSE(menu.is_section_expanded("Edit"));

    menu.set_allow_multiple(true);
    menu.expand_section("Files");
    menu.expand_section("Edit");
    CHECK(menu.is_section_expanded("Files"));
    CHECK(menu.is_section_expanded("Edit"));
    menu.set_allow_multiple(false);
    CHECK(menu.is_section_expanded("Files"));
    CHECK_FALSE(menu.is_section_expanded("Edit"));

    menu.collapse_all();
    CHECK_FALSE(menu.is_section_expanded("Files"));
}

TEST_CASE("Pagination window keeps the current page in view") {
    reset_environment();
    Pagination pages(10, 5);
    std::vector<int> middle{ 1, 2, 3, 4, 5, 6, 7, 8, 0, 10 };
    CHECK(pages.visible_pages() == middle);

    pages.set_current_page(1);
    std::vector<int> start{ 1, 2, 3, 4, 5, 6, 7, 0, 10 };
    CHECK(pages.visible_pages() == start);
    CHECK_FALSE(pages.has_previous());

    pages.set_current_page(10);
    std::vector<int> end{ 1, 0, 4, 5, 6, 7, 8, 9, 10 };
    CHECK(pages.visible_pages() == end);
    CHECK(pages.page_caption() == "Page 10 of 10");

    std::vector<int> changes;
    pages.set_on_page_changed([&](int p) { changes.push_back(p); });
    pages.set_current_page(11);
    pages.set_current_page(10);
    CHECK(changes.empty());

    pages.set_total_pages(4);
    CHECK(pages.current_page() == 4);
    REQUIRE(changes.size() == 1);
    CHECK(changes[0] == 4);

    Pagination single(1, 1);
    CHECK(single.visible_pages().empty());
    CHECK(single.height_for_width(400) == 0);
}

TEST_CASE("Pagination with an even window shows a button for every listed page") {
    reset_environment();
    Pagination pages(10, 5);
    pages.set_rect(SDL_Rect{ 0, 0, 900, 40 });
    pages.set_max_visible(4);

    const std::pair<int, int> range{ 3, 7 };
    CHECK(pages.visible_range() == range);
    const std::vector<int> expected{ 1, 0, 3, 4, 5, 6, 7, 0, 10 };
    CHECK(pages.visible_pages() == expected);
    for (int p : pages.visible_pages()) {
        if (p == 0) continue;
        BaseButton* b = pages.page_button(p);
        REQUIRE(b != nullptr);
        CHECK(b->is_visible());
        CHECK(b->text() == std::to_string(p));
    }

    pages.page_button(7)->click();
    CHECK(pages.current_page() == 7);
}

TEST_CASE("Pagination buttons move between pages") {
    reset_environment();
    Pagination pages(20, 1);
    pages.set_rect(SDL_Rect{ 0, 0, 900, 40 });
    std::vector<int> changes;
    pages.set_on_page_changed([&](int p) { changes.push_back(p); });

    BaseButton* three = pages.page_button(3);
    REQUIRE(three != nullptr);
    three->click();
    CHECK(pages.current_page() == 3);
    CHECK_FALSE(pages.page_button(3)->is_enabled());

    pages.next_button()->click();
    CHECK(pages.current_page() == 4);
    pages.previous_button()->click();
    pages.previous_button()->click();
    CHECK(pages.current_page() == 2);
    const std::vector<int> expected{ 3, 4, 3, 2 };
    CHECK(changes == expected);

    pages.page_button(20)->click();
    CHECK(pages.current_page() == 20);
    CHECK_FALSE(pages.next_button()->is_enabled());
}

TEST_CASE("Load-more pagination tracks shown items") {
    reset_environment();
    Pagination more(1, 1, PaginationMode::LoadMore);
    more.set_total_items(25);
    more.add_items(10);
    CHECK(more.status_text() == "Showing 10 of 25 items");

    int requests = 0;
    more.set_on_load_more_requested([&]() { ++requests; });
    REQUIRE(more.load_more_button() != nullptr);
    more.load_more_button()->click();
    CHECK(requests == 1);
    CHECK(more.is_loading());

    more.add_items(15);
    CHECK_FALSE(more.is_loading());
    CHECK(more.items_shown() == 25);
    CHECK_FALSE(more.load_more_button()->is_visible());

    more.set_total_items(-1);
    CHECK(more.status_text() == "Showing 25 items");
    CHECK(more.load_more_button()->is_visible());
    more.reset();
    CHECK(more.items_shown() == 0);
}

TEST_CASE("Command palette filters, sorts and runs commands") {
    reset_environment();
    CommandPalette pal;
    pal.add_command("Save File", "Write the buffer", "Ctrl+S", { { "action", "save" } }, "File");
    pal.add_command("Open File", "Open from disk", "Ctrl+O", { { "action", "open" } }, "File");
    pal.add_command("Toggle Sidebar", "", "", nlohmann::json::object(), "View");
    pal.add_command("Find", "Search in files", "Ctrl+F", { { "action", "find" } }, "Edit");
    pal.add_command("Find", "Search the document", "Ctrl+F", { { "action", "find" } }, "Edit");
    CHECK(pal.command_count() == 4);
    CHECK(pal.find_command("Find")->description == "Search the document");

    pal.show_palette();
    CHECK(pal.is_visible());
    CHECK(OverlayManager::instance().is_open(&pal));
    const std::vector<std::string> all{ "Find", "Open File", "Save File", "Toggle Sidebar" };
    CHECK(pal.filtered_commands() == all);
    CHECK(pal.selected_index() == 0);

    pal.select_previous();
    CHECK(pal.selected_command() == "Toggle Sidebar");
    pal.select_next();
    CHECK(pal.selected_command() == "Find");

    // Matches in the description count; names starting with the query sort first.
    pal.set_query("  FILE ");
    const std::vector<std::string> files{ "Open File", "Save File" };
    CHECK(pal.filtered_commands() == files);
    pal.set_query("f");
    CHECK(pal.filtered_commands().front() == "Find");

    pal.handle_event(text_input("x"));
    CHECK(pal.query() == "fx");
    CHECK(pal.filtered_commands().empty());
    CHECK(pal.selected_command().empty());

    pal.set_query("save");
    std::string ran;
    nlohmann::json ran_data;
    pal.set_on_command_executed([&](const std::string& n, const nlohmann::json& d) {
        ran = n;
        ran_data = d;
    });
    pal.handle_event(key_down(SDLK_RETURN));
    CHECK(ran == "Save File");
    CHECK(ran_data.value("action", "") == "save");
    advance(&pal, BasePopup::kFadeMs + 20);
    CHECK_FALSE(pal.is_visible());
    CHECK_FALSE(OverlayManager::instance().is_open(&pal));
}

TEST_CASE("Command palette closes on Escape and clears the query when reopened") {
    reset_environment();
    CommandPalette pal;
    pal.add_command("Reload");
    pal.show_palette();
    pal.set_query("zzz");
    CHECK(pal.filtered_commands().empty());
    pal.handle_event(key_down(SDLK_ESCAPE));
    advance(&pal, BasePopup::kFadeMs + 20);
    CHECK_FALSE(pal.is_visible());

    pal.show_palette();
    CHECK(pal.query().empty());
    CHECK(pal.filtered_commands().size() == 1);
    CHECK(pal.remove_command("Reload"));
    CHECK_FALSE(pal.has_command("Reload"));
}

TEST_CASE("Quick command palette ships the common commands") {
    reset_environment();
    QuickCommandPalette quick;
    CHECK(quick.command_count() == 10);
    const CommandPalette::Command* help = quick.find_command("Help");
    REQUIRE(help != nullptr);
    CHECK(help->shortcut == "F1");
    CHECK(help->category == "Help");
    CHECK(quick.find_command("Save As")->data.value("action", "") == "save_as");
    quick.show_palette();
    quick.set_query("redo");
    CHECK(quick.selected_command() == "Redo");
}

TEST_CASE("Searchable command palette ranks matches by relevance") {
    reset_environment();
    SearchableCommandPalette pal;
    pal.add_command("Save", "Save current file", "Ctrl+S", nlohmann::json::object(), "File");
    pal.add_command("Save As", "Save file with new name", "Ctrl+Shift+S", nlohmann::json::object(), "File");
    pal.add_command("Open File", "Open an existing file", "Ctrl+O", nlohmann::json::object(), "File");
    pal.add_command("Settings", "Open application settings", "", nlohmann::json::object(), "View");
    pal.add_command("Autosave", "Toggle autosave", "", nlohmann::json::object(), "File");

    CHECK(pal.filtered_commands() ==
          std::vector<std::string>{ "Save", "Save As", "Open File", "Settings", "Autosave" });

    pal.set_query("save");
    CHECK(pal.search_pending());
    CHECK(pal.filtered_commands().size() == 5);
    advance(&pal, 100);
    CHECK(pal.search_pending());
    advance(&pal, 60);
    CHECK_FALSE(pal.search_pending());
    CHECK(pal.filtered_commands() == std::vector<std::string>{ "Save", "Save As", "Autosave" });
    CHECK(pal.selected_command() == "Save");

    // Equal scores keep the order the commands were added in.
    pal.set_query("file");
    pal.flush_search();
    CHECK(pal.filtered_commands() == std::vector<std::string>{ "Open File", "Save", "Save As", "Autosave" });

    const CommandPalette::Command* open = pal.find_command("Open File");
    REQUIRE(open != nullptr);
    CHECK(SearchableCommandPalette::search_score(*open, "open file") == 130);
    CHECK(SearchableCommandPalette::search_score(*open, "file") == 125);
    CHECK(SearchableCommandPalette::search_score(*pal.find_command("Save"), "save") == 145);
    CHECK(SearchableCommandPalette::search_score(*pal.find_command("Settings"), "save") == 0);

    std::string ran;
    pal.set_on_command_executed([&](const std::string& name, const nlohmann::json&) { ran = name; });
    pal.set_query("toggle");
    pal.flush_search();
    CHECK(pal.filtered_commands() == std::vector<std::string>{ "Autosave" });
    CHECK(pal.execute_selected());
    CHECK(ran == "Autosave");
}

TEST_CASE("Docking area lays panels out by zone") {
    reset_navigation();
    DockingArea area;
    area.set_rect(SDL_Rect{ 0, 0, 1000, 700 });
    std::vector<std::string> docked;
    area.set_on_panel_docked([&](DockablePanel* p, DockZone z) {
        docked.push_back(p->title() + ":" + wk::dock_zone_name(z));
    });

    DockablePanel* files = area.add_panel(std::make_unique<DockablePanel>("Files"), DockZone::Left);
    DockablePanel* outline = area.add_panel(std::make_unique<DockablePanel>("Outline"), DockZone::Left);
    DockablePanel* console = area.add_panel(std::make_unique<DockablePanel>("Console"), DockZone::Bottom);
    area.add_panel(std::make_unique<DockablePanel>("Editor", false), DockZone::Center);
    CHECK(docked.size() == 4);
    CHECK(docked[2] == "Console:bottom");

    const SDL_Rect left = area.zone_rect(DockZone::Left);
    CHECK(left.w == DockingArea::kSideWidth);
    CHECK(area.zone_rect(DockZone::Bottom).h == DockingArea::kBandHeight);
    CHECK(area.zone_rect(DockZone::Right).w == 0);
    CHECK(files->rect().y < outline->rect().y);
    CHECK(files->rect().h == outline->rect().h);
    CHECK(console->rect().w == 1000);

    // A header click without dragging collapses the panel to its header.
    click_rect(area, files->header_rect());
    CHECK(files->is_collapsed());
    area.update();
    CHECK(files->rect().h == DockablePanel::kHeaderHeight);
    CHECK(outline->rect().h > files->rect().h);

    std::vector<std::string> closed;
    area.set_on_panel_closed([&](DockablePanel* p) { closed.push_back(p->title()); });
    click_rect(area, console->close_rect());
    CHECK_FALSE(console->is_visible());
    CHECK(area.panels_in(DockZone::Bottom).empty());
    REQUIRE(closed.size() == 1);
    CHECK(area.zone_rect(DockZone::Bottom).h == 0);

    area.show_panel(console);
    CHECK(area.panels_in(DockZone::Bottom).size() == 1);

    std::unique_ptr<DockablePanel> taken = area.remove_panel(outline);
    REQUIRE(taken != nullptr);
    CHECK(taken->docking_area() == nullptr);
    CHECK(area.panels().size() == 3);
}

TEST_CASE("Dragging a docked panel floats it and dropping docks it elsewhere") {
    reset_navigation();
    DockingArea area;
    area.set_rect(SDL_Rect{ 0, 0, 1200, 720 });
    DockablePanel* panel = area.add_panel(std::make_unique<DockablePanel>("Properties"), DockZone::Left);
    panel->set_content(std::make_unique<Label>("Nothing selected"));
    int undocked = 0;
    area.set_on_panel_undocked([&](DockablePanel*) { ++undocked; });

    const SDL_Rect header = panel->header_rect();
    const int hx = header.x + 100;
    const int hy = header.y + header.h / 2;
    CHECK(dispatch(area, mouse_down(hx, hy)));
    CHECK(dispatch(area, mouse_move(hx + 2, hy)));
    CHECK_FALSE(panel->is_dragging());

    dispatch(area, mouse_move(hx + 40, hy + 30));
    CHECK(panel->is_dragging());
    CHECK(panel->is_floating());
    CHECK(undocked == 1);
    CHECK(panel->rect().w == DockablePanel::kFloatingWidth);
    CHECK(FloatingPanelManager::instance().active_panel() == panel);
    CHECK(area.panels_in(DockZone::Left).empty());

    const SDL_Point mid{ 600, 360 };
    dispatch(area, mouse_move(mid.x, mid.y));
    DockZone hint = DockZone::Left;
    REQUIRE(area.drag_hint(hint));
    CHECK(hint == DockZone::Center);

    dispatch(area, mouse_up(mid.x, mid.y));
    CHECK_FALSE(panel->is_floating());
    CHECK_FALSE(panel->is_collapsed());
    CHECK(area.zone_of(panel) == DockZone::Center);
    CHECK(area.panels_in(DockZone::Center).size() == 1);
    CHECK(FloatingPanelManager::instance().count() == 0);
    CHECK_FALSE(OverlayManager::instance().is_open(panel));
    CHECK_FALSE(area.drag_hint(hint));
}

TEST_CASE("Only one panel floats at a time") {
    reset_navigation();
    DockingArea area;
    area.set_rect(SDL_Rect{ 0, 0, 1000, 700 });
    DockablePanel* a = area.add_panel(std::make_unique<DockablePanel>("Search"), DockZone::Left);
    DockablePanel* b = area.add_panel(std::make_unique<DockablePanel>("Problems"), DockZone::Right);

    click_rect(area, a->float_rect());
    CHECK(a->is_floating());
    CHECK(area.floating_panel() == a);
    CHECK(OverlayManager::instance().is_open(a));

    area.undock_panel(b);
    CHECK(b->is_floating());
    CHECK_FALSE(a->is_floating());
    CHECK(area.zone_of(a) == DockZone::Left);
    CHECK(area.panels_in(DockZone::Left).size() == 1);
    CHECK(area.floating_panel() == b);
    CHECK(FloatingPanelManager::instance().count() == 1);
    CHECK(FloatingPanelManager::instance().active_name() == "Problems");

    // Escape closes a floating panel under the pointer.
    const SDL_Point over = center(b->body_rect());
    dispatch(area, mouse_move(over.x, over.y));
    dispatch(area, key_down(SDLK_ESCAPE));
    CHECK_FALSE(b->is_visible());
    CHECK_FALSE(b->is_floating());
    CHECK(area.floating_panel() == nullptr);
    CHECK(FloatingPanelManager::instance().count() == 0);

    area.show_panel(b);
    CHECK(area.panels_in(DockZone::Right).size() == 1);

    DockZone z = DockZone::Center;
    CHECK(area.drop_zone_at(SDL_Point{ 10, 350 }, z));
    CHECK(z == DockZone::Left);
    CHECK(area.drop_zone_at(SDL_Point{ 500, 690 }, z));
    CHECK(z == DockZone::Bottom);
    CHECK_FALSE(area.drop_zone_at(SDL_Point{ 200, 200 }, z));
}
