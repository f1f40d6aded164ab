#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/base_button.hpp"
#include "base/base_popup.hpp"
#include "base/controls.hpp"
#include "utility/clipboard_history.hpp"
#include "utility/floating_action_button.hpp"
#include "utility/global_search.hpp"
#include "utility/pinned_note.hpp"
#include "utility/quick_settings_panel.hpp"
#include "utility/shortcut_helper.hpp"
#include "../test_support.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace wk_test;
namespace fs = std::filesystem;

namespace {
class TempDir {
public:
    explicit TempDir(const std::string& name) : path_(fs::temp_directory_path() / name) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

std::vector<std::string> contents(const ClipboardHistory& h) {
    std::vector<std::string> out;
    for (const auto& entry : h.items()) out.push_back(entry.content);
    return out;
}

bool same_rect(const SDL_Rect& a, const SDL_Rect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

std::vector<SearchResult> file_results(const std::string& query) {
    std::vector<SearchResult> out;
    if (query.find("file") != std::string::npos) {
        SearchResult r;
        r.title = "example.txt";
        r.description = "Text file containing example data";
        r.score = 95.0;
        out.push_back(r);
    }
    return out;
}

std::vector<SearchResult> content_results(const std::string& query) {
    SearchResult r;
    r.title = "Content matching \"" + query + "\"";
    r.score = 80.0;
    return { r };
}
}

TEST_CASE("Clipboard history keeps unique trimmed entries newest first") {
    reset_environment();
    ClipboardHistory history;
    history.set_rect(SDL_Rect{ 0, 0, 340, 420 });

    CHECK(history.add_item("  first "));
    CHECK_FALSE(history.add_item("   "));
    CHECK(history.add_item("second"));
    CHECK(contents(history) == std::vector<std::string>{ "second", "first" });

    CHECK(history.add_item("first"));
    CHECK(contents(history) == std::vector<std::string>{ "first", "second" });
    CHECK(history.status_text() == "2 items");

    CHECK(history.add_manual_item("typed"));
    CHECK(history.items().front().type == "manual");
    CHECK(history.remove_item(0));
    CHECK_FALSE(history.remove_item(5));
    CHECK(history.item_count() == 2);
}

TEST_CASE("Clipboard history limit and clear spare pinned entries") {
    reset_environment();
    ClipboardHistory history(3);
    int cleared = 0;
    history.set_on_history_cleared([&]() { ++cleared; });
    history.add_item("a");
    history.add_item("b");
    history.add_item("c");
    REQUIRE(history.set_pinned(2, true));

    history.add_item("d");
    CHECK(contents(history) == std::vector<std::string>{ "d", "c", "a" });
    CHECK(history.items().back().pinned);

    // A pinned entry copied again keeps its pin.
    history.add_item("a");
    CHECK(history.items().front().content == "a");
    CHECK(history.items().front().pinned);

    history.clear_history();
    CHECK(cleared == 1);
    CHECK(contents(history) == std::vector<std::string>{ "a" });
}

TEST_CASE("Clipboard history filter and previews") {
    reset_environment();
    ClipboardHistory history;
    history.set_rect(SDL_Rect{ 0, 0, 340, 420 });
    history.add_item("Hello World");
    history.add_item("goodbye");

    history.set_filter("HELLO");
    CHECK(history.search_box()->text() == "HELLO");
    REQUIRE(history.visible_items().size() == 1);
    CHECK(history.items()[static_cast<size_t>(history.visible_items()[0])].content == "Hello World");
    REQUIRE(history.row(0) != nullptr);
    CHECK(history.row(1) == nullptr);

    history.search_box()->set_text("");
    CHECK(history.visible_items().size() == 2);

    CHECK(ClipboardHistory::preview("a\nb") == "a \xE2\x86\xB5 b");
    CHECK(ClipboardHistory::preview(std::string(150, 'x')) == std::string(100, 'x') + "...");
    CHECK(ClipboardHistory::plain_text(" a\nb ") == "a b");
}

TEST_CASE("Clipboard history captures the system clipboard without echoing its own copies") {
    reset_environment();
    ClipboardHistory history;
    history.set_rect(SDL_Rect{ 0, 0, 340, 420 });
    std::vector<std::string> copied;
    history.set_on_item_copied([&](const std::string& text) { copied.push_back(text); });

    REQUIRE(SDL_SetClipboardText("from system") == 0);
    CHECK(history.check_clipboard());
    CHECK(history.items().front().content == "from system");
    CHECK_FALSE(history.check_clipboard());

    history.add_item("line one\nline two");
    CHECK(history.copy_as_plain_text(0));
    REQUIRE(copied.size() == 1);
    CHECK(copied[0] == "line one line two");
    CHECK_FALSE(history.check_clipboard());

    REQUIRE(SDL_SetClipboardText("polled") == 0);
    advance(&history, 1100);
    CHECK(history.items().front().content == "polled");

    history.set_monitoring(false);
    CHECK(history.monitor_button()->text() == "Monitoring: OFF");
    REQUIRE(SDL_SetClipboardText("ignored") == 0);
    advance(&history, 1100);
    CHECK(history.items().front().content == "polled");
}

TEST_CASE("Clipboard row click copies and the context menu pins") {
    reset_environment();
    ClipboardHistory history;
    history.set_rect(SDL_Rect{ 0, 0, 340, 420 });
    history.set_monitoring(false);
    history.add_item("older");
    history.add_item("newer");
    std::string selected;
    history.set_on_item_selected([&](const std::string& text) { selected = text; });

    REQUIRE(history.row(1) != nullptr);
    CHECK(click(*history.row(1)));
    CHECK(selected == "older");

    history.show_context_menu(0, 100, 100);
    REQUIRE(history.context_menu() != nullptr);
    history.context_menu()->trigger(1);
    CHECK(history.items()[0].pinned);
    advance(&history, 400);
    CHECK(history.context_menu() == nullptr);
}

TEST_CASE("Hidden clipboard history ignores input but keeps its rows") {
    reset_environment();
    ClipboardHistory history;
    history.set_rect(SDL_Rect{ 0, 0, 340, 420 });
    history.set_monitoring(false);
    history.add_item("kept");
    std::string selected;
    history.set_on_item_selected([&](const std::string& text) { selected = text; });
    REQUIRE(history.row(0) != nullptr);
    const SDL_Rect row = history.row(0)->rect();

    history.hide();
    CHECK_FALSE(history.handle_event(mouse_down(row.x + row.w / 2, row.y + row.h / 2)));
    CHECK_FALSE(history.handle_event(mouse_up(row.x + row.w / 2, row.y + row.h / 2)));
    CHECK(selected.empty());
    CHECK(history.visible_items().size() == 1);

    history.show();
    CHECK(click_at(history, row.x + row.w / 2, row.y + row.h / 2));
    CHECK(selected == "kept");
}

TEST_CASE("Floating action button sits in the bottom-right corner") {
    reset_environment();
    FloatingActionButton fab;
    fab.place_in(SDL_Rect{ 0, 0, 400, 300 });
    CHECK(same_rect(fab.rect(), SDL_Rect{ 324, 224, 56, 56 }));
    int clicks = 0;
    fab.set_on_clicked([&]() { ++clicks; });
    CHECK(click(fab));
    CHECK(clicks == 1);

    SoftwareCanvas canvas;
    fab.render(canvas.renderer());
}

TEST_CASE("Speed dial fans actions out above the main button") {
    reset_environment();
    SpeedDialFAB dial;
    dial.place_in(SDL_Rect{ 0, 0, 400, 400 });
    dial.expand();
    CHECK_FALSE(dial.is_expanded());

    int shared = 0;
    dial.add_action("edit", "Edit Note");
    dial.add_action("send", "Share", [&]() { ++shared; });
    CHECK(dial.action_names() == std::vector<std::string>{ "edit_note", "share" });

    std::vector<bool> expanded;
    dial.set_on_expanded_changed([&](bool on) { expanded.push_back(on); });
    CHECK(click(dial));
    CHECK(dial.is_expanded());
    advance(&dial, 400);
    CHECK(same_rect(dial.action_target(0), SDL_Rect{ 332, 264, 40, 40 }));
    CHECK(same_rect(dial.action_button(0)->rect(), dial.action_target(0)));
    CHECK(same_rect(dial.action_button(1)->rect(), SDL_Rect{ 332, 204, 40, 40 }));

    std::string triggered;
    dial.set_on_action_triggered([&](const std::string& name) { triggered = name; });
    CHECK(click(*dial.action_button(1)));
    CHECK(shared == 1);
    CHECK(triggered == "share");
    CHECK_FALSE(dial.is_expanded());
    advance(&dial, 300);
    CHECK_FALSE(dial.action_button(0)->is_visible());

    dial.expand();
    CHECK(dial.handle_event(key_down(SDLK_ESCAPE)));
    CHECK_FALSE(dial.is_expanded());
    CHECK(expanded == std::vector<bool>{ true, false, true, false });
}

TEST_CASE("Pinned note colours, editing and JSON") {
    reset_environment();
    PinnedNote note;
    note.set_rect(SDL_Rect{ 0, 0, PinnedNote::kWidth, PinnedNote::kHeight });
    CHECK(note.title() == "New Note");
    CHECK(note.color() == "yellow");
    note.set_color("orange");
    CHECK(note.color() == "yellow");
    note.cycle_color();
    CHECK(note.color() == "blue");
    CHECK(wk::same_color(PinnedNote::note_color("green"), wk::parse_hex("#B2F2BB")));

    int changed = 0;
    note.set_on_changed([&]() { ++changed; });
    note.start_edit(PinnedNote::EditField::Title);
    note.title_editor()->set_text("  Groceries ");
    CHECK(note.commit_edit());
    CHECK(note.title() == "Groceries");
    CHECK(changed == 1);

    note.start_edit(PinnedNote::EditField::Title);
    note.title_editor()->set_text("   ");
    note.commit_edit();
    CHECK(note.title() == "Groceries");
    CHECK(changed == 1);

    note.start_edit(PinnedNote::EditField::Content);
    note.content_editor()->set_text("milk");
    note.cancel_edit();
    CHECK(note.content().empty());
    CHECK(note.editing() == PinnedNote::EditField::None);

    // Double-clicking the header edits the title; Enter saves it.
    note.handle_event(mouse_down(40, 16, SDL_BUTTON_LEFT, 2));
    note.handle_event(mouse_up(40, 16, SDL_BUTTON_LEFT, 2));
    CHECK(note.editing() == PinnedNote::EditField::Title);
    note.title_editor()->set_text("Errands");
    note.handle_event(key_down(SDLK_RETURN));
    CHECK(note.title() == "Errands");
    CHECK(changed == 2);

    const nlohmann::json j = note.to_json();
    CHECK(j["title"] == "Errands");
    CHECK(j["color"] == "blue");
    PinnedNote copy;
    copy.apply_json(j);
    CHECK(copy.title() == "Errands");
    CHECK(copy.color() == "blue");
    CHECK_THROWS_AS(copy.apply_json(nlohmann::json::array()), std::invalid_argument);
}

TEST_CASE("Pinned note drags by its header unless pinned") {
    reset_environment();
    PinnedNote note;
    note.set_rect(SDL_Rect{ 0, 0, PinnedNote::kWidth, PinnedNote::kHeight });
    SDL_Point moved{ -1, -1 };
    note.set_on_moved([&](int x, int y) { moved = SDL_Point{ x, y }; });

    note.handle_event(mouse_down(40, 16));
    note.handle_event(mouse_move(140, 116));
    CHECK(note.is_dragging());
    note.handle_event(mouse_up(140, 116));
    CHECK(note.rect().x == 100);
    CHECK(note.rect().y == 100);
    CHECK(moved.x == 100);
    CHECK(moved.y == 100);

    note.set_pinned(true);
    note.handle_event(mouse_down(140, 116));
    note.handle_event(mouse_move(240, 216));
    note.handle_event(mouse_up(240, 216));
    CHECK(note.rect().x == 100);
}

TEST_CASE("Note manager creates, raises, duplicates and closes notes") {
    reset_environment();
    NoteManager board;
    board.set_rect(SDL_Rect{ 0, 0, 800, 600 });
    const SDL_Rect area = board.notes_area();

    PinnedNote* a = board.create_note("A");
    PinnedNote* b = board.create_note("B");
    board.create_note("C");
    CHECK(a->id() == "note-1");
    CHECK(b->id() == "note-2");
    CHECK(a->rect().x == area.x + 16);
    CHECK(b->rect().x - a->rect().x == NoteManager::kCascadeStep);

    CHECK(board.bring_to_front("note-1"));
    CHECK(board.notes().back()->id() == "note-1");

    PinnedNote* dup = board.duplicate_note("note-2");
    REQUIRE(dup != nullptr);
    CHECK(dup->id() == "note-4");
    CHECK(dup->title() == "B");
    CHECK(dup->rect().x == b->rect().x + 20);
    CHECK(board.note_count() == 4);

    b->close_button()->click();
    CHECK(board.note_count() == 4);
    board.update();
    CHECK(board.note_count() == 3);
    CHECK(board.find_note("note-2") == nullptr);

    board.clear_button()->click();
    CHECK(board.note_count() == 0);
    board.add_button()->click();
    CHECK(board.note_count() == 1);
}

TEST_CASE("Note manager JSON is relative to the note area and loads atomically") {
    reset_environment();
    NoteManager board;
    board.set_rect(SDL_Rect{ 0, 0, 800, 600 });
    PinnedNote* note = board.create_note("Plan", "Ship it", "pink");
    const SDL_Rect area = board.notes_area();
    note->move_to(area.x + 50, area.y + 60);

    const nlohmann::json j = board.to_json();
    REQUIRE(j["notes"].size() == 1);
    CHECK(j["notes"][0]["x"] == 50);
    CHECK(j["notes"][0]["y"] == 60);

    nlohmann::json bad = j;
    bad["notes"].push_back(nlohmann::json{ { "title", 5 } });
    CHECK_FALSE(board.load_json(bad));
    CHECK_FALSE(board.load_json(nlohmann::json{ { "notes", "nope" } }));
    CHECK(board.note_count() == 1);

    TempDir dir("widgetkit_notes_test");
    const std::string path = (dir.path() / "notes.json").string();
    REQUIRE(board.save_notes(path));
    NoteManager loaded;
    loaded.set_rect(SDL_Rect{ 0, 0, 800, 600 });
    REQUIRE(loaded.load_notes(path));
    REQUIRE(loaded.note_count() == 1);
    PinnedNote* restored = loaded.notes().front();
    CHECK(restored->title() == "Plan");
    CHECK(restored->content() == "Ship it");
    CHECK(restored->color() == "pink");
    CHECK(restored->rect().x == loaded.notes_area().x + 50);
    CHECK_FALSE(loaded.load_notes((dir.path() / "missing.json").string()));
}

TEST_CASE("Quick settings read, write, import and reset values") {
    reset_environment();
    QuickSettingsPanel panel;
    panel.set_rect(SDL_Rect{ 0, 0, 300, 500 });
    REQUIRE(panel.add_toggle("dark", "Dark mode") != nullptr);
    REQUIRE(panel.add_slider("volume", "Volume", 0, 100, 40) != nullptr);
    REQUIRE(panel.add_choice("lang", "Language", { "English", "French" }) != nullptr);
    CHECK(panel.add_toggle("dark", "Again") == nullptr);
    CHECK(panel.keys() == std::vector<std::string>{ "dark", "volume", "lang" });

    std::vector<std::string> changes;
    panel.set_on_setting_changed([&](const std::string& key, const nlohmann::json&) { changes.push_back(key); });

    CHECK(panel.get_setting("volume") == 40);
    CHECK(panel.get_setting("missing").is_null());
    CHECK(panel.set_setting("dark", true));
    CHECK(panel.set_setting("volume", 250));
    CHECK(panel.get_setting("volume") == 100);
    CHECK(panel.set_setting("lang", "French"));
    CHECK(panel.set_setting("lang", 0));
    CHECK(panel.get_setting("lang") == "English");
    CHECK_FALSE(panel.set_setting("lang", "German"));
    CHECK_FALSE(panel.set_setting("dark", "yes"));
    CHECK_FALSE(panel.set_setting("missing", 1));
    CHECK(changes == std::vector<std::string>{ "dark", "volume", "lang", "lang" });

    const nlohmann::json expected = { { "dark", true }, { "volume", 100 }, { "lang", "English" } };
    CHECK(panel.export_settings() == expected);

    CHECK(panel.import_settings(nlohmann::json{ { "volume", 10 }, { "unknown", 1 } }));
    CHECK(panel.get_setting("volume") == 10);
    CHECK_FALSE(panel.import_settings(nlohmann::json{ { "dark", 3 } }));
    CHECK_FALSE(panel.import_settings(nlohmann::json::array()));

    panel.reset_settings();
    CHECK(panel.get_setting("dark") == false);
    CHECK(panel.get_setting("volume") == 40);

    nlohmann::json applied;
    panel.set_on_settings_applied([&](const nlohmann::json& s) { applied = s; });
    panel.apply_button()->click();
    CHECK(applied == panel.export_settings());
}

TEST_CASE("Quick settings panel collapses to its header") {
    reset_environment();
    QuickSettingsPanel panel("Display");
    panel.add_toggle("grid", "Show grid", true, "Draws a grid behind the canvas");
    panel.set_rect(SDL_Rect{ 0, 0, 300, 400 });
    const int full = panel.height_for_width(300);

    std::vector<bool> toggled;
    panel.set_on_panel_toggled([&](bool on) { toggled.push_back(on); });
    panel.toggle_button()->click();
    CHECK_FALSE(panel.is_expanded());
    advance(&panel, 400);
    CHECK(panel.expand_progress() == doctest::Approx(0.0f));
    CHECK(panel.height_for_width(300) < full);

    panel.set_expanded(true);
    advance(&panel, 400);
    CHECK(panel.expand_progress() == doctest::Approx(1.0f));
    CHECK(panel.height_for_width(300) == full);
    CHECK(toggled == std::vector<bool>{ false, true });

    QuickSettingsPanel fixed("Fixed", false);
    fixed.set_expanded(false);
    CHECK(fixed.is_expanded());
    CHECK_FALSE(fixed.toggle_button()->is_visible());
}

TEST_CASE("Key sequences parse case-insensitively") {
    reset_environment();
    KeySequence seq;
    REQUIRE(wk_keys::parse("ctrl+shift+k", seq));
    CHECK(seq.key == SDLK_k);
    CHECK(seq.mods == (KMOD_CTRL | KMOD_SHIFT));
    CHECK(wk_keys::to_string(seq) == "Ctrl+Shift+K");

    REQUIRE(wk_keys::parse("Ctrl++", seq));
    CHECK(seq.key == SDLK_PLUS);
    CHECK(seq.mods == KMOD_CTRL);
    REQUIRE(wk_keys::parse("Alt+Left", seq));
    CHECK(seq.key == SDLK_LEFT);
    REQUIRE(wk_keys::parse("F11", seq));
    CHECK(seq.key == SDLK_F11);
    CHECK(seq.mods == KMOD_NONE);
    REQUIRE(wk_keys::parse("Ctrl+/", seq));
    CHECK(seq.key == SDLK_SLASH);

    CHECK_FALSE(wk_keys::parse("", seq));
    CHECK_FALSE(wk_keys::parse("Ctrl+", seq));
    CHECK_FALSE(wk_keys::parse("Hyper+K", seq));

    const KeySequence plus = wk_keys::from_event(key_down(SDLK_EQUALS, KMOD_LCTRL | KMOD_LSHIFT));
    CHECK(plus.key == SDLK_PLUS);
    CHECK(plus.mods == KMOD_CTRL);
}

TEST_CASE("Shortcut helper dispatches key events to bound shortcuts") {
    reset_environment();
    ShortcutHelper helper(false);
    helper.set_rect(SDL_Rect{ 0, 0, 460, 480 });
    int saved = 0;
    std::vector<std::string> activated;
    helper.set_on_shortcut_activated([&](const std::string& name) { activated.push_back(name); });

    CHECK(helper.add_shortcut("save", "Ctrl+S", "Save file", "File", [&]() { ++saved; }));
    CHECK_FALSE(helper.add_shortcut("bad", "Ctrl+Nope+", "Broken"));
    CHECK(helper.add_shortcut("find", "K", "Find"));

    CHECK(helper.handle_event(key_down(SDLK_s, KMOD_LCTRL)));
    CHECK(saved == 1);
    CHECK_FALSE(helper.handle_event(key_down(SDLK_s)));

    // Plain keys typed into the search box are text, not shortcuts.
    helper.search_box()->set_focus(true);
    helper.handle_event(key_down(SDLK_k));
    helper.search_box()->set_focus(false);
    CHECK(helper.handle_event(key_down(SDLK_k)));
    CHECK(activated == std::vector<std::string>{ "save", "find" });

    CHECK(helper.bind("find", [&]() { ++saved; }));
    CHECK(helper.activate("find"));
    CHECK(saved == 2);

    CHECK(helper.categories() == std::vector<std::string>{ "File", "General" });
    CHECK(helper.remove_shortcut("find"));
    CHECK(helper.categories() == std::vector<std::string>{ "File" });
    CHECK(helper.get_shortcut("find") == nullptr);
}

TEST_CASE("Shortcut helper defaults, search and export") {
    reset_environment();
    ShortcutHelper helper;
    helper.set_rect(SDL_Rect{ 0, 0, 460, 480 });
    CHECK(helper.get_shortcuts().size() == 23);
    CHECK(helper.categories() == std::vector<std::string>{ "File", "Edit", "View", "Navigation", "Help" });
    REQUIRE(helper.get_shortcut("zoom_in") != nullptr);
    CHECK(helper.get_shortcut("zoom_in")->sequence == "Ctrl++");

    helper.search_box()->set_text("zoom");
    advance(&helper, 200);
    CHECK(helper.visible_shortcuts().size() == 23);
    advance(&helper, 150);
    CHECK(helper.visible_shortcuts() == std::vector<std::string>{ "zoom_in", "zoom_out", "zoom_reset" });

    helper.set_filter("ctrl+shift");
    CHECK(helper.visible_shortcuts() == std::vector<std::string>{ "save_as" });
    helper.clear_search();
    CHECK(helper.visible_shortcuts().size() == 23);

    ShortcutHelper small(false);
    small.add_shortcut("select_all", "Ctrl+A", "Select all", "Edit");
    small.add_shortcut("help", "F1", "Show help", "Navigation");
    const std::string expected = "Keyboard Shortcuts\n" + std::string(50, '=') + "\n\n" + "Edit:\n" +
                                 std::string(4, '-') + "\n" + "  Ctrl+A" + std::string(14, ' ') + " Select all\n" +
                                 "\n" + "Navigation:\n" + std::string(10, '-') + "\n" + "  F1" + std::string(18, ' ') +
                                 " Show help\n" + "\n";
    CHECK(small.export_shortcuts() == expected);
}

TEST_CASE("Quick help describes key presses without running them") {
    reset_environment();
    ShortcutHelper helper;
    helper.set_rect(SDL_Rect{ 0, 0, 460, 480 });
    int undone = 0;
    helper.bind("undo", [&]() { ++undone; });

    helper.quick_help_button()->click();
    CHECK(helper.quick_help());
    helper.handle_event(key_down(SDLK_LCTRL, KMOD_LCTRL));
    CHECK(helper.quick_help_key() == "Press a key combination...");
    helper.handle_event(key_down(SDLK_z, KMOD_LCTRL));
    CHECK(helper.quick_help_key() == "Key: Ctrl+Z");
    CHECK(helper.quick_help_info().find("undo: Undo last action (Edit)") != std::string::npos);
    CHECK(undone == 0);

    helper.handle_event(key_down(SDLK_j, KMOD_LCTRL | KMOD_LALT));
    CHECK(helper.quick_help_info() == "No shortcut assigned to this key combination.");

    helper.handle_event(key_down(SDLK_ESCAPE));
    CHECK_FALSE(helper.quick_help());
    CHECK_FALSE(helper.quick_help_button()->is_checked());
}

TEST_CASE("Shortcut capture records the next combination") {
    reset_environment();
    ShortcutCapture capture;
    capture.set_rect(SDL_Rect{ 0, 0, 360, 40 });
    std::string captured;
    capture.set_on_shortcut_captured([&](const std::string& s) { captured = s; });

    capture.capture_button()->click();
    CHECK(capture.is_capturing());
    CHECK(capture.capture_button()->text() == "Cancel");
    capture.handle_event(key_down(SDLK_LSHIFT, KMOD_LSHIFT));
    CHECK(capture.is_capturing());
    capture.handle_event(key_down(SDLK_k, KMOD_LCTRL | KMOD_LSHIFT));
    CHECK_FALSE(capture.is_capturing());
    CHECK(captured == "Ctrl+Shift+K");
    CHECK(capture.prompt_text() == "Captured: Ctrl+Shift+K");

    capture.start_capture();
    capture.handle_event(key_down(SDLK_ESCAPE));
    CHECK_FALSE(capture.is_capturing());
    CHECK(capture.captured() == "Ctrl+Shift+K");
}

TEST_CASE("Global search debounces and groups results by provider") {
    reset_environment();
    GlobalSearch search;
    search.set_rect(SDL_Rect{ 0, 0, 420, 440 });
    search.add_provider("files", file_results);
    search.add_provider("content", content_results);
    search.add_provider("broken", [](const std::string&) -> std::vector<SearchResult> {
        throw std::runtime_error("index offline");
    });
    std::vector<std::string> performed;
    search.set_on_search_performed([&](const std::string& q) { performed.push_back(q); });

    search.set_query("file");
    CHECK(search.clear_button()->is_visible());
    advance(&search, 200);
    CHECK(search.result_count() == 0);
    advance(&search, 150);
    REQUIRE(search.result_count() == 2);
    CHECK(search.results()[0].provider == "files");
    CHECK(search.results()[1].provider == "content");
    CHECK(search.status_text() == "Found 2 results");
    CHECK(performed == std::vector<std::string>{ "file" });
    CHECK(search.selected_index() == 0);

    search.set_provider_filter("content");
    REQUIRE(search.result_count() == 1);
    CHECK(search.results()[0].provider == "content");
    search.set_provider_filter("");

    search.set_query("f");
    advance(&search, 350);
    CHECK(search.result_count() == 0);
    CHECK(search.status_text() == "Type at least 2 characters");
}

TEST_CASE("Global search keyboard navigation and clearing") {
    reset_environment();
    GlobalSearch search;
    search.set_rect(SDL_Rect{ 0, 0, 420, 440 });
    search.add_provider("files", file_results);
    search.add_provider("content", content_results);
    std::string provider;
    std::string title;
    search.set_on_result_selected([&](const std::string& p, const SearchResult& r) {
        provider = p;
        title = r.title;
    });
    int cleared = 0;
    search.set_on_search_cleared([&]() { ++cleared; });

    search.focus_search();
    search.handle_event(text_input("file"));
    CHECK(search.query() == "file");
    search.handle_event(key_down(SDLK_RETURN));
    REQUIRE(search.result_count() == 2);

    search.handle_event(key_down(SDLK_DOWN));
    CHECK(search.selected_index() == 1);
    search.handle_event(key_down(SDLK_DOWN));
    CHECK(search.selected_index() == 0);
    search.handle_event(key_down(SDLK_UP));
    CHECK(search.selected_index() == 1);
    search.handle_event(key_down(SDLK_RETURN));
    CHECK(provider == "content");
    CHECK(title == "Content matching \"file\"");

    REQUIRE(search.row(0) != nullptr);
    CHECK(click(*search.row(0)));
    CHECK(provider == "files");
    CHECK(title == "example.txt");

    search.handle_event(key_down(SDLK_ESCAPE));
    CHECK(cleared == 1);
    CHECK(search.query().empty());
    CHECK(search.result_count() == 0);
    CHECK(search.status_text() == "Type to search...");
    CHECK_FALSE(search.clear_button()->is_visible());

    SoftwareCanvas canvas;
    search.render(canvas.renderer());
}
