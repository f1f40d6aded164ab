#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/base_button.hpp"
#include "base/base_popup.hpp"
#include "base/controls.hpp"
#include "data/data_table.hpp"
#include "data/file_explorer.hpp"
#include "data/kanban_board.hpp"
#include "data/mini_chart.hpp"
#include "data/property_grid.hpp"
#include "data/timeline.hpp"
#include "data/tree_view.hpp"
#include "navigation/pagination.hpp"
#include "../test_support.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

using namespace wk_test;
namespace fs = std::filesystem;

namespace {
SDL_Point center(const SDL_Rect& r) {
    return SDL_Point{ r.x + r.w / 2, r.y + r.h / 2 };
}

// Scratch directory removed when the test ends.
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

void write_file(const fs::path& p, const std::string& text) {
    std::ofstream out(p);
    out << text;
}

std::vector<std::string> texts(const std::vector<TreeItem*>& items) {
    std::vector<std::string> out;
    for (const TreeItem* item : items) out.push_back(item->text());
    return out;
}
}

TEST_CASE("Kanban board moves cards between columns") {
    reset_environment();
    KanbanBoard board;
    board.add_column("To Do", "todo");
    board.add_column("Done", "done");
    CHECK(board.add_column("Again", "todo") == nullptr);
    REQUIRE(board.column_count() == 2);

    KanbanCard* card = board.add_card("todo", "Write docs", "API pages", "c1");
    REQUIRE(card != nullptr);
    CHECK(board.add_card("todo", "Duplicate", "", "c1") == nullptr);
    CHECK(board.add_card("missing", "Nowhere") == nullptr);
    CHECK(board.card_column("c1") == "todo");
    CHECK(board.find_column("todo")->card_count() == 1);

    std::vector<std::tuple<std::string, std::string, std::string>> moves;
    board.set_on_card_moved([&](const std::string& card_id, const std::string& from, const std::string& to) {
        moves.emplace_back(card_id, from, to);
    });

    CHECK(board.move_card("c1", "done"));
    REQUIRE(moves.size() == 1);
    CHECK(std::get<0>(moves[0]) == "c1");
    CHECK(std::get<1>(moves[0]) == "todo");
    CHECK(std::get<2>(moves[0]) == "done");
    CHECK(board.find_column("todo")->card_count() == 0);
    CHECK(board.find_column("done")->get_card("c1") == card);

    // Dropping on the column the card is already in changes nothing.
    CHECK_FALSE(board.drop_payload(card->drag_payload(), "done"));
    CHECK_FALSE(board.drop_payload("something:c1", "todo"));
    CHECK(moves.size() == 1);
    CHECK(board.drop_payload("kanban_card:c1", "todo"));
    CHECK(board.card_column("c1") == "todo");

    CHECK(board.remove_card("c1"));
    CHECK(board.card_count() == 0);
    CHECK(board.find_card("c1") == nullptr);
}

TEST_CASE("Kanban column hands over ownership of a taken card") {
    reset_environment();
    KanbanColumn first("To Do", "todo");
    KanbanColumn second("Done", "done");
    KanbanCard* raw = first.add_card(std::make_unique<KanbanCard>("c7", "Ship it", "Tag the release"));
    REQUIRE(raw != nullptr);

    CHECK(first.take_card("missing") == nullptr);
    CHECK(first.card_count() == 1);

    std::unique_ptr<KanbanCard> taken = first.take_card("c7");
    REQUIRE(taken != nullptr);
    CHECK(taken.get() == raw);
    CHECK(taken->title() == "Ship it");
    CHECK(first.card_count() == 0);
    CHECK(first.get_card("c7") == nullptr);

    CHECK(second.add_card(std::move(taken)) == raw);
    CHECK(second.get_card("c7") == raw);
    CHECK(second.take_card("c7") != nullptr);
    CHECK(second.card_count() == 0);
}

TEST_CASE("Kanban board saves and loads its data") {
    reset_environment();
    TempDir dir("wk_kanban_test");
    KanbanBoard board;
    board.add_column("To Do", "todo");
    board.add_column("Doing", "doing");
    board.add_card("todo", "First", "one", "a");
    board.add_card("todo", "Second", "two", "b");
    board.add_card("doing", "Third", "", "c");

    const nlohmann::json data = board.get_board_data();
    REQUIRE(data["columns"].size() == 2);
    CHECK(data["columns"][0]["cards"][1]["title"] == "Second");

    const std::string path = (dir.path() / "board.json").string();
    REQUIRE(board.save_to_file(path));

    KanbanBoard loaded;
    REQUIRE(loaded.load_from_file(path));
    CHECK(loaded.get_board_data() == data);
    CHECK(loaded.card_column("c") == "doing");

    // Numeric ids are accepted and kept as text.
    const nlohmann::json numeric = nlohmann::json::parse(
        R"({"columns": [{"id": 7, "title": "Seven", "cards": [{"id": 42, "title": "Answer"}]}]})");
    REQUIRE(loaded.load_board_data(numeric));
    CHECK(loaded.column_count() == 1);
    CHECK(loaded.card_column("42") == "7");

    CHECK_FALSE(loaded.load_board_data(nlohmann::json::array()));
    CHECK_FALSE(loaded.load_from_file((dir.path() / "missing.json").string()));
    CHECK(loaded.column_count() == 1);
}

TEST_CASE("Kanban column plus button and add column button") {
    reset_environment();
    KanbanBoard board;
    board.set_rect(SDL_Rect{ 0, 0, 1200, 700 });
    KanbanColumn* column = board.add_column("To Do", "todo");
    board.set_rect(SDL_Rect{ 0, 0, 1200, 700 });

    // Without a handler the board adds the card.
    REQUIRE(click(*column->add_button()));
    REQUIRE(column->card_count() == 1);
    CHECK(column->cards()[0]->title() == "New Card");
    CHECK(column->cards()[0]->description() == "Click to edit...");

    std::vector<std::string> created;
    board.set_on_card_created([&](const std::string& column_id, const nlohmann::json& card) {
        created.push_back(column_id + ":" + card["title"].get<std::string>());
    });
    click(*column->add_button());
    REQUIRE(created.size() == 1);
    CHECK(created[0] == "todo:New Card");
    CHECK(column->card_count() == 1);

    std::vector<std::string> added;
    board.set_on_column_added([&](const std::string& title) { added.push_back(title); });
    click(*board.add_column_button());
    CHECK(board.column_count() == 2);
    REQUIRE(added.size() == 1);
    CHECK(added[0] == "Column 2");
}

TEST_CASE("Kanban cards drag to another column") {
    reset_environment();
    KanbanBoard board;
    board.add_column("To Do", "todo");
    KanbanColumn* done = board.add_column("Done", "done");
    KanbanCard* card = board.add_card("todo", "Drag me", "", "c1");
    board.set_rect(SDL_Rect{ 0, 0, 1200, 700 });

    std::vector<std::string> moved;
    board.set_on_card_moved([&](const std::string& id, const std::string&, const std::string& to) {
        moved.push_back(id + "->" + to);
    });

    const SDL_Point start = center(card->rect());
    board.handle_event(mouse_down(start.x, start.y));
    board.handle_event(mouse_move(start.x + 4, start.y));
    CHECK(board.dragged_card() == nullptr);
    board.handle_event(mouse_move(start.x + 20, start.y));
    REQUIRE(board.dragged_card() == card);
    CHECK(card->is_dragging());

    const SDL_Point target = center(done->rect());
    board.handle_event(mouse_move(target.x, target.y));
    CHECK(done->is_drop_highlighted());
    board.handle_event(mouse_up(target.x, target.y));

    CHECK(board.dragged_card() == nullptr);
    CHECK_FALSE(card->is_dragging());
    CHECK_FALSE(done->is_drop_highlighted());
    REQUIRE(moved.size() == 1);
    CHECK(moved[0] == "c1->done");
    CHECK(board.card_column("c1") == "done");

    // Escape cancels a drag.
    board.set_rect(SDL_Rect{ 0, 0, 1200, 700 });
    const SDL_Point again = center(card->rect());
    board.handle_event(mouse_down(again.x, again.y));
    board.handle_event(mouse_move(again.x, again.y + 30));
    REQUIRE(board.dragged_card() == card);
    board.handle_event(key_down(SDLK_ESCAPE));
    CHECK(board.dragged_card() == nullptr);
    CHECK(board.card_column("c1") == "done");
    CHECK(moved.size() == 1);
}

TEST_CASE("Tree filter keeps the parents of matches") {
    reset_environment();
    TreeView tree;
    tree.set_rect(SDL_Rect{ 0, 0, 400, 600 });
    TreeItem* docs = tree.add_folder("Documents");
    tree.add_file("Report.pdf", docs, "pdf");
    tree.add_file("notes.txt", docs, "text");
    TreeItem* pics = tree.add_folder("Pictures");
    tree.add_file("holiday.png", pics, "image");

    CHECK(texts(tree.visible_items()) == std::vector<std::string>{ "Documents", "Pictures" });

    tree.filter("REPORT");
    CHECK(tree.filter_text() == "REPORT");
    CHECK(docs->is_expanded());
    CHECK(pics->is_hidden());
    CHECK(texts(tree.visible_items()) == std::vector<std::string>{ "Documents", "Report.pdf" });

    tree.search_box()->set_text("");
    CHECK(tree.filter_text().empty());
    CHECK_FALSE(pics->is_hidden());
    CHECK_FALSE(docs->is_expanded());
    CHECK(texts(tree.visible_items()) == std::vector<std::string>{ "Documents", "Pictures" });

    CHECK(tree.find_item("holiday.png")->parent() == pics);
    CHECK(tree.find_item("holiday.png")->file_type() == "image");
    CHECK(tree.remove_item(pics));
    CHECK(tree.top_level_count() == 1);
    CHECK(tree.find_item("holiday.png") == nullptr);
}

TEST_CASE("Clearing the tree filter restores the expansion from before filtering") {
    reset_environment();
    TreeView tree;
    tree.set_rect(SDL_Rect{ 0, 0, 400, 600 });
    TreeItem* docs = tree.add_folder("Documents");
    TreeItem* work = tree.add_folder("Work", docs);
    tree.add_file("plan.md", work, "markdown");
    TreeItem* pics = tree.add_folder("Pictures");
    tree.add_file("holiday.png", pics, "image");
    TreeItem* music = tree.add_folder("Music");
    tree.add_file("plan.mp3", music, "audio");
    tree.set_expanded(pics, true);

    tree.filter("plan");
    CHECK(docs->is_expanded());
    CHECK(work->is_expanded());
    CHECK(music->is_expanded());
    CHECK(pics->is_hidden());

    // Narrowing the query closes folders the filter opened but no longer needs.
    tree.filter("plan.md");
    CHECK(docs->is_expanded());
    CHECK_FALSE(music->is_expanded());

    // A folder the user opens while filtering stays open afterwards.
    tree.set_expanded(music, true);
    tree.filter("");
    CHECK_FALSE(docs->is_expanded());
    CHECK_FALSE(work->is_expanded());
    CHECK(pics->is_expanded());
    CHECK(music->is_expanded());
    CHECK(texts(tree.visible_items()) ==
          std::vector<std::string>{ "Documents", "Pictures", "holiday.png", "Music", "plan.mp3" });
}

TEST_CASE("Tree expands, navigates with keys and renames inline") {
    reset_environment();
    TreeView tree(false);
    tree.set_rect(SDL_Rect{ 0, 0, 400, 600 });
    TreeItem* root = tree.add_folder("Project");
    TreeItem* src = tree.add_folder("src", root);
    TreeItem* main_file = tree.add_file("main.cpp", src);
    tree.add_file("README.md", root);

    std::vector<std::string> expanded;
    tree.set_on_item_expanded([&](TreeItem* item) { expanded.push_back(item->text()); });
    tree.expand_all();
    CHECK(expanded.size() == 2);
    CHECK(tree.visible_items().size() == 4);
    tree.collapse_all();
    CHECK(tree.visible_items().size() == 1);

    // Arrow click toggles; double click toggles and reports.
    click_at(tree, center(tree.arrow_rect(root)).x, center(tree.arrow_rect(root)).y);
    CHECK(root->is_expanded());
    std::vector<TreeItem*> double_clicked;
    tree.set_on_item_double_clicked([&](TreeItem* item) { double_clicked.push_back(item); });
    const SDL_Point src_row = center(tree.item_rect(src));
    click_at(tree, src_row.x, src_row.y);
    click_at(tree, src_row.x, src_row.y, 2);
    CHECK(src->is_expanded());
    REQUIRE(double_clicked.size() == 1);
    CHECK(double_clicked[0] == src);
    CHECK(tree.current_item() == src);

    tree.handle_event(key_down(SDLK_DOWN));
    CHECK(tree.current_item() == main_file);
    tree.handle_event(key_down(SDLK_HOME));
    CHECK(tree.current_item() == root);
    tree.handle_event(key_down(SDLK_END));
    CHECK(tree.current_item()->text() == "README.md");
    tree.handle_event(key_down(SDLK_HOME));
    tree.handle_event(key_down(SDLK_LEFT));
    CHECK_FALSE(root->is_expanded());

    tree.expand_all();
    std::vector<std::string> renamed;
    tree.set_on_item_renamed([&](TreeItem* item) { renamed.push_back(item->text()); });
    tree.rename_item(main_file);
    REQUIRE(tree.is_renaming());
    tree.rename_editor()->set_text("   ");
    tree.handle_event(key_down(SDLK_RETURN));
    CHECK_FALSE(tree.is_renaming());
    CHECK(main_file->text() == "main.cpp");
    tree.update();
    CHECK(tree.rename_editor() == nullptr);

    tree.rename_item(main_file);
    tree.rename_editor()->set_text("app.cpp");
    tree.handle_event(key_down(SDLK_RETURN));
    CHECK(main_file->text() == "app.cpp");
    REQUIRE(renamed.size() == 1);
    CHECK(renamed[0] == "app.cpp");

    tree.update();
    tree.rename_item(main_file);
    tree.rename_editor()->set_text("other.cpp");
    tree.handle_event(key_down(SDLK_ESCAPE));
    CHECK(main_file->text() == "app.cpp");
}

TEST_CASE("Tree context menu adds, renames and deletes") {
    reset_environment();
    TreeView tree(false);
    tree.set_rect(SDL_Rect{ 0, 0, 400, 600 });
    TreeItem* folder = tree.add_folder("Assets");
    TreeItem* file = tree.add_file("logo.svg");

    const SDL_Point folder_row = center(tree.item_rect(folder));
    tree.handle_event(mouse_down(folder_row.x, folder_row.y, SDL_BUTTON_RIGHT));
    ContextMenuPopup* menu = tree.context_menu();
    REQUIRE(menu != nullptr);
    CHECK(menu->is_visible());
    REQUIRE(menu->action_count() == 5);
    CHECK(menu->action(0)->text() == "Expand All");
    CHECK(menu->action(1)->text() == "Collapse All");
    CHECK(menu->action(2)->text() == "Add Folder");
    CHECK(menu->action(3)->text() == "Add File");
    CHECK(menu->action(4)->text() == "Delete");

    menu->trigger(2);
    REQUIRE(folder->child_count() == 1);
    CHECK(folder->child(0)->text() == "New Folder 1");
    CHECK(folder->is_expanded());
    advance(&tree, 500);

    tree.show_context_menu(folder, 10, 10);
    tree.context_menu()->trigger(3);
    REQUIRE(folder->child_count() == 2);
    CHECK(folder->child(1)->text() == "New File 2.txt");
    CHECK(folder->child(1)->file_type() == "text");
    advance(&tree, 500);

    tree.show_context_menu(file, 10, 10);
    REQUIRE(tree.context_menu()->action_count() == 4);
    CHECK(tree.context_menu()->action(2)->text() == "Rename");
    tree.context_menu()->trigger(2);
    CHECK(tree.is_renaming());
    tree.handle_event(key_down(SDLK_ESCAPE));
    advance(&tree, 500);

    tree.show_context_menu(file, 10, 10);
    tree.context_menu()->trigger(3);
    CHECK(tree.top_level_count() == 1);
    CHECK(tree.find_item("logo.svg") == nullptr);
    advance(&tree, 500);
    CHECK(tree.context_menu() == nullptr);
}

TEST_CASE("Checkable tree propagates to children and parents") {
    reset_environment();
    CheckableTreeView tree(false);
    tree.set_rect(SDL_Rect{ 0, 0, 400, 600 });
    TreeItem* root = tree.add_folder("All");
    TreeItem* a = tree.add_item("A", root);
    TreeItem* b = tree.add_item("B", root);
    TreeItem* b1 = tree.add_item("B1", b);
    TreeItem* b2 = tree.add_item("B2", b);

    int notifications = 0;
    tree.set_on_items_checked([&](const std::vector<TreeItem*>&) { ++notifications; });

    tree.set_check_state(b, CheckState::Checked);
    CHECK(b1->check_state() == CheckState::Checked);
    CHECK(b2->check_state() == CheckState::Checked);
    CHECK(root->check_state() == CheckState::Partial);

    tree.set_check_state(a, CheckState::Checked);
    CHECK(root->check_state() == CheckState::Checked);

    tree.set_check_state(b1, CheckState::Unchecked);
    CHECK(b->check_state() == CheckState::Partial);
    CHECK(root->check_state() == CheckState::Partial);

    tree.set_check_state(root, CheckState::Unchecked);
    CHECK(a->check_state() == CheckState::Unchecked);
    CHECK(b2->check_state() == CheckState::Unchecked);
    CHECK(tree.checked_items().empty());
    CHECK(notifications == 4);

    tree.set_current_item(a);
    tree.handle_event(mouse_down(center(tree.item_rect(a)).x, center(tree.item_rect(a)).y));
    tree.handle_event(key_down(SDLK_SPACE));
    CHECK(a->check_state() == CheckState::Checked);
    CHECK(texts(tree.checked_items()) == std::vector<std::string>{ "A" });
}

TEST_CASE("File tree reads folders when they open") {
    reset_environment();
    TempDir dir("wk_file_tree_test");
    fs::create_directories(dir.path() / "src");
    write_file(dir.path() / "README.md", "# readme");
    write_file(dir.path() / "src" / "main.py", "print()");
    write_file(dir.path() / "src" / "Photo.JPG", "");

    FileTreeView tree;
    tree.set_rect(SDL_Rect{ 0, 0, 400, 600 });
    REQUIRE(tree.load_directory(dir.path().string()));
    REQUIRE(tree.top_level_count() == 1);
    TreeItem* root = tree.top_level_item(0);
    CHECK(root->text() == "wk_file_tree_test");
    CHECK(root->is_expanded());
    REQUIRE(root->child_count() == 2);
    CHECK(root->child(0)->text() == "README.md");
    CHECK(root->child(0)->file_type() == "markdown");

    TreeItem* src = root->child(1);
    CHECK(src->is_folder());
    REQUIRE(src->child_count() == 1);
    CHECK(src->child(0)->text() == FileTreeView::kPlaceholder);

    tree.set_expanded(src, true);
    REQUIRE(src->child_count() == 2);
    CHECK(src->child(0)->text() == "Photo.JPG");
    CHECK(src->child(0)->file_type() == "image");
    CHECK(src->child(1)->file_type() == "python");
    CHECK(src->child(1)->data().get<std::string>() == (dir.path() / "src" / "main.py").string());

    CHECK(FileTreeView::file_type(".DOCX") == "document");
    CHECK(FileTreeView::file_type(".rs") == "default");
    CHECK_FALSE(tree.load_directory((dir.path() / "README.md").string()));
    CHECK(tree.top_level_count() == 1);
}

TEST_CASE("File explorer walks folders with back, forward and up") {
    reset_environment();
    TempDir dir("wk_explorer_test");
    fs::create_directories(dir.path() / "docs" / "drafts");
    fs::create_directories(dir.path() / "music");
    write_file(dir.path() / "readme.md", "# readme");
    write_file(dir.path() / "docs" / "b.txt", "b");
    write_file(dir.path() / "docs" / "a.pdf", "a");

    FileExplorer explorer(dir.path().string());
    explorer.set_rect(SDL_Rect{ 0, 0, 900, 600 });
    const std::string root = explorer.root_path();
    const std::string docs = (fs::path(root) / "docs").string();
    const std::string music = (fs::path(root) / "music").string();
    REQUIRE(explorer.shows_list_view());
    CHECK(explorer.current_path() == root);
    CHECK(texts(explorer.tree()->visible_items()) ==
          std::vector<std::string>{ "wk_explorer_test", "docs", "music" });
    REQUIRE(explorer.file_list()->entries().size() == 1);
    CHECK(explorer.file_list()->entries()[0].name == "readme.md");
    CHECK_FALSE(explorer.back_button()->is_enabled());
    CHECK_FALSE(explorer.forward_button()->is_enabled());

    std::vector<std::string> folders;
    explorer.set_on_folder_changed([&](const std::string& path) { folders.push_back(path); });

    CHECK(explorer.navigate_to(docs));
    CHECK(explorer.current_path() == docs);
    CHECK(explorer.breadcrumb()->current_path() == "docs");
    REQUIRE(explorer.file_list()->entries().size() == 2);
    CHECK(explorer.file_list()->entries()[0].name == "a.pdf");
    CHECK(explorer.file_list()->entries()[0].file_type == "pdf");
    CHECK(explorer.back_button()->is_enabled());

    CHECK_FALSE(explorer.navigate_to((fs::path(root) / "missing").string()));
    CHECK_FALSE(explorer.navigate_to((fs::path(root) / "readme.md").string()));
    CHECK(explorer.current_path() == docs);

    // Clicking a folder in the tree opens it.
    TreeItem* music_row = explorer.tree()->find_item("music");
    REQUIRE(music_row != nullptr);
    const SDL_Point p = center(explorer.tree()->item_rect(music_row));
    click_at(explorer, p.x, p.y);
    CHECK(explorer.current_path() == music);

    CHECK(explorer.go_back());
    CHECK(explorer.current_path() == docs);
    CHECK(explorer.go_back());
    CHECK(explorer.current_path() == root);
    CHECK_FALSE(explorer.go_back());
    CHECK(explorer.can_go_forward());
    CHECK(explorer.go_forward());
    CHECK(explorer.current_path() == docs);

    // Going up is a new step: the forward history is dropped.
    CHECK(explorer.go_up());
    CHECK(explorer.current_path() == root);
    CHECK_FALSE(explorer.can_go_forward());
    explorer.back_button()->click();
    CHECK(explorer.current_path() == docs);

    // A breadcrumb segment leads back to its folder.
    const int parent_index = static_cast<int>(explorer.breadcrumb()->paths().size()) - 2;
    explorer.breadcrumb()->navigate_to_index(parent_index);
    CHECK(explorer.current_path() == root);

    const std::vector<std::string> expected{ docs, music, docs, root, docs, root, docs, root };
    CHECK(folders == expected);
}

TEST_CASE("File explorer list selects, opens and deletes files") {
    reset_environment();
    TempDir dir("wk_explorer_actions");
    write_file(dir.path() / "notes.txt", "n");
    write_file(dir.path() / "old.log", "x");

    FileExplorer explorer(dir.path().string());
    explorer.set_rect(SDL_Rect{ 0, 0, 900, 600 });
    const std::string root = explorer.root_path();
    const std::string old_log = (fs::path(root) / "old.log").string();
    FileListView* list = explorer.file_list();
    REQUIRE(list != nullptr);
    REQUIRE(list->entries().size() == 2);

    std::string selected;
    std::string opened;
    explorer.set_on_file_selected([&](const std::string& path) { selected = path; });
    explorer.set_on_file_double_clicked([&](const std::string& path) { opened = path; });

    const int old_index = list->index_of("old.log");
    REQUIRE(old_index == 1);
    const SDL_Point row = center(list->row_rect(old_index));
    click_at(explorer, row.x, row.y);
    CHECK(selected == old_log);
    CHECK(explorer.selected_file() == old_log);
    explorer.handle_event(mouse_down(row.x, row.y, SDL_BUTTON_LEFT, 2));
    explorer.handle_event(mouse_up(row.x, row.y, SDL_BUTTON_LEFT, 2));
    CHECK(opened == old_log);

    explorer.handle_event(mouse_down(row.x, row.y, SDL_BUTTON_RIGHT));
    ContextMenuPopup* menu = list->context_menu();
    REQUIRE(menu != nullptr);
    REQUIRE(menu->action_count() == 3);
    CHECK(menu->action(0)->text() == "Open");
    CHECK(menu->action(1)->text() == "Copy Path");
    CHECK(menu->action(2)->text() == "Delete");

    menu->trigger(1);
    char* clip = SDL_GetClipboardText();
    REQUIRE(clip != nullptr);
    CHECK(std::string(clip) == old_log);
    SDL_free(clip);

    menu->trigger(2);
    CHECK_FALSE(fs::exists(old_log));
    REQUIRE(list->entries().size() == 1);
    CHECK(list->entries()[0].name == "notes.txt");
    CHECK(list->current_index() == -1);

    CHECK_FALSE(explorer.delete_file(old_log));
    CHECK_FALSE(explorer.delete_file(root));
    CHECK(fs::is_directory(root));
}

TEST_CASE("File explorer creates numbered folders from the tree menu") {
    reset_environment();
    TempDir dir("wk_explorer_folders");
    write_file(dir.path() / "keep.txt", "k");

    FileExplorer explorer(dir.path().string());
    explorer.set_rect(SDL_Rect{ 0, 0, 900, 600 });
    const std::string root = explorer.root_path();

    CHECK(explorer.create_folder(root) == (fs::path(root) / "New Folder").string());
    CHECK(explorer.create_folder(root) == (fs::path(root) / "New Folder (1)").string());
    CHECK(explorer.tree()->find_item("New Folder (1)") != nullptr);
    CHECK(explorer.create_folder((fs::path(root) / "missing").string()).empty());

    TreeItem* top = explorer.tree()->top_level_item(0);
    REQUIRE(top != nullptr);
    explorer.tree()->show_context_menu(top, 20, 20);
    ContextMenuPopup* menu = explorer.tree()->context_menu();
    REQUIRE(menu != nullptr);
    REQUIRE(menu->action_count() == 2);
    CHECK(menu->action(0)->text() == "New Folder");
    CHECK(menu->action(1)->text() == "Copy Path");
    menu->trigger(0);
    CHECK(fs::is_directory(fs::path(root) / "New Folder (2)"));
    CHECK(explorer.tree()->find_item("New Folder (2)") != nullptr);

    // Without the list view the tree carries the files as well.
    FileExplorer tree_only(root, false);
    CHECK_FALSE(tree_only.shows_list_view());
    CHECK(tree_only.file_list() == nullptr);
    TreeItem* keep = tree_only.tree()->find_item("keep.txt");
    REQUIRE(keep != nullptr);
    tree_only.tree()->set_current_item(keep);
    CHECK(tree_only.selected_file() == (fs::path(root) / "keep.txt").string());
}

TEST_CASE("Data table sorts numbers, filters and edits") {
    reset_environment();
    DataTable table({ "Name", "Age", "City" });
    table.set_rect(SDL_Rect{ 0, 0, 800, 500 });
    table.set_data({ { "alice", "30", "Paris" }, { "Bob", "9", "Berlin" }, { "carol", "1,200", "Rome" }, { "dave" } });
    CHECK(table.row_count() == 4);
    CHECK(table.cell(3, 2).empty());

    table.sort_by(1);
    CHECK(table.visible_rows() == std::vector<int>{ 3, 1, 0, 2 });
    table.toggle_sort(1);
    CHECK_FALSE(table.sort_ascending());
    CHECK(table.visible_rows() == std::vector<int>{ 2, 0, 1, 3 });
    table.toggle_sort(0);
    CHECK(table.sort_column() == 0);
    CHECK(table.visible_rows() == std::vector<int>{ 0, 1, 2, 3 });

    // Header click sorts too.
    click_at(table, center(table.header_rect(2)).x, center(table.header_rect(2)).y);
    CHECK(table.sort_column() == 2);

    table.set_filter("R");
    CHECK(table.visible_rows().size() == 3);
    table.set_filter_column(0);
    CHECK(table.visible_rows() == std::vector<int>{ 2 });
    table.clear_filters();
    CHECK(table.filter().empty());
    CHECK(table.filter_column() == -1);
    CHECK(table.visible_rows().size() == 4);

    std::vector<int> selected;
    table.set_on_row_selected([&](int row) { selected.push_back(row); });
    table.select_row(1);
    table.select_row(1);
    CHECK(selected == std::vector<int>{ 1 });
    CHECK(table.row_data(1)["City"] == "Berlin");

    CHECK_FALSE(table.begin_edit(1, 2));
    table.set_editable(true);
    std::vector<std::string> changes;
    int data_changes = 0;
    table.set_on_cell_changed([&](int row, int column, const std::string& v) {
        changes.push_back(std::to_string(row) + "," + std::to_string(column) + "=" + v);
    });
    table.set_on_data_changed([&]() { ++data_changes; });
    REQUIRE(table.begin_edit(1, 2));
    table.editor()->set_text("Munich");
    table.handle_event(key_down(SDLK_RETURN));
    CHECK_FALSE(table.is_editing());
    CHECK(table.cell(1, 2) == "Munich");
    REQUIRE(changes.size() == 1);
    CHECK(changes[0] == "1,2=Munich");
    CHECK(data_changes == 1);

    table.update();
    REQUIRE(table.begin_edit(0, 0));
    table.editor()->set_text("zed");
    table.handle_event(key_down(SDLK_ESCAPE));
    CHECK(table.cell(0, 0) == "alice");

    table.add_row({ "eve", "41", "Oslo" });
    CHECK(data_changes == 2);
    CHECK(table.remove_row(4));
    CHECK_FALSE(table.remove_row(4));
    CHECK(data_changes == 3);
}

TEST_CASE("Data table exports the visible rows as CSV") {
    reset_environment();
    TempDir dir("wk_table_test");
    DataTable table({ "Name", "Note" });
    table.set_data({ { "Ann", "likes \"tea\"" }, { "Ben", "a, b" }, { "Cy", "solo" } });
    table.set_filter("n");

    const std::string csv = table.to_csv();
    CHECK(csv == "Name,Note\r\nAnn,\"likes \"\"tea\"\"\"\r\nBen,\"a, b\"\r\n");

    std::string exported;
    table.set_on_export([&](const std::string& text) { exported = text; });
    table.set_rect(SDL_Rect{ 0, 0, 800, 400 });
    click(*table.export_button());
    CHECK(exported == csv);

    const fs::path path = dir.path() / "out.csv";
    REQUIRE(table.export_csv(path.string()));
    std::ifstream in(path, std::ios::binary);
    const std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(written == csv);
    CHECK_FALSE(table.export_csv((dir.path() / "missing" / "out.csv").string()));
}

TEST_CASE("Paginated table pages the filtered rows") {
    reset_environment();
    PaginatedDataTable table({ "Item" }, 10);
    table.set_rect(SDL_Rect{ 0, 0, 800, 600 });
    std::vector<DataTable::Row> rows;
    for (int i = 1; i <= 25; ++i) rows.push_back({ (i % 2 ? "odd " : "even ") + std::to_string(i) });
    table.set_data(rows);
    CHECK(table.total_pages() == 3);

    std::vector<int> pages;
    table.set_on_page_changed([&](int p) { pages.push_back(p); });
    table.set_current_page(3);
    CHECK(table.current_page() == 3);
    CHECK(table.pagination()->current_page() == 3);

    table.set_filter("even");
    CHECK(table.visible_rows().size() == 12);
    CHECK(table.total_pages() == 2);
    CHECK(table.current_page() == 1);

    table.set_page_size(5);
    CHECK(table.total_pages() == 3);
    CHECK(table.current_page() == 1);
    CHECK(pages.front() == 3);
}

TEST_CASE("Timeline keeps events in time order") {
    reset_environment();
    Timeline timeline;
    timeline.set_rect(SDL_Rect{ 0, 0, 500, 800 });
    CHECK(timeline.add_event("Second", "", 2000) == 0);
    CHECK(timeline.add_event("First", "", 1000, "success") == 0);
    CHECK(timeline.add_event("Second again", "", 2000, "error") == 2);
    CHECK(timeline.add_event("Now") == 3);
    CHECK(timeline.events()[1].title == "Second");
    CHECK(timeline.events()[2].title == "Second again");
    CHECK(timeline.events()[3].timestamp > 2000);

    std::vector<std::string> clicked;
    timeline.set_on_event_clicked([&](int index, const TimelineEvent& ev) {
        clicked.push_back(std::to_string(index) + ":" + ev.title);
    });
    const SDL_Rect first = timeline.event_rect(0);
    REQUIRE(first.w > 0);
    click_at(timeline, center(first).x, center(first).y);
    REQUIRE(clicked.size() == 1);
    CHECK(clicked[0] == "0:First");

    // Press on one card, release on another: no click.
    const SDL_Point a = center(timeline.event_rect(1));
    const SDL_Point b = center(timeline.event_rect(2));
    timeline.handle_event(mouse_down(a.x, a.y));
    timeline.handle_event(mouse_up(b.x, b.y));
    CHECK(clicked.size() == 1);

    CHECK(wk::same_color(Timeline::status_color("error"), ThemeManager::instance().color("danger")));
    CHECK(wk::same_color(Timeline::status_color("unknown"), ThemeManager::instance().color("primary")));
    CHECK(Timeline::format_timestamp(timeline.events()[0].timestamp, true).size() == 5);

    timeline.set_compact(true);
    CHECK(timeline.event_rect(1).h == Timeline::kCompactHeight);
    CHECK(timeline.remove_event(0));
    CHECK(timeline.event_count() == 3);
    timeline.clear_events();
    CHECK(timeline.event_count() == 0);
}

TEST_CASE("Property grid types, coercion and reset") {
    reset_environment();
    PropertyGrid grid;
    grid.set_rect(SDL_Rect{ 0, 0, 360, 600 });
    CHECK(grid.add_property("Name", "Button"));
    CHECK(grid.add_property("Width", 120, PropertyType::Auto, "Layout"));
    CHECK(grid.add_property("Opacity", 0.5, PropertyType::Auto, "Appearance"));
    CHECK(grid.add_property("Visible", true, PropertyType::Auto, "Appearance"));
    CHECK(grid.add_property("Align", "Left", PropertyType::Choice, "Layout", { "Left", "Center", "Right" }));
    CHECK(grid.add_property("Color", "#ff8800", PropertyType::Color, "Appearance"));
    CHECK_FALSE(grid.add_property("Name", "Again"));
    CHECK_FALSE(grid.add_property("Mode", "Fast", PropertyType::Choice));
    CHECK_FALSE(grid.add_property("Flag", "yes", PropertyType::Bool));

    CHECK(grid.property_type("Width") == PropertyType::Int);
    CHECK(grid.property_type("Opacity") == PropertyType::Float);
    CHECK(grid.property_type("Visible") == PropertyType::Bool);
    CHECK(grid.get_property("Color") == "#FF8800");
    CHECK(grid.get_property("Unknown").is_null());
    CHECK(grid.categories() == std::vector<std::string>{ "Layout", "Appearance" });

    std::vector<std::string> changed;
    grid.set_on_property_changed([&](const std::string& name, const nlohmann::json& v) {
        changed.push_back(name + "=" + v.dump());
    });

    CHECK(grid.set_property("Width", 12.7));
    CHECK(grid.get_property("Width") == 13);
    CHECK(grid.set_property("Width", 5000000));
    CHECK(grid.get_property("Width") == PropertyGrid::kIntLimit);
    CHECK_FALSE(grid.set_property("Align", "Justify"));
    CHECK(grid.set_property("Align", 2));
    CHECK(grid.get_property("Align") == "Right");
    CHECK(changed.empty());

    auto* visible = dynamic_cast<Checkbox*>(grid.editor("Visible"));
    REQUIRE(visible != nullptr);
    visible->set_checked(false);
    REQUIRE(changed.size() == 1);
    CHECK(changed[0] == "Visible=false");
    CHECK(grid.get_property("Visible") == false);

    auto* width = dynamic_cast<TextBox*>(grid.editor("Width"));
    REQUIRE(width != nullptr);
    width->set_text("64");
    CHECK(grid.get_property("Width") == 64);
    width->set_text("abc");
    CHECK(grid.get_property("Width") == 64);

    changed.clear();
    grid.reset_properties();
    CHECK(grid.get_property("Width") == 120);
    CHECK(grid.get_property("Visible") == true);
    CHECK(grid.get_property("Align") == "Left");
    CHECK(changed.size() == 3);

    grid.set_category_expanded("Layout", false);
    CHECK_FALSE(grid.is_category_expanded("Layout"));
    CHECK(grid.remove_property("Width"));
    CHECK(grid.remove_property("Align"));
    CHECK(grid.categories() == std::vector<std::string>{ "Appearance" });

    grid.set_properties(nlohmann::json{ { "Title", "Hello" }, { "Count", 3 } });
    CHECK(grid.property_names().size() == 2);
    CHECK(grid.properties() == nlohmann::json{ { "Count", 3 }, { "Title", "Hello" } });
}

TEST_CASE("Charts trim points, track range and report trends") {
    reset_environment();
    CHECK(wk::parse_chart_type("BAR") == ChartType::Bar);
    CHECK(wk::parse_chart_type("pie") == ChartType::Line);

    MiniChart chart("Requests", ChartType::Bar, { 4, 8, 2 });
    CHECK(chart.title() == "Requests");
    CHECK(chart.min_label()->text() == "Min: 2");
    CHECK(chart.max_label()->text() == "Max: 8");

    chart.set_max_points(3);
    chart.add_point(10);
    CHECK(chart.data() == std::vector<double>{ 8, 2, 10 });
    CHECK(chart.max_label()->text() == "Max: 10");

    std::vector<double> many;
    for (int i = 0; i < 80; ++i) many.push_back(i);
    MiniChart line("Load", ChartType::Line, many);
    CHECK(line.data().size() == ChartView::kDefaultMaxPoints);
    CHECK(line.data().front() == 30);
    line.chart()->set_range(0, 100);
    CHECK(line.chart()->max_value() == 100);
    line.chart()->clear_range();
    CHECK(line.chart()->max_value() == 79);

    line.set_rect(SDL_Rect{ 0, 0, 300, 200 });
    int clicked = -1;
    line.set_on_chart_clicked([&](int i) { clicked = i; });
    const SDL_Point last = line.chart()->point_position(49);
    click_at(line, last.x, last.y);
    CHECK(clicked == 49);

    Sparkline spark("CPU", { 10, 20, 15.5 });
    CHECK(spark.value_label()->text() == "15.5");
    CHECK(spark.chart()->chart_type() == ChartType::Sparkline);
    CHECK(spark.chart()->height_for_width(200) == Sparkline::kChartHeight);

    TrendChart trend("Revenue", { 200, 150, 250 });
    CHECK(trend.trend_percent() == doctest::Approx(25.0));
    CHECK(trend.trend() == Trend::Up);
    CHECK(trend.indicator()->text() == "+25.0%");
    trend.set_data({ 0, 5 });
    CHECK(trend.trend_percent() == 0.0);
    CHECK(trend.trend() == Trend::Flat);
    trend.set_data({ 80, 60 });
    CHECK(trend.indicator()->text() == "-25.0%");

    SoftwareCanvas canvas;
    trend.set_rect(SDL_Rect{ 0, 0, 300, 160 });
    trend.render(canvas.renderer());
    chart.set_rect(SDL_Rect{ 0, 0, 300, 160 });
    chart.render(canvas.renderer());
}
