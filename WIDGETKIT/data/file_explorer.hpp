#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class ContextMenuPopup;
class FileBreadcrumb;
class FileTreeView;
class TreeItem;

// Files of one directory, one row each, sorted by name. Click selects, double
// click opens, right click shows the context menu.
class FileListView : public Widget {
public:
    static constexpr int kRowHeight = 32;
    static constexpr int kWheelStep = 40;

    struct Entry {
        std::string name;
        std::string path;
        std::string file_type;
    };

    FileListView();
    ~FileListView() override;

    // False when the directory cannot be read; the list is then empty.
    bool load_directory(const std::string& path);
    void clear();
    const std::string& directory() const { return directory_; }
    const std::vector<Entry>& entries() const { return entries_; }
    int index_of(const std::string& name) const;

    int current_index() const { return current_; }
    void set_current_index(int index);
    // Full path of the selected file; empty when nothing is selected.
    std::string selected_path() const;
    SDL_Rect row_rect(int index) const;

    void show_context_menu(int index, int x, int y);
    ContextMenuPopup* context_menu() const { return menu_.get(); }
    void set_context_menu_builder(std::function<void(ContextMenuPopup&, const Entry&)> cb) {
        menu_builder_ = std::move(cb);
    }

    void set_on_file_clicked(std::function<void(const std::string&)> cb) { on_file_clicked_ = std::move(cb); }
    void set_on_file_double_clicked(std::function<void(const std::string&)> cb) {
        on_file_double_clicked_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    int index_at(SDL_Point p) const;
    int max_scroll() const;

    std::string directory_;
    std::vector<Entry> entries_;
    int current_ = -1;
    int hover_ = -1;
    int pressed_ = -1;
    int scroll_ = 0;
    std::unique_ptr<ContextMenuPopup> menu_;
    std::function<void(ContextMenuPopup&, const Entry&)> menu_builder_{};
    std::function<void(const std::string&)> on_file_clicked_{};
    std::function<void(const std::string&)> on_file_double_clicked_{};
};

// Toolbar (back, forward, up, path breadcrumb, refresh) over a folder tree
// and, with the list view on, the files of the current folder. Without the
// list view the tree shows files too.
//
// navigate_to() records history: back and forward walk it, up goes to the
// parent folder. Folder rows offer "New Folder" and "Copy Path"; file rows
// offer "Open", "Copy Path" and "Delete".
class FileExplorer : public Widget {
public:
    static constexpr int kToolButtonSize = 32;
    static constexpr const char* kNewFolderName = "New Folder";

    // An empty root starts in the home directory.
    explicit FileExplorer(const std::string& root_path = {}, bool show_list_view = true);
    ~FileExplorer() override;

    // False when `path` is not a directory.
    bool navigate_to(const std::string& path);
    const std::string& current_path() const { return current_path_; }
    const std::string& root_path() const { return root_path_; }

    bool go_back();
    bool go_forward();
    bool go_up();
    bool can_go_back() const { return !back_.empty(); }
    bool can_go_forward() const { return !forward_.empty(); }
    // Reloads the tree from the root and the list from the current folder.
    void refresh();

    // Creates "New Folder", or "New Folder (n)" when taken, inside `parent`.
    // Returns the new path; empty on failure.
    std::string create_folder(const std::string& parent);
    bool delete_file(const std::string& path);
    bool copy_path(const std::string& path);
    std::string selected_file() const;

    bool shows_list_view() const { return list_ != nullptr; }
    FileTreeView* tree() const { return tree_; }
    FileListView* file_list() const { return list_; }
    FileBreadcrumb* breadcrumb() const { return breadcrumb_; }
    BaseButton* back_button() const { return back_button_; }
    BaseButton* forward_button() const { return forward_button_; }
    BaseButton* up_button() const { return up_button_; }
    BaseButton* refresh_button() const { return refresh_button_; }

    void set_on_file_selected(std::function<void(const std::string&)> cb) { on_file_selected_ = std::move(cb); }
    void set_on_file_double_clicked(std::function<void(const std::string&)> cb) {
        on_file_double_clicked_ = std::move(cb);
    }
    void set_on_folder_changed(std::function<void(const std::string&)> cb) { on_folder_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    // Moves to `path` without touching the history.
    void show_folder(const std::string& path);
    void update_buttons();
    void build_tree_menu(ContextMenuPopup& menu, TreeItem* item);
    void build_list_menu(ContextMenuPopup& menu, const FileListView::Entry& entry);

    std::string root_path_;
    std::string current_path_;
    std::vector<std::string> back_;
    std::vector<std::string> forward_;
    std::unique_ptr<BoxLayout> layout_;
    BaseButton* back_button_ = nullptr;
    BaseButton* forward_button_ = nullptr;
    BaseButton* up_button_ = nullptr;
    BaseButton* refresh_button_ = nullptr;
    FileBreadcrumb* breadcrumb_ = nullptr;
    FileTreeView* tree_ = nullptr;
    FileListView* list_ = nullptr;
    std::function<void(const std::string&)> on_file_selected_{};
    std::function<void(const std::string&)> on_file_double_clicked_{};
    std::function<void(const std::string&)> on_folder_changed_{};
};
