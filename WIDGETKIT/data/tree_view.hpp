#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "base/controls.hpp"
#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class ContextMenuPopup;

// Node of a TreeView. Items are owned by their parent item, top-level items
// by the view.
class TreeItem {
public:
    TreeItem(const std::string& text, TreeItem* parent) : text_(text), parent_(parent) {}

    const std::string& text() const { return text_; }
    void set_text(const std::string& t) { text_ = t; }
    const std::string& icon() const { return icon_; }
    void set_icon(const std::string& icon) { icon_ = icon; }
    const nlohmann::json& data() const { return data_; }
    void set_data(const nlohmann::json& d) { data_ = d; }
    // "python", "image", ... for file rows; empty otherwise.
    const std::string& file_type() const { return file_type_; }

    TreeItem* parent() const { return parent_; }
    int child_count() const { return static_cast<int>(children_.size()); }
    TreeItem* child(int i) const;
    int index_of(const TreeItem* child) const;
    int depth() const;

    bool is_folder() const { return folder_ || !children_.empty(); }
    bool is_expanded() const { return expanded_; }
    bool is_hidden() const { return hidden_; }
    CheckState check_state() const { return check_; }

private:
    friend class TreeView;
    friend class FileTreeView;

    std::string text_;
    std::string icon_;
    std::string file_type_;
    nlohmann::json data_;
    TreeItem* parent_;
    std::vector<std::unique_ptr<TreeItem>> children_;
    bool folder_ = false;
    bool expanded_ = false;
    bool hidden_ = false;
    // Opened by the filter; closed again when the filter no longer needs it.
    bool filter_expanded_ = false;
    // Folder whose children are read on first expand.
    bool lazy_ = false;
    CheckState check_ = CheckState::Unchecked;
};

// Tree with a search bar, keyboard navigation and a context menu.
//
// Rows expand with a click on the arrow or a double click. Right click opens
// the context menu: "Expand All", "Collapse All", then "Add Folder" and
// "Add File" on folders or "Rename" on files, then "Delete".
class TreeView : public Widget {
public:
    static constexpr int kRowHeight = 28;
    static constexpr int kIndent = 20;
    static constexpr int kArrowSize = 16;
    static constexpr int kWheelStep = 40;

    explicit TreeView(bool searchable = true);
    ~TreeView() override;

    TreeItem* add_item(const std::string& text, TreeItem* parent = nullptr, const std::string& icon = {},
                       const nlohmann::json& data = nullptr);
    TreeItem* add_folder(const std::string& text, TreeItem* parent = nullptr);
    TreeItem* add_file(const std::string& text, TreeItem* parent = nullptr, const std::string& file_type = "default");
    bool remove_item(TreeItem* item);
    void clear_tree();

    int top_level_count() const { return static_cast<int>(roots_.size()); }
    TreeItem* top_level_item(int i) const;
    // First item with the text, depth first.
    TreeItem* find_item(const std::string& text) const;

    void set_expanded(TreeItem* item, bool expanded);
    void expand_all();
    void collapse_all();
    void expand_recursive(TreeItem* item);
    void collapse_recursive(TreeItem* item);

    void set_current_item(TreeItem* item);
    TreeItem* current_item() const { return current_; }

    // Case-insensitive substring filter. Parents of matches stay visible and
    // are expanded; clearing the filter restores the expansion they had.
    void filter(const std::string& query);
    const std::string& filter_text() const { return filter_; }
    TextBox* search_box() const { return search_; }

    void set_checkable(bool checkable) { checkable_ = checkable; }
    bool is_checkable() const { return checkable_; }
    void set_check_state(TreeItem* item, CheckState state);
    std::vector<TreeItem*> checked_items() const;

    // Rows currently shown, top to bottom.
    std::vector<TreeItem*> visible_items() const;
    SDL_Rect item_rect(const TreeItem* item) const;
    SDL_Rect arrow_rect(const TreeItem* item) const;
    SDL_Rect check_rect(const TreeItem* item) const;

    void show_context_menu(TreeItem* item, int x, int y);
    ContextMenuPopup* context_menu() const { return menu_.get(); }
    // Fills the context menu in place of the default actions.
    void set_context_menu_builder(std::function<void(ContextMenuPopup&, TreeItem*)> cb) {
        menu_builder_ = std::move(cb);
    }
    // Inline editor over the row; Enter commits, Escape cancels.
    void rename_item(TreeItem* item);
    bool is_renaming() const { return renaming_ != nullptr; }
    TextBox* rename_editor() const { return editor_.get(); }

    void set_on_item_clicked(std::function<void(TreeItem*)> cb) { on_item_clicked_ = std::move(cb); }
    void set_on_item_double_clicked(std::function<void(TreeItem*)> cb) { on_item_double_clicked_ = std::move(cb); }
    void set_on_item_expanded(std::function<void(TreeItem*)> cb) { on_item_expanded_ = std::move(cb); }
    void set_on_item_collapsed(std::function<void(TreeItem*)> cb) { on_item_collapsed_ = std::move(cb); }
    void set_on_item_renamed(std::function<void(TreeItem*)> cb) { on_item_renamed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    // Runs before a folder opens.
    virtual void before_expand(TreeItem*) {}
    // Runs after the user or set_check_state changed an item.
    virtual void check_changed(TreeItem*) {}
    // Sets the state without notifying.
    void assign_check_state(TreeItem* item, CheckState state) { item->check_ = state; }
    TreeItem* append(TreeItem* parent, std::unique_ptr<TreeItem> item);
    void remove_children(TreeItem* item);

private:
    bool filter_item(TreeItem* item, const std::string& query);
    void collect_visible(const std::vector<std::unique_ptr<TreeItem>>& items, std::vector<TreeItem*>& out) const;
    void forget(const TreeItem* item);
    bool contains(const TreeItem* ancestor, const TreeItem* item) const;
    SDL_Rect list_area() const;
    int max_scroll() const;
    void ensure_visible(const TreeItem* item);
    TreeItem* item_at(SDL_Point p) const;
    bool handle_key(const SDL_Event& e);
    void finish_rename(bool commit);

    std::unique_ptr<BoxLayout> search_bar_;
    TextBox* search_ = nullptr;
    BaseButton* clear_button_ = nullptr;
    std::vector<std::unique_ptr<TreeItem>> roots_;
    std::string filter_;
    bool checkable_ = false;
    TreeItem* current_ = nullptr;
    TreeItem* hover_item_ = nullptr;
    TreeItem* pressed_ = nullptr;
    bool focused_ = false;
    int scroll_ = 0;
    std::unique_ptr<ContextMenuPopup> menu_;
    TreeItem* menu_target_ = nullptr;
    std::unique_ptr<TextBox> editor_;
    TreeItem* renaming_ = nullptr;
    std::function<void(TreeItem*)> on_item_clicked_{};
    std::function<void(TreeItem*)> on_item_double_clicked_{};
    std::function<void(TreeItem*)> on_item_expanded_{};
    std::function<void(TreeItem*)> on_item_collapsed_{};
    std::function<void(TreeItem*)> on_item_renamed_{};
    std::function<void(ContextMenuPopup&, TreeItem*)> menu_builder_{};
};

// Every item has a check box. Checking an item checks its whole subtree;
// parents show Checked, Partial or Unchecked from their children.
class CheckableTreeView : public TreeView {
public:
    explicit CheckableTreeView(bool searchable = true);

    void set_on_items_checked(std::function<void(const std::vector<TreeItem*>&)> cb) {
        on_items_checked_ = std::move(cb);
    }

protected:
    void check_changed(TreeItem* item) override;

private:
    void update_children(TreeItem* item);
    void update_parents(TreeItem* item);

    std::function<void(const std::vector<TreeItem*>&)> on_items_checked_{};
};

// Directory browser. Sub-folders are read when first expanded; item data
// holds the full path.
class FileTreeView : public TreeView {
public:
    static constexpr const char* kPlaceholder = "Loading...";

    explicit FileTreeView(const std::string& root_path = {});

    // Replaces the tree with `path` as its expanded root. False when the
    // path is not a readable directory.
    bool load_directory(const std::string& path);
    const std::string& root_path() const { return root_path_; }
    // Folders only when off. Applies from the next load.
    void set_show_files(bool show) { show_files_ = show; }
    bool shows_files() const { return show_files_; }
    // ".py" -> "python", unknown -> "default". Case-insensitive.
    static std::string file_type(const std::string& extension);

protected:
    void before_expand(TreeItem* item) override;

private:
    void populate(TreeItem* folder, const std::string& path);

    std::string root_path_;
    bool show_files_ = true;
};
