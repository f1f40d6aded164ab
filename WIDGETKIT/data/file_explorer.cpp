#include "file_explorer.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "base/base_button.hpp"
#include "base/base_popup.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/layout.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "data/tree_view.hpp"
#include "navigation/breadcrumb_bar.hpp"
#include "style/theme_manager.hpp"

namespace fs = std::filesystem;

namespace {
constexpr int kRowPad = 4;
constexpr int kIconSize = 18;
constexpr int kGap = 8;
constexpr int kMinRows = 6;
constexpr float kDisabledAlpha = 0.5f;

std::string home_directory() {
    for (const char* var : { "HOME", "USERPROFILE" }) {
        const char* value = std::getenv(var);
        if (value && *value) return value;
    }
    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

// "/a/b/" -> "/a/b"; the root keeps its separator.
std::string normalized(const std::string& path) {
    fs::path p = fs::path(path).lexically_normal();
    if (!p.has_filename() && p != p.root_path()) p = p.parent_path();
    return p.string();
}

std::unique_ptr<BaseButton> tool_button(const std::string& text, const std::string& tip) {
    auto b = std::make_unique<BaseButton>(text, ButtonVariant::Secondary, ButtonSize::Small);
    b->set_fixed_size(FileExplorer::kToolButtonSize, FileExplorer::kToolButtonSize);
    b->set_tooltip(tip);
    return b;
}
}

FileListView::FileListView() = default;

FileListView::~FileListView() = default;

bool FileListView::load_directory(const std::string& path) {
    clear();
    directory_ = path;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        std::cerr << "[FileListView] Cannot read " << path << ": " << ec.message() << "\n";
        return false;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        Entry entry;
        entry.name = it->path().filename().string();
        entry.path = it->path().string();
        entry.file_type = FileTreeView::file_type(it->path().extension().string());
        entries_.push_back(entry);
    }
    std::sort(entries_.begin(), entries_.end(), [](const Entry& a, const Entry& b) { return a.name < b.name; });
    layout();
    return true;
}

void FileListView::clear() {
    entries_.clear();
    current_ = -1;
    hover_ = -1;
    pressed_ = -1;
    scroll_ = 0;
}

int FileListView::index_of(const std::string& name) const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].name == name) return static_cast<int>(i);
    }
    return -1;
}

void FileListView::set_current_index(int index) {
    if (index < -1 || index >= static_cast<int>(entries_.size())) return;
    current_ = index;
}

std::string FileListView::selected_path() const {
    if (current_ < 0 || current_ >= static_cast<int>(entries_.size())) return {};
    return entries_[static_cast<size_t>(current_)].path;
}

SDL_Rect FileListView::row_rect(int index) const {
    if (index < 0 || index >= static_cast<int>(entries_.size())) return SDL_Rect{ 0, 0, 0, 0 };
    const SDL_Rect row{ rect_.x + 1, rect_.y + kRowPad + index * kRowHeight - scroll_, rect_.w - 2, kRowHeight };
    return wk_draw::intersect(row, rect_);
}

int FileListView::index_at(SDL_Point p) const {
    if (!wk::point_in(rect_, p)) return -1;
    const int offset = p.y - rect_.y - kRowPad + scroll_;
    if (offset < 0) return -1;
    const int index = offset / kRowHeight;
    return index < static_cast<int>(entries_.size()) ? index : -1;
}

int FileListView::max_scroll() const {
    const int content = static_cast<int>(entries_.size()) * kRowHeight + 2 * kRowPad;
    return std::max(0, content - rect_.h);
}

void FileListView::show_context_menu(int index, int x, int y) {
    if (index < 0 || index >= static_cast<int>(entries_.size())) return;
    menu_ = std::make_unique<ContextMenuPopup>();
    const Entry entry = entries_[static_cast<size_t>(index)];
    if (menu_builder_) {
        menu_builder_(*menu_, entry);
    } else {
        menu_->add_action("Open", [this, entry]() {
            if (on_file_double_clicked_) on_file_double_clicked_(entry.path);
        }, "file");
    }
    menu_->show_at_position(x, y);
}

void FileListView::layout() {
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
}

int FileListView::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : 320;
}

int FileListView::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int rows = std::max(kMinRows, static_cast<int>(entries_.size()));
    return rows * kRowHeight + 2 * kRowPad;
}

bool FileListView::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        hover_ = index_at(wk::event_point(e));
        return false;
    }
    if (e.type == SDL_MOUSEWHEEL) {
        if (!hovered_ || max_scroll() == 0) return false;
        scroll_ = std::max(0, std::min(max_scroll(), scroll_ - e.wheel.y * kWheelStep));
        return true;
    }
    if (e.type == SDL_MOUSEBUTTONDOWN) {
        const SDL_Point p = wk::event_point(e);
        if (!wk::point_in(rect_, p)) return false;
        const int index = index_at(p);
        if (index < 0) return true;
        current_ = index;
        if (e.button.button == SDL_BUTTON_RIGHT) {
            show_context_menu(index, p.x, p.y);
            return true;
        }
        if (e.button.button != SDL_BUTTON_LEFT) return true;
        if (e.button.clicks >= 2) {
            pressed_ = -1;
            if (on_file_double_clicked_) on_file_double_clicked_(entries_[static_cast<size_t>(index)].path);
        } else {
            pressed_ = index;
        }
        return true;
    }
    if (wk::is_left_release(e)) {
        const int index = pressed_;
        pressed_ = -1;
        if (index < 0) return false;
        if (index_at(wk::event_point(e)) == index && on_file_clicked_) {
            on_file_clicked_(entries_[static_cast<size_t>(index)].path);
        }
        return true;
    }
    return false;
}

void FileListView::update() {
    if (menu_ && !menu_->is_visible() && !OverlayManager::instance().is_open(menu_.get())) menu_.reset();
}

void FileListView::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int radius = tm.border_radius("md");
    wk_draw::fill_rounded_rect(r, rect_, radius, tm.color("surface"), alpha);
    wk_draw::draw_rounded_rect(r, rect_, radius, tm.color("border"), alpha);

    wk_draw::ClipScope clip(r, wk_draw::inset(rect_, 1, 1));
    const SDL_Color white = wk::rgba(255, 255, 255);
    for (size_t i = 0; i < entries_.size(); ++i) {
        const int index = static_cast<int>(i);
        const SDL_Rect row{ rect_.x + 1, rect_.y + kRowPad + index * kRowHeight - scroll_, rect_.w - 2, kRowHeight };
        if (row.y + row.h < rect_.y || row.y > rect_.y + rect_.h) continue;
        const bool selected = index == current_;
        if (selected) {
            wk_draw::fill_rect(r, wk_draw::inset(row, 2, 1), tm.color("primary"), alpha);
        } else if (index == hover_) {
            wk_draw::fill_rect(r, wk_draw::inset(row, 2, 1), tm.color("hover"), alpha);
        }
        const SDL_Rect icon{ row.x + kGap, row.y + (row.h - kIconSize) / 2, kIconSize, kIconSize };
        wk_icons::draw(r, "file", icon, selected ? white : tm.color("text_secondary"), alpha);
        LabelStyle st = Styles::Label("default", "text");
        if (selected) st.color = white;
        const int x = icon.x + kIconSize + kGap;
        const SDL_Rect text_area{ x, row.y, std::max(0, row.x + row.w - x - kGap), row.h };
        wk_text::draw_in_rect(r, st, wk_text::elide(st, entries_[i].name, text_area.w), text_area,
                              wk_text::Align::Left, alpha);
    }
}

FileExplorer::FileExplorer(const std::string& root_path, bool show_list_view)
    : root_path_(normalized(root_path.empty() ? home_directory() : root_path)),
      layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8)) {
    layout_->set_parent(this);

    auto toolbar = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    toolbar->set_margins(8, 4, 8, 4);
    toolbar->set_alignment(BoxLayout::Align::Center);
    back_button_ = toolbar->add_widget(tool_button("\xE2\x86\x90", "Go back"));
    back_button_->set_on_clicked([this]() { go_back(); });
    forward_button_ = toolbar->add_widget(tool_button("\xE2\x86\x92", "Go forward"));
    forward_button_->set_on_clicked([this]() { go_forward(); });
    up_button_ = toolbar->add_widget(tool_button("\xE2\x86\x91", "Go up"));
    up_button_->set_on_clicked([this]() { go_up(); });
    breadcrumb_ = toolbar->add_widget(std::make_unique<FileBreadcrumb>(), 1);
    breadcrumb_->set_on_path_clicked([this](int, const std::string&) { navigate_to(breadcrumb_->file_path()); });
    refresh_button_ = toolbar->add_widget(tool_button({}, "Refresh"));
    refresh_button_->set_icon("refresh");
    refresh_button_->set_on_clicked([this]() { refresh(); });
    layout_->add_widget(std::move(toolbar));

    auto content = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    tree_ = content->add_widget(std::make_unique<FileTreeView>(), 1);
    tree_->set_show_files(!show_list_view);
    tree_->set_on_item_clicked([this](TreeItem* item) {
        if (!item->data().is_string()) return;
        const std::string path = item->data().get<std::string>();
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            navigate_to(path);
        } else if (on_file_selected_) {
            on_file_selected_(path);
        }
    });
    tree_->set_on_item_double_clicked([this](TreeItem* item) {
        if (!item->data().is_string() || item->is_folder()) return;
        if (on_file_double_clicked_) on_file_double_clicked_(item->data().get<std::string>());
    });
    tree_->set_context_menu_builder([this](ContextMenuPopup& menu, TreeItem* item) { build_tree_menu(menu, item); });
    if (show_list_view) {
        list_ = content->add_widget(std::make_unique<FileListView>(), 2);
        list_->set_on_file_clicked([this](const std::string& path) {
            if (on_file_selected_) on_file_selected_(path);
        });
        list_->set_on_file_double_clicked([this](const std::string& path) {
            if (on_file_double_clicked_) on_file_double_clicked_(path);
        });
        list_->set_context_menu_builder(
            [this](ContextMenuPopup& menu, const FileListView::Entry& entry) { build_list_menu(menu, entry); });
    }
    layout_->add_widget(std::move(content), 1);

    tree_->load_directory(root_path_);
    current_path_ = root_path_;
    breadcrumb_->set_file_path(current_path_);
    if (list_) list_->load_directory(current_path_);
    update_buttons();
}

FileExplorer::~FileExplorer() = default;

bool FileExplorer::navigate_to(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::is_directory(path, ec)) {
        std::cerr << "[FileExplorer] Not a directory: " << path << "\n";
        return false;
    }
    const std::string target = normalized(path);
    if (target == current_path_) return true;
    back_.push_back(current_path_);
    forward_.clear();
    show_folder(target);
    return true;
}

bool FileExplorer::go_back() {
    if (back_.empty()) return false;
    forward_.push_back(current_path_);
    const std::string path = back_.back();
    back_.pop_back();
    show_folder(path);
    return true;
}

bool FileExplorer::go_forward() {
    if (forward_.empty()) return false;
    back_.push_back(current_path_);
    const std::string path = forward_.back();
    forward_.pop_back();
    show_folder(path);
    return true;
}

bool FileExplorer::go_up() {
    const std::string parent = fs::path(current_path_).parent_path().string();
    if (parent.empty() || parent == current_path_) return false;
    return navigate_to(parent);
}

void FileExplorer::show_folder(const std::string& path) {
    current_path_ = path;
    breadcrumb_->set_file_path(path);
    if (list_) list_->load_directory(path);
    update_buttons();
    layout();
    if (on_folder_changed_) on_folder_changed_(path);
}

void FileExplorer::update_buttons() {
    back_button_->set_enabled(can_go_back());
    forward_button_->set_enabled(can_go_forward());
    const std::string parent = fs::path(current_path_).parent_path().string();
    up_button_->set_enabled(!parent.empty() && parent != current_path_);
}

void FileExplorer::refresh() {
    tree_->load_directory(root_path_);
    if (list_) list_->load_directory(current_path_);
    layout();
}

std::string FileExplorer::create_folder(const std::string& parent) {
    const fs::path base(parent);
    fs::path target = base / kNewFolderName;
    std::error_code ec;
    for (int n = 1; fs::exists(target, ec); ++n) {
        target = base / (std::string(kNewFolderName) + " (" + std::to_string(n) + ")");
    }
    if (!fs::create_directory(target, ec) || ec) {
        std::cerr << "[FileExplorer] Could not create folder " << target.string() << ": " << ec.message() << "\n";
        return {};
    }
    refresh();
    return target.string();
}

bool FileExplorer::delete_file(const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        std::cerr << "[FileExplorer] Not deleting folder " << path << "\n";
        return false;
    }
    if (!fs::remove(path, ec) || ec) {
        std::cerr << "[FileExplorer] Could not delete file " << path << ": "
                  << (ec ? ec.message() : std::string("no such file")) << "\n";
        return false;
    }
    refresh();
    return true;
}

bool FileExplorer::copy_path(const std::string& path) {
    if (SDL_SetClipboardText(path.c_str()) != 0) {
        SDL_Log("Unable to set clipboard text: %s", SDL_GetError());
        return false;
    }
    return true;
}

std::string FileExplorer::selected_file() const {
    if (list_) return list_->selected_path();
    const TreeItem* item = tree_->current_item();
    if (!item || item->is_folder() || !item->data().is_string()) return {};
    return item->data().get<std::string>();
}

void FileExplorer::build_tree_menu(ContextMenuPopup& menu, TreeItem* item) {
    if (!item->data().is_string()) return;
    const std::string path = item->data().get<std::string>();
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        menu.add_action("New Folder", [this, path]() { create_folder(path); }, "folder");
    } else {
        menu.add_action("Open", [this, path]() {
            if (on_file_double_clicked_) on_file_double_clicked_(path);
        }, "file");
    }
    menu.add_separator();
    menu.add_action("Copy Path", [this, path]() { copy_path(path); }, "copy");
    if (!item->is_folder()) menu.add_action("Delete", [this, path]() { delete_file(path); }, "trash");
}

void FileExplorer::build_list_menu(ContextMenuPopup& menu, const FileListView::Entry& entry) {
    const std::string path = entry.path;
    menu.add_action("Open", [this, path]() {
        if (on_file_double_clicked_) on_file_double_clicked_(path);
    }, "file");
    menu.add_separator();
    menu.add_action("Copy Path", [this, path]() { copy_path(path); }, "copy");
    menu.add_action("Delete", [this, path]() { delete_file(path); }, "trash");
}

int FileExplorer::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : std::max(600, layout_->preferred_width());
}

int FileExplorer::height_for_width(int w) const {
    return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w);
}

void FileExplorer::layout() { layout_->set_rect(rect_); }

bool FileExplorer::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void FileExplorer::update() { layout_->update(); }

void FileExplorer::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}
