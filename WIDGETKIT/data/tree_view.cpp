#include "tree_view.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <map>
#include <system_error>

#include "base/base_button.hpp"
#include "base/base_popup.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace fs = std::filesystem;

namespace {
constexpr int kSearchGap = 8;
constexpr int kRowPad = 4;
constexpr int kCheckSize = 16;
constexpr int kIconSize = 16;
constexpr int kGap = 6;
constexpr int kMinListHeight = 4 * TreeView::kRowHeight;
constexpr float kDisabledAlpha = 0.5f;

bool rect_empty(const SDL_Rect& r) { return r.w <= 0 || r.h <= 0; }

SDL_Color file_color(const std::string& type) {
    const auto& tm = ThemeManager::instance();
    if (type == "python" || type == "javascript") return tm.color("warning");
    if (type == "html" || type == "css" || type == "xml") return tm.color("info");
    if (type == "image") return tm.color("success");
    if (type == "pdf") return tm.color("danger");
    if (type == "document" || type == "markdown") return tm.color("primary");
    return tm.color("text_secondary");
}
}

TreeItem* TreeItem::child(int i) const {
    if (i < 0 || i >= child_count()) return nullptr;
    return children_[static_cast<size_t>(i)].get();
}

int TreeItem::index_of(const TreeItem* c) const {
    for (size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].get() == c) return static_cast<int>(i);
    }
    return -1;
}

int TreeItem::depth() const {
    int d = 0;
    for (const TreeItem* p = parent_; p; p = p->parent_) ++d;
    return d;
}

TreeView::TreeView(bool searchable) {
    if (!searchable) return;
    search_bar_ = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    search_bar_->set_parent(this);
    search_bar_->set_alignment(BoxLayout::Align::Center);
    search_ = search_bar_->add_widget(std::make_unique<TextBox>("", "Search..."), 1);
    search_->set_on_text_changed([this](const std::string& text) { filter(text); });
    clear_button_ = search_bar_->add_widget(std::make_unique<BaseButton>("Clear", ButtonVariant::Secondary, ButtonSize::Small));
    clear_button_->set_on_clicked([this]() { search_->clear(); });
}

TreeView::~TreeView() = default;

TreeItem* TreeView::append(TreeItem* parent, std::unique_ptr<TreeItem> item) {
    TreeItem* raw = item.get();
    if (parent) {
        parent->children_.push_back(std::move(item));
    } else {
        roots_.push_back(std::move(item));
    }
    if (checkable_ && parent && parent->check_ == CheckState::Checked) raw->check_ = CheckState::Checked;
    layout();
    return raw;
}

TreeItem* TreeView::add_item(const std::string& text, TreeItem* parent, const std::string& icon,
                             const nlohmann::json& data) {
    auto item = std::make_unique<TreeItem>(text, parent);
    item->icon_ = icon;
    item->data_ = data;
    return append(parent, std::move(item));
}

TreeItem* TreeView::add_folder(const std::string& text, TreeItem* parent) {
    TreeItem* item = add_item(text, parent, "folder");
    item->folder_ = true;
    return item;
}

TreeItem* TreeView::add_file(const std::string& text, TreeItem* parent, const std::string& file_type) {
    TreeItem* item = add_item(text, parent, "file");
    item->file_type_ = file_type;
    return item;
}

bool TreeView::contains(const TreeItem* ancestor, const TreeItem* item) const {
    for (const TreeItem* p = item; p; p = p->parent()) {
        if (p == ancestor) return true;
    }
    return false;
}

void TreeView::forget(const TreeItem* item) {
    if (current_ && contains(item, current_)) current_ = nullptr;
    if (hover_item_ && contains(item, hover_item_)) hover_item_ = nullptr;
    if (pressed_ && contains(item, pressed_)) pressed_ = nullptr;
    if (renaming_ && contains(item, renaming_)) finish_rename(false);
    if (menu_target_ && contains(item, menu_target_)) {
        menu_target_ = nullptr;
        if (menu_) menu_->close();
    }
}

bool TreeView::remove_item(TreeItem* item) {
    if (!item) return false;
    auto& siblings = item->parent() ? item->parent()->children_ : roots_;
    auto it = std::find_if(siblings.begin(), siblings.end(),
                           [item](const std::unique_ptr<TreeItem>& c) { return c.get() == item; });
    if (it == siblings.end()) return false;
    forget(item);
    siblings.erase(it);
    layout();
    return true;
}

void TreeView::remove_children(TreeItem* item) {
    for (const auto& c : item->children_) forget(c.get());
    item->children_.clear();
    layout();
}

void TreeView::clear_tree() {
    for (const auto& r : roots_) forget(r.get());
    roots_.clear();
    scroll_ = 0;
    layout();
}

TreeItem* TreeView::top_level_item(int i) const {
    if (i < 0 || i >= top_level_count()) return nullptr;
    return roots_[static_cast<size_t>(i)].get();
}

TreeItem* TreeView::find_item(const std::string& text) const {
    std::vector<TreeItem*> stack;
    for (auto it = roots_.rbegin(); it != roots_.rend(); ++it) stack.push_back(it->get());
    while (!stack.empty()) {
        TreeItem* item = stack.back();
        stack.pop_back();
        if (item->text() == text) return item;
        for (auto it = item->children_.rbegin(); it != item->children_.rend(); ++it) stack.push_back(it->get());
    }
    return nullptr;
}

void TreeView::set_expanded(TreeItem* item, bool expanded) {
    if (!item) return;
    item->filter_expanded_ = false;
    if (item->expanded_ == expanded) return;
    if (expanded) {
        before_expand(item);
        if (!item->is_folder()) return;
    }
    item->expanded_ = expanded;
    if (!expanded && current_ && current_ != item && contains(item, current_)) current_ = item;
    layout();
    if (expanded && on_item_expanded_) on_item_expanded_(item);
    if (!expanded && on_item_collapsed_) on_item_collapsed_(item);
}

// Folders that have not been read yet stay closed.
void TreeView::expand_recursive(TreeItem* item) {
    if (!item || item->lazy_) return;
    set_expanded(item, true);
    for (const auto& c : item->children_) expand_recursive(c.get());
}

void TreeView::collapse_recursive(TreeItem* item) {
    if (!item) return;
    for (const auto& c : item->children_) collapse_recursive(c.get());
    set_expanded(item, false);
}

void TreeView::expand_all() {
    for (const auto& r : roots_) expand_recursive(r.get());
}

void TreeView::collapse_all() {
    for (const auto& r : roots_) collapse_recursive(r.get());
}

void TreeView::set_current_item(TreeItem* item) {
    current_ = item;
    if (item) ensure_visible(item);
}

bool TreeView::filter_item(TreeItem* item, const std::string& query) {
    const bool match = wk_text::to_lower(item->text()).find(query) != std::string::npos;
    bool child_match = false;
    for (const auto& c : item->children_) {
        if (filter_item(c.get(), query)) child_match = true;
    }
    const bool show = match || child_match || query.empty();
    item->hidden_ = !show;
    if (child_match && !query.empty()) {
        if (!item->expanded_) {
            item->expanded_ = true;
            item->filter_expanded_ = true;
        }
    } else if (item->filter_expanded_) {
        item->expanded_ = false;
        item->filter_expanded_ = false;
    }
    return show;
}

void TreeView::filter(const std::string& query) {
    filter_ = query;
    const std::string q = wk_text::to_lower(query);
    for (const auto& r : roots_) filter_item(r.get(), q);
    const std::vector<TreeItem*> rows = visible_items();
    if (current_ && std::find(rows.begin(), rows.end(), current_) == rows.end()) current_ = nullptr;
    scroll_ = 0;
    layout();
}

void TreeView::set_check_state(TreeItem* item, CheckState state) {
    if (!item || item->check_ == state) return;
    item->check_ = state;
    check_changed(item);
}

std::vector<TreeItem*> TreeView::checked_items() const {
    std::vector<TreeItem*> out;
    std::function<void(const TreeItem*)> collect = [&out, &collect](const TreeItem* item) {
        if (item->check_state() == CheckState::Checked) out.push_back(const_cast<TreeItem*>(item));
        for (int i = 0; i < item->child_count(); ++i) collect(item->child(i));
    };
    for (const auto& r : roots_) collect(r.get());
    return out;
}

void TreeView::collect_visible(const std::vector<std::unique_ptr<TreeItem>>& items, std::vector<TreeItem*>& out) const {
    for (const auto& c : items) {
        if (c->hidden_) continue;
        out.push_back(c.get());
        if (c->expanded_) collect_visible(c->children_, out);
    }
}

std::vector<TreeItem*> TreeView::visible_items() const {
    std::vector<TreeItem*> out;
    collect_visible(roots_, out);
    return out;
}

SDL_Rect TreeView::list_area() const {
    if (!search_bar_) return rect_;
    const int top = search_bar_->rect().h + kSearchGap;
    return SDL_Rect{ rect_.x, rect_.y + top, rect_.w, std::max(0, rect_.h - top) };
}

int TreeView::max_scroll() const {
    const int content = static_cast<int>(visible_items().size()) * kRowHeight + 2 * kRowPad;
    return std::max(0, content - list_area().h);
}

SDL_Rect TreeView::item_rect(const TreeItem* item) const {
    const std::vector<TreeItem*> rows = visible_items();
    auto it = std::find(rows.begin(), rows.end(), item);
    if (it == rows.end()) return SDL_Rect{ 0, 0, 0, 0 };
    const SDL_Rect area = list_area();
    const int index = static_cast<int>(it - rows.begin());
    return SDL_Rect{ area.x + 1, area.y + kRowPad + index * kRowHeight - scroll_, area.w - 2, kRowHeight };
}

SDL_Rect TreeView::arrow_rect(const TreeItem* item) const {
    const SDL_Rect row = item_rect(item);
    if (rect_empty(row) || !item->is_folder()) return SDL_Rect{ 0, 0, 0, 0 };
    const int x = row.x + kRowPad + item->depth() * kIndent;
    return SDL_Rect{ x, row.y + (row.h - kArrowSize) / 2, kArrowSize, kArrowSize };
}

SDL_Rect TreeView::check_rect(const TreeItem* item) const {
    const SDL_Rect row = item_rect(item);
    if (rect_empty(row) || !checkable_) return SDL_Rect{ 0, 0, 0, 0 };
    const int x = row.x + kRowPad + item->depth() * kIndent + kArrowSize + kGap;
    return SDL_Rect{ x, row.y + (row.h - kCheckSize) / 2, kCheckSize, kCheckSize };
}

void TreeView::ensure_visible(const TreeItem* item) {
    const SDL_Rect row = item_rect(item);
    if (rect_empty(row)) return;
    const SDL_Rect area = list_area();
    if (row.y < area.y) {
        scroll_ -= area.y - row.y;
    } else if (row.y + row.h > area.y + area.h) {
        scroll_ += row.y + row.h - (area.y + area.h);
    }
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
}

TreeItem* TreeView::item_at(SDL_Point p) const {
    const SDL_Rect area = list_area();
    if (!wk::point_in(area, p)) return nullptr;
    const int index = (p.y - area.y - kRowPad + scroll_) / kRowHeight;
    if (p.y - area.y - kRowPad + scroll_ < 0) return nullptr;
    const std::vector<TreeItem*> rows = visible_items();
    return index < static_cast<int>(rows.size()) ? rows[static_cast<size_t>(index)] : nullptr;
}

void TreeView::show_context_menu(TreeItem* item, int x, int y) {
    if (!item) return;
    menu_ = std::make_unique<ContextMenuPopup>();
    menu_target_ = item;
    if (menu_builder_) {
        menu_builder_(*menu_, item);
    } else {
        menu_->add_action("Expand All", [this, item]() { expand_recursive(item); });
        menu_->add_action("Collapse All", [this, item]() { collapse_recursive(item); });
        menu_->add_separator();
        if (item->is_folder()) {
            menu_->add_action("Add Folder", [this, item]() {
                add_folder("New Folder " + std::to_string(item->child_count() + 1), item);
                set_expanded(item, true);
            }, "folder");
            menu_->add_action("Add File", [this, item]() {
                add_file("New File " + std::to_string(item->child_count() + 1) + ".txt", item, "text");
                set_expanded(item, true);
            }, "file");
        } else {
            menu_->add_action("Rename", [this, item]() { rename_item(item); }, "edit");
        }
        menu_->add_separator();
        menu_->add_action("Delete", [this, item]() { remove_item(item); }, "trash");
    }
    menu_->set_on_closed([this]() { menu_target_ = nullptr; });
    menu_->show_at_position(x, y);
}

void TreeView::rename_item(TreeItem* item) {
    const SDL_Rect row = item_rect(item);
    if (!item || rect_empty(row)) return;
    renaming_ = item;
    editor_ = std::make_unique<TextBox>(item->text());
    editor_->set_parent(this);
    editor_->set_on_submitted([this](const std::string&) { finish_rename(true); });
    editor_->set_on_escape([this]() { finish_rename(false); });
    const int x = check_rect(item).w > 0 ? check_rect(item).x + kCheckSize + kGap
                                         : row.x + kRowPad + item->depth() * kIndent + kArrowSize + kGap;
    const int h = editor_->height_for_width(row.w);
    editor_->set_rect(SDL_Rect{ x, row.y + (row.h - h) / 2, std::max(40, row.x + row.w - x - kRowPad), h });
    editor_->set_focus(true);
    editor_->set_caret(item->text().size());
}

// The editor is released in update(); this can run inside its callbacks.
void TreeView::finish_rename(bool commit) {
    TreeItem* item = renaming_;
    renaming_ = nullptr;
    if (!item || !editor_) return;
    editor_->set_focus(false);
    editor_->hide();
    const std::string text = wk_text::trim(editor_->text());
    if (commit && !text.empty() && text != item->text()) {
        item->text_ = text;
        if (on_item_renamed_) on_item_renamed_(item);
    }
}

void TreeView::layout() {
    if (search_bar_) {
        search_bar_->set_rect(SDL_Rect{ rect_.x, rect_.y, rect_.w, search_bar_->height_for_width(rect_.w) });
    }
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
}

int TreeView::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max(240, search_bar_ ? search_bar_->preferred_width() : 0);
}

int TreeView::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int search = search_bar_ ? search_bar_->height_for_width(w) + kSearchGap : 0;
    const int rows = static_cast<int>(visible_items().size()) * kRowHeight + 2 * kRowPad;
    return search + std::max(kMinListHeight, rows);
}

bool TreeView::handle_key(const SDL_Event& e) {
    const std::vector<TreeItem*> rows = visible_items();
    if (rows.empty()) return false;
    auto it = std::find(rows.begin(), rows.end(), current_);
    const int index = it == rows.end() ? -1 : static_cast<int>(it - rows.begin());
    const int last = static_cast<int>(rows.size()) - 1;
    switch (e.key.keysym.sym) {
    case SDLK_DOWN:
        set_current_item(rows[static_cast<size_t>(std::min(last, index + 1))]);
        return true;
    case SDLK_UP:
        set_current_item(rows[static_cast<size_t>(std::max(0, index - 1))]);
        return true;
    case SDLK_HOME:
        set_current_item(rows.front());
        return true;
    case SDLK_END:
        set_current_item(rows.back());
        return true;
    case SDLK_RIGHT:
        if (!current_) return false;
        if (current_->is_folder() && !current_->expanded_) {
            set_expanded(current_, true);
        } else if (current_->expanded_ && index < last && rows[static_cast<size_t>(index + 1)]->parent() == current_) {
            set_current_item(rows[static_cast<size_t>(index + 1)]);
        }
        return true;
    case SDLK_LEFT:
        if (!current_) return false;
        if (current_->expanded_) {
            set_expanded(current_, false);
        } else if (current_->parent()) {
            set_current_item(current_->parent());
        }
        return true;
    case SDLK_RETURN:
    case SDLK_KP_ENTER:
        if (!current_) return false;
        if (current_->is_folder()) set_expanded(current_, !current_->expanded_);
        if (on_item_double_clicked_) on_item_double_clicked_(current_);
        return true;
    case SDLK_SPACE:
        if (!current_ || !checkable_) return false;
        set_check_state(current_, current_->check_ == CheckState::Checked ? CheckState::Unchecked : CheckState::Checked);
        return true;
    case SDLK_F2:
        if (!current_ || current_->is_folder()) return false;
        rename_item(current_);
        return true;
    default:
        return false;
    }
}

bool TreeView::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (renaming_ && editor_) {
        if (wk::is_left_press(e) && !wk::point_in(editor_->rect(), wk::event_point(e))) {
            finish_rename(true);
        } else if (editor_->handle_event(e)) {
            return true;
        }
    }
    if (search_bar_ && search_bar_->handle_event(e)) {
        focused_ = false;
        return true;
    }
    const SDL_Rect area = list_area();
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        hover_item_ = item_at(wk::event_point(e));
        return false;
    }
    if (e.type == SDL_MOUSEWHEEL) {
        if (!hovered_ || max_scroll() == 0) return false;
        scroll_ = std::max(0, std::min(max_scroll(), scroll_ - e.wheel.y * kWheelStep));
        return true;
    }
    if (e.type == SDL_MOUSEBUTTONDOWN) {
        const SDL_Point p = wk::event_point(e);
        if (!wk::point_in(area, p)) {
            focused_ = false;
            return false;
        }
        focused_ = true;
        TreeItem* item = item_at(p);
        if (e.button.button == SDL_BUTTON_RIGHT) {
            if (!item) return true;
            current_ = item;
            show_context_menu(item, p.x, p.y);
            return true;
        }
        if (e.button.button != SDL_BUTTON_LEFT || !item) return true;
        if (item->is_folder() && wk::point_in(arrow_rect(item), p)) {
            set_expanded(item, !item->expanded_);
            return true;
        }
        if (checkable_ && wk::point_in(check_rect(item), p)) {
            set_check_state(item, item->check_ == CheckState::Checked ? CheckState::Unchecked : CheckState::Checked);
            return true;
        }
        current_ = item;
        if (e.button.clicks >= 2) {
            pressed_ = nullptr;
            if (item->is_folder()) set_expanded(item, !item->expanded_);
            if (on_item_double_clicked_) on_item_double_clicked_(item);
        } else {
            pressed_ = item;
        }
        return true;
    }
    if (wk::is_left_release(e)) {
        TreeItem* item = pressed_;
        pressed_ = nullptr;
        if (!item) return false;
        if (item_at(wk::event_point(e)) == item && on_item_clicked_) on_item_clicked_(item);
        return true;
    }
    if (e.type == SDL_KEYDOWN && focused_ && !renaming_) return handle_key(e);
    return false;
}

void TreeView::update() {
    if (search_bar_) search_bar_->update();
    if (editor_ && !renaming_) editor_.reset();
    if (editor_) editor_->update();
    if (menu_ && !menu_->is_visible() && !OverlayManager::instance().is_open(menu_.get())) menu_.reset();
}

void TreeView::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    if (search_bar_) search_bar_->render(r);

    const SDL_Rect area = list_area();
    const int radius = tm.border_radius("md");
    wk_draw::fill_rounded_rect(r, area, radius, tm.color("surface"), alpha);
    wk_draw::draw_rounded_rect(r, area, radius, focused_ ? tm.color("primary") : tm.color("border"), alpha);

    wk_draw::ClipScope clip(r, wk_draw::inset(area, 1, 1));
    const std::vector<TreeItem*> rows = visible_items();
    const SDL_Color white = wk::rgba(255, 255, 255);
    for (size_t i = 0; i < rows.size(); ++i) {
        const TreeItem* item = rows[i];
        const SDL_Rect row{ area.x + 1, area.y + kRowPad + static_cast<int>(i) * kRowHeight - scroll_, area.w - 2,
                            kRowHeight };
        if (row.y + row.h < area.y || row.y > area.y + area.h) continue;
        const bool selected = item == current_;
        if (selected) {
            wk_draw::fill_rect(r, row, tm.color("primary"), alpha);
        } else if (item == hover_item_) {
            wk_draw::fill_rect(r, row, tm.color("hover"), alpha);
        } else if (i % 2 == 1) {
            wk_draw::fill_rect(r, row, wk::with_alpha(tm.color("hover"), 110), alpha);
        }
        const SDL_Color fg = selected ? white : tm.color("text");
        const SDL_Color muted = selected ? white : tm.color("text_secondary");

        int x = row.x + kRowPad + item->depth() * kIndent;
        if (item->is_folder()) {
            const SDL_Rect arrow{ x, row.y + (row.h - kArrowSize) / 2, kArrowSize, kArrowSize };
            wk_draw::draw_chevron(r, wk_draw::centered(arrow, 10, 10),
                                  item->is_expanded() ? wk_draw::Direction::Down : wk_draw::Direction::Right, muted, alpha);
        }
        x += kArrowSize + kGap;
        if (checkable_) {
            const SDL_Rect box{ x, row.y + (row.h - kCheckSize) / 2, kCheckSize, kCheckSize };
            const int br = tm.border_radius("sm");
            if (item->check_state() == CheckState::Unchecked) {
                wk_draw::fill_rounded_rect(r, box, br, tm.color("background"), alpha);
                wk_draw::draw_rounded_rect(r, box, br, selected ? white : tm.color("border"), alpha);
            } else {
                const SDL_Color fill = selected ? white : tm.color("primary");
                const SDL_Color mark = selected ? tm.color("primary") : white;
                wk_draw::fill_rounded_rect(r, box, br, fill, alpha);
                if (item->check_state() == CheckState::Checked) {
                    wk_draw::draw_check(r, wk_draw::inset(box, 3, 3), mark, alpha);
                } else {
                    wk_draw::fill_rect(r, SDL_Rect{ box.x + 4, box.y + box.h / 2 - 1, box.w - 8, 2 }, mark, alpha);
                }
            }
            x += kCheckSize + kGap;
        }
        if (!item->icon().empty()) {
            const SDL_Rect icon{ x, row.y + (row.h - kIconSize) / 2, kIconSize, kIconSize };
            SDL_Color ic = muted;
            if (!selected) ic = item->icon() == "folder" ? tm.color("warning") : file_color(item->file_type());
            wk_icons::draw(r, item->icon(), icon, ic, alpha);
            x += kIconSize + kGap;
        }
        if (item == renaming_) continue;
        LabelStyle st = Styles::Label("default", "text");
        st.color = fg;
        const SDL_Rect text_area{ x, row.y, std::max(0, row.x + row.w - x - kRowPad), row.h };
        wk_text::draw_in_rect(r, st, wk_text::elide(st, item->text(), text_area.w), text_area, wk_text::Align::Left,
                              alpha);
    }
    if (editor_ && renaming_) editor_->render(r);
}

CheckableTreeView::CheckableTreeView(bool searchable) : TreeView(searchable) {
    set_checkable(true);
}

void CheckableTreeView::update_children(TreeItem* item) {
    for (int i = 0; i < item->child_count(); ++i) {
        TreeItem* c = item->child(i);
        assign_check_state(c, item->check_state());
        update_children(c);
    }
}

void CheckableTreeView::update_parents(TreeItem* item) {
    TreeItem* parent = item->parent();
    if (!parent) return;
    int checked = 0;
    bool partial = false;
    for (int i = 0; i < parent->child_count(); ++i) {
        const CheckState s = parent->child(i)->check_state();
        if (s == CheckState::Checked) ++checked;
        if (s == CheckState::Partial) partial = true;
    }
    if (checked == parent->child_count()) {
        assign_check_state(parent, CheckState::Checked);
    } else if (checked == 0 && !partial) {
        assign_check_state(parent, CheckState::Unchecked);
    } else {
        assign_check_state(parent, CheckState::Partial);
    }
    update_parents(parent);
}

void CheckableTreeView::check_changed(TreeItem* item) {
    if (item->check_state() != CheckState::Partial) update_children(item);
    update_parents(item);
    if (on_items_checked_) on_items_checked_(checked_items());
}

FileTreeView::FileTreeView(const std::string& root_path) {
    if (!root_path.empty()) load_directory(root_path);
}

std::string FileTreeView::file_type(const std::string& extension) {
    static const std::map<std::string, std::string> kTypes = {
        { ".py", "python" },  { ".js", "javascript" }, { ".html", "html" }, { ".css", "css" },
        { ".txt", "text" },   { ".md", "markdown" },   { ".json", "json" }, { ".xml", "xml" },
        { ".png", "image" },  { ".jpg", "image" },     { ".jpeg", "image" }, { ".gif", "image" },
        { ".pdf", "pdf" },    { ".doc", "document" },  { ".docx", "document" },
    };
    auto it = kTypes.find(wk_text::to_lower(extension));
    return it == kTypes.end() ? "default" : it->second;
}

bool FileTreeView::load_directory(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        std::cerr << "[FileTreeView] Not a directory: " << path << "\n";
        return false;
    }
    clear_tree();
    root_path_ = path;
    fs::path p(path);
    std::string name = p.filename().string();
    if (name.empty()) name = p.parent_path().filename().string();
    if (name.empty()) name = path;
    TreeItem* root = add_folder(name);
    root->set_data(path);
    populate(root, path);
    set_expanded(root, true);
    return true;
}

void FileTreeView::populate(TreeItem* folder, const std::string& path) {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        std::cerr << "[FileTreeView] Cannot read " << path << ": " << ec.message() << "\n";
        return;
    }
    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        entries.push_back(*it);
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    });
    for (const auto& entry : entries) {
        const std::string name = entry.path().filename().string();
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            TreeItem* sub = add_folder(name, folder);
            sub->set_data(entry.path().string());
            sub->lazy_ = true;
            add_item(kPlaceholder, sub);
        } else if (show_files_) {
            TreeItem* file = add_file(name, folder, file_type(entry.path().extension().string()));
            file->set_data(entry.path().string());
        }
    }
}

void FileTreeView::before_expand(TreeItem* item) {
    if (!item->lazy_) return;
    item->lazy_ = false;
    remove_children(item);
    if (item->data().is_string()) populate(item, item->data().get<std::string>());
}
