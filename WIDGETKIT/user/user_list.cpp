#include "user_list.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"
#include "user/user_avatar.hpp"

namespace {
constexpr int kPadX = 12;
constexpr int kPadY = 8;
constexpr int kGap = 12;
constexpr int kListWidth = 320;
constexpr int kListHeight = 360;

std::string action_name_for(const std::string& text) {
    std::string out = wk_text::to_lower(wk_text::trim(text));
    std::replace(out.begin(), out.end(), ' ', '_');
    return out;
}
}

UserListItem::UserListItem(const std::string& name, const std::string& role, const std::string& email,
                           const std::string& avatar_path, const std::string& status)
    : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, kGap)) {
    layout_->set_parent(this);
    layout_->set_margins(kPadX, kPadY, kPadX, kPadY);
    layout_->set_alignment(BoxLayout::Align::Center);

    avatar_ = layout_->add_widget(std::make_unique<UserAvatar>(name, avatar_path, kAvatarSize, status));

    auto info = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 2);
    name_label_ = info->add_widget(std::make_unique<Label>("", "default", "text"));
    name_label_->set_bold(true);
    name_label_->set_elide(true);
    role_label_ = info->add_widget(std::make_unique<Label>("", "default", "text_secondary"));
    role_label_->set_elide(true);
    email_label_ = info->add_widget(std::make_unique<Label>("", "caption", "text_secondary"));
    email_label_->set_elide(true);
    layout_->add_widget(std::move(info), 1);

    auto actions = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 4);
    actions_box_ = layout_->add_widget(std::move(actions));

    set_name(name);
    set_role(role);
    set_email(email);
}

UserListItem::~UserListItem() = default;

void UserListItem::set_name(const std::string& name) {
    name_ = name;
    name_label_->set_text(name);
    avatar_->set_name(name);
}

void UserListItem::set_role(const std::string& role) {
    role_ = role;
    role_label_->set_text(role);
    role_label_->set_visible(!role.empty());
    layout();
}

void UserListItem::set_email(const std::string& email) {
    email_ = email;
    email_label_->set_text(email);
    email_label_->set_visible(!email.empty());
    layout();
}

void UserListItem::set_status(const std::string& status) { avatar_->set_status(status); }

void UserListItem::set_avatar(const std::string& path) { avatar_->set_image(path); }

BaseButton* UserListItem::add_action(const std::string& text, const std::string& action_name,
                                     ButtonVariant variant) {
    const std::string id = action_name.empty() ? action_name_for(text) : action_name;
    auto* button = actions_box_->add_widget(std::make_unique<BaseButton>(text, variant, ButtonSize::Small));
    button->set_on_clicked([this, id]() {
        if (on_action_clicked_) on_action_clicked_(id);
    });
    actions_.emplace_back(button, id);
    layout();
    return button;
}

bool UserListItem::remove_action(const std::string& action_name) {
    auto it = std::find_if(actions_.begin(), actions_.end(),
                           [&action_name](const std::pair<BaseButton*, std::string>& a) { return a.second == action_name; });
    if (it == actions_.end()) return false;
    actions_box_->remove(it->first);
    actions_.erase(it);
    layout();
    return true;
}

BaseButton* UserListItem::action_button(const std::string& action_name) const {
    for (const auto& a : actions_) {
        if (a.second == action_name) return a.first;
    }
    return nullptr;
}

bool UserListItem::matches(const std::string& query) const {
    const std::string q = wk_text::to_lower(wk_text::trim(query));
    if (q.empty()) return true;
    for (const std::string* field : { &name_, &role_, &email_ }) {
        if (wk_text::to_lower(*field).find(q) != std::string::npos) return true;
    }
    return false;
}

int UserListItem::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return layout_->preferred_width();
}

int UserListItem::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return layout_->height_for_width(w);
}

void UserListItem::layout() { layout_->set_rect(rect_); }

bool UserListItem::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (layout_->handle_event(e)) return true;
    if (!clickable_) return false;
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
        return true;
    case ClickTracker::Result::Clicked:
        if (on_clicked_) on_clicked_();
        return true;
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::None:
    default:
        return false;
    }
}

void UserListItem::update() { layout_->update(); }

void UserListItem::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    if (selected_) {
        wk_draw::fill_rect(r, rect_, wk::with_alpha(tm.color("primary"), 40), alpha);
        wk_draw::fill_rect(r, SDL_Rect{ rect_.x, rect_.y, 3, rect_.h }, tm.color("primary"), alpha);
    } else if (hovered_ && clickable_) {
        wk_draw::fill_rect(r, rect_, tm.color("hover"), alpha);
    }
    layout_->render(r);
}

UserList::UserList() {
    auto list = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    list_ = list.get();
    scroll_ = std::make_unique<ScrollArea>(std::move(list));
    scroll_->set_parent(this);
}

UserList::~UserList() = default;

UserListItem* UserList::add_user(std::unique_ptr<UserListItem> item) {
    if (!item) return nullptr;
    UserListItem* raw = list_->add_widget(std::move(item));
    items_.push_back(raw);
    raw->set_on_clicked([this, raw]() { select_user(raw->name()); });
    raw->set_on_action_clicked([this, raw](const std::string& action) {
        if (on_user_action_) on_user_action_(raw->name(), action);
    });
    raw->set_visible(raw->matches(filter_));
    layout();
    return raw;
}

UserListItem* UserList::add_user(const std::string& name, const std::string& role, const std::string& email,
                                 const std::string& avatar_path, const std::string& status) {
    return add_user(std::make_unique<UserListItem>(name, role, email, avatar_path, status));
}

bool UserList::remove_user(const std::string& name) {
    UserListItem* item = find_user(name);
    if (!item) return false;
    if (selected_ == item) selected_ = nullptr;
    items_.erase(std::remove(items_.begin(), items_.end(), item), items_.end());
    list_->remove(item);
    layout();
    return true;
}

void UserList::clear_users() {
    selected_ = nullptr;
    items_.clear();
    list_->clear();
    scroll_->scroll_to_top();
    layout();
}

UserListItem* UserList::find_user(const std::string& name) const {
    for (UserListItem* item : items_) {
        if (item->name() == name) return item;
    }
    return nullptr;
}

std::vector<std::string> UserList::users() const {
    std::vector<std::string> out;
    for (const UserListItem* item : items_) out.push_back(item->name());
    return out;
}

void UserList::filter(const std::string& query) {
    filter_ = query;
    for (UserListItem* item : items_) item->set_visible(item->matches(query));
    scroll_->scroll_to_top();
    layout();
}

std::vector<std::string> UserList::visible_users() const {
    std::vector<std::string> out;
    for (const UserListItem* item : items_) {
        if (item->is_visible()) out.push_back(item->name());
    }
    return out;
}

void UserList::select_user(const std::string& name) {
    if (selected_) selected_->set_selected(false);
    selected_ = find_user(name);
    if (!selected_) return;
    selected_->set_selected(true);
    scroll_->ensure_visible(selected_->rect());
    if (on_user_selected_) on_user_selected_(name);
}

std::string UserList::selected_user() const { return selected_ ? selected_->name() : std::string(); }

int UserList::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return kListWidth;
}

int UserList::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return kListHeight;
}

void UserList::layout() { scroll_->set_rect(rect_); }

bool UserList::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return scroll_->handle_event(e);
}

void UserList::update() { scroll_->update(); }

void UserList::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    wk_draw::draw_rect(r, rect_, tm.color("border"), alpha);
    scroll_->render(r);
}
