#include "sidebar_nav.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kToggleSize = 32;
constexpr int kCollapsedSeparator = 12;
constexpr int kItemInset = 6;
constexpr int kBadgeHeight = 18;
constexpr int kBadgeDot = 8;
constexpr float kDisabledAlpha = 0.5f;

bool empty_rect(const SDL_Rect& r) { return r.w <= 0 || r.h <= 0; }
}

SidebarNav::SidebarNav(const std::string& title, bool collapsible) : title_(title), collapsible_(collapsible) {}

void SidebarNav::add_section(const std::string& title, bool expanded) {
    if (title.empty() || find_section(title)) return;
    Section s;
    s.title = title;
    s.expanded = expanded;
    sections_.push_back(s);
    layout();
}

void SidebarNav::add_item(const std::string& id, const std::string& text, const std::string& icon,
                          const std::string& section) {
    if (id.empty() || find_item(id)) return;
    Section* target = nullptr;
    if (section.empty()) {
        if (sections_.empty() || !sections_.back().title.empty()) sections_.push_back(Section{});
        target = &sections_.back();
    } else {
        target = find_section(section);
        if (!target) {
            add_section(section);
            target = &sections_.back();
        }
    }
    Item it;
    it.id = id;
    it.text = text;
    it.icon = icon;
    target->items.push_back(it);
    layout();
}

bool SidebarNav::remove_item(const std::string& id) {
    for (auto& s : sections_) {
        auto it = std::find_if(s.items.begin(), s.items.end(), [&id](const Item& i) { return i.id == id; });
        if (it == s.items.end()) continue;
        s.items.erase(it);
        if (current_ == id) current_.clear();
        if (hovered_id_ == id) hovered_id_.clear();
        if (pressed_id_ == id) pressed_id_.clear();
        layout();
        return true;
    }
    return false;
}

bool SidebarNav::remove_section(const std::string& title) {
    auto it = std::find_if(sections_.begin(), sections_.end(),
                           [&title](const Section& s) { return !title.empty() && s.title == title; });
    if (it == sections_.end()) return false;
    for (const auto& i : it->items) {
        if (i.id == current_) current_.clear();
    }
    sections_.erase(it);
    hovered_id_.clear();
    pressed_id_.clear();
    pressed_section_.clear();
    layout();
    return true;
}

void SidebarNav::clear() {
    sections_.clear();
    current_.clear();
    hovered_id_.clear();
    pressed_id_.clear();
    pressed_section_.clear();
    scroll_ = 0;
}

bool SidebarNav::has_item(const std::string& id) const { return find_item(id) != nullptr; }

std::vector<std::string> SidebarNav::item_ids() const {
    std::vector<std::string> out;
    for (const auto& s : sections_) {
        for (const auto& i : s.items) out.push_back(i.id);
    }
    return out;
}

std::vector<std::string> SidebarNav::sections() const {
    std::vector<std::string> out;
    for (const auto& s : sections_) {
        if (!s.title.empty()) out.push_back(s.title);
    }
    return out;
}

void SidebarNav::set_badge(const std::string& id, int count) {
    if (Item* it = find_item(id)) it->badge = std::max(0, count);
}

int SidebarNav::badge(const std::string& id) const {
    const Item* it = find_item(id);
    return it ? it->badge : 0;
}

void SidebarNav::set_current_item(const std::string& id) {
    if (find_item(id)) current_ = id;
}

void SidebarNav::set_section_expanded(const std::string& title, bool expanded) {
    Section* s = find_section(title);
    if (!s || s->expanded == expanded) return;
    s->expanded = expanded;
    layout();
    if (on_section_toggled_) on_section_toggled_(title, expanded);
}

bool SidebarNav::is_section_expanded(const std::string& title) const {
    const Section* s = find_section(title);
    return s && s->expanded;
}

void SidebarNav::set_collapsed(bool collapsed, bool animated) {
    if (collapsed == collapsed_) return;
    collapsed_ = collapsed;
    const float target = static_cast<float>(collapsed_ ? kCollapsedWidth : kExpandedWidth);
    if (!animated) {
        stop_animation("width");
        width_ = target;
        layout();
    } else {
        animate("width", width_, target, kCollapseMs,
                [this](float v) {
                    width_ = v;
                    layout();
                },
                [this, target]() {
                    width_ = target;
                    layout();
                },
                Easing::InOutQuad);
        layout();
    }
    if (on_collapsed_changed_) on_collapsed_changed_(collapsed_);
}

SidebarNav::Item* SidebarNav::find_item(const std::string& id) {
    for (auto& s : sections_) {
        for (auto& i : s.items) {
            if (i.id == id) return &i;
        }
    }
    return nullptr;
}

const SidebarNav::Item* SidebarNav::find_item(const std::string& id) const {
    return const_cast<SidebarNav*>(this)->find_item(id);
}

SidebarNav::Section* SidebarNav::find_section(const std::string& title) {
    if (title.empty()) return nullptr;
    for (auto& s : sections_) {
        if (s.title == title) return &s;
    }
    return nullptr;
}

const SidebarNav::Section* SidebarNav::find_section(const std::string& title) const {
    return const_cast<SidebarNav*>(this)->find_section(title);
}

SDL_Rect SidebarNav::toggle_rect() const {
    if (!collapsible_) return SDL_Rect{ 0, 0, 0, 0 };
    const int y = rect_.y + (kHeaderHeight - kToggleSize) / 2;
    if (!show_titles()) return SDL_Rect{ rect_.x + (kCollapsedWidth - kToggleSize) / 2, y, kToggleSize, kToggleSize };
    return SDL_Rect{ rect_.x + rect_.w - kToggleSize - 8, y, kToggleSize, kToggleSize };
}

SDL_Rect SidebarNav::list_area() const {
    const int header = (collapsible_ || !title_.empty()) ? kHeaderHeight : 0;
    return SDL_Rect{ rect_.x, rect_.y + header, rect_.w, std::max(0, rect_.h - header) };
}

int SidebarNav::content_height() const {
    int h = 0;
    for (const auto& s : sections_) {
        if (!s.title.empty()) h += show_titles() ? kSectionHeight : kCollapsedSeparator;
        if (s.expanded || s.title.empty()) h += kItemHeight * static_cast<int>(s.items.size());
    }
    return h;
}

int SidebarNav::max_scroll() const {
    return std::max(0, content_height() - list_area().h);
}

void SidebarNav::layout() {
    const SDL_Rect area = list_area();
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
    int y = area.y - scroll_;
    for (auto& s : sections_) {
        if (s.title.empty()) {
            s.rect = SDL_Rect{ 0, 0, 0, 0 };
        } else {
            const int h = show_titles() ? kSectionHeight : kCollapsedSeparator;
            s.rect = SDL_Rect{ area.x, y, area.w, h };
            y += h;
        }
        const bool open = s.expanded || s.title.empty();
        for (auto& i : s.items) {
            if (open) {
                i.rect = SDL_Rect{ area.x, y, area.w, kItemHeight };
                y += kItemHeight;
            } else {
                i.rect = SDL_Rect{ 0, 0, 0, 0 };
            }
        }
    }
}

SDL_Rect SidebarNav::item_rect(const std::string& id) const {
    const Item* it = find_item(id);
    return it ? it->rect : SDL_Rect{ 0, 0, 0, 0 };
}

SDL_Rect SidebarNav::section_rect(const std::string& title) const {
    const Section* s = find_section(title);
    return s ? s->rect : SDL_Rect{ 0, 0, 0, 0 };
}

int SidebarNav::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : current_width();
}

int SidebarNav::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return ((collapsible_ || !title_.empty()) ? kHeaderHeight : 0) + content_height();
}

bool SidebarNav::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    const SDL_Rect area = list_area();
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        hovered_id_.clear();
        const SDL_Point p = wk::event_point(e);
        if (!wk::point_in(area, p)) return false;
        for (const auto& s : sections_) {
            for (const auto& i : s.items) {
                if (!empty_rect(i.rect) && wk::point_in(i.rect, p)) hovered_id_ = i.id;
            }
        }
        return false;
    }
    if (e.type == SDL_MOUSEWHEEL) {
        if (!hovered_ || max_scroll() == 0) return false;
        scroll_ = std::max(0, std::min(max_scroll(), scroll_ - e.wheel.y * kWheelStep));
        layout();
        return true;
    }
    if (wk::is_left_press(e)) {
        const SDL_Point p = wk::event_point(e);
        if (collapsible_ && wk::point_in(toggle_rect(), p)) {
            pressed_toggle_ = true;
            return true;
        }
        if (!wk::point_in(area, p)) return false;
        for (const auto& s : sections_) {
            if (show_titles() && !s.title.empty() && wk::point_in(s.rect, p)) {
                pressed_section_ = s.title;
                return true;
            }
            for (const auto& i : s.items) {
                if (!empty_rect(i.rect) && wk::point_in(i.rect, p)) {
                    pressed_id_ = i.id;
                    return true;
                }
            }
        }
        return false;
    }
    if (wk::is_left_release(e)) {
        const SDL_Point p = wk::event_point(e);
        if (pressed_toggle_) {
            pressed_toggle_ = false;
            if (wk::point_in(toggle_rect(), p)) toggle_collapsed();
            return true;
        }
        if (!pressed_section_.empty()) {
            const std::string title = pressed_section_;
            pressed_section_.clear();
            if (wk::point_in(section_rect(title), p)) set_section_expanded(title, !is_section_expanded(title));
            return true;
        }
        if (!pressed_id_.empty()) {
            const std::string id = pressed_id_;
            pressed_id_.clear();
            if (wk::point_in(item_rect(id), p)) {
                current_ = id;
                if (on_item_clicked_) on_item_clicked_(id);
            }
            return true;
        }
    }
    return false;
}

void SidebarNav::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    wk_draw::ClipScope clip(r, rect_);
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    wk_draw::fill_rect(r, SDL_Rect{ rect_.x + rect_.w - 1, rect_.y, 1, rect_.h }, tm.color("border"), alpha);

    if (show_titles() && !title_.empty()) {
        const SDL_Rect title_area{ rect_.x + 16, rect_.y, rect_.w - 16 - (collapsible_ ? kToggleSize + 16 : 16),
                                   kHeaderHeight };
        const LabelStyle st = Styles::Label("heading", "text");
        wk_text::draw_in_rect(r, st, wk_text::elide(st, title_, title_area.w), title_area, wk_text::Align::Left, alpha);
    }
    if (collapsible_) {
        const SDL_Rect tr = toggle_rect();
        if (pressed_toggle_) wk_draw::fill_rounded_rect(r, tr, tm.border_radius("sm"), tm.color("hover"), alpha);
        wk_icons::draw(r, "menu", wk_draw::centered(tr, kIconSize, kIconSize), tm.color("text_secondary"), alpha);
    }

    wk_draw::ClipScope list_clip(r, list_area());
    const int radius = tm.border_radius("sm");
    const LabelStyle section_style = Styles::Label("caption", "text_secondary");
    for (const auto& s : sections_) {
        if (!s.title.empty()) {
            if (show_titles()) {
                const SDL_Rect title_area{ s.rect.x + 16, s.rect.y, s.rect.w - 48, s.rect.h };
                LabelStyle st = section_style;
                st.bold = true;
                wk_text::draw_in_rect(r, st, s.title, title_area, wk_text::Align::Left, alpha);
                const SDL_Rect chevron{ s.rect.x + s.rect.w - 28, s.rect.y + (s.rect.h - 12) / 2, 12, 12 };
                wk_draw::draw_chevron(r, chevron, s.expanded ? wk_draw::Direction::Down : wk_draw::Direction::Right,
                                      tm.color("text_secondary"), alpha);
            } else {
                const int y = s.rect.y + s.rect.h / 2;
                wk_draw::fill_rect(r, SDL_Rect{ s.rect.x + 12, y, s.rect.w - 24, 1 }, tm.color("border"), alpha);
            }
        }
        for (const auto& i : s.items) {
            if (empty_rect(i.rect)) continue;
            const SDL_Rect bg = wk_draw::inset(i.rect, kItemInset, 2);
            const bool current = i.id == current_;
            if (current) {
                wk_draw::fill_rounded_rect(r, bg, radius, wk::with_alpha(tm.color("primary"), 40), alpha);
                wk_draw::fill_rect(r, SDL_Rect{ i.rect.x, bg.y + 6, 3, bg.h - 12 }, tm.color("primary"), alpha);
            } else if (i.id == hovered_id_) {
                wk_draw::fill_rounded_rect(r, bg, radius, tm.color("hover"), alpha);
            }
            const SDL_Color fg = current ? tm.color("primary") : tm.color("text");
            const SDL_Rect icon{ i.rect.x + (kCollapsedWidth - kIconSize) / 2, i.rect.y + (i.rect.h - kIconSize) / 2,
                                 kIconSize, kIconSize };
            if (!i.icon.empty()) {
                wk_icons::draw(r, i.icon, icon, fg, alpha);
            } else if (!show_titles() && !i.text.empty()) {
                LabelStyle st = Styles::Label("default", "text");
                st.color = fg;
                st.bold = true;
                wk_text::draw_in_rect(r, st, wk_text::utf8_prefix(i.text, 1), icon, wk_text::Align::Center, alpha);
            }
            if (show_titles()) {
                LabelStyle st = Styles::Label("default", "text");
                st.color = fg;
                st.bold = current;
                const int right = i.rect.x + i.rect.w - 12;
                const SDL_Rect text_area{ i.rect.x + kCollapsedWidth, i.rect.y,
                                          std::max(0, right - i.rect.x - kCollapsedWidth - 32), i.rect.h };
                wk_text::draw_in_rect(r, st, wk_text::elide(st, i.text, text_area.w), text_area, wk_text::Align::Left,
                                      alpha);
                if (i.badge > 0) {
                    LabelStyle bst = Styles::Label("caption", "text");
                    bst.color = wk::rgba(255, 255, 255);
                    bst.bold = true;
                    const std::string txt = i.badge > 99 ? "99+" : std::to_string(i.badge);
                    const int w = std::max(kBadgeHeight, wk_text::width(bst, txt) + 10);
                    const SDL_Rect pill{ right - w, i.rect.y + (i.rect.h - kBadgeHeight) / 2, w, kBadgeHeight };
                    wk_draw::fill_rounded_rect(r, pill, kBadgeHeight / 2, tm.color("danger"), alpha);
                    wk_text::draw_in_rect(r, bst, txt, pill, wk_text::Align::Center, alpha);
                }
            } else if (i.badge > 0) {
                wk_draw::fill_circle(r, icon.x + icon.w, icon.y, kBadgeDot / 2, tm.color("danger"), alpha);
            }
        }
    }
}
