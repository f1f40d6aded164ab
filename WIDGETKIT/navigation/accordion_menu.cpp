#include "accordion_menu.hpp"

#include <algorithm>
#include <cmath>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kHeaderPadX = 16;
constexpr int kIconSize = 18;
constexpr int kChevronSize = 12;
constexpr float kDisabledAlpha = 0.5f;
}

AccordionMenu::AccordionMenu(bool allow_multiple) : allow_multiple_(allow_multiple) {}

void AccordionMenu::add_section(const std::string& title, const std::vector<std::string>& items,
                                const std::string& icon) {
    if (title.empty() || find(title)) return;
    Section s;
    s.title = title;
    s.icon = icon;
    s.items = items;
    sections_.push_back(s);
    layout();
}

bool AccordionMenu::add_item(const std::string& section, const std::string& item) {
    Section* s = find(section);
    if (!s) return false;
    s->items.push_back(item);
    layout();
    return true;
}

bool AccordionMenu::remove_section(const std::string& title) {
    auto it = std::find_if(sections_.begin(), sections_.end(), [&title](const Section& s) { return s.title == title; });
    if (it == sections_.end()) return false;
    stop_animation("section:" + title);
    sections_.erase(it);
    if (active_section_ == title) {
        active_section_.clear();
        active_item_.clear();
    }
    hovered_header_.clear();
    hovered_item_ = pressed_item_ = -1;
    pressed_header_.clear();
    layout();
    return true;
}

bool AccordionMenu::remove_item(const std::string& section, const std::string& item) {
    Section* s = find(section);
    if (!s) return false;
    auto it = std::find(s->items.begin(), s->items.end(), item);
    if (it == s->items.end()) return false;
    s->items.erase(it);
    if (active_section_ == section && active_item_ == item) {
        active_section_.clear();
        active_item_.clear();
    }
    hovered_item_ = pressed_item_ = -1;
    layout();
    return true;
}

void AccordionMenu::clear_section(const std::string& title) {
    Section* s = find(title);
    if (!s) return;
    s->items.clear();
    if (active_section_ == title) {
        active_section_.clear();
        active_item_.clear();
    }
    hovered_item_ = pressed_item_ = -1;
    layout();
}

void AccordionMenu::clear() {
    stop_all_animations();
    sections_.clear();
    active_section_.clear();
    active_item_.clear();
    hovered_header_.clear();
    pressed_header_.clear();
    hovered_item_ = pressed_item_ = -1;
}

std::vector<std::string> AccordionMenu::sections() const {
    std::vector<std::string> out;
    for (const auto& s : sections_) out.push_back(s.title);
    return out;
}

std::vector<std::string> AccordionMenu::section_items(const std::string& title) const {
    const Section* s = find(title);
    return s ? s->items : std::vector<std::string>{};
}

AccordionMenu::Section* AccordionMenu::find(const std::string& title) {
    for (auto& s : sections_) {
        if (s.title == title) return &s;
    }
    return nullptr;
}

const AccordionMenu::Section* AccordionMenu::find(const std::string& title) const {
    return const_cast<AccordionMenu*>(this)->find(title);
}

void AccordionMenu::set_expanded(Section& s, bool expanded) {
    if (s.expanded == expanded) return;
    s.expanded = expanded;
    const std::string title = s.title;
    const float target = expanded ? 1.0f : 0.0f;
    animate("section:" + title, s.progress, target, kAnimMs,
            [this, title](float v) {
                if (Section* sec = find(title)) sec->progress = v;
                layout();
            },
            [this, title, target]() {
                if (Section* sec = find(title)) sec->progress = target;
                layout();
            },
            Easing::OutCubic);
    if (on_section_toggled_) on_section_toggled_(title, expanded);
}

void AccordionMenu::expand_section(const std::string& title) {
    Section* s = find(title);
    if (!s || s->expanded) return;
    if (!allow_multiple_) {
        for (auto& other : sections_) {
            if (other.title != title) set_expanded(other, false);
        }
    }
    if (Section* again = find(title)) set_expanded(*again, true);
}

void AccordionMenu::collapse_section(const std::string& title) {
    if (Section* s = find(title)) set_expanded(*s, false);
}

void AccordionMenu::toggle_section(const std::string& title) {
    if (is_section_expanded(title)) collapse_section(title);
    else expand_section(title);
}

void AccordionMenu::collapse_all() {
    for (auto& s : sections_) set_expanded(s, false);
}

bool AccordionMenu::is_section_expanded(const std::string& title) const {
    const Section* s = find(title);
    return s && s->expanded;
}

float AccordionMenu::section_progress(const std::string& title) const {
    const Section* s = find(title);
    return s ? s->progress : 0.0f;
}

void AccordionMenu::set_allow_multiple(bool allow) {
    allow_multiple_ = allow;
    if (allow_multiple_) return;
    bool seen = false;
    for (auto& s : sections_) {
        if (!s.expanded) continue;
        if (seen) set_expanded(s, false);
        seen = true;
    }
}

void AccordionMenu::set_active_item(const std::string& section, const std::string& item) {
    const Section* s = find(section);
    if (!s || std::find(s->items.begin(), s->items.end(), item) == s->items.end()) return;
    active_section_ = section;
    active_item_ = item;
}

int AccordionMenu::body_height(const Section& s) const {
    const float full = static_cast<float>(kItemHeight * static_cast<int>(s.items.size()));
    return static_cast<int>(std::lround(full * s.progress));
}

void AccordionMenu::layout() {
    int y = rect_.y;
    for (auto& s : sections_) {
        s.header = SDL_Rect{ rect_.x, y, rect_.w, kHeaderHeight };
        y += kHeaderHeight;
        const int bh = body_height(s);
        s.body = SDL_Rect{ rect_.x, y, rect_.w, bh };
        y += bh;
    }
}

SDL_Rect AccordionMenu::header_rect(const std::string& title) const {
    const Section* s = find(title);
    return s ? s->header : SDL_Rect{ 0, 0, 0, 0 };
}

SDL_Rect AccordionMenu::item_rect(const std::string& section, const std::string& item) const {
    const Section* s = find(section);
    if (!s || s->body.h <= 0) return SDL_Rect{ 0, 0, 0, 0 };
    auto it = std::find(s->items.begin(), s->items.end(), item);
    if (it == s->items.end()) return SDL_Rect{ 0, 0, 0, 0 };
    const int idx = static_cast<int>(it - s->items.begin());
    return SDL_Rect{ s->body.x, s->body.y + idx * kItemHeight, s->body.w, kItemHeight };
}

int AccordionMenu::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const LabelStyle header = Styles::Label("default", "text");
    int w = 0;
    for (const auto& s : sections_) {
        LabelStyle bold = header;
        bold.bold = true;
        w = std::max(w, kHeaderPadX * 2 + kIconSize + 8 + wk_text::width(bold, s.title) + kChevronSize + 8);
        for (const auto& i : s.items) w = std::max(w, kItemIndent + wk_text::width(header, i) + kHeaderPadX);
    }
    return w;
}

int AccordionMenu::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    int h = 0;
    for (const auto& s : sections_) h += kHeaderHeight + body_height(s);
    return h;
}

bool AccordionMenu::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        const SDL_Point p = wk::event_point(e);
        hovered_header_.clear();
        hovered_item_ = -1;
        hovered_item_section_.clear();
        for (const auto& s : sections_) {
            if (wk::point_in(s.header, p)) hovered_header_ = s.title;
            if (s.body.h > 0 && wk::point_in(s.body, p)) {
                hovered_item_ = (p.y - s.body.y) / kItemHeight;
                hovered_item_section_ = s.title;
            }
        }
        return false;
    }
    if (wk::is_left_press(e)) {
        const SDL_Point p = wk::event_point(e);
        for (const auto& s : sections_) {
            if (wk::point_in(s.header, p)) {
                pressed_header_ = s.title;
                return true;
            }
            if (s.body.h > 0 && wk::point_in(s.body, p)) {
                const int idx = (p.y - s.body.y) / kItemHeight;
                if (idx < 0 || idx >= static_cast<int>(s.items.size())) return false;
                pressed_section_ = s.title;
                pressed_item_ = idx;
                return true;
            }
        }
        return false;
    }
    if (wk::is_left_release(e)) {
        const SDL_Point p = wk::event_point(e);
        if (!pressed_header_.empty()) {
            const std::string title = pressed_header_;
            pressed_header_.clear();
            if (wk::point_in(header_rect(title), p)) toggle_section(title);
            return true;
        }
        if (pressed_item_ >= 0) {
            const std::string section = pressed_section_;
            const int idx = pressed_item_;
            pressed_item_ = -1;
            pressed_section_.clear();
            const Section* s = find(section);
            if (!s || idx >= static_cast<int>(s->items.size())) return true;
            const std::string item = s->items[static_cast<size_t>(idx)];
            if (wk::point_in(item_rect(section, item), p)) {
                active_section_ = section;
                active_item_ = item;
                if (on_item_clicked_) on_item_clicked_(section, item);
            }
            return true;
        }
    }
    return false;
}

void AccordionMenu::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int radius = tm.border_radius("sm");
    for (const auto& s : sections_) {
        wk_draw::fill_rect(r, s.header, s.title == hovered_header_ ? tm.color("hover") : tm.color("surface"), alpha);
        int x = s.header.x + kHeaderPadX;
        if (!s.icon.empty()) {
            wk_icons::draw(r, s.icon, SDL_Rect{ x, s.header.y + (s.header.h - kIconSize) / 2, kIconSize, kIconSize },
                           tm.color("text"), alpha);
            x += kIconSize + 8;
        }
        LabelStyle title_style = Styles::Label("default", "text");
        title_style.bold = true;
        const SDL_Rect chevron{ s.header.x + s.header.w - kHeaderPadX - kChevronSize,
                                s.header.y + (s.header.h - kChevronSize) / 2, kChevronSize, kChevronSize };
        const SDL_Rect title_area{ x, s.header.y, std::max(0, chevron.x - 8 - x), s.header.h };
        wk_text::draw_in_rect(r, title_style, wk_text::elide(title_style, s.title, title_area.w), title_area,
                              wk_text::Align::Left, alpha);
        wk_draw::draw_chevron(r, chevron, s.progress > 0.5f ? wk_draw::Direction::Up : wk_draw::Direction::Down,
                              tm.color("text_secondary"), alpha);
        wk_draw::fill_rect(r, SDL_Rect{ s.header.x, s.header.y + s.header.h - 1, s.header.w, 1 }, tm.color("border"),
                           alpha);
        if (s.body.h <= 0) continue;
        wk_draw::ClipScope clip(r, s.body);
        wk_draw::fill_rect(r, s.body, tm.color("background"), alpha);
        for (size_t i = 0; i < s.items.size(); ++i) {
            const SDL_Rect row{ s.body.x, s.body.y + static_cast<int>(i) * kItemHeight, s.body.w, kItemHeight };
            const bool active = s.title == active_section_ && s.items[i] == active_item_;
            if (active) {
                wk_draw::fill_rounded_rect(r, wk_draw::inset(row, 6, 2), radius, wk::with_alpha(tm.color("primary"), 40),
                                           alpha);
            } else if (s.title == hovered_item_section_ && static_cast<int>(i) == hovered_item_) {
                wk_draw::fill_rounded_rect(r, wk_draw::inset(row, 6, 2), radius, tm.color("hover"), alpha);
            }
            LabelStyle st = Styles::Label("default", active ? "primary" : "text_secondary");
            const SDL_Rect text_area{ row.x + kItemIndent, row.y, std::max(0, row.w - kItemIndent - kHeaderPadX), row.h };
            wk_text::draw_in_rect(r, st, wk_text::elide(st, s.items[i], text_area.w), text_area, wk_text::Align::Left,
                                  alpha);
        }
    }
}
