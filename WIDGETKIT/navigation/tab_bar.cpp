#include "tab_bar.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kTabPadding = 16;
constexpr int kInnerGap = 8;
constexpr int kAddGap = 8;
constexpr float kDisabledAlpha = 0.5f;

bool empty_rect(const SDL_Rect& r) { return r.w <= 0 || r.h <= 0; }

int lerp_int(int a, int b, float t) { return static_cast<int>(wk::lerp(static_cast<float>(a), static_cast<float>(b), t)); }
}

TabBar::TabBar(Orientation orientation) : orientation_(orientation) {}

int TabBar::add_tab(const std::string& text, bool closable, const std::string& icon) {
    Tab t;
    t.text = text;
    t.icon = icon;
    t.closable = closable;
    tabs_.push_back(t);
    const int index = count() - 1;
    layout();
    if (current_ < 0) {
        current_ = 0;
        indicator_t_ = 1.0f;
        if (on_current_changed_) on_current_changed_(current_);
    }
    return index;
}

bool TabBar::remove_tab(int index) {
    if (index < 0 || index >= count()) return false;
    const SDL_Rect from = indicator_rect();
    tabs_.erase(tabs_.begin() + index);
    hovered_tab_ = hovered_close_ = pressed_close_ = -1;
    bool changed = false;
    if (tabs_.empty()) {
        current_ = -1;
        changed = true;
    } else if (index == current_) {
        current_ = std::max(0, index - 1);
        changed = true;
    } else if (index < current_) {
        --current_;
    }
    scroll_ = std::min(scroll_, max_scroll());
    layout();
    slide_indicator(from);
    if (changed && on_current_changed_) on_current_changed_(current_);
    return true;
}

void TabBar::clear() {
    const bool had_current = current_ >= 0;
    tabs_.clear();
    current_ = -1;
    scroll_ = 0;
    hovered_tab_ = hovered_close_ = pressed_close_ = -1;
    stop_animation("indicator");
    indicator_t_ = 1.0f;
    if (had_current && on_current_changed_) on_current_changed_(-1);
}

void TabBar::set_current_index(int index) {
    if (index < 0 || index >= count() || index == current_) return;
    const SDL_Rect from = indicator_rect();
    current_ = index;
    ensure_visible(index);
    slide_indicator(from);
    if (on_current_changed_) on_current_changed_(current_);
}

std::string TabBar::tab_text(int index) const {
    return index >= 0 && index < count() ? tabs_[static_cast<size_t>(index)].text : std::string{};
}

void TabBar::set_tab_text(int index, const std::string& text) {
    if (index < 0 || index >= count()) return;
    tabs_[static_cast<size_t>(index)].text = text;
    layout();
}

std::string TabBar::tab_icon(int index) const {
    return index >= 0 && index < count() ? tabs_[static_cast<size_t>(index)].icon : std::string{};
}

void TabBar::set_tab_icon(int index, const std::string& icon) {
    if (index < 0 || index >= count()) return;
    tabs_[static_cast<size_t>(index)].icon = icon;
    layout();
}

bool TabBar::is_tab_closable(int index) const {
    return index >= 0 && index < count() && tabs_[static_cast<size_t>(index)].closable;
}

void TabBar::set_tab_closable(int index, bool closable) {
    if (index < 0 || index >= count()) return;
    tabs_[static_cast<size_t>(index)].closable = closable;
    layout();
}

void TabBar::set_add_button_visible(bool v) {
    show_add_ = v;
    layout();
}

int TabBar::tab_extent(const Tab& t) const {
    if (orientation_ == Orientation::Vertical) return kTabHeight;
    int w = kTabPadding * 2 + wk_text::width(Styles::Label("default", "text"), t.text);
    if (!t.icon.empty()) w += kIconSize + kInnerGap;
    if (t.closable) w += kInnerGap + kCloseSize;
    return std::max(kMinTabWidth, w);
}

int TabBar::content_extent() const {
    int total = 0;
    for (const auto& t : tabs_) total += tab_extent(t);
    return total;
}

SDL_Rect TabBar::tabs_area() const {
    SDL_Rect a = rect_;
    if (!show_add_) return a;
    if (orientation_ == Orientation::Horizontal) {
        a.w = std::max(0, a.w - kAddButtonSize - kAddGap);
    } else {
        a.h = std::max(0, a.h - kAddButtonSize - kAddGap);
    }
    return a;
}

int TabBar::max_scroll() const {
    const SDL_Rect a = tabs_area();
    const int avail = orientation_ == Orientation::Horizontal ? a.w : a.h;
    return std::max(0, content_extent() - avail);
}

void TabBar::ensure_visible(int index) {
    if (index < 0 || index >= count()) return;
    const SDL_Rect a = tabs_area();
    int start = 0;
    for (int i = 0; i < index; ++i) start += tab_extent(tabs_[static_cast<size_t>(i)]);
    const int end = start + tab_extent(tabs_[static_cast<size_t>(index)]);
    const int avail = orientation_ == Orientation::Horizontal ? a.w : a.h;
    if (start < scroll_) scroll_ = start;
    else if (end > scroll_ + avail) scroll_ = end - avail;
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
    layout();
}

void TabBar::layout() {
    const SDL_Rect a = tabs_area();
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
    int pos = (orientation_ == Orientation::Horizontal ? a.x : a.y) - scroll_;
    for (auto& t : tabs_) {
        const int ext = tab_extent(t);
        if (orientation_ == Orientation::Horizontal) {
            t.rect = SDL_Rect{ pos, a.y, ext, a.h };
        } else {
            t.rect = SDL_Rect{ a.x, pos, a.w, ext };
        }
        pos += ext;
    }
}

SDL_Rect TabBar::tab_rect(int index) const {
    if (index < 0 || index >= count()) return SDL_Rect{ 0, 0, 0, 0 };
    return tabs_[static_cast<size_t>(index)].rect;
}

SDL_Rect TabBar::close_rect(int index) const {
    if (!is_tab_closable(index)) return SDL_Rect{ 0, 0, 0, 0 };
    const SDL_Rect t = tab_rect(index);
    return SDL_Rect{ t.x + t.w - kTabPadding - kCloseSize, t.y + (t.h - kCloseSize) / 2, kCloseSize, kCloseSize };
}

SDL_Rect TabBar::add_button_rect() const {
    if (!show_add_) return SDL_Rect{ 0, 0, 0, 0 };
    if (orientation_ == Orientation::Horizontal) {
        return SDL_Rect{ rect_.x + rect_.w - kAddButtonSize - kAddGap / 2,
                         rect_.y + (rect_.h - kAddButtonSize) / 2, kAddButtonSize, kAddButtonSize };
    }
    return SDL_Rect{ rect_.x + (rect_.w - kAddButtonSize) / 2,
                     rect_.y + rect_.h - kAddButtonSize - kAddGap / 2, kAddButtonSize, kAddButtonSize };
}

SDL_Rect TabBar::target_indicator(int index) const {
    if (index < 0 || index >= count()) return SDL_Rect{ 0, 0, 0, 0 };
    const SDL_Rect t = tab_rect(index);
    if (orientation_ == Orientation::Horizontal) {
        return SDL_Rect{ t.x, t.y + t.h - kIndicatorThickness, t.w, kIndicatorThickness };
    }
    return SDL_Rect{ t.x, t.y, kIndicatorThickness, t.h };
}

SDL_Rect TabBar::indicator_rect() const {
    const SDL_Rect to = target_indicator(current_);
    if (indicator_t_ >= 1.0f || empty_rect(indicator_from_)) return to;
    return SDL_Rect{ lerp_int(indicator_from_.x, to.x, indicator_t_), lerp_int(indicator_from_.y, to.y, indicator_t_),
                     lerp_int(indicator_from_.w, to.w, indicator_t_), lerp_int(indicator_from_.h, to.h, indicator_t_) };
}

void TabBar::slide_indicator(const SDL_Rect& from) {
    indicator_from_ = from;
    if (empty_rect(from) || current_ < 0) {
        stop_animation("indicator");
        indicator_t_ = 1.0f;
        return;
    }
    animate("indicator", 0.0f, 1.0f, kIndicatorMs, [this](float v) { indicator_t_ = v; },
            [this]() { indicator_t_ = 1.0f; }, Easing::OutCubic);
}

int TabBar::tab_at(SDL_Point p) const {
    if (!wk::point_in(tabs_area(), p)) return -1;
    for (int i = 0; i < count(); ++i) {
        if (wk::point_in(tabs_[static_cast<size_t>(i)].rect, p)) return i;
    }
    return -1;
}

int TabBar::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    if (orientation_ == Orientation::Vertical) return kVerticalWidth;
    return content_extent() + (show_add_ ? kAddButtonSize + kAddGap : 0);
}

int TabBar::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    if (orientation_ == Orientation::Horizontal) return kTabHeight;
    return content_extent() + (show_add_ ? kAddButtonSize + kAddGap : 0);
}

bool TabBar::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        const SDL_Point p = wk::event_point(e);
        hovered_tab_ = tab_at(p);
        hovered_close_ = hovered_tab_ >= 0 && wk::point_in(close_rect(hovered_tab_), p) ? hovered_tab_ : -1;
        return false;
    }
    if (e.type == SDL_MOUSEWHEEL) {
        if (!hovered_ || max_scroll() == 0) return false;
        const int delta = e.wheel.y != 0 ? e.wheel.y : -e.wheel.x;
        scroll_ = std::max(0, std::min(max_scroll(), scroll_ - delta * kWheelStep));
        layout();
        return true;
    }
    if (wk::is_left_press(e)) {
        const SDL_Point p = wk::event_point(e);
        if (show_add_ && wk::point_in(add_button_rect(), p)) {
            pressed_add_ = true;
            return true;
        }
        const int i = tab_at(p);
        if (i < 0) return false;
        if (wk::point_in(close_rect(i), p)) {
            pressed_close_ = i;
            return true;
        }
        set_current_index(i);
        return true;
    }
    if (wk::is_left_release(e)) {
        const SDL_Point p = wk::event_point(e);
        if (pressed_add_) {
            pressed_add_ = false;
            if (wk::point_in(add_button_rect(), p)) {
                if (on_add_requested_) {
                    on_add_requested_();
                } else {
                    set_current_index(add_tab("Tab " + std::to_string(count() + 1)));
                }
            }
            return true;
        }
        if (pressed_close_ >= 0) {
            const int i = pressed_close_;
            pressed_close_ = -1;
            if (wk::point_in(close_rect(i), p) && on_close_requested_) on_close_requested_(i);
            return true;
        }
    }
    return false;
}

void TabBar::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    if (orientation_ == Orientation::Horizontal) {
        wk_draw::fill_rect(r, SDL_Rect{ rect_.x, rect_.y + rect_.h - 1, rect_.w, 1 }, tm.color("border"), alpha);
    } else {
        wk_draw::fill_rect(r, SDL_Rect{ rect_.x + rect_.w - 1, rect_.y, 1, rect_.h }, tm.color("border"), alpha);
    }
    {
        wk_draw::ClipScope clip(r, tabs_area());
        for (int i = 0; i < count(); ++i) {
            const Tab& t = tabs_[static_cast<size_t>(i)];
            const bool current = i == current_;
            if (current) {
                wk_draw::fill_rect(r, t.rect, tm.color("background"), alpha);
            } else if (i == hovered_tab_) {
                wk_draw::fill_rect(r, t.rect, tm.color("hover"), alpha);
            }
            LabelStyle st = Styles::Label("default", current ? "primary" : "text_secondary");
            st.bold = current;
            int x = t.rect.x + kTabPadding;
            if (!t.icon.empty()) {
                const SDL_Rect icon{ x, t.rect.y + (t.rect.h - kIconSize) / 2, kIconSize, kIconSize };
                wk_icons::draw(r, t.icon, icon, st.color, alpha);
                x += kIconSize + kInnerGap;
            }
            const int right = t.closable ? close_rect(i).x - kInnerGap : t.rect.x + t.rect.w - kTabPadding;
            const SDL_Rect text_area{ x, t.rect.y, std::max(0, right - x), t.rect.h };
            wk_text::draw_in_rect(r, st, wk_text::elide(st, t.text, text_area.w), text_area,
                                  orientation_ == Orientation::Horizontal && t.icon.empty() && !t.closable
                                      ? wk_text::Align::Center
                                      : wk_text::Align::Left,
                                  alpha);
            if (t.closable) {
                const SDL_Rect cr = close_rect(i);
                if (i == hovered_close_) {
                    wk_draw::fill_circle(r, cr.x + cr.w / 2, cr.y + cr.h / 2, cr.w / 2 + 2, tm.color("hover"), alpha);
                }
                wk_draw::draw_cross(r, wk_draw::inset(cr, 4, 4), tm.color("text_secondary"), alpha);
            }
        }
        if (current_ >= 0) wk_draw::fill_rect(r, indicator_rect(), tm.color("primary"), alpha);
    }
    if (show_add_) {
        const SDL_Rect ar = add_button_rect();
        if (pressed_add_) {
            wk_draw::fill_circle(r, ar.x + ar.w / 2, ar.y + ar.h / 2, ar.w / 2, tm.color("hover"), alpha);
        }
        wk_icons::draw(r, "plus", wk_draw::inset(ar, 8, 8), tm.color("text_secondary"), alpha);
    }
}

TabContainer::TabContainer(TabBar::Orientation orientation)
    : layout_(std::make_unique<BoxLayout>(orientation == TabBar::Orientation::Horizontal
                                              ? BoxLayout::Direction::Vertical
                                              : BoxLayout::Direction::Horizontal,
                                          0)) {
    layout_->set_parent(this);
    bar_ = layout_->add_widget(std::make_unique<TabBar>(orientation));
    stack_ = layout_->add_widget(std::make_unique<StackedLayout>(), 1);
    bar_->set_on_current_changed([this](int index) {
        stack_->set_current(index);
        if (on_current_changed_) on_current_changed_(index);
    });
    bar_->set_on_tab_close_requested([this](int index) {
        const std::string text = bar_->tab_text(index);
        if (remove_tab(index) && on_tab_closed_) on_tab_closed_(index, text);
    });
}

TabContainer::~TabContainer() = default;

int TabContainer::add_tab(const std::string& text, std::unique_ptr<Widget> page, bool closable,
                          const std::string& icon) {
    if (!page) return -1;
    stack_->add(std::move(page));
    const int index = bar_->add_tab(text, closable, icon);
    stack_->set_current(bar_->current_index());
    return index;
}

bool TabContainer::remove_tab(int index) {
    if (index < 0 || index >= count()) return false;
    stack_->remove(index);
    bar_->remove_tab(index);
    stack_->set_current(bar_->current_index());
    return true;
}

void TabContainer::clear() {
    bar_->clear();
    stack_->clear();
}

int TabContainer::count() const { return bar_->count(); }

int TabContainer::current_index() const { return bar_->current_index(); }

void TabContainer::set_current_index(int index) { bar_->set_current_index(index); }

Widget* TabContainer::page(int index) const { return stack_->at(index); }

Widget* TabContainer::current_page() const { return stack_->current_page(); }

int TabContainer::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width();
}

int TabContainer::height_for_width(int w) const {
    return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w);
}

void TabContainer::layout() { layout_->set_rect(rect_); }

bool TabContainer::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void TabContainer::update() { layout_->update(); }

void TabContainer::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}
