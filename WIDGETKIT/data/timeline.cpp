#include "timeline.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kVisualGap = 16;
constexpr int kTextGap = 8;
constexpr int kIconSize = 24;
constexpr int kMarkerOffset = 20;
constexpr int kLineWidth = 2;
constexpr float kDisabledAlpha = 0.5f;
}

Timeline::Timeline(Orientation orientation) : orientation_(orientation) {}

int Timeline::add_event(const std::string& title, const std::string& description, std::time_t timestamp,
                        const std::string& status, const std::string& icon, const nlohmann::json& data) {
    TimelineEvent ev;
    ev.title = title;
    ev.description = description;
    ev.timestamp = timestamp != 0 ? timestamp : std::time(nullptr);
    ev.status = status;
    ev.icon = icon;
    ev.data = data;
    auto pos = std::upper_bound(events_.begin(), events_.end(), ev.timestamp,
                                [](std::time_t t, const TimelineEvent& e) { return t < e.timestamp; });
    const int index = static_cast<int>(pos - events_.begin());
    events_.insert(pos, ev);
    hover_ = -1;
    pressed_ = -1;
    layout();
    return index;
}

bool Timeline::remove_event(int index) {
    if (index < 0 || index >= event_count()) return false;
    events_.erase(events_.begin() + index);
    hover_ = -1;
    pressed_ = -1;
    layout();
    return true;
}

void Timeline::clear_events() {
    events_.clear();
    hover_ = -1;
    pressed_ = -1;
    scroll_ = 0;
    layout();
}

void Timeline::set_orientation(Orientation o) {
    if (o == orientation_) return;
    orientation_ = o;
    scroll_ = 0;
    layout();
}

void Timeline::set_compact(bool compact) {
    if (compact == compact_) return;
    compact_ = compact;
    scroll_ = 0;
    layout();
}

std::string Timeline::format_timestamp(std::time_t t, bool time_only) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char buf[64];
    const size_t n = std::strftime(buf, sizeof(buf), time_only ? "%H:%M" : "%b %d, %Y %H:%M", &local);
    return std::string(buf, n);
}

SDL_Color Timeline::status_color(const std::string& status) {
    const auto& tm = ThemeManager::instance();
    if (status == "success") return tm.color("success");
    if (status == "warning") return tm.color("warning");
    if (status == "error") return tm.color("danger");
    if (status == "info") return tm.color("info");
    return tm.color("primary");
}

int Timeline::card_height(const TimelineEvent& ev, int card_w) const {
    if (compact_) return kCompactHeight;
    const int inner = std::max(1, card_w - 2 * kCardPad);
    int h = 2 * kCardPad + wk_text::line_height(Styles::Label("heading", "text"));
    if (!ev.description.empty()) {
        h += kTextGap + wk_text::wrapped_height(Styles::Label("default", "text_secondary"), ev.description, inner);
    }
    if (!ev.icon.empty()) h += kTextGap + kIconSize;
    return h;
}

void Timeline::layout() {
    rects_.assign(events_.size(), SDL_Rect{ 0, 0, 0, 0 });
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
    if (orientation_ == Orientation::Vertical) {
        const int x = rect_.x + kMargin + (compact_ ? 0 : kVisualSize + kVisualGap);
        const int w = std::max(0, rect_.x + rect_.w - kMargin - x);
        int y = rect_.y + kMargin - scroll_;
        for (size_t i = 0; i < events_.size(); ++i) {
            const int h = card_height(events_[i], w);
            rects_[i] = SDL_Rect{ x, y, w, h };
            y += h + (compact_ ? 4 : kItemSpacing);
        }
    } else {
        int tallest = 0;
        for (const auto& ev : events_) tallest = std::max(tallest, card_height(ev, kCardWidth));
        int x = rect_.x + kMargin - scroll_;
        for (size_t i = 0; i < events_.size(); ++i) {
            rects_[i] = SDL_Rect{ x, rect_.y + kMargin, kCardWidth, tallest };
            x += kCardWidth + kItemSpacing;
        }
    }
}

int Timeline::content_extent() const {
    if (events_.empty()) return 2 * kMargin;
    if (orientation_ == Orientation::Horizontal) {
        return 2 * kMargin + event_count() * kCardWidth + (event_count() - 1) * kItemSpacing;
    }
    const int w = std::max(0, rect_.w - 2 * kMargin - (compact_ ? 0 : kVisualSize + kVisualGap));
    int h = 2 * kMargin;
    for (const auto& ev : events_) h += card_height(ev, w);
    h += (event_count() - 1) * (compact_ ? 4 : kItemSpacing);
    return h;
}

int Timeline::max_scroll() const {
    const int view = orientation_ == Orientation::Vertical ? rect_.h : rect_.w;
    return std::max(0, content_extent() - view);
}

SDL_Rect Timeline::event_rect(int index) const {
    if (index < 0 || index >= static_cast<int>(rects_.size())) return SDL_Rect{ 0, 0, 0, 0 };
    return rects_[static_cast<size_t>(index)];
}

SDL_Point Timeline::marker_center(int index) const {
    const SDL_Rect c = event_rect(index);
    if (compact_) return SDL_Point{ c.x + kCardPad, c.y + c.h / 2 };
    if (orientation_ == Orientation::Vertical) {
        return SDL_Point{ c.x - kVisualGap - kVisualSize / 2, c.y + kMarkerOffset };
    }
    return SDL_Point{ c.x + kMarkerOffset, c.y + c.h + kVisualGap + kVisualSize / 2 };
}

int Timeline::event_at(SDL_Point p) const {
    if (!wk::point_in(rect_, p)) return -1;
    for (size_t i = 0; i < rects_.size(); ++i) {
        if (wk::point_in(rects_[i], p)) return static_cast<int>(i);
    }
    return -1;
}

int Timeline::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    if (orientation_ == Orientation::Horizontal) return std::min(content_extent(), 4 * kCardWidth);
    return 320;
}

int Timeline::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    if (orientation_ == Orientation::Horizontal) {
        int tallest = 0;
        for (const auto& ev : events_) tallest = std::max(tallest, card_height(ev, kCardWidth));
        return 2 * kMargin + tallest + kVisualGap + kVisualSize;
    }
    const int cw = std::max(0, w - 2 * kMargin - (compact_ ? 0 : kVisualSize + kVisualGap));
    int h = 2 * kMargin;
    for (const auto& ev : events_) h += card_height(ev, cw);
    if (!events_.empty()) h += (event_count() - 1) * (compact_ ? 4 : kItemSpacing);
    return h;
}

bool Timeline::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        hover_ = event_at(wk::event_point(e));
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
        pressed_ = event_at(wk::event_point(e));
        return pressed_ >= 0;
    }
    if (wk::is_left_release(e)) {
        const int index = pressed_;
        pressed_ = -1;
        if (index < 0) return false;
        if (event_at(wk::event_point(e)) == index && on_event_clicked_) {
            const TimelineEvent ev = events_[static_cast<size_t>(index)];
            on_event_clicked_(index, ev);
        }
        return true;
    }
    return false;
}

void Timeline::render_card(SDL_Renderer* r, int index, float alpha) const {
    const auto& tm = ThemeManager::instance();
    const TimelineEvent& ev = events_[static_cast<size_t>(index)];
    const SDL_Rect card = rects_[static_cast<size_t>(index)];
    const int radius = tm.border_radius("md");
    const bool hot = index == hover_;

    if (compact_) {
        if (hot) wk_draw::fill_rounded_rect(r, card, radius, tm.color("hover"), alpha);
        const SDL_Rect mark{ card.x + kCardPad - 2, card.y + (card.h - 16) / 2, 4, 16 };
        if (!ev.icon.empty() && wk_icons::has(ev.icon)) {
            wk_icons::draw(r, ev.icon, SDL_Rect{ card.x + 4, card.y + (card.h - 16) / 2, 16, 16 },
                           status_color(ev.status), alpha);
        } else {
            wk_draw::fill_rounded_rect(r, mark, 2, status_color(ev.status), alpha);
        }
        const LabelStyle ts = Styles::Label("caption", "text_secondary");
        const std::string time = format_timestamp(ev.timestamp, true);
        const int time_w = wk_text::width(ts, time);
        const SDL_Rect title_area{ card.x + 28, card.y, std::max(0, card.w - 28 - time_w - 16), card.h };
        const LabelStyle st = Styles::Label("default", "text");
        wk_text::draw_in_rect(r, st, wk_text::elide(st, ev.title, title_area.w), title_area, wk_text::Align::Left, alpha);
        wk_text::draw_in_rect(r, ts, time, SDL_Rect{ card.x + card.w - time_w - 8, card.y, time_w, card.h },
                              wk_text::Align::Right, alpha);
        return;
    }

    const CardStyle cs = Styles::Card();
    if (hot) wk_draw::draw_shadow(r, card, radius, 3, wk::rgba(0, 0, 0, 40), alpha);
    wk_draw::fill_rounded_rect(r, card, radius, hot ? cs.hover_bg : cs.bg, alpha);
    wk_draw::draw_rounded_rect(r, card, radius, hot ? status_color(ev.status) : cs.border, alpha);

    const int inner_w = std::max(1, card.w - 2 * kCardPad);
    int y = card.y + kCardPad;
    const LabelStyle hs = Styles::Label("heading", "text");
    const LabelStyle ts = Styles::Label("caption", "text_secondary");
    const std::string when = format_timestamp(ev.timestamp);
    const int when_w = orientation_ == Orientation::Vertical ? wk_text::width(ts, when) : 0;
    const int lh = wk_text::line_height(hs);
    const SDL_Rect title_area{ card.x + kCardPad, y, std::max(0, inner_w - when_w - (when_w > 0 ? 8 : 0)), lh };
    wk_text::draw_in_rect(r, hs, wk_text::elide(hs, ev.title, title_area.w), title_area, wk_text::Align::Left, alpha);
    if (when_w > 0) {
        wk_text::draw_in_rect(r, ts, when, SDL_Rect{ card.x + card.w - kCardPad - when_w, y, when_w, lh },
                              wk_text::Align::Right, alpha);
    }
    y += lh;
    if (!ev.description.empty()) {
        y += kTextGap;
        y += wk_text::draw_wrapped(r, Styles::Label("default", "text_secondary"), ev.description, card.x + kCardPad, y,
                                   inner_w, 0, alpha);
    }
    if (!ev.icon.empty()) {
        y += kTextGap;
        const SDL_Rect icon{ card.x + (card.w - kIconSize) / 2, y, kIconSize, kIconSize };
        if (wk_icons::has(ev.icon)) {
            wk_icons::draw(r, ev.icon, icon, status_color(ev.status), alpha);
        } else {
            wk_text::draw_in_rect(r, Styles::Label("default", "text"), ev.icon, icon, wk_text::Align::Center, alpha);
        }
    }
    if (orientation_ == Orientation::Horizontal) {
        const SDL_Point m = marker_center(index);
        const LabelStyle small = Styles::Label("caption", "text_secondary");
        const std::string date = format_timestamp(ev.timestamp);
        wk_text::draw(r, small, wk_text::elide(small, date, card.w - kMarkerOffset), m.x + kMarkerRadius + 6,
                      m.y + kMarkerRadius + 4, alpha);
    }
}

void Timeline::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    wk_draw::ClipScope clip(r, rect_);
    const SDL_Color line = tm.color("border");
    const int n = event_count();

    if (!compact_) {
        for (int i = 0; i + 1 < n; ++i) {
            const SDL_Point a = marker_center(i);
            const SDL_Point b = marker_center(i + 1);
            if (orientation_ == Orientation::Vertical) {
                wk_draw::draw_line(r, a.x, a.y + kMarkerRadius, b.x, b.y - kMarkerRadius, line, kLineWidth, alpha);
            } else {
                wk_draw::draw_line(r, a.x + kMarkerRadius, a.y, b.x - kMarkerRadius, b.y, line, kLineWidth, alpha);
            }
        }
    }
    for (int i = 0; i < n; ++i) {
        const SDL_Rect c = rects_[static_cast<size_t>(i)];
        if (!SDL_HasIntersection(&c, &rect_)) continue;
        render_card(r, i, alpha);
        if (compact_) continue;
        const SDL_Point m = marker_center(i);
        const SDL_Color color = status_color(events_[static_cast<size_t>(i)].status);
        wk_draw::fill_circle(r, m.x, m.y, kMarkerRadius, color, alpha);
        if (i == hover_) wk_draw::draw_circle(r, m.x, m.y, kMarkerRadius + 3, wk::with_alpha(color, 120), alpha);
    }
}
