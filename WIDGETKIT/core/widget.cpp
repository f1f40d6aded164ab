#include "widget.hpp"

#include <algorithm>

namespace wk {
SDL_Point event_point(const SDL_Event& e) {
    switch (e.type) {
    case SDL_MOUSEMOTION:
        return SDL_Point{ e.motion.x, e.motion.y };
    case SDL_MOUSEBUTTONDOWN:
    case SDL_MOUSEBUTTONUP:
        return SDL_Point{ e.button.x, e.button.y };
    default: {
        SDL_Point p{0, 0};
        SDL_GetMouseState(&p.x, &p.y);
        return p;
    }
    }
}
}

void Widget::set_rect(const SDL_Rect& r) {
    rect_ = r;
    layout();
}

void Widget::set_position(int x, int y) {
    set_rect(SDL_Rect{ x, y, rect_.w, rect_.h });
}

int Widget::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : rect_.w;
}

int Widget::height_for_width(int w) const {
    (void)w;
    return fixed_h_ >= 0 ? fixed_h_ : rect_.h;
}

void Widget::set_visible(bool v) {
    visible_ = v;
    if (!visible_ && hovered_) {
        hovered_ = false;
        on_hover_changed(false);
    }
}

void Widget::set_enabled(bool e) {
    enabled_ = e;
}

void Widget::set_opacity(float o) {
    opacity_ = std::max(0.0f, std::min(1.0f, o));
}

float Widget::effective_opacity() const {
    float o = opacity_;
    for (const Widget* p = parent_; p; p = p->parent_) o *= p->opacity_;
    return o;
}

bool Widget::contains(int x, int y) const {
    SDL_Point p{ x, y };
    return SDL_PointInRect(&p, &rect_) == SDL_TRUE;
}

bool Widget::track_hover(const SDL_Event& e) {
    return track_hover(e, rect_);
}

bool Widget::track_hover(const SDL_Event& e, const SDL_Rect& area) {
    if (e.type != SDL_MOUSEMOTION) return false;
    SDL_Point p{ e.motion.x, e.motion.y };
    const bool inside = visible_ && SDL_PointInRect(&p, &area) == SDL_TRUE;
    if (inside == hovered_) return false;
    hovered_ = inside;
    on_hover_changed(hovered_);
    return true;
}

ClickTracker::Result ClickTracker::feed(const SDL_Event& e, const SDL_Rect& area) {
    if (wk::is_left_press(e)) {
        SDL_Point p{ e.button.x, e.button.y };
        if (SDL_PointInRect(&p, &area)) {
            pressed_ = true;
            clicks_ = e.button.clicks;
            return Result::Pressed;
        }
    } else if (wk::is_left_release(e)) {
        SDL_Point p{ e.button.x, e.button.y };
        const bool inside = SDL_PointInRect(&p, &area) == SDL_TRUE;
        const bool was = pressed_;
        pressed_ = false;
        if (!was) return Result::None;
        return inside ? Result::Clicked : Result::Released;
    }
    return Result::None;
}
