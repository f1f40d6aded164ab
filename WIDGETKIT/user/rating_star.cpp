#include "rating_star.hpp"

#include <algorithm>
#include <cmath>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr float kPreviewAlpha = 0.6f;
constexpr float kDisabledAlpha = 0.5f;
const SDL_Color kStarColor{ 0xF5, 0x9E, 0x0B, 0xFF };
}

RatingStar::RatingStar(int max_rating, double rating, bool read_only, Size size)
    : max_(std::max(1, max_rating)), read_only_(read_only), size_(size) {
    set_rating(rating);
}

double RatingStar::snap(double v) const {
    v = std::max(0.0, std::min(static_cast<double>(max_), v));
    return half_ ? std::round(v * 2.0) / 2.0 : std::round(v);
}

void RatingStar::set_rating(double rating) { rating_ = snap(rating); }

void RatingStar::set_max_rating(int max_rating) {
    max_ = std::max(1, max_rating);
    rating_ = snap(rating_);
    hover_ = 0.0;
}

void RatingStar::set_half_stars(bool half) {
    half_ = half;
    rating_ = snap(rating_);
}

void RatingStar::set_read_only(bool read_only) {
    read_only_ = read_only;
    hover_ = 0.0;
    pressed_ = 0.0;
}

int RatingStar::star_size() const {
    switch (size_) {
    case Size::Small: return 16;
    case Size::Large: return 24;
    case Size::Medium:
    default: return 20;
    }
}

SDL_Rect RatingStar::star_rect(int index) const {
    const int s = star_size();
    return SDL_Rect{ rect_.x + index * (s + kSpacing), rect_.y + (rect_.h - s) / 2, s, s };
}

double RatingStar::value_at(SDL_Point p) const {
    for (int i = 0; i < max_; ++i) {
        const SDL_Rect star = star_rect(i);
        if (!wk::point_in(star, p)) continue;
        if (half_ && p.x < star.x + star.w / 2) return i + 0.5;
        return i + 1.0;
    }
    return 0.0;
}

int RatingStar::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return max_ * star_size() + (max_ - 1) * kSpacing;
}

int RatingStar::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : star_size();
}

void RatingStar::on_hover_changed(bool hovered) {
    if (!hovered) hover_ = 0.0;
}

bool RatingStar::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_ || read_only_) return false;
    track_hover(e);
    if (e.type == SDL_MOUSEMOTION) {
        hover_ = hovered_ ? value_at(wk::event_point(e)) : 0.0;
        return false;
    }
    if (wk::is_left_press(e)) {
        pressed_ = value_at(wk::event_point(e));
        return pressed_ > 0.0;
    }
    if (wk::is_left_release(e)) {
        const double value = pressed_;
        pressed_ = 0.0;
        if (value <= 0.0 || value_at(wk::event_point(e)) != value) return value > 0.0;
        rating_ = value == rating_ ? 0.0 : value;
        hover_ = 0.0;
        if (on_rating_changed_) on_rating_changed_(rating_);
        return true;
    }
    return false;
}

void RatingStar::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const double shown = displayed_rating();
    const float fill_alpha = hover_ > 0.0 ? alpha * kPreviewAlpha : alpha;
    for (int i = 0; i < max_; ++i) {
        const SDL_Rect star = star_rect(i);
        const double fill = std::max(0.0, std::min(1.0, shown - i));
        if (fill >= 1.0) {
            wk_icons::draw(r, "star", star, kStarColor, fill_alpha);
            continue;
        }
        wk_icons::draw(r, "star", star, tm.color("border"), alpha);
        if (fill > 0.0) {
            wk_draw::ClipScope clip(r, SDL_Rect{ star.x, star.y, star.w / 2, star.h });
            wk_icons::draw(r, "star", star, kStarColor, fill_alpha);
        }
    }
}
