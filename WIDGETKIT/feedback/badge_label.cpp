#include "badge_label.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kFontPx = 10;
}

BadgeLabel::BadgeLabel(int count, int max_count) : count_(std::max(0, count)), max_count_(std::max(1, max_count)) {}

void BadgeLabel::set_count(int count) {
    count = std::max(0, count);
    if (count == count_) return;
    const bool grew = count > count_;
    count_ = count;
    if (animated_ && grew && badge_visible()) AnimationHelpers::bounce_effect(*this, 1.2f, 300);
    if (on_count_changed_) on_count_changed_(count_);
}

void BadgeLabel::set_max_count(int m) {
    max_count_ = std::max(1, m);
}

void BadgeLabel::set_badge_color(const std::string& role) {
    color_role_ = role == "error" ? "danger" : role;
    has_color_ = false;
}

void BadgeLabel::set_badge_color(SDL_Color c) {
    color_ = c;
    has_color_ = true;
}

SDL_Color BadgeLabel::badge_color() const {
    if (has_color_) return color_;
    const std::string role = color_role_ == "secondary" ? "text_secondary" : color_role_;
    return ThemeManager::instance().color(role);
}

std::string BadgeLabel::badge_text() const {
    if (count_ > max_count_) return std::to_string(max_count_) + "+";
    return std::to_string(count_);
}

int BadgeLabel::badge_width() const {
    const int len = static_cast<int>(badge_text().size());
    if (len == 1) return 18;
    if (len == 2) return 22;
    return std::max(22, len * 8);
}

int BadgeLabel::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return badge_visible() ? badge_width() : 0;
}

int BadgeLabel::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return badge_visible() ? kHeight : 0;
}

void BadgeLabel::render(SDL_Renderer* r) const {
    if (!visible_ || !badge_visible()) return;
    const float alpha = effective_opacity();
    SDL_Rect pill{ rect_.x + std::max(0, rect_.w - badge_width()), rect_.y + (rect_.h - kHeight) / 2, badge_width(),
                   kHeight };
    if (scale_ != 1.0f) {
        const int w = static_cast<int>(pill.w * scale_);
        const int h = static_cast<int>(pill.h * scale_);
        pill = SDL_Rect{ pill.x + (pill.w - w) / 2, pill.y + (pill.h - h) / 2, w, h };
    }
    wk_draw::fill_rounded_rect(r, pill, pill.h / 2, badge_color(), alpha);
    LabelStyle st = ThemeManager::instance().font("default");
    st.font_size = kFontPx;
    st.bold = true;
    st.color = text_color_;
    wk_text::draw_in_rect(r, st, badge_text(), pill, wk_text::Align::Center, alpha);
}

BadgedWidget::BadgedWidget(std::unique_ptr<Widget> child, int count)
    : child_(std::move(child)), badge_(std::make_unique<BadgeLabel>(count)) {
    if (child_) child_->set_parent(this);
    badge_->set_parent(this);
}

SDL_Rect BadgedWidget::badge_rect() const {
    const SDL_Rect c = child_ ? child_->rect() : rect_;
    const int w = badge_->badge_width();
    return SDL_Rect{ c.x + c.w - w / 2, c.y - overhang(), w, BadgeLabel::kHeight };
}

int BadgedWidget::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const int child_w = child_ ? child_->preferred_width() : 0;
    return child_w + badge_->badge_width() / 2;
}

int BadgedWidget::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int child_w = std::max(0, w - badge_->badge_width() / 2);
    return (child_ ? child_->height_for_width(child_w) : 0) + overhang();
}

void BadgedWidget::layout() {
    const int right = badge_->badge_width() / 2;
    if (child_) {
        child_->set_rect(SDL_Rect{ rect_.x, rect_.y + overhang(), std::max(0, rect_.w - right),
                                   std::max(0, rect_.h - overhang()) });
    }
    badge_->set_rect(badge_rect());
}

bool BadgedWidget::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_ || !child_) return false;
    return child_->handle_event(e);
}

void BadgedWidget::update() {
    if (child_) child_->update();
    badge_->update();
    // The badge width follows the count.
    const SDL_Rect want = badge_rect();
    const SDL_Rect& have = badge_->rect();
    if (want.x != have.x || want.w != have.w) badge_->set_rect(want);
}

void BadgedWidget::render(SDL_Renderer* r) const {
    if (!visible_) return;
    if (child_) child_->render(r);
    badge_->render(r);
}
