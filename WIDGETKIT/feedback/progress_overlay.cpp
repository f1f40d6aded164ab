#include "progress_overlay.hpp"

#include <algorithm>
#include <cmath>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kSpinnerDots = 8;
constexpr int kBarHeight = 8;
constexpr int kCancelRowHeight = 40;
constexpr Uint8 kDimAlpha = 128;
constexpr float kPi = 3.14159265f;
}

void Spinner::update() {
    angle_ = static_cast<float>(wk::Clock::now() % kTurnMs) * 360.0f / static_cast<float>(kTurnMs);
}

void Spinner::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const SDL_Color c = ThemeManager::instance().color("primary");
    const int cx = rect_.x + rect_.w / 2;
    const int cy = rect_.y + rect_.h / 2;
    const int dot = std::max(2, std::min(rect_.w, rect_.h) / 10);
    const float radius = static_cast<float>(std::min(rect_.w, rect_.h)) / 2.0f - static_cast<float>(dot);
    for (int i = 0; i < kSpinnerDots; ++i) {
        const float a = (angle_ + i * 360.0f / kSpinnerDots) * kPi / 180.0f;
        const int x = cx + static_cast<int>(std::lround(std::cos(a) * radius));
        const int y = cy + static_cast<int>(std::lround(std::sin(a) * radius));
        const float fade = static_cast<float>(i + 1) / kSpinnerDots;
        wk_draw::fill_circle(r, x, y, dot, c, effective_opacity() * fade);
    }
}

DotsIndicator::DotsIndicator(int count, int dot_size) : count_(std::max(1, count)), dot_size_(dot_size) {
    timer_.set_on_timeout([this]() { active_ = (active_ + 1) % count_; });
}

void DotsIndicator::start() {
    active_ = 0;
    timer_.start(kStepMs);
}

void DotsIndicator::stop() {
    timer_.stop();
}

int DotsIndicator::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return count_ * dot_size_ + (count_ - 1) * 8;
}

void DotsIndicator::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const int total = count_ * dot_size_ + (count_ - 1) * 8;
    int x = rect_.x + (rect_.w - total) / 2 + dot_size_ / 2;
    const int cy = rect_.y + rect_.h / 2;
    for (int i = 0; i < count_; ++i) {
        const SDL_Color c = i == active_ ? tm.color("primary") : tm.color("border");
        wk_draw::fill_circle(r, x, cy, dot_size_ / 2, c, effective_opacity());
        x += dot_size_ + 8;
    }
}

ProgressOverlay::ProgressOverlay(const std::string& message, ProgressKind kind, bool cancelable)
    : BasePopup(true), kind_(kind), cancelable_(cancelable) {
    content_->set_margins(16);
    content_->set_spacing(12);
    content_->set_alignment(BoxLayout::Align::Center);

    switch (kind_) {
    case ProgressKind::Spinner:
        spinner_ = content_->add_widget(std::make_unique<Spinner>(32));
        break;
    case ProgressKind::Dots:
        dots_ = content_->add_widget(std::make_unique<DotsIndicator>());
        break;
    case ProgressKind::Bar: {
        auto bar = std::make_unique<ProgressBar>(0);
        bar->set_fixed_height(kBarHeight);
        bar_ = content_->add_widget(std::move(bar));
        break;
    }
    }

    auto label = std::make_unique<Label>(message);
    label->set_alignment(wk_text::Align::Center);
    label->set_word_wrap(true);
    message_ = content_->add_widget(std::move(label));

    if (cancelable_) {
        auto button = std::make_unique<BaseButton>("Cancel", ButtonVariant::Secondary, ButtonSize::Small);
        button->set_on_clicked([this]() { cancel(); });
        cancel_button_ = content_->add_widget(std::move(button));
    }
    done_timer_.set_on_timeout([this]() { close_animated(); });
}

SDL_Rect ProgressOverlay::box_rect() const {
    const int h = kBoxHeight + (cancelable_ ? kCancelRowHeight : 0);
    return wk_draw::centered(rect_, kBoxWidth, h);
}

void ProgressOverlay::show_overlay() {
    show_overlay(OverlayManager::instance().screen_rect());
}

void ProgressOverlay::show_overlay(const SDL_Rect& area) {
    done_timer_.stop();
    open_at(area);
    if (dots_) dots_->start();
}

void ProgressOverlay::set_message(const std::string& m) {
    message_->set_text(m);
}

const std::string& ProgressOverlay::message() const {
    return message_->text();
}

void ProgressOverlay::set_progress(int percent) {
    progress_ = std::max(0, std::min(100, percent));
    if (bar_) bar_->set_value(progress_);
    if (progress_ >= 100) {
        if (!done_timer_.is_active()) done_timer_.start(kDoneHideMs);
    } else {
        done_timer_.stop();
    }
}

void ProgressOverlay::cancel() {
    if (!cancelable_) return;
    if (on_cancelled_) on_cancelled_();
    close_animated();
}

bool ProgressOverlay::handle_event(const SDL_Event& e) {
    if (!visible_) return false;
    if (wk::is_key(e, SDLK_ESCAPE)) {
        cancel();
        return true;
    }
    content_->handle_event(e);
    return true;
}

void ProgressOverlay::update() {
    if (!visible_) return;
    BasePopup::update();
    if (!visible_) return;
    done_timer_.poll();
}

void ProgressOverlay::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, wk::rgba(0, 0, 0, kDimAlpha), alpha);
    const SDL_Rect box = box_rect();
    const int radius = tm.border_radius("lg");
    wk_draw::draw_shadow(r, box, radius, 6, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, box, radius, tm.color("background"), alpha);
    wk_draw::ClipScope clip(r, box);
    content_->render(r);
}

ProgressOverlay* ProgressOverlayManager::show_progress(const std::string& id, const std::string& message,
                                                       ProgressKind kind, const SDL_Rect& area) {
    auto it = overlays_.find(id);
    if (it == overlays_.end()) {
        it = overlays_.emplace(id, std::make_unique<ProgressOverlay>(message, kind)).first;
    } else {
        it->second->set_message(message);
    }
    ProgressOverlay* overlay = it->second.get();
    if (area.w > 0 && area.h > 0) {
        overlay->show_overlay(area);
    } else {
        overlay->show_overlay();
    }
    return overlay;
}

bool ProgressOverlayManager::update_progress(const std::string& id, int percent, const std::string& message) {
    ProgressOverlay* overlay = this->overlay(id);
    if (!overlay) return false;
    overlay->set_progress(percent);
    if (!message.empty()) overlay->set_message(message);
    return true;
}

bool ProgressOverlayManager::hide_progress(const std::string& id) {
    ProgressOverlay* overlay = this->overlay(id);
    if (!overlay) return false;
    overlay->hide_overlay();
    return true;
}

void ProgressOverlayManager::hide_all() {
    for (auto& kv : overlays_) kv.second->hide_overlay();
}

bool ProgressOverlayManager::is_showing(const std::string& id) const {
    ProgressOverlay* overlay = this->overlay(id);
    return overlay && overlay->is_visible() && !overlay->is_closing();
}

ProgressOverlay* ProgressOverlayManager::overlay(const std::string& id) const {
    auto it = overlays_.find(id);
    return it == overlays_.end() ? nullptr : it->second.get();
}

void ProgressOverlayManager::update() {
    for (auto it = overlays_.begin(); it != overlays_.end();) {
        if (!it->second->is_visible()) {
            it = overlays_.erase(it);
        } else {
            ++it;
        }
    }
}
