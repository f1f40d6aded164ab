#include "animation.hpp"

#include <algorithm>
#include <cmath>

#include "clock.hpp"

namespace wk {

float ease(Easing easing, float t) {
    t = std::max(0.0f, std::min(1.0f, t));
    switch (easing) {
    case Easing::Linear:
        return t;
    case Easing::InOutQuad:
        return t < 0.5f ? 2.0f * t * t : 1.0f - std::pow(-2.0f * t + 2.0f, 2.0f) / 2.0f;
    case Easing::OutBack: {
        const float c1 = 1.70158f;
        const float c3 = c1 + 1.0f;
        return 1.0f + c3 * std::pow(t - 1.0f, 3.0f) + c1 * std::pow(t - 1.0f, 2.0f);
    }
    case Easing::OutCubic:
    default:
        return 1.0f - std::pow(1.0f - t, 3.0f);
    }
}

float lerp(float a, float b, float t) {
    return a + (b - a) * t;
}

}

void Tween::start(float from, float to, Uint32 duration_ms, Easing easing) {
    from_ = from;
    to_ = to;
    value_ = from;
    duration_ = duration_ms;
    easing_ = easing;
    started_ = wk::Clock::now();
    running_ = true;
}

bool Tween::update() {
    if (!running_) return false;
    const Uint32 elapsed = wk::Clock::now() - started_;
    if (duration_ == 0 || elapsed >= duration_) {
        value_ = to_;
        running_ = false;
        if (on_finished_) on_finished_();
        return false;
    }
    const float t = static_cast<float>(elapsed) / static_cast<float>(duration_);
    value_ = wk::lerp(from_, to_, wk::ease(easing_, t));
    return true;
}

void AnimatedWidget::animate(const std::string& key, float from, float to, Uint32 duration_ms,
                             Apply apply, std::function<void()> finished, Easing easing) {
    stop_animation(key);
    Animation a;
    a.key = key;
    a.apply = std::move(apply);
    a.finished = std::move(finished);
    a.tween.start(from, to, duration_ms, easing);
    if (a.apply) a.apply(from);
    animations_.push_back(std::move(a));
}

bool AnimatedWidget::is_animating(const std::string& key) const {
    return std::any_of(animations_.begin(), animations_.end(),
                       [&key](const Animation& a) { return a.key == key; });
}

void AnimatedWidget::stop_animation(const std::string& key) {
    animations_.erase(std::remove_if(animations_.begin(), animations_.end(),
                                     [&key](const Animation& a) { return a.key == key; }),
                      animations_.end());
}

void AnimatedWidget::stop_all_animations() {
    animations_.clear();
}

void AnimatedWidget::update() {
    if (animations_.empty()) return;
    std::vector<std::function<void()>> done;
    for (auto it = animations_.begin(); it != animations_.end();) {
        const bool running = it->tween.update();
        if (it->apply) it->apply(it->tween.value());
        if (!running) {
            if (it->finished) done.push_back(std::move(it->finished));
            it = animations_.erase(it);
        } else {
            ++it;
        }
    }
    for (auto& cb : done) cb();
}

SDL_Rect AnimatedWidget::visual_rect() const {
    SDL_Rect r = rect_;
    if (scale_ != 1.0f) {
        const int w = static_cast<int>(std::lround(r.w * scale_));
        const int h = static_cast<int>(std::lround(r.h * scale_));
        r.x += (r.w - w) / 2;
        r.y += (r.h - h) / 2;
        r.w = w;
        r.h = h;
    }
    r.x += offset_.x;
    r.y += offset_.y;
    return r;
}

void AnimationHelpers::fade_in(AnimatedWidget& w, Uint32 duration, std::function<void()> finished) {
    w.set_visible(true);
    w.animate("opacity", 0.0f, 1.0f, duration,
              [&w](float v) { w.set_opacity(v); }, std::move(finished));
}

void AnimationHelpers::fade_out(AnimatedWidget& w, Uint32 duration, std::function<void()> finished) {
    w.animate("opacity", w.opacity(), 0.0f, duration,
              [&w](float v) { w.set_opacity(v); }, std::move(finished));
}

void AnimationHelpers::slide_in_from_left(AnimatedWidget& w, Uint32 duration,
                                          std::function<void()> finished) {
    const float start = static_cast<float>(-(w.rect().x + w.rect().w));
    w.animate("slide", start, 0.0f, duration,
              [&w](float v) { w.set_offset(static_cast<int>(v), w.offset().y); }, std::move(finished));
}

void AnimationHelpers::slide_in_from_right(AnimatedWidget& w, int parent_width, Uint32 duration,
                                           std::function<void()> finished) {
    const float start = static_cast<float>(parent_width - w.rect().x);
    w.animate("slide", start, 0.0f, duration,
              [&w](float v) { w.set_offset(static_cast<int>(v), w.offset().y); }, std::move(finished));
}

void AnimationHelpers::expand_height(AnimatedWidget& w, int target_height, Uint32 duration,
                                     std::function<void()> finished) {
    auto done = std::move(finished);
    w.animate("height", 0.0f, static_cast<float>(std::max(0, target_height)), duration,
              [&w](float v) { w.set_height_limit(static_cast<int>(v)); },
              [&w, done]() {
                  w.set_height_limit(-1);
                  if (done) done();
              });
}

void AnimationHelpers::collapse_height(AnimatedWidget& w, Uint32 duration,
                                       std::function<void()> finished) {
    const int from = w.height_limit() >= 0 ? w.height_limit() : w.rect().h;
    w.animate("height", static_cast<float>(from), 0.0f, duration,
              [&w](float v) { w.set_height_limit(static_cast<int>(v)); }, std::move(finished));
}

void AnimationHelpers::bounce_effect(AnimatedWidget& w, float scale, Uint32 duration,
                                     std::function<void()> finished) {
    const Uint32 half = duration / 2;
    auto done = std::move(finished);
    w.animate("scale", 1.0f, scale, half, [&w](float v) { w.set_scale(v); },
              [&w, scale, half, done]() {
                  w.animate("scale", scale, 1.0f, half, [&w](float v) { w.set_scale(v); }, done);
              });
}
