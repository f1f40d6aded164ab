#pragma once

#include <SDL.h>
#include <algorithm>
#include <functional>
#include <string>
#include <vector>

#include "widget.hpp"

enum class Easing { Linear, OutCubic, InOutQuad, OutBack };

namespace wk {
float ease(Easing easing, float t);
float lerp(float a, float b, float t);
}

class Tween {
public:
    void start(float from, float to, Uint32 duration_ms, Easing easing = Easing::OutCubic);
    // Advances to the current clock time. Returns true while still running.
    bool update();
    void stop() { running_ = false; }
    bool is_running() const { return running_; }
    float value() const { return value_; }
    float start_value() const { return from_; }
    float end_value() const { return to_; }
    Uint32 duration() const { return duration_; }
    void set_on_finished(std::function<void()> cb) { on_finished_ = std::move(cb); }

private:
    float from_ = 0.0f;
    float to_ = 0.0f;
    float value_ = 0.0f;
    Uint32 started_ = 0;
    Uint32 duration_ = 0;
    Easing easing_ = Easing::OutCubic;
    bool running_ = false;
    std::function<void()> on_finished_{};
};

// Widget that drives keyed property animations from update(). Starting an
// animation under a key that is already running replaces it.
class AnimatedWidget : public Widget {
public:
    using Apply = std::function<void(float)>;

    void animate(const std::string& key, float from, float to, Uint32 duration_ms, Apply apply,
                 std::function<void()> finished = {}, Easing easing = Easing::OutCubic);
    bool is_animating(const std::string& key) const;
    bool is_animating() const { return !animations_.empty(); }
    void stop_animation(const std::string& key);
    void stop_all_animations();
    size_t animation_count() const { return animations_.size(); }

    void update() override;

    float scale() const { return scale_; }
    void set_scale(float s) { scale_ = s; }
    SDL_Point offset() const { return offset_; }
    void set_offset(int dx, int dy) { offset_ = SDL_Point{ dx, dy }; }
    // -1 means unlimited.
    int height_limit() const { return height_limit_; }
    void set_height_limit(int h) { height_limit_ = h; }
    // Rect scaled about its centre and shifted by the offset.
    SDL_Rect visual_rect() const;

protected:
    int apply_height_limit(int h) const { return height_limit_ >= 0 ? std::min(h, height_limit_) : h; }

    struct Animation {
        std::string key;
        Tween tween;
        Apply apply;
        std::function<void()> finished;
    };
    std::vector<Animation> animations_;
    float scale_ = 1.0f;
    SDL_Point offset_{0, 0};
    int height_limit_ = -1;
};

// Stock animations, all OutCubic.
class AnimationHelpers {
public:
    static constexpr Uint32 kDefaultDuration = 300;

    static void fade_in(AnimatedWidget& w, Uint32 duration = kDefaultDuration,
                        std::function<void()> finished = {});
    static void fade_out(AnimatedWidget& w, Uint32 duration = kDefaultDuration,
                         std::function<void()> finished = {});
    static void slide_in_from_left(AnimatedWidget& w, Uint32 duration = kDefaultDuration,
                                   std::function<void()> finished = {});
    static void slide_in_from_right(AnimatedWidget& w, int parent_width = 800,
                                    Uint32 duration = kDefaultDuration,
                                    std::function<void()> finished = {});
    static void expand_height(AnimatedWidget& w, int target_height, Uint32 duration = kDefaultDuration,
                              std::function<void()> finished = {});
    static void collapse_height(AnimatedWidget& w, Uint32 duration = kDefaultDuration,
                                std::function<void()> finished = {});
    static void bounce_effect(AnimatedWidget& w, float scale = 1.1f, Uint32 duration = 200,
                              std::function<void()> finished = {});
};
