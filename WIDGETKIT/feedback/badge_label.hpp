#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>

#include "core/animation.hpp"

// Pill showing a count. Hidden at zero unless show_zero is set; counts above
// max_count read "{max}+".
class BadgeLabel : public AnimatedWidget {
public:
    static constexpr int kHeight = 18;

    explicit BadgeLabel(int count = 0, int max_count = 99);

    // Negative counts are stored as 0.
    void set_count(int count);
    int count() const { return count_; }
    void increment() { set_count(count_ + 1); }
    void decrement() { set_count(count_ - 1); }
    void reset() { set_count(0); }
    void set_max_count(int m);
    int max_count() const { return max_count_; }
    void set_show_zero(bool s) { show_zero_ = s; }
    bool show_zero() const { return show_zero_; }
    // Bounces the pill when the count goes up.
    void set_animated(bool a) { animated_ = a; }

    // Theme color role; "error" is accepted for danger.
    void set_badge_color(const std::string& role);
    void set_badge_color(SDL_Color c);
    void set_text_color(SDL_Color c) { text_color_ = c; }
    SDL_Color badge_color() const;

    bool badge_visible() const { return count_ > 0 || show_zero_; }
    std::string badge_text() const;
    // 18 for one character, 22 for two, then 8 px per character.
    int badge_width() const;

    void set_on_count_changed(std::function<void(int)> cb) { on_count_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    void render(SDL_Renderer* r) const override;

private:
    int count_ = 0;
    int max_count_ = 99;
    bool show_zero_ = false;
    bool animated_ = false;
    std::string color_role_ = "primary";
    SDL_Color color_{0, 0, 0, 255};
    bool has_color_ = false;
    SDL_Color text_color_{255, 255, 255, 255};
    std::function<void(int)> on_count_changed_{};
};

// Wraps any widget and pins a BadgeLabel to its top-right corner. The badge
// overhangs the child by half its height, which the wrapper reserves.
class BadgedWidget : public Widget {
public:
    explicit BadgedWidget(std::unique_ptr<Widget> child, int count = 0);

    Widget* child() const { return child_.get(); }
    BadgeLabel* badge() const { return badge_.get(); }
    SDL_Rect badge_rect() const;

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    int overhang() const { return BadgeLabel::kHeight / 2; }

    std::unique_ptr<Widget> child_;
    std::unique_ptr<BadgeLabel> badge_;
};
