#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "base/base_popup.hpp"
#include "core/clock.hpp"

class BaseButton;
class Label;
class ProgressBar;

enum class ProgressKind { Spinner, Bar, Dots };

// Ring of fading dots turning once a second.
class Spinner : public Widget {
public:
    static constexpr Uint32 kTurnMs = 1000;

    explicit Spinner(int size = 32) : size_(size) {}

    // Degrees, 0..360.
    float angle() const { return angle_; }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : size_; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : size_; }
    void update() override;
    void render(SDL_Renderer* r) const override;

private:
    int size_;
    float angle_ = 0.0f;
};

// Row of dots where the highlight steps to the next dot every interval.
class DotsIndicator : public Widget {
public:
    static constexpr Uint32 kStepMs = 500;

    explicit DotsIndicator(int count = 3, int dot_size = 12);

    void start();
    void stop();
    bool is_running() const { return timer_.is_active(); }
    int active_dot() const { return active_; }
    int count() const { return count_; }

    int preferred_width() const override;
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : dot_size_; }
    void update() override { timer_.poll(); }
    void render(SDL_Renderer* r) const override;

private:
    int count_;
    int dot_size_;
    int active_ = 0;
    Timer timer_{ false };
};

// Modal layer that dims an area and shows a 200x120 box with a message and a
// spinner, bar or dots. Swallows input while shown; Escape cancels when the
// overlay is cancelable.
class ProgressOverlay : public BasePopup {
public:
    static constexpr int kBoxWidth = 200;
    static constexpr int kBoxHeight = 120;
    static constexpr Uint32 kDoneHideMs = 500;

    explicit ProgressOverlay(const std::string& message = "Loading...", ProgressKind kind = ProgressKind::Spinner,
                             bool cancelable = false);

    // Covers the whole screen, or just `area`.
    void show_overlay();
    void show_overlay(const SDL_Rect& area);
    void hide_overlay() { close_animated(); }

    void set_message(const std::string& m);
    const std::string& message() const;
    // Clamped to [0, 100]; reaching 100 hides the overlay half a second later.
    void set_progress(int percent);
    int progress() const { return progress_; }
    ProgressKind kind() const { return kind_; }
    bool is_cancelable() const { return cancelable_; }
    void cancel();

    Spinner* spinner() const { return spinner_; }
    DotsIndicator* dots() const { return dots_; }
    ProgressBar* bar() const { return bar_; }
    BaseButton* cancel_button() const { return cancel_button_; }
    SDL_Rect box_rect() const;

    void set_on_cancelled(std::function<void()> cb) { on_cancelled_ = std::move(cb); }

    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { content_->set_rect(box_rect()); }

private:
    ProgressKind kind_;
    bool cancelable_;
    int progress_ = 0;
    Label* message_ = nullptr;
    Spinner* spinner_ = nullptr;
    DotsIndicator* dots_ = nullptr;
    ProgressBar* bar_ = nullptr;
    BaseButton* cancel_button_ = nullptr;
    Timer done_timer_{ true };
    std::function<void()> on_cancelled_{};
};

// Progress overlays keyed by caller-chosen ids. Call update() once per frame
// so hidden overlays are released.
class ProgressOverlayManager {
public:
    ProgressOverlayManager() = default;
    ProgressOverlayManager(const ProgressOverlayManager&) = delete;
    ProgressOverlayManager& operator=(const ProgressOverlayManager&) = delete;

    // Shows (or re-shows) the overlay for `id`. An empty area covers the
    // screen.
    ProgressOverlay* show_progress(const std::string& id, const std::string& message = "Loading...",
                                   ProgressKind kind = ProgressKind::Spinner, const SDL_Rect& area = SDL_Rect{ 0, 0, 0, 0 });
    // Returns false for an unknown id. An empty message keeps the old one.
    bool update_progress(const std::string& id, int percent, const std::string& message = {});
    bool hide_progress(const std::string& id);
    void hide_all();
    bool is_showing(const std::string& id) const;
    ProgressOverlay* overlay(const std::string& id) const;
    size_t count() const { return overlays_.size(); }

    void update();

private:
    std::map<std::string, std::unique_ptr<ProgressOverlay>> overlays_;
};
