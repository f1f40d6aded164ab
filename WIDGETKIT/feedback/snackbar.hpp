#pragma once

#include <SDL.h>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "base/base_popup.hpp"

class BaseButton;
class IconButton;
class Label;

// Message bar that slides up from the bottom centre of the screen with an
// optional action button. A duration of 0 keeps it open until closed.
class Snackbar : public BasePopup {
public:
    static constexpr int kHeight = 48;
    static constexpr int kMinWidth = 300;
    static constexpr int kMaxWidth = 600;
    static constexpr int kBottomOffset = 80;
    static constexpr Uint32 kSlideInMs = 300;
    static constexpr Uint32 kSlideOutMs = 250;

    explicit Snackbar(const std::string& message = {}, const std::string& action_text = {},
                      Uint32 duration = 4000);

    void show_snackbar();
    // Slides back below the screen edge, then closes.
    void slide_out();

    void set_message(const std::string& m);
    const std::string& message() const;
    void set_action_text(const std::string& t);
    const std::string& action_text() const;
    Uint32 duration() const { return duration_; }
    BaseButton* action_button() const { return action_; }
    // info, success, warning, error; anything else is the dark default.
    void set_kind(const std::string& kind) { kind_ = kind; }

    void set_on_action_clicked(std::function<void()> cb) { on_action_clicked_ = std::move(cb); }

    int preferred_width() const override;
    void render(SDL_Renderer* r) const override;

private:
    int target_y() const;

    Uint32 duration_;
    std::string kind_;
    Label* message_ = nullptr;
    BaseButton* action_ = nullptr;
    IconButton* close_ = nullptr;
    std::function<void()> on_action_clicked_{};
};

// Shows one snackbar at a time; the rest wait in a queue and appear as the
// current one closes. Call update() once per frame.
class SnackbarManager {
public:
    SnackbarManager() = default;
    SnackbarManager(const SnackbarManager&) = delete;
    SnackbarManager& operator=(const SnackbarManager&) = delete;

    // Returns the snackbar when it is shown right away, nullptr when queued.
    Snackbar* show_snackbar(const std::string& message, const std::string& action_text = {},
                            Uint32 duration = 4000, std::function<void()> on_action = {});
    Snackbar* show_undo_snackbar(const std::string& message, std::function<void()> on_undo,
                                 Uint32 duration = 4000);
    Snackbar* show_retry_snackbar(const std::string& message, std::function<void()> on_retry,
                                  Uint32 duration = 6000);

    void clear_queue() { queue_.clear(); }
    void close_current();
    size_t queue_length() const { return queue_.size(); }
    Snackbar* current() const { return current_.get(); }

    void update();

private:
    struct Pending {
        std::string message;
        std::string action_text;
        Uint32 duration = 0;
        std::function<void()> on_action;
    };

    Snackbar* present(Pending p);

    std::deque<Pending> queue_;
    std::unique_ptr<Snackbar> current_;
    bool current_closed_ = false;
};
