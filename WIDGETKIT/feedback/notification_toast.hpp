#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "base/base_popup.hpp"

class BaseButton;
class IconButton;
class Label;

// Coloured notice with a type icon, bold title, message and optional action
// buttons. Slides down 50 px into place when shown and closes itself after
// `duration` milliseconds (0 keeps it open).
class NotificationToast : public BasePopup {
public:
    static constexpr int kWidth = 350;
    static constexpr int kSlideDistance = 50;
    static constexpr Uint32 kSlideMs = 300;

    NotificationToast(const std::string& title, const std::string& message, const std::string& type = "info",
                      Uint32 duration = 3000);

    // Shows the toast with its top-left corner at (x, y).
    void show_toast_at(int x, int y);
    void show_toast(PopupPosition position = PopupPosition::TopRight);

    void set_title(const std::string& t);
    const std::string& title() const;
    void set_message(const std::string& m);
    const std::string& message() const;
    // info, success, warning, error
    void set_type(const std::string& type) { type_ = type; }
    const std::string& type() const { return type_; }
    Uint32 duration() const { return duration_; }

    // Clicking an action reports its name and closes the toast.
    BaseButton* add_action(const std::string& text, const std::string& name = {});
    size_t action_count() const { return action_count_; }

    // Progress strip along the bottom; values are clamped to [0, 100] and the
    // toast closes a second after reaching 100. -1 hides the strip.
    void set_progress(int percent);
    int progress() const { return progress_; }

    void set_on_action_clicked(std::function<void(const std::string&)> cb) { on_action_clicked_ = std::move(cb); }

    static std::string icon_for(const std::string& type);
    static std::string color_role_for(const std::string& type);

    void update() override;
    void render(SDL_Renderer* r) const override;

private:
    std::string type_;
    Uint32 duration_;
    int progress_ = -1;
    Timer done_timer_{ true };
    size_t action_count_ = 0;
    Label* title_ = nullptr;
    Label* message_ = nullptr;
    BoxLayout* actions_ = nullptr;
    std::function<void(const std::string&)> on_action_clicked_{};
};

// Keeps the visible toasts. Toasts sharing a position stack away from the
// screen edge; beyond max_toasts the oldest one is closed. Call update() once
// per frame so closed toasts are released.
class ToastManager {
public:
    static constexpr int kSpacing = 10;
    static constexpr int kMargin = 20;

    ToastManager() = default;
    ToastManager(const ToastManager&) = delete;
    ToastManager& operator=(const ToastManager&) = delete;

    NotificationToast* show_toast(const std::string& title, const std::string& message,
                                  const std::string& type = "info", Uint32 duration = 3000,
                                  PopupPosition position = PopupPosition::TopRight);
    NotificationToast* show_info(const std::string& title, const std::string& message = {});
    NotificationToast* show_success(const std::string& title, const std::string& message = {});
    NotificationToast* show_warning(const std::string& title, const std::string& message = {});
    // Error toasts stay up for five seconds.
    NotificationToast* show_error(const std::string& title, const std::string& message = {});

    void set_default_position(PopupPosition p) { default_position_ = p; }
    PopupPosition default_position() const { return default_position_; }
    void set_max_toasts(size_t n);
    size_t max_toasts() const { return max_toasts_; }

    void clear_all();
    size_t active_count() const;
    std::vector<NotificationToast*> active_toasts() const;

    void update();

private:
    struct Entry {
        std::unique_ptr<NotificationToast> toast;
        PopupPosition position = PopupPosition::TopRight;
        bool active = true;
    };

    void retire(Entry& e);
    // Vertical offset from the anchor for a new toast at `pos`.
    int stack_offset(PopupPosition pos) const;

    std::vector<Entry> entries_;
    size_t max_toasts_ = 5;
    PopupPosition default_position_ = PopupPosition::TopRight;
};
