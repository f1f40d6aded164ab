#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/animation.hpp"
#include "core/clock.hpp"
#include "core/layout.hpp"
#include "core/overlay_manager.hpp"

enum class PopupPosition { TopRight, TopLeft, BottomRight, BottomLeft, TopCenter, BottomCenter, Center };

namespace wk {
// "top-right", "bottom-center", ...; anything unknown maps to Center.
PopupPosition parse_popup_position(const std::string& s);
// Rect of size w x h anchored inside `area` with `margin` from the edges.
SDL_Rect anchor_rect(const SDL_Rect& area, int w, int h, PopupPosition pos, int margin);
}

// Popup shown on the overlay layer. Fades in over 200 ms when shown; Escape
// closes it. Modal popups dim the screen and close on a backdrop click.
//
// The closed callback must not destroy the popup; owners drop closed popups
// from their own update().
class BasePopup : public AnimatedWidget {
public:
    static constexpr Uint32 kFadeMs = 200;
    static constexpr int kMinWidth = 160;

    explicit BasePopup(bool modal = true);
    ~BasePopup() override;

    BoxLayout* content() const { return content_.get(); }
    template <class T>
    T* add_widget(std::unique_ptr<T> w, int stretch = 0) {
        return content_->add_widget(std::move(w), stretch);
    }

    void show_at_position(int x, int y);
    void show_centered();
    void show_centered(const SDL_Rect& parent_rect);
    void show_at_cursor();

    // Starts a single-shot timer that calls close_animated().
    void auto_close(Uint32 delay_ms);
    void close_animated();
    void close();
    bool is_closing() const { return closing_; }
    bool is_modal() const { return modal_; }
    // Overrides the overlay mode used by the next show. Non-modal popups
    // default to light dismiss.
    void set_overlay_mode(OverlayManager::Mode mode) { mode_ = mode; }

    void set_on_closed(std::function<void()> cb) { on_closed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    void open_at(const SDL_Rect& r);
    void render_backdrop(SDL_Renderer* r) const;
    void render_frame(SDL_Renderer* r) const;

    std::unique_ptr<BoxLayout> content_;
    bool modal_;
    OverlayManager::Mode mode_;
    bool closing_ = false;
    Timer close_timer_{ true };
    std::function<void()> on_closed_{};
};

// Passive 300x60 notice anchored to a screen corner; closes itself after
// `duration` milliseconds.
class ToastPopup : public BasePopup {
public:
    static constexpr int kWidth = 300;
    static constexpr int kHeight = 60;
    static constexpr int kMargin = 20;

    explicit ToastPopup(const std::string& message, Uint32 duration = 3000);

    void show_toast(PopupPosition position = PopupPosition::TopRight);
    const std::string& message() const { return message_; }
    Uint32 duration() const { return duration_; }

    void render(SDL_Renderer* r) const override;

private:
    std::string message_;
    Uint32 duration_;
};

class ContextMenuPopup;

// Row of a context menu.
class MenuAction : public Widget {
public:
    MenuAction(ContextMenuPopup& menu, const std::string& text, std::function<void()> cb,
               const std::string& icon);

    const std::string& text() const { return text_; }
    void trigger();

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    ContextMenuPopup& menu_;
    std::string text_;
    std::string icon_;
    std::function<void()> cb_;
    ClickTracker click_;
};

class ContextMenuPopup : public BasePopup {
public:
    ContextMenuPopup();

    MenuAction* add_action(const std::string& text, std::function<void()> cb = {},
                           const std::string& icon = {});
    void add_separator();
    size_t action_count() const { return actions_.size(); }
    MenuAction* action(size_t i) const { return i < actions_.size() ? actions_[i] : nullptr; }
    // Runs the action's callback, then closes the menu.
    void trigger(size_t i);

private:
    friend class MenuAction;
    void run(const std::function<void()>& cb);

    std::vector<MenuAction*> actions_;
};
