#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

class Widget;

// Global stack of widgets drawn above the page: popups, menus, dropdown
// lists, toasts, tooltips and floating panels. Overlays see events before the
// page, top-most first.
//
// Passive overlays only consume what they handle. Light-dismiss overlays are
// dismissed by a press outside their rect (the press is consumed) or an
// unhandled Escape. Modal overlays swallow every event.
//
// Overlays that share a non-empty group are exclusive: opening one dismisses
// the others. The manager does not own the widgets; a widget that dies while
// open must call close(this).
class OverlayManager {
public:
    enum class Mode { Passive, LightDismiss, Modal };
    using DismissCallback = std::function<void()>;

    static OverlayManager& instance();

    // Opening a widget that is already open moves it to the top and replaces
    // its mode, callback and group. The caller makes the widget visible.
    void open(Widget* w, Mode mode = Mode::LightDismiss, DismissCallback on_dismiss = {},
              const std::string& group = {});
    // Removes the widget without running its dismiss callback.
    bool close(const Widget* w);
    // Removes the widget and runs its dismiss callback (or hides it when it
    // has none).
    bool dismiss(const Widget* w);
    bool is_open(const Widget* w) const;
    Widget* top() const;
    size_t count() const { return entries_.size(); }
    bool has_modal() const;

    bool handle_event(const SDL_Event& e);
    // Updates every open overlay and drops the ones that hid themselves.
    void update();
    void render(SDL_Renderer* r) const;

    void set_screen_size(int w, int h);
    SDL_Rect screen_rect() const { return SDL_Rect{ 0, 0, screen_w_, screen_h_ }; }
    // Moves `r` so it lies inside the screen where possible.
    SDL_Rect clamp_to_screen(const SDL_Rect& r) const;

    // Forgets every overlay without callbacks.
    void clear();

private:
    OverlayManager() = default;

    struct Entry {
        Widget* widget = nullptr;
        Mode mode = Mode::LightDismiss;
        DismissCallback on_dismiss;
        std::string group;
    };

    int find(const Widget* w) const;
    std::vector<Widget*> snapshot() const;

    std::vector<Entry> entries_;
    int screen_w_ = 1280;
    int screen_h_ = 720;
};
