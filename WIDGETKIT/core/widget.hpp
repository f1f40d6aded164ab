#pragma once

#include <SDL.h>
#include <string>

namespace wk {
inline bool is_left_press(const SDL_Event& e) {
    return e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_LEFT;
}
inline bool is_left_release(const SDL_Event& e) {
    return e.type == SDL_MOUSEBUTTONUP && e.button.button == SDL_BUTTON_LEFT;
}
inline bool is_right_press(const SDL_Event& e) {
    return e.type == SDL_MOUSEBUTTONDOWN && e.button.button == SDL_BUTTON_RIGHT;
}
inline bool is_pointer_event(const SDL_Event& e) {
    return e.type == SDL_MOUSEBUTTONDOWN || e.type == SDL_MOUSEBUTTONUP || e.type == SDL_MOUSEMOTION;
}
inline bool is_key(const SDL_Event& e, SDL_Keycode key) {
    return e.type == SDL_KEYDOWN && e.key.keysym.sym == key;
}
// Pointer position of a mouse event; wheel events use the current cursor.
SDL_Point event_point(const SDL_Event& e);
inline bool point_in(const SDL_Rect& r, SDL_Point p) { return SDL_PointInRect(&p, &r) == SDL_TRUE; }
}

// Base of every widget: a rectangle that handles events, advances timed state
// in update() and draws itself.
class Widget {
public:
    virtual ~Widget() = default;

    virtual void set_rect(const SDL_Rect& r);
    const SDL_Rect& rect() const { return rect_; }
    void set_position(int x, int y);

    virtual int preferred_width() const;
    virtual int height_for_width(int w) const;
    virtual bool wants_full_row() const { return false; }

    virtual bool handle_event(const SDL_Event& e) { (void)e; return false; }
    virtual void update() {}
    virtual void render(SDL_Renderer* r) const = 0;

    virtual void set_visible(bool v);
    bool is_visible() const { return visible_; }
    void show() { set_visible(true); }
    void hide() { set_visible(false); }
    virtual void set_enabled(bool e);
    bool is_enabled() const { return enabled_; }
    bool is_hovered() const { return hovered_; }

    void set_opacity(float o);
    float opacity() const { return opacity_; }
    float effective_opacity() const;

    void set_fixed_size(int w, int h) { fixed_w_ = w; fixed_h_ = h; }
    void set_fixed_width(int w) { fixed_w_ = w; }
    void set_fixed_height(int h) { fixed_h_ = h; }
    int fixed_width() const { return fixed_w_; }
    int fixed_height() const { return fixed_h_; }

    void set_parent(Widget* p) { parent_ = p; }
    Widget* parent() const { return parent_; }

    void set_tooltip(const std::string& t) { tooltip_ = t; }
    const std::string& tooltip() const { return tooltip_; }

    bool contains(int x, int y) const;

protected:
    virtual void layout() {}
    virtual void on_hover_changed(bool hovered) { (void)hovered; }
    // Updates hovered_ from motion events. Returns true when it changed.
    bool track_hover(const SDL_Event& e);
    bool track_hover(const SDL_Event& e, const SDL_Rect& area);

    SDL_Rect rect_{0,0,0,0};
    bool visible_ = true;
    bool enabled_ = true;
    bool hovered_ = false;
    float opacity_ = 1.0f;
    int fixed_w_ = -1;
    int fixed_h_ = -1;
    Widget* parent_ = nullptr;
    std::string tooltip_;
};

// Press-inside then release-inside detection.
class ClickTracker {
public:
    enum class Result { None, Pressed, Released, Clicked };

    Result feed(const SDL_Event& e, const SDL_Rect& area);
    bool pressed() const { return pressed_; }
    int clicks() const { return clicks_; }
    void reset() { pressed_ = false; clicks_ = 0; }

private:
    bool pressed_ = false;
    int clicks_ = 0;
};
