#pragma once

#include <SDL.h>
#include <SDL_ttf.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "core/clock.hpp"
#include "core/overlay_manager.hpp"
#include "core/widget.hpp"
#include "style/theme_manager.hpp"

namespace wk_test {

class SDLSubsystemGuard {
public:
    SDLSubsystemGuard() {
        SDL_SetHint(SDL_HINT_VIDEODRIVER, "dummy");
        if (SDL_Init(SDL_INIT_VIDEO) != 0) {
            throw std::runtime_error(SDL_GetError());
        }
        if (TTF_Init() != 0) {
            std::string err = TTF_GetError();
            SDL_Quit();
            throw std::runtime_error(err);
        }
    }

    ~SDLSubsystemGuard() {
        TTF_Quit();
        SDL_Quit();
    }
};

inline SDLSubsystemGuard& ensure_sdl() {
    static SDLSubsystemGuard guard;
    return guard;
}

// Software renderer over a small surface for render smoke tests.
class SoftwareCanvas {
public:
    SoftwareCanvas(int w = 640, int h = 480) {
        surface_ = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
        if (!surface_) throw std::runtime_error(SDL_GetError());
        renderer_ = SDL_CreateSoftwareRenderer(surface_);
        if (!renderer_) {
            std::string err = SDL_GetError();
            SDL_FreeSurface(surface_);
            throw std::runtime_error(err);
        }
        SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    }

    ~SoftwareCanvas() {
        SDL_DestroyRenderer(renderer_);
        SDL_FreeSurface(surface_);
    }

    SoftwareCanvas(const SoftwareCanvas&) = delete;
    SoftwareCanvas& operator=(const SoftwareCanvas&) = delete;

    SDL_Renderer* renderer() const { return renderer_; }

private:
    SDL_Surface* surface_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
};

// Fresh state for each test: manual clock at 1000 ms, light theme, no overlays.
inline void reset_environment() {
    ensure_sdl();
    wk::Clock::set_manual(1000);
    ThemeManager::instance().reset();
    OverlayManager::instance().clear();
    OverlayManager::instance().set_screen_size(1280, 720);
}

inline SDL_Event mouse_down(int x, int y, Uint8 button = SDL_BUTTON_LEFT, Uint8 clicks = 1) {
    SDL_Event e{};
    e.type = SDL_MOUSEBUTTONDOWN;
    e.button.button = button;
    e.button.x = x;
    e.button.y = y;
    e.button.clicks = clicks;
    return e;
}

inline SDL_Event mouse_up(int x, int y, Uint8 button = SDL_BUTTON_LEFT, Uint8 clicks = 1) {
    SDL_Event e{};
    e.type = SDL_MOUSEBUTTONUP;
    e.button.button = button;
    e.button.x = x;
    e.button.y = y;
    e.button.clicks = clicks;
    return e;
}

inline SDL_Event mouse_move(int x, int y) {
    SDL_Event e{};
    e.type = SDL_MOUSEMOTION;
    e.motion.x = x;
    e.motion.y = y;
    return e;
}

inline SDL_Event wheel(int dy) {
    SDL_Event e{};
    e.type = SDL_MOUSEWHEEL;
    e.wheel.y = dy;
    return e;
}

inline SDL_Event key_down(SDL_Keycode key, Uint16 mod = KMOD_NONE) {
    SDL_Event e{};
    e.type = SDL_KEYDOWN;
    e.key.keysym.sym = key;
    e.key.keysym.mod = mod;
    return e;
}

inline SDL_Event text_input(const std::string& s) {
    SDL_Event e{};
    e.type = SDL_TEXTINPUT;
    SDL_strlcpy(e.text.text, s.c_str(), sizeof(e.text.text));
    return e;
}

// Press and release at the centre of the widget.
inline bool click(Widget& w, Uint8 clicks = 1) {
    const SDL_Rect& r = w.rect();
    const int x = r.x + r.w / 2;
    const int y = r.y + r.h / 2;
    const bool a = w.handle_event(mouse_down(x, y, SDL_BUTTON_LEFT, clicks));
    const bool b = w.handle_event(mouse_up(x, y, SDL_BUTTON_LEFT, clicks));
    return a || b;
}

inline bool click_at(Widget& w, int x, int y, Uint8 clicks = 1) {
    const bool a = w.handle_event(mouse_down(x, y, SDL_BUTTON_LEFT, clicks));
    const bool b = w.handle_event(mouse_up(x, y, SDL_BUTTON_LEFT, clicks));
    return a || b;
}

inline void double_click(Widget& w) {
    click(w, 1);
    click(w, 2);
}

// Advances the manual clock in frame-sized steps, updating the widget and
// the overlay layer after each step.
inline void advance(Widget* w, Uint32 ms, Uint32 step = 16) {
    Uint32 done = 0;
    while (done < ms) {
        const Uint32 dt = std::min(step, ms - done);
        wk::Clock::advance(dt);
        if (w) w->update();
        OverlayManager::instance().update();
        done += dt;
    }
}

}
