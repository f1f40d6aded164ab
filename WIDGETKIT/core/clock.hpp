#pragma once

#include <SDL.h>
#include <functional>

namespace wk {

// Time source for timers and animations. Defaults to SDL_GetTicks(); a manual
// source makes timed behaviour reproducible.
class Clock {
public:
    static Uint32 now();
    static void set_manual(Uint32 t);
    static void advance(Uint32 dt);
    static void use_system();
    static bool is_manual() { return manual_; }

private:
    static inline bool manual_ = false;
    static inline Uint32 manual_now_ = 0;
};

}

// Polled timer. Call poll() from update(); the callback runs when due.
class Timer {
public:
    Timer() = default;
    explicit Timer(bool single_shot) : single_shot_(single_shot) {}

    void start(Uint32 delay_ms);
    void stop() { active_ = false; }
    bool is_active() const { return active_; }
    Uint32 interval() const { return interval_; }
    Uint32 remaining() const;
    void set_single_shot(bool s) { single_shot_ = s; }
    bool is_single_shot() const { return single_shot_; }
    void set_on_timeout(std::function<void()> cb) { on_timeout_ = std::move(cb); }

    // Returns true when the timer fired during this call.
    bool poll();

private:
    bool single_shot_ = true;
    bool active_ = false;
    Uint32 started_ = 0;
    Uint32 interval_ = 0;
    std::function<void()> on_timeout_{};
};
