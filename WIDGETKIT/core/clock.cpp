#include "clock.hpp"

namespace wk {

Uint32 Clock::now() {
    return manual_ ? manual_now_ : SDL_GetTicks();
}

void Clock::set_manual(Uint32 t) {
    manual_ = true;
    manual_now_ = t;
}

void Clock::advance(Uint32 dt) {
    if (!manual_) {
        set_manual(SDL_GetTicks());
    }
    manual_now_ += dt;
}

void Clock::use_system() {
    manual_ = false;
}

}

void Timer::start(Uint32 delay_ms) {
    interval_ = delay_ms;
    started_ = wk::Clock::now();
    active_ = true;
}

Uint32 Timer::remaining() const {
    if (!active_) return 0;
    const Uint32 elapsed = wk::Clock::now() - started_;
    return elapsed >= interval_ ? 0 : interval_ - elapsed;
}

bool Timer::poll() {
    if (!active_) return false;
    const Uint32 now = wk::Clock::now();
    if (now - started_ < interval_) return false;
    if (single_shot_) {
        active_ = false;
    } else {
        started_ = now;
    }
    if (on_timeout_) {
        auto cb = on_timeout_;
        cb();
    }
    return true;
}
