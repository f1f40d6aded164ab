#include "overlay_manager.hpp"

#include <algorithm>
#include <utility>

#include "widget.hpp"

OverlayManager& OverlayManager::instance() {
    static OverlayManager manager;
    return manager;
}

namespace {

void run_dismiss(OverlayManager::DismissCallback& callback, Widget* w) {
    if (callback) {
        callback();
    } else if (w) {
        w->set_visible(false);
    }
}

}

int OverlayManager::find(const Widget* w) const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].widget == w) return static_cast<int>(i);
    }
    return -1;
}

std::vector<Widget*> OverlayManager::snapshot() const {
    std::vector<Widget*> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) out.push_back(entry.widget);
    return out;
}

void OverlayManager::open(Widget* w, Mode mode, DismissCallback on_dismiss, const std::string& group) {
    if (!w) {
        return;
    }

    const int existing = find(w);
    if (existing >= 0) {
        entries_.erase(entries_.begin() + existing);
    }

    if (!group.empty()) {
        std::vector<Entry> evicted;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->group == group) {
                evicted.push_back(std::move(*it));
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto& entry : evicted) {
            run_dismiss(entry.on_dismiss, entry.widget);
        }
    }

    Entry entry;
    entry.widget = w;
    entry.mode = mode;
    entry.on_dismiss = std::move(on_dismiss);
    entry.group = group;
    entries_.push_back(std::move(entry));
}

bool OverlayManager::close(const Widget* w) {
    const int idx = find(w);
    if (idx < 0) return false;
    entries_.erase(entries_.begin() + idx);
    return true;
}

bool OverlayManager::dismiss(const Widget* w) {
    const int idx = find(w);
    if (idx < 0) return false;
    Entry entry = std::move(entries_[static_cast<size_t>(idx)]);
    entries_.erase(entries_.begin() + idx);
    run_dismiss(entry.on_dismiss, entry.widget);
    return true;
}

bool OverlayManager::is_open(const Widget* w) const {
    return find(w) >= 0;
}

Widget* OverlayManager::top() const {
    return entries_.empty() ? nullptr : entries_.back().widget;
}

bool OverlayManager::has_modal() const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [](const Entry& e) { return e.mode == Mode::Modal; });
}

bool OverlayManager::handle_event(const SDL_Event& e) {
    const auto widgets = snapshot();
    for (auto it = widgets.rbegin(); it != widgets.rend(); ++it) {
        Widget* w = *it;
        const int idx = find(w);
        if (idx < 0) continue;
        const Mode mode = entries_[static_cast<size_t>(idx)].mode;

        if (mode == Mode::Modal) {
            w->handle_event(e);
            return true;
        }
        if (mode == Mode::LightDismiss) {
            if (e.type == SDL_MOUSEBUTTONDOWN) {
                SDL_Point p{ e.button.x, e.button.y };
                if (!wk::point_in(w->rect(), p)) {
                    dismiss(w);
                    return true;
                }
            }
            if (w->handle_event(e)) return true;
            if (wk::is_key(e, SDLK_ESCAPE)) {
                dismiss(w);
                return true;
            }
            continue;
        }
        if (w->is_visible() && w->handle_event(e)) return true;
    }
    return false;
}

void OverlayManager::update() {
    const auto widgets = snapshot();
    for (Widget* w : widgets) {
        if (find(w) < 0) continue;
        w->update();
    }
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [](const Entry& e) { return !e.widget->is_visible(); }),
                   entries_.end());
}

void OverlayManager::render(SDL_Renderer* r) const {
    for (const auto& entry : entries_) {
        if (entry.widget->is_visible()) entry.widget->render(r);
    }
}

void OverlayManager::set_screen_size(int w, int h) {
    screen_w_ = std::max(1, w);
    screen_h_ = std::max(1, h);
}

SDL_Rect OverlayManager::clamp_to_screen(const SDL_Rect& r) const {
    SDL_Rect out = r;
    if (out.x + out.w > screen_w_) out.x = screen_w_ - out.w;
    if (out.y + out.h > screen_h_) out.y = screen_h_ - out.h;
    out.x = std::max(0, out.x);
    out.y = std::max(0, out.y);
    return out;
}

void OverlayManager::clear() {
    entries_.clear();
}
