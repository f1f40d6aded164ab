#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "base/base_button.hpp"
#include "core/animation.hpp"

// Round primary button with a drop shadow, normally parked in the
// bottom-right corner of a page.
class FloatingActionButton : public BaseButton {
public:
    static constexpr int kMargin = 20;

    explicit FloatingActionButton(const std::string& icon = "plus", int diameter = 56);

    int diameter() const { return diameter_; }
    // Moves the button to the bottom-right of `area`, kMargin from the edges.
    void place_in(const SDL_Rect& area);

    int preferred_width() const override;
    int height_for_width(int w) const override;
    void render(SDL_Renderer* r) const override;

private:
    int diameter_;
};

// Floating button that fans a column of smaller actions out above itself.
// Each action slides from the main button to its slot, staggered by 50 ms.
class SpeedDialFAB : public AnimatedWidget {
public:
    static constexpr int kActionSize = 40;
    static constexpr int kSpacing = 60;
    static constexpr Uint32 kExpandMs = 200;
    static constexpr Uint32 kStaggerMs = 50;
    static constexpr Uint32 kCollapseMs = 150;

    explicit SpeedDialFAB(const std::string& icon = "plus", int diameter = 56);
    ~SpeedDialFAB() override;

    // An empty name is derived from the label: "New File" -> "new_file".
    IconButton* add_action(const std::string& icon, const std::string& label, std::function<void()> cb = {},
                           const std::string& name = {});
    size_t action_count() const { return actions_.size(); }
    IconButton* action_button(size_t i) const;
    const std::string& action_label(size_t i) const;
    std::vector<std::string> action_names() const;
    // Runs the action, collapses and emits action_triggered.
    bool trigger(size_t i);

    // Does nothing without actions.
    void expand();
    void collapse();
    void toggle() { expanded_ ? collapse() : expand(); }
    bool is_expanded() const { return expanded_; }

    FloatingActionButton* main_button() const { return main_.get(); }
    // Slot an action occupies when fully expanded.
    SDL_Rect action_target(size_t i) const;
    void place_in(const SDL_Rect& area);

    void set_on_action_triggered(std::function<void(const std::string&)> cb) { on_action_triggered_ = std::move(cb); }
    void set_on_expanded_changed(std::function<void(bool)> cb) { on_expanded_changed_ = std::move(cb); }

    void set_visible(bool v) override;
    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    struct Action {
        std::unique_ptr<IconButton> button;
        std::string label;
        std::string name;
        std::function<void()> cb;
        // 0 = tucked behind the main button, 1 = at its slot.
        float progress = 0.0f;
    };

    SDL_Rect action_rect_at(size_t i, float progress) const;
    void place_action(size_t i);

    std::unique_ptr<FloatingActionButton> main_;
    std::string icon_;
    std::vector<Action> actions_;
    bool expanded_ = false;
    std::function<void(const std::string&)> on_action_triggered_{};
    std::function<void(bool)> on_expanded_changed_{};
};
