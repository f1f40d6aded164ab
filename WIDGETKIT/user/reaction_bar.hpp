#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/widget.hpp"

class ContextMenuPopup;

// Emoji reaction chips ("👍 3") followed by a "+" chip that opens a picker.
// Clicking a chip toggles the local user's reaction: +1 the first time, -1
// the second. A reaction whose count reaches zero disappears.
class ReactionBar : public Widget {
public:
    using Reaction = std::pair<std::string, int>;

    static constexpr int kChipPadX = 8;
    static constexpr int kChipPadY = 4;
    static constexpr int kSpacing = 4;

    explicit ReactionBar(const std::vector<Reaction>& reactions = {}, const std::vector<std::string>& own = {});
    ~ReactionBar() override;

    // Emojis offered by the picker.
    static const std::vector<std::string>& picker_emojis();

    void add_reaction(const std::string& emoji, int count = 1);
    void remove_reaction(const std::string& emoji, int count = 1);
    void toggle_reaction(const std::string& emoji);
    // Marks the emoji as the local user's without changing counts.
    void set_user_reaction(const std::string& emoji, bool reacted);
    void clear_reactions();

    int count(const std::string& emoji) const;
    bool has_reacted(const std::string& emoji) const;
    // In the order they first appeared.
    const std::vector<Reaction>& reactions() const { return reactions_; }
    const std::vector<std::string>& user_reactions() const { return own_; }

    void show_picker();
    ContextMenuPopup* picker() const { return picker_.get(); }

    SDL_Rect chip_rect(const std::string& emoji) const;
    SDL_Rect add_rect() const;

    void set_on_reaction_clicked(std::function<void(const std::string&)> cb) { on_reaction_clicked_ = std::move(cb); }
    void set_on_reaction_added(std::function<void(const std::string&)> cb) { on_reaction_added_ = std::move(cb); }
    void set_on_reaction_removed(std::function<void(const std::string&)> cb) { on_reaction_removed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

private:
    std::vector<Reaction>::iterator find(const std::string& emoji);
    std::string chip_text(const Reaction& reaction) const;
    int chip_height() const;
    // Chips left to right; the "+" chip is last.
    std::vector<SDL_Rect> chip_rects() const;
    int chip_at(SDL_Point p) const;
    void pick(const std::string& emoji);

    std::vector<Reaction> reactions_;
    std::vector<std::string> own_;
    std::unique_ptr<ContextMenuPopup> picker_;
    int hover_ = -1;
    int pressed_ = -1;
    std::function<void(const std::string&)> on_reaction_clicked_{};
    std::function<void(const std::string&)> on_reaction_added_{};
    std::function<void(const std::string&)> on_reaction_removed_{};
};
