#include "reaction_bar.hpp"

#include <algorithm>

#include "base/base_popup.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kAddChipWidth = 36;
}

ReactionBar::ReactionBar(const std::vector<Reaction>& reactions, const std::vector<std::string>& own) {
    for (const auto& r : reactions) add_reaction(r.first, r.second);
    for (const auto& e : own) set_user_reaction(e, true);
}

ReactionBar::~ReactionBar() = default;

const std::vector<std::string>& ReactionBar::picker_emojis() {
    static const std::vector<std::string> emojis{ "👍", "👎", "❤️", "😂", "😮", "😢", "😡", "🎉", "👏", "🔥" };
    return emojis;
}

std::vector<ReactionBar::Reaction>::iterator ReactionBar::find(const std::string& emoji) {
    return std::find_if(reactions_.begin(), reactions_.end(), [&emoji](const Reaction& r) { return r.first == emoji; });
}

void ReactionBar::add_reaction(const std::string& emoji, int count) {
    if (emoji.empty() || count <= 0) return;
    auto it = find(emoji);
    if (it == reactions_.end()) {
        reactions_.emplace_back(emoji, count);
    } else {
        it->second += count;
    }
}

void ReactionBar::remove_reaction(const std::string& emoji, int count) {
    auto it = find(emoji);
    if (it == reactions_.end() || count <= 0) return;
    it->second = std::max(0, it->second - count);
    if (it->second == 0) {
        reactions_.erase(it);
        own_.erase(std::remove(own_.begin(), own_.end(), emoji), own_.end());
    }
}

void ReactionBar::toggle_reaction(const std::string& emoji) {
    if (has_reacted(emoji)) {
        own_.erase(std::remove(own_.begin(), own_.end(), emoji), own_.end());
        remove_reaction(emoji, 1);
        if (on_reaction_removed_) on_reaction_removed_(emoji);
    } else {
        add_reaction(emoji, 1);
        own_.push_back(emoji);
        if (on_reaction_added_) on_reaction_added_(emoji);
    }
    if (on_reaction_clicked_) on_reaction_clicked_(emoji);
}

void ReactionBar::set_user_reaction(const std::string& emoji, bool reacted) {
    const bool has = has_reacted(emoji);
    if (reacted && !has) {
        own_.push_back(emoji);
    } else if (!reacted && has) {
        own_.erase(std::remove(own_.begin(), own_.end(), emoji), own_.end());
    }
}

void ReactionBar::clear_reactions() {
    reactions_.clear();
    own_.clear();
    hover_ = -1;
    pressed_ = -1;
}

int ReactionBar::count(const std::string& emoji) const {
    for (const auto& r : reactions_) {
        if (r.first == emoji) return r.second;
    }
    return 0;
}

bool ReactionBar::has_reacted(const std::string& emoji) const {
    return std::find(own_.begin(), own_.end(), emoji) != own_.end();
}

void ReactionBar::pick(const std::string& emoji) {
    if (has_reacted(emoji)) return;
    add_reaction(emoji, 1);
    own_.push_back(emoji);
    if (on_reaction_added_) on_reaction_added_(emoji);
}

void ReactionBar::show_picker() {
    picker_ = std::make_unique<ContextMenuPopup>();
    for (const std::string& emoji : picker_emojis()) {
        picker_->add_action(emoji, [this, emoji]() { pick(emoji); });
    }
    const SDL_Rect add = add_rect();
    picker_->show_at_position(add.x, add.y + add.h + 4);
}

std::string ReactionBar::chip_text(const Reaction& reaction) const {
    return reaction.first + " " + std::to_string(reaction.second);
}

int ReactionBar::chip_height() const {
    return wk_text::line_height(Styles::Label("caption")) + 2 * kChipPadY;
}

std::vector<SDL_Rect> ReactionBar::chip_rects() const {
    const LabelStyle st = Styles::Label("caption");
    const int h = chip_height();
    const int y = rect_.y + (rect_.h - h) / 2;
    std::vector<SDL_Rect> out;
    int x = rect_.x;
    for (const auto& r : reactions_) {
        const int w = wk_text::width(st, chip_text(r)) + 2 * kChipPadX;
        out.push_back(SDL_Rect{ x, y, w, h });
        x += w + kSpacing;
    }
    out.push_back(SDL_Rect{ x, y, kAddChipWidth, h });
    return out;
}

SDL_Rect ReactionBar::chip_rect(const std::string& emoji) const {
    const std::vector<SDL_Rect> rects = chip_rects();
    for (size_t i = 0; i < reactions_.size(); ++i) {
        if (reactions_[i].first == emoji) return rects[i];
    }
    return SDL_Rect{ 0, 0, 0, 0 };
}

SDL_Rect ReactionBar::add_rect() const {
    return chip_rects().back();
}

int ReactionBar::chip_at(SDL_Point p) const {
    const std::vector<SDL_Rect> rects = chip_rects();
    for (size_t i = 0; i < rects.size(); ++i) {
        if (wk::point_in(rects[i], p)) return static_cast<int>(i);
    }
    return -1;
}

int ReactionBar::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const LabelStyle st = Styles::Label("caption");
    int w = kAddChipWidth;
    for (const auto& r : reactions_) w += wk_text::width(st, chip_text(r)) + 2 * kChipPadX + kSpacing;
    return w;
}

int ReactionBar::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : chip_height();
}

bool ReactionBar::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (e.type == SDL_MOUSEMOTION) {
        hover_ = hovered_ ? chip_at(wk::event_point(e)) : -1;
        return false;
    }
    if (wk::is_left_press(e)) {
        pressed_ = chip_at(wk::event_point(e));
        return pressed_ >= 0;
    }
    if (wk::is_left_release(e)) {
        const int index = pressed_;
        pressed_ = -1;
        if (index < 0) return false;
        if (chip_at(wk::event_point(e)) != index) return true;
        if (index == static_cast<int>(reactions_.size())) {
            show_picker();
        } else {
            const std::string emoji = reactions_[static_cast<size_t>(index)].first;
            toggle_reaction(emoji);
        }
        return true;
    }
    return false;
}

void ReactionBar::update() {
    if (picker_ && !picker_->is_visible() && !OverlayManager::instance().is_open(picker_.get())) picker_.reset();
}

void ReactionBar::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int radius = tm.border_radius("sm");
    const std::vector<SDL_Rect> rects = chip_rects();
    for (size_t i = 0; i < reactions_.size(); ++i) {
        const bool own = has_reacted(reactions_[i].first);
        const bool hot = static_cast<int>(i) == hover_;
        LabelStyle st = Styles::Label("caption", "text");
        SDL_Color bg = tm.color("surface");
        SDL_Color border = hot ? tm.color("primary") : tm.color("border");
        if (own) {
            bg = hot ? tm.color("dark") : tm.color("primary");
            border = tm.color("primary");
            st.color = wk::rgba(255, 255, 255);
        } else if (hot) {
            bg = tm.color("hover");
        }
        wk_draw::fill_rounded_rect(r, rects[i], radius, bg, alpha);
        wk_draw::draw_rounded_rect(r, rects[i], radius, border, alpha);
        wk_text::draw_in_rect(r, st, chip_text(reactions_[i]), rects[i], wk_text::Align::Center, alpha);
    }
    const SDL_Rect add = rects.back();
    const bool hot = hover_ == static_cast<int>(reactions_.size());
    wk_draw::fill_rounded_rect(r, add, radius, hot ? tm.color("hover") : tm.color("light"), alpha);
    wk_draw::draw_rounded_rect(r, add, radius, hot ? tm.color("primary") : tm.color("border"), alpha);
    const int s = add.h - 2 * kChipPadY;
    wk_icons::draw(r, "plus", wk_draw::centered(add, s, s), tm.color("text_secondary"), alpha);
}
