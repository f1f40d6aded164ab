#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/widget.hpp"

class TextBox;

// Rounded tag with an optional remove cross.
class TagChip : public Widget {
public:
    static constexpr int kHeight = 24;
    static constexpr int kCloseSize = 16;
    static constexpr int kMaxWidth = 200;

    explicit TagChip(const std::string& text, bool removable = true);

    const std::string& text() const { return text_; }
    bool is_removable() const { return removable_; }
    // Solid fill with white text; without one the chip uses the theme surface.
    void set_color(SDL_Color c) { color_ = c; has_color_ = true; }
    bool has_color() const { return has_color_; }
    SDL_Color color() const { return color_; }
    SDL_Rect close_rect() const;

    void set_on_remove(std::function<void()> cb) { on_remove_ = std::move(cb); }
    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    std::string text_;
    bool removable_;
    SDL_Color color_{0, 0, 0, 255};
    bool has_color_ = false;
    bool close_hovered_ = false;
    ClickTracker click_;
    ClickTracker close_click_;
    std::function<void()> on_remove_{};
    std::function<void()> on_clicked_{};
};

namespace wk {
// Lays the widgets out left to right inside `area`, wrapping when a row is
// full. Returns the height used.
int flow_layout(const std::vector<Widget*>& items, const SDL_Rect& area, int gap, bool apply = true);
}

// Tag editor: chips above a text box. Enter, comma or semicolon commits the
// typed text; Backspace in an empty box removes the last tag. Typing shows up
// to ten matching suggestions under the box.
class TagInput : public Widget {
public:
    static constexpr int kMaxSuggestions = 10;
    static constexpr int kSuggestionHeight = 28;
    static constexpr int kChipGap = 4;

    explicit TagInput(const std::string& placeholder = "Add tags...", const std::vector<std::string>& suggestions = {},
                      size_t max_tags = 0);
    ~TagInput() override;

    // Rejects empty, duplicate and over-limit tags.
    bool add_tag(const std::string& tag);
    bool remove_tag(const std::string& tag);
    void clear_tags();
    void set_tags(const std::vector<std::string>& tags);
    const std::vector<std::string>& tags() const { return tags_; }
    bool has_tag(const std::string& tag) const;
    TagChip* chip(const std::string& tag) const;

    void set_suggestions(const std::vector<std::string>& s);
    const std::vector<std::string>& suggestions() const { return suggestions_; }
    const std::vector<std::string>& visible_suggestions() const { return filtered_; }
    int highlighted_suggestion() const { return highlighted_; }
    // 0 means unlimited. Lowering the limit drops tags from the end.
    void set_max_tags(size_t n);
    size_t max_tags() const { return max_tags_; }
    void set_placeholder(const std::string& p);
    TextBox* input() const { return input_.get(); }

    void set_on_tag_added(std::function<void(const std::string&)> cb) { on_tag_added_ = std::move(cb); }
    void set_on_tag_removed(std::function<void(const std::string&)> cb) { on_tag_removed_ = std::move(cb); }
    void set_on_tags_changed(std::function<void(const std::vector<std::string>&)> cb) {
        on_tags_changed_ = std::move(cb);
    }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

    SDL_Rect suggestion_rect(int idx) const;

protected:
    void layout() override;
    virtual void on_chip_created(TagChip& chip) { (void)chip; }

private:
    void commit_input();
    void refresh_suggestions();
    void update_placeholder();
    void flush_pending_removal();
    std::vector<Widget*> chip_widgets() const;
    int chips_height(int w) const;

    std::string placeholder_;
    std::vector<std::string> tags_;
    std::vector<std::unique_ptr<TagChip>> chips_;
    std::unique_ptr<TextBox> input_;
    std::vector<std::string> suggestions_;
    std::vector<std::string> filtered_;
    int highlighted_ = -1;
    size_t max_tags_;
    std::string pending_removal_;
    std::function<void(const std::string&)> on_tag_added_{};
    std::function<void(const std::string&)> on_tag_removed_{};
    std::function<void(const std::vector<std::string>&)> on_tags_changed_{};
};

// At most five tags.
class CompactTagInput : public TagInput {
public:
    CompactTagInput();
};

// Tags drawn in per-tag colors.
class ColoredTagInput : public TagInput {
public:
    explicit ColoredTagInput(const std::map<std::string, SDL_Color>& colors = {});

    // Recolors the chip if the tag is already present.
    void set_tag_color(const std::string& tag, SDL_Color c);
    bool tag_color(const std::string& tag, SDL_Color& out) const;

protected:
    void on_chip_created(TagChip& chip) override;

private:
    std::map<std::string, SDL_Color> colors_;
};

// Non-editable chips that report clicks.
class TagDisplay : public Widget {
public:
    explicit TagDisplay(const std::vector<std::string>& tags = {});

    void set_tags(const std::vector<std::string>& tags);
    const std::vector<std::string>& tags() const { return tags_; }

    void set_on_tag_clicked(std::function<void(const std::string&)> cb) { on_tag_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    std::vector<Widget*> chip_widgets() const;

    std::vector<std::string> tags_;
    std::vector<std::unique_ptr<TagChip>> chips_;
    std::function<void(const std::string&)> on_tag_clicked_{};
};
