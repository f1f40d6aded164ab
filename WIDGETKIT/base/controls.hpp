#pragma once

#include <SDL.h>
#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/text.hpp"
#include "core/widget.hpp"

class Label : public Widget {
public:
    explicit Label(const std::string& text = {}, const std::string& font_role = "default",
                   const std::string& color_role = "text");

    void set_text(const std::string& t) { text_ = t; }
    const std::string& text() const { return text_; }
    void set_font_role(const std::string& role) { font_role_ = role; }
    const std::string& font_role() const { return font_role_; }
    void set_color_role(const std::string& role) { color_role_ = role; has_color_ = false; }
    void set_color(SDL_Color c) { color_ = c; has_color_ = true; }
    void set_bold(bool b) { bold_ = b; }
    void set_font_size(int px) { font_size_ = px; }
    void set_alignment(wk_text::Align a) { align_ = a; }
    void set_word_wrap(bool w) { wrap_ = w; }
    bool word_wrap() const { return wrap_; }
    void set_elide(bool e) { elide_ = e; }

    LabelStyle style() const;

    int preferred_width() const override;
    int height_for_width(int w) const override;
    void render(SDL_Renderer* r) const override;

private:
    std::string text_;
    std::string font_role_;
    std::string color_role_;
    SDL_Color color_{0, 0, 0, 255};
    bool has_color_ = false;
    bool bold_ = false;
    int font_size_ = 0;
    wk_text::Align align_ = wk_text::Align::Left;
    bool wrap_ = false;
    bool elide_ = true;
};

// One of the named icons from wk_icons (or a literal glyph).
class IconGlyph : public Widget {
public:
    explicit IconGlyph(const std::string& name = {}, int size = 16, const std::string& color_role = "text");

    void set_icon(const std::string& name) { name_ = name; }
    const std::string& icon() const { return name_; }
    void set_icon_size(int s) { size_ = s; }
    int icon_size() const { return size_; }
    void set_color_role(const std::string& role) { color_role_ = role; has_color_ = false; }
    void set_color(SDL_Color c) { color_ = c; has_color_ = true; }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    void render(SDL_Renderer* r) const override;

private:
    std::string name_;
    int size_ = 16;
    std::string color_role_;
    SDL_Color color_{0, 0, 0, 255};
    bool has_color_ = false;
};

// Thin rule in the border color.
class Separator : public Widget {
public:
    explicit Separator(bool vertical = false) : vertical_(vertical) {}
    int preferred_width() const override;
    int height_for_width(int w) const override;
    void render(SDL_Renderer* r) const override;

private:
    bool vertical_;
};

// Filled circle, used as a status indicator.
class StatusDot : public Widget {
public:
    explicit StatusDot(const std::string& color_role = "success", int diameter = 12)
        : color_role_(color_role), diameter_(diameter) {}

    void set_color_role(const std::string& role) { color_role_ = role; has_color_ = false; }
    const std::string& color_role() const { return color_role_; }
    void set_color(SDL_Color c) { color_ = c; has_color_ = true; }
    SDL_Color color() const;
    void set_diameter(int d) { diameter_ = d; }
    int diameter() const { return diameter_; }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : diameter_; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : diameter_; }
    void render(SDL_Renderer* r) const override;

private:
    std::string color_role_;
    int diameter_;
    SDL_Color color_{0, 0, 0, 255};
    bool has_color_ = false;
};

class TextBox : public Widget {
public:
    using TextCallback = std::function<void(const std::string&)>;
    // Runs before the default key handling; returning true consumes the key.
    using KeyFilter = std::function<bool(const SDL_Event&)>;

    explicit TextBox(const std::string& text = {}, const std::string& placeholder = {}, bool multiline = false);

    // Emits text_changed when the text differs.
    void set_text(const std::string& t);
    const std::string& text() const { return text_; }
    void clear() { set_text(std::string()); }
    void insert_text(const std::string& s);

    void set_label(const std::string& l) { label_ = l; }
    const std::string& label() const { return label_; }
    void set_placeholder(const std::string& p) { placeholder_ = p; }
    const std::string& placeholder() const { return placeholder_; }
    void set_multiline(bool m) { multiline_ = m; }
    bool is_multiline() const { return multiline_; }
    void set_visible_rows(int rows) { rows_ = std::max(1, rows); }
    // In code points; 0 means unlimited.
    void set_max_length(size_t n);
    size_t max_length() const { return max_length_; }
    void set_password(bool p) { password_ = p; }
    bool is_password() const { return password_; }
    void set_read_only(bool ro) { read_only_ = ro; }
    bool is_read_only() const { return read_only_; }

    void set_focus(bool f);
    bool has_focus() const { return focused_; }
    size_t caret() const { return caret_; }
    void set_caret(size_t byte_pos);

    void set_on_text_changed(TextCallback cb) { on_text_changed_ = std::move(cb); }
    void set_on_submitted(TextCallback cb) { on_submitted_ = std::move(cb); }
    void set_on_focus_changed(std::function<void(bool)> cb) { on_focus_changed_ = std::move(cb); }
    void set_on_escape(std::function<void()> cb) { on_escape_ = std::move(cb); }
    void set_key_filter(KeyFilter f) { key_filter_ = std::move(f); }

    void set_enabled(bool e) override;
    void set_visible(bool v) override;

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

    const SDL_Rect& box_rect() const { return box_rect_; }
    static int height() { return 32; }

protected:
    void layout() override;

private:
    std::string display_text() const;
    int label_height(int width) const;
    int box_height() const;
    SDL_Rect inner_rect() const;
    size_t caret_from_point(SDL_Point p) const;
    void replace_text(std::string t, size_t caret);
    void move_caret_vertically(int delta);
    bool handle_key(const SDL_Event& e);

    std::string text_;
    std::string label_;
    std::string placeholder_;
    bool multiline_ = false;
    int rows_ = 4;
    size_t max_length_ = 0;
    bool password_ = false;
    bool read_only_ = false;
    bool focused_ = false;
    size_t caret_ = 0;
    SDL_Rect box_rect_{0, 0, 0, 0};
    TextCallback on_text_changed_{};
    TextCallback on_submitted_{};
    std::function<void(bool)> on_focus_changed_{};
    std::function<void()> on_escape_{};
    KeyFilter key_filter_{};
};

enum class CheckState { Unchecked, Partial, Checked };

class Checkbox : public Widget {
public:
    explicit Checkbox(const std::string& label = {}, bool checked = false);

    void set_text(const std::string& t) { label_ = t; }
    const std::string& text() const { return label_; }
    // Programmatic changes emit state_changed/toggled when the state differs.
    void set_checked(bool c) { set_state(c ? CheckState::Checked : CheckState::Unchecked); }
    bool is_checked() const { return state_ == CheckState::Checked; }
    void set_state(CheckState s);
    CheckState state() const { return state_; }
    // When on, clicks cycle Unchecked -> Partial -> Checked.
    void set_user_tristate(bool t) { user_tristate_ = t; }
    void toggle();

    void set_on_toggled(std::function<void(bool)> cb) { on_toggled_ = std::move(cb); }
    void set_on_state_changed(std::function<void(CheckState)> cb) { on_state_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

    static int height() { return 28; }
    static constexpr int kBoxSize = 16;

private:
    std::string label_;
    CheckState state_ = CheckState::Unchecked;
    bool user_tristate_ = false;
    ClickTracker click_;
    std::function<void(bool)> on_toggled_{};
    std::function<void(CheckState)> on_state_changed_{};
};

class DropdownList;

class Dropdown : public Widget {
public:
    using ChangedCallback = std::function<void(int, const std::string&)>;

    explicit Dropdown(const std::vector<std::string>& options = {}, int idx = 0, const std::string& label = {});
    ~Dropdown() override;

    void set_options(const std::vector<std::string>& options);
    const std::vector<std::string>& options() const { return options_; }
    void add_option(const std::string& o);
    int selected() const { return index_; }
    std::string selected_text() const;
    // Ignores out-of-range indices; emits changed only when the index differs.
    void set_selected(int idx);
    bool set_selected_text(const std::string& text);
    void set_label(const std::string& l) { label_ = l; }
    void set_placeholder(const std::string& p) { placeholder_ = p; }

    void open_list();
    void close_list();
    bool expanded() const { return expanded_; }

    void set_on_changed(ChangedCallback cb) { on_changed_ = std::move(cb); }

    void set_visible(bool v) override;
    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

    const SDL_Rect& box_rect() const { return box_rect_; }
    DropdownList* list() const { return list_.get(); }
    static constexpr int kItemHeight = 28;
    static constexpr int kMaxVisibleItems = 8;

protected:
    void layout() override;

private:
    friend class DropdownList;
    int label_height() const;
    void choose(int idx);

    std::string label_;
    std::string placeholder_;
    std::vector<std::string> options_;
    int index_ = -1;
    bool expanded_ = false;
    SDL_Rect box_rect_{0, 0, 0, 0};
    std::unique_ptr<DropdownList> list_;
    ChangedCallback on_changed_{};
};

// Option list a Dropdown shows on the overlay layer.
class DropdownList : public Widget {
public:
    explicit DropdownList(Dropdown& owner) : owner_(owner) {}
    ~DropdownList() override;

    int highlighted() const { return highlighted_; }
    void set_highlighted(int idx);
    int first_visible() const { return first_; }
    SDL_Rect item_rect(int idx) const;

    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    int visible_count() const;
    int index_at(SDL_Point p) const;

    Dropdown& owner_;
    int highlighted_ = -1;
    int first_ = 0;
};

class ProgressBar : public Widget {
public:
    explicit ProgressBar(int value = 0);

    // Clamped to [0, 100].
    void set_value(int v);
    int value() const { return value_; }
    void set_indeterminate(bool i) { indeterminate_ = i; }
    bool is_indeterminate() const { return indeterminate_; }
    void set_color_role(const std::string& role) { color_role_ = role; }
    const std::string& color_role() const { return color_role_; }
    void set_show_text(bool s) { show_text_ = s; }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    void update() override;
    void render(SDL_Renderer* r) const override;

private:
    int value_ = 0;
    bool indeterminate_ = false;
    bool show_text_ = false;
    std::string color_role_ = "primary";
    float phase_ = 0.0f;
};
