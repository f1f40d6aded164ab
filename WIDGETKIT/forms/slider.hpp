#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>

#include "core/layout.hpp"
#include "core/widget.hpp"

class Label;
class TextBox;

namespace wk {
// Whole-string integer parse ("  42 " is fine, "4x" is not). Returns false
// when the text is not a number.
bool parse_int(const std::string& text, int& out);
}

// Horizontal integer slider: optional caption above, track with a 12x16 knob
// and the current value at the right. Clicking the value opens an edit box.
class Slider : public Widget {
public:
    static constexpr int kControlHeight = 40;
    static constexpr int kValueWidth = 60;
    static constexpr int kKnobWidth = 12;
    static constexpr int kKnobHeight = 16;

    Slider(int min_val = 0, int max_val = 100, int value = 0, const std::string& label = {});
    ~Slider() override;

    // Clamped to the range; emits value_changed when the value differs.
    void set_value(int v);
    int value() const { return value_; }
    void set_range(int min_val, int max_val);
    int minimum() const { return min_; }
    int maximum() const { return max_; }
    void set_label(const std::string& l) { label_ = l; }
    const std::string& label() const { return label_; }
    // Hides the value column so the track uses the full width.
    void set_value_visible(bool v) { show_value_ = v; }
    bool is_dragging() const { return dragging_; }
    bool is_editing() const { return edit_box_ != nullptr; }
    TextBox* edit_box() const { return edit_box_.get(); }

    SDL_Rect track_rect() const;
    SDL_Rect knob_rect() const;
    SDL_Rect value_rect() const;
    int value_for_x(int x) const;
    int x_for_value(int v) const;

    void set_on_value_changed(std::function<void(int)> cb) { on_value_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    int label_height() const;
    SDL_Rect content_rect() const;
    void begin_edit();
    void finish_edit(bool commit);

    std::string label_;
    int min_;
    int max_;
    int value_;
    bool show_value_ = true;
    bool dragging_ = false;
    bool knob_hovered_ = false;
    std::unique_ptr<TextBox> edit_box_;
    std::function<void(int)> on_value_changed_{};
};

// Slider paired with a numeric box and an optional suffix; the min and max
// are printed under the track. Invalid box input reverts to the slider value.
class SliderWithInput : public Widget {
public:
    static constexpr int kInputWidth = 70;

    SliderWithInput(int min_val = 0, int max_val = 100, int value = 0, const std::string& suffix = {},
                    const std::string& label = {});

    void set_value(int v);
    int value() const;
    void set_range(int min_val, int max_val);
    void set_suffix(const std::string& s);
    const std::string& suffix() const { return suffix_; }
    void set_label(const std::string& l);

    Slider* slider() const { return slider_; }
    TextBox* input() const { return input_; }

    void set_on_value_changed(std::function<void(int)> cb) { on_value_changed_ = std::move(cb); }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width(); }
    int height_for_width(int w) const override { return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w); }
    bool handle_event(const SDL_Event& e) override;
    void update() override { layout_->update(); }
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { layout_->set_rect(rect_); }

private:
    void commit_input();
    void sync_input();

    std::unique_ptr<BoxLayout> layout_;
    Label* label_ = nullptr;
    Slider* slider_ = nullptr;
    TextBox* input_ = nullptr;
    Label* suffix_label_ = nullptr;
    Label* min_label_ = nullptr;
    Label* max_label_ = nullptr;
    std::string suffix_;
    std::function<void(int)> on_value_changed_{};
};

// Two knobs on one track. The low value never exceeds the high value; the
// values are printed at both ends and open an edit box on double click.
class RangeSlider : public Widget {
public:
    static constexpr int kLabelWidth = 40;

    RangeSlider(int min_val = 0, int max_val = 100, int low = 20, int high = 80);
    ~RangeSlider() override;

    // Clamped to [minimum, high].
    void set_low(int v);
    // Clamped to [low, maximum].
    void set_high(int v);
    // Swaps a reversed pair.
    void set_values(int low, int high);
    int low() const { return low_; }
    int high() const { return high_; }
    int minimum() const { return min_; }
    int maximum() const { return max_; }
    bool is_editing() const { return edit_box_ != nullptr; }
    TextBox* edit_box() const { return edit_box_.get(); }

    SDL_Rect track_rect() const;
    SDL_Rect low_knob_rect() const;
    SDL_Rect high_knob_rect() const;
    SDL_Rect low_label_rect() const;
    SDL_Rect high_label_rect() const;
    int value_for_x(int x) const;

    void set_on_range_changed(std::function<void(int, int)> cb) { on_range_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    enum class Knob { None, Low, High };

    SDL_Rect knob_at(int value) const;
    void apply(int low, int high);
    void begin_edit(Knob which);
    void finish_edit(bool commit);

    int min_;
    int max_;
    int low_ = 0;
    int high_ = 0;
    Knob dragging_ = Knob::None;
    Knob hovered_knob_ = Knob::None;
    Knob editing_ = Knob::None;
    std::unique_ptr<TextBox> edit_box_;
    std::function<void(int, int)> on_range_changed_{};
};
