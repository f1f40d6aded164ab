#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/animation.hpp"
#include "core/layout.hpp"
#include "style/styles.hpp"

enum class ChipSize { Small, Medium, Large };

// Rounded label tinted by a status: info, success, warning, error, neutral,
// plus primary, active, inactive, pending and draft. Optionally shows a
// leading icon and a close cross.
class StatusChip : public AnimatedWidget {
public:
    explicit StatusChip(const std::string& text = {}, const std::string& status = "neutral",
                        ChipSize size = ChipSize::Medium);

    void set_text(const std::string& t) { text_ = t; }
    const std::string& text() const { return text_; }
    virtual void set_status(const std::string& status) { status_ = status; }
    const std::string& status() const { return status_; }
    void set_icon(const std::string& icon) { icon_ = icon; }
    const std::string& icon() const { return icon_; }
    void set_chip_size(ChipSize s) { size_ = s; }
    ChipSize chip_size() const { return size_; }
    void set_clickable(bool c) { clickable_ = c; }
    bool is_clickable() const { return clickable_; }
    void set_closable(bool c) { closable_ = c; }
    bool is_closable() const { return closable_; }

    // Background, text and border for a status under the current theme.
    static StatusStyle colors_for(const std::string& status);

    void set_on_clicked(std::function<void()> cb) { on_clicked_ = std::move(cb); }
    void set_on_close_requested(std::function<void()> cb) { on_close_requested_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

    SDL_Rect close_rect() const;

protected:
    virtual void on_chip_clicked();

    std::string text_;
    std::string status_;
    std::string icon_;
    ChipSize size_;
    bool clickable_ = false;
    bool closable_ = false;
    ClickTracker click_;
    ClickTracker close_click_;
    std::function<void()> on_clicked_{};
    std::function<void()> on_close_requested_{};
};

// Row of chips with uniform spacing.
class StatusChipGroup : public Widget {
public:
    explicit StatusChipGroup(BoxLayout::Direction dir = BoxLayout::Direction::Horizontal);

    StatusChip* add_chip(const std::string& text, const std::string& status = "neutral", bool clickable = false);
    // Removes the first chip with this text.
    bool remove_chip(const std::string& text);
    void clear();
    std::vector<StatusChip*> chips() const { return chips_; }
    StatusChip* find_chip(const std::string& text) const;

    void set_on_chip_clicked(std::function<void(const std::string&, const std::string&)> cb) {
        on_chip_clicked_ = std::move(cb);
    }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width(); }
    int height_for_width(int w) const override { return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w); }
    bool handle_event(const SDL_Event& e) override;
    void update() override { layout_->update(); }
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { layout_->set_rect(rect_); }

private:
    std::unique_ptr<BoxLayout> layout_;
    std::vector<StatusChip*> chips_;
    std::function<void(const std::string&, const std::string&)> on_chip_clicked_{};
};

// Chip that steps to the next status in its list on every click.
class InteractiveStatusChip : public StatusChip {
public:
    InteractiveStatusChip(const std::string& text, const std::vector<std::string>& statuses, int current = 0);

    void set_statuses(const std::vector<std::string>& statuses);
    const std::vector<std::string>& statuses() const { return statuses_; }
    int current_index() const { return index_; }
    void cycle();

    void set_on_status_changed(std::function<void(const std::string&)> cb) { on_status_changed_ = std::move(cb); }

protected:
    void on_chip_clicked() override;

private:
    std::vector<std::string> statuses_;
    int index_ = 0;
    std::function<void(const std::string&)> on_status_changed_{};
};

// Chip that pulses when its status changes.
class AnimatedStatusChip : public StatusChip {
public:
    static constexpr Uint32 kPulseMs = 200;

    using StatusChip::StatusChip;

    void set_status(const std::string& status) override;
    void pulse();
};

// "Label (N)", or just "N" without a label.
class CounterStatusChip : public StatusChip {
public:
    explicit CounterStatusChip(const std::string& label = {}, int count = 0, const std::string& status = "neutral");

    void set_count(int count);
    int count() const { return count_; }
    void increment() { set_count(count_ + 1); }
    // Never goes below 0.
    void decrement() { set_count(count_ - 1); }
    void set_label(const std::string& l);
    const std::string& label() const { return label_; }

private:
    void refresh();

    std::string label_;
    int count_ = 0;
};
