#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/layout.hpp"

class TextBox;

// Text that turns into an edit box on double click. Enter or losing focus
// commits the trimmed text, Escape restores it. A validator that rejects the
// text keeps the editor open with the previous value.
class InlineEditLabel : public Widget {
public:
    using Validator = std::function<bool(const std::string&)>;

    explicit InlineEditLabel(const std::string& text = {}, const std::string& placeholder = "Click to edit",
                             Validator validator = {});
    ~InlineEditLabel() override;

    // Does not emit.
    void set_text(const std::string& t);
    const std::string& text() const { return text_; }
    void set_placeholder(const std::string& p) { placeholder_ = p; }
    const std::string& placeholder() const { return placeholder_; }
    void set_validation(Validator v) { validator_ = std::move(v); }

    void start_editing();
    // Returns false when the validator rejected the text.
    bool finish_editing();
    void cancel_editing();
    bool is_editing() const { return editing_; }
    // Set after a rejected commit until the next edit starts.
    bool is_invalid() const { return invalid_; }
    TextBox* editor() const { return editor_.get(); }

    void set_on_text_changed(std::function<void(const std::string&)> cb) { on_text_changed_ = std::move(cb); }
    void set_on_editing_started(std::function<void()> cb) { on_editing_started_ = std::move(cb); }
    void set_on_editing_finished(std::function<void(const std::string&)> cb) { on_editing_finished_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    InlineEditLabel(const std::string& text, const std::string& placeholder, Validator validator, bool multiline);
    void layout() override;
    virtual bool starts_on_click(int clicks) const { return clicks >= 2; }

    std::string text_;
    std::string placeholder_;
    Validator validator_;
    bool multiline_;
    bool editing_ = false;
    bool invalid_ = false;
    std::unique_ptr<TextBox> editor_;
    ClickTracker click_;
    std::function<void(const std::string&)> on_text_changed_{};
    std::function<void()> on_editing_started_{};
    std::function<void(const std::string&)> on_editing_finished_{};
};

// Multi-line variant: the editor grows to four rows, Ctrl+Enter commits and
// the text wraps when displayed.
class MultilineInlineEdit : public InlineEditLabel {
public:
    explicit MultilineInlineEdit(const std::string& text = {}, const std::string& placeholder = "Click to edit");
};

// Inline edit with a built-in check: "email", "number", "phone", "url" or
// "text" (no check).
class ValidatedInlineEdit : public InlineEditLabel {
public:
    explicit ValidatedInlineEdit(const std::string& text = {}, const std::string& validation_type = "text");

    const std::string& validation_type() const { return type_; }

    static Validator validator_for(const std::string& validation_type);
    static std::string placeholder_for(const std::string& validation_type);

private:
    std::string type_;
};

// Starts editing on a single click.
class QuickEditLabel : public InlineEditLabel {
public:
    explicit QuickEditLabel(const std::string& text = {});

protected:
    bool starts_on_click(int clicks) const override { return clicks >= 1; }
};

// Labelled inline editors stacked in a column.
class InlineEditGroup : public Widget {
public:
    static constexpr int kLabelWidth = 100;

    InlineEditGroup();

    InlineEditLabel* add_field(const std::string& key, const std::string& label, const std::string& value = {},
                               const std::string& validation_type = "text");
    std::map<std::string, std::string> values() const;
    void set_values(const std::map<std::string, std::string>& values);
    InlineEditLabel* get_editor(const std::string& key) const;

    void set_on_group_changed(std::function<void(const std::map<std::string, std::string>&)> cb) {
        on_group_changed_ = std::move(cb);
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
    std::vector<std::pair<std::string, InlineEditLabel*>> editors_;
    std::function<void(const std::map<std::string, std::string>&)> on_group_changed_{};
};
