#include "inline_edit.hpp"

#include <algorithm>
#include <cstdlib>
#include <regex>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kPadX = 6;
constexpr int kMultilineMinHeight = 60;
constexpr int kEditorRows = 4;

bool valid_email(const std::string& t) {
    static const std::regex re(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    return std::regex_match(t, re);
}

bool valid_number(const std::string& t) {
    if (t.empty()) return false;
    char* end = nullptr;
    std::strtod(t.c_str(), &end);
    return end != t.c_str() && *end == '\0';
}

bool valid_phone(const std::string& t) {
    static const std::regex re(R"(^[\d\s\-\(\)\+]+$)");
    if (!std::regex_match(t, re)) return false;
    return std::count_if(t.begin(), t.end(), [](char c) { return c >= '0' && c <= '9'; }) >= 10;
}

bool valid_url(const std::string& t) {
    static const std::regex re(R"(^https?://[^\s/$.?#].[^\s]*$)");
    return std::regex_match(t, re);
}
}

InlineEditLabel::InlineEditLabel(const std::string& text, const std::string& placeholder, Validator validator)
    : InlineEditLabel(text, placeholder, std::move(validator), false) {}

InlineEditLabel::InlineEditLabel(const std::string& text, const std::string& placeholder, Validator validator,
                                 bool multiline)
    : text_(text), placeholder_(placeholder), validator_(std::move(validator)), multiline_(multiline),
      editor_(std::make_unique<TextBox>(text, placeholder, multiline)) {
    editor_->set_parent(this);
    if (multiline_) editor_->set_visible_rows(kEditorRows);
    editor_->hide();
    editor_->set_on_submitted([this](const std::string&) { finish_editing(); });
    editor_->set_on_escape([this]() { cancel_editing(); });
    editor_->set_on_focus_changed([this](bool focused) {
        if (!focused && editing_) finish_editing();
    });
}

InlineEditLabel::~InlineEditLabel() = default;

void InlineEditLabel::set_text(const std::string& t) {
    text_ = t;
    if (!editing_) editor_->set_text(t);
}

void InlineEditLabel::start_editing() {
    if (editing_ || !enabled_) return;
    editing_ = true;
    invalid_ = false;
    editor_->set_text(text_);
    editor_->show();
    layout();
    editor_->set_focus(true);
    if (on_editing_started_) on_editing_started_();
}

bool InlineEditLabel::finish_editing() {
    if (!editing_) return true;
    const std::string new_text = wk_text::trim(editor_->text());
    if (validator_ && !validator_(new_text)) {
        invalid_ = true;
        editor_->set_text(text_);
        return false;
    }
    const std::string old_text = text_;
    text_ = new_text;
    editing_ = false;
    editor_->hide();
    if (new_text != old_text && on_text_changed_) on_text_changed_(new_text);
    if (on_editing_finished_) on_editing_finished_(new_text);
    return true;
}

void InlineEditLabel::cancel_editing() {
    if (!editing_) return;
    editing_ = false;
    editor_->set_text(text_);
    editor_->hide();
}

int InlineEditLabel::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const std::string& shown = text_.empty() ? placeholder_ : text_;
    return std::max(120, wk_text::width(Styles::Label(), shown) + 2 * kPadX);
}

int InlineEditLabel::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    if (editing_) return editor_->height_for_width(w);
    if (!multiline_) return TextBox::height();
    const std::string& shown = text_.empty() ? placeholder_ : text_;
    const int h = wk_text::wrapped_height(Styles::Label(), shown, std::max(1, w - 2 * kPadX)) + 2 * kPadX;
    return std::max(kMultilineMinHeight, h);
}

void InlineEditLabel::layout() {
    editor_->set_rect(rect_);
}

bool InlineEditLabel::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (editing_) return editor_->handle_event(e);
    track_hover(e);
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
        if (starts_on_click(click_.clicks())) {
            click_.reset();
            start_editing();
        }
        return true;
    case ClickTracker::Result::Clicked:
    case ClickTracker::Result::Released:
        return true;
    default:
        return false;
    }
}

void InlineEditLabel::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    if (editing_) {
        editor_->render(r);
        if (invalid_) wk_draw::draw_rounded_rect(r, editor_->box_rect(), tm.border_radius("sm"), tm.color("danger"), alpha);
        return;
    }
    if (hovered_) {
        wk_draw::fill_rounded_rect(r, rect_, tm.border_radius("sm"), tm.color("surface"), alpha);
        wk_draw::draw_rounded_rect(r, rect_, tm.border_radius("sm"), tm.color("border"), alpha);
    }
    const bool empty = text_.empty();
    const LabelStyle st = Styles::Label("default", empty ? "text_secondary" : "text");
    const std::string& shown = empty ? placeholder_ : text_;
    if (multiline_) {
        wk_text::draw_wrapped(r, st, shown, rect_.x + kPadX, rect_.y + kPadX, std::max(1, rect_.w - 2 * kPadX), 0, alpha);
    } else {
        const SDL_Rect area{ rect_.x + kPadX, rect_.y, std::max(0, rect_.w - 2 * kPadX), rect_.h };
        wk_text::draw_in_rect(r, st, wk_text::elide(st, shown, area.w), area, wk_text::Align::Left, alpha);
    }
}

MultilineInlineEdit::MultilineInlineEdit(const std::string& text, const std::string& placeholder)
    : InlineEditLabel(text, placeholder, {}, true) {}

ValidatedInlineEdit::ValidatedInlineEdit(const std::string& text, const std::string& validation_type)
    : InlineEditLabel(text, placeholder_for(validation_type), validator_for(validation_type)), type_(validation_type) {}

InlineEditLabel::Validator ValidatedInlineEdit::validator_for(const std::string& validation_type) {
    if (validation_type == "email") return valid_email;
    if (validation_type == "number") return valid_number;
    if (validation_type == "phone") return valid_phone;
    if (validation_type == "url") return valid_url;
    return {};
}

std::string ValidatedInlineEdit::placeholder_for(const std::string& validation_type) {
    if (validation_type == "email") return "Enter email address";
    if (validation_type == "number") return "Enter number";
    if (validation_type == "phone") return "Enter phone number";
    if (validation_type == "url") return "Enter URL";
    return "Click to edit";
}

QuickEditLabel::QuickEditLabel(const std::string& text) : InlineEditLabel(text) {}

InlineEditGroup::InlineEditGroup() : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8)) {
    layout_->set_parent(this);
}

InlineEditLabel* InlineEditGroup::add_field(const std::string& key, const std::string& label, const std::string& value,
                                            const std::string& validation_type) {
    if (InlineEditLabel* existing = get_editor(key)) return existing;
    auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    row->set_alignment(BoxLayout::Align::Center);
    auto caption = std::make_unique<Label>(label + ":");
    caption->set_fixed_width(kLabelWidth);
    row->add(std::move(caption));
    std::unique_ptr<InlineEditLabel> editor;
    if (validation_type != "text") {
        editor = std::make_unique<ValidatedInlineEdit>(value, validation_type);
    } else {
        editor = std::make_unique<InlineEditLabel>(value);
    }
    editor->set_on_text_changed([this](const std::string&) {
        if (on_group_changed_) on_group_changed_(values());
    });
    InlineEditLabel* raw = row->add_widget(std::move(editor), 1);
    layout_->add(std::move(row));
    editors_.emplace_back(key, raw);
    layout();
    return raw;
}

std::map<std::string, std::string> InlineEditGroup::values() const {
    std::map<std::string, std::string> out;
    for (const auto& kv : editors_) out[kv.first] = kv.second->text();
    return out;
}

void InlineEditGroup::set_values(const std::map<std::string, std::string>& values) {
    for (const auto& kv : values) {
        if (InlineEditLabel* ed = get_editor(kv.first)) ed->set_text(kv.second);
    }
}

InlineEditLabel* InlineEditGroup::get_editor(const std::string& key) const {
    for (const auto& kv : editors_) {
        if (kv.first == key) return kv.second;
    }
    return nullptr;
}

bool InlineEditGroup::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void InlineEditGroup::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}
