#include "selectable_card.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kMarkSize = 18;

// Check circle or radio dot that mirrors the owning card's selection.
class SelectionGlyph : public Widget {
public:
    SelectionGlyph(const BaseCard& card, SelectionMark mark) : card_(card), mark_(mark) {}

    int preferred_width() const override { return kMarkSize; }
    int height_for_width(int) const override { return kMarkSize; }
    void render(SDL_Renderer* r) const override {
        if (!visible_) return;
        const ThemeManager& tm = ThemeManager::instance();
        const float alpha = effective_opacity();
        const SDL_Rect box = wk_draw::centered(rect_, kMarkSize, kMarkSize);
        const int cx = box.x + kMarkSize / 2;
        const int cy = box.y + kMarkSize / 2;
        const bool on = card_.is_selected();
        const SDL_Color primary = tm.color("primary");
        if (mark_ == SelectionMark::Radio) {
            wk_draw::draw_circle(r, cx, cy, kMarkSize / 2, on ? primary : tm.color("border"), alpha);
            if (on) wk_draw::fill_circle(r, cx, cy, kMarkSize / 4, primary, alpha);
            return;
        }
        if (on) {
            wk_draw::fill_circle(r, cx, cy, kMarkSize / 2, primary, alpha);
            wk_draw::draw_check(r, wk_draw::inset(box, 4, 5), wk::rgba(255, 255, 255), alpha);
        } else {
            wk_draw::draw_circle(r, cx, cy, kMarkSize / 2, tm.color("border"), alpha);
        }
    }

private:
    const BaseCard& card_;
    SelectionMark mark_;
};
}

SelectableCard::SelectableCard(const std::string& title, const std::string& content, const std::string& value,
                               SelectionMark mark)
    : value_(value), mark_(mark) {
    set_selectable(true);
    set_title(title);
    if (mark_ != SelectionMark::None) add_header_action(std::make_unique<SelectionGlyph>(*this, mark_));
    auto label = std::make_unique<Label>(content, "default", "text_secondary");
    label->set_word_wrap(true);
    content_ = body_->add_widget(std::move(label));
    content_->set_visible(!content.empty());
}

void SelectableCard::set_content(const std::string& c) {
    content_->set_text(c);
    content_->set_visible(!c.empty());
}

const std::string& SelectableCard::content() const {
    return content_->text();
}

OptionCard::OptionCard(const std::string& title, const std::string& description, const std::string& value)
    : SelectableCard(title, description, value, SelectionMark::Radio) {}

OptionCard::~OptionCard() {
    if (group_) group_->remove_card(this);
}

void OptionCard::on_card_clicked() {
    set_selected(true);
    if (group_) group_->card_selected(this);
    if (on_clicked_) on_clicked_();
}

OptionCardGroup::~OptionCardGroup() {
    for (OptionCard* c : cards_) c->group_ = nullptr;
}

void OptionCardGroup::add_card(OptionCard* card) {
    if (!card || card->group_ == this) return;
    if (card->group_) card->group_->remove_card(card);
    cards_.push_back(card);
    card->group_ = this;
    if (card->is_selected()) card_selected(card);
}

void OptionCardGroup::remove_card(OptionCard* card) {
    auto it = std::find(cards_.begin(), cards_.end(), card);
    if (it == cards_.end()) return;
    cards_.erase(it);
    card->group_ = nullptr;
}

int OptionCardGroup::selected_index() const {
    for (size_t i = 0; i < cards_.size(); ++i) {
        if (cards_[i]->is_selected()) return static_cast<int>(i);
    }
    return -1;
}

std::string OptionCardGroup::selected_value() const {
    const int idx = selected_index();
    return idx >= 0 ? cards_[static_cast<size_t>(idx)]->value() : std::string();
}

void OptionCardGroup::set_selected_index(int idx) {
    if (idx < 0 || idx >= static_cast<int>(cards_.size())) return;
    OptionCard* card = cards_[static_cast<size_t>(idx)];
    card->set_selected(true);
    card_selected(card);
}

void OptionCardGroup::card_selected(OptionCard* card) {
    int idx = -1;
    for (size_t i = 0; i < cards_.size(); ++i) {
        if (cards_[i] == card) idx = static_cast<int>(i);
        else cards_[i]->set_selected(false);
    }
    if (idx >= 0 && on_selection_changed_) on_selection_changed_(idx, card->value());
}

MultiSelectCard::MultiSelectCard(const std::string& title) {
    set_hoverable(false);
    if (!title.empty()) set_title(title);
    body_->set_spacing(4);
}

Checkbox* MultiSelectCard::add_option(const std::string& text, const std::string& value, bool selected) {
    const size_t idx = options_.size();
    Checkbox* box = body_->add_widget(std::make_unique<Checkbox>(text));
    options_.push_back(Option{ box, value.empty() ? text : value });
    if (selected && (max_selection_ == 0 || selected_count() < max_selection_)) box->set_checked(true);
    box->set_on_toggled([this, idx](bool checked) { option_toggled(idx, checked); });
    return box;
}

size_t MultiSelectCard::selected_count() const {
    return static_cast<size_t>(std::count_if(options_.begin(), options_.end(),
                                             [](const Option& o) { return o.box->is_checked(); }));
}

void MultiSelectCard::option_toggled(size_t idx, bool checked) {
    if (batch_) return;
    if (checked && max_selection_ > 0 && selected_count() > max_selection_) {
        batch_ = true;
        options_[idx].box->set_checked(false);
        batch_ = false;
        return;
    }
    emit_changed();
}

std::vector<std::string> MultiSelectCard::selected_values() const {
    std::vector<std::string> out;
    for (const Option& o : options_) {
        if (o.box->is_checked()) out.push_back(o.value);
    }
    return out;
}

void MultiSelectCard::set_selected_values(const std::vector<std::string>& values) {
    batch_ = true;
    size_t count = 0;
    for (Option& o : options_) {
        bool want = std::find(values.begin(), values.end(), o.value) != values.end();
        if (want && max_selection_ > 0 && count >= max_selection_) want = false;
        if (want) ++count;
        o.box->set_checked(want);
    }
    batch_ = false;
    emit_changed();
}

void MultiSelectCard::clear_selection() {
    set_selected_values({});
}

void MultiSelectCard::select_all() {
    std::vector<std::string> all;
    for (const Option& o : options_) all.push_back(o.value);
    set_selected_values(all);
}

void MultiSelectCard::set_max_selection(size_t n) {
    max_selection_ = n;
    if (n == 0 || selected_count() <= n) return;
    batch_ = true;
    for (auto it = options_.rbegin(); it != options_.rend() && selected_count() > n; ++it) {
        if (it->box->is_checked()) it->box->set_checked(false);
    }
    batch_ = false;
    emit_changed();
}

void MultiSelectCard::emit_changed() {
    if (on_selection_changed_) on_selection_changed_(selected_values());
}

FilterCard::FilterCard(const std::string& title) {
    set_hoverable(false);
    set_title(title);
    body_->set_spacing(Spacing::label_gap());
}

FilterCard::Category* FilterCard::find_category(const std::string& name) {
    for (Category& c : categories_) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

const FilterCard::Category* FilterCard::find_category(const std::string& name) const {
    for (const Category& c : categories_) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

ToggleButton* FilterCard::find_chip(const std::string& category, const std::string& value) const {
    const Category* c = find_category(category);
    if (!c) return nullptr;
    for (const auto& chip : c->chips) {
        if (chip.first == value) return chip.second;
    }
    return nullptr;
}

ToggleButton* FilterCard::add_filter(const std::string& category, const std::string& value, bool active) {
    if (ToggleButton* existing = find_chip(category, value)) return existing;
    Category* c = find_category(category);
    if (!c) {
        if (!categories_.empty()) body_->add_spacing(Spacing::item_gap());
        body_->add(std::make_unique<Label>(category, "caption", "text_secondary"));
        auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::small_gap());
        row->set_alignment(BoxLayout::Align::Center);
        Category fresh;
        fresh.name = category;
        fresh.row = body_->add_widget(std::move(row));
        categories_.push_back(std::move(fresh));
        c = &categories_.back();
    }
    auto chip = std::make_unique<ToggleButton>(value);
    chip->set_size(ButtonSize::Small);
    chip->set_checked(active);
    chip->set_on_toggled([this](bool) { emit_changed(); });
    ToggleButton* raw = c->row->add_widget(std::move(chip));
    c->chips.emplace_back(value, raw);
    return raw;
}

bool FilterCard::set_filter_active(const std::string& category, const std::string& value, bool active) {
    ToggleButton* chip = find_chip(category, value);
    if (!chip) return false;
    if (chip->is_checked() != active) {
        chip->set_checked(active);
        emit_changed();
    }
    return true;
}

bool FilterCard::is_filter_active(const std::string& category, const std::string& value) const {
    const ToggleButton* chip = find_chip(category, value);
    return chip && chip->is_checked();
}

FilterCard::Filters FilterCard::active_filters() const {
    Filters out;
    for (const Category& c : categories_) {
        for (const auto& chip : c.chips) {
            if (chip.second->is_checked()) out[c.name].push_back(chip.first);
        }
    }
    return out;
}

void FilterCard::clear_filters() {
    bool changed = false;
    for (Category& c : categories_) {
        for (auto& chip : c.chips) {
            if (chip.second->is_checked()) {
                chip.second->set_checked(false);
                changed = true;
            }
        }
    }
    if (changed) emit_changed();
}

std::vector<std::string> FilterCard::categories() const {
    std::vector<std::string> out;
    for (const Category& c : categories_) out.push_back(c.name);
    return out;
}

void FilterCard::emit_changed() {
    if (on_filters_changed_) on_filters_changed_(active_filters());
}
