#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "base/base_card.hpp"

class Checkbox;
class Label;
class ToggleButton;

enum class SelectionMark { None, Check, Radio };

// Card selected by clicking it. The mark in the header shows the state.
class SelectableCard : public BaseCard {
public:
    SelectableCard(const std::string& title = {}, const std::string& content = {},
                   const std::string& value = {}, SelectionMark mark = SelectionMark::Check);

    void set_value(const std::string& v) { value_ = v; }
    // Falls back to the title when no value was given.
    std::string value() const { return value_.empty() ? title() : value_; }
    void set_content(const std::string& c);
    const std::string& content() const;
    SelectionMark mark() const { return mark_; }

private:
    std::string value_;
    SelectionMark mark_;
    Label* content_ = nullptr;
};

class OptionCardGroup;

// Radio-like card: a click selects but never deselects.
class OptionCard : public SelectableCard {
public:
    OptionCard(const std::string& title = {}, const std::string& description = {},
               const std::string& value = {});
    ~OptionCard() override;

protected:
    void on_card_clicked() override;

private:
    friend class OptionCardGroup;
    OptionCardGroup* group_ = nullptr;
};

// Keeps one OptionCard selected at a time. Does not own the cards.
class OptionCardGroup {
public:
    OptionCardGroup() = default;
    ~OptionCardGroup();
    OptionCardGroup(const OptionCardGroup&) = delete;
    OptionCardGroup& operator=(const OptionCardGroup&) = delete;

    void add_card(OptionCard* card);
    void remove_card(OptionCard* card);
    const std::vector<OptionCard*>& cards() const { return cards_; }
    int selected_index() const;
    std::string selected_value() const;
    void set_selected_index(int idx);

    void set_on_selection_changed(std::function<void(int, const std::string&)> cb) {
        on_selection_changed_ = std::move(cb);
    }

private:
    friend class OptionCard;
    void card_selected(OptionCard* card);

    std::vector<OptionCard*> cards_;
    std::function<void(int, const std::string&)> on_selection_changed_{};
};

// Card holding a checklist of options, optionally capped.
class MultiSelectCard : public BaseCard {
public:
    explicit MultiSelectCard(const std::string& title = {});

    // `value` defaults to the text.
    Checkbox* add_option(const std::string& text, const std::string& value = {}, bool selected = false);
    size_t option_count() const { return options_.size(); }
    Checkbox* option(size_t i) const { return i < options_.size() ? options_[i].box : nullptr; }

    std::vector<std::string> selected_values() const;
    void set_selected_values(const std::vector<std::string>& values);
    void clear_selection();
    // Selects in order until the cap is reached.
    void select_all();
    // 0 means unlimited. Lowering it deselects the excess from the end.
    void set_max_selection(size_t n);
    size_t max_selection() const { return max_selection_; }

    void set_on_selection_changed(std::function<void(const std::vector<std::string>&)> cb) {
        on_selection_changed_ = std::move(cb);
    }

private:
    struct Option {
        Checkbox* box;
        std::string value;
    };
    size_t selected_count() const;
    void option_toggled(size_t idx, bool checked);
    void emit_changed();

    std::vector<Option> options_;
    size_t max_selection_ = 0;
    bool batch_ = false;
    std::function<void(const std::vector<std::string>&)> on_selection_changed_{};
};

// Filter chips grouped by category.
class FilterCard : public BaseCard {
public:
    using Filters = std::map<std::string, std::vector<std::string>>;

    explicit FilterCard(const std::string& title = "Filters");

    ToggleButton* add_filter(const std::string& category, const std::string& value, bool active = false);
    bool set_filter_active(const std::string& category, const std::string& value, bool active);
    bool is_filter_active(const std::string& category, const std::string& value) const;
    // Active values per category, categories with nothing active left out.
    Filters active_filters() const;
    void clear_filters();
    std::vector<std::string> categories() const;

    void set_on_filters_changed(std::function<void(const Filters&)> cb) { on_filters_changed_ = std::move(cb); }

private:
    struct Category {
        std::string name;
        BoxLayout* row = nullptr;
        std::vector<std::pair<std::string, ToggleButton*>> chips;
    };
    Category* find_category(const std::string& name);
    const Category* find_category(const std::string& name) const;
    ToggleButton* find_chip(const std::string& category, const std::string& value) const;
    void emit_changed();

    std::vector<Category> categories_;
    std::function<void(const Filters&)> on_filters_changed_{};
};
