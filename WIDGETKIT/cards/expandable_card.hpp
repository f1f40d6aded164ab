#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "base/base_card.hpp"

class Label;

// Card whose body opens and closes under the header. Clicking anywhere in the
// header toggles it; the body height animates over kExpandMs.
class ExpandableCard : public BaseCard {
public:
    static constexpr Uint32 kExpandMs = 300;

    explicit ExpandableCard(const std::string& title = {}, const std::string& content = {},
                            bool expanded = false);

    void set_expanded(bool expanded, bool animated = true);
    bool is_expanded() const { return expanded_; }
    void toggle() { set_expanded(!expanded_); }
    // 0 when fully closed, 1 when fully open.
    float expand_progress() const { return progress_; }

    void set_content_text(const std::string& text);
    template <class T>
    T* set_content(std::unique_ptr<T> w) {
        content_label_ = nullptr;
        return set_body(std::move(w));
    }
    Widget* add_content_widget(std::unique_ptr<Widget> w);

    void set_on_expanded_changed(std::function<void(bool)> cb) { on_expanded_changed_ = std::move(cb); }

    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;

protected:
    void layout() override;
    void on_card_clicked() override;

private:
    void apply_progress(float p);

    bool expanded_ = false;
    float progress_ = 0.0f;
    SDL_Point press_point_{ -1, -1 };
    Label* content_label_ = nullptr;
    std::function<void(bool)> on_expanded_changed_{};
};

// Flat expandable section, used inside accordions and settings pages.
class CollapsibleSection : public ExpandableCard {
public:
    explicit CollapsibleSection(const std::string& title = {}, bool expanded = false);
};

// Stack of collapsible sections. Opening one closes the others unless
// multiple sections are allowed.
class AccordionCard : public BaseCard {
public:
    explicit AccordionCard(const std::string& title = {}, bool allow_multiple = false);

    CollapsibleSection* add_section(const std::string& title, const std::string& text);
    CollapsibleSection* add_section(const std::string& title, std::unique_ptr<Widget> content);
    size_t section_count() const { return sections_.size(); }
    CollapsibleSection* section(size_t i) const { return i < sections_.size() ? sections_[i] : nullptr; }

    void expand_section(size_t i);
    void collapse_section(size_t i);
    void collapse_all();
    // Indices of the open sections in order.
    std::vector<size_t> expanded_sections() const;

    // Turning it off keeps only the first open section open.
    void set_allow_multiple(bool allow);
    bool allow_multiple() const { return allow_multiple_; }

    void set_on_section_toggled(std::function<void(size_t, bool)> cb) { on_section_toggled_ = std::move(cb); }

private:
    CollapsibleSection* attach(std::unique_ptr<CollapsibleSection> section);
    void section_changed(CollapsibleSection* s, bool expanded);

    bool allow_multiple_;
    std::vector<CollapsibleSection*> sections_;
    std::function<void(size_t, bool)> on_section_toggled_{};
};

enum class StepStatus { Pending, Current, Completed };

// Numbered circle: the step number, or a check once completed.
class StepBadge : public Widget {
public:
    explicit StepBadge(int number, StepStatus status = StepStatus::Pending, int diameter = 28)
        : number_(number), status_(status), diameter_(diameter) {}

    void set_status(StepStatus s) { status_ = s; }
    StepStatus status() const { return status_; }
    int number() const { return number_; }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : diameter_; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : diameter_; }
    void render(SDL_Renderer* r) const override;

private:
    int number_;
    StepStatus status_;
    int diameter_;
};

// Expandable card for one step of a walkthrough, with a numbered badge
// and a status caption in the header.
class StepCard : public ExpandableCard {
public:
    StepCard(int step_number, const std::string& title = {}, StepStatus status = StepStatus::Pending);

    void set_status(StepStatus s);
    StepStatus status() const { return status_; }
    void set_completed(bool c) { set_status(c ? StepStatus::Completed : StepStatus::Pending); }
    bool is_completed() const { return status_ == StepStatus::Completed; }
    int step_number() const { return number_; }

    static std::string status_text(StepStatus s);

private:
    int number_;
    StepStatus status_;
    StepBadge* badge_ = nullptr;
    Label* status_label_ = nullptr;
};
