#pragma once

#include <SDL.h>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/layout.hpp"

class BaseButton;
class Label;
class ProgressBar;

// Row of numbered circles joined by connectors. Completed steps are drawn in
// the success color with a check, the current step in primary, pending steps
// in the border color.
class StepProgressIndicator : public Widget {
public:
    static constexpr int kHeight = 80;
    static constexpr int kCircleRadius = 15;
    static constexpr int kCircleY = 25;
    static constexpr int kMargin = 20;

    StepProgressIndicator() = default;

    void add_step(const std::string& title, const std::string& description = {});
    void remove_step(int index);
    int step_count() const { return static_cast<int>(steps_.size()); }
    const std::string& step_title(int index) const;

    void set_current_step(int index) { current_ = index; }
    int current_step() const { return current_; }
    void set_completed_steps(const std::set<int>& completed) { completed_ = completed; }
    bool is_completed(int index) const { return completed_.count(index) > 0; }

    // Centre of the circle for `index` in screen coordinates.
    SDL_Point circle_center(int index) const;

    int preferred_width() const override;
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : kHeight; }
    void render(SDL_Renderer* r) const override;

private:
    struct Step {
        std::string title;
        std::string description;
    };

    std::vector<Step> steps_;
    int current_ = 0;
    std::set<int> completed_;
};

// Multi-step form: a progress indicator, the current step's page and
// Previous / Next / Finish buttons. Moving forward runs the step's validator
// first; a step passed with Next or Finish is marked completed.
class FormStepper : public Widget {
public:
    using Validator = std::function<bool()>;

    FormStepper();
    ~FormStepper() override;

    Widget* add_step(const std::string& title, std::unique_ptr<Widget> widget, const std::string& description = {},
                     Validator validator = {});
    template <class T>
    T* add_step_widget(const std::string& title, std::unique_ptr<T> widget, const std::string& description = {},
                       Validator validator = {}) {
        T* raw = widget.get();
        add_step(title, std::move(widget), description, std::move(validator));
        return raw;
    }
    void remove_step(int index);

    // Returns false when already on the last step or validation failed.
    bool next_step();
    bool previous_step();
    // Out-of-range indices are ignored.
    void go_to_step(int index);
    // Validates and completes the last step, then emits form_completed.
    bool finish();
    void reset_form();

    int current_step() const { return current_; }
    int step_count() const { return static_cast<int>(steps_.size()); }
    bool is_step_completed(int index) const { return completed_.count(index) > 0; }
    Widget* step_widget(int index) const;
    const std::string& step_title(int index) const;

    void set_step_data(int index, const nlohmann::json& data) { data_[index] = data; }
    // Empty object for steps without data.
    nlohmann::json get_step_data(int index) const;
    // Object keyed by the step index as a string.
    nlohmann::json get_all_data() const;

    StepProgressIndicator* indicator() const { return indicator_; }
    BaseButton* previous_button() const { return prev_; }
    BaseButton* next_button() const { return next_; }
    BaseButton* finish_button() const { return finish_; }

    void set_on_step_changed(std::function<void(int)> cb) { on_step_changed_ = std::move(cb); }
    void set_on_step_completed(std::function<void(int)> cb) { on_step_completed_ = std::move(cb); }
    void set_on_form_completed(std::function<void(const nlohmann::json&)> cb) { on_form_completed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override { layout_->update(); }
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { layout_->set_rect(rect_); }

private:
    struct Step {
        std::string title;
        std::string description;
        Widget* widget = nullptr;
        Validator validator;
    };

    bool validate_current() const;
    void complete(int index);
    void update_current_step();
    void update_navigation();

    std::unique_ptr<BoxLayout> layout_;
    StepProgressIndicator* indicator_ = nullptr;
    StackedLayout* stack_ = nullptr;
    BaseButton* prev_ = nullptr;
    BaseButton* next_ = nullptr;
    BaseButton* finish_ = nullptr;
    std::vector<Step> steps_;
    int current_ = 0;
    std::set<int> completed_;
    std::map<int, nlohmann::json> data_;
    std::function<void(int)> on_step_changed_{};
    std::function<void(int)> on_step_completed_{};
    std::function<void(const nlohmann::json&)> on_form_completed_{};
};

// Progress bar, "Step X of N: title" and Previous / Next buttons, without
// pages or validation.
class SimpleFormStepper : public Widget {
public:
    explicit SimpleFormStepper(const std::vector<std::string>& steps);
    ~SimpleFormStepper() override;

    bool next_step();
    bool previous_step();
    int current_step() const { return current_; }
    int step_count() const { return static_cast<int>(titles_.size()); }
    std::string step_text() const;
    ProgressBar* progress_bar() const { return progress_; }

    void set_on_step_changed(std::function<void(int)> cb) { on_step_changed_ = std::move(cb); }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width(); }
    int height_for_width(int w) const override { return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w); }
    bool handle_event(const SDL_Event& e) override;
    void update() override { layout_->update(); }
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { layout_->set_rect(rect_); }

private:
    void update_ui();

    std::vector<std::string> titles_;
    int current_ = 0;
    std::unique_ptr<BoxLayout> layout_;
    ProgressBar* progress_ = nullptr;
    Label* label_ = nullptr;
    BaseButton* prev_ = nullptr;
    BaseButton* next_ = nullptr;
    std::function<void(int)> on_step_changed_{};
};
