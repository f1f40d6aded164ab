#include "form_stepper.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kOuterMargin = 16;
constexpr int kSectionSpacing = 16;
constexpr int kPagePadding = 16;
constexpr int kNavButtonWidth = 80;
constexpr int kTitleGap = 10;
constexpr float kDisabledAlpha = 0.5f;

const std::string kEmpty;

std::unique_ptr<BaseButton> nav_button(const std::string& text) {
    auto b = std::make_unique<BaseButton>(text, ButtonVariant::Primary);
    b->set_fixed_width(std::max(kNavButtonWidth, b->preferred_width()));
    return b;
}
}

void StepProgressIndicator::add_step(const std::string& title, const std::string& description) {
    steps_.push_back(Step{ title, description });
}

void StepProgressIndicator::remove_step(int index) {
    if (index < 0 || index >= step_count()) return;
    steps_.erase(steps_.begin() + index);
}

const std::string& StepProgressIndicator::step_title(int index) const {
    if (index < 0 || index >= step_count()) return kEmpty;
    return steps_[static_cast<size_t>(index)].title;
}

SDL_Point StepProgressIndicator::circle_center(int index) const {
    const int n = step_count();
    const int usable = std::max(0, rect_.w - 2 * kMargin);
    const int x = n > 1 ? rect_.x + kMargin + index * usable / (n - 1) : rect_.x + rect_.w / 2;
    return SDL_Point{ x, rect_.y + kCircleY };
}

int StepProgressIndicator::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const LabelStyle st = Styles::Label();
    int widest = 2 * kCircleRadius;
    for (const Step& s : steps_) widest = std::max(widest, wk_text::width(st, s.title));
    return 2 * kMargin + step_count() * (widest + kTitleGap);
}

void StepProgressIndicator::render(SDL_Renderer* r) const {
    if (!visible_ || steps_.empty()) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const SDL_Color active = tm.color("primary");
    const SDL_Color done = tm.color("success");
    const SDL_Color pending = tm.color("border");
    const int n = step_count();

    for (int i = 0; i + 1 < n; ++i) {
        const SDL_Point a = circle_center(i);
        const SDL_Point b = circle_center(i + 1);
        const SDL_Color c = is_completed(i) ? done : pending;
        wk_draw::draw_line(r, a.x + kCircleRadius, a.y, b.x - kCircleRadius, b.y, c, 2, alpha);
    }

    LabelStyle number_style = Styles::Label();
    number_style.bold = true;
    for (int i = 0; i < n; ++i) {
        const SDL_Point c = circle_center(i);
        const SDL_Rect circle{ c.x - kCircleRadius, c.y - kCircleRadius, 2 * kCircleRadius, 2 * kCircleRadius };
        if (is_completed(i)) {
            wk_draw::fill_circle(r, c.x, c.y, kCircleRadius, done, alpha);
            wk_draw::draw_check(r, wk_draw::inset(circle, 8, 8), wk::rgba(255, 255, 255), alpha);
        } else {
            const bool current = i == current_;
            wk_draw::fill_circle(r, c.x, c.y, kCircleRadius, current ? active : pending, alpha);
            number_style.color = current ? wk::rgba(255, 255, 255) : tm.color("text_secondary");
            wk_text::draw_in_rect(r, number_style, std::to_string(i + 1), circle, wk_text::Align::Center, alpha);
        }

        LabelStyle title_style = Styles::Label();
        title_style.bold = i == current_;
        const std::string& title = steps_[static_cast<size_t>(i)].title;
        const int tw = wk_text::width(title_style, title);
        wk_text::draw(r, title_style, title, c.x - tw / 2, c.y + kCircleRadius + kTitleGap, alpha);
    }
}

FormStepper::FormStepper() : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, kSectionSpacing)) {
    layout_->set_parent(this);
    layout_->set_margins(kOuterMargin);
    indicator_ = layout_->add_widget(std::make_unique<StepProgressIndicator>());
    stack_ = layout_->add_widget(std::make_unique<StackedLayout>(), 1);

    auto nav = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::item_gap());
    nav->add_stretch();
    prev_ = nav->add_widget(nav_button("Previous"));
    next_ = nav->add_widget(nav_button("Next"));
    finish_ = nav->add_widget(nav_button("Finish"));
    layout_->add(std::move(nav));

    prev_->set_enabled(false);
    finish_->hide();
    prev_->set_on_clicked([this]() { previous_step(); });
    next_->set_on_clicked([this]() { next_step(); });
    finish_->set_on_clicked([this]() { finish(); });
}

FormStepper::~FormStepper() = default;

Widget* FormStepper::add_step(const std::string& title, std::unique_ptr<Widget> widget,
                              const std::string& description, Validator validator) {
    if (!widget) return nullptr;
    Widget* raw = widget.get();
    auto page = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    page->set_margins(kPagePadding);
    page->add(std::move(widget), 1);
    stack_->add(std::move(page));
    steps_.push_back(Step{ title, description, raw, std::move(validator) });
    indicator_->add_step(title, description);
    stack_->set_current(current_);
    update_navigation();
    layout();
    return raw;
}

void FormStepper::remove_step(int index) {
    if (index < 0 || index >= step_count()) return;
    steps_.erase(steps_.begin() + index);
    stack_->remove(index);
    indicator_->remove_step(index);

    std::set<int> completed;
    for (int i : completed_) {
        if (i != index) completed.insert(i > index ? i - 1 : i);
    }
    completed_ = completed;
    std::map<int, nlohmann::json> data;
    for (auto& kv : data_) {
        if (kv.first != index) data[kv.first > index ? kv.first - 1 : kv.first] = std::move(kv.second);
    }
    data_ = std::move(data);

    if (current_ >= step_count()) current_ = std::max(0, step_count() - 1);
    stack_->set_current(current_);
    indicator_->set_current_step(current_);
    indicator_->set_completed_steps(completed_);
    update_navigation();
    layout();
}

bool FormStepper::validate_current() const {
    if (current_ < 0 || current_ >= step_count()) return false;
    const Step& step = steps_[static_cast<size_t>(current_)];
    return !step.validator || step.validator();
}

void FormStepper::complete(int index) {
    completed_.insert(index);
    indicator_->set_completed_steps(completed_);
    if (on_step_completed_) on_step_completed_(index);
}

bool FormStepper::next_step() {
    if (current_ >= step_count() - 1) return false;
    if (!validate_current()) return false;
    complete(current_);
    ++current_;
    update_current_step();
    return true;
}

bool FormStepper::previous_step() {
    if (current_ <= 0) return false;
    --current_;
    update_current_step();
    return true;
}

void FormStepper::go_to_step(int index) {
    if (index < 0 || index >= step_count()) return;
    current_ = index;
    update_current_step();
}

bool FormStepper::finish() {
    if (steps_.empty() || !validate_current()) return false;
    complete(current_);
    if (on_form_completed_) on_form_completed_(get_all_data());
    return true;
}

void FormStepper::reset_form() {
    current_ = 0;
    completed_.clear();
    data_.clear();
    indicator_->set_completed_steps(completed_);
    update_current_step();
}

Widget* FormStepper::step_widget(int index) const {
    if (index < 0 || index >= step_count()) return nullptr;
    return steps_[static_cast<size_t>(index)].widget;
}

const std::string& FormStepper::step_title(int index) const {
    if (index < 0 || index >= step_count()) return kEmpty;
    return steps_[static_cast<size_t>(index)].title;
}

nlohmann::json FormStepper::get_step_data(int index) const {
    auto it = data_.find(index);
    if (it == data_.end()) return nlohmann::json::object();
    return it->second;
}

nlohmann::json FormStepper::get_all_data() const {
    nlohmann::json all = nlohmann::json::object();
    for (const auto& kv : data_) all[std::to_string(kv.first)] = kv.second;
    return all;
}

void FormStepper::update_current_step() {
    stack_->set_current(current_);
    indicator_->set_current_step(current_);
    update_navigation();
    layout();
    if (on_step_changed_) on_step_changed_(current_);
}

void FormStepper::update_navigation() {
    if (steps_.empty()) return;
    prev_->set_enabled(current_ > 0);
    const bool last = current_ == step_count() - 1;
    next_->set_visible(!last);
    finish_->set_visible(last);
}

int FormStepper::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return layout_->preferred_width();
}

int FormStepper::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return layout_->height_for_width(w);
}

bool FormStepper::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void FormStepper::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    if (!steps_.empty()) {
        const SDL_Rect page = stack_->rect();
        const int radius = tm.border_radius("md");
        wk_draw::fill_rounded_rect(r, page, radius, tm.color("background"), alpha);
        wk_draw::draw_rounded_rect(r, page, radius, tm.color("border"), alpha);
    }
    layout_->render(r);
}

SimpleFormStepper::SimpleFormStepper(const std::vector<std::string>& steps)
    : titles_(steps), layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, Spacing::item_gap())) {
    layout_->set_parent(this);
    progress_ = layout_->add_widget(std::make_unique<ProgressBar>(0));
    label_ = layout_->add_widget(std::make_unique<Label>(std::string(), "heading"));
    auto nav = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::item_gap());
    prev_ = nav->add_widget(nav_button("Previous"));
    nav->add_stretch();
    next_ = nav->add_widget(nav_button("Next"));
    layout_->add(std::move(nav));
    prev_->set_on_clicked([this]() { previous_step(); });
    next_->set_on_clicked([this]() { next_step(); });
    update_ui();
}

SimpleFormStepper::~SimpleFormStepper() = default;

bool SimpleFormStepper::next_step() {
    if (current_ >= step_count() - 1) return false;
    ++current_;
    update_ui();
    if (on_step_changed_) on_step_changed_(current_);
    return true;
}

bool SimpleFormStepper::previous_step() {
    if (current_ <= 0) return false;
    --current_;
    update_ui();
    if (on_step_changed_) on_step_changed_(current_);
    return true;
}

std::string SimpleFormStepper::step_text() const {
    if (titles_.empty()) return std::string();
    return "Step " + std::to_string(current_ + 1) + " of " + std::to_string(step_count()) + ": " +
           titles_[static_cast<size_t>(current_)];
}

void SimpleFormStepper::update_ui() {
    const int last = step_count() - 1;
    progress_->set_value(last > 0 ? current_ * 100 / last : 0);
    label_->set_text(step_text());
    prev_->set_enabled(current_ > 0);
    next_->set_enabled(current_ < last);
}

bool SimpleFormStepper::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void SimpleFormStepper::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}
