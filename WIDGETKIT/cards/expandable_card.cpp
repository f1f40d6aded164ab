#include "expandable_card.hpp"

#include <algorithm>
#include <cmath>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kArrowSize = 16;
constexpr int kSectionGap = 8;

// Chevron that points down while the card is closed and up while open.
class ExpandArrow : public Widget {
public:
    explicit ExpandArrow(const ExpandableCard& card) : card_(card) {}

    int preferred_width() const override { return kArrowSize; }
    int height_for_width(int) const override { return kArrowSize; }
    void render(SDL_Renderer* r) const override {
        if (!visible_) return;
        const SDL_Color c = ThemeManager::instance().color("text_secondary");
        const auto dir = card_.expand_progress() > 0.5f ? wk_draw::Direction::Up : wk_draw::Direction::Down;
        wk_draw::draw_chevron(r, wk_draw::centered(rect_, kArrowSize, kArrowSize), dir, c, effective_opacity());
    }

private:
    const ExpandableCard& card_;
};
}

ExpandableCard::ExpandableCard(const std::string& title, const std::string& content, bool expanded)
    : expanded_(expanded), progress_(expanded ? 1.0f : 0.0f) {
    set_title(title);
    add_header_action(std::make_unique<ExpandArrow>(*this));
    if (!content.empty()) set_content_text(content);
    body_->set_visible(expanded_);
}

void ExpandableCard::set_content_text(const std::string& text) {
    if (content_label_) {
        content_label_->set_text(text);
        return;
    }
    auto label = std::make_unique<Label>(text, "default", "text_secondary");
    label->set_word_wrap(true);
    content_label_ = set_body(std::move(label));
}

Widget* ExpandableCard::add_content_widget(std::unique_ptr<Widget> w) {
    return body_->add(std::move(w));
}

void ExpandableCard::apply_progress(float p) {
    progress_ = std::max(0.0f, std::min(1.0f, p));
    body_->set_visible(progress_ > 0.0f);
    layout();
}

void ExpandableCard::set_expanded(bool expanded, bool animated) {
    if (expanded == expanded_) return;
    expanded_ = expanded;
    const float target = expanded_ ? 1.0f : 0.0f;
    if (!animated) {
        stop_animation("expand");
        apply_progress(target);
    } else {
        if (expanded_) body_->show();
        animate("expand", progress_, target, kExpandMs,
                [this](float v) {
                    progress_ = v;
                    layout();
                },
                [this, target]() { apply_progress(target); }, Easing::InOutQuad);
    }
    if (on_expanded_changed_) on_expanded_changed_(expanded_);
}

int ExpandableCard::height_for_width(int w) const {
    if (fixed_h_ >= 0) return apply_height_limit(fixed_h_);
    int h = 0;
    if (header_->is_visible()) h += header_->height_for_width(w);
    if (body_->is_visible()) h += static_cast<int>(std::lround(body_->height_for_width(w) * progress_));
    if (footer_->is_visible()) h += footer_->height_for_width(w);
    return apply_height_limit(h);
}

void ExpandableCard::layout() {
    const int x = rect_.x + offset_.x;
    int y = rect_.y + offset_.y;
    if (header_->is_visible()) {
        const int h = header_->height_for_width(rect_.w);
        header_->set_rect(SDL_Rect{ x, y, rect_.w, h });
        y += h;
    }
    if (body_->is_visible()) {
        const int h = body_->height_for_width(rect_.w);
        body_->set_rect(SDL_Rect{ x, y, rect_.w, h });
        y += static_cast<int>(std::lround(h * progress_));
    }
    if (footer_->is_visible()) {
        footer_->set_rect(SDL_Rect{ x, y, rect_.w, footer_->height_for_width(rect_.w) });
    }
}

bool ExpandableCard::handle_event(const SDL_Event& e) {
    if (wk::is_left_press(e)) press_point_ = SDL_Point{ e.button.x, e.button.y };
    return BaseCard::handle_event(e);
}

void ExpandableCard::on_card_clicked() {
    if (header_->is_visible() && wk::point_in(header_->rect(), press_point_)) toggle();
    BaseCard::on_card_clicked();
}

CollapsibleSection::CollapsibleSection(const std::string& title, bool expanded)
    : ExpandableCard(title, {}, expanded) {
    set_shadow(false);
    set_hoverable(false);
    header_->set_margins(12, 8, 12, 8);
    body_->set_margins(12, 0, 12, 12);
}

AccordionCard::AccordionCard(const std::string& title, bool allow_multiple) : allow_multiple_(allow_multiple) {
    if (!title.empty()) set_title(title);
    set_hoverable(false);
    body_->set_spacing(kSectionGap);
}

CollapsibleSection* AccordionCard::add_section(const std::string& title, const std::string& text) {
    auto section = std::make_unique<CollapsibleSection>(title);
    section->set_content_text(text);
    return attach(std::move(section));
}

CollapsibleSection* AccordionCard::add_section(const std::string& title, std::unique_ptr<Widget> content) {
    auto section = std::make_unique<CollapsibleSection>(title);
    if (content) section->set_content(std::move(content));
    return attach(std::move(section));
}

CollapsibleSection* AccordionCard::attach(std::unique_ptr<CollapsibleSection> section) {
    CollapsibleSection* raw = body_->add_widget(std::move(section));
    raw->set_on_expanded_changed([this, raw](bool expanded) { section_changed(raw, expanded); });
    sections_.push_back(raw);
    return raw;
}

void AccordionCard::section_changed(CollapsibleSection* s, bool expanded) {
    if (expanded && !allow_multiple_) {
        for (CollapsibleSection* other : sections_) {
            if (other != s && other->is_expanded()) other->set_expanded(false);
        }
    }
    if (on_section_toggled_) {
        const auto it = std::find(sections_.begin(), sections_.end(), s);
        on_section_toggled_(static_cast<size_t>(it - sections_.begin()), expanded);
    }
}

void AccordionCard::expand_section(size_t i) {
    if (i < sections_.size()) sections_[i]->set_expanded(true);
}

void AccordionCard::collapse_section(size_t i) {
    if (i < sections_.size()) sections_[i]->set_expanded(false);
}

void AccordionCard::collapse_all() {
    for (CollapsibleSection* s : sections_) s->set_expanded(false);
}

std::vector<size_t> AccordionCard::expanded_sections() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < sections_.size(); ++i) {
        if (sections_[i]->is_expanded()) out.push_back(i);
    }
    return out;
}

void AccordionCard::set_allow_multiple(bool allow) {
    allow_multiple_ = allow;
    if (allow_multiple_) return;
    bool kept = false;
    for (CollapsibleSection* s : sections_) {
        if (!s->is_expanded()) continue;
        if (kept) s->set_expanded(false);
        kept = true;
    }
}

void StepBadge::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const int d = std::min(rect_.w, rect_.h);
    const int cx = rect_.x + rect_.w / 2;
    const int cy = rect_.y + rect_.h / 2;
    switch (status_) {
    case StepStatus::Completed:
        wk_draw::fill_circle(r, cx, cy, d / 2, tm.color("success"), alpha);
        wk_draw::draw_check(r, wk_draw::centered(rect_, d / 2, d / 2), wk::rgba(255, 255, 255), alpha);
        return;
    case StepStatus::Current:
        wk_draw::fill_circle(r, cx, cy, d / 2, tm.color("primary"), alpha);
        break;
    case StepStatus::Pending:
        wk_draw::fill_circle(r, cx, cy, d / 2, tm.color("border"), alpha);
        wk_draw::fill_circle(r, cx, cy, d / 2 - 2, tm.color("background"), alpha);
        break;
    }
    LabelStyle st = tm.font("caption");
    st.bold = true;
    st.color = status_ == StepStatus::Current ? wk::rgba(255, 255, 255) : tm.color("text_secondary");
    wk_text::draw_in_rect(r, st, std::to_string(number_), rect_, wk_text::Align::Center, alpha);
}

StepCard::StepCard(int step_number, const std::string& title, StepStatus status)
    : ExpandableCard(title), number_(step_number), status_(status) {
    auto badge = std::make_unique<StepBadge>(step_number, status);
    badge_ = badge.get();
    header_->insert(0, std::move(badge));
    header_->set_spacing(12);
    status_label_ = static_cast<Label*>(header_->insert(header_->count() - 1,
                                                        std::make_unique<Label>(status_text(status), "caption",
                                                                                "text_secondary")));
    set_status(status);
}

std::string StepCard::status_text(StepStatus s) {
    switch (s) {
    case StepStatus::Completed: return "Completed";
    case StepStatus::Current: return "In progress";
    case StepStatus::Pending:
    default: return "Pending";
    }
}

void StepCard::set_status(StepStatus s) {
    status_ = s;
    badge_->set_status(s);
    status_label_->set_text(status_text(s));
    status_label_->set_color_role(s == StepStatus::Completed ? "success" : "text_secondary");
}
