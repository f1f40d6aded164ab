#include "status_chip.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
struct ChipMetrics {
    int height;
    int pad_h;
    int spacing;
    int icon;
    int font_px;
};

ChipMetrics metrics(ChipSize s) {
    switch (s) {
    case ChipSize::Small: return ChipMetrics{ 20, 8, 4, 12, 10 };
    case ChipSize::Large: return ChipMetrics{ 32, 16, 8, 16, 12 };
    case ChipSize::Medium:
    default: return ChipMetrics{ 24, 12, 6, 14, 11 };
    }
}

StatusStyle solid(SDL_Color c) {
    return StatusStyle{ c, wk::rgba(255, 255, 255), c };
}

LabelStyle chip_font(const ChipMetrics& m) {
    LabelStyle st = ThemeManager::instance().font("default");
    st.font_size = m.font_px;
    return st;
}
}

StatusChip::StatusChip(const std::string& text, const std::string& status, ChipSize size)
    : text_(text), status_(status), size_(size) {}

StatusStyle StatusChip::colors_for(const std::string& status) {
    const ThemeManager& tm = ThemeManager::instance();
    if (status == "primary") return solid(tm.color("primary"));
    if (status == "active") return solid(wk::parse_hex("#10B981"));
    if (status == "pending") return solid(wk::parse_hex("#F59E0B"));
    if (status == "draft") return solid(wk::parse_hex("#6B7280"));
    if (status == "inactive") return solid(tm.color("text_secondary"));
    return Styles::Status(status);
}

int StatusChip::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const ChipMetrics m = metrics(size_);
    int w = 2 * m.pad_h + wk_text::width(chip_font(m), text_);
    if (!icon_.empty()) w += m.icon + m.spacing;
    if (closable_) w += m.icon + m.spacing;
    return w;
}

int StatusChip::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : metrics(size_).height;
}

SDL_Rect StatusChip::close_rect() const {
    if (!closable_) return SDL_Rect{ 0, 0, 0, 0 };
    const ChipMetrics m = metrics(size_);
    return SDL_Rect{ rect_.x + rect_.w - m.pad_h - m.icon, rect_.y + (rect_.h - m.icon) / 2, m.icon, m.icon };
}

void StatusChip::on_chip_clicked() {
    if (on_clicked_) on_clicked_();
}

bool StatusChip::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (closable_) {
        switch (close_click_.feed(e, close_rect())) {
        case ClickTracker::Result::Pressed:
        case ClickTracker::Result::Released:
            return true;
        case ClickTracker::Result::Clicked:
            if (on_close_requested_) on_close_requested_();
            return true;
        default:
            break;
        }
    }
    if (!clickable_) return false;
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::Clicked:
        on_chip_clicked();
        return true;
    default:
        return false;
    }
}

void StatusChip::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : 0.5f);
    const ChipMetrics m = metrics(size_);
    const SDL_Rect box = visual_rect();
    StatusStyle st = colors_for(status_);
    if (clickable_ && hovered_) st.bg = wk::darken(st.bg, 0.1f);
    wk_draw::fill_rounded_rect(r, box, box.h / 2, st.bg, alpha);
    wk_draw::draw_rounded_rect(r, box, box.h / 2, st.border, alpha);

    int x = box.x + m.pad_h;
    if (!icon_.empty()) {
        wk_icons::draw(r, icon_, SDL_Rect{ x, box.y + (box.h - m.icon) / 2, m.icon, m.icon }, st.fg, alpha);
        x += m.icon + m.spacing;
    }
    LabelStyle font = chip_font(m);
    font.color = st.fg;
    const int right = closable_ ? close_rect().x - m.spacing : box.x + box.w - m.pad_h;
    wk_text::draw_in_rect(r, font, text_, SDL_Rect{ x, box.y, std::max(0, right - x), box.h },
                          wk_text::Align::Left, alpha);
    if (closable_) wk_draw::draw_cross(r, wk_draw::inset(close_rect(), 3, 3), st.fg, alpha);
}

StatusChipGroup::StatusChipGroup(BoxLayout::Direction dir) : layout_(std::make_unique<BoxLayout>(dir, 8)) {
    layout_->set_parent(this);
    layout_->set_alignment(dir == BoxLayout::Direction::Horizontal ? BoxLayout::Align::Center
                                                                   : BoxLayout::Align::Start);
}

StatusChip* StatusChipGroup::add_chip(const std::string& text, const std::string& status, bool clickable) {
    auto chip = std::make_unique<StatusChip>(text, status);
    chip->set_clickable(clickable);
    StatusChip* raw = chip.get();
    chip->set_on_clicked([this, raw]() {
        if (on_chip_clicked_) on_chip_clicked_(raw->text(), raw->status());
    });
    layout_->add(std::move(chip));
    chips_.push_back(raw);
    layout();
    return raw;
}

StatusChip* StatusChipGroup::find_chip(const std::string& text) const {
    for (StatusChip* c : chips_) {
        if (c->text() == text) return c;
    }
    return nullptr;
}

bool StatusChipGroup::remove_chip(const std::string& text) {
    StatusChip* chip = find_chip(text);
    if (!chip) return false;
    chips_.erase(std::find(chips_.begin(), chips_.end(), chip));
    layout_->remove(chip);
    layout();
    return true;
}

void StatusChipGroup::clear() {
    chips_.clear();
    layout_->clear();
}

bool StatusChipGroup::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    return layout_->handle_event(e);
}

void StatusChipGroup::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}

InteractiveStatusChip::InteractiveStatusChip(const std::string& text, const std::vector<std::string>& statuses,
                                             int current)
    : StatusChip(text), statuses_(statuses) {
    clickable_ = true;
    if (statuses_.empty()) statuses_ = { "neutral" };
    index_ = std::max(0, std::min(current, static_cast<int>(statuses_.size()) - 1));
    status_ = statuses_[static_cast<size_t>(index_)];
}

void InteractiveStatusChip::set_statuses(const std::vector<std::string>& statuses) {
    statuses_ = statuses.empty() ? std::vector<std::string>{ "neutral" } : statuses;
    index_ = 0;
    status_ = statuses_.front();
}

void InteractiveStatusChip::cycle() {
    index_ = (index_ + 1) % static_cast<int>(statuses_.size());
    status_ = statuses_[static_cast<size_t>(index_)];
    if (on_status_changed_) on_status_changed_(status_);
}

void InteractiveStatusChip::on_chip_clicked() {
    cycle();
    StatusChip::on_chip_clicked();
}

void AnimatedStatusChip::set_status(const std::string& status) {
    const bool changed = status != status_;
    StatusChip::set_status(status);
    if (changed) pulse();
}

void AnimatedStatusChip::pulse() {
    AnimationHelpers::bounce_effect(*this, 1.1f, kPulseMs);
}

CounterStatusChip::CounterStatusChip(const std::string& label, int count, const std::string& status)
    : StatusChip({}, status), label_(label), count_(std::max(0, count)) {
    refresh();
}

void CounterStatusChip::set_count(int count) {
    count_ = std::max(0, count);
    refresh();
}

void CounterStatusChip::set_label(const std::string& l) {
    label_ = l;
    refresh();
}

void CounterStatusChip::refresh() {
    text_ = label_.empty() ? std::to_string(count_) : label_ + " (" + std::to_string(count_) + ")";
}
