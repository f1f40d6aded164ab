#include "stat_card.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kArrowSize = 16;
constexpr int kArrowGap = 4;
constexpr int kValueFontSize = 24;
constexpr int kIconSize = 32;
}

namespace wk {

Trend parse_trend(const std::string& s) {
    if (s == "up") return Trend::Up;
    if (s == "down") return Trend::Down;
    return Trend::Flat;
}

bool parse_number(const std::string& s, double& out) {
    std::string clean;
    clean.reserve(s.size());
    for (char c : s) {
        if (c != ',') clean.push_back(c);
    }
    clean = wk_text::trim(clean);
    if (clean.empty()) return false;
    char* end = nullptr;
    const double v = std::strtod(clean.c_str(), &end);
    if (end == clean.c_str() || *end != '\0' || !std::isfinite(v)) return false;
    out = v;
    return true;
}

std::string format_change(double percent) {
    if (std::fabs(percent) < 0.05) return "0%";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%.1f%%", percent > 0 ? "+" : "-", std::fabs(percent));
    return buf;
}

}

TrendIndicator::TrendIndicator(Trend trend, const std::string& text) : trend_(trend), text_(text) {}

void TrendIndicator::set_trend(Trend t, const std::string& text) {
    trend_ = t;
    text_ = text;
}

std::string TrendIndicator::color_role() const {
    switch (trend_) {
    case Trend::Up: return "success";
    case Trend::Down: return "danger";
    case Trend::Flat:
    default: return "text_secondary";
    }
}

int TrendIndicator::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const int text_w = text_.empty() ? 0 : kArrowGap + wk_text::width(Styles::Label("caption"), text_);
    return kArrowSize + text_w;
}

int TrendIndicator::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return std::max(kArrowSize, wk_text::line_height(Styles::Label("caption")));
}

void TrendIndicator::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const SDL_Color c = ThemeManager::instance().color(color_role());
    const float alpha = effective_opacity();
    const SDL_Rect box{ rect_.x, rect_.y + (rect_.h - kArrowSize) / 2, kArrowSize, kArrowSize };
    const int cx = box.x + kArrowSize / 2;
    switch (trend_) {
    case Trend::Up:
        wk_draw::draw_line(r, cx, box.y + 12, cx, box.y + 4, c, 2, alpha);
        wk_draw::draw_line(r, cx, box.y + 4, cx - 3, box.y + 7, c, 2, alpha);
        wk_draw::draw_line(r, cx, box.y + 4, cx + 3, box.y + 7, c, 2, alpha);
        break;
    case Trend::Down:
        wk_draw::draw_line(r, cx, box.y + 4, cx, box.y + 12, c, 2, alpha);
        wk_draw::draw_line(r, cx, box.y + 12, cx - 3, box.y + 9, c, 2, alpha);
        wk_draw::draw_line(r, cx, box.y + 12, cx + 3, box.y + 9, c, 2, alpha);
        break;
    case Trend::Flat:
        wk_draw::draw_line(r, box.x + 4, box.y + 8, box.x + 12, box.y + 8, c, 2, alpha);
        break;
    }
    if (!text_.empty()) {
        LabelStyle st = Styles::Label("caption");
        st.color = c;
        st.bold = true;
        const SDL_Rect text_rect{ box.x + kArrowSize + kArrowGap, rect_.y,
                                  std::max(0, rect_.w - kArrowSize - kArrowGap), rect_.h };
        wk_text::draw_in_rect(r, st, text_, text_rect, wk_text::Align::Left, alpha);
    }
}

StatCard::StatCard(const std::string& label, const std::string& value, const std::string& unit, Trend trend,
                   const std::string& trend_text) {
    body_->set_spacing(4);
    label_ = body_->add_widget(std::make_unique<Label>(label, "caption", "text_secondary"));

    auto row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 4);
    row->set_alignment(BoxLayout::Align::End);
    auto value_label = std::make_unique<Label>(value, "heading");
    value_label->set_font_size(kValueFontSize);
    value_label->set_bold(true);
    value_ = row->add_widget(std::move(value_label));
    unit_ = row->add_widget(std::make_unique<Label>(unit, "default", "text_secondary"));
    unit_->set_visible(!unit.empty());
    row->add_stretch();
    top_row_ = body_->add_widget(std::move(row));

    trend_ = body_->add_widget(std::make_unique<TrendIndicator>(trend, trend_text));
    trend_->set_visible(trend != Trend::Flat || !trend_text.empty());

    subtitle_ = body_->add_widget(std::make_unique<Label>(std::string(), "caption", "text_secondary"));
    subtitle_->hide();
}

void StatCard::set_value(const std::string& v) {
    if (v == value_->text()) return;
    value_->set_text(v);
    if (on_value_changed_) on_value_changed_(v);
}

const std::string& StatCard::value() const {
    return value_->text();
}

void StatCard::set_label(const std::string& l) {
    label_->set_text(l);
}

const std::string& StatCard::label() const {
    return label_->text();
}

void StatCard::set_unit(const std::string& u) {
    unit_->set_text(u);
    unit_->set_visible(!u.empty());
}

void StatCard::set_subtitle(const std::string& s) {
    subtitle_->set_text(s);
    subtitle_->set_visible(!s.empty());
}

void StatCard::set_trend(Trend t, const std::string& text) {
    trend_->set_trend(t, text);
    trend_->set_visible(t != Trend::Flat || !text.empty());
}

Trend StatCard::trend() const {
    return trend_->trend();
}

const std::string& StatCard::trend_text() const {
    return trend_->text();
}

void StatCard::set_value_color_role(const std::string& role) {
    value_->set_color_role(role);
}

MetricCard::MetricCard(const std::string& title, const std::string& value, const std::string& unit, Trend trend,
                       double percent)
    : StatCard(title, value, unit) {
    set_trend(trend, percent);
}

void MetricCard::set_trend(Trend t, double percent) {
    percent_ = std::fabs(percent);
    double signed_percent = percent_;
    if (t == Trend::Down) signed_percent = -percent_;
    else if (t == Trend::Flat) signed_percent = 0.0;
    StatCard::set_trend(t, wk::format_change(signed_percent));
}

ProgressStatCard::ProgressStatCard(const std::string& label, const std::string& value, const std::string& max_value,
                                   const std::string& unit)
    : StatCard(label, value, unit), max_value_(max_value) {
    auto bar = std::make_unique<ProgressBar>();
    bar->set_fixed_height(6);
    bar_ = body_->add_widget(std::move(bar));
    update_progress();
}

void ProgressStatCard::set_value(const std::string& v) {
    StatCard::set_value(v);
    update_progress();
}

void ProgressStatCard::set_max_value(const std::string& m) {
    max_value_ = m;
    update_progress();
}

void ProgressStatCard::update_progress() {
    double current = 0.0;
    double maximum = 0.0;
    if (wk::parse_number(value(), current) && wk::parse_number(max_value_, maximum) && maximum > 0.0) {
        percent_ = std::max(0, std::min(100, static_cast<int>(current / maximum * 100.0)));
    } else {
        percent_ = 0;
    }
    bar_->set_value(percent_);
}

ComparisonStatCard::ComparisonStatCard(const std::string& label, const std::string& current,
                                       const std::string& previous, const std::string& unit)
    : StatCard(label, current, unit), previous_(previous) {
    recompute(current);
}

void ComparisonStatCard::set_comparison_values(const std::string& current, const std::string& previous) {
    previous_ = previous;
    set_value(current);
    recompute(current);
}

void ComparisonStatCard::recompute(const std::string& current) {
    double cur = 0.0;
    double prev = 0.0;
    if (!wk::parse_number(current, cur) || !wk::parse_number(previous_, prev)) {
        change_ = 0.0;
        set_trend(Trend::Flat, "N/A");
        return;
    }
    change_ = prev != 0.0 ? (cur - prev) / prev * 100.0 : 0.0;
    if (cur > prev) set_trend(Trend::Up, wk::format_change(std::fabs(change_)));
    else if (cur < prev) set_trend(Trend::Down, wk::format_change(-std::fabs(change_)));
    else set_trend(Trend::Flat, "0%");
}

IconStatCard::IconStatCard(const std::string& label, const std::string& value, const std::string& unit,
                           const std::string& icon, const std::string& icon_color_role)
    : StatCard(label, value, unit) {
    icon_ = top_row_->add_widget(std::make_unique<IconGlyph>(icon, kIconSize, icon_color_role));
    icon_->set_visible(!icon.empty());
}

void IconStatCard::set_icon(const std::string& icon, const std::string& color_role) {
    icon_->set_icon(icon);
    if (!color_role.empty()) icon_->set_color_role(color_role);
    icon_->set_visible(!icon.empty());
}

const std::string& IconStatCard::icon() const {
    return icon_->icon();
}
