#include "mini_chart.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>

#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kChartMinHeight = 60;
constexpr int kPointRadius = 3;
constexpr int kHoverRadius = 5;
constexpr float kBarFill = 0.8f;
constexpr float kAreaAlpha = 0.25f;
constexpr float kGridAlpha = 0.5f;
constexpr int kGridLines = 4;
}

namespace wk {

ChartType parse_chart_type(const std::string& s) {
    const std::string t = wk_text::to_lower(s);
    if (t == "bar") return ChartType::Bar;
    if (t == "area") return ChartType::Area;
    if (t == "sparkline") return ChartType::Sparkline;
    return ChartType::Line;
}

std::string format_value(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    return buf;
}

}

ChartView::ChartView(ChartType type, const std::vector<double>& data) : type_(type) {
    set_data(data);
}

void ChartView::set_data(const std::vector<double>& data) {
    data_ = data;
    trim();
    hover_ = -1;
}

void ChartView::add_point(double v) {
    data_.push_back(v);
    trim();
    if (hover_ >= static_cast<int>(data_.size())) hover_ = -1;
}

void ChartView::clear_data() {
    data_.clear();
    hover_ = -1;
}

void ChartView::set_max_points(int n) {
    max_points_ = std::max(0, n);
    trim();
}

void ChartView::trim() {
    if (max_points_ > 0 && static_cast<int>(data_.size()) > max_points_) {
        data_.erase(data_.begin(), data_.end() - max_points_);
    }
}

void ChartView::set_range(double min, double max) {
    if (max < min) std::swap(min, max);
    range_min_ = min;
    range_max_ = max;
    fixed_range_ = true;
}

double ChartView::min_value() const {
    if (fixed_range_) return range_min_;
    if (data_.empty()) return 0.0;
    return *std::min_element(data_.begin(), data_.end());
}

double ChartView::max_value() const {
    if (fixed_range_) return range_max_;
    if (data_.empty()) return 0.0;
    return *std::max_element(data_.begin(), data_.end());
}

SDL_Rect ChartView::plot_rect() const {
    const int margin = type_ == ChartType::Sparkline ? 1 : kMargin;
    return wk_draw::inset(rect_, margin, margin);
}

SDL_Point ChartView::point_position(int index) const {
    const SDL_Rect area = plot_rect();
    const int n = static_cast<int>(data_.size());
    if (index < 0 || index >= n) return SDL_Point{area.x, area.y + area.h};

    int x = area.x + area.w / 2;
    if (type_ == ChartType::Bar) {
        const float slot = static_cast<float>(area.w) / n;
        x = area.x + static_cast<int>(slot * index + slot / 2.0f);
    } else if (n > 1) {
        x = area.x + static_cast<int>(std::lround(static_cast<double>(area.w) * index / (n - 1)));
    }

    const double lo = min_value();
    double span = max_value() - lo;
    if (span <= 0.0) span = 1.0;
    double t = (data_[index] - lo) / span;
    t = std::max(0.0, std::min(1.0, t));
    const int y = area.y + area.h - static_cast<int>(std::lround(t * area.h));
    return SDL_Point{x, y};
}

int ChartView::point_at(int x) const {
    int best = -1;
    int best_d = kHoverDistance + 1;
    for (int i = 0; i < static_cast<int>(data_.size()); ++i) {
        const int d = std::abs(point_position(i).x - x);
        if (d < best_d) {
            best = i;
            best_d = d;
        }
    }
    return best;
}

int ChartView::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return 160;
}

int ChartView::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return kChartMinHeight;
}

void ChartView::on_hover_changed(bool hovered) {
    if (!hovered) hover_ = -1;
}

bool ChartView::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (e.type == SDL_MOUSEMOTION) {
        hover_ = hovered_ ? point_at(e.motion.x) : -1;
        return false;
    }
    if (e.type == SDL_MOUSEBUTTONDOWN || e.type == SDL_MOUSEBUTTONUP) {
        if (click_.feed(e, rect_) == ClickTracker::Result::Clicked) {
            const int index = point_at(e.button.x);
            if (index >= 0 && on_point_clicked_) on_point_clicked_(index);
            return true;
        }
        return click_.pressed();
    }
    return false;
}

void ChartView::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const float alpha = effective_opacity();
    auto& theme = ThemeManager::instance();
    const SDL_Color color = theme.color(color_role_);
    const SDL_Rect area = plot_rect();
    const int n = static_cast<int>(data_.size());

    if (type_ != ChartType::Sparkline) {
        const SDL_Color grid = theme.color("border");
        for (int i = 1; i < kGridLines; ++i) {
            const int y = area.y + area.h * i / kGridLines;
            wk_draw::draw_line(r, area.x, y, area.x + area.w, y, grid, 1, alpha * kGridAlpha);
        }
    }
    if (n == 0) return;

    if (type_ == ChartType::Bar) {
        const float slot = static_cast<float>(area.w) / n;
        const int bar_w = std::max(1, static_cast<int>(slot * kBarFill));
        const int bottom = area.y + area.h;
        for (int i = 0; i < n; ++i) {
            const SDL_Point p = point_position(i);
            const int h = std::max(2, bottom - p.y);
            const SDL_Rect bar{ p.x - bar_w / 2, bottom - h, bar_w, h };
            const SDL_Color c = i == hover_ ? wk::mix(color, theme.color("dark"), 0.2f) : color;
            wk_draw::fill_rect(r, bar, c, alpha);
        }
    } else {
        if (type_ == ChartType::Area && n > 1) {
            const int bottom = area.y + area.h;
            for (int i = 0; i + 1 < n; ++i) {
                const SDL_Point a = point_position(i);
                const SDL_Point b = point_position(i + 1);
                for (int x = a.x; x <= b.x; ++x) {
                    const float t = b.x == a.x ? 0.0f : static_cast<float>(x - a.x) / (b.x - a.x);
                    const int y = a.y + static_cast<int>(std::lround((b.y - a.y) * t));
                    wk_draw::draw_line(r, x, y, x, bottom, color, 1, alpha * kAreaAlpha);
                }
            }
        }
        const int thickness = type_ == ChartType::Sparkline ? 1 : 2;
        for (int i = 0; i + 1 < n; ++i) {
            const SDL_Point a = point_position(i);
            const SDL_Point b = point_position(i + 1);
            wk_draw::draw_line(r, a.x, a.y, b.x, b.y, color, thickness, alpha);
        }
        if (type_ == ChartType::Line || n == 1) {
            for (int i = 0; i < n; ++i) {
                const SDL_Point p = point_position(i);
                wk_draw::fill_circle(r, p.x, p.y, i == hover_ ? kHoverRadius : kPointRadius, color, alpha);
            }
        } else if (hover_ >= 0) {
            const SDL_Point p = point_position(hover_);
            wk_draw::fill_circle(r, p.x, p.y, kPointRadius, color, alpha);
        }
    }

    if (hover_ >= 0 && hover_ < n && type_ != ChartType::Sparkline) {
        const LabelStyle st = Styles::Label("caption", "text");
        const std::string text = wk::format_value(data_[hover_]);
        const SDL_Point p = point_position(hover_);
        const int w = wk_text::width(st, text) + 8;
        const int h = wk_text::line_height(st) + 4;
        SDL_Rect tip{ p.x - w / 2, p.y - h - kHoverRadius - 2, w, h };
        tip.x = std::max(rect_.x, std::min(tip.x, rect_.x + rect_.w - w));
        tip.y = std::max(rect_.y, tip.y);
        wk_draw::fill_rounded_rect(r, tip, theme.border_radius("sm"), theme.color("surface"), alpha);
        wk_draw::draw_rounded_rect(r, tip, theme.border_radius("sm"), theme.color("border"), alpha);
        wk_text::draw_in_rect(r, st, text, tip, wk_text::Align::Center, alpha);
    }
}

MiniChart::MiniChart(const std::string& title, ChartType type, const std::vector<double>& data) {
    if (!title.empty()) set_title(title);
    body_->set_spacing(8);

    chart_ = body_->add_widget(std::make_unique<ChartView>(type, data));
    chart_->set_on_point_clicked([this](int index) {
        if (on_chart_clicked_) on_chart_clicked_(index);
    });

    auto stats = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    min_label_ = stats->add_widget(std::make_unique<Label>(std::string(), "caption", "text_secondary"));
    stats->add_stretch();
    max_label_ = stats->add_widget(std::make_unique<Label>(std::string(), "caption", "text_secondary"));
    stats_ = body_->add_widget(std::move(stats));
    refresh();
}

void MiniChart::set_data(const std::vector<double>& data) {
    chart_->set_data(data);
    refresh();
}

void MiniChart::add_point(double v) {
    chart_->add_point(v);
    refresh();
}

const std::vector<double>& MiniChart::data() const {
    return chart_->data();
}

void MiniChart::set_max_points(int n) {
    chart_->set_max_points(n);
    refresh();
}

void MiniChart::set_chart_type(ChartType t) {
    chart_->set_chart_type(t);
}

ChartType MiniChart::chart_type() const {
    return chart_->chart_type();
}

void MiniChart::refresh() {
    if (chart_->data().empty()) {
        min_label_->set_text("Min: -");
        max_label_->set_text("Max: -");
        return;
    }
    min_label_->set_text("Min: " + wk::format_value(chart_->min_value()));
    max_label_->set_text("Max: " + wk::format_value(chart_->max_value()));
}

Sparkline::Sparkline(const std::string& title, const std::vector<double>& data)
    : MiniChart(title, ChartType::Sparkline, data) {
    if (title_label_) {
        title_label_->set_font_role("caption");
        title_label_->set_color_role("text_secondary");
    }
    auto value = std::make_unique<Label>(std::string(), "default");
    value->set_bold(true);
    value_ = static_cast<Label*>(add_header_action(std::move(value)));
    chart()->set_fixed_height(kChartHeight);
    stats_->hide();
    refresh();
}

void Sparkline::refresh() {
    MiniChart::refresh();
    if (!value_) return;
    value_->set_text(data().empty() ? std::string() : wk::format_value(data().back()));
}

TrendChart::TrendChart(const std::string& title, const std::vector<double>& data)
    : MiniChart(title, ChartType::Line, data) {
    indicator_ = static_cast<TrendIndicator*>(add_header_action(std::make_unique<TrendIndicator>()));
    refresh();
}

double TrendChart::trend_percent() const {
    const std::vector<double>& values = data();
    if (values.size() < 2 || values.front() == 0.0) return 0.0;
    return (values.back() - values.front()) / std::fabs(values.front()) * 100.0;
}

Trend TrendChart::trend() const {
    const double p = trend_percent();
    if (p >= 0.05) return Trend::Up;
    if (p <= -0.05) return Trend::Down;
    return Trend::Flat;
}

void TrendChart::refresh() {
    MiniChart::refresh();
    if (!indicator_) return;
    indicator_->set_trend(trend(), wk::format_change(trend_percent()));
}
