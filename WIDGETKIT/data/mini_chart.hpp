#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

#include "base/base_card.hpp"
#include "cards/stat_card.hpp"

class Label;

enum class ChartType { Line, Bar, Area, Sparkline };

namespace wk {
// "line", "bar", "area", "sparkline"; anything else is Line.
ChartType parse_chart_type(const std::string& s);
// Shortest form of a chart value: "3", "2.5", "1e+06".
std::string format_value(double v);
}

// Plot area of a mini chart. The value range follows the data unless a
// fixed range is set.
class ChartView : public Widget {
public:
    static constexpr int kDefaultMaxPoints = 50;
    static constexpr int kMargin = 4;
    static constexpr int kHoverDistance = 20;

    explicit ChartView(ChartType type = ChartType::Line, const std::vector<double>& data = {});

    // Keeps the last max_points values.
    void set_data(const std::vector<double>& data);
    void add_point(double v);
    void clear_data();
    const std::vector<double>& data() const { return data_; }
    // 0 keeps everything.
    void set_max_points(int n);
    int max_points() const { return max_points_; }

    void set_chart_type(ChartType t) { type_ = t; }
    ChartType chart_type() const { return type_; }

    void set_range(double min, double max);
    void clear_range() { fixed_range_ = false; }
    double min_value() const;
    double max_value() const;

    void set_color_role(const std::string& role) { color_role_ = role; }
    // Closest point within kHoverDistance of x, or -1.
    int point_at(int x) const;
    SDL_Point point_position(int index) const;
    int hover_index() const { return hover_; }

    void set_on_point_clicked(std::function<void(int)> cb) { on_point_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void on_hover_changed(bool hovered) override;

private:
    SDL_Rect plot_rect() const;
    void trim();

    ChartType type_;
    std::vector<double> data_;
    int max_points_ = kDefaultMaxPoints;
    bool fixed_range_ = false;
    double range_min_ = 0.0;
    double range_max_ = 1.0;
    std::string color_role_ = "primary";
    int hover_ = -1;
    ClickTracker click_;
    std::function<void(int)> on_point_clicked_{};
};

// Card with a title, a chart and a min/max row.
class MiniChart : public BaseCard {
public:
    explicit MiniChart(const std::string& title = {}, ChartType type = ChartType::Line,
                       const std::vector<double>& data = {});

    void set_data(const std::vector<double>& data);
    void add_point(double v);
    const std::vector<double>& data() const;
    void set_max_points(int n);
    void set_chart_type(ChartType t);
    ChartType chart_type() const;
    ChartView* chart() const { return chart_; }

    const Label* min_label() const { return min_label_; }
    const Label* max_label() const { return max_label_; }

    void set_on_chart_clicked(std::function<void(int)> cb) { on_chart_clicked_ = std::move(cb); }

protected:
    // Runs after the data changed.
    virtual void refresh();
    BoxLayout* stats_ = nullptr;

private:
    ChartView* chart_ = nullptr;
    Label* min_label_ = nullptr;
    Label* max_label_ = nullptr;
    std::function<void(int)> on_chart_clicked_{};
};

// Compact card: caption title, the latest value in bold and a 30 px line.
class Sparkline : public MiniChart {
public:
    static constexpr int kChartHeight = 30;

    explicit Sparkline(const std::string& title = {}, const std::vector<double>& data = {});

    const Label* value_label() const { return value_; }

protected:
    void refresh() override;

private:
    Label* value_ = nullptr;
};

// Line chart with the change from the first to the last value.
class TrendChart : public MiniChart {
public:
    explicit TrendChart(const std::string& title = {}, const std::vector<double>& data = {});

    // (last - first) / |first| * 100; 0 with fewer than two points or a
    // zero first value.
    double trend_percent() const;
    Trend trend() const;
    const TrendIndicator* indicator() const { return indicator_; }

protected:
    void refresh() override;

private:
    TrendIndicator* indicator_ = nullptr;
};
