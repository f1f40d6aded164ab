#pragma once

#include <SDL.h>
#include <functional>
#include <string>

#include "base/base_card.hpp"

class IconGlyph;
class Label;
class ProgressBar;

enum class Trend { Flat, Up, Down };

namespace wk {
// "up" / "down"; anything else is Flat.
Trend parse_trend(const std::string& s);
// Numeric value of a display string such as "1,250.5". False when it is not
// a number.
bool parse_number(const std::string& s, double& out);
// "+12.5%", "-3.0%" or "0%".
std::string format_change(double percent);
}

// Arrow plus change text, green for up, red for down.
class TrendIndicator : public Widget {
public:
    explicit TrendIndicator(Trend trend = Trend::Flat, const std::string& text = {});

    void set_trend(Trend t, const std::string& text);
    Trend trend() const { return trend_; }
    const std::string& text() const { return text_; }
    std::string color_role() const;

    int preferred_width() const override;
    int height_for_width(int w) const override;
    void render(SDL_Renderer* r) const override;

private:
    Trend trend_;
    std::string text_;
};

// Single figure with a caption, unit, optional subtitle and trend.
class StatCard : public BaseCard {
public:
    explicit StatCard(const std::string& label = {}, const std::string& value = "0",
                      const std::string& unit = {}, Trend trend = Trend::Flat,
                      const std::string& trend_text = {});

    virtual void set_value(const std::string& v);
    const std::string& value() const;
    void set_label(const std::string& l);
    const std::string& label() const;
    void set_unit(const std::string& u);
    void set_subtitle(const std::string& s);
    void set_trend(Trend t, const std::string& text = {});
    Trend trend() const;
    const std::string& trend_text() const;
    // Colour role of the value text; "text" by default.
    void set_value_color_role(const std::string& role);

    void set_on_value_changed(std::function<void(const std::string&)> cb) { on_value_changed_ = std::move(cb); }

protected:
    BoxLayout* top_row_ = nullptr;

private:
    Label* label_ = nullptr;
    Label* value_ = nullptr;
    Label* unit_ = nullptr;
    Label* subtitle_ = nullptr;
    TrendIndicator* trend_ = nullptr;
    std::function<void(const std::string&)> on_value_changed_{};
};

// Stat card whose trend is given as a signed percentage.
class MetricCard : public StatCard {
public:
    MetricCard(const std::string& title, const std::string& value, const std::string& unit = {},
               Trend trend = Trend::Flat, double percent = 0.0);

    using StatCard::set_trend;
    void set_trend(Trend t, double percent);
    double percent() const { return percent_; }

private:
    double percent_ = 0.0;
};

class ProgressStatCard : public StatCard {
public:
    ProgressStatCard(const std::string& label, const std::string& value, const std::string& max_value = "100",
                     const std::string& unit = {});

    void set_value(const std::string& v) override;
    void set_max_value(const std::string& m);
    // value / max as a whole percentage in [0, 100]; 0 when either is not numeric.
    int progress_percentage() const { return percent_; }

private:
    void update_progress();

    std::string max_value_;
    int percent_ = 0;
    ProgressBar* bar_ = nullptr;
};

// Current value compared with a previous one; the trend follows the sign of
// the change.
class ComparisonStatCard : public StatCard {
public:
    ComparisonStatCard(const std::string& label, const std::string& current, const std::string& previous,
                       const std::string& unit = {});

    void set_comparison_values(const std::string& current, const std::string& previous);
    const std::string& previous_value() const { return previous_; }
    // (current - previous) / previous * 100; 0 when previous is 0.
    double change_percent() const { return change_; }

private:
    void recompute(const std::string& current);

    std::string previous_;
    double change_ = 0.0;
};

class IconStatCard : public StatCard {
public:
    IconStatCard(const std::string& label, const std::string& value, const std::string& unit = {},
                 const std::string& icon = {}, const std::string& icon_color_role = "primary");

    void set_icon(const std::string& icon, const std::string& color_role = {});
    const std::string& icon() const;

private:
    IconGlyph* icon_ = nullptr;
};
