#pragma once

#include <SDL.h>
#include <ctime>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/widget.hpp"

struct TimelineEvent {
    std::string title;
    std::string description;
    std::time_t timestamp = 0;
    // "success", "warning", "error", "info"; anything else draws as default.
    std::string status = "default";
    std::string icon;
    nlohmann::json data;
};

// Chronological list of events on a line with status-coloured markers.
// Events are kept sorted by timestamp; equal timestamps keep insertion order.
class Timeline : public Widget {
public:
    enum class Orientation { Vertical, Horizontal };

    static constexpr int kMarkerRadius = 8;
    static constexpr int kVisualSize = 40;
    static constexpr int kCardPad = 12;
    static constexpr int kItemSpacing = 20;
    static constexpr int kMargin = 20;
    static constexpr int kCardWidth = 220;
    static constexpr int kCompactHeight = 28;
    static constexpr int kWheelStep = 40;

    explicit Timeline(Orientation orientation = Orientation::Vertical);

    // `timestamp` 0 means now. Returns the event's position after sorting.
    int add_event(const std::string& title, const std::string& description = {}, std::time_t timestamp = 0,
                  const std::string& status = "default", const std::string& icon = {},
                  const nlohmann::json& data = nullptr);
    bool remove_event(int index);
    void clear_events();
    const std::vector<TimelineEvent>& events() const { return events_; }
    int event_count() const { return static_cast<int>(events_.size()); }

    void set_orientation(Orientation o);
    Orientation orientation() const { return orientation_; }
    // One line per event: marker, title and time of day.
    void set_compact(bool compact);
    bool is_compact() const { return compact_; }

    SDL_Rect event_rect(int index) const;
    SDL_Point marker_center(int index) const;

    // "Mar 05, 2024 14:30" in local time, or "14:30" when `time_only`.
    static std::string format_timestamp(std::time_t t, bool time_only = false);
    static SDL_Color status_color(const std::string& status);

    void set_on_event_clicked(std::function<void(int, const TimelineEvent&)> cb) { on_event_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    int card_height(const TimelineEvent& ev, int card_w) const;
    int content_extent() const;
    int max_scroll() const;
    int event_at(SDL_Point p) const;
    void render_card(SDL_Renderer* r, int index, float alpha) const;

    Orientation orientation_;
    bool compact_ = false;
    std::vector<TimelineEvent> events_;
    std::vector<SDL_Rect> rects_;
    int scroll_ = 0;
    int hover_ = -1;
    int pressed_ = -1;
    std::function<void(int, const TimelineEvent&)> on_event_clicked_{};
};

// Timeline laid out left to right with cards above the line.
class HorizontalTimeline : public Timeline {
public:
    HorizontalTimeline() : Timeline(Orientation::Horizontal) {}
};
