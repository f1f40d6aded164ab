#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "base/base_popup.hpp"
#include "core/layout.hpp"

class BaseButton;
class IconButton;
class Label;
class TextBox;

// Proleptic Gregorian calendar date. A default-constructed Date is null.
struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    bool is_valid() const;
    bool is_null() const { return !is_valid(); }

    // Days since 1970-01-01.
    long to_days() const;
    static Date from_days(long days);
    Date add_days(long n) const { return from_days(to_days() + n); }
    // 0 = Sunday.
    int weekday() const;

    // "yyyy-MM-dd"; null dates give an empty string.
    std::string to_string() const;
    // Returns false and leaves `out` alone unless `s` is a valid yyyy-MM-dd date.
    static bool parse(const std::string& s, Date& out);
    static Date today();

    static bool is_leap_year(int y);
    static int days_in_month(int y, int m);
    static std::string month_name(int m);
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);
bool operator<=(const Date& a, const Date& b);

enum class DatePreset { Today, Yesterday, Last7Days, Last30Days, ThisMonth, LastMonth, ThisYear };

namespace wk {
const std::vector<DatePreset>& date_presets();
std::string preset_name(DatePreset p);
// Range covered by `p` relative to `today`.
std::pair<Date, Date> preset_range(DatePreset p, const Date& today);
}

// Month grid with weekday headers. Days inside the selection are tinted and
// the ends are filled with the primary color.
class CalendarGrid : public Widget {
public:
    static constexpr int kCellSize = 32;
    static constexpr int kHeaderHeight = 24;

    CalendarGrid();

    void set_month(int year, int month);
    int year() const { return year_; }
    int month() const { return month_; }
    void set_selection(const Date& start, const Date& end) { start_ = start; end_ = end; }
    void set_today(const Date& d) { today_ = d; }

    // First date shown (the Sunday on or before the 1st).
    Date first_cell_date() const;
    SDL_Rect cell_rect(int index) const;
    // Null when `p` is not over a day of the shown month.
    Date date_at(SDL_Point p) const;
    SDL_Rect date_rect(const Date& d) const;

    void set_on_date_clicked(std::function<void(const Date&)> cb) { on_date_clicked_ = std::move(cb); }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : 7 * kCellSize; }
    int height_for_width(int) const override { return fixed_h_ >= 0 ? fixed_h_ : kHeaderHeight + 6 * kCellSize; }
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

private:
    int year_;
    int month_;
    Date start_;
    Date end_;
    Date today_;
    Date hover_;
    std::function<void(const Date&)> on_date_clicked_{};
};

// Light-dismiss popup with preset buttons, month navigation, a CalendarGrid
// and Clear / Apply. The first click on the grid starts a new range, the
// second completes it (in either order).
class DateRangeCalendarPopup : public BasePopup {
public:
    DateRangeCalendarPopup();
    ~DateRangeCalendarPopup() override;

    // Resets the pending selection and shows the month of `start` (or today).
    void prepare(const Date& start, const Date& end, const Date& today);

    void previous_month();
    void next_month();
    void click_date(const Date& d);
    void select_preset(DatePreset p);
    void clear_selection();
    void apply_selection();

    const Date& pending_start() const { return temp_start_; }
    const Date& pending_end() const { return temp_end_; }
    CalendarGrid* grid() const { return grid_; }
    std::string month_title() const;

    void set_on_date_selected(std::function<void(const Date&)> cb) { on_date_selected_ = std::move(cb); }
    void set_on_range_selected(std::function<void(const Date&, const Date&)> cb) { on_range_selected_ = std::move(cb); }

private:
    void sync_view();

    Date today_;
    Date temp_start_;
    Date temp_end_;
    CalendarGrid* grid_ = nullptr;
    Label* title_ = nullptr;
    std::function<void(const Date&)> on_date_selected_{};
    std::function<void(const Date&, const Date&)> on_range_selected_{};
};

// Start and end date fields with a calendar button. The start never lies
// after the end: moving one past the other moves the other with it.
class DateRangePicker : public Widget {
public:
    DateRangePicker();
    ~DateRangePicker() override;

    // Null dates are ignored; use clear().
    void set_start_date(const Date& d);
    void set_end_date(const Date& d);
    // A reversed pair is swapped. A pair with a null date clears the range.
    void set_date_range(const Date& start, const Date& end);
    const Date& start_date() const { return start_; }
    const Date& end_date() const { return end_; }
    bool has_range() const { return start_.is_valid() && end_.is_valid(); }
    // Inclusive; 0 without a full range.
    int days_in_range() const;
    void clear();

    void apply_preset(DatePreset p, const Date& today = Date::today());

    void open_calendar(bool selecting_start);
    void close_calendar();
    bool is_calendar_open() const;
    bool selecting_start() const { return selecting_start_; }
    DateRangeCalendarPopup* calendar() const { return popup_.get(); }
    TextBox* start_input() const { return start_input_; }
    TextBox* end_input() const { return end_input_; }

    void set_on_range_changed(std::function<void(const Date&, const Date&)> cb) { on_range_changed_ = std::move(cb); }
    void set_on_start_changed(std::function<void(const Date&)> cb) { on_start_changed_ = std::move(cb); }
    void set_on_end_changed(std::function<void(const Date&)> cb) { on_end_changed_ = std::move(cb); }

    int preferred_width() const override { return fixed_w_ >= 0 ? fixed_w_ : layout_->preferred_width(); }
    int height_for_width(int w) const override { return fixed_h_ >= 0 ? fixed_h_ : layout_->height_for_width(w); }
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override { layout_->set_rect(rect_); }

private:
    void assign(const Date& start, const Date& end);
    void sync_inputs();

    Date start_;
    Date end_;
    bool selecting_start_ = true;
    std::unique_ptr<BoxLayout> layout_;
    TextBox* start_input_ = nullptr;
    TextBox* end_input_ = nullptr;
    IconButton* calendar_button_ = nullptr;
    std::unique_ptr<DateRangeCalendarPopup> popup_;
    std::function<void(const Date&, const Date&)> on_range_changed_{};
    std::function<void(const Date&)> on_start_changed_{};
    std::function<void(const Date&)> on_end_changed_{};
};
