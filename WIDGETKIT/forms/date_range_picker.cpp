#include "date_range_picker.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "style/styles.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kPopupMargin = 8;
constexpr int kPopupSpacing = 8;
constexpr int kPresetsPerRow = 4;
constexpr int kPickerSpacing = 8;
constexpr int kInputMinWidth = 110;
constexpr int kCalendarButtonSize = 32;
constexpr int kPopupGap = 4;
constexpr float kOtherMonthAlpha = 0.4f;
constexpr float kRangeTint = 0.2f;

const char* const kWeekdays[] = { "Su", "Mo", "Tu", "We", "Th", "Fr", "Sa" };
const char* const kMonths[] = { "January", "February", "March",     "April",   "May",      "June",
                                "July",    "August",   "September", "October", "November", "December" };
}

bool Date::is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int Date::days_in_month(int y, int m) {
    static const int kDays[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (m < 1 || m > 12) return 0;
    if (m == 2 && is_leap_year(y)) return 29;
    return kDays[m - 1];
}

std::string Date::month_name(int m) {
    if (m < 1 || m > 12) return std::string();
    return kMonths[m - 1];
}

bool Date::is_valid() const {
    return year >= 1 && month >= 1 && month <= 12 && day >= 1 && day <= days_in_month(year, month);
}

// Civil-from-days and days-from-civil after H. Hinnant's date algorithms.
long Date::to_days() const {
    const long y = month <= 2 ? year - 1 : year;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long mp = (month + 9) % 12;
    const long doy = (153 * mp + 2) / 5 + day - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(long days) {
    days += 719468;
    const long era = (days >= 0 ? days : days - 146096) / 146097;
    const long doe = days - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    const int y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    return Date(y, m, d);
}

int Date::weekday() const {
    const long z = to_days();
    return static_cast<int>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

std::string Date::to_string() const {
    if (!is_valid()) return std::string();
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool Date::parse(const std::string& s, Date& out) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    const Date d(std::stoi(s.substr(0, 4)), std::stoi(s.substr(5, 2)), std::stoi(s.substr(8, 2)));
    if (!d.is_valid()) return false;
    out = d;
    return true;
}

Date Date::today() {
    const std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return Date(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}

bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}

bool operator<=(const Date& a, const Date& b) {
    return !(b < a);
}

namespace wk {

const std::vector<DatePreset>& date_presets() {
    static const std::vector<DatePreset> all = { DatePreset::Today,     DatePreset::Yesterday, DatePreset::Last7Days,
                                                 DatePreset::Last30Days, DatePreset::ThisMonth, DatePreset::LastMonth,
                                                 DatePreset::ThisYear };
    return all;
}

std::string preset_name(DatePreset p) {
    switch (p) {
    case DatePreset::Today: return "Today";
    case DatePreset::Yesterday: return "Yesterday";
    case DatePreset::Last7Days: return "Last 7 days";
    case DatePreset::Last30Days: return "Last 30 days";
    case DatePreset::ThisMonth: return "This month";
    case DatePreset::LastMonth: return "Last month";
    case DatePreset::ThisYear: return "This year";
    }
    return std::string();
}

std::pair<Date, Date> preset_range(DatePreset p, const Date& today) {
    switch (p) {
    case DatePreset::Today: return { today, today };
    case DatePreset::Yesterday: return { today.add_days(-1), today.add_days(-1) };
    case DatePreset::Last7Days: return { today.add_days(-6), today };
    case DatePreset::Last30Days: return { today.add_days(-29), today };
    case DatePreset::ThisMonth: return { Date(today.year, today.month, 1), today };
    case DatePreset::LastMonth: {
        const int y = today.month == 1 ? today.year - 1 : today.year;
        const int m = today.month == 1 ? 12 : today.month - 1;
        return { Date(y, m, 1), Date(y, m, Date::days_in_month(y, m)) };
    }
    case DatePreset::ThisYear: return { Date(today.year, 1, 1), today };
    }
    return { today, today };
}

}

CalendarGrid::CalendarGrid() {
    const Date t = Date::today();
    year_ = t.year;
    month_ = t.month;
    today_ = t;
}

void CalendarGrid::set_month(int year, int month) {
    if (month < 1 || month > 12 || year < 1) return;
    year_ = year;
    month_ = month;
    hover_ = Date();
}

Date CalendarGrid::first_cell_date() const {
    const Date first(year_, month_, 1);
    return first.add_days(-first.weekday());
}

SDL_Rect CalendarGrid::cell_rect(int index) const {
    const int cw = rect_.w / 7;
    const int col = index % 7;
    const int row = index / 7;
    return SDL_Rect{ rect_.x + col * cw, rect_.y + kHeaderHeight + row * kCellSize, cw, kCellSize };
}

Date CalendarGrid::date_at(SDL_Point p) const {
    if (!wk::point_in(rect_, p) || rect_.w < 7) return Date();
    const int cw = rect_.w / 7;
    const int col = std::min(6, (p.x - rect_.x) / cw);
    const int dy = p.y - rect_.y - kHeaderHeight;
    if (dy < 0) return Date();
    const int row = dy / kCellSize;
    if (row > 5) return Date();
    const Date d = first_cell_date().add_days(row * 7 + col);
    if (d.month != month_) return Date();
    return d;
}

SDL_Rect CalendarGrid::date_rect(const Date& d) const {
    if (!d.is_valid()) return SDL_Rect{ 0, 0, 0, 0 };
    const long idx = d.to_days() - first_cell_date().to_days();
    if (idx < 0 || idx >= 42) return SDL_Rect{ 0, 0, 0, 0 };
    return cell_rect(static_cast<int>(idx));
}

bool CalendarGrid::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (e.type == SDL_MOUSEMOTION) {
        hover_ = date_at(SDL_Point{ e.motion.x, e.motion.y });
        return false;
    }
    if (wk::is_left_press(e)) {
        const SDL_Point p{ e.button.x, e.button.y };
        const Date d = date_at(p);
        if (d.is_valid()) {
            if (on_date_clicked_) on_date_clicked_(d);
            return true;
        }
        return wk::point_in(rect_, p);
    }
    return false;
}

void CalendarGrid::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    const SDL_Color primary = tm.color("primary");
    const int cw = rect_.w / 7;

    const LabelStyle head = Styles::Label("caption", "text_secondary");
    for (int c = 0; c < 7; ++c) {
        const SDL_Rect hr{ rect_.x + c * cw, rect_.y, cw, kHeaderHeight };
        wk_text::draw_in_rect(r, head, kWeekdays[c], hr, wk_text::Align::Center, alpha);
    }

    const bool has_range = start_.is_valid() && end_.is_valid();
    const SDL_Color range_bg = wk::mix(tm.color("background"), primary, kRangeTint);
    const int radius = kCellSize / 2 - 2;
    Date d = first_cell_date();
    for (int i = 0; i < 42; ++i, d = d.add_days(1)) {
        const SDL_Rect cell = cell_rect(i);
        const bool in_month = d.month == month_;
        const bool is_end = in_month && (d == start_ || d == end_);
        LabelStyle st = Styles::Label("default", in_month ? "text" : "text_secondary");
        if (in_month && has_range && start_ <= d && d <= end_) wk_draw::fill_rect(r, cell, range_bg, alpha);
        const int cx = cell.x + cell.w / 2;
        const int cy = cell.y + cell.h / 2;
        if (is_end) {
            wk_draw::fill_circle(r, cx, cy, radius, primary, alpha);
            st.color = wk::rgba(255, 255, 255);
            st.bold = true;
        } else if (in_month && d == hover_) {
            wk_draw::fill_circle(r, cx, cy, radius, tm.color("hover"), alpha);
        }
        if (in_month && d == today_ && !is_end) wk_draw::draw_circle(r, cx, cy, radius, primary, alpha);
        wk_text::draw_in_rect(r, st, std::to_string(d.day), cell, wk_text::Align::Center,
                              in_month ? alpha : alpha * kOtherMonthAlpha);
    }
}

DateRangeCalendarPopup::DateRangeCalendarPopup() : BasePopup(false) {
    content_->set_margins(kPopupMargin);
    content_->set_spacing(kPopupSpacing);

    std::unique_ptr<BoxLayout> row;
    int in_row = 0;
    for (DatePreset p : wk::date_presets()) {
        if (!row) row = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::small_gap());
        auto b = std::make_unique<BaseButton>(wk::preset_name(p), ButtonVariant::Secondary, ButtonSize::Small);
        b->set_on_clicked([this, p]() { select_preset(p); });
        row->add(std::move(b));
        if (++in_row == kPresetsPerRow) {
            content_->add(std::move(row));
            in_row = 0;
        }
    }
    if (row) content_->add(std::move(row));

    auto nav = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::item_gap());
    IconButton* prev = nav->add_widget(std::make_unique<IconButton>("<", 28));
    title_ = nav->add_widget(std::make_unique<Label>(std::string(), "default"), 1);
    title_->set_bold(true);
    title_->set_alignment(wk_text::Align::Center);
    IconButton* next = nav->add_widget(std::make_unique<IconButton>(">", 28));
    prev->set_on_clicked([this]() { previous_month(); });
    next->set_on_clicked([this]() { next_month(); });
    content_->add(std::move(nav));

    grid_ = content_->add_widget(std::make_unique<CalendarGrid>());
    grid_->set_on_date_clicked([this](const Date& d) { click_date(d); });

    auto actions = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, Spacing::item_gap());
    BaseButton* clear =
        actions->add_widget(std::make_unique<BaseButton>("Clear", ButtonVariant::Secondary, ButtonSize::Small));
    actions->add_stretch();
    BaseButton* apply =
        actions->add_widget(std::make_unique<BaseButton>("Apply", ButtonVariant::Primary, ButtonSize::Small));
    clear->set_on_clicked([this]() { clear_selection(); });
    apply->set_on_clicked([this]() { apply_selection(); });
    content_->add(std::move(actions));

    today_ = Date::today();
    sync_view();
}

DateRangeCalendarPopup::~DateRangeCalendarPopup() = default;

void DateRangeCalendarPopup::prepare(const Date& start, const Date& end, const Date& today) {
    today_ = today;
    temp_start_ = start;
    temp_end_ = end;
    const Date shown = start.is_valid() ? start : today;
    grid_->set_month(shown.year, shown.month);
    grid_->set_today(today);
    sync_view();
}

void DateRangeCalendarPopup::previous_month() {
    if (grid_->month() == 1) {
        grid_->set_month(grid_->year() - 1, 12);
    } else {
        grid_->set_month(grid_->year(), grid_->month() - 1);
    }
    sync_view();
}

void DateRangeCalendarPopup::next_month() {
    if (grid_->month() == 12) {
        grid_->set_month(grid_->year() + 1, 1);
    } else {
        grid_->set_month(grid_->year(), grid_->month() + 1);
    }
    sync_view();
}

void DateRangeCalendarPopup::click_date(const Date& d) {
    if (!temp_start_.is_valid() || temp_end_.is_valid()) {
        temp_start_ = d;
        temp_end_ = Date();
    } else if (d < temp_start_) {
        temp_end_ = temp_start_;
        temp_start_ = d;
    } else {
        temp_end_ = d;
    }
    sync_view();
    if (on_date_selected_) on_date_selected_(d);
}

void DateRangeCalendarPopup::select_preset(DatePreset p) {
    const std::pair<Date, Date> range = wk::preset_range(p, today_);
    temp_start_ = range.first;
    temp_end_ = range.second;
    sync_view();
    if (on_range_selected_) on_range_selected_(temp_start_, temp_end_);
}

void DateRangeCalendarPopup::clear_selection() {
    temp_start_ = Date();
    temp_end_ = Date();
    sync_view();
    if (on_range_selected_) on_range_selected_(Date(), Date());
}

void DateRangeCalendarPopup::apply_selection() {
    if (temp_start_.is_valid() && temp_end_.is_valid()) {
        if (on_range_selected_) on_range_selected_(temp_start_, temp_end_);
    } else if (temp_start_.is_valid()) {
        if (on_date_selected_) on_date_selected_(temp_start_);
    }
    close();
}

std::string DateRangeCalendarPopup::month_title() const {
    return Date::month_name(grid_->month()) + " " + std::to_string(grid_->year());
}

void DateRangeCalendarPopup::sync_view() {
    grid_->set_selection(temp_start_, temp_end_);
    title_->set_text(month_title());
}

DateRangePicker::DateRangePicker()
    : layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, kPickerSpacing)),
      popup_(std::make_unique<DateRangeCalendarPopup>()) {
    layout_->set_parent(this);
    start_input_ = layout_->add_widget(std::make_unique<TextBox>(std::string(), "Start date"), 1);
    layout_->add(std::make_unique<Label>("to", "default", "text_secondary"));
    end_input_ = layout_->add_widget(std::make_unique<TextBox>(std::string(), "End date"), 1);
    calendar_button_ = layout_->add_widget(std::make_unique<IconButton>("calendar", kCalendarButtonSize));
    for (TextBox* box : { start_input_, end_input_ }) {
        box->set_read_only(true);
        box->set_fixed_width(std::max(kInputMinWidth, box->preferred_width()));
    }
    calendar_button_->set_on_clicked([this]() { open_calendar(true); });

    popup_->set_on_date_selected([this](const Date& d) {
        if (selecting_start_) {
            set_start_date(d);
            selecting_start_ = false;
        } else {
            set_end_date(d);
        }
    });
    popup_->set_on_range_selected([this](const Date& s, const Date& e) {
        if (s.is_valid() && e.is_valid()) {
            set_date_range(s, e);
        } else {
            clear();
        }
        close_calendar();
    });
}

DateRangePicker::~DateRangePicker() = default;

void DateRangePicker::set_start_date(const Date& d) {
    if (!d.is_valid()) return;
    assign(d, end_.is_valid() && end_ < d ? d : end_);
}

void DateRangePicker::set_end_date(const Date& d) {
    if (!d.is_valid()) return;
    assign(start_.is_valid() && d < start_ ? d : start_, d);
}

void DateRangePicker::set_date_range(const Date& start, const Date& end) {
    if (!start.is_valid() || !end.is_valid()) {
        clear();
        return;
    }
    if (end < start) {
        assign(end, start);
    } else {
        assign(start, end);
    }
}

void DateRangePicker::assign(const Date& start, const Date& end) {
    const bool start_changed = start != start_;
    const bool end_changed = end != end_;
    if (!start_changed && !end_changed) return;
    start_ = start;
    end_ = end;
    sync_inputs();
    if (start_changed && on_start_changed_) on_start_changed_(start_);
    if (end_changed && on_end_changed_) on_end_changed_(end_);
    if (has_range() && on_range_changed_) on_range_changed_(start_, end_);
}

int DateRangePicker::days_in_range() const {
    if (!has_range()) return 0;
    return static_cast<int>(end_.to_days() - start_.to_days()) + 1;
}

void DateRangePicker::clear() {
    start_ = Date();
    end_ = Date();
    sync_inputs();
}

void DateRangePicker::apply_preset(DatePreset p, const Date& today) {
    const std::pair<Date, Date> range = wk::preset_range(p, today);
    set_date_range(range.first, range.second);
}

void DateRangePicker::sync_inputs() {
    start_input_->set_text(start_.to_string());
    end_input_->set_text(end_.to_string());
}

void DateRangePicker::open_calendar(bool selecting_start) {
    selecting_start_ = selecting_start;
    popup_->prepare(start_, end_, Date::today());
    popup_->show_at_position(rect_.x, rect_.y + rect_.h + kPopupGap);
}

void DateRangePicker::close_calendar() {
    popup_->close();
}

bool DateRangePicker::is_calendar_open() const {
    return popup_->is_visible() && OverlayManager::instance().is_open(popup_.get());
}

bool DateRangePicker::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (wk::is_left_press(e)) {
        const SDL_Point p{ e.button.x, e.button.y };
        if (wk::point_in(start_input_->box_rect(), p)) {
            open_calendar(true);
            return true;
        }
        if (wk::point_in(end_input_->box_rect(), p)) {
            open_calendar(false);
            return true;
        }
    }
    return layout_->handle_event(e);
}

void DateRangePicker::update() {
    layout_->update();
}

void DateRangePicker::render(SDL_Renderer* r) const {
    if (!visible_) return;
    layout_->render(r);
}
