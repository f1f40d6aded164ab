#include "data_table.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "cards/stat_card.hpp"
#include "core/draw_utils.hpp"
#include "core/layout.hpp"
#include "core/text.hpp"
#include "navigation/pagination.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kToolbarGap = 8;
constexpr int kFooterGap = 8;
constexpr int kMinColumnWidth = 80;
constexpr int kMinBodyRows = 4;
constexpr float kDisabledAlpha = 0.5f;

// Negative when a sorts before b.
int compare_cells(const std::string& a, const std::string& b) {
    double x = 0.0;
    double y = 0.0;
    if (wk::parse_number(a, x) && wk::parse_number(b, y)) return x < y ? -1 : (x > y ? 1 : 0);
    return wk_text::to_lower(a).compare(wk_text::to_lower(b));
}

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

void append_csv_line(std::string& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out += ',';
        out += csv_field(fields[i]);
    }
    out += "\r\n";
}

bool rect_empty(const SDL_Rect& r) { return r.w <= 0 || r.h <= 0; }
}

DataTable::DataTable(const std::vector<std::string>& headers, bool show_toolbar) : headers_(headers) {
    if (show_toolbar) {
        toolbar_ = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 12);
        toolbar_->set_parent(this);
        toolbar_->set_alignment(BoxLayout::Align::Center);
        search_ = toolbar_->add_widget(std::make_unique<TextBox>("", "Search..."), 1);
        search_->set_on_text_changed([this](const std::string& text) { set_filter(text); });
        column_filter_ = toolbar_->add_widget(std::make_unique<Dropdown>());
        column_filter_->set_on_changed([this](int idx, const std::string&) { set_filter_column(idx - 1); });
        clear_button_ = toolbar_->add_widget(std::make_unique<BaseButton>("Clear", ButtonVariant::Ghost, ButtonSize::Small));
        clear_button_->set_on_clicked([this]() { clear_filters(); });
        toolbar_->add_stretch();
        export_button_ =
            toolbar_->add_widget(std::make_unique<BaseButton>("Export", ButtonVariant::Secondary, ButtonSize::Small));
        export_button_->set_on_clicked([this]() {
            if (on_export_) on_export_(to_csv());
        });
    }
    set_headers(headers);
}

DataTable::~DataTable() = default;

void DataTable::set_headers(const std::vector<std::string>& headers) {
    cancel_edit();
    headers_ = headers;
    for (auto& row : data_) row.resize(headers_.size());
    if (sort_column_ >= column_count()) sort_column_ = -1;
    if (filter_column_ >= column_count()) filter_column_ = -1;
    if (column_filter_) {
        std::vector<std::string> options{ "All Columns" };
        options.insert(options.end(), headers_.begin(), headers_.end());
        column_filter_->set_options(options);
        column_filter_->set_selected(filter_column_ + 1);
    }
    refresh();
}

void DataTable::set_data(const std::vector<Row>& rows) {
    cancel_edit();
    data_ = rows;
    for (auto& row : data_) row.resize(headers_.size());
    selected_ = -1;
    hover_row_ = -1;
    scroll_ = 0;
    refresh();
}

void DataTable::add_row(const Row& row) {
    data_.push_back(row);
    data_.back().resize(headers_.size());
    refresh();
    if (on_data_changed_) on_data_changed_();
}

bool DataTable::remove_row(int row) {
    if (row < 0 || row >= row_count()) return false;
    if (edit_row_ == row) {
        cancel_edit();
    } else if (edit_row_ > row) {
        --edit_row_;
    }
    data_.erase(data_.begin() + row);
    if (selected_ == row) {
        selected_ = -1;
    } else if (selected_ > row) {
        --selected_;
    }
    hover_row_ = -1;
    refresh();
    if (on_data_changed_) on_data_changed_();
    return true;
}

void DataTable::clear() {
    set_data({});
    if (on_data_changed_) on_data_changed_();
}

std::string DataTable::cell(int row, int column) const {
    if (row < 0 || row >= row_count() || column < 0 || column >= column_count()) return {};
    return data_[static_cast<size_t>(row)][static_cast<size_t>(column)];
}

bool DataTable::set_cell(int row, int column, const std::string& value) {
    if (row < 0 || row >= row_count() || column < 0 || column >= column_count()) return false;
    data_[static_cast<size_t>(row)][static_cast<size_t>(column)] = value;
    refresh();
    return true;
}

nlohmann::json DataTable::row_data(int row) const {
    nlohmann::json out = nlohmann::json::object();
    if (row < 0 || row >= row_count()) return out;
    for (int c = 0; c < column_count(); ++c) out[headers_[static_cast<size_t>(c)]] = cell(row, c);
    return out;
}

void DataTable::sort_by(int column, bool ascending) {
    if (column < 0 || column >= column_count()) return;
    sort_column_ = column;
    sort_ascending_ = ascending;
    refresh();
}

void DataTable::toggle_sort(int column) {
    if (column == sort_column_) {
        sort_by(column, !sort_ascending_);
    } else {
        sort_by(column, true);
    }
}

void DataTable::set_filter(const std::string& text) {
    if (text == filter_) return;
    filter_ = text;
    if (search_ && search_->text() != text) search_->set_text(text);
    scroll_ = 0;
    refresh();
}

void DataTable::set_filter_column(int column) {
    if (column < -1 || column >= column_count()) column = -1;
    if (column == filter_column_) return;
    filter_column_ = column;
    if (column_filter_) column_filter_->set_selected(column + 1);
    scroll_ = 0;
    refresh();
}

void DataTable::clear_filters() {
    set_filter_column(-1);
    set_filter(std::string());
}

bool DataTable::row_matches(const Row& row) const {
    if (filter_.empty()) return true;
    const std::string q = wk_text::to_lower(filter_);
    if (filter_column_ >= 0) {
        return wk_text::to_lower(row[static_cast<size_t>(filter_column_)]).find(q) != std::string::npos;
    }
    for (const auto& v : row) {
        if (wk_text::to_lower(v).find(q) != std::string::npos) return true;
    }
    return false;
}

void DataTable::refresh() {
    order_.clear();
    for (int i = 0; i < row_count(); ++i) {
        if (row_matches(data_[static_cast<size_t>(i)])) order_.push_back(i);
    }
    if (sort_column_ >= 0) {
        const size_t col = static_cast<size_t>(sort_column_);
        const bool asc = sort_ascending_;
        std::stable_sort(order_.begin(), order_.end(), [this, col, asc](int a, int b) {
            const int c = compare_cells(data_[static_cast<size_t>(a)][col], data_[static_cast<size_t>(b)][col]);
            return asc ? c < 0 : c > 0;
        });
    }
    rows_changed();
    layout();
}

void DataTable::select_row(int row) {
    if (row < -1 || row >= row_count()) return;
    if (row == selected_) return;
    selected_ = row;
    if (row >= 0) {
        ensure_visible(row);
        if (on_row_selected_) on_row_selected_(row);
    }
}

bool DataTable::begin_edit(int row, int column) {
    if (!editable_) return false;
    const SDL_Rect cell_area = cell_rect(row, column);
    if (rect_empty(cell_area)) return false;
    cancel_edit();
    edit_row_ = row;
    edit_column_ = column;
    editor_ = std::make_unique<TextBox>(cell(row, column));
    editor_->set_parent(this);
    editor_->set_on_submitted([this](const std::string&) { commit_edit(); });
    editor_->set_on_escape([this]() { cancel_edit(); });
    const int h = editor_->height_for_width(cell_area.w);
    editor_->set_rect(SDL_Rect{ cell_area.x + 2, cell_area.y + (cell_area.h - h) / 2, cell_area.w - 4, h });
    editor_->set_focus(true);
    editor_->set_caret(cell(row, column).size());
    return true;
}

// The editor is released in update(); these can run inside its callbacks.
void DataTable::commit_edit() {
    if (edit_row_ < 0 || !editor_) return;
    const int row = edit_row_;
    const int column = edit_column_;
    const std::string value = editor_->text();
    edit_row_ = -1;
    edit_column_ = -1;
    editor_->set_focus(false);
    editor_->hide();
    if (value == cell(row, column)) return;
    data_[static_cast<size_t>(row)][static_cast<size_t>(column)] = value;
    refresh();
    if (on_cell_changed_) on_cell_changed_(row, column, value);
    if (on_data_changed_) on_data_changed_();
}

void DataTable::cancel_edit() {
    edit_row_ = -1;
    edit_column_ = -1;
    if (!editor_) return;
    editor_->set_focus(false);
    editor_->hide();
}

std::string DataTable::to_csv() const {
    std::string out;
    append_csv_line(out, headers_);
    for (int row : order_) append_csv_line(out, data_[static_cast<size_t>(row)]);
    return out;
}

bool DataTable::export_csv(const std::string& path) const {
    try {
        std::ofstream out(path, std::ios::binary);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open " + path + " for writing.");
        }
        out << to_csv();
        std::cout << "[DataTable] Exported " << order_.size() << " rows to " << path << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DataTable] Export failed: " << e.what() << "\n";
        return false;
    }
}

SDL_Rect DataTable::table_area() const {
    int top = rect_.y;
    if (toolbar_) top += toolbar_->rect().h + kToolbarGap;
    const int footer = footer_height(rect_.w);
    const int bottom = rect_.y + rect_.h - (footer > 0 ? footer + kFooterGap : 0);
    return SDL_Rect{ rect_.x, top, rect_.w, std::max(0, bottom - top) };
}

SDL_Rect DataTable::body_area() const {
    const SDL_Rect t = table_area();
    return SDL_Rect{ t.x, t.y + kHeaderHeight, t.w, std::max(0, t.h - kHeaderHeight) };
}

int DataTable::column_width(int column) const {
    if (headers_.empty()) return 0;
    const int w = table_area().w;
    const int n = column_count();
    const int base = w / n;
    return column == n - 1 ? w - base * (n - 1) : base;
}

int DataTable::column_x(int column) const {
    const int w = table_area().w;
    return table_area().x + (headers_.empty() ? 0 : (w / column_count()) * column);
}

SDL_Rect DataTable::header_rect(int column) const {
    if (column < 0 || column >= column_count()) return SDL_Rect{ 0, 0, 0, 0 };
    return SDL_Rect{ column_x(column), table_area().y, column_width(column), kHeaderHeight };
}

SDL_Rect DataTable::cell_rect(int row, int column) const {
    if (column < 0 || column >= column_count()) return SDL_Rect{ 0, 0, 0, 0 };
    const std::vector<int> rows = shown_rows();
    auto it = std::find(rows.begin(), rows.end(), row);
    if (it == rows.end()) return SDL_Rect{ 0, 0, 0, 0 };
    const SDL_Rect body = body_area();
    const int y = body.y + static_cast<int>(it - rows.begin()) * kRowHeight - scroll_;
    if (y + kRowHeight <= body.y || y >= body.y + body.h) return SDL_Rect{ 0, 0, 0, 0 };
    return SDL_Rect{ column_x(column), y, column_width(column), kRowHeight };
}

int DataTable::max_scroll() const {
    const int content = static_cast<int>(shown_rows().size()) * kRowHeight;
    return std::max(0, content - body_area().h);
}

void DataTable::ensure_visible(int row) {
    const std::vector<int> rows = shown_rows();
    auto it = std::find(rows.begin(), rows.end(), row);
    if (it == rows.end()) return;
    const int top = static_cast<int>(it - rows.begin()) * kRowHeight;
    const int h = body_area().h;
    if (top < scroll_) {
        scroll_ = top;
    } else if (top + kRowHeight > scroll_ + h) {
        scroll_ = top + kRowHeight - h;
    }
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
}

int DataTable::row_at(SDL_Point p) const {
    const SDL_Rect body = body_area();
    if (!wk::point_in(body, p)) return -1;
    const int index = (p.y - body.y + scroll_) / kRowHeight;
    const std::vector<int> rows = shown_rows();
    return index >= 0 && index < static_cast<int>(rows.size()) ? rows[static_cast<size_t>(index)] : -1;
}

int DataTable::column_at(int x) const {
    for (int c = 0; c < column_count(); ++c) {
        const int cx = column_x(c);
        if (x >= cx && x < cx + column_width(c)) return c;
    }
    return -1;
}

void DataTable::layout() {
    if (toolbar_) toolbar_->set_rect(SDL_Rect{ rect_.x, rect_.y, rect_.w, toolbar_->height_for_width(rect_.w) });
    scroll_ = std::max(0, std::min(scroll_, max_scroll()));
}

int DataTable::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const int table = std::max(1, column_count()) * kMinColumnWidth;
    return std::max(table, toolbar_ ? toolbar_->preferred_width() : 0);
}

int DataTable::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    const int toolbar = toolbar_ ? toolbar_->height_for_width(w) + kToolbarGap : 0;
    const int footer = footer_height(w);
    const int rows = std::max(kMinBodyRows, static_cast<int>(shown_rows().size()));
    return toolbar + kHeaderHeight + rows * kRowHeight + (footer > 0 ? footer + kFooterGap : 0);
}

bool DataTable::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (edit_row_ >= 0 && editor_) {
        if (wk::is_left_press(e) && !wk::point_in(editor_->rect(), wk::event_point(e))) {
            commit_edit();
        } else if (editor_->handle_event(e)) {
            return true;
        }
    }
    if (toolbar_ && toolbar_->handle_event(e)) {
        focused_ = false;
        return true;
    }
    const SDL_Rect table = table_area();
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e, table);
        hover_row_ = row_at(wk::event_point(e));
        return false;
    }
    if (e.type == SDL_MOUSEWHEEL) {
        if (!hovered_ || max_scroll() == 0) return false;
        scroll_ = std::max(0, std::min(max_scroll(), scroll_ - e.wheel.y * kWheelStep));
        return true;
    }
    if (wk::is_left_press(e)) {
        const SDL_Point p = wk::event_point(e);
        if (!wk::point_in(table, p)) {
            focused_ = false;
            return false;
        }
        focused_ = true;
        if (p.y < table.y + kHeaderHeight) {
            pressed_header_ = column_at(p.x);
            return true;
        }
        const int row = row_at(p);
        if (row < 0) return true;
        select_row(row);
        if (e.button.clicks >= 2) {
            begin_edit(row, column_at(p.x));
            if (on_row_double_clicked_) on_row_double_clicked_(row, row_data(row));
        }
        return true;
    }
    if (wk::is_left_release(e)) {
        const int column = pressed_header_;
        pressed_header_ = -1;
        if (column < 0) return false;
        if (sortable_ && wk::point_in(header_rect(column), wk::event_point(e))) toggle_sort(column);
        return true;
    }
    if (e.type == SDL_KEYDOWN && focused_ && edit_row_ < 0) {
        const std::vector<int> rows = shown_rows();
        if (rows.empty()) return false;
        auto it = std::find(rows.begin(), rows.end(), selected_);
        const int index = it == rows.end() ? -1 : static_cast<int>(it - rows.begin());
        const int last = static_cast<int>(rows.size()) - 1;
        switch (e.key.keysym.sym) {
        case SDLK_DOWN:
            select_row(rows[static_cast<size_t>(std::min(last, index + 1))]);
            return true;
        case SDLK_UP:
            select_row(rows[static_cast<size_t>(std::max(0, index - 1))]);
            return true;
        case SDLK_F2:
            return selected_ >= 0 && begin_edit(selected_, 0);
        default:
            break;
        }
    }
    return false;
}

void DataTable::update() {
    if (toolbar_) toolbar_->update();
    if (editor_ && edit_row_ < 0) editor_.reset();
    if (editor_) editor_->update();
}

void DataTable::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    if (toolbar_) toolbar_->render(r);

    const SDL_Rect table = table_area();
    const int radius = tm.border_radius("md");
    wk_draw::fill_rounded_rect(r, table, radius, tm.color("surface"), alpha);
    {
        wk_draw::ClipScope clip(r, wk_draw::inset(table, 1, 1));
        const SDL_Rect header{ table.x, table.y, table.w, kHeaderHeight };
        wk_draw::fill_rect(r, header, tm.color("light"), alpha);
        LabelStyle hs = Styles::Label("default", "text");
        hs.bold = true;
        for (int c = 0; c < column_count(); ++c) {
            const SDL_Rect hr = header_rect(c);
            if (c == pressed_header_) wk_draw::fill_rect(r, hr, tm.color("hover"), alpha);
            const bool sorted = c == sort_column_;
            const int arrow_w = sorted ? 16 : 0;
            const SDL_Rect text_area{ hr.x + kCellPad, hr.y, std::max(0, hr.w - 2 * kCellPad - arrow_w), hr.h };
            wk_text::draw_in_rect(r, hs, wk_text::elide(hs, headers_[static_cast<size_t>(c)], text_area.w), text_area,
                                  wk_text::Align::Left, alpha);
            if (sorted) {
                const SDL_Rect arrow{ hr.x + hr.w - kCellPad - 12, hr.y + (hr.h - 12) / 2, 12, 12 };
                wk_draw::draw_chevron(r, arrow, sort_ascending_ ? wk_draw::Direction::Up : wk_draw::Direction::Down,
                                      tm.color("primary"), alpha);
            }
            if (c > 0) wk_draw::fill_rect(r, SDL_Rect{ hr.x, hr.y, 1, table.h }, tm.color("border"), alpha);
        }
        wk_draw::fill_rect(r, SDL_Rect{ table.x, table.y + kHeaderHeight - 1, table.w, 1 }, tm.color("border"), alpha);

        const SDL_Rect body = body_area();
        wk_draw::ClipScope body_clip(r, body);
        const std::vector<int> rows = shown_rows();
        const LabelStyle cs = Styles::Label("default", "text");
        for (size_t i = 0; i < rows.size(); ++i) {
            const int row = rows[i];
            const int y = body.y + static_cast<int>(i) * kRowHeight - scroll_;
            if (y + kRowHeight < body.y || y > body.y + body.h) continue;
            const SDL_Rect line{ table.x, y, table.w, kRowHeight };
            if (row == selected_) {
                wk_draw::fill_rect(r, line, wk::with_alpha(tm.color("primary"), 50), alpha);
            } else if (row == hover_row_) {
                wk_draw::fill_rect(r, line, tm.color("hover"), alpha);
            } else if (i % 2 == 1) {
                wk_draw::fill_rect(r, line, wk::with_alpha(tm.color("hover"), 110), alpha);
            }
            for (int c = 0; c < column_count(); ++c) {
                if (row == edit_row_ && c == edit_column_) continue;
                const SDL_Rect text_area{ column_x(c) + kCellPad, y, std::max(0, column_width(c) - 2 * kCellPad), kRowHeight };
                wk_text::draw_in_rect(r, cs, wk_text::elide(cs, cell(row, c), text_area.w), text_area,
                                      wk_text::Align::Left, alpha);
            }
            wk_draw::fill_rect(r, SDL_Rect{ table.x, y + kRowHeight - 1, table.w, 1 },
                               wk::with_alpha(tm.color("border"), 140), alpha);
        }
        if (editor_ && edit_row_ >= 0) editor_->render(r);
    }
    wk_draw::draw_rounded_rect(r, table, radius, focused_ ? tm.color("primary") : tm.color("border"), alpha);
}

PaginatedDataTable::PaginatedDataTable(const std::vector<std::string>& headers, int page_size, bool show_toolbar)
    : DataTable(headers, show_toolbar),
      pagination_(std::make_unique<Pagination>(1, 1, PaginationMode::Numeric)),
      page_size_(std::max(1, page_size)) {
    pagination_->set_parent(this);
    pagination_->set_on_page_changed([this](int page) {
        if (page == page_) return;
        page_ = page;
        layout();
        if (on_page_changed_) on_page_changed_(page);
    });
    rows_changed();
}

PaginatedDataTable::~PaginatedDataTable() = default;

int PaginatedDataTable::total_pages() const {
    const int rows = static_cast<int>(visible_rows().size());
    return std::max(1, (rows + page_size_ - 1) / page_size_);
}

void PaginatedDataTable::set_page_size(int page_size) {
    page_size_ = std::max(1, page_size);
    pagination_->set_current_page(1);
    page_ = 1;
    rows_changed();
    layout();
}

void PaginatedDataTable::set_current_page(int page) {
    if (pagination_) pagination_->set_current_page(page);
}

std::vector<int> PaginatedDataTable::shown_rows() const {
    const std::vector<int>& rows = visible_rows();
    const size_t start = static_cast<size_t>((page_ - 1) * page_size_);
    if (start >= rows.size()) return {};
    const size_t end = std::min(rows.size(), start + static_cast<size_t>(page_size_));
    return std::vector<int>(rows.begin() + static_cast<long>(start), rows.begin() + static_cast<long>(end));
}

void PaginatedDataTable::rows_changed() {
    if (!pagination_) return;
    if (filter() != last_filter_) {
        last_filter_ = filter();
        if (page_ != 1) pagination_->set_current_page(1);
    }
    pagination_->set_total_pages(total_pages());
    page_ = pagination_->current_page();
}

int PaginatedDataTable::footer_height(int w) const {
    return pagination_ ? pagination_->height_for_width(w) : 0;
}

void PaginatedDataTable::layout() {
    DataTable::layout();
    if (!pagination_) return;
    const int h = pagination_->height_for_width(rect_.w);
    pagination_->set_rect(SDL_Rect{ rect_.x, rect_.y + rect_.h - h, rect_.w, h });
}

bool PaginatedDataTable::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (pagination_->handle_event(e)) return true;
    return DataTable::handle_event(e);
}

void PaginatedDataTable::update() {
    DataTable::update();
    pagination_->update();
}

void PaginatedDataTable::render(SDL_Renderer* r) const {
    if (!visible_) return;
    DataTable::render(r);
    pagination_->render(r);
}
