#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/widget.hpp"

class BaseButton;
class BoxLayout;
class Dropdown;
class Pagination;
class TextBox;

// Table of string cells with a search toolbar, sortable columns and
// single-row selection.
//
// Row indices in the API are positions in the data as added; sorting and
// filtering only change which rows are shown and in what order.
class DataTable : public Widget {
public:
    using Row = std::vector<std::string>;

    static constexpr int kHeaderHeight = 36;
    static constexpr int kRowHeight = 32;
    static constexpr int kCellPad = 10;
    static constexpr int kWheelStep = 40;

    explicit DataTable(const std::vector<std::string>& headers = {}, bool show_toolbar = true);
    ~DataTable() override;

    void set_headers(const std::vector<std::string>& headers);
    const std::vector<std::string>& headers() const { return headers_; }
    int column_count() const { return static_cast<int>(headers_.size()); }

    // Rows are padded or cut to the column count.
    void set_data(const std::vector<Row>& rows);
    void add_row(const Row& row);
    bool remove_row(int row);
    void clear();
    int row_count() const { return static_cast<int>(data_.size()); }
    const Row& row(int index) const { return data_.at(static_cast<size_t>(index)); }
    std::string cell(int row, int column) const;
    // Does not emit cell_changed.
    bool set_cell(int row, int column, const std::string& value);
    // {header: value}
    nlohmann::json row_data(int row) const;

    void set_sortable(bool sortable) { sortable_ = sortable; }
    bool is_sortable() const { return sortable_; }
    // Numeric order when both values parse as numbers, otherwise
    // case-insensitive text order.
    void sort_by(int column, bool ascending = true);
    // Same column toggles the direction; a new column starts ascending.
    void toggle_sort(int column);
    int sort_column() const { return sort_column_; }
    bool sort_ascending() const { return sort_ascending_; }

    // Case-insensitive substring match over all cells, or one column.
    void set_filter(const std::string& text);
    const std::string& filter() const { return filter_; }
    // -1 searches every column.
    void set_filter_column(int column);
    int filter_column() const { return filter_column_; }
    void clear_filters();
    // Data rows shown after filtering and sorting, in display order.
    const std::vector<int>& visible_rows() const { return order_; }

    void select_row(int row);
    int selected_row() const { return selected_; }

    void set_editable(bool editable) { editable_ = editable; }
    bool is_editable() const { return editable_; }
    bool begin_edit(int row, int column);
    bool is_editing() const { return edit_row_ >= 0; }
    TextBox* editor() const { return editor_.get(); }

    // Header line then the visible rows; fields with commas, quotes or line
    // breaks are quoted.
    std::string to_csv() const;
    bool export_csv(const std::string& path) const;

    SDL_Rect header_rect(int column) const;
    // Rect of a data row's cell while the row is on screen.
    SDL_Rect cell_rect(int row, int column) const;

    TextBox* search_box() const { return search_; }
    Dropdown* column_filter() const { return column_filter_; }
    BaseButton* export_button() const { return export_button_; }

    void set_on_row_selected(std::function<void(int)> cb) { on_row_selected_ = std::move(cb); }
    void set_on_row_double_clicked(std::function<void(int, const nlohmann::json&)> cb) {
        on_row_double_clicked_ = std::move(cb);
    }
    void set_on_cell_changed(std::function<void(int, int, const std::string&)> cb) { on_cell_changed_ = std::move(cb); }
    void set_on_data_changed(std::function<void()> cb) { on_data_changed_ = std::move(cb); }
    // Export button; receives the CSV text.
    void set_on_export(std::function<void(const std::string&)> cb) { on_export_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    // Rows drawn in the body; all visible rows unless a subclass pages them.
    virtual std::vector<int> shown_rows() const { return order_; }
    // Runs after the visible rows were recomputed.
    virtual void rows_changed() {}
    virtual int footer_height(int) const { return 0; }
    SDL_Rect table_area() const;

private:
    void refresh();
    bool row_matches(const Row& row) const;
    int column_width(int column) const;
    int column_x(int column) const;
    SDL_Rect body_area() const;
    int max_scroll() const;
    int row_at(SDL_Point p) const;
    int column_at(int x) const;
    void commit_edit();
    void cancel_edit();
    void ensure_visible(int row);

    std::vector<std::string> headers_;
    std::vector<Row> data_;
    std::vector<int> order_;
    std::unique_ptr<BoxLayout> toolbar_;
    TextBox* search_ = nullptr;
    Dropdown* column_filter_ = nullptr;
    BaseButton* clear_button_ = nullptr;
    BaseButton* export_button_ = nullptr;
    bool sortable_ = true;
    int sort_column_ = -1;
    bool sort_ascending_ = true;
    std::string filter_;
    int filter_column_ = -1;
    int selected_ = -1;
    int hover_row_ = -1;
    int pressed_header_ = -1;
    bool focused_ = false;
    int scroll_ = 0;
    bool editable_ = false;
    int edit_row_ = -1;
    int edit_column_ = -1;
    std::unique_ptr<TextBox> editor_;
    std::function<void(int)> on_row_selected_{};
    std::function<void(int, const nlohmann::json&)> on_row_double_clicked_{};
    std::function<void(int, int, const std::string&)> on_cell_changed_{};
    std::function<void()> on_data_changed_{};
    std::function<void(const std::string&)> on_export_{};
};

// DataTable showing `page_size` filtered rows at a time with a Pagination
// footer. Changing the filter returns to page 1.
class PaginatedDataTable : public DataTable {
public:
    explicit PaginatedDataTable(const std::vector<std::string>& headers = {}, int page_size = 50,
                                bool show_toolbar = true);
    ~PaginatedDataTable() override;

    void set_page_size(int page_size);
    int page_size() const { return page_size_; }
    void set_current_page(int page);
    int current_page() const { return page_; }
    int total_pages() const;
    Pagination* pagination() const { return pagination_.get(); }

    void set_on_page_changed(std::function<void(int)> cb) { on_page_changed_ = std::move(cb); }

    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;
    std::vector<int> shown_rows() const override;
    void rows_changed() override;
    int footer_height(int w) const override;

private:
    std::unique_ptr<Pagination> pagination_;
    int page_size_;
    int page_ = 1;
    std::string last_filter_;
    std::function<void(int)> on_page_changed_{};
};
