#pragma once

#include <SDL.h>
#include <functional>
#include <string>
#include <vector>

#include "core/widget.hpp"

// Horizontal trail of path segments. Every segment but the last is a link;
// clicking one truncates the trail after it. Trails longer than max_items
// show the first segment, "..." and the last max_items - 2 segments.
class BreadcrumbBar : public Widget {
public:
    static constexpr int kHeight = 40;
    static constexpr int kDefaultMaxItems = 5;
    static constexpr int kItemPadding = 6;

    explicit BreadcrumbBar(const std::string& separator = " > ", int max_items = kDefaultMaxItems);

    void set_paths(const std::vector<std::string>& paths);
    void add_path(const std::string& path);
    void remove_last_path();
    void clear();
    // Drops everything after `index` and emits path_clicked.
    void navigate_to_index(int index);

    const std::vector<std::string>& paths() const { return paths_; }
    std::string current_path() const { return paths_.empty() ? std::string{} : paths_.back(); }
    std::string full_path(const std::string& separator = "/") const;

    void set_separator(const std::string& separator);
    const std::string& separator() const { return separator_; }
    // At least 3.
    void set_max_items(int n);
    int max_items() const { return max_items_; }

    // Displayed texts, "..." standing for the hidden middle.
    std::vector<std::string> visible_items() const;
    // Rect of the segment showing paths()[index]; empty when it is hidden.
    SDL_Rect item_rect(int index) const;

    void set_on_path_clicked(std::function<void(int, const std::string&)> cb) { on_path_clicked_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

    std::vector<std::string> paths_;

private:
    struct Segment {
        std::string text;
        int index = -1;
        SDL_Rect rect{0, 0, 0, 0};
    };

    std::vector<Segment> build_segments() const;
    int segment_at(SDL_Point p) const;
    bool is_link(const Segment& s) const;
    void rebuild();

    std::string separator_;
    int max_items_;
    std::vector<Segment> segments_;
    int hovered_segment_ = -1;
    int pressed_segment_ = -1;
    std::function<void(int, const std::string&)> on_path_clicked_{};
};

// Breadcrumb for file system paths. Accepts both '/' and '\\'.
class FileBreadcrumb : public BreadcrumbBar {
public:
    FileBreadcrumb();

    void set_file_path(const std::string& path);
    // Segments joined with '/', with a leading '/' for absolute paths.
    std::string file_path() const;

private:
    bool absolute_ = false;
};

// Breadcrumb for URLs: the host followed by the path segments.
class WebBreadcrumb : public BreadcrumbBar {
public:
    WebBreadcrumb();

    void set_url(const std::string& url);
    // "https://host/a/b" for the current trail.
    std::string url() const;

private:
    std::string scheme_ = "https";
};
