#include "breadcrumb_bar.hpp"

#include <algorithm>

#include "core/draw_utils.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kItemHeight = 28;
constexpr int kLeftInset = 4;
constexpr float kDisabledAlpha = 0.5f;
const char* const kEllipsis = "...";

std::vector<std::string> split_any(const std::string& s, const std::string& seps) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (seps.find(c) != std::string::npos) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}
}

BreadcrumbBar::BreadcrumbBar(const std::string& separator, int max_items)
    : separator_(separator), max_items_(std::max(3, max_items)) {}

void BreadcrumbBar::set_paths(const std::vector<std::string>& paths) {
    paths_ = paths;
    rebuild();
}

void BreadcrumbBar::add_path(const std::string& path) {
    paths_.push_back(path);
    rebuild();
}

void BreadcrumbBar::remove_last_path() {
    if (paths_.empty()) return;
    paths_.pop_back();
    rebuild();
}

void BreadcrumbBar::clear() {
    paths_.clear();
    rebuild();
}

void BreadcrumbBar::navigate_to_index(int index) {
    if (index < 0 || index >= static_cast<int>(paths_.size())) return;
    paths_.resize(static_cast<size_t>(index) + 1);
    rebuild();
    if (on_path_clicked_) on_path_clicked_(index, paths_.back());
}

std::string BreadcrumbBar::full_path(const std::string& separator) const {
    std::string out;
    for (size_t i = 0; i < paths_.size(); ++i) {
        if (i) out += separator;
        out += paths_[i];
    }
    return out;
}

void BreadcrumbBar::set_separator(const std::string& separator) {
    separator_ = separator;
    rebuild();
}

void BreadcrumbBar::set_max_items(int n) {
    max_items_ = std::max(3, n);
    rebuild();
}

std::vector<std::string> BreadcrumbBar::visible_items() const {
    std::vector<std::string> out;
    for (const auto& s : build_segments()) out.push_back(s.text);
    return out;
}

SDL_Rect BreadcrumbBar::item_rect(int index) const {
    for (const auto& s : segments_) {
        if (s.index == index) return s.rect;
    }
    return SDL_Rect{ 0, 0, 0, 0 };
}

std::vector<BreadcrumbBar::Segment> BreadcrumbBar::build_segments() const {
    std::vector<Segment> out;
    const int n = static_cast<int>(paths_.size());
    auto push = [&out](const std::string& text, int index) {
        Segment s;
        s.text = text;
        s.index = index;
        out.push_back(s);
    };
    if (n <= max_items_) {
        for (int i = 0; i < n; ++i) push(paths_[static_cast<size_t>(i)], i);
        return out;
    }
    push(paths_.front(), 0);
    push(kEllipsis, -1);
    for (int i = n - (max_items_ - 2); i < n; ++i) push(paths_[static_cast<size_t>(i)], i);
    return out;
}

bool BreadcrumbBar::is_link(const Segment& s) const {
    return s.index >= 0 && s.index + 1 < static_cast<int>(paths_.size());
}

void BreadcrumbBar::rebuild() {
    segments_ = build_segments();
    hovered_segment_ = -1;
    pressed_segment_ = -1;
    layout();
}

void BreadcrumbBar::layout() {
    const LabelStyle link = Styles::Label("default", "primary");
    const int sep_w = wk_text::width(Styles::Label("default", "text_secondary"), separator_);
    const int y = rect_.y + (rect_.h - kItemHeight) / 2;
    int x = rect_.x + kLeftInset;
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (i) x += sep_w;
        LabelStyle st = link;
        st.bold = i + 1 == segments_.size();
        const int w = wk_text::width(st, segments_[i].text) + kItemPadding * 2;
        segments_[i].rect = SDL_Rect{ x, y, w, kItemHeight };
        x += w;
    }
}

int BreadcrumbBar::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const int sep_w = wk_text::width(Styles::Label("default", "text_secondary"), separator_);
    int w = kLeftInset * 2;
    const auto segs = build_segments();
    for (size_t i = 0; i < segs.size(); ++i) {
        LabelStyle st = Styles::Label("default", "primary");
        st.bold = i + 1 == segs.size();
        w += wk_text::width(st, segs[i].text) + kItemPadding * 2;
        if (i) w += sep_w;
    }
    return w;
}

int BreadcrumbBar::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : kHeight;
}

int BreadcrumbBar::segment_at(SDL_Point p) const {
    for (size_t i = 0; i < segments_.size(); ++i) {
        if (wk::point_in(segments_[i].rect, p)) return static_cast<int>(i);
    }
    return -1;
}

bool BreadcrumbBar::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        const int seg = segment_at(wk::event_point(e));
        hovered_segment_ = seg >= 0 && is_link(segments_[static_cast<size_t>(seg)]) ? seg : -1;
        return false;
    }
    if (wk::is_left_press(e)) {
        const int seg = segment_at(wk::event_point(e));
        if (seg < 0 || !is_link(segments_[static_cast<size_t>(seg)])) return false;
        pressed_segment_ = seg;
        return true;
    }
    if (wk::is_left_release(e) && pressed_segment_ >= 0) {
        const int pressed = pressed_segment_;
        pressed_segment_ = -1;
        if (segment_at(wk::event_point(e)) == pressed) {
            navigate_to_index(segments_[static_cast<size_t>(pressed)].index);
        }
        return true;
    }
    return false;
}

void BreadcrumbBar::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const LabelStyle sep_style = Styles::Label("default", "text_secondary");
    const int radius = tm.border_radius("sm");
    wk_draw::ClipScope clip(r, rect_);
    for (size_t i = 0; i < segments_.size(); ++i) {
        const Segment& s = segments_[i];
        if (i) {
            const SDL_Rect& prev = segments_[i - 1].rect;
            const SDL_Rect sep{ prev.x + prev.w, s.rect.y, s.rect.x - prev.x - prev.w, s.rect.h };
            wk_text::draw_in_rect(r, sep_style, separator_, sep, wk_text::Align::Center, alpha);
        }
        LabelStyle st;
        if (s.index < 0) {
            st = sep_style;
        } else if (is_link(s)) {
            st = Styles::Label("default", "primary");
        } else {
            st = Styles::Label("default", "text");
            st.bold = true;
        }
        if (static_cast<int>(i) == hovered_segment_) {
            wk_draw::fill_rounded_rect(r, s.rect, radius, tm.color("hover"), alpha);
        }
        wk_text::draw_in_rect(r, st, s.text, s.rect, wk_text::Align::Center, alpha);
    }
}

FileBreadcrumb::FileBreadcrumb() : BreadcrumbBar(" / ") {}

void FileBreadcrumb::set_file_path(const std::string& path) {
    absolute_ = !path.empty() && (path.front() == '/' || path.front() == '\\');
    std::vector<std::string> parts;
    for (const auto& p : split_any(path, "/\\")) {
        if (p == ".") continue;
        if (p == "..") {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(p);
    }
    set_paths(parts);
}

std::string FileBreadcrumb::file_path() const {
    const std::string joined = full_path("/");
    return absolute_ ? "/" + joined : joined;
}

WebBreadcrumb::WebBreadcrumb() : BreadcrumbBar(" \xE2\x80\xBA ") {}

void WebBreadcrumb::set_url(const std::string& url) {
    std::string rest = url;
    const size_t scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        scheme_ = rest.substr(0, scheme_end);
        rest = rest.substr(scheme_end + 3);
    } else {
        scheme_ = "https";
    }
    const size_t tail = rest.find_first_of("?#");
    if (tail != std::string::npos) rest.resize(tail);
    set_paths(split_any(rest, "/"));
}

std::string WebBreadcrumb::url() const {
    if (paths_.empty()) return {};
    return scheme_ + "://" + full_path("/");
}
