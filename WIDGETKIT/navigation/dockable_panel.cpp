#include "dockable_panel.hpp"

#include <algorithm>
#include <cstdlib>

#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "floating_panel_manager.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kArrowSize = 12;
constexpr int kEmptyBodyHeight = 60;
constexpr int kFloatOffset = 24;
constexpr float kDisabledAlpha = 0.5f;

void draw_grip(SDL_Renderer* r, const SDL_Rect& area, SDL_Color col, float alpha) {
    const int lines = 3;
    const int gap = 3;
    const int total_h = lines + (lines - 1) * gap;
    const int start_y = area.y + (area.h - total_h) / 2;
    for (int i = 0; i < lines; ++i) {
        const int y = start_y + i * (1 + gap);
        wk_draw::draw_line(r, area.x + 3, y, area.x + area.w - 3, y, col, 1, alpha);
    }
}

int zone_index(DockZone z) { return static_cast<int>(z); }

bool vertical_stack(DockZone z) { return z != DockZone::Top && z != DockZone::Bottom; }
}

namespace wk {
const char* dock_zone_name(DockZone zone) {
    switch (zone) {
    case DockZone::Left: return "left";
    case DockZone::Right: return "right";
    case DockZone::Top: return "top";
    case DockZone::Bottom: return "bottom";
    case DockZone::Center:
    default: return "center";
    }
}
}

DockablePanel::DockablePanel(const std::string& title, bool closable) : title_(title), closable_(closable) {}

DockablePanel::~DockablePanel() {
    FloatingPanelManager::instance().notify_panel_closed(this);
    OverlayManager::instance().close(this);
}

Widget* DockablePanel::set_content(std::unique_ptr<Widget> content) {
    content_ = std::move(content);
    if (content_) content_->set_parent(this);
    layout();
    return content_.get();
}

void DockablePanel::set_collapsed(bool collapsed) {
    if (collapsed == collapsed_) return;
    collapsed_ = collapsed;
    if (floating_) {
        const int w = rect_.w > 0 ? rect_.w : kFloatingWidth;
        rect_.h = std::min(kMaxFloatingHeight, height_for_width(w));
    }
    layout();
    if (on_collapsed_changed_) on_collapsed_changed_(collapsed_);
}

void DockablePanel::close() {
    if (!visible_) return;
    visible_ = false;
    hovered_ = false;
    header_pressed_ = false;
    dragging_ = false;
    pressed_button_ = HeaderButton::None;
    if (floating_) {
        floating_ = false;
        FloatingPanelManager::instance().notify_panel_closed(this);
    }
    if (area_) area_->panel_closed(this);
    if (on_closed_) on_closed_();
}

SDL_Rect DockablePanel::header_rect() const {
    return SDL_Rect{ rect_.x, rect_.y, rect_.w, kHeaderHeight };
}

SDL_Rect DockablePanel::collapse_rect() const {
    return SDL_Rect{ rect_.x + 10, rect_.y + (kHeaderHeight - kArrowSize) / 2, kArrowSize, kArrowSize };
}

SDL_Rect DockablePanel::close_rect() const {
    if (!closable_) return SDL_Rect{ 0, 0, 0, 0 };
    return SDL_Rect{ rect_.x + rect_.w - 6 - kButtonSize, rect_.y + (kHeaderHeight - kButtonSize) / 2, kButtonSize,
                     kButtonSize };
}

SDL_Rect DockablePanel::float_rect() const {
    if (!area_) return SDL_Rect{ 0, 0, 0, 0 };
    const int right = closable_ ? close_rect().x - 2 : rect_.x + rect_.w - 6;
    return SDL_Rect{ right - kButtonSize, rect_.y + (kHeaderHeight - kButtonSize) / 2, kButtonSize, kButtonSize };
}

SDL_Rect DockablePanel::body_rect() const {
    if (collapsed_) return SDL_Rect{ rect_.x, rect_.y + kHeaderHeight, rect_.w, 0 };
    return SDL_Rect{ rect_.x + kBodyPadding, rect_.y + kHeaderHeight + kBodyPadding,
                     std::max(0, rect_.w - 2 * kBodyPadding),
                     std::max(0, rect_.h - kHeaderHeight - 2 * kBodyPadding) };
}

DockablePanel::HeaderButton DockablePanel::button_at(SDL_Point p) const {
    if (closable_ && wk::point_in(close_rect(), p)) return HeaderButton::Close;
    if (area_ && wk::point_in(float_rect(), p)) return HeaderButton::Float;
    return HeaderButton::None;
}

void DockablePanel::move_to(int x, int y) {
    set_rect(OverlayManager::instance().clamp_to_screen(SDL_Rect{ x, y, rect_.w, rect_.h }));
}

void DockablePanel::layout() {
    if (content_ && !collapsed_) content_->set_rect(body_rect());
}

int DockablePanel::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    const LabelStyle st = Styles::Label("default", "text");
    const int header_w = 32 + wk_text::width(st, title_) + 2 * (kButtonSize + 4) + 8;
    const int body_w = content_ ? content_->preferred_width() + 2 * kBodyPadding : 0;
    return std::max(header_w, body_w);
}

int DockablePanel::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    if (collapsed_) return kHeaderHeight;
    const int body = content_ ? content_->height_for_width(std::max(0, w - 2 * kBodyPadding)) : kEmptyBodyHeight;
    return kHeaderHeight + body + 2 * kBodyPadding;
}

bool DockablePanel::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;

    if (e.type == SDL_MOUSEMOTION) {
        track_hover(e);
        if (header_pressed_) {
            const SDL_Point p = wk::event_point(e);
            if (!dragging_ && (std::abs(p.x - press_point_.x) > kDragThreshold ||
                               std::abs(p.y - press_point_.y) > kDragThreshold)) {
                dragging_ = true;
                if (!floating_ && area_) area_->begin_drag(this);
                drag_offset_.x = std::min(drag_offset_.x, std::max(0, rect_.w - 1));
            }
            if (dragging_) {
                if (floating_) move_to(p.x - drag_offset_.x, p.y - drag_offset_.y);
                if (area_) area_->drag_moved(this, p);
            }
            return true;
        }
    }

    if (floating_ && closable_ && hovered_ && wk::is_key(e, SDLK_ESCAPE)) {
        close();
        return true;
    }

    if (wk::is_left_press(e)) {
        const SDL_Point p = wk::event_point(e);
        if (wk::point_in(header_rect(), p)) {
            pressed_button_ = button_at(p);
            if (pressed_button_ == HeaderButton::None) {
                header_pressed_ = true;
                press_point_ = p;
                drag_offset_ = SDL_Point{ p.x - rect_.x, p.y - rect_.y };
            }
            return true;
        }
    }

    if (wk::is_left_release(e)) {
        const SDL_Point p = wk::event_point(e);
        if (pressed_button_ != HeaderButton::None) {
            const HeaderButton b = pressed_button_;
            pressed_button_ = HeaderButton::None;
            if (button_at(p) != b) return true;
            if (b == HeaderButton::Close) {
                close();
            } else if (area_) {
                if (floating_) area_->dock_panel(this, area_->zone_of(this));
                else area_->undock_panel(this);
            }
            return true;
        }
        if (header_pressed_) {
            header_pressed_ = false;
            if (dragging_) {
                dragging_ = false;
                if (area_) area_->end_drag(this, p);
            } else if (wk::point_in(header_rect(), p)) {
                toggle_collapsed();
            }
            return true;
        }
    }

    if (content_ && !collapsed_ && content_->handle_event(e)) return true;

    if (floating_ && wk::is_left_press(e) && wk::point_in(rect_, wk::event_point(e))) return true;
    return false;
}

void DockablePanel::update() {
    if (!visible_) return;
    AnimatedWidget::update();
    layout();
    if (content_ && !collapsed_) content_->update();
}

void DockablePanel::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity() * (enabled_ ? 1.0f : kDisabledAlpha);
    const int radius = tm.border_radius("md");

    if (floating_) wk_draw::draw_shadow(r, rect_, radius, 6, wk::rgba(0, 0, 0, 60), alpha);
    wk_draw::fill_rounded_rect(r, rect_, radius, Styles::PanelBG(), alpha);
    wk_draw::draw_rounded_rect(r, rect_, radius, Styles::Border(), alpha);

    const SDL_Rect header = header_rect();
    const SDL_Color secondary = tm.color("text_secondary");
    wk_draw::draw_chevron(r, collapse_rect(), collapsed_ ? wk_draw::Direction::Right : wk_draw::Direction::Down,
                          secondary, alpha);
    LabelStyle title_style = Styles::Label("default", "text");
    title_style.bold = true;
    const int title_x = collapse_rect().x + kArrowSize + 8;
    int title_right = header.x + header.w - 8;
    if (area_) title_right = float_rect().x - 4;
    else if (closable_) title_right = close_rect().x - 4;
    if (floating_) {
        const SDL_Rect grip{ title_right - 24, header.y + 6, 20, header.h - 12 };
        draw_grip(r, grip, Styles::Border(), alpha);
        title_right = grip.x - 4;
    }
    const SDL_Rect title_area{ title_x, header.y, std::max(0, title_right - title_x), header.h };
    wk_text::draw_in_rect(r, title_style, wk_text::elide(title_style, title_, title_area.w), title_area,
                          wk_text::Align::Left, alpha);

    if (area_) {
        const SDL_Rect fr = float_rect();
        if (pressed_button_ == HeaderButton::Float) {
            wk_draw::fill_rounded_rect(r, fr, tm.border_radius("sm"), tm.color("hover"), alpha);
        }
        wk_icons::draw(r, "pin", wk_draw::inset(fr, 5, 5), floating_ ? tm.color("primary") : secondary, alpha);
    }
    if (closable_) {
        const SDL_Rect cr = close_rect();
        if (pressed_button_ == HeaderButton::Close) {
            wk_draw::fill_rounded_rect(r, cr, tm.border_radius("sm"), tm.color("hover"), alpha);
        }
        wk_draw::draw_cross(r, wk_draw::inset(cr, 7, 7), secondary, alpha);
    }

    if (collapsed_) return;
    wk_draw::fill_rect(r, SDL_Rect{ header.x, header.y + header.h - 1, header.w, 1 }, Styles::Border(), alpha);
    if (content_) {
        wk_draw::ClipScope clip(r, body_rect());
        content_->render(r);
    }
}

DockingArea::DockingArea() = default;

DockingArea::~DockingArea() {
    for (auto& e : entries_) {
        if (e.panel->is_floating()) FloatingPanelManager::instance().notify_panel_closed(e.panel.get());
    }
}

DockingArea::Entry* DockingArea::find(const DockablePanel* panel) {
    for (auto& e : entries_) {
        if (e.panel.get() == panel) return &e;
    }
    return nullptr;
}

const DockingArea::Entry* DockingArea::find(const DockablePanel* panel) const {
    return const_cast<DockingArea*>(this)->find(panel);
}

DockablePanel* DockingArea::add_panel(std::unique_ptr<DockablePanel> panel, DockZone zone) {
    if (!panel) return nullptr;
    Entry e;
    e.panel = std::move(panel);
    e.zone = zone;
    e.panel->area_ = this;
    e.panel->set_parent(this);
    DockablePanel* raw = e.panel.get();
    entries_.push_back(std::move(e));
    layout();
    if (on_panel_docked_) on_panel_docked_(raw, zone);
    return raw;
}

std::unique_ptr<DockablePanel> DockingArea::remove_panel(DockablePanel* panel) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->panel.get() != panel) continue;
        std::unique_ptr<DockablePanel> out = std::move(it->panel);
        entries_.erase(it);
        if (out->floating_) {
            out->floating_ = false;
            FloatingPanelManager::instance().notify_panel_closed(out.get());
        }
        out->area_ = nullptr;
        out->set_parent(nullptr);
        out->dragging_ = false;
        out->header_pressed_ = false;
        hint_active_ = false;
        layout();
        return out;
    }
    return nullptr;
}

void DockingArea::clear_panels() {
    for (auto& e : entries_) {
        if (e.panel->floating_) FloatingPanelManager::instance().notify_panel_closed(e.panel.get());
    }
    entries_.clear();
    hint_active_ = false;
    layout();
}

void DockingArea::dock_panel(DockablePanel* panel, DockZone zone) {
    Entry* e = find(panel);
    if (!e) return;
    if (panel->floating_) {
        panel->floating_ = false;
        FloatingPanelManager::instance().notify_panel_closed(panel);
    }
    panel->dragging_ = false;
    panel->header_pressed_ = false;
    panel->set_opacity(1.0f);
    panel->show();
    e->zone = zone;
    hint_active_ = false;
    layout();
    if (on_panel_docked_) on_panel_docked_(panel, zone);
}

void DockingArea::float_panel(DockablePanel* panel, const SDL_Rect& r) {
    Entry* e = find(panel);
    if (!e || panel->floating_) return;
    const DockZone home = e->zone;
    panel->floating_ = true;
    FloatingPanelManager::instance().open_floating(panel->title(), panel,
                                                   [this, panel, home]() { dock_panel(panel, home); });
    panel->show();
    const int h = std::min(DockablePanel::kMaxFloatingHeight, panel->height_for_width(r.w));
    panel->set_rect(OverlayManager::instance().clamp_to_screen(SDL_Rect{ r.x, r.y, r.w, h }));
    layout();
    if (on_panel_undocked_) on_panel_undocked_(panel);
}

void DockingArea::undock_panel(DockablePanel* panel) {
    if (!find(panel) || panel->floating_ || !panel->is_visible()) return;
    const SDL_Rect cur = panel->rect();
    float_panel(panel, SDL_Rect{ cur.x + kFloatOffset, cur.y + kFloatOffset, DockablePanel::kFloatingWidth, 0 });
    AnimationHelpers::fade_in(*panel, 150);
}

void DockingArea::show_panel(DockablePanel* panel) {
    if (!find(panel) || panel->is_visible()) return;
    panel->show();
    layout();
}

std::vector<DockablePanel*> DockingArea::panels() const {
    std::vector<DockablePanel*> out;
    for (const auto& e : entries_) out.push_back(e.panel.get());
    return out;
}

std::vector<DockablePanel*> DockingArea::panels_in(DockZone zone) const {
    std::vector<DockablePanel*> out;
    for (const auto& e : entries_) {
        if (e.zone == zone && !e.panel->floating_ && e.panel->is_visible()) out.push_back(e.panel.get());
    }
    return out;
}

DockZone DockingArea::zone_of(const DockablePanel* panel) const {
    const Entry* e = find(panel);
    return e ? e->zone : DockZone::Left;
}

DockablePanel* DockingArea::floating_panel() const {
    for (const auto& e : entries_) {
        if (e.panel->floating_) return e.panel.get();
    }
    return nullptr;
}

SDL_Rect DockingArea::zone_rect(DockZone zone) const {
    return zone_rects_[zone_index(zone)];
}

SDL_Rect DockingArea::center_target() const {
    return wk_draw::centered(rect_, rect_.w / 3, rect_.h / 3);
}

bool DockingArea::drop_zone_at(SDL_Point p, DockZone& zone) const {
    if (!wk::point_in(rect_, p)) return false;
    if (p.x < rect_.x + kEdgeBand) zone = DockZone::Left;
    else if (p.x >= rect_.x + rect_.w - kEdgeBand) zone = DockZone::Right;
    else if (p.y < rect_.y + kEdgeBand) zone = DockZone::Top;
    else if (p.y >= rect_.y + rect_.h - kEdgeBand) zone = DockZone::Bottom;
    else if (wk::point_in(center_target(), p)) zone = DockZone::Center;
    else return false;
    return true;
}

bool DockingArea::drag_hint(DockZone& zone) const {
    if (!hint_active_) return false;
    zone = hint_zone_;
    return true;
}

SDL_Rect DockingArea::hint_rect(DockZone zone) const {
    switch (zone) {
    case DockZone::Left: return SDL_Rect{ rect_.x, rect_.y, std::min(kSideWidth, rect_.w), rect_.h };
    case DockZone::Right:
        return SDL_Rect{ rect_.x + rect_.w - std::min(kSideWidth, rect_.w), rect_.y, std::min(kSideWidth, rect_.w), rect_.h };
    case DockZone::Top: return SDL_Rect{ rect_.x, rect_.y, rect_.w, std::min(kBandHeight, rect_.h) };
    case DockZone::Bottom:
        return SDL_Rect{ rect_.x, rect_.y + rect_.h - std::min(kBandHeight, rect_.h), rect_.w, std::min(kBandHeight, rect_.h) };
    case DockZone::Center:
    default: return center_target();
    }
}

void DockingArea::begin_drag(DockablePanel* panel) {
    const SDL_Rect cur = panel->rect();
    float_panel(panel, SDL_Rect{ cur.x, cur.y, DockablePanel::kFloatingWidth, 0 });
}

void DockingArea::drag_moved(DockablePanel*, SDL_Point p) {
    hint_active_ = drop_zone_at(p, hint_zone_);
}

void DockingArea::end_drag(DockablePanel* panel, SDL_Point p) {
    hint_active_ = false;
    DockZone zone = DockZone::Center;
    if (drop_zone_at(p, zone)) dock_panel(panel, zone);
}

void DockingArea::panel_closed(DockablePanel* panel) {
    hint_active_ = false;
    layout();
    if (on_panel_closed_) on_panel_closed_(panel);
}

void DockingArea::layout_zone(DockZone zone, const SDL_Rect& area) {
    const auto list = panels_in(zone);
    if (list.empty()) return;
    const int n = static_cast<int>(list.size());
    if (!vertical_stack(zone)) {
        const int w = (area.w - kGap * (n - 1)) / n;
        int x = area.x;
        for (auto* p : list) {
            const int h = p->is_collapsed() ? DockablePanel::kHeaderHeight : area.h;
            p->set_rect(SDL_Rect{ x, area.y, w, h });
            x += w + kGap;
        }
        return;
    }
    int fixed = kGap * (n - 1);
    int open = 0;
    for (auto* p : list) {
        if (p->is_collapsed()) fixed += DockablePanel::kHeaderHeight;
        else ++open;
    }
    const int share = open > 0 ? std::max(DockablePanel::kHeaderHeight, (area.h - fixed) / open) : 0;
    int y = area.y;
    for (auto* p : list) {
        const int h = p->is_collapsed() ? DockablePanel::kHeaderHeight : share;
        p->set_rect(SDL_Rect{ area.x, y, area.w, h });
        y += h + kGap;
    }
}

void DockingArea::layout() {
    for (auto& zr : zone_rects_) zr = SDL_Rect{ 0, 0, 0, 0 };
    const bool top = !panels_in(DockZone::Top).empty();
    const bool bottom = !panels_in(DockZone::Bottom).empty();
    const bool left = !panels_in(DockZone::Left).empty();
    const bool right = !panels_in(DockZone::Right).empty();

    int mid_y = rect_.y;
    int mid_h = rect_.h;
    if (top) {
        zone_rects_[zone_index(DockZone::Top)] = SDL_Rect{ rect_.x, rect_.y, rect_.w, kBandHeight };
        mid_y += kBandHeight + kGap;
        mid_h -= kBandHeight + kGap;
    }
    if (bottom) {
        zone_rects_[zone_index(DockZone::Bottom)] =
            SDL_Rect{ rect_.x, rect_.y + rect_.h - kBandHeight, rect_.w, kBandHeight };
        mid_h -= kBandHeight + kGap;
    }
    mid_h = std::max(0, mid_h);
    int mid_x = rect_.x;
    int mid_w = rect_.w;
    if (left) {
        zone_rects_[zone_index(DockZone::Left)] = SDL_Rect{ rect_.x, mid_y, kSideWidth, mid_h };
        mid_x += kSideWidth + kGap;
        mid_w -= kSideWidth + kGap;
    }
    if (right) {
        zone_rects_[zone_index(DockZone::Right)] = SDL_Rect{ rect_.x + rect_.w - kSideWidth, mid_y, kSideWidth, mid_h };
        mid_w -= kSideWidth + kGap;
    }
    if (!panels_in(DockZone::Center).empty()) {
        zone_rects_[zone_index(DockZone::Center)] = SDL_Rect{ mid_x, mid_y, std::max(0, mid_w), mid_h };
    }
    for (int z = 0; z < 5; ++z) layout_zone(static_cast<DockZone>(z), zone_rects_[z]);
}

int DockingArea::preferred_width() const {
    return fixed_w_ >= 0 ? fixed_w_ : 2 * kSideWidth + 320;
}

int DockingArea::height_for_width(int) const {
    return fixed_h_ >= 0 ? fixed_h_ : 2 * kBandHeight + 240;
}

bool DockingArea::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    // Copy first: a handler can re-dock panels and reorder the zones.
    std::vector<DockablePanel*> docked;
    for (int z = 0; z < 5; ++z) {
        for (auto* p : panels_in(static_cast<DockZone>(z))) docked.push_back(p);
    }
    for (auto* p : docked) {
        if (find(p) && !p->is_floating() && p->handle_event(e)) return true;
    }
    return false;
}

void DockingArea::update() {
    if (!visible_) return;
    layout();
    for (int z = 0; z < 5; ++z) {
        for (auto* p : panels_in(static_cast<DockZone>(z))) p->update();
    }
}

void DockingArea::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("background"), alpha);
    for (int z = 0; z < 5; ++z) {
        for (auto* p : panels_in(static_cast<DockZone>(z))) p->render(r);
    }
    if (hint_active_) {
        const SDL_Rect hr = hint_rect(hint_zone_);
        const int radius = tm.border_radius("md");
        wk_draw::fill_rounded_rect(r, hr, radius, wk::with_alpha(tm.color("primary"), 50), alpha);
        wk_draw::draw_rounded_rect(r, hr, radius, tm.color("primary"), alpha);
    }
}
