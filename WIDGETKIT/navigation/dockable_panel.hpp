#pragma once

#include <SDL.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/animation.hpp"

enum class DockZone { Left, Right, Top, Bottom, Center };

namespace wk {
const char* dock_zone_name(DockZone zone);
}

class DockingArea;

// Titled panel with a collapse arrow, a float/dock button and a close
// button. Docked panels are placed by their DockingArea; dragging the header
// of a docked panel past a few pixels pulls it out as a floating panel, and
// dropping it over a zone of the area docks it again. Clicking the header
// without dragging collapses or expands the body.
class DockablePanel : public AnimatedWidget {
public:
    static constexpr int kHeaderHeight = 36;
    static constexpr int kButtonSize = 24;
    static constexpr int kBodyPadding = 8;
    static constexpr int kDragThreshold = 4;
    static constexpr int kFloatingWidth = 280;
    static constexpr int kMaxFloatingHeight = 360;

    explicit DockablePanel(const std::string& title = {}, bool closable = true);
    ~DockablePanel() override;

    void set_title(const std::string& title) { title_ = title; }
    const std::string& title() const { return title_; }

    Widget* set_content(std::unique_ptr<Widget> content);
    template <class T>
    T* set_content_widget(std::unique_ptr<T> content) {
        T* raw = content.get();
        set_content(std::move(content));
        return raw;
    }
    Widget* content() const { return content_.get(); }

    void set_collapsed(bool collapsed);
    bool is_collapsed() const { return collapsed_; }
    void toggle_collapsed() { set_collapsed(!collapsed_); }

    void set_closable(bool closable) { closable_ = closable; }
    bool is_closable() const { return closable_; }
    // Hides the panel and takes it off the floating layer.
    void close();

    bool is_floating() const { return floating_; }
    bool is_dragging() const { return dragging_; }
    DockingArea* docking_area() const { return area_; }

    SDL_Rect header_rect() const;
    SDL_Rect collapse_rect() const;
    // Empty when the panel has no docking area.
    SDL_Rect float_rect() const;
    // Empty when the panel cannot be closed.
    SDL_Rect close_rect() const;
    SDL_Rect body_rect() const;

    void set_on_closed(std::function<void()> cb) { on_closed_ = std::move(cb); }
    void set_on_collapsed_changed(std::function<void(bool)> cb) { on_collapsed_changed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    friend class DockingArea;
    enum class HeaderButton { None, Collapse, Float, Close };

    HeaderButton button_at(SDL_Point p) const;
    void move_to(int x, int y);

    std::string title_;
    std::unique_ptr<Widget> content_;
    bool closable_;
    bool collapsed_ = false;
    bool floating_ = false;
    bool header_pressed_ = false;
    bool dragging_ = false;
    HeaderButton pressed_button_ = HeaderButton::None;
    SDL_Point press_point_{0, 0};
    SDL_Point drag_offset_{0, 0};
    DockingArea* area_ = nullptr;
    std::function<void()> on_closed_{};
    std::function<void(bool)> on_collapsed_changed_{};
};

// Host that arranges docked panels in five zones: top and bottom bands across
// the full width, left and right columns between them and the centre in the
// remaining space. Panels in a zone share it evenly; collapsed panels keep
// only their header.
//
// Only one panel floats at a time. Floating another panel docks the previous
// one back into its zone.
class DockingArea : public Widget {
public:
    static constexpr int kSideWidth = 240;
    static constexpr int kBandHeight = 160;
    static constexpr int kEdgeBand = 48;
    static constexpr int kGap = 4;

    DockingArea();
    ~DockingArea() override;

    DockablePanel* add_panel(std::unique_ptr<DockablePanel> panel, DockZone zone = DockZone::Left);
    std::unique_ptr<DockablePanel> remove_panel(DockablePanel* panel);
    void clear_panels();

    // Docks a floating, closed or differently docked panel into `zone`.
    void dock_panel(DockablePanel* panel, DockZone zone);
    // Floats a docked panel next to where it was docked.
    void undock_panel(DockablePanel* panel);
    // Reopens a closed panel in its zone.
    void show_panel(DockablePanel* panel);

    std::vector<DockablePanel*> panels() const;
    // Docked, open panels in layout order.
    std::vector<DockablePanel*> panels_in(DockZone zone) const;
    // Zone the panel docks into; floating and closed panels remember theirs.
    DockZone zone_of(const DockablePanel* panel) const;
    DockablePanel* floating_panel() const;

    // Area given to a zone by the last layout; empty when nothing is docked
    // there.
    SDL_Rect zone_rect(DockZone zone) const;
    // Zone a panel dropped at `p` would dock into. Points outside the edge
    // bands and the centre target leave the panel floating.
    bool drop_zone_at(SDL_Point p, DockZone& zone) const;
    // Drop target highlighted while a panel is dragged.
    bool drag_hint(DockZone& zone) const;

    void set_on_panel_docked(std::function<void(DockablePanel*, DockZone)> cb) { on_panel_docked_ = std::move(cb); }
    void set_on_panel_undocked(std::function<void(DockablePanel*)> cb) { on_panel_undocked_ = std::move(cb); }
    void set_on_panel_closed(std::function<void(DockablePanel*)> cb) { on_panel_closed_ = std::move(cb); }

    int preferred_width() const override;
    int height_for_width(int w) const override;
    bool handle_event(const SDL_Event& e) override;
    void update() override;
    void render(SDL_Renderer* r) const override;

protected:
    void layout() override;

private:
    friend class DockablePanel;

    struct Entry {
        std::unique_ptr<DockablePanel> panel;
        DockZone zone = DockZone::Left;
    };

    Entry* find(const DockablePanel* panel);
    const Entry* find(const DockablePanel* panel) const;
    void float_panel(DockablePanel* panel, const SDL_Rect& r);
    void layout_zone(DockZone zone, const SDL_Rect& area);
    SDL_Rect center_target() const;
    SDL_Rect hint_rect(DockZone zone) const;

    void begin_drag(DockablePanel* panel);
    void drag_moved(DockablePanel* panel, SDL_Point p);
    void end_drag(DockablePanel* panel, SDL_Point p);
    void panel_closed(DockablePanel* panel);

    std::vector<Entry> entries_;
    SDL_Rect zone_rects_[5] = {};
    bool hint_active_ = false;
    DockZone hint_zone_ = DockZone::Center;
    std::function<void(DockablePanel*, DockZone)> on_panel_docked_{};
    std::function<void(DockablePanel*)> on_panel_undocked_{};
    std::function<void(DockablePanel*)> on_panel_closed_{};
};
