#include "floating_panel_manager.hpp"

#include <utility>

#include "core/overlay_manager.hpp"
#include "dockable_panel.hpp"

FloatingPanelManager& FloatingPanelManager::instance() {
    static FloatingPanelManager manager;
    return manager;
}

int FloatingPanelManager::find(const DockablePanel* panel) const {
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].panel == panel) return static_cast<int>(i);
    }
    return -1;
}

void FloatingPanelManager::open_floating(const std::string& name, DockablePanel* panel, CloseCallback close_callback,
                                         const std::string& stack_key) {
    if (!panel) return;

    Entry entry;
    entry.name = name;
    entry.panel = panel;
    entry.close_callback = std::move(close_callback);
    entry.stack_key = stack_key;

    const int existing = find(panel);
    if (existing >= 0) {
        entries_.erase(entries_.begin() + existing);
    } else {
        const bool share_stack = !stack_key.empty() && !entries_.empty() && entries_.back().stack_key == stack_key;
        if (!share_stack) {
            // Closing can re-enter notify_panel_closed, so detach each entry first.
            while (!entries_.empty()) {
                Entry previous = std::move(entries_.back());
                entries_.pop_back();
                OverlayManager::instance().close(previous.panel);
                if (previous.close_callback) {
                    previous.close_callback();
                } else if (previous.panel) {
                    previous.panel->hide();
                }
            }
        }
    }

    entries_.push_back(std::move(entry));
    OverlayManager::instance().open(panel, OverlayManager::Mode::Passive, {}, {});
}

void FloatingPanelManager::notify_panel_closed(const DockablePanel* panel) {
    const int i = find(panel);
    if (i < 0) return;
    entries_.erase(entries_.begin() + i);
    OverlayManager::instance().close(panel);
}

DockablePanel* FloatingPanelManager::active_panel() const {
    return entries_.empty() ? nullptr : entries_.back().panel;
}

std::string FloatingPanelManager::active_name() const {
    return entries_.empty() ? std::string{} : entries_.back().name;
}

bool FloatingPanelManager::is_floating(const DockablePanel* panel) const {
    return find(panel) >= 0;
}

void FloatingPanelManager::clear() {
    entries_.clear();
}
