#pragma once

#include <functional>
#include <string>
#include <vector>

class DockablePanel;

// Keeps a single floating DockablePanel open at a time. Floating panels live
// on the overlay layer as passive overlays.
//
// Opening a panel closes the ones floating before it through their close
// callbacks, unless it shares their stack key: then the previous panel stays
// underneath and becomes active again when the new one closes.
class FloatingPanelManager {
public:
    using CloseCallback = std::function<void()>;

    static FloatingPanelManager& instance();

    // Registers the panel and puts it on the overlay layer. Opening a panel
    // that is already floating refreshes its name, callback and stack key and
    // brings it to the top.
    void open_floating(const std::string& name, DockablePanel* panel, CloseCallback close_callback = {},
                       const std::string& stack_key = {});

    // Called when a panel stops floating, whoever closed it. Takes it off the
    // overlay layer.
    void notify_panel_closed(const DockablePanel* panel);

    DockablePanel* active_panel() const;
    std::string active_name() const;
    bool is_floating(const DockablePanel* panel) const;
    size_t count() const { return entries_.size(); }

    // Forgets every panel without running callbacks.
    void clear();

private:
    FloatingPanelManager() = default;

    struct Entry {
        std::string name;
        DockablePanel* panel = nullptr;
        CloseCallback close_callback;
        std::string stack_key;
    };

    int find(const DockablePanel* panel) const;

    // Active panel last.
    std::vector<Entry> entries_;
};
