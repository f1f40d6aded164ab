#include "clipboard_history.hpp"

#include <algorithm>
#include <cctype>

#include "base/base_button.hpp"
#include "base/base_popup.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "core/layout.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kPadX = 10;
constexpr int kPadY = 6;
constexpr int kPinSize = 14;
constexpr int kPanelWidth = 340;
constexpr int kPanelHeight = 420;
const char* const kNewlineMark = " \xE2\x86\xB5 ";

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}
}

ClipboardRow::ClipboardRow(const ClipboardEntry& entry)
    : content_(entry.content),
      pinned_(entry.pinned),
      layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 2)) {
    layout_->set_parent(this);
    layout_->set_margins(kPadX, kPadY, kPadX + (pinned_ ? kPinSize + 4 : 0), kPadY);
    auto* text = layout_->add_widget(std::make_unique<Label>(ClipboardHistory::preview(content_), "default", "text"));
    text->set_elide(true);
    layout_->add_widget(std::make_unique<Label>(
        upper(entry.type) + "  \xE2\x80\xA2  " + ClipboardHistory::time_text(entry.timestamp), "caption",
        "text_secondary"));
}

ClipboardRow::~ClipboardRow() = default;

int ClipboardRow::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return layout_->preferred_width();
}

int ClipboardRow::height_for_width(int w) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return layout_->height_for_width(w);
}

void ClipboardRow::layout() { layout_->set_rect(rect_); }

bool ClipboardRow::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    if (wk::is_right_press(e) && contains(e.button.x, e.button.y)) {
        if (on_context_menu_) on_context_menu_(e.button.x, e.button.y);
        return true;
    }
    switch (click_.feed(e, rect_)) {
    case ClickTracker::Result::Clicked:
        if (on_clicked_) on_clicked_();
        return true;
    case ClickTracker::Result::Pressed:
    case ClickTracker::Result::Released:
        return true;
    case ClickTracker::Result::None:
    default:
        return false;
    }
}

void ClipboardRow::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    if (click_.pressed()) wk_draw::fill_rect(r, rect_, wk::with_alpha(tm.color("primary"), 40), alpha);
    else if (hovered_) wk_draw::fill_rect(r, rect_, tm.color("hover"), alpha);
    wk_draw::fill_rect(r, SDL_Rect{ rect_.x, rect_.y + rect_.h - 1, rect_.w, 1 }, tm.color("border"), alpha);
    layout_->render(r);
    if (pinned_) {
        wk_icons::draw(r, "pin",
                       SDL_Rect{ rect_.x + rect_.w - kPadX - kPinSize, rect_.y + kPadY, kPinSize, kPinSize },
                       tm.color("primary"), alpha);
    }
}

ClipboardHistory::ClipboardHistory(int max_items)
    : max_items_(std::max(1, max_items)),
      layout_(std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 8)) {
    layout_->set_parent(this);
    layout_->set_margins(8);

    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    header->set_alignment(BoxLayout::Align::Center);
    auto* title = header->add_widget(std::make_unique<Label>("Clipboard History", "heading", "text"));
    title->set_bold(true);
    header->add_stretch();
    clear_button_ = header->add_widget(
        std::make_unique<BaseButton>("Clear", ButtonVariant::Destructive, ButtonSize::Small));
    clear_button_->set_on_clicked([this]() { clear_history(); });
    layout_->add_widget(std::move(header));

    search_ = layout_->add_widget(std::make_unique<TextBox>("", "Search history..."));
    search_->set_on_text_changed([this](const std::string& text) { set_filter(text); });

    auto list = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 0);
    list_ = list.get();
    scroll_ = layout_->add_widget(std::make_unique<ScrollArea>(std::move(list)), 1);

    auto status = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 8);
    status->set_alignment(BoxLayout::Align::Center);
    status_label_ = status->add_widget(std::make_unique<Label>("0 items", "caption", "text_secondary"));
    status->add_stretch();
    monitor_button_ = status->add_widget(
        std::make_unique<BaseButton>("Monitoring: ON", ButtonVariant::Secondary, ButtonSize::Small));
    monitor_button_->set_checkable(true);
    monitor_button_->set_checked(true);
    monitor_button_->set_on_toggled([this](bool on) { set_monitoring(on); });
    layout_->add_widget(std::move(status));

    poll_timer_.set_on_timeout([this]() { check_clipboard(); });
    poll_timer_.start(kPollMs);
}

ClipboardHistory::~ClipboardHistory() = default;

std::string ClipboardHistory::preview(const std::string& content) {
    std::string head = content;
    const bool cut = wk_text::utf8_length(content) > kPreviewLength;
    if (cut) head = wk_text::utf8_prefix(content, kPreviewLength);
    std::string out;
    for (char c : head) {
        if (c == '\n') out += kNewlineMark;
        else if (c != '\r') out += c;
    }
    if (cut) out += "...";
    return out;
}

std::string ClipboardHistory::plain_text(const std::string& content) {
    std::string out = content;
    std::replace(out.begin(), out.end(), '\n', ' ');
    return wk_text::trim(out);
}

std::string ClipboardHistory::time_text(std::time_t t) {
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &t);
#else
    localtime_r(&t, &local);
#endif
    char buf[16];
    const size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    return std::string(buf, n);
}

bool ClipboardHistory::add_item(const std::string& content, const std::string& type) {
    const std::string text = wk_text::trim(content);
    if (text.empty()) return false;
    bool pinned = false;
    auto it = std::find_if(items_.begin(), items_.end(),
                           [&text](const ClipboardEntry& entry) { return entry.content == text; });
    if (it != items_.end()) {
        pinned = it->pinned;
        items_.erase(it);
    }
    ClipboardEntry entry;
    entry.content = text;
    entry.type = type;
    entry.timestamp = std::time(nullptr);
    entry.pinned = pinned;
    items_.insert(items_.begin(), entry);
    enforce_limit();
    rebuild();
    return true;
}

bool ClipboardHistory::remove_item(int index) {
    if (index < 0 || index >= item_count()) return false;
    items_.erase(items_.begin() + index);
    rebuild();
    return true;
}

void ClipboardHistory::clear_history() {
    items_.erase(std::remove_if(items_.begin(), items_.end(), [](const ClipboardEntry& entry) { return !entry.pinned; }),
                 items_.end());
    rebuild();
    if (on_history_cleared_) on_history_cleared_();
}

bool ClipboardHistory::set_pinned(int index, bool pinned) {
    if (index < 0 || index >= item_count()) return false;
    if (items_[static_cast<size_t>(index)].pinned == pinned) return true;
    items_[static_cast<size_t>(index)].pinned = pinned;
    enforce_limit();
    rebuild();
    return true;
}

bool ClipboardHistory::toggle_pin(int index) {
    if (index < 0 || index >= item_count()) return false;
    return set_pinned(index, !items_[static_cast<size_t>(index)].pinned);
}

void ClipboardHistory::set_max_items(int max_items) {
    max_items_ = std::max(1, max_items);
    enforce_limit();
    rebuild();
}

void ClipboardHistory::enforce_limit() {
    int excess = item_count() - max_items_;
    for (int i = item_count() - 1; i >= 0 && excess > 0; --i) {
        if (items_[static_cast<size_t>(i)].pinned) continue;
        items_.erase(items_.begin() + i);
        --excess;
    }
}

bool ClipboardHistory::put_on_clipboard(const std::string& text) {
    if (SDL_SetClipboardText(text.c_str()) != 0) {
        SDL_Log("Unable to set clipboard text: %s", SDL_GetError());
        return false;
    }
    // Our own copy must not come back as a new entry.
    last_seen_ = text;
    return true;
}

bool ClipboardHistory::copy_item(int index) {
    if (index < 0 || index >= item_count()) return false;
    const std::string content = items_[static_cast<size_t>(index)].content;
    if (!put_on_clipboard(content)) return false;
    if (on_item_copied_) on_item_copied_(content);
    return true;
}

bool ClipboardHistory::copy_as_plain_text(int index) {
    if (index < 0 || index >= item_count()) return false;
    const std::string text = plain_text(items_[static_cast<size_t>(index)].content);
    if (!put_on_clipboard(text)) return false;
    if (on_item_copied_) on_item_copied_(text);
    return true;
}

void ClipboardHistory::set_filter(const std::string& query) {
    filter_ = query;
    if (search_->text() != query) search_->set_text(query);
    rebuild();
    scroll_->scroll_to_top();
}

ClipboardRow* ClipboardHistory::row(int visible_index) const {
    if (visible_index < 0 || visible_index >= static_cast<int>(rows_.size())) return nullptr;
    return rows_[static_cast<size_t>(visible_index)];
}

void ClipboardHistory::set_monitoring(bool on) {
    monitoring_ = on;
    monitor_button_->set_checked(on);
    monitor_button_->set_text(on ? "Monitoring: ON" : "Monitoring: OFF");
    if (on) poll_timer_.start(kPollMs);
    else poll_timer_.stop();
}

bool ClipboardHistory::check_clipboard() {
    if (!monitoring_ || SDL_HasClipboardText() != SDL_TRUE) return false;
    char* raw = SDL_GetClipboardText();
    if (!raw) return false;
    const std::string text = wk_text::trim(raw);
    SDL_free(raw);
    if (text.empty() || text == last_seen_) return false;
    last_seen_ = text;
    return add_item(text, "text");
}

void ClipboardHistory::show_context_menu(int index, int x, int y) {
    if (index < 0 || index >= item_count()) return;
    const bool pinned = items_[static_cast<size_t>(index)].pinned;
    menu_ = std::make_unique<ContextMenuPopup>();
    menu_->add_action("Copy to Clipboard", [this, index]() { copy_item(index); }, "copy");
    menu_->add_action(pinned ? "Unpin" : "Pin", [this, index]() { toggle_pin(index); }, "pin");
    menu_->add_action("Delete", [this, index]() { remove_item(index); }, "trash");
    menu_->add_separator();
    menu_->add_action("Copy as Plain Text", [this, index]() { copy_as_plain_text(index); });
    menu_->show_at_position(x, y);
}

const std::string& ClipboardHistory::status_text() const { return status_label_->text(); }

void ClipboardHistory::rebuild() {
    list_->clear();
    rows_.clear();
    visible_rows_.clear();
    const std::string q = wk_text::to_lower(wk_text::trim(filter_));
    for (size_t i = 0; i < items_.size(); ++i) {
        const ClipboardEntry& entry = items_[i];
        if (!q.empty() && wk_text::to_lower(entry.content).find(q) == std::string::npos) continue;
        const int index = static_cast<int>(i);
        auto* row = list_->add_widget(std::make_unique<ClipboardRow>(entry));
        row->set_on_clicked([this, index]() {
            if (index >= item_count()) return;
            const std::string content = items_[static_cast<size_t>(index)].content;
            if (!copy_item(index)) return;
            if (on_item_selected_) on_item_selected_(content);
        });
        row->set_on_context_menu([this, index](int x, int y) { show_context_menu(index, x, y); });
        rows_.push_back(row);
        visible_rows_.push_back(index);
    }
    const size_t n = items_.size();
    status_label_->set_text(std::to_string(n) + (n == 1 ? " item" : " items"));
    layout();
}

int ClipboardHistory::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::max(kPanelWidth, layout_->preferred_width());
}

int ClipboardHistory::height_for_width(int) const {
    if (fixed_h_ >= 0) return fixed_h_;
    return kPanelHeight;
}

void ClipboardHistory::layout() { layout_->set_rect(rect_); }

bool ClipboardHistory::handle_event(const SDL_Event& e) {
    if (!visible_ || !enabled_) return false;
    track_hover(e);
    return layout_->handle_event(e);
}

void ClipboardHistory::update() {
    poll_timer_.poll();
    layout_->update();
    if (menu_ && !menu_->is_visible() && !OverlayManager::instance().is_open(menu_.get())) menu_.reset();
}

void ClipboardHistory::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const auto& tm = ThemeManager::instance();
    const float alpha = effective_opacity();
    wk_draw::fill_rect(r, rect_, tm.color("surface"), alpha);
    wk_draw::draw_rect(r, rect_, tm.color("border"), alpha);
    layout_->render(r);
    if (items_.empty()) {
        wk_text::draw_in_rect(r, Styles::Label("caption", "text_secondary"), "Nothing copied yet", scroll_->rect(),
                              wk_text::Align::Center, alpha);
    }
}
