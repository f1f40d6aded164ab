#include "tooltip.hpp"

#include <algorithm>

#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "core/draw_utils.hpp"
#include "core/icons.hpp"
#include "style/theme_manager.hpp"

namespace {
constexpr int kIconSize = 16;
constexpr int kCloseSize = 18;

const SDL_Color kWhite{ 255, 255, 255, 255 };
const SDL_Color kMuted{ 255, 255, 255, 180 };
}

Tooltip::Tooltip(const std::string& text, const std::string& icon, Uint32 delay) : BasePopup(false), delay_(delay) {
    set_overlay_mode(OverlayManager::Mode::Passive);
    content_->set_margins(10, 6, 10, 6);
    content_->set_spacing(6);

    auto header = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 6);
    header->set_alignment(BoxLayout::Align::Center);
    auto glyph = std::make_unique<IconGlyph>(icon, kIconSize);
    glyph->set_color(kWhite);
    icon_ = header->add_widget(std::move(glyph));
    icon_->set_visible(!icon.empty());
    auto label = std::make_unique<Label>(text);
    label->set_word_wrap(true);
    label->set_color(kWhite);
    text_ = header->add_widget(std::move(label), 1);
    text_->set_visible(!text.empty());
    header_ = content_->add_widget(std::move(header));
    header_->set_visible(!text.empty() || !icon.empty());

    auto actions = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 6);
    actions->add_stretch();
    actions_ = content_->add_widget(std::move(actions));
    actions_->hide();
}

void Tooltip::set_text(const std::string& t) {
    text_->set_text(t);
    text_->set_visible(!t.empty());
    header_->set_visible(!t.empty() || !icon_->icon().empty());
}

const std::string& Tooltip::text() const {
    return text_->text();
}

void Tooltip::set_icon(const std::string& icon) {
    icon_->set_icon(icon);
    icon_->set_visible(!icon.empty());
    header_->set_visible(!icon.empty() || !text_->text().empty());
}

const std::string& Tooltip::icon() const {
    return icon_->icon();
}

BaseButton* Tooltip::add_action(const std::string& text, const std::string& name) {
    const std::string key = name.empty() ? text : name;
    auto button = std::make_unique<BaseButton>(text, ButtonVariant::Ghost, ButtonSize::Small);
    button->set_on_clicked([this, key]() {
        if (on_action_clicked_) on_action_clicked_(key);
    });
    BaseButton* raw = actions_->add_widget(std::move(button));
    actions_->show();
    return raw;
}

int Tooltip::preferred_width() const {
    if (fixed_w_ >= 0) return fixed_w_;
    return std::min(kMaxWidth, content_->preferred_width());
}

void Tooltip::show_for(const SDL_Rect& target, TooltipSide side) {
    const int w = preferred_width();
    const int h = height_for_width(w);
    const SDL_Rect screen = OverlayManager::instance().screen_rect();

    if (side == TooltipSide::Top && target.y - h - kGap < screen.y) side = TooltipSide::Bottom;
    else if (side == TooltipSide::Bottom && target.y + target.h + kGap + h > screen.y + screen.h) side = TooltipSide::Top;
    else if (side == TooltipSide::Left && target.x - w - kGap < screen.x) side = TooltipSide::Right;
    else if (side == TooltipSide::Right && target.x + target.w + kGap + w > screen.x + screen.w) side = TooltipSide::Left;

    const int cx = target.x + (target.w - w) / 2;
    const int cy = target.y + (target.h - h) / 2;
    SDL_Rect r{ cx, target.y - h - kGap, w, h };
    switch (side) {
    case TooltipSide::Bottom: r.y = target.y + target.h + kGap; break;
    case TooltipSide::Left: r = SDL_Rect{ target.x - w - kGap, cy, w, h }; break;
    case TooltipSide::Right: r = SDL_Rect{ target.x + target.w + kGap, cy, w, h }; break;
    case TooltipSide::Top:
    default: break;
    }
    open_at(r);
}

SDL_Color Tooltip::background() const {
    return ThemeManager::instance().color(background_role_);
}

void Tooltip::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const float alpha = effective_opacity();
    const int radius = ThemeManager::instance().border_radius("sm");
    wk_draw::draw_shadow(r, rect_, radius, 3, wk::rgba(0, 0, 0, 50), alpha);
    wk_draw::fill_rounded_rect(r, rect_, radius, background(), alpha);
    wk_draw::ClipScope clip(r, rect_);
    content_->render(r);
}

RichTooltip::RichTooltip(const std::string& title, const std::string& body) : Tooltip() {
    content_->set_margins(12, 10, 12, 10);
    if (!title.empty()) add_title(title);
    if (!body.empty()) add_description(body);
}

Label* RichTooltip::add_title(const std::string& title) {
    auto label = std::make_unique<Label>(title);
    label->set_bold(true);
    label->set_color(kWhite);
    Label* raw = label.get();
    content_->insert(static_cast<size_t>(content_->index_of(actions_)), std::move(label));
    return raw;
}

Label* RichTooltip::add_description(const std::string& description) {
    auto label = std::make_unique<Label>(description);
    label->set_word_wrap(true);
    label->set_color(kWhite);
    Label* raw = label.get();
    content_->insert(static_cast<size_t>(content_->index_of(actions_)), std::move(label));
    return raw;
}

Label* RichTooltip::add_shortcut(const std::string& shortcut) {
    auto label = std::make_unique<Label>("Shortcut: " + shortcut);
    label->set_font_size(11);
    label->set_color(kMuted);
    Label* raw = label.get();
    content_->insert(static_cast<size_t>(content_->index_of(actions_)), std::move(label));
    return raw;
}

void RichTooltip::add_separator() {
    content_->insert(static_cast<size_t>(content_->index_of(actions_)), std::make_unique<Separator>());
}

HelpTooltip::HelpTooltip(const std::string& title, const std::string& description, const std::string& shortcut)
    : RichTooltip(title, description) {
    set_icon("help");
    icon_->set_color_role("info");
    if (!shortcut.empty()) add_shortcut(shortcut);
}

StatusTooltip::StatusTooltip(const std::string& status, const std::string& details)
    : Tooltip(details, icon_for(status), kDelay) {
    set_status(status);
}

void StatusTooltip::set_status(const std::string& status) {
    status_ = status;
    background_role_ = color_role_for(status);
    set_icon(icon_for(status));
}

std::string StatusTooltip::icon_for(const std::string& status) {
    if (status == "success" || status == "error" || status == "warning" || status == "info") return status;
    if (status == "loading") return "refresh";
    return {};
}

std::string StatusTooltip::color_role_for(const std::string& status) {
    if (status == "success" || status == "warning" || status == "info") return status;
    if (status == "error") return "danger";
    if (status == "loading") return "primary";
    return "dark";
}

InteractiveTooltip::InteractiveTooltip(const std::string& text) : Tooltip(text) {
    auto close = std::make_unique<IconButton>("close", kCloseSize);
    close->set_on_clicked([this]() { close_animated(); });
    header_->add(std::move(close));
    header_->show();
    hide_timer_.set_on_timeout([this]() { close_animated(); });
}

void InteractiveTooltip::target_left() {
    if (!hovered_) hide_timer_.start(kHideDelay);
}

void InteractiveTooltip::on_hover_changed(bool hovered) {
    if (hovered) {
        hide_timer_.stop();
    } else if (visible_) {
        hide_timer_.start(kHideDelay);
    }
}

void InteractiveTooltip::update() {
    if (!visible_) {
        hide_timer_.stop();
        return;
    }
    Tooltip::update();
    hide_timer_.poll();
}

TooltipManager::TooltipManager() {
    show_timer_.set_on_timeout([this]() {
        if (Entry* e = find(hover_)) show_for(*e);
    });
}

TooltipManager::Entry* TooltipManager::find(const Widget* w) {
    if (!w) return nullptr;
    for (Entry& e : entries_) {
        if (e.widget == w) return &e;
    }
    return nullptr;
}

bool TooltipManager::is_registered(const Widget* w) const {
    return std::any_of(entries_.begin(), entries_.end(), [w](const Entry& e) { return e.widget == w; });
}

void TooltipManager::register_widget(Widget* w, const std::string& text, const std::string& icon) {
    if (!w) return;
    Entry* e = find(w);
    if (!e) {
        entries_.emplace_back();
        e = &entries_.back();
        e->widget = w;
    }
    e->text = text;
    e->icon = icon;
}

void TooltipManager::register_widget(Widget* w, std::unique_ptr<Tooltip> tooltip) {
    if (!w || !tooltip) return;
    unregister_widget(w);
    Entry e;
    e.widget = w;
    e.text = tooltip->text();
    e.custom = std::move(tooltip);
    entries_.push_back(std::move(e));
}

void TooltipManager::unregister_widget(Widget* w) {
    Entry* e = find(w);
    if (!e) return;
    if (hover_ == w) {
        hide();
        hover_ = nullptr;
    }
    if (e->custom && current_ == e->custom.get()) {
        current_->close();
        current_ = nullptr;
    }
    entries_.erase(entries_.begin() + (e - entries_.data()));
}

TooltipManager::Entry* TooltipManager::entry_at(SDL_Point p) {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->widget->is_visible() && it->widget->contains(p.x, p.y)) return &*it;
    }
    return nullptr;
}

void TooltipManager::handle_event(const SDL_Event& e) {
    if (e.type == SDL_MOUSEMOTION) {
        Entry* entry = entry_at(SDL_Point{ e.motion.x, e.motion.y });
        Widget* w = entry ? entry->widget : nullptr;
        if (w == hover_) return;
        show_timer_.stop();
        if (current_ && current_->is_visible()) current_->target_left();
        hover_ = w;
        if (entry) show_timer_.start(entry->custom ? entry->custom->delay() : delay_);
        return;
    }
    if (e.type == SDL_MOUSEBUTTONDOWN) {
        const bool on_tooltip = current_ && current_->is_visible() && current_->contains(e.button.x, e.button.y);
        if (!on_tooltip) hide();
    }
}

void TooltipManager::show_for(Entry& e) {
    Tooltip* t = e.custom ? e.custom.get() : &shared_;
    if (!e.custom) {
        shared_.set_text(e.text);
        shared_.set_icon(e.icon);
    }
    if (current_ && current_ != t) current_->close();
    current_ = t;
    t->show_for(e.widget->rect(), side_);
}

void TooltipManager::hide() {
    show_timer_.stop();
    if (current_) current_->close();
    current_ = nullptr;
}

void TooltipManager::update() {
    show_timer_.poll();
    if (current_ && !current_->is_visible()) current_ = nullptr;
}

HelpIcon::HelpIcon(const std::string& title, const std::string& description, int size)
    : size_(size), help_tooltip_(std::make_unique<HelpTooltip>(title, description)) {
    show_timer_.set_on_timeout([this]() {
        if (visible_) help_tooltip_->show_for(rect_, TooltipSide::Bottom);
    });
}

void HelpIcon::on_hover_changed(bool hovered) {
    if (hovered) {
        show_timer_.start(help_tooltip_->delay());
    } else {
        show_timer_.stop();
        help_tooltip_->target_left();
    }
}

bool HelpIcon::handle_event(const SDL_Event& e) {
    if (!visible_) return false;
    track_hover(e);
    return false;
}

void HelpIcon::update() {
    show_timer_.poll();
}

void HelpIcon::render(SDL_Renderer* r) const {
    if (!visible_) return;
    const ThemeManager& tm = ThemeManager::instance();
    const SDL_Color c = hovered_ ? tm.color("primary") : tm.color("text_secondary");
    wk_icons::draw(r, "help", rect_, c, effective_opacity());
}
