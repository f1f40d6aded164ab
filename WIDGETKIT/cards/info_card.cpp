#include "info_card.hpp"

#include <memory>

#include "base/controls.hpp"

namespace {
constexpr int kIconSize = 24;
}

InfoCard::InfoCard(const std::string& title, const std::string& content, const std::string& icon) {
    auto glyph = std::make_unique<IconGlyph>(icon, kIconSize, "primary");
    icon_ = glyph.get();
    set_title(title);
    header_->insert(0, std::move(glyph));
    icon_->set_visible(!icon.empty());

    auto subtitle = std::make_unique<Label>(std::string(), "default", "text_secondary");
    subtitle_ = body_->add_widget(std::move(subtitle));
    subtitle_->hide();

    auto text = std::make_unique<Label>(content);
    text->set_word_wrap(true);
    content_ = body_->add_widget(std::move(text));
}

void InfoCard::set_subtitle(const std::string& s) {
    subtitle_->set_text(s);
    subtitle_->set_visible(!s.empty());
}

const std::string& InfoCard::subtitle() const {
    return subtitle_->text();
}

void InfoCard::set_content(const std::string& c) {
    content_->set_text(c);
}

const std::string& InfoCard::content() const {
    return content_->text();
}

void InfoCard::set_icon(const std::string& icon) {
    icon_->set_icon(icon);
    icon_->set_visible(!icon.empty());
}

const std::string& InfoCard::icon() const {
    return icon_->icon();
}

StatusCard::StatusCard(const std::string& title, const std::string& status, const std::string& description)
    : InfoCard(title, description), status_(status) {
    dot_ = static_cast<StatusDot*>(add_header_action(std::make_unique<StatusDot>(color_role_for(status))));
}

std::string StatusCard::color_role_for(const std::string& status) {
    if (status == "active" || status == "success") return "success";
    if (status == "warning") return "warning";
    if (status == "error" || status == "danger") return "danger";
    if (status == "pending" || status == "info") return "info";
    return "text_secondary";
}

void StatusCard::set_status(const std::string& status) {
    status_ = status;
    dot_->set_color_role(color_role_for(status));
}
