#pragma once

#include <string>

#include "base/base_card.hpp"

class IconGlyph;
class Label;
class StatusDot;

// Card with an icon and a title in the header, and an optional subtitle above
// wrapped content text in the body.
class InfoCard : public BaseCard {
public:
    explicit InfoCard(const std::string& title = {}, const std::string& content = {},
                      const std::string& icon = {});

    void set_subtitle(const std::string& s);
    const std::string& subtitle() const;
    void set_content(const std::string& c);
    const std::string& content() const;
    void set_icon(const std::string& icon);
    const std::string& icon() const;

protected:
    Label* content_label() const { return content_; }

private:
    IconGlyph* icon_ = nullptr;
    Label* subtitle_ = nullptr;
    Label* content_ = nullptr;
};

// Info card with a coloured status dot at the end of the header.
// Known statuses: active, inactive, warning, error, pending, and the theme's
// info/success/danger names.
class StatusCard : public InfoCard {
public:
    StatusCard(const std::string& title, const std::string& status, const std::string& description = {});

    void set_status(const std::string& status);
    const std::string& status() const { return status_; }
    static std::string color_role_for(const std::string& status);

private:
    std::string status_;
    StatusDot* dot_ = nullptr;
};
