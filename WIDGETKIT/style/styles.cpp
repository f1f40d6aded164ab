#include "styles.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include "theme_manager.hpp"

namespace {
const SDL_Color kDestructiveHover = wk::rgba(0xc8, 0x23, 0x33);
const SDL_Color kDestructivePress = wk::rgba(0xbd, 0x21, 0x30);
const SDL_Color kWhite            = wk::rgba(255, 255, 255);
const SDL_Color kShadow           = wk::rgba(0, 0, 0, 40);

int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  return -1;
}

Uint8 clamp_channel(float v) {
  return static_cast<Uint8>(std::max(0.0f, std::min(255.0f, v)));
}

int font_point_size(ButtonSize size) {
  switch (size) {
  case ButtonSize::Small: return 8;
  case ButtonSize::Large: return 11;
  case ButtonSize::Medium:
  default: return 9;
  }
}
} // namespace

namespace wk {

SDL_Color parse_hex(const std::string &hex, SDL_Color fallback) {
  std::string s = hex;
  if (!s.empty() && s[0] == '#') s.erase(0, 1);
  if (s.size() != 6 && s.size() != 8) return fallback;
  int values[4] = {0, 0, 0, 255};
  for (size_t i = 0; i < s.size(); i += 2) {
    int hi = hex_digit(s[i]);
    int lo = hex_digit(s[i + 1]);
    if (hi < 0 || lo < 0) return fallback;
    values[i / 2] = hi * 16 + lo;
  }
  return rgba(static_cast<Uint8>(values[0]), static_cast<Uint8>(values[1]),
              static_cast<Uint8>(values[2]), static_cast<Uint8>(values[3]));
}

std::string to_hex(SDL_Color c) {
  char buf[10];
  if (c.a == 255) {
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", c.r, c.g, c.b);
  } else {
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X", c.r, c.g, c.b, c.a);
  }
  return buf;
}

SDL_Color with_alpha(SDL_Color c, Uint8 a) {
  c.a = a;
  return c;
}

SDL_Color mix(SDL_Color a, SDL_Color b, float t) {
  t = std::max(0.0f, std::min(1.0f, t));
  return rgba(clamp_channel(a.r + (b.r - a.r) * t),
              clamp_channel(a.g + (b.g - a.g) * t),
              clamp_channel(a.b + (b.b - a.b) * t),
              clamp_channel(a.a + (b.a - a.a) * t));
}

SDL_Color lighten(SDL_Color c, float amount) {
  return mix(c, rgba(255, 255, 255, c.a), amount);
}

SDL_Color darken(SDL_Color c, float amount) {
  return mix(c, rgba(0, 0, 0, c.a), amount);
}

bool same_color(SDL_Color a, SDL_Color b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

} // namespace wk

LabelStyle Styles::Label(const std::string &font_role,
                         const std::string &color_role) {
  const ThemeManager &tm = ThemeManager::instance();
  LabelStyle s = tm.font(font_role);
  s.color = tm.color(color_role);
  return s;
}

ButtonStyle Styles::Button(ButtonVariant variant, ButtonSize size) {
  const ThemeManager &tm = ThemeManager::instance();
  LabelStyle label = tm.font("default");
  label.font_size = std::max(1, font_point_size(size) * 4 / 3);
  label.bold = true;
  const int radius = tm.border_radius("sm");
  const SDL_Color primary = tm.color("primary");
  const SDL_Color text = tm.color("text");
  switch (variant) {
  case ButtonVariant::Primary: {
    const SDL_Color dark = tm.color("dark");
    label.color = kWhite;
    return ButtonStyle{label, primary, dark, dark, primary, kWhite, radius};
  }
  case ButtonVariant::Secondary:
    label.color = primary;
    return ButtonStyle{label, wk::with_alpha(primary, 0),
                       wk::with_alpha(primary, 40), wk::with_alpha(primary, 80),
                       primary, primary, radius};
  case ButtonVariant::Destructive: {
    const SDL_Color bg = tm.color("danger");
    label.color = kWhite;
    return ButtonStyle{label, bg, kDestructiveHover, kDestructivePress, bg,
                       kWhite, radius};
  }
  case ButtonVariant::Ghost:
    label.color = text;
    return ButtonStyle{label, wk::with_alpha(text, 0), tm.color("hover"),
                       tm.color("light"), wk::with_alpha(text, 0), text, radius};
  case ButtonVariant::Default:
  default:
    label.color = text;
    return ButtonStyle{label, tm.color("surface"), tm.color("hover"),
                       tm.color("light"), tm.color("border"), text, radius};
  }
}

ButtonStyle Styles::DisabledButton(ButtonSize size) {
  const ThemeManager &tm = ThemeManager::instance();
  LabelStyle label = tm.font("default");
  label.font_size = std::max(1, font_point_size(size) * 4 / 3);
  label.color = tm.color("text_secondary");
  const SDL_Color bg = tm.color("light");
  return ButtonStyle{label, bg, bg, bg, tm.color("border"), label.color,
                     tm.border_radius("sm")};
}

TextBoxStyle Styles::TextBox() {
  const ThemeManager &tm = ThemeManager::instance();
  LabelStyle label = tm.font("default");
  label.color = tm.color("text_secondary");
  return TextBoxStyle{label,
                      tm.color("background"),
                      tm.color("border"),
                      tm.color("primary"),
                      tm.color("text"),
                      tm.color("text_secondary")};
}

CheckboxStyle Styles::Checkbox() {
  const ThemeManager &tm = ThemeManager::instance();
  return CheckboxStyle{Label("default", "text"), tm.color("background"),
                       tm.color("primary"), tm.color("border")};
}

SliderStyle Styles::Slider() {
  const ThemeManager &tm = ThemeManager::instance();
  const SDL_Color primary = tm.color("primary");
  return SliderStyle{Label("default", "text_secondary"),
                     Label("default", "text"),
                     tm.color("border"),
                     primary,
                     tm.color("background"),
                     wk::lighten(primary, 0.8f),
                     primary,
                     wk::lighten(primary, 0.2f)};
}

CardStyle Styles::Card() {
  const ThemeManager &tm = ThemeManager::instance();
  return CardStyle{tm.color("background"), tm.color("surface"),
                   tm.color("border"),     tm.color("primary"),
                   kShadow,                tm.border_radius("md")};
}

StatusStyle Styles::Status(const std::string &kind) {
  const ThemeManager &tm = ThemeManager::instance();
  std::string key = kind;
  if (key == "error") key = "danger";
  if (key != "info" && key != "success" && key != "warning" && key != "danger") {
    const SDL_Color fg = tm.color("text_secondary");
    return StatusStyle{wk::with_alpha(fg, 32), fg, wk::with_alpha(fg, 96)};
  }
  const SDL_Color c = tm.color(key);
  return StatusStyle{wk::with_alpha(c, 38), tm.is_dark() ? wk::lighten(c, 0.3f) : wk::darken(c, 0.25f),
                     wk::with_alpha(c, 110)};
}

SDL_Color Styles::PanelBG() { return ThemeManager::instance().color("surface"); }

SDL_Color Styles::Border() { return ThemeManager::instance().color("border"); }

int Spacing::panel_padding() { return ThemeManager::instance().spacing("md"); }
int Spacing::section_gap()   { return ThemeManager::instance().spacing("lg"); }
int Spacing::item_gap()      { return ThemeManager::instance().spacing("sm"); }
int Spacing::label_gap()     { return ThemeManager::instance().spacing("xs"); }
int Spacing::small_gap()     { return ThemeManager::instance().spacing("xs"); }
int Spacing::header_gap()    { return ThemeManager::instance().spacing("sm"); }
