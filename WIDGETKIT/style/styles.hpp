#pragma once

#include <SDL.h>
#include <SDL_ttf.h>
#include <string>

namespace wk {
inline SDL_Color rgba(Uint8 r, Uint8 g, Uint8 b, Uint8 a = 255) {
  return SDL_Color{r, g, b, a};
}
#if defined(WIDGETKIT_FONT_PATH)
constexpr const char *FONT_PATH = WIDGETKIT_FONT_PATH;
#elif defined(_WIN32)
constexpr const char *FONT_PATH = "C:/Windows/Fonts/segoeui.ttf";
#else
constexpr const char *FONT_PATH =
    "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf";
#endif
#ifdef _WIN32
constexpr const char *MONO_FONT_PATH = "C:/Windows/Fonts/consola.ttf";
#else
constexpr const char *MONO_FONT_PATH =
    "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf";
#endif

// "#RRGGBB" or "#RRGGBBAA"; anything else yields the fallback.
SDL_Color parse_hex(const std::string &hex, SDL_Color fallback = rgba(0, 0, 0));
std::string to_hex(SDL_Color c);
SDL_Color with_alpha(SDL_Color c, Uint8 a);
SDL_Color mix(SDL_Color a, SDL_Color b, float t);
SDL_Color lighten(SDL_Color c, float amount);
SDL_Color darken(SDL_Color c, float amount);
bool same_color(SDL_Color a, SDL_Color b);
} // namespace wk

struct LabelStyle {
  std::string font_path;
  int font_size;
  SDL_Color color;
  bool bold = false;
  TTF_Font *open_font() const {
    return TTF_OpenFont(font_path.c_str(), font_size);
  }
};

enum class ButtonVariant { Default, Primary, Secondary, Destructive, Ghost };
enum class ButtonSize { Small, Medium, Large };

struct ButtonStyle {
  LabelStyle label;
  SDL_Color bg;
  SDL_Color hover_bg;
  SDL_Color press_bg;
  SDL_Color border;
  SDL_Color text;
  int radius;
};

struct TextBoxStyle {
  LabelStyle label;
  SDL_Color bg;
  SDL_Color border;
  SDL_Color border_focus;
  SDL_Color text;
  SDL_Color placeholder;
};

struct CheckboxStyle {
  LabelStyle label;
  SDL_Color box_bg;
  SDL_Color check;
  SDL_Color border;
};

struct SliderStyle {
  LabelStyle label;
  LabelStyle value;
  SDL_Color track_bg;
  SDL_Color track_fill;
  SDL_Color knob;
  SDL_Color knob_hover;
  SDL_Color knob_border;
  SDL_Color knob_border_hover;
};

struct CardStyle {
  SDL_Color bg;
  SDL_Color hover_bg;
  SDL_Color border;
  SDL_Color selected_border;
  SDL_Color shadow;
  int radius;
};

struct StatusStyle {
  SDL_Color bg;
  SDL_Color fg;
  SDL_Color border;
};

// Styles resolved against the active theme. Returned by value because the
// theme can change between frames.
class Styles {
public:
  static LabelStyle Label(const std::string &font_role = "default",
                          const std::string &color_role = "text");
  static ButtonStyle Button(ButtonVariant variant,
                            ButtonSize size = ButtonSize::Medium);
  static ButtonStyle DisabledButton(ButtonSize size = ButtonSize::Medium);
  static TextBoxStyle TextBox();
  static CheckboxStyle Checkbox();
  static SliderStyle Slider();
  static CardStyle Card();
  // info, success, warning, error/danger, neutral
  static StatusStyle Status(const std::string &kind);
  static SDL_Color PanelBG();
  static SDL_Color Border();
};

// Spacing tokens backed by the theme's spacing scale.
struct Spacing {
  // Outer padding inside panels, cards and popups
  static int panel_padding();    // md, default 16
  // Gap between stacked sections
  static int section_gap();      // lg, default 24
  // Gap between controls
  static int item_gap();         // sm, default 8
  // Space between a label and its control
  static int label_gap();        // xs, default 4
  // Dense grids (chips, small labels)
  static int small_gap();        // xs, default 4
  // Space below a section header
  static int header_gap();       // sm, default 8
};
