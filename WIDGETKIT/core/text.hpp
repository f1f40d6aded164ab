#pragma once

#include <SDL.h>
#include <SDL_ttf.h>
#include <string>
#include <vector>

#include "style/styles.hpp"

namespace wk_text {

enum class Align { Left, Center, Right };

// Cached font for the style; nullptr when TTF is not initialised or the file
// cannot be opened.
TTF_Font* font(const LabelStyle& style);
void clear_cache();

SDL_Point measure(const LabelStyle& style, const std::string& s);
int width(const LabelStyle& style, const std::string& s);
int line_height(const LabelStyle& style);

std::vector<std::string> wrap_lines(const LabelStyle& style, const std::string& s, int max_width);
int wrapped_height(const LabelStyle& style, const std::string& s, int max_width, int line_gap = 0);
// Cuts the string so it fits max_width, ending with "...".
std::string elide(const LabelStyle& style, const std::string& s, int max_width);

// Returns the drawn size.
SDL_Point draw(SDL_Renderer* r, const LabelStyle& style, const std::string& s, int x, int y,
               float alpha = 1.0f);
void draw_in_rect(SDL_Renderer* r, const LabelStyle& style, const std::string& s, const SDL_Rect& rect,
                  Align align = Align::Left, float alpha = 1.0f);
// Returns the total height used.
int draw_wrapped(SDL_Renderer* r, const LabelStyle& style, const std::string& s, int x, int y,
                 int max_width, int line_gap = 0, float alpha = 1.0f);

size_t utf8_length(const std::string& s);
// Byte offset of the code point before / after `pos`.
size_t utf8_prev(const std::string& s, size_t pos);
size_t utf8_next(const std::string& s, size_t pos);
// First `count` code points.
std::string utf8_prefix(const std::string& s, size_t count);

std::string to_lower(const std::string& s);
std::string trim(const std::string& s);

}
