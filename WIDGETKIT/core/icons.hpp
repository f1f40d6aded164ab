#pragma once

#include <SDL.h>
#include <string>
#include <vector>

// Named vector icons drawn with the primitives in draw_utils. Names that are
// not known are drawn as text, so a single character or emoji also works as
// an icon.
namespace wk_icons {

bool has(const std::string& name);
std::vector<std::string> names();
void draw(SDL_Renderer* r, const std::string& name, const SDL_Rect& area, SDL_Color c, float alpha = 1.0f);

}
