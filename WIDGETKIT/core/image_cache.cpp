#include "image_cache.hpp"

#include <SDL_image.h>
#include <filesystem>
#include <system_error>

#include "draw_utils.hpp"

namespace fs = std::filesystem;

ImageCache& ImageCache::instance() {
    static ImageCache cache;
    return cache;
}

ImageCache::~ImageCache() {
    // Textures die with their renderer; only forget the handles here.
    textures_.clear();
    circles_.clear();
}

bool ImageCache::is_loadable(const std::string& path) const {
    if (path.empty() || failed_.count(path)) return false;
    std::error_code ec;
    return fs::is_regular_file(fs::path(path), ec);
}

SDL_Surface* ImageCache::load_surface(const std::string& path) {
    if (path.empty() || failed_.count(path)) return nullptr;
    SDL_Surface* surf = IMG_Load(path.c_str());
    if (!surf) {
        SDL_Log("Failed to load image %s: %s", path.c_str(), IMG_GetError());
        failed_.insert(path);
    }
    return surf;
}

SDL_Texture* ImageCache::texture(SDL_Renderer* r, const std::string& path) {
    if (!r) return nullptr;
    Key key{ r, path };
    auto it = textures_.find(key);
    if (it != textures_.end()) return it->second;
    SDL_Surface* surf = load_surface(path);
    if (!surf) return nullptr;
    SDL_Texture* tex = SDL_CreateTextureFromSurface(r, surf);
    SDL_FreeSurface(surf);
    if (!tex) {
        SDL_Log("Failed to create texture for %s: %s", path.c_str(), SDL_GetError());
        failed_.insert(path);
        return nullptr;
    }
    textures_[key] = tex;
    return tex;
}

SDL_Texture* ImageCache::circular_texture(SDL_Renderer* r, const std::string& path) {
    if (!r) return nullptr;
    Key key{ r, path };
    auto it = circles_.find(key);
    if (it != circles_.end()) return it->second;
    SDL_Surface* surf = load_surface(path);
    if (!surf) return nullptr;
    SDL_Surface* rgba = SDL_ConvertSurfaceFormat(surf, SDL_PIXELFORMAT_RGBA32, 0);
    SDL_FreeSurface(surf);
    if (!rgba) {
        SDL_Log("Failed to convert %s: %s", path.c_str(), SDL_GetError());
        failed_.insert(path);
        return nullptr;
    }
    wk_draw::mask_circle(rgba);
    SDL_Texture* tex = SDL_CreateTextureFromSurface(r, rgba);
    SDL_FreeSurface(rgba);
    if (!tex) {
        SDL_Log("Failed to create texture for %s: %s", path.c_str(), SDL_GetError());
        failed_.insert(path);
        return nullptr;
    }
    SDL_SetTextureBlendMode(tex, SDL_BLENDMODE_BLEND);
    circles_[key] = tex;
    return tex;
}

void ImageCache::clear() {
    for (auto& kv : textures_) SDL_DestroyTexture(kv.second);
    for (auto& kv : circles_) SDL_DestroyTexture(kv.second);
    textures_.clear();
    circles_.clear();
    failed_.clear();
}
