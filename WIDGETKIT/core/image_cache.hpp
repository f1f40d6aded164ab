#pragma once

#include <SDL.h>
#include <map>
#include <set>
#include <string>
#include <utility>

// Textures loaded with SDL_image, cached per renderer and path.
class ImageCache {
public:
    static ImageCache& instance();

    // nullptr when the file cannot be loaded; failures are logged once.
    SDL_Texture* texture(SDL_Renderer* r, const std::string& path);
    // Same image with everything outside the inscribed circle transparent.
    SDL_Texture* circular_texture(SDL_Renderer* r, const std::string& path);
    bool is_loadable(const std::string& path) const;
    void clear();

private:
    ImageCache() = default;
    ~ImageCache();
    SDL_Surface* load_surface(const std::string& path);

    using Key = std::pair<SDL_Renderer*, std::string>;
    std::map<Key, SDL_Texture*> textures_;
    std::map<Key, SDL_Texture*> circles_;
    std::set<std::string> failed_;
};
