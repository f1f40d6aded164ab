#pragma once

#include <SDL.h>
#include <memory>
#include <string>

class QuickCommandPalette;
class SnackbarManager;
class TabContainer;
class ToastManager;

struct GalleryOptions {
    std::string theme_file;
    bool dark = false;
    int width = 1280;
    int height = 800;
};

class GalleryApp {

	public:
    GalleryApp(const GalleryOptions& options, SDL_Renderer* renderer, int screen_w, int screen_h);
    virtual ~GalleryApp();
    virtual void init();
    virtual void loop();
    virtual void setup();
	protected:
    void apply_theme_options();
    void toggle_theme();
    bool handle_shortcut(const SDL_Event& e);
    void resize(int w, int h);
    void render();

    GalleryOptions options_;
    SDL_Renderer* renderer_   = nullptr;
    int           screen_w_   = 0;
    int           screen_h_   = 0;
    std::unique_ptr<TabContainer>        root_;
    std::unique_ptr<QuickCommandPalette> palette_;
    std::unique_ptr<ToastManager>        toasts_;
    std::unique_ptr<SnackbarManager>     snackbars_;
    bool quit_ = false;
};

// Parses --theme <file>, --dark and --size WxH. Unknown arguments are logged
// and ignored.
GalleryOptions parse_gallery_options(int argc, char* argv[]);

void run(SDL_Window* window, SDL_Renderer* renderer, int screen_w, int screen_h, const GalleryOptions& options);
