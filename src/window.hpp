#pragma once

#include "pixel_view.hpp"

#include <memory>
#include <string>

struct SDL_Window;
struct SDL_Surface;

// ---------------------------------------------------------------------------
// Live preview window. The drawing surface is bound directly to the
// window's own pixel memory, so presenting is a single surface update.
// SDL ties video and event handling to the thread that initialised it: every
// call, destruction included, must come from the thread that called open().
// ---------------------------------------------------------------------------
class LiveWindow {
public:
    // Returns nullptr and fills err on failure.
    static std::unique_ptr<LiveWindow> open(const char* title, int w, int h, std::string& err);

    ~LiveWindow();
    LiveWindow(const LiveWindow&) = delete;
    LiveWindow& operator=(const LiveWindow&) = delete;

    // View onto the window surface, limited to the requested size.
    PixelView pixels() const;

    std::string fill_white();
    std::string present();

    // Drains pending events; true once a quit event was seen.
    bool poll_quit();

    // Blocks until the window is closed.
    void idle_until_quit();

private:
    LiveWindow() = default;

    SDL_Window*  window  = nullptr;
    SDL_Surface* surface = nullptr;
    int          width   = 0;
    int          height  = 0;
    bool         quit    = false;
};
