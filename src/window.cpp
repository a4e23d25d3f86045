#include "window.hpp"

#include <SDL2/SDL.h>

std::unique_ptr<LiveWindow> LiveWindow::open(const char* title, int w, int h, std::string& err)
{
    if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
        err = std::string("SDL_Init error: ") + SDL_GetError();
        return nullptr;
    }

    // From here on the destructor owns the SDL video subsystem reference.
    std::unique_ptr<LiveWindow> win(new LiveWindow());
    win->width  = w;
    win->height = h;

    win->window = SDL_CreateWindow(
        title,
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        w, h,
        SDL_WINDOW_SHOWN
    );
    if (!win->window) {
        err = std::string("SDL_CreateWindow error: ") + SDL_GetError();
        return nullptr;
    }

    win->surface = SDL_GetWindowSurface(win->window);
    if (!win->surface) {
        err = std::string("SDL_GetWindowSurface error: ") + SDL_GetError();
        return nullptr;
    }

    const Uint32 fmt = win->surface->format->format;
    if (fmt != SDL_PIXELFORMAT_ARGB8888 && fmt != SDL_PIXELFORMAT_RGB888) {
        err = std::string("Unsupported window surface format: ") + SDL_GetPixelFormatName(fmt);
        return nullptr;
    }
    if (win->surface->w < w || win->surface->h < h) {
        err = "Window surface is smaller than the requested size";
        return nullptr;
    }
    return win;
}

LiveWindow::~LiveWindow()
{
    // The window surface belongs to the window.
    if (window) SDL_DestroyWindow(window);
    SDL_QuitSubSystem(SDL_INIT_VIDEO);
}

PixelView LiveWindow::pixels() const
{
    PixelView v;
    v.pixels = static_cast<uint32_t*>(surface->pixels);
    v.width  = width;
    v.height = height;
    v.stride = surface->pitch / 4;
    v.format = PixelFormat::RGB24;
    return v;
}

std::string LiveWindow::fill_white()
{
    if (SDL_FillRect(surface, nullptr, SDL_MapRGBA(surface->format, 255, 255, 255, 255)) != 0)
        return std::string("SDL_FillRect error: ") + SDL_GetError();
    return {};
}

std::string LiveWindow::present()
{
    if (SDL_UpdateWindowSurface(window) != 0)
        return std::string("SDL_UpdateWindowSurface error: ") + SDL_GetError();
    return {};
}

bool LiveWindow::poll_quit()
{
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_QUIT)
            quit = true;
    }
    return quit;
}

void LiveWindow::idle_until_quit()
{
    while (!quit) {
        // Block until an event arrives or 50 ms elapse, then drain the rest.
        SDL_Event event;
        if (SDL_WaitEventTimeout(&event, 50) && event.type == SDL_QUIT)
            quit = true;
        poll_quit();
    }
}
