#pragma once

#include <glm/glm.hpp>
#include <SDL2/SDL.h>

struct Graphics {
    SDL_Window* window{nullptr};
    SDL_Renderer* renderer{nullptr};
    glm::uvec2 window_dims{1280, 720};
};

// Brings up SDL video and, unless headless, a resizable window with a renderer.
// Headless uses the dummy video driver and creates nothing. Returns false if SDL cannot start.
bool init_graphics(Graphics& gfx, bool headless, const char* title, int width, int height);
void shutdown_graphics(Graphics& gfx);
