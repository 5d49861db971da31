#pragma once

#include "graphics.hpp"

struct World;

// Wireframe debug view of the world, scaled to the window. No-op without a renderer.
void render_frame(Graphics& gfx, const World& world);
