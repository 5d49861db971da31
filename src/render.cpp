#include "render.hpp"

#include "doors.hpp"
#include "world.hpp"

#include <algorithm>
#include <cmath>

namespace {

struct View {
    SDL_Renderer* r{nullptr};
    glm::vec2 scale{1.0f, 1.0f};

    SDL_FPoint px(glm::vec2 p) const { return {p.x * scale.x, p.y * scale.y}; }

    void color(Uint8 cr, Uint8 cg, Uint8 cb, Uint8 ca = 255) const { SDL_SetRenderDrawColor(r, cr, cg, cb, ca); }

    void line(glm::vec2 a, glm::vec2 b) const {
        SDL_FPoint pa = px(a), pb = px(b);
        SDL_RenderDrawLineF(r, pa.x, pa.y, pb.x, pb.y);
    }

    void circle(glm::vec2 c, float radius, int segments = 20) const {
        glm::vec2 prev = c + glm::vec2(radius, 0.0f);
        for (int i = 1; i <= segments; ++i) {
            float a = 2.0f * PI * static_cast<float>(i) / static_cast<float>(segments);
            glm::vec2 p = c + radius * glm::vec2(std::cos(a), std::sin(a));
            line(prev, p);
            prev = p;
        }
    }

    void rect(const Wall& w, bool fill) const {
        SDL_FPoint a = px(w.pos);
        SDL_FRect fr{a.x, a.y, w.size.x * scale.x, w.size.y * scale.y};
        if (fill)
            SDL_RenderFillRectF(r, &fr);
        else
            SDL_RenderDrawRectF(r, &fr);
    }
};

void draw_unit(const View& v, glm::vec2 pos, float radius, float facing) {
    v.circle(pos, radius);
    v.line(pos, pos + dir_from_angle(facing) * (radius + 8.0f));
}

} // namespace

void render_frame(Graphics& gfx, const World& world) {
    if (!gfx.renderer)
        return;
    int ww = 0, wh = 0;
    SDL_GetRendererOutputSize(gfx.renderer, &ww, &wh);
    gfx.window_dims = {static_cast<unsigned int>(std::max(ww, 1)), static_cast<unsigned int>(std::max(wh, 1))};
    View v{gfx.renderer, glm::vec2(gfx.window_dims) / world.size};

    v.color(12, 12, 16);
    SDL_RenderClear(gfx.renderer);

    // Visible area outline
    v.color(40, 40, 52);
    const auto& poly = world.player_view;
    for (size_t i = 0; i < poly.size(); ++i)
        v.line(poly[i], poly[(i + 1) % poly.size()]);

    if (world.extraction) {
        if (world.extraction_active)
            v.color(60, 200, 90);
        else
            v.color(40, 90, 50);
        v.rect(*world.extraction, false);
    }

    v.color(150, 150, 160);
    for (auto const& w : world.walls)
        v.rect(w, true);
    for (auto const& d : world.doors) {
        if (d.locked)
            v.color(200, 80, 60);
        else
            v.color(180, 140, 80);
        v.line(d.hinge, door_end(d));
    }

    v.color(120, 120, 120, 90);
    for (auto const& s : world.smoke)
        v.circle(s.pos, s.radius, 28);
    v.color(230, 110, 30, 140);
    for (auto const& f : world.fires)
        v.circle(f.pos, f.radius, 28);

    v.color(90, 90, 200, 80);
    for (auto const& s : world.sounds)
        v.circle(s.pos, s.radius, 32);

    for (auto const& e : world.enemies.data()) {
        if (!e.active || e.health <= 0.0f)
            continue;
        if (e.stun_timer > 0.0f)
            v.color(200, 200, 80);
        else if (e.alert)
            v.color(230, 60, 60);
        else
            v.color(170, 90, 90);
        draw_unit(v, e.pos, e.radius, e.facing);
    }
    v.color(90, 160, 230);
    for (auto const& peer : world.net.peers)
        draw_unit(v, peer.pos, peer.radius, peer.aim);

    const Player& p = world.player;
    if (p.hit_timer > 0.0f)
        v.color(255, 120, 120);
    else
        v.color(90, 230, 120);
    draw_unit(v, p.pos, p.radius, p.aim);
    if (world.swing.active) {
        v.color(240, 240, 240);
        v.line(p.pos, p.pos + dir_from_angle(world.swing.angle) * world.swing.reach);
    }

    v.color(250, 220, 120);
    for (auto const& b : world.bullets.data()) {
        if (b.active)
            v.circle(b.pos, std::max(1.5f, b.radius), 8);
    }
    for (auto const& t : world.fx.tracers)
        v.line(t.a, t.b);
    v.color(120, 200, 120);
    for (auto const& t : world.throwables.data()) {
        if (t.active)
            v.circle(t.pos, THROWABLE_RADIUS, 8);
    }
    v.color(255, 160, 60);
    for (auto const& ring : world.fx.rings)
        v.circle(ring.pos, ring.radius * (1.0f - ring.ttl / EXPLOSION_RING_TTL), 32);
    v.color(255, 255, 200);
    for (auto const& s : world.fx.sparks)
        v.line(s.pos, s.pos + s.vel * 0.02f);

    if (p.flash_timer > 0.0f) {
        v.color(255, 255, 255, static_cast<Uint8>(std::min(1.0f, p.flash_timer) * 255.0f));
        SDL_RenderFillRect(gfx.renderer, nullptr);
    }
    SDL_RenderPresent(gfx.renderer);
}
