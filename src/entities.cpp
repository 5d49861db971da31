#include "entities.hpp"

#include <algorithm>

void add_bleed_stack(StatusEffects& s) {
    s.bleed_stacks = std::min(BLEED_MAX_STACKS, s.bleed_stacks + 1);
    s.bleed_timer = BLEED_DURATION;
}

void apply_burn(StatusEffects& s) { s.burn_timer = BURN_DURATION; }

float tick_status(StatusEffects& s, float dt) {
    float dmg = 0.0f;
    if (s.bleed_stacks > 0 && s.bleed_timer > 0.0f) {
        float step = std::min(dt, s.bleed_timer);
        dmg += static_cast<float>(s.bleed_stacks) * BLEED_DPS_PER_STACK * step;
        s.bleed_timer -= dt;
        if (s.bleed_timer <= 0.0f) {
            s.bleed_timer = 0.0f;
            s.bleed_stacks = 0;
        }
    }
    if (s.burn_timer > 0.0f) {
        dmg += BURN_DPS * std::min(dt, s.burn_timer);
        s.burn_timer = std::max(0.0f, s.burn_timer - dt);
    }
    return dmg;
}
