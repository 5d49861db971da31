#pragma once

#include "settings.hpp"

#include <cstdint>
#include <string>

// Per-difficulty AI behavior selector.
enum class AiBehavior { Tactical, Aggressive };

struct RuntimeSettings {
    AiBehavior ai_behavior{AiBehavior::Tactical};
    float reaction_delay{0.75f};
    float max_frame_dt{MAX_FRAME_DT};
    float net_update_interval{0.05f};
    std::uint32_t seed{0}; // 0 picks a random seed
    std::string local_id{"local"};
};

// key=value .ini, # comments. Unknown keys are ignored and bad values keep their defaults.
bool load_runtime_settings_from_ini(const std::string& path, RuntimeSettings& out);
