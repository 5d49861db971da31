#pragma once

inline constexpr int MAX_ENEMIES = 256;
inline constexpr int MAX_BULLETS = 1024;
inline constexpr int MAX_THROWABLES = 64;
inline constexpr float FRAMES_PER_SECOND = 60.0f;
inline constexpr float TIMESTEP = 1.0f / FRAMES_PER_SECOND;
inline constexpr float MAX_FRAME_DT = 0.05f; // clamp after stalls
inline constexpr float PI = 3.14159265358979323846f;

// World
inline constexpr float WORLD_WIDTH = 1280.0f;
inline constexpr float WORLD_HEIGHT = 720.0f;
inline constexpr float WALL_THICKNESS = 15.0f;
inline constexpr float COLLISION_SKIN = 0.1f;

// Player
inline constexpr float PLAYER_RADIUS = 10.0f;
inline constexpr float PLAYER_SPEED = 240.0f;
inline constexpr float PLAYER_MAX_HEALTH = 100.0f;
inline constexpr float PLAYER_HIT_FLASH_SECONDS = 0.17f;
inline constexpr int PLAYER_COLLISION_ITERATIONS = 3;
inline constexpr float PLAYER_STEP_SOUND_INTERVAL = 0.3f;
inline constexpr float PLAYER_STEP_SOUND_RADIUS = 100.0f;
inline constexpr float HEAL_CHANNEL_SECONDS = 2.0f;
inline constexpr float HEAL_AMOUNT = 50.0f;
inline constexpr float TAKEDOWN_REACH = 15.0f;
inline constexpr float TAKEDOWN_BEHIND_DOT = -0.3f;

// Doors
inline constexpr float DOOR_AUTO_SWING_SPEED = 3.0f; // rad/s
inline constexpr float DOOR_ARRIVE_EPS = 0.01f;
inline constexpr float DOOR_DAMPING = 2.0f;
inline constexpr float DOOR_PUSH_SPEED = 1.8f;
inline constexpr float DOOR_DOUBLE_TAP_SECONDS = 0.3f;
inline constexpr float DOOR_SOUND_SPEED = 1.5f;
inline constexpr float DOOR_SOUND_FAST_SPEED = 3.0f;
inline constexpr float DOOR_SOUND_COOLDOWN = 0.25f;
inline constexpr float DOOR_SOUND_RADIUS_SLOW = 100.0f;
inline constexpr float DOOR_SOUND_RADIUS_FAST = 250.0f;
inline constexpr float DOOR_CLOSED_EPS = 0.1f;
inline constexpr float DOOR_CAMP_MARGIN = 30.0f;

// Sound events
inline constexpr float SHOOT_SOUND_LIFETIME = 0.5f;
inline constexpr float IMPACT_SOUND_RADIUS = 200.0f;
inline constexpr float IMPACT_SOUND_LIFETIME = 0.3f;
inline constexpr float FLESH_SOUND_RADIUS = 50.0f;
inline constexpr float FLESH_SOUND_LIFETIME = 0.2f;
inline constexpr float BOUNCE_SOUND_RADIUS = 120.0f;
inline constexpr float SLASH_SOUND_RADIUS = 80.0f;
inline constexpr float BLOCKED_SLASH_SOUND_RADIUS = 150.0f;
inline constexpr float ALERT_SOUND_RADIUS = 300.0f;
inline constexpr float PROJECTILE_BLAST_SOUND_RADIUS = 700.0f;
inline constexpr float AIRBURST_SOUND_RADIUS = 300.0f;

// Effects
inline constexpr float IMPACT_LIGHT_TTL = 0.13f;
inline constexpr float IMPACT_LIGHT_POWER = 1.35f;
inline constexpr float MUZZLE_LIGHT_TTL = 0.06f;
inline constexpr float TRACER_TTL = 0.08f;
inline constexpr float SPARK_TTL = 0.25f;

// Bullets
inline constexpr float BULLET_LIFETIME = 3.0f;
inline constexpr float HITSCAN_MAX_DISTANCE = 9999.0f;

// Homing and airburst
inline constexpr float HOMING_ACQUIRE_RADIUS = 60.0f;
inline constexpr float HOMING_TURN_RATE = 4.0f; // rad/s
inline constexpr float HOMING_RELEASE_ERROR = 0.02f;
inline constexpr float AIRBURST_SEARCH_RADIUS = 200.0f;
inline constexpr float AIRBURST_RADIUS = 90.0f;
inline constexpr float AIRBURST_DAMAGE = 25.0f;

// Status effects
inline constexpr int BLEED_MAX_STACKS = 5;
inline constexpr float BLEED_DPS_PER_STACK = 4.0f;
inline constexpr float BLEED_DURATION = 4.0f;
inline constexpr float BURN_DPS = 10.0f;
inline constexpr float BURN_DURATION = 1.0f;

// Melee
inline constexpr float BLADE_DURATION = 0.15f;
inline constexpr float BLADE_COOLDOWN = 0.67f;
inline constexpr float BLADE_RANGE = 90.0f;
inline constexpr float BLADE_INNER = 15.0f;
inline constexpr float BLADE_SWEEP_DEG = 120.0f;
inline constexpr float BLADE_WIDTH_DEG = 20.0f;
inline constexpr float SHIELD_BASH_RANGE = 60.0f;
inline constexpr float SHIELD_BASH_CONE_DEG = 90.0f;
inline constexpr float SHIELD_BASH_DAMAGE = 35.0f;
inline constexpr float SHIELD_BASH_STUN = 1.2f;
inline constexpr float SHIELD_BASH_COOLDOWN = 0.8f;
inline constexpr float SHIELD_DURABILITY = 200.0f;
inline constexpr float SHIELD_FRONT_ARC_DEG = 120.0f;
inline constexpr float SHIELD_REAR_PASS_THROUGH = 0.2f;

// Throwables and area effects
inline constexpr float THROW_DAMPING = 1.5f;
inline constexpr float THROW_BOUNCE = 0.4f;
inline constexpr float THROW_POWER_DIVISOR = 20.0f;
inline constexpr float THROW_POWER_MAX = 15.0f;
inline constexpr float THROWABLE_RADIUS = 5.0f;
inline constexpr float FLASH_MIN_SECONDS = 0.5f;
inline constexpr float FLASH_MAX_SECONDS = 2.5f;
inline constexpr float EXPLOSION_RING_TTL = 0.4f;

// Enemies
inline constexpr float ENEMY_RADIUS = 12.0f;
inline constexpr float ENEMY_SPEED = 120.0f;
inline constexpr float ENEMY_FOV_DEG = 130.0f;
inline constexpr float ENEMY_VIEW_FRACTION = 0.5f; // of world width
inline constexpr float ENEMY_STANDARD_HEALTH = 100.0f;
inline constexpr float ENEMY_ADVANCED_HEALTH = 150.0f;
inline constexpr float ENEMY_SHOOT_COOLDOWN = 2.0f;
inline constexpr float ENEMY_BULLET_RADIUS = 4.0f;
inline constexpr float ENEMY_BULLET_SPEED = 360.0f;
inline constexpr float ENEMY_BULLET_DAMAGE = 15.0f;
inline constexpr float ENEMY_SHOOT_SOUND_RADIUS = 400.0f;
inline constexpr float ENEMY_SEARCH_SECONDS = 5.0f;
inline constexpr float ENEMY_FOLLOWUP_SEARCH_SECONDS = 3.0f;
inline constexpr float ENEMY_SUPPRESS_SECONDS = 1.5f;
inline constexpr float ENEMY_SUPPRESS_MARGIN = 50.0f;
inline constexpr float ENEMY_INVESTIGATE_SPEED_SCALE = 0.7f;
inline constexpr float ENEMY_ARRIVE_SCALE = 1.5f;
inline constexpr float ENEMY_STEP_SOUND_INTERVAL = 0.4f;
inline constexpr float ENEMY_STEP_SOUND_RADIUS = 120.0f;
inline constexpr float ENEMY_LOOK_AROUND_PERIOD = 150.0f; // ms divisor
inline constexpr float ENEMY_DOOR_PROBE = 20.0f;
// Advanced archetype
inline constexpr float AXE_RANGE = 50.0f;
inline constexpr float AXE_ARC_DEG = 90.0f;
inline constexpr float AXE_WINDUP = 0.4f;
inline constexpr float AXE_SWING = 0.15f;
inline constexpr float AXE_RECOVER = 0.6f;
inline constexpr float AXE_SHIELD_DAMAGE = 60.0f;
inline constexpr int RIFLE_MAG = 30;
inline constexpr float RIFLE_RELOAD_SECONDS = 2.5f;
inline constexpr int RIFLE_BURST = 3;
inline constexpr float RIFLE_SHOT_INTERVAL = 0.1f;
inline constexpr float RIFLE_BURST_PAUSE = 0.8f;
inline constexpr float RIFLE_DAMAGE = 11.0f;

// Network overlay
inline constexpr float REMOTE_LERP_RATE = 10.0f;
