#pragma once

#include "pool.hpp"
#include "settings.hpp"
#include "weapons.hpp"

#include <array>
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// Damage-over-time and crowd-control timers shared by every unit.
struct StatusEffects {
    float burn_timer{0.0f};
    int bleed_stacks{0};
    float bleed_timer{0.0f};
};

void add_bleed_stack(StatusEffects& s);
void apply_burn(StatusEffects& s);
// Advances the timers and returns the damage dealt over `dt`.
float tick_status(StatusEffects& s, float dt);

enum class CombatMode { Gun, Melee };

struct Player {
    glm::vec2 pos{0.0f, 0.0f};
    float radius{PLAYER_RADIUS};
    float health{PLAYER_MAX_HEALTH};
    float max_health{PLAYER_MAX_HEALTH};
    float aim{0.0f};
    glm::vec2 aim_point{0.0f, 0.0f};

    std::vector<Weapon> weapons;
    int active_weapon{0};
    CombatMode mode{CombatMode::Gun};
    MeleeKind melee{MeleeKind::Blade};
    float melee_cooldown{0.0f};
    float shield_durability{0.0f};

    std::array<int, THROWABLE_KIND_COUNT> throwables{};
    ThrowableKind active_throwable{ThrowableKind::Grenade};
    bool cooking{false};
    float cook_timer{0.0f};

    int medkits{0};
    bool healing{false};
    float heal_timer{0.0f};

    float hit_timer{0.0f};
    float flash_timer{0.0f};
    StatusEffects status{};

    float step_sound_timer{0.0f};
    bool fire_was_down{false};
    bool interact_was_down{false};
    double last_interact_time{-1.0};
    int last_door_id{-1};
};

enum class EnemyType { Standard, Advanced };

enum class AiState { Idle, Investigating, Alert, Searching, Returning };

enum class AxePhase { Idle, Windup, Swing, Recover };

struct StandardKit {
    float shoot_cooldown_max{ENEMY_SHOOT_COOLDOWN};
};

struct AdvancedKit {
    AxePhase axe{AxePhase::Idle};
    float axe_timer{0.0f};
    int rifle_ammo{RIFLE_MAG};
    bool reloading{false};
    float reload_timer{0.0f};
    float burst_pause{0.0f};
    float shot_timer{0.0f};
    int burst_left{RIFLE_BURST};
};

using EnemyKit = std::variant<StandardKit, AdvancedKit>;

struct Enemy {
    bool active{false};
    VID vid{};
    glm::vec2 pos{0.0f, 0.0f};
    float radius{ENEMY_RADIUS};
    float health{ENEMY_STANDARD_HEALTH};
    float max_health{ENEMY_STANDARD_HEALTH};
    float facing{0.0f};
    float fov{ENEMY_FOV_DEG * PI / 180.0f};
    float view_distance{WORLD_WIDTH * ENEMY_VIEW_FRACTION};
    float speed{ENEMY_SPEED};

    AiState state{AiState::Idle};
    bool alert{false};
    std::optional<glm::vec2> target{};
    double last_seen{-1.0};
    glm::vec2 post{0.0f, 0.0f};
    float post_facing{0.0f};
    float search_base_facing{0.0f};

    float shoot_cooldown{0.0f};
    float stun_timer{0.0f};
    float suppress_timer{0.0f};
    float reaction_timer{0.0f};
    float search_timer{0.0f};
    std::uint32_t heard_sound{0}; // newest sound already investigated
    float step_sound_timer{0.0f};
    StatusEffects status{};

    EnemyKit kit{StandardKit{}};
};

inline EnemyType enemy_type(const Enemy& e) {
    return std::holds_alternative<AdvancedKit>(e.kit) ? EnemyType::Advanced : EnemyType::Standard;
}

class Enemies : public Pool<Enemy, MAX_ENEMIES> {
  public:
    std::optional<VID> spawn(glm::vec2 p, float facing, EnemyType type) {
        auto v = alloc();
        if (!v)
            return std::nullopt;
        Enemy* e = get(*v);
        e->pos = p;
        e->facing = facing;
        e->post = p;
        e->post_facing = facing;
        if (type == EnemyType::Advanced) {
            e->kit = AdvancedKit{};
            e->health = e->max_health = ENEMY_ADVANCED_HEALTH;
        }
        return v;
    }
    int living() const {
        int n = 0;
        for (auto const& e : data())
            if (e.active && e.health > 0.0f)
                ++n;
        return n;
    }
};

enum class Owner { Player, Enemy };

struct Bullet {
    bool active{false};
    VID vid{};
    glm::vec2 pos{0.0f, 0.0f};
    glm::vec2 dir{1.0f, 0.0f};
    float speed{0.0f};
    float radius{2.0f};
    float damage{0.0f};
    Owner owner{Owner::Player};
    ProjectileKind kind{ProjectileKind::Standard};
    bool incendiary{false};
    float blast_radius{0.0f};
    float blast_damage{0.0f};
    float proximity_radius{0.0f};
    std::optional<VID> homing_target{};
    bool homing_locked{false};
    float travelled{0.0f};
    float max_range{0.0f};
    float lifetime{BULLET_LIFETIME};
};

using Bullets = Pool<Bullet, MAX_BULLETS>;

struct Throwable {
    bool active{false};
    VID vid{};
    ThrowableKind kind{ThrowableKind::Grenade};
    glm::vec2 pos{0.0f, 0.0f};
    glm::vec2 vel{0.0f, 0.0f};
    float fuse{0.0f};
    bool bounced{false};
};

using Throwables = Pool<Throwable, MAX_THROWABLES>;

enum class SoundType {
    PlayerMove,
    PlayerShoot,
    EnemyMove,
    EnemyShoot,
    Impact,
    Explosion,
    Door,
    Bounce,
    Slash,
    Alert
};

struct SoundEvent {
    glm::vec2 pos{0.0f, 0.0f};
    float radius{0.0f};
    float max_radius{0.0f};
    float lifetime{0.0f};
    float max_lifetime{0.0f};
    SoundType type{SoundType::Impact};
    std::uint32_t id{0}; // increases with every emitted sound
};

enum class LightKind { Muzzle, Impact, Explosion, Flash };

struct Light {
    glm::vec2 pos{0.0f, 0.0f};
    float radius{0.0f};
    float power{1.0f};
    float ttl{0.0f};
    float max_ttl{0.0f};
    LightKind kind{LightKind::Impact};
};

struct Spark {
    glm::vec2 pos{0.0f, 0.0f};
    glm::vec2 vel{0.0f, 0.0f};
    float ttl{SPARK_TTL};
};

struct Tracer {
    glm::vec2 a{0.0f, 0.0f};
    glm::vec2 b{0.0f, 0.0f};
    float ttl{TRACER_TTL};
};

struct HitMarker {
    glm::vec2 pos{0.0f, 0.0f};
    float ttl{0.2f};
};

struct ExplosionRing {
    glm::vec2 pos{0.0f, 0.0f};
    float radius{0.0f};
    float ttl{EXPLOSION_RING_TTL};
};

struct SmokeCloud {
    glm::vec2 pos{0.0f, 0.0f};
    float radius{0.0f};
    float ttl{0.0f};
};

struct FireZone {
    glm::vec2 pos{0.0f, 0.0f};
    float radius{0.0f};
    float ttl{0.0f};
};

struct Effects {
    std::vector<Light> lights;
    std::vector<Spark> sparks;
    std::vector<Tracer> tracers;
    std::vector<HitMarker> hits;
    std::vector<ExplosionRing> rings;
};

// Active blade sweep of the local player.
struct MeleeSwing {
    bool active{false};
    float elapsed{0.0f};
    float start_angle{0.0f};
    float prev_angle{0.0f};
    float angle{0.0f};
    float reach{BLADE_RANGE};
    bool blocked{false};
    std::vector<VID> hit;
};
