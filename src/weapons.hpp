#pragma once

#include <string>
#include <vector>

enum class FireKind { Hitscan, Projectile };
enum class ProjectileKind { Standard, Explosive, Homing, Proximity };
enum class MeleeKind { Blade, Shield };
enum class ThrowableKind { Grenade, Flashbang, Smoke, Incendiary };
inline constexpr int THROWABLE_KIND_COUNT = 4;

// Attachment deltas. Multipliers default to 1, additive terms to 0.
struct AttachmentDef {
    std::string slot;
    std::string name;
    float fire_rate{1.0f};
    float reload_time{1.0f};
    float bullet_radius{0.0f};
    int pellets{0};
    float mag_size{1.0f};
    float spread{1.0f};
    float sound_radius{1.0f};
    bool incendiary{false};
};

struct WeaponDef {
    std::string name;
    std::string category{"primary"};
    FireKind fire{FireKind::Projectile};
    ProjectileKind projectile{ProjectileKind::Standard};
    float damage{20.0f};
    float fire_rate{0.25f}; // seconds between shots
    bool automatic{false};
    float bullet_speed{900.0f};
    float bullet_radius{2.0f};
    int pellets{1};
    float spread{0.02f};        // radians, full width
    float pellet_spread{0.0f};  // radians, extra per-pellet jitter
    int mag_size{12};           // < 0 is bottomless
    int reserve{48};
    float reload_time{1.5f};
    float sound_radius{300.0f};
    bool incendiary{false};
    float blast_radius{0.0f};
    float blast_damage{0.0f};
    float proximity_radius{0.0f};
    float min_range{0.0f};
    float max_range{0.0f}; // homing airburst distance at full charge
    float charge_time{0.0f};
    float lifetime{0.0f}; // 0 uses BULLET_LIFETIME
    std::vector<AttachmentDef> attachments;
};

// A carried weapon: definition with attachments folded in, plus ammo state.
struct Weapon {
    WeaponDef stats{};
    int mag{0};
    int reserve{0};
    float cooldown{0.0f};
    bool reloading{false};
    float reload_timer{0.0f};
    float charge{0.0f};
    bool charging{false};
};

struct ThrowableDef {
    ThrowableKind kind{ThrowableKind::Grenade};
    std::string name;
    float fuse{4.0f};
    float radius{230.0f};
    float damage{999.0f};       // vs enemies at the center
    float player_damage{100.0f};
    float sound_radius{800.0f};
    float effect_duration{0.0f}; // smoke / fire lifetime
};

void apply_attachment(WeaponDef& w, const AttachmentDef& a);
const AttachmentDef* find_attachment(const WeaponDef& w, const std::string& name);
// Folds the named attachments into a fresh weapon with a full magazine.
Weapon make_weapon(const WeaponDef& def, const std::vector<std::string>& attachments);

WeaponDef default_weapon_def();
ThrowableDef default_throwable_def(ThrowableKind kind);

bool parse_fire_kind(const std::string& s, FireKind& out);
bool parse_projectile_kind(const std::string& s, ProjectileKind& out);
bool parse_throwable_kind(const std::string& s, ThrowableKind& out);
bool parse_melee_kind(const std::string& s, MeleeKind& out);
const char* throwable_kind_name(ThrowableKind k);
