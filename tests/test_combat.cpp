#include <doctest/doctest.h>

#include "combat.hpp"
#include "sim.hpp"
#include "test_support.hpp"
#include "throwables.hpp"

#include <cmath>

TEST_CASE("hitscan into a bare wall leaves one light and one sound") {
    LevelDef level = open_level();
    level.walls.push_back(wall_px(600.0f, 0.0f, 20.0f, 720.0f));
    World world;
    make_world(world, level);
    Enemy& e = add_enemy(world, {300.0f, 100.0f}, 0.0f);

    hitscan_pellet(world, world.player.pos, 0.0f, 50.0f, Owner::Player, false);

    CHECK(world.fx.lights.size() == 1);
    CHECK(world.sounds.size() == 1);
    CHECK(world.fx.tracers.size() == 1);
    CHECK(world.fx.tracers[0].b.x == doctest::Approx(600.0f));
    CHECK(e.health == ENEMY_STANDARD_HEALTH);
    CHECK(world.player.health == PLAYER_MAX_HEALTH);
}

TEST_CASE("hitscan picks a target in front of the wall") {
    LevelDef level = open_level();
    level.walls.push_back(wall_px(600.0f, 0.0f, 20.0f, 720.0f));
    World world;
    make_world(world, level);
    Enemy& near = add_enemy(world, {300.0f, 365.0f}, 0.0f);
    Enemy& behind = add_enemy(world, {700.0f, 360.0f}, 0.0f);

    hitscan_pellet(world, world.player.pos, 0.0f, 50.0f, Owner::Player, false);

    CHECK(near.health == doctest::Approx(50.0f));
    CHECK(behind.health == ENEMY_STANDARD_HEALTH);
    CHECK(world.fx.hits.size() == 1);
    CHECK(world.fx.lights.empty());
}

TEST_CASE("firing with an empty magazine does nothing") {
    World world;
    make_world(world, open_level());
    Weapon w = make_weapon(default_weapon_def(), {});
    w.mag = 0;
    CHECK_FALSE(fire_weapon(world, w, 1.0f));
    CHECK(world.bullets.count() == 0);
    CHECK(world.sounds.empty());
    CHECK(world.fx.lights.empty());
    CHECK(world.net.outbox.empty());
    CHECK(w.cooldown == 0.0f);
}

TEST_CASE("firing respects cooldown and spends one round") {
    World world;
    make_world(world, open_level());
    Weapon w = make_weapon(default_weapon_def(), {});
    int mag = w.mag;
    REQUIRE(fire_weapon(world, w, 1.0f));
    CHECK(w.mag == mag - 1);
    CHECK(world.bullets.count() == 1);
    CHECK(world.net.outbox.size() == 1);
    CHECK(world.net.outbox[0].type == NetMessageType::FireWeapon);
    CHECK_FALSE(fire_weapon(world, w, 1.0f));
    CHECK(w.mag == mag - 1);
}

TEST_CASE("blast at distance zero deals full damage and falls off linearly") {
    World world;
    make_world(world, open_level());
    Enemy& center = add_enemy(world, {500.0f, 360.0f}, 0.0f);
    Enemy& half = add_enemy(world, {500.0f, 410.0f}, 0.0f);
    Enemy& outside = add_enemy(world, {500.0f, 500.0f}, 0.0f);

    blast(world, center.pos, 100.0f, 60.0f, 0.0f, false);
    CHECK(center.health == doctest::Approx(40.0f));
    CHECK(half.health == doctest::Approx(70.0f));
    CHECK(outside.health == ENEMY_STANDARD_HEALTH);

    blast(world, world.player.pos, 100.0f, 0.0f, 40.0f, false);
    CHECK(world.player.health == doctest::Approx(60.0f));
}

TEST_CASE("walls shelter targets from a blast") {
    LevelDef level = open_level();
    level.walls.push_back(wall_px(540.0f, 300.0f, 20.0f, 120.0f));
    World world;
    make_world(world, level);
    Enemy& e = add_enemy(world, {600.0f, 360.0f}, 0.0f);
    blast(world, {500.0f, 360.0f}, 200.0f, 80.0f, 0.0f, false);
    CHECK(e.health == ENEMY_STANDARD_HEALTH);
}

TEST_CASE("a grenade removes locked doors in its radius") {
    LevelDef level = open_level();
    DoorDef d{};
    d.id = 7;
    d.hinge = {600.0f / WORLD_WIDTH, 300.0f / WORLD_HEIGHT};
    d.length = 100.0f / WORLD_HEIGHT;
    d.locked = true;
    level.doors.push_back(d);
    World world;
    make_world(world, level);
    REQUIRE(world.doors.size() == 1);
    detonate_throwable(world, ThrowableKind::Grenade, {650.0f, 340.0f});
    CHECK(world.doors.empty());
    CHECK_FALSE(world.fx.rings.empty());
}

TEST_CASE("homing heading error shrinks every tick until it locks on") {
    World world;
    make_world(world, open_level());
    Enemy& e = add_enemy(world, {400.0f, 410.0f}, 0.0f);
    Bullet* b = spawn_bullet(world, {100.0f, 360.0f}, {1.0f, 0.0f}, 300.0f, 3.0f, 40.0f, Owner::Player);
    REQUIRE(b);
    b->kind = ProjectileKind::Homing;
    b->max_range = 2000.0f;
    VID vid = b->vid;

    auto error = [&](const Bullet& x) {
        return std::fabs(wrap_angle(angle_of(e.pos - x.pos) - angle_of(x.dir)));
    };
    float prev = error(*b);
    REQUIRE(prev > HOMING_RELEASE_ERROR);
    int turns = 0;
    while (prev > HOMING_RELEASE_ERROR && turns < 30) {
        sim_bullets(world, 1.0f / 60.0f);
        Bullet* cur = world.bullets.get(vid);
        REQUIRE(cur);
        REQUIRE(cur->homing_target.has_value());
        CHECK(*cur->homing_target == e.vid);
        float err = error(*cur);
        CHECK(err < prev);
        prev = err;
        ++turns;
    }
    CHECK(prev <= HOMING_RELEASE_ERROR);
}

TEST_CASE("a homing round that runs out of range airbursts and bleeds the group") {
    World world;
    make_world(world, open_level());
    Enemy& a = add_enemy(world, {200.0f, 500.0f}, 0.0f);
    Enemy& c = add_enemy(world, {230.0f, 500.0f}, 0.0f);
    Bullet* b = spawn_bullet(world, {100.0f, 360.0f}, {1.0f, 0.0f}, 600.0f, 3.0f, 40.0f, Owner::Player);
    REQUIRE(b);
    b->kind = ProjectileKind::Homing;
    b->max_range = 100.0f;

    for (int i = 0; i < 30; ++i)
        sim_bullets(world, 1.0f / 60.0f);

    CHECK(world.bullets.count() == 0);
    CHECK(a.health == doctest::Approx(ENEMY_STANDARD_HEALTH - AIRBURST_DAMAGE));
    CHECK(c.health == doctest::Approx(ENEMY_STANDARD_HEALTH - AIRBURST_DAMAGE));
    CHECK(a.status.bleed_stacks == 1);
    CHECK(c.status.bleed_stacks == 1);
}

TEST_CASE("a proximity round detonates on a near miss") {
    World world;
    make_world(world, open_level());
    Enemy& e = add_enemy(world, {300.0f, 390.0f}, 0.0f);
    Bullet* b = spawn_bullet(world, {100.0f, 360.0f}, {1.0f, 0.0f}, 600.0f, 2.0f, 70.0f, Owner::Player);
    REQUIRE(b);
    b->kind = ProjectileKind::Proximity;
    b->proximity_radius = 20.0f;
    for (int i = 0; i < 40; ++i)
        sim_bullets(world, 1.0f / 60.0f);
    CHECK(e.health == doctest::Approx(30.0f));
    CHECK(world.bullets.count() == 0);
}

TEST_CASE("a proximity fuse does not trigger on a target behind a wall") {
    LevelDef level = open_level();
    level.walls.push_back(wall_px(0.0f, 368.0f, 1280.0f, 4.0f));
    World world;
    make_world(world, level);
    Enemy& e = add_enemy(world, {300.0f, 388.0f}, 0.0f);
    Bullet* b = spawn_bullet(world, {100.0f, 360.0f}, {1.0f, 0.0f}, 1100.0f, 2.0f, 70.0f, Owner::Player);
    REQUIRE(b);
    b->kind = ProjectileKind::Proximity;
    b->proximity_radius = 18.0f;
    for (int i = 0; i < 30; ++i)
        sim_bullets(world, 1.0f / 60.0f);
    CHECK(e.health == ENEMY_STANDARD_HEALTH);
}

static Bullet* launch_explosive(World& world, glm::vec2 from) {
    Bullet* b = spawn_bullet(world, from, {1.0f, 0.0f}, 600.0f, 2.0f, 0.0f, Owner::Player);
    REQUIRE(b);
    b->kind = ProjectileKind::Explosive;
    b->blast_radius = 120.0f;
    b->blast_damage = 100.0f;
    return b;
}

static int explosion_sounds(const World& world) {
    int n = 0;
    for (auto const& s : world.sounds)
        if (s.type == SoundType::Explosion)
            ++n;
    return n;
}

TEST_CASE("an explosive round that hits a target blasts with falloff") {
    World world;
    make_world(world, open_level());
    Enemy& struck = add_enemy(world, {400.0f, 360.0f}, 0.0f);
    Enemy& behind = add_enemy(world, {470.0f, 360.0f}, 0.0f);
    launch_explosive(world, {100.0f, 360.0f});
    for (int i = 0; i < 60 && world.bullets.count() > 0; ++i)
        sim_bullets(world, 1.0f / 60.0f);

    REQUIRE(world.bullets.count() == 0);
    // Detonates where the round touches the struck enemy.
    float contact = ENEMY_RADIUS + 2.0f;
    CHECK(ENEMY_STANDARD_HEALTH - struck.health == doctest::Approx(100.0f * (1.0f - contact / 120.0f)));
    CHECK(ENEMY_STANDARD_HEALTH - behind.health ==
          doctest::Approx(100.0f * (1.0f - (70.0f + contact) / 120.0f)));
    CHECK(world.fx.rings.size() == 1);
    CHECK(explosion_sounds(world) == 1);
}

TEST_CASE("an explosive round that hits a wall blasts just in front of it") {
    LevelDef level = open_level();
    level.walls.push_back(wall_px(600.0f, 0.0f, 20.0f, 720.0f));
    World world;
    make_world(world, level);
    Enemy& close_by = add_enemy(world, {570.0f, 420.0f}, 0.0f);
    Enemy& sheltered = add_enemy(world, {650.0f, 360.0f}, 0.0f);
    launch_explosive(world, {100.0f, 360.0f});
    for (int i = 0; i < 90 && world.bullets.count() > 0; ++i)
        sim_bullets(world, 1.0f / 60.0f);

    REQUIRE(world.bullets.count() == 0);
    float d = glm::length(glm::vec2{570.0f, 420.0f} - glm::vec2{599.0f, 360.0f});
    CHECK(ENEMY_STANDARD_HEALTH - close_by.health == doctest::Approx(100.0f * (1.0f - d / 120.0f)).epsilon(0.02));
    CHECK(sheltered.health == ENEMY_STANDARD_HEALTH);
    REQUIRE(world.fx.rings.size() == 1);
    CHECK(world.fx.rings[0].pos.x < 600.0f);
    // The AI has to be able to hear launcher impacts.
    CHECK(explosion_sounds(world) == 1);
}

TEST_CASE("fire zones keep units burning while they stand in them") {
    World world;
    make_world(world, open_level());
    world.player.pos = {100.0f, 100.0f};
    Enemy& e = add_enemy(world, {500.0f, 360.0f}, 0.0f);
    world.fires.push_back(FireZone{{500.0f, 360.0f}, 100.0f, 1.0f});

    const float dt = 1.0f / 60.0f;
    for (int i = 0; i < 30; ++i)
        sim_effects(world, dt);
    CHECK(e.status.burn_timer > BURN_DURATION - 2.0f * dt);
    CHECK(ENEMY_STANDARD_HEALTH - e.health == doctest::Approx(BURN_DPS * 0.5f).epsilon(0.05));

    // The zone burns out after its lifetime; the last refresh runs its course.
    for (int i = 0; i < 150; ++i)
        sim_effects(world, dt);
    CHECK(world.fires.empty());
    CHECK(e.status.burn_timer == 0.0f);
    CHECK(ENEMY_STANDARD_HEALTH - e.health == doctest::Approx(BURN_DPS * (1.0f + BURN_DURATION)).epsilon(0.03));
    CHECK(world.player.health == PLAYER_MAX_HEALTH);
}

TEST_CASE("bleed stacks cap and deal damage linearly") {
    StatusEffects s{};
    for (int i = 0; i < 8; ++i)
        add_bleed_stack(s);
    CHECK(s.bleed_stacks == BLEED_MAX_STACKS);

    StatusEffects two{};
    add_bleed_stack(two);
    add_bleed_stack(two);
    CHECK(tick_status(two, 1.0f) == doctest::Approx(2.0f * BLEED_DPS_PER_STACK));
    CHECK(tick_status(two, 0.5f) == doctest::Approx(BLEED_DPS_PER_STACK));
    CHECK(tick_status(two, 0.5f) == doctest::Approx(BLEED_DPS_PER_STACK));

    // Stacks expire together once the timer runs out.
    tick_status(two, BLEED_DURATION);
    CHECK(two.bleed_stacks == 0);
    CHECK(tick_status(two, 1.0f) == 0.0f);
}

TEST_CASE("burning deals damage for its duration only") {
    StatusEffects s{};
    apply_burn(s);
    CHECK(tick_status(s, 0.5f) == doctest::Approx(BURN_DPS * 0.5f));
    CHECK(tick_status(s, 1.0f) == doctest::Approx(BURN_DPS * 0.5f));
    CHECK(tick_status(s, 1.0f) == 0.0f);
}

TEST_CASE("a blade swing kills each enemy in its arc once") {
    World world;
    make_world(world, open_level());
    world.player.aim = 0.0f;
    glm::vec2 p = world.player.pos;
    Enemy& a = add_enemy(world, p + dir_from_angle(0.5f) * 50.0f, 0.0f);
    Enemy& b = add_enemy(world, p + dir_from_angle(-0.5f) * 60.0f, 0.0f);
    Enemy& far = add_enemy(world, p + glm::vec2{200.0f, 0.0f}, 0.0f);

    start_melee(world);
    REQUIRE(world.swing.active);
    for (int i = 0; i < 20; ++i)
        sim_melee(world, 1.0f / 60.0f);

    CHECK(a.health == 0.0f);
    CHECK(b.health == 0.0f);
    CHECK(far.health == ENEMY_STANDARD_HEALTH);
    CHECK(world.fx.hits.size() == 2);
    CHECK_FALSE(world.swing.active);
    CHECK(world.player.melee_cooldown == doctest::Approx(BLADE_COOLDOWN));
}

TEST_CASE("a blade swing across the -pi/pi seam still connects") {
    World world;
    make_world(world, open_level());
    world.player.pos = {400.0f, 360.0f};
    world.player.aim = PI;
    Enemy& e = add_enemy(world, {350.0f, 360.0f}, 0.0f);
    start_melee(world);
    for (int i = 0; i < 20; ++i)
        sim_melee(world, 1.0f / 60.0f);
    CHECK(e.health == 0.0f);
}

TEST_CASE("a raised shield absorbs frontal damage") {
    Loadout l{};
    l.melee = MeleeKind::Shield;
    World world;
    make_world(world, open_level(), l);
    Player& p = world.player;
    REQUIRE(p.shield_durability == SHIELD_DURABILITY);
    p.aim = 0.0f;
    p.mode = CombatMode::Melee;

    damage_player(world, 30.0f, p.pos + glm::vec2{100.0f, 0.0f});
    CHECK(p.health == PLAYER_MAX_HEALTH);
    CHECK(p.shield_durability == doctest::Approx(SHIELD_DURABILITY - 30.0f));

    // Flank hits are not covered.
    damage_player(world, 10.0f, p.pos + glm::vec2{0.0f, 100.0f});
    CHECK(p.health == doctest::Approx(PLAYER_MAX_HEALTH - 10.0f));
}

TEST_CASE("a slung shield lets part of a rear hit through") {
    Loadout l{};
    l.melee = MeleeKind::Shield;
    World world;
    make_world(world, open_level(), l);
    Player& p = world.player;
    p.aim = 0.0f;
    p.mode = CombatMode::Gun;

    damage_player(world, 30.0f, p.pos - glm::vec2{100.0f, 0.0f});
    CHECK(p.health == doctest::Approx(PLAYER_MAX_HEALTH - 30.0f * SHIELD_REAR_PASS_THROUGH));
    CHECK(p.shield_durability == doctest::Approx(SHIELD_DURABILITY - 24.0f));

    // Lowered shield does nothing for the front.
    damage_player(world, 10.0f, p.pos + glm::vec2{100.0f, 0.0f});
    CHECK(p.health == doctest::Approx(PLAYER_MAX_HEALTH - 6.0f - 10.0f));
}

TEST_CASE("shield bash stuns enemies in the cone") {
    Loadout l{};
    l.melee = MeleeKind::Shield;
    World world;
    make_world(world, open_level(), l);
    world.player.aim = 0.0f;
    Enemy& front = add_enemy(world, world.player.pos + glm::vec2{40.0f, 0.0f}, PI);
    Enemy& back = add_enemy(world, world.player.pos - glm::vec2{40.0f, 0.0f}, 0.0f);
    start_melee(world);
    CHECK(front.health == doctest::Approx(ENEMY_STANDARD_HEALTH - SHIELD_BASH_DAMAGE));
    CHECK(front.stun_timer == doctest::Approx(SHIELD_BASH_STUN));
    CHECK(back.health == ENEMY_STANDARD_HEALTH);
    CHECK(world.player.melee_cooldown == doctest::Approx(SHIELD_BASH_COOLDOWN));
    CHECK_FALSE(world.swing.active);
}

TEST_CASE("flash duration depends on facing") {
    CHECK(flash_duration(0.0f, {0.0f, 0.0f}, {100.0f, 0.0f}) == doctest::Approx(FLASH_MAX_SECONDS));
    CHECK(flash_duration(PI, {0.0f, 0.0f}, {100.0f, 0.0f}) == doctest::Approx(FLASH_MIN_SECONDS));
}

TEST_CASE("a flashbang stuns and confuses enemies in sight") {
    World world;
    make_world(world, open_level());
    Enemy& e = add_enemy(world, {600.0f, 360.0f}, PI);
    e.alert = true;
    e.state = AiState::Alert;
    flash(world, {560.0f, 360.0f}, 280.0f);
    CHECK(e.stun_timer == doctest::Approx(FLASH_MAX_SECONDS));
    CHECK_FALSE(e.alert);
    CHECK(e.state == AiState::Searching);
}
