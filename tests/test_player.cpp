#include <doctest/doctest.h>

#include "combat.hpp"
#include "player.hpp"
#include "test_support.hpp"

static void run_player(World& world, const PlayerCommands& cmd, float seconds) {
    const float dt = 1.0f / 60.0f;
    for (float t = 0.0f; t < seconds; t += dt) {
        world.now += static_cast<double>(dt);
        sim_player(world, cmd, dt);
    }
}

static WeaponDef rifle_def() {
    WeaponDef d{};
    d.name = "Rifle";
    d.fire = FireKind::Hitscan;
    d.mag_size = 12;
    d.reserve = 48;
    d.reload_time = 1.5f;
    return d;
}

TEST_CASE("reload moves only what the magazine needs") {
    Weapon w = make_weapon(rifle_def(), {});
    w.mag = 5;
    REQUIRE(start_reload(w));
    CHECK_FALSE(start_reload(w));
    finish_reload(w);
    CHECK(w.mag == 12);
    CHECK(w.reserve == 41);
    CHECK_FALSE(w.reloading);

    w.mag = 2;
    w.reserve = 3;
    REQUIRE(start_reload(w));
    finish_reload(w);
    CHECK(w.mag == 5);
    CHECK(w.reserve == 0);
    CHECK_FALSE(start_reload(w));
}

TEST_CASE("a full magazine does not reload") {
    Weapon w = make_weapon(rifle_def(), {});
    CHECK_FALSE(start_reload(w));
}

TEST_CASE("reload completes after the reload time") {
    Loadout l{};
    World world;
    make_world(world, open_level(), l);
    world.player.weapons = {make_weapon(rifle_def(), {})};
    Weapon& w = world.player.weapons[0];
    w.mag = 0;
    PlayerCommands cmd = idle_commands(world);
    cmd.reload = true;
    sim_player(world, cmd, 1.0f / 60.0f);
    REQUIRE(w.reloading);
    cmd.reload = false;
    run_player(world, cmd, 1.0f);
    CHECK(w.mag == 0);
    run_player(world, cmd, 0.6f);
    CHECK(w.mag == 12);
    CHECK(w.reserve == 36);
}

TEST_CASE("healing at full health is a no-op") {
    Loadout l{};
    l.medkits = 2;
    World world;
    make_world(world, open_level(), l);
    CHECK_FALSE(start_heal(world));
    CHECK(world.player.medkits == 2);
    CHECK_FALSE(world.player.healing);
}

TEST_CASE("healing restores health after the channel") {
    Loadout l{};
    l.medkits = 1;
    World world;
    make_world(world, open_level(), l);
    world.player.health = 30.0f;
    PlayerCommands cmd = idle_commands(world);
    cmd.heal = true;
    run_player(world, cmd, HEAL_CHANNEL_SECONDS - 0.1f);
    CHECK(world.player.health == 30.0f);
    run_player(world, cmd, 0.2f);
    CHECK(world.player.health == doctest::Approx(30.0f + HEAL_AMOUNT));
    CHECK(world.player.medkits == 0);
    CHECK_FALSE(world.player.healing);
}

TEST_CASE("moving interrupts healing") {
    Loadout l{};
    l.medkits = 1;
    World world;
    make_world(world, open_level(), l);
    world.player.health = 30.0f;
    REQUIRE(start_heal(world));
    PlayerCommands cmd = idle_commands(world);
    cmd.move = {1.0f, 0.0f};
    sim_player(world, cmd, 1.0f / 60.0f);
    CHECK_FALSE(world.player.healing);
    CHECK(world.player.medkits == 1);
}

TEST_CASE("taking damage interrupts healing") {
    Loadout l{};
    l.medkits = 1;
    World world;
    make_world(world, open_level(), l);
    world.player.health = 30.0f;
    REQUIRE(start_heal(world));
    damage_player(world, 5.0f, world.player.pos + glm::vec2{50.0f, 0.0f});
    CHECK_FALSE(world.player.healing);
}

TEST_CASE("takedown from behind kills an unaware enemy") {
    World world;
    make_world(world, open_level());
    Enemy& e = add_enemy(world, {400.0f, 360.0f}, 0.0f);
    world.player.pos = {400.0f - 12.0f - 10.0f - 5.0f, 360.0f};
    CHECK(try_takedown(world));
    CHECK(e.health == 0.0f);
}

TEST_CASE("takedown needs the enemy to face away and be unaware") {
    World world;
    make_world(world, open_level());
    Enemy& facing = add_enemy(world, {400.0f, 360.0f}, PI);
    world.player.pos = {373.0f, 360.0f};
    CHECK_FALSE(try_takedown(world));
    CHECK(facing.health == ENEMY_STANDARD_HEALTH);

    facing.facing = 0.0f;
    facing.alert = true;
    CHECK_FALSE(try_takedown(world));
    CHECK(facing.health == ENEMY_STANDARD_HEALTH);
}

TEST_CASE("double tapping interact toggles the nearest door") {
    LevelDef level = open_level();
    DoorDef d{};
    d.id = 3;
    d.hinge = {600.0f / WORLD_WIDTH, 300.0f / WORLD_HEIGHT};
    d.length = 100.0f / WORLD_HEIGHT;
    d.closed_angle = PI / 2.0f;
    level.doors.push_back(d);
    World world;
    make_world(world, level);
    world.player.pos = {580.0f, 350.0f};

    PlayerCommands press = idle_commands(world);
    press.interact = true;
    PlayerCommands release = idle_commands(world);

    world.now = 1.0;
    sim_player(world, press, 1.0f / 60.0f);
    CHECK(world.doors[0].held);
    world.now += 0.05;
    sim_player(world, release, 1.0f / 60.0f);
    world.now += 0.05;
    sim_player(world, press, 1.0f / 60.0f);
    CHECK(world.doors[0].target_angle.has_value());
}

TEST_CASE("holding interact pushes the door away from the player") {
    LevelDef level = open_level();
    DoorDef d{};
    d.id = 3;
    d.hinge = {600.0f / WORLD_WIDTH, 300.0f / WORLD_HEIGHT};
    d.length = 100.0f / WORLD_HEIGHT;
    d.closed_angle = PI / 2.0f;
    d.max_open_angle = PI / 2.0f;
    d.swing_direction = 1;
    level.doors.push_back(d);
    World world;
    make_world(world, level);
    world.player.pos = {580.0f, 350.0f};
    PlayerCommands cmd = idle_commands(world);
    cmd.interact = true;
    sim_player(world, cmd, 1.0f / 60.0f);
    const Door& door = world.doors[0];
    REQUIRE(door.held);
    // Leaf pointing +y with the player on the -x side: pushing swings the end toward +x.
    glm::vec2 end_now = door_end(door);
    glm::vec2 end_next = door_end(door, door.angle + door.angular_vel * 0.1f);
    CHECK(end_next.x > end_now.x);
}

TEST_CASE("a charged shot scales the homing range") {
    WeaponDef seeker{};
    seeker.name = "Seeker";
    seeker.projectile = ProjectileKind::Homing;
    seeker.charge_time = 1.0f;
    seeker.min_range = 200.0f;
    seeker.max_range = 600.0f;
    seeker.bullet_speed = 400.0f;
    World world;
    make_world(world, open_level());
    world.player.weapons = {make_weapon(seeker, {})};

    PlayerCommands hold = idle_commands(world);
    hold.fire = true;
    run_player(world, hold, 0.5f);
    CHECK(world.bullets.count() == 0);
    CHECK(world.player.weapons[0].charging);

    sim_player(world, idle_commands(world), 1.0f / 60.0f);
    REQUIRE(world.bullets.count() == 1);
    for (auto const& b : world.bullets.data()) {
        if (b.active)
            CHECK(b.max_range == doctest::Approx(400.0f).epsilon(0.05));
    }
}

TEST_CASE("semi-automatic weapons need a fresh press per shot") {
    World world;
    make_world(world, open_level());
    WeaponDef d = default_weapon_def();
    d.fire_rate = 0.01f;
    world.player.weapons = {make_weapon(d, {})};
    PlayerCommands hold = idle_commands(world);
    hold.fire = true;
    run_player(world, hold, 0.5f);
    CHECK(world.bullets.count() == 1);
}

TEST_CASE("holding a grenade too long detonates it in hand") {
    Loadout l{};
    l.throwables = {1, 0, 0, 0};
    World world;
    make_world(world, open_level(), l);
    Enemy& e = add_enemy(world, world.player.pos + glm::vec2{50.0f, 0.0f}, 0.0f);
    PlayerCommands hold = idle_commands(world);
    hold.throw_held = true;
    run_player(world, hold, throwable_def(world, ThrowableKind::Grenade).fuse + 0.1f);
    CHECK(world.player.throwables[0] == 0);
    CHECK(world.player.health < PLAYER_MAX_HEALTH);
    CHECK(e.health < ENEMY_STANDARD_HEALTH);
}

TEST_CASE("releasing a cooked grenade throws it with the remaining fuse") {
    Loadout l{};
    l.throwables = {1, 0, 0, 0};
    World world;
    make_world(world, open_level(), l);
    PlayerCommands hold = idle_commands(world);
    hold.throw_held = true;
    hold.aim_point = world.player.pos + glm::vec2{200.0f, 0.0f};
    run_player(world, hold, 1.0f);
    PlayerCommands release = hold;
    release.throw_held = false;
    sim_player(world, release, 1.0f / 60.0f);
    REQUIRE(world.throwables.count() == 1);
    for (auto const& t : world.throwables.data()) {
        if (!t.active)
            continue;
        CHECK(t.fuse < throwable_def(world, ThrowableKind::Grenade).fuse - 0.9f);
        CHECK(t.vel.x == doctest::Approx(10.0f));
    }
    CHECK(world.player.throwables[0] == 0);
}
