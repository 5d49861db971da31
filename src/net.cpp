#include "net.hpp"

#include "combat.hpp"
#include "world.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

const char* net_message_name(NetMessageType t) {
    switch (t) {
    case NetMessageType::FireWeapon:
        return "fire-weapon";
    case NetMessageType::PlayerUpdate:
        return "player-update";
    case NetMessageType::PlayerHit:
        return "player-hit";
    case NetMessageType::DropWeapon:
        return "drop-weapon";
    case NetMessageType::PickupWeapon:
        return "pickup-weapon";
    case NetMessageType::BuyWeapon:
        return "buy-weapon";
    case NetMessageType::StartRound:
        return "start-round";
    }
    return "unknown";
}

void net_emit(World& world, NetMessage msg) {
    msg.sender = world.net.local_id;
    world.net.outbox.push_back(std::move(msg));
}

RemotePeer* find_peer(World& world, const std::string& id) {
    for (auto& p : world.net.peers)
        if (p.id == id)
            return &p;
    return nullptr;
}

static void grant_weapon(World& world, const std::string& name) {
    const WeaponDef* def = nullptr;
    for (auto const& w : world.catalog)
        if (w.name == name)
            def = &w;
    if (!def) {
        std::fprintf(stderr, "[net] unknown weapon '%s'\n", name.c_str());
        return;
    }
    Player& p = world.player;
    for (size_t i = 0; i < p.weapons.size(); ++i) {
        if (p.weapons[i].stats.name == name) {
            // Already carried: top up the reserve.
            p.weapons[i].reserve += std::max(0, def->reserve);
            return;
        }
    }
    p.weapons.push_back(make_weapon(*def, {}));
}

bool apply_net_message(World& world, const NetMessage& msg) {
    NetState& net = world.net;
    if (msg.sender == net.local_id)
        return false;
    if (!msg.target.empty() && msg.target != net.local_id)
        return false;
    switch (msg.type) {
    case NetMessageType::PlayerUpdate: {
        RemotePeer* peer = find_peer(world, msg.sender);
        if (!peer) {
            RemotePeer np{};
            np.id = msg.sender;
            np.pos = msg.pos;
            net.peers.push_back(np);
            peer = &net.peers.back();
        }
        peer->target_pos = msg.pos;
        peer->aim = msg.aim;
        peer->health = std::max(0.0f, msg.health);
        if (!msg.weapon.empty())
            peer->weapon = msg.weapon;
        return true;
    }
    case NetMessageType::PlayerHit:
        if (msg.target != net.local_id)
            return false;
        damage_player(world, msg.damage, msg.pos);
        return true;
    case NetMessageType::FireWeapon:
        emit_sound(world, msg.pos, 300.0f, SHOOT_SOUND_LIFETIME, SoundType::PlayerShoot);
        add_light(world, msg.pos, 60.0f, 1.0f, MUZZLE_LIGHT_TTL, LightKind::Muzzle);
        return true;
    case NetMessageType::DropWeapon:
        if (RemotePeer* peer = find_peer(world, msg.sender))
            peer->weapon.clear();
        return true;
    case NetMessageType::PickupWeapon:
    case NetMessageType::BuyWeapon:
        if (msg.target != net.local_id)
            return false;
        grant_weapon(world, msg.weapon);
        return true;
    case NetMessageType::StartRound:
        net.round = msg.round;
        world.player.pos = msg.pos;
        world.player.health = world.player.max_health;
        world.game_over = false;
        return true;
    }
    return false;
}

void sim_remote_peers(World& world, float dt) {
    float k = std::min(1.0f, dt * REMOTE_LERP_RATE);
    for (auto& p : world.net.peers)
        p.pos += (p.target_pos - p.pos) * k;
}

void net_tick(World& world, float dt) {
    NetState& net = world.net;
    net.update_timer -= dt;
    if (net.update_timer > 0.0f)
        return;
    net.update_timer = world.settings.net_update_interval;
    const Player& p = world.player;
    NetMessage m{};
    m.type = NetMessageType::PlayerUpdate;
    m.pos = p.pos;
    m.aim = p.aim;
    m.health = p.health;
    if (!p.weapons.empty())
        m.weapon = p.weapons[static_cast<size_t>(std::clamp(p.active_weapon, 0, static_cast<int>(p.weapons.size()) - 1))].stats.name;
    net_emit(world, m);
}

void flush_outbox(World& world, NetTransport* transport) {
    if (!transport) {
        world.net.outbox.clear();
        return;
    }
    for (auto const& m : world.net.outbox) {
        try {
            transport->send(m);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[net] send failed (%s): %s\n", net_message_name(m.type), e.what());
        }
    }
    world.net.outbox.clear();
}

void pump_inbound(World& world, NetTransport* transport) {
    if (!transport)
        return;
    std::vector<NetMessage> in;
    try {
        in = transport->poll();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "[net] receive failed: %s\n", e.what());
        return;
    }
    for (auto const& m : in)
        apply_net_message(world, m);
}
