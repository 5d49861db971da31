#pragma once

#include <glm/glm.hpp>
#include <string>
#include <vector>

struct World;

enum class NetMessageType {
    FireWeapon,
    PlayerUpdate,
    PlayerHit,
    DropWeapon,
    PickupWeapon,
    BuyWeapon,
    StartRound
};

struct NetMessage {
    NetMessageType type{NetMessageType::PlayerUpdate};
    std::string sender;
    std::string target; // empty is broadcast
    glm::vec2 pos{0.0f, 0.0f};
    float aim{0.0f};
    float health{0.0f};
    float damage{0.0f};
    std::string weapon;
    int round{0};
};

// Non-authoritative view of another peer, eased toward its latest sample.
struct RemotePeer {
    std::string id;
    glm::vec2 pos{0.0f, 0.0f};
    glm::vec2 target_pos{0.0f, 0.0f};
    float aim{0.0f};
    float health{100.0f};
    float radius{10.0f};
    std::string weapon;
};

struct NetState {
    std::string local_id{"local"};
    std::vector<NetMessage> outbox;
    std::vector<RemotePeer> peers;
    float update_timer{0.0f};
    int round{0};
};

// Transport seam. Implementations may throw std::exception on failure.
class NetTransport {
  public:
    virtual ~NetTransport() = default;
    virtual void send(const NetMessage& msg) = 0;
    virtual std::vector<NetMessage> poll() = 0;
};

const char* net_message_name(NetMessageType t);

void net_emit(World& world, NetMessage msg);
RemotePeer* find_peer(World& world, const std::string& id);
// Applies one inbound message if it is addressed to the local actor. Returns true when applied.
bool apply_net_message(World& world, const NetMessage& msg);
void sim_remote_peers(World& world, float dt);
// Emits player-update at the configured interval.
void net_tick(World& world, float dt);

// Drains the outbox into `transport`; failures are logged and dropped.
void flush_outbox(World& world, NetTransport* transport);
// Polls `transport` and applies what it returns; failures are logged.
void pump_inbound(World& world, NetTransport* transport);
