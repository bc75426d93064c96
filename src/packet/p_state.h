#ifndef SRC_PACKET_P_STATE_H_
#define SRC_PACKET_P_STATE_H_

#include <string>

#include "game/world.h"
#include "packet/p_base.h"

// Full world snapshot. The world is serialized once in the constructor;
// each recipient only changes player_id before the packet is written.
struct packet_state_update : public PacketBase {
  packet_state_update() : PacketBase(packet_t_state_update) {}
  explicit packet_state_update(const World &w);

  player_id_t player_id = 0;
  std::string members;  // "foods":...,"snakes":...,"world_size":...
};

json snake_to_json(const Snake &s);

std::ostream &operator<<(std::ostream &out, const packet_state_update &p);

#endif  // SRC_PACKET_P_STATE_H_
