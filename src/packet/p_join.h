#ifndef SRC_PACKET_P_JOIN_H_
#define SRC_PACKET_P_JOIN_H_

#include "game/config.h"
#include "packet/p_base.h"

// Reply to a successful join, carries the id the player now owns.
struct packet_join_ack : public PacketBase {
  packet_join_ack() : PacketBase(packet_t_join_ack) {}
  explicit packet_join_ack(player_id_t id) : PacketBase(packet_t_join_ack), player_id(id) {}

  player_id_t player_id = 0;
};

std::ostream &operator<<(std::ostream &out, const packet_join_ack &p);

#endif  // SRC_PACKET_P_JOIN_H_
