#ifndef SRC_PACKET_P_CHAT_H_
#define SRC_PACKET_P_CHAT_H_

#include <string>

#include "game/config.h"
#include "packet/p_base.h"

// Chat line relayed to every connection.
struct packet_chat : public PacketBase {
  packet_chat() : PacketBase(packet_t_chat) {}
  packet_chat(player_id_t id, const std::string &name, const std::string &msg)
      : PacketBase(packet_t_chat), player_id(id), player_name(name), text(msg) {}

  player_id_t player_id = 0;
  std::string player_name;
  std::string text;
};

std::ostream &operator<<(std::ostream &out, const packet_chat &p);

#endif  // SRC_PACKET_P_CHAT_H_
