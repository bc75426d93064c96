#ifndef SRC_PACKET_P_IN_H_
#define SRC_PACKET_P_IN_H_

#include <string>

#include "game/config.h"
#include "packet/p_base.h"

// Client -> server messages. The server decodes them, the client encodes them.

struct packet_join {
  std::string name;
  bool has_name = false;  // "name" present, even if empty
  std::string color = default_color;
  bool reconnect = false;
  uint32_t last_score = 0;
  int last_length = WorldConfig::base_length;
  player_id_t previous_id = 0;

  static const char *const default_color;
};

struct packet_input {
  float dx = 0.0f;
  float dy = 0.0f;
};

struct packet_chat_in {
  std::string text;
};

struct packet_in {
  in_packet_t type = in_packet_t_unknown;
  std::string type_name;

  packet_join join;
  packet_input input;
  packet_chat_in chat;
};

// Throws protocol_error on anything that is not a usable message object.
// Unknown "type" values decode to in_packet_t_unknown.
packet_in decode_packet(const std::string &frame);

// Parses a server frame for clients; throws protocol_error like decode_packet.
json parse_frame(const std::string &frame);

std::ostream &operator<<(std::ostream &out, const packet_join &p);
std::ostream &operator<<(std::ostream &out, const packet_input &p);
std::ostream &operator<<(std::ostream &out, const packet_chat_in &p);

#endif  // SRC_PACKET_P_IN_H_
