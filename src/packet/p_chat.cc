#include "packet/p_chat.h"

std::ostream &operator<<(std::ostream &out, const packet_chat &p) {
  json j = p.header();
  j["player_id"] = p.player_id;
  j["player_name"] = p.player_name;
  j["text"] = p.text;
  return write_frame(out, j);
}
