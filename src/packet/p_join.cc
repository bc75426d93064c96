#include "packet/p_join.h"

std::ostream &operator<<(std::ostream &out, const packet_join_ack &p) {
  json j = p.header();
  j["player_id"] = p.player_id;
  return write_frame(out, j);
}
