#include "packet/p_base.h"

json PacketBase::header() const {
  json j = json::object();
  j["type"] = packet_type_name(packet_type);
  return j;
}

const char *packet_type_name(out_packet_t t) {
  switch (t) {
    case packet_t_join_ack:
      return "join_ack";
    case packet_t_chat:
      return "chat";
    case packet_t_state_update:
      return "state_update";
    case packet_t_error:
      return "error";
  }
  return "unknown";
}

in_packet_t packet_type_from_name(const std::string &name) {
  if (name == "join") return in_packet_t_join;
  if (name == "input") return in_packet_t_input;
  if (name == "chat") return in_packet_t_chat;
  return in_packet_t_unknown;
}

std::ostream &write_frame(std::ostream &out, const json &j) {
  return out << j.dump() << '\n';
}
