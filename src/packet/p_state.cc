#include "packet/p_state.h"

json snake_to_json(const Snake &s) {
  json segments = json::array();
  for (const Body &b : s.parts) {
    segments.push_back(json::array({b.x, b.y}));
  }

  json j = json::object();
  j["id"] = s.id;
  j["name"] = s.name;
  j["color"] = s.color;
  j["segments"] = std::move(segments);
  j["score"] = s.score;
  j["alive"] = s.alive;
  return j;
}

packet_state_update::packet_state_update(const World &w) : PacketBase(packet_t_state_update) {
  json snakes = json::array();
  for (const auto &pair : w.GetSnakes()) {
    snakes.push_back(snake_to_json(*pair.second));
  }

  json foods = json::array();
  for (const Food &f : w.GetFood()) {
    foods.push_back(json::array({f.x, f.y}));
  }

  json state = json::object();
  state["snakes"] = std::move(snakes);
  state["foods"] = std::move(foods);
  state["world_size"] = w.GetConfig().world_size;

  // strip the braces, player_id goes in front per recipient
  const std::string dump = state.dump();
  members = dump.substr(1, dump.size() - 2);
}

std::ostream &operator<<(std::ostream &out, const packet_state_update &p) {
  out << "{\"type\":\"" << packet_type_name(p.packet_type) << "\",\"state\":{\"player_id\":"
      << p.player_id;
  if (!p.members.empty()) {
    out << ',' << p.members;
  }
  return out << "}}\n";
}
