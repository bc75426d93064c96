#include "packet/p_in.h"

#include <cmath>
#include <limits>

const char *const packet_join::default_color = "#ff0000";

static double read_number(const json &j, const char *key, double def) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return def;
  }
  if (!it->is_number()) {
    throw protocol_error(std::string("field '") + key + "' is not a number");
  }
  return it->get<double>();
}

static std::string read_string(const json &j, const char *key, const std::string &def) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return def;
  }
  if (!it->is_string()) {
    throw protocol_error(std::string("field '") + key + "' is not a string");
  }
  return it->get<std::string>();
}

static bool read_flag(const json &j, const char *key) {
  const auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return false;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_number()) {
    return it->get<double>() != 0;
  }
  throw protocol_error(std::string("field '") + key + "' is not a flag");
}

// Direction components must survive the narrowing to float.
static float read_direction(const json &j, const char *key) {
  const double v = read_number(j, key, 0);
  if (!std::isfinite(v) || std::fabs(v) > std::numeric_limits<float>::max()) {
    throw protocol_error(std::string("field '") + key + "' is out of range");
  }
  return static_cast<float>(v);
}

template <typename T>
static T clamp_to(double v) {
  if (v <= 0) {
    return 0;
  }
  if (v >= static_cast<double>(std::numeric_limits<T>::max())) {
    return std::numeric_limits<T>::max();
  }
  return static_cast<T>(v);
}

json parse_frame(const std::string &frame) {
  json j;
  try {
    j = json::parse(frame);
  } catch (const json::parse_error &e) {
    throw protocol_error(std::string("malformed JSON: ") + e.what());
  }

  if (!j.is_object()) {
    throw protocol_error("frame is not a JSON object");
  }

  const auto type_i = j.find("type");
  if (type_i == j.end() || !type_i->is_string()) {
    throw protocol_error("missing message type");
  }
  return j;
}

packet_in decode_packet(const std::string &frame) {
  const json j = parse_frame(frame);

  packet_in p;
  p.type_name = j["type"].get<std::string>();
  p.type = packet_type_from_name(p.type_name);

  switch (p.type) {
    case in_packet_t_join:
      p.join.has_name = j.find("name") != j.end() && !j["name"].is_null();
      p.join.name = read_string(j, "name", "");
      p.join.color = read_string(j, "color", packet_join::default_color);
      p.join.reconnect = read_flag(j, "reconnect");
      p.join.last_score = clamp_to<uint32_t>(read_number(j, "last_score", 0));
      p.join.last_length = static_cast<int>(
          clamp_to<uint16_t>(read_number(j, "last_length", WorldConfig::base_length)));
      p.join.previous_id = clamp_to<player_id_t>(read_number(j, "previous_id", 0));
      break;

    case in_packet_t_input:
      p.input.dx = read_direction(j, "dx");
      p.input.dy = read_direction(j, "dy");
      break;

    case in_packet_t_chat:
      p.chat.text = read_string(j, "text", "");
      break;

    case in_packet_t_unknown:
      break;
  }

  return p;
}

std::ostream &operator<<(std::ostream &out, const packet_join &p) {
  json j = json::object();
  j["type"] = "join";
  if (p.has_name || !p.name.empty()) {
    j["name"] = p.name;
  }
  j["color"] = p.color;
  if (p.reconnect) {
    j["reconnect"] = true;
    j["last_score"] = p.last_score;
    j["last_length"] = p.last_length;
    if (p.previous_id != 0) {
      j["previous_id"] = p.previous_id;
    }
  }
  return write_frame(out, j);
}

std::ostream &operator<<(std::ostream &out, const packet_input &p) {
  json j = json::object();
  j["type"] = "input";
  j["dx"] = p.dx;
  j["dy"] = p.dy;
  return write_frame(out, j);
}

std::ostream &operator<<(std::ostream &out, const packet_chat_in &p) {
  json j = json::object();
  j["type"] = "chat";
  j["text"] = p.text;
  return write_frame(out, j);
}
