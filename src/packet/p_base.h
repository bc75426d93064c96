#ifndef SRC_PACKET_P_BASE_H_
#define SRC_PACKET_P_BASE_H_

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

typedef nlohmann::json json;

enum in_packet_t : uint8_t {
  in_packet_t_unknown = 0,
  in_packet_t_join,
  in_packet_t_input,
  in_packet_t_chat,
};

enum out_packet_t : uint8_t {
  packet_t_join_ack = 0,
  packet_t_chat,
  packet_t_state_update,
  packet_t_error,
};

// Malformed frame: bad JSON, wrong field types, missing "type".
class protocol_error : public std::runtime_error {
 public:
  explicit protocol_error(const std::string &what) : std::runtime_error(what) {}
};

struct PacketBase {
  out_packet_t packet_type;

  explicit PacketBase(out_packet_t t) : packet_type(t) {}

  // Starts the JSON object every outgoing packet is built from.
  json header() const;
};

const char *packet_type_name(out_packet_t t);
in_packet_t packet_type_from_name(const std::string &name);

// One frame on the wire: the object and its trailing newline.
// Callers hand the whole frame to a single write call.
std::ostream &write_frame(std::ostream &out, const json &j);

#endif  // SRC_PACKET_P_BASE_H_
