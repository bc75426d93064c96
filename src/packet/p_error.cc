#include "packet/p_error.h"

const char *const packet_error::server_full = "Server is full";
const char *const packet_error::invalid_join = "Invalid join message";

std::ostream &operator<<(std::ostream &out, const packet_error &p) {
  json j = p.header();
  j["message"] = p.message;
  return write_frame(out, j);
}
