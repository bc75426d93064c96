#ifndef SRC_PACKET_P_ERROR_H_
#define SRC_PACKET_P_ERROR_H_

#include <string>

#include "packet/p_base.h"

struct packet_error : public PacketBase {
  packet_error() : PacketBase(packet_t_error) {}
  explicit packet_error(const std::string &msg) : PacketBase(packet_t_error), message(msg) {}

  std::string message;

  static const char *const server_full;
  static const char *const invalid_join;
};

std::ostream &operator<<(std::ostream &out, const packet_error &p);

#endif  // SRC_PACKET_P_ERROR_H_
