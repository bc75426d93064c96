#ifndef SRC_SERVER_CONFIG_H_
#define SRC_SERVER_CONFIG_H_

#include <cstdint>
#include <string>

#include "game/config.h"

struct IncomingConfig {
  bool help = false;
  bool verbose = false;
  bool version = false;
  bool debug = false;

  uint16_t port = 5000;
  uint16_t max_players = 20;

  // TLS on by default; without a loadable cert/key the server runs plain.
  bool tls = true;
  std::string cert_file = "server.crt";
  std::string key_file = "server.key";

  // Driver pacing
  long tick_ms = 15;
  uint16_t broadcast_every = 3;  // ticks between state_update broadcasts

  WorldConfig world;
};

// Exits the process on --help, --version and invalid options.
IncomingConfig ParseCommandLine(const int argc, const char *const *argv);

#endif  // SRC_SERVER_CONFIG_H_
