#include "server/config.h"
#include "server/game.h"

int main(const int argc, const char *const *argv) {
  GameServer server;
  return server.Run(ParseCommandLine(argc, argv));
}
