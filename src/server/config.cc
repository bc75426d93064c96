#include "server/config.h"

#include <cstdlib>
#include <iostream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

static const char *const version_string = "funsnakes_server 1.0";

IncomingConfig ParseCommandLine(const int argc, const char *const *argv) {
  IncomingConfig config;

  po::options_description generic("Generic options");
  generic.add_options()("help,h", po::bool_switch(&config.help),
                        "print help message")(
      "verbose,v", po::bool_switch(&config.verbose), "log every message")(
      "version", po::bool_switch(&config.version), "show version information")(
      "port,p", po::value<uint16_t>(&config.port)->default_value(config.port),
      "bind port")("debug,d",
                   po::bool_switch(&config.debug)->default_value(config.debug),
                   "enable debug mode");

  po::options_description server("Server");
  server.add_options()
      ("max_players,m",
       po::value<uint16_t>(&config.max_players)->default_value(config.max_players),
       "maximum concurrent players")
      ("tls", po::value<bool>(&config.tls)->default_value(config.tls),
       "wrap connections in TLS (falls back to plain without a certificate)")
      ("cert", po::value<std::string>(&config.cert_file)->default_value(config.cert_file),
       "TLS certificate chain (PEM)")
      ("key", po::value<std::string>(&config.key_file)->default_value(config.key_file),
       "TLS private key (PEM)")
      ("tick_ms", po::value<long>(&config.tick_ms)->default_value(config.tick_ms),
       "simulation tick period")
      ("broadcast_every",
       po::value<uint16_t>(&config.broadcast_every)->default_value(config.broadcast_every),
       "ticks between state broadcasts");

  po::options_description world("World");
  world.add_options()
      ("world_size", po::value<uint16_t>(&config.world.world_size)
                        ->default_value(config.world.world_size),
       "side of the wrap-around arena")
      ("food", po::value<uint16_t>(&config.world.food_count)
                  ->default_value(config.world.food_count),
       "food items kept in the arena")
      ("respawn_ms", po::value<long>(&config.world.respawn_delay_ms)
                        ->default_value(config.world.respawn_delay_ms),
       "delay between death and respawn")
      ("grace_ms", po::value<long>(&config.world.grace_period_ms)
                      ->default_value(config.world.grace_period_ms),
       "spawn protection against collisions")
      ("kill_bonus", po::value<uint16_t>(&config.world.kill_bonus)
                        ->default_value(config.world.kill_bonus),
       "score awarded for a kill")
      ("seed", po::value<uint32_t>(&config.world.seed)->default_value(config.world.seed),
       "random seed, 0 = time based");

  po::options_description cmdline_options;
  cmdline_options.add(generic).add(server).add(world);

  po::variables_map vm;

  try {
    po::store(po::parse_command_line(argc, argv, cmdline_options), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "error: " << e.what() << '\n';
    config.help = true;
  }

  if (!config.help && config.world.world_size < 1000) {
    std::cerr << "error: world_size must be at least 1000\n";
    config.help = true;
  }
  if (!config.help && (config.tick_ms <= 0 || config.broadcast_every == 0 ||
                       config.max_players == 0)) {
    std::cerr << "error: tick_ms, broadcast_every and max_players must be positive\n";
    config.help = true;
  }

  if (config.version) {
    std::cout << version_string << '\n';
    exit(0);
  }

  if (config.help) {
    std::cerr << "Usage: funsnakes_server [OPTIONS]\n";
    std::cerr << cmdline_options << '\n';
    exit(1);
  }

  return config;
}
