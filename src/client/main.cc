#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iostream>
#include <string>

#include <boost/program_options.hpp>

#include "client/client.h"

namespace po = boost::program_options;

static std::atomic<bool> interrupted(false);

static void on_signal(int) {
  interrupted = true;
}

struct BotConfig {
  bool help = false;
  std::string host = "127.0.0.1";
  uint16_t port = 5000;
  std::string name = "snake_bot";
  std::string color = packet_join::default_color;
  bool tls = true;
  float turn_rate = 0.05f;  // radians per input
  long input_ms = 150;
};

static BotConfig ParseBotCommandLine(const int argc, const char *const *argv) {
  BotConfig config;

  po::options_description options("Bot options");
  options.add_options()
      ("help,h", po::bool_switch(&config.help), "print help message")
      ("host", po::value<std::string>(&config.host)->default_value(config.host), "server host")
      ("port,p", po::value<uint16_t>(&config.port)->default_value(config.port), "server port")
      ("name,n", po::value<std::string>(&config.name)->default_value(config.name), "player name")
      ("color", po::value<std::string>(&config.color)->default_value(config.color),
       "snake color")
      ("tls", po::value<bool>(&config.tls)->default_value(config.tls),
       "try TLS before plain TCP")
      ("turn_rate", po::value<float>(&config.turn_rate)->default_value(config.turn_rate),
       "heading change per input")
      ("input_ms", po::value<long>(&config.input_ms)->default_value(config.input_ms),
       "interval between inputs");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, options), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    std::cerr << "error: " << e.what() << '\n';
    config.help = true;
  }

  if (config.help) {
    std::cerr << "Usage: snake_bot [OPTIONS]\n";
    std::cerr << options << '\n';
    exit(1);
  }
  return config;
}

static long now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

int main(const int argc, const char *const *argv) {
  const BotConfig config = ParseBotCommandLine(argc, argv);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  GameClient client;
  if (!client.Connect(config.host, config.port, config.tls, 10000)) {
    return 1;
  }

  packet_join join;
  join.name = config.name;
  join.color = config.color;
  const player_id_t id = client.Join(join, 10000);
  if (id == 0) {
    client.get_elog().write(elevel::fatal, "Join failed: " + client.get_error());
    return 1;
  }

  float heading = 0.0f;
  long last_input = 0;
  long last_score = -1;

  while (!interrupted && client.is_connected()) {
    const long now = now_ms();
    if (now - last_input >= config.input_ms) {
      last_input = now;
      heading += config.turn_rate;
      if (!client.SendInput(std::cos(heading), std::sin(heading))) {
        break;
      }
    }

    json msg;
    try {
      if (!client.ReadPacket(&msg, 50)) {
        continue;
      }
    } catch (const protocol_error &e) {
      client.get_elog().write(elevel::warn, std::string("Bad message from server: ") + e.what());
      continue;
    }

    const std::string type = msg["type"].get<std::string>();
    if (type == "chat") {
      client.get_alog().write(alevel::app, msg.value("player_name", std::string("Unknown")) +
                                               ": " + msg.value("text", std::string()));
    } else if (type == "state_update") {
      for (const json &snake : msg["state"]["snakes"]) {
        if (snake.value("id", player_id_t(0)) != id) {
          continue;
        }
        const long score = snake.value("score", 0L);
        if (score != last_score) {
          last_score = score;
          client.get_alog().write(alevel::app, "Score: " + std::to_string(score));
        }
      }
    } else if (type == "error") {
      client.get_elog().write(elevel::warn, "Error from server: " + msg.value("message", std::string()));
    }
  }

  client.Close();
  client.get_alog().write(alevel::disconnect, "Disconnected from server");
  return 0;
}
