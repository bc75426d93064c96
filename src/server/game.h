#ifndef SRC_SERVER_GAME_H_
#define SRC_SERVER_GAME_H_

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "server/config.h"
#include "server/server.h"
#include "server/session.h"

#include "game/world.h"

#include "packet/frame_reader.h"
#include "packet/p_all.h"

class GameServer {
 public:
  GameServer();
  ~GameServer();

  // Blocks until SIGINT or SIGTERM.
  int Run(IncomingConfig in_config);

  // Binds, then starts the accept and driver threads and returns.
  // Throws boost::system::system_error when the port is taken.
  void Start(IncomingConfig in_config);

  // Stops accepting, stops the driver, closes every connection and
  // waits for the handler threads to finish.
  void Stop();

  uint16_t get_port() const { return endpoint.get_port(); }
  size_t CountSessions() const;
  Endpoint &get_endpoint() { return endpoint; }

 private:
  void on_accept(tcp::socket socket);
  void HandleConnection(Connection::Ptr con);
  player_id_t AcceptPlayer(const Connection::Ptr &con, FrameReader *reader);
  void ReceiveLoop(const Session::Ptr &s, FrameReader *reader);
  bool ReadFrame(Connection &con, FrameReader *reader, std::string *frame, error_code &ec);
  void on_message(const Session::Ptr &s, const packet_in &in);
  void on_close(Connection::Ptr con, player_id_t id);

  void DriverLoop();
  void on_timer(long now);
  void ApplySessionEvents(long now);
  void ApplyInputs();
  void BroadcastUpdates();
  void BroadcastChat(const packet_chat &p);

  long GetCurrentTime();
  void PrintWorldInfo();

 private:
  template <typename T>
  void send(const Connection::Ptr &con, const T &packet) {
    if (verbose) {
      std::ostringstream out;
      out << packet;
      std::string frame = out.str();
      if (!frame.empty()) frame.pop_back();
      endpoint.get_alog().write(alevel::devel, std::string(COLOR_GREEN COLOR_BOLD ">>> SEND" COLOR_RESET " ") +
                                                   con->get_remote() + " " + frame);
    }
    endpoint.send(con, packet);
  }

  Endpoint endpoint;

  World world;
  IncomingConfig config;
  bool verbose = false;

  IdentityRegistry identities;
  std::unique_ptr<SessionRegistry> sessions;

  std::thread io_thread;
  std::thread driver_thread;
  std::atomic<bool> running;
  bool started = false;
  uint64_t ticks = 0;

  std::mutex driver_mutex;
  std::condition_variable driver_cv;

  // Every accepted connection until its handler thread is done with it.
  std::mutex handlers_mutex;
  std::condition_variable handlers_cv;
  std::map<uint64_t, Connection::Ptr> connections;
  uint64_t next_connection_id = 1;
};

#endif  // SRC_SERVER_GAME_H_
