#include "server/game.h"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <sstream>
#include <vector>

GameServer::GameServer() : world(&endpoint.get_alog()), running(false) {}

GameServer::~GameServer() {
  Stop();
}

int GameServer::Run(IncomingConfig in_config) {
  try {
    Start(in_config);
  } catch (const boost::system::system_error &e) {
    endpoint.get_elog().write(elevel::fatal, std::string("Could not start server: ") + e.what());
    return 1;
  }

  boost::asio::io_context signals_io;
  boost::asio::signal_set signals(signals_io, SIGINT, SIGTERM);
  signals.async_wait([this](const error_code &ec, int signal_number) {
    if (!ec) {
      endpoint.get_alog().write(alevel::app,
                                "Caught signal " + std::to_string(signal_number) + ", shutting down");
    }
  });
  signals_io.run();

  Stop();
  endpoint.get_alog().write(alevel::app, "Server stopped");
  return 0;
}

void GameServer::Start(IncomingConfig in_config) {
  config = in_config;
  verbose = config.verbose;

  if (config.verbose) {
    endpoint.get_alog().set_channels(alevel::devel);
  }
  if (config.debug) {
    endpoint.get_elog().set_channels(elevel::devel);
  }

  world.Init(config.world);
  sessions.reset(new SessionRegistry(identities, config.max_players));

  if (config.tls && !endpoint.init_tls(config.cert_file, config.key_file)) {
    endpoint.get_elog().write(elevel::warn, "TLS unavailable, falling back to plain TCP");
  }

  endpoint.set_accept_handler([this](tcp::socket socket) { on_accept(std::move(socket)); });
  endpoint.listen(config.port);

  endpoint.get_alog().write(alevel::app, "Running snake server on port " +
                                             std::to_string(endpoint.get_port()) +
                                             (endpoint.get_tls_context() ? " (TLS)" : " (plain)"));
  PrintWorldInfo();

  running = true;
  started = true;
  io_thread = std::thread([this]() { endpoint.run(); });
  driver_thread = std::thread(&GameServer::DriverLoop, this);
}

void GameServer::Stop() {
  if (!started) {
    return;
  }
  started = false;

  running = false;
  endpoint.stop();
  if (io_thread.joinable()) {
    io_thread.join();
  }

  {
    std::lock_guard<std::mutex> lock(driver_mutex);
    driver_cv.notify_all();
  }
  if (driver_thread.joinable()) {
    driver_thread.join();
  }

  std::unique_lock<std::mutex> lock(handlers_mutex);
  for (auto &c : connections) {
    c.second->Close();
  }
  handlers_cv.wait(lock, [this]() { return connections.empty(); });
}

size_t GameServer::CountSessions() const {
  return sessions ? sessions->Count() : 0;
}

void GameServer::PrintWorldInfo() {
  std::stringstream s;
  s << "World info = \n" << world;
  endpoint.get_alog().write(alevel::app, s.str());
}

void GameServer::on_accept(tcp::socket socket) {
  Connection::Ptr con;
  {
    std::lock_guard<std::mutex> lock(handlers_mutex);
    if (!running) {
      return;
    }
    con = std::make_shared<Connection>(std::move(socket), endpoint.get_tls_context(),
                                       next_connection_id++);
    connections[con->get_id()] = con;
  }

  endpoint.get_alog().write(alevel::connect, "Client connected from " + con->get_remote());
  std::thread(&GameServer::HandleConnection, this, con).detach();
}

void GameServer::HandleConnection(Connection::Ptr con) {
  player_id_t id = 0;
  try {
    FrameReader reader;
    id = AcceptPlayer(con, &reader);
    if (id != 0) {
      const Session::Ptr s = sessions->Find(id);
      if (s) {
        ReceiveLoop(s, &reader);
      }
    }
  } catch (const protocol_error &e) {
    endpoint.get_elog().write(elevel::warn,
                              "Protocol error from " + con->get_remote() + ": " + e.what());
  } catch (const std::exception &e) {
    endpoint.get_elog().write(elevel::rerror,
                              "Error handling client " + con->get_remote() + ": " + e.what());
  }

  on_close(std::move(con), id);
}

player_id_t GameServer::AcceptPlayer(const Connection::Ptr &con, FrameReader *reader) {
  error_code ec;
  con->Handshake(ec);
  if (ec) {
    endpoint.get_elog().write(elevel::warn,
                              "TLS handshake failed with " + con->get_remote() + ": " + ec.message());
    return 0;
  }
  if (con->is_tls()) {
    endpoint.get_alog().write(alevel::devel, "TLS handshake successful with " + con->get_remote());
  }

  if (sessions->IsFull()) {
    endpoint.get_alog().write(alevel::app, "Rejecting " + con->get_remote() + ": server full");
    send(con, packet_error(packet_error::server_full));
    return 0;
  }

  std::string frame;
  if (!ReadFrame(*con, reader, &frame, ec)) {
    return 0;
  }

  packet_in in;
  try {
    in = decode_packet(frame);
  } catch (const protocol_error &e) {
    endpoint.get_elog().write(elevel::warn,
                              "Invalid join from " + con->get_remote() + ": " + e.what());
  }
  if (in.type != in_packet_t_join) {
    send(con, packet_error(packet_error::invalid_join));
    return 0;
  }

  const player_id_t id = sessions->Join(in.join, con);
  if (id == 0) {
    endpoint.get_alog().write(alevel::app, "Rejecting " + con->get_remote() + ": server full");
    send(con, packet_error(packet_error::server_full));
    return 0;
  }

  const Session::Ptr session = sessions->Find(id);
  if (!session) {
    return 0;
  }

  std::stringstream s;
  s << "Player " << id << " joined as '" << session->name << "' from " << con->get_remote();
  if (in.join.reconnect) {
    s << " (reconnect, score " << in.join.last_score << ", length " << in.join.last_length;
    if (in.join.previous_id != 0) {
      s << ", previous id " << in.join.previous_id;
    }
    s << ")";
  }
  endpoint.get_alog().write(alevel::app, s.str());

  send(con, packet_join_ack(id));
  session->ready = true;
  return id;
}

bool GameServer::ReadFrame(Connection &con, FrameReader *reader, std::string *frame,
                           error_code &ec) {
  char buf[4096];
  while (!reader->Next(frame)) {
    const size_t n = con.ReadSome(buf, sizeof(buf), ec);
    if (ec) {
      return false;
    }
    reader->Feed(buf, n);
  }
  return true;
}

void GameServer::ReceiveLoop(const Session::Ptr &s, FrameReader *reader) {
  std::string frame;
  error_code ec;

  while (ReadFrame(*s->connection, reader, &frame, ec)) {
    if (verbose) {
      endpoint.get_alog().write(alevel::devel, std::string(COLOR_CYAN COLOR_BOLD "<<< RECV" COLOR_RESET " player ") +
                                                   std::to_string(s->player_id) + " " + frame);
    }

    packet_in in;
    try {
      in = decode_packet(frame);
    } catch (const protocol_error &e) {
      endpoint.get_elog().write(elevel::warn, "Dropping message from player " +
                                                  std::to_string(s->player_id) + ": " + e.what());
      continue;
    }
    on_message(s, in);
  }

  if (ec != boost::asio::error::eof && !s->connection->is_closed()) {
    endpoint.get_elog().write(elevel::rerror, "Connection error for player " +
                                                  std::to_string(s->player_id) + ": " + ec.message());
  }
}

void GameServer::on_message(const Session::Ptr &s, const packet_in &in) {
  switch (in.type) {
    case in_packet_t_input:
      s->inputs.Push(in.input);
      break;

    case in_packet_t_chat: {
      endpoint.get_alog().write(alevel::app, std::string(COLOR_CYAN "[chat] " COLOR_RESET) +
                                                 s->name + ": " + in.chat.text);
      BroadcastChat(packet_chat(s->player_id, s->name, in.chat.text));
      break;
    }

    case in_packet_t_join:
      endpoint.get_elog().write(elevel::warn, "Player " + std::to_string(s->player_id) +
                                                  " sent a second join, ignored");
      break;

    case in_packet_t_unknown:
      endpoint.get_elog().write(elevel::warn, "Unknown message type '" + in.type_name +
                                                  "' from player " + std::to_string(s->player_id));
      break;
  }
}

void GameServer::on_close(Connection::Ptr con, player_id_t id) {
  if (id != 0) {
    sessions->Leave(id);
    endpoint.get_alog().write(alevel::disconnect, "Player " + std::to_string(id) +
                                                      " disconnected from " + con->get_remote());
  } else {
    endpoint.get_alog().write(alevel::disconnect, "Client " + con->get_remote() + " disconnected");
  }
  con->Close();

  const uint64_t con_id = con->get_id();
  con.reset();

  std::lock_guard<std::mutex> lock(handlers_mutex);
  connections.erase(con_id);
  handlers_cv.notify_all();
}

void GameServer::DriverLoop() {
  while (running) {
    const long now = GetCurrentTime();
    on_timer(now);

    const long step_time = GetCurrentTime() - now;
    if (step_time > config.tick_ms) {
      endpoint.get_elog().write(elevel::warn, std::string(COLOR_YELLOW "Load is too high" COLOR_RESET
                                                          ", step took ") +
                                                  std::to_string(step_time) + "ms");
    }

    const long sleep_ms = std::max(0L, config.tick_ms - step_time);
    std::unique_lock<std::mutex> lock(driver_mutex);
    driver_cv.wait_for(lock, std::chrono::milliseconds(sleep_ms), [this]() { return !running; });
  }
}

void GameServer::on_timer(long now) {
  ApplySessionEvents(now);
  ApplyInputs();
  world.Tick(now);

  if (++ticks % config.broadcast_every == 0) {
    BroadcastUpdates();
  }
}

void GameServer::ApplySessionEvents(long now) {
  std::vector<SessionEvent> events;
  sessions->TakeEvents(&events);

  for (const SessionEvent &ev : events) {
    switch (ev.kind) {
      case SessionEvent::joined:
        world.AddPlayer(ev.spawn, now);
        break;
      case SessionEvent::left:
        world.RemoveSnake(ev.spawn.id);
        break;
    }
  }
}

void GameServer::ApplyInputs() {
  std::vector<packet_input> inputs;
  for (const Session::Ptr &s : sessions->Snapshot()) {
    inputs.clear();
    s->inputs.Drain(&inputs);
    for (const packet_input &in : inputs) {
      if (!world.SetDirection(s->player_id, in.dx, in.dy)) {
        endpoint.get_alog().write(alevel::devel, "Turn refused for player " +
                                                     std::to_string(s->player_id));
      }
    }
  }
}

void GameServer::BroadcastUpdates() {
  packet_state_update update(world);

  for (const Session::Ptr &s : sessions->Snapshot()) {
    // still waiting for join_ack
    if (!s->ready || !s->connection || s->connection->is_closed()) {
      continue;
    }
    update.player_id = s->player_id;
    endpoint.send(s->connection, update);
  }
}

void GameServer::BroadcastChat(const packet_chat &p) {
  for (const Session::Ptr &s : sessions->Snapshot()) {
    if (!s->ready || !s->connection || s->connection->is_closed()) {
      continue;
    }
    send(s->connection, p);
  }
}

long GameServer::GetCurrentTime() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}
