#include "client/client.h"

namespace ssl = boost::asio::ssl;

GameClient::GameClient()
    : tls_context(ssl::context::tls_client),
      socket(io),
      alog(websocketpp::log::channel_type_hint::access),
      elog(websocketpp::log::channel_type_hint::error) {
  // self-signed server certificates are the norm
  tls_context.set_verify_mode(ssl::verify_none);

  alog.clear_channels(alevel::all);
  alog.set_channels(alevel::connect | alevel::disconnect | alevel::app);

  elog.clear_channels(elevel::all);
  elog.set_channels(elevel::warn | elevel::rerror | elevel::fatal);
}

GameClient::~GameClient() {
  Close();
}

GameClient::time_point GameClient::Deadline(long timeout_ms) {
  return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

bool GameClient::Connect(const std::string &host, uint16_t port, bool use_tls, long timeout_ms) {
  Close();
  last_error.clear();

  alog.write(alevel::connect, "Attempting to connect to " + host + ":" + std::to_string(port));

  tcp::resolver resolver(io);
  error_code ec;
  const tcp::resolver::results_type endpoints = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    last_error = "Could not resolve " + host + ": " + ec.message();
    elog.write(elevel::rerror, last_error);
    return false;
  }

  if (!ConnectSocket(endpoints, Deadline(timeout_ms))) {
    return false;
  }

  if (use_tls) {
    if (HandshakeTls(Deadline(timeout_ms))) {
      alog.write(alevel::connect, "TLS handshake successful");
      connected = true;
      return true;
    }

    elog.write(elevel::warn, "TLS handshake failed: " + last_error);
    elog.write(elevel::warn, "Attempting to connect without TLS...");
    tls.reset();
    if (!ConnectSocket(endpoints, Deadline(timeout_ms))) {
      return false;
    }
  }

  alog.write(alevel::connect, "Connected to " + host + ":" + std::to_string(port));
  connected = true;
  return true;
}

bool GameClient::ConnectSocket(const tcp::resolver::results_type &endpoints, time_point deadline) {
  bool done = false;
  error_code result;

  boost::asio::async_connect(socket, endpoints,
                             [&done, &result](const error_code &ec, const tcp::endpoint &) {
                               result = ec;
                               done = true;
                             });

  if (!RunUntil(done, deadline)) {
    AbortPending();
    last_error = "Connection timed out";
    elog.write(elevel::rerror, last_error);
    return false;
  }
  if (result) {
    last_error = "Connection failed: " + result.message();
    elog.write(elevel::rerror, last_error);
    return false;
  }

  error_code ec;
  socket.set_option(tcp::no_delay(true), ec);
  return true;
}

bool GameClient::HandshakeTls(time_point deadline) {
  tls.reset(new ssl::stream<tcp::socket &>(socket, tls_context));

  bool done = false;
  error_code result;
  tls->async_handshake(ssl::stream_base::client, [&done, &result](const error_code &ec) {
    result = ec;
    done = true;
  });

  if (!RunUntil(done, deadline)) {
    AbortPending();
    last_error = "handshake timed out";
    return false;
  }
  if (result) {
    last_error = result.message();
    error_code ec;
    socket.close(ec);
    return false;
  }
  return true;
}

player_id_t GameClient::Join(const packet_join &req, long timeout_ms) {
  player_id = 0;
  if (!send(req)) {
    return 0;
  }

  const time_point deadline = Deadline(timeout_ms);
  json msg;
  for (;;) {
    const long left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - std::chrono::steady_clock::now())
                          .count();
    if (left <= 0 || !ReadPacket(&msg, left)) {
      if (last_error.empty()) {
        last_error = "No reply to join";
      }
      return 0;
    }

    const std::string type = msg["type"].get<std::string>();
    if (type == "join_ack") {
      player_id = msg.value("player_id", player_id_t(0));
      alog.write(alevel::app, "Joined game as player " + std::to_string(player_id));
      return player_id;
    }
    if (type == "error") {
      last_error = msg.value("message", std::string());
      elog.write(elevel::warn, "Error from server: " + last_error);
      return 0;
    }
  }
}

bool GameClient::SendInput(float dx, float dy) {
  packet_input p;
  p.dx = dx;
  p.dy = dy;
  return send(p);
}

bool GameClient::SendChat(const std::string &text) {
  packet_chat_in p;
  p.text = text;
  return send(p);
}

bool GameClient::SendRaw(const std::string &bytes) {
  return Write(bytes);
}

bool GameClient::Write(const std::string &frame) {
  if (!connected) {
    last_error = "Not connected";
    return false;
  }

  bool done = false;
  error_code result;
  auto handler = [&done, &result](const error_code &ec, size_t) {
    result = ec;
    done = true;
  };
  if (tls) {
    boost::asio::async_write(*tls, boost::asio::buffer(frame), handler);
  } else {
    boost::asio::async_write(socket, boost::asio::buffer(frame), handler);
  }

  if (!RunUntil(done, Deadline(5000))) {
    AbortPending();
    last_error = "Send timed out";
    Close();
    return false;
  }
  if (result) {
    last_error = "Error sending message: " + result.message();
    elog.write(elevel::rerror, last_error);
    Close();
    return false;
  }
  return true;
}

void GameClient::StartRead() {
  if (reading || !connected) {
    return;
  }
  reading = true;

  auto handler = [this](const error_code &ec, size_t n) {
    reading = false;
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        last_error = ec == boost::asio::error::eof ? "Disconnected from server" : ec.message();
        alog.write(alevel::disconnect, last_error);
      }
      connected = false;
      return;
    }
    try {
      reader.Feed(read_buf, n);
    } catch (const protocol_error &e) {
      last_error = e.what();
      elog.write(elevel::rerror, last_error);
      connected = false;
    }
  };

  if (tls) {
    tls->async_read_some(boost::asio::buffer(read_buf), handler);
  } else {
    socket.async_read_some(boost::asio::buffer(read_buf), handler);
  }
}

bool GameClient::ReadPacket(json *out, long timeout_ms) {
  const time_point deadline = Deadline(timeout_ms);

  std::string frame;
  while (!reader.Next(&frame)) {
    if (!connected) {
      return false;
    }
    StartRead();
    io.restart();
    if (io.run_one_until(deadline) == 0) {
      return false;
    }
  }

  *out = parse_frame(frame);
  return true;
}

bool GameClient::RunUntil(const bool &done, time_point deadline) {
  io.restart();
  while (!done) {
    if (io.run_one_until(deadline) == 0) {
      return done;
    }
  }
  return true;
}

void GameClient::AbortPending() {
  error_code ec;
  socket.close(ec);
  io.restart();
  io.run();
}

void GameClient::Close() {
  if (socket.is_open()) {
    error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    AbortPending();
  }
  tls.reset();
  reader = FrameReader();
  reading = false;
  connected = false;
}
