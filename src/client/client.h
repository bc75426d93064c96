#ifndef SRC_CLIENT_CLIENT_H_
#define SRC_CLIENT_CLIENT_H_

#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "game/config.h"
#include "game/log.h"
#include "packet/frame_reader.h"
#include "packet/p_in.h"

// Blocking game client. Every call drives the io_context itself until the
// operation completes or its deadline passes, so no thread is needed.
class GameClient {
 public:
  typedef boost::asio::ip::tcp tcp;
  typedef boost::system::error_code error_code;
  typedef std::chrono::steady_clock::time_point time_point;

  GameClient();
  ~GameClient();

  GameClient(const GameClient &) = delete;
  GameClient &operator=(const GameClient &) = delete;

  // With tls set, tries a TLS handshake first (peer not verified) and
  // reconnects once without TLS when it fails.
  bool Connect(const std::string &host, uint16_t port, bool tls, long timeout_ms);

  // Sends the join and waits for join_ack or error. Returns the player id,
  // or 0 with the reason in get_error().
  player_id_t Join(const packet_join &req, long timeout_ms);

  bool SendInput(float dx, float dy);
  bool SendChat(const std::string &text);
  bool SendRaw(const std::string &bytes);

  // Next server message. False on timeout or a closed connection.
  // Throws protocol_error on a frame that is not a message object.
  bool ReadPacket(json *out, long timeout_ms);

  void Close();

  bool is_connected() const { return connected; }
  bool is_tls() const { return tls != nullptr; }
  player_id_t get_player_id() const { return player_id; }
  const std::string &get_error() const { return last_error; }

  alog_type &get_alog() { return alog; }
  elog_type &get_elog() { return elog; }

 private:
  bool ConnectSocket(const tcp::resolver::results_type &endpoints, time_point deadline);
  bool HandshakeTls(time_point deadline);
  bool Write(const std::string &frame);
  void StartRead();

  // Runs handlers until done is set. False when the deadline passed first.
  bool RunUntil(const bool &done, time_point deadline);

  // Aborts whatever is pending on the socket and runs the aborted handlers.
  void AbortPending();

  static time_point Deadline(long timeout_ms);

  template <typename T>
  bool send(const T &packet) {
    std::ostringstream out;
    out << packet;
    return Write(out.str());
  }

 private:
  boost::asio::io_context io;
  boost::asio::ssl::context tls_context;
  tcp::socket socket;
  std::unique_ptr<boost::asio::ssl::stream<tcp::socket &>> tls;

  FrameReader reader;
  char read_buf[4096];
  bool reading = false;
  bool connected = false;

  player_id_t player_id = 0;
  std::string last_error;

  alog_type alog;
  elog_type elog;
};

#endif  // SRC_CLIENT_CLIENT_H_
