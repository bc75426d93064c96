#ifndef SRC_SERVER_SERVER_H_
#define SRC_SERVER_SERVER_H_

#include <functional>
#include <memory>
#include <sstream>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include "game/log.h"
#include "server/connection.h"

// Listening socket, TLS context and loggers. Accepts asynchronously on its
// own io_context; everything after accept is blocking I/O in handler threads.
class Endpoint {
 public:
  typedef std::function<void(tcp::socket)> accept_handler;

  Endpoint();

  // Loads cert chain and key. On failure logs why and returns false.
  bool init_tls(const std::string &cert_file, const std::string &key_file);
  boost::asio::ssl::context *get_tls_context() { return tls_context.get(); }

  void set_accept_handler(accept_handler h) { on_accept = h; }

  // Throws boost::system::system_error when the port cannot be bound.
  void listen(uint16_t port);
  uint16_t get_port() const { return port; }

  // Runs the accept loop until stop().
  void run();
  void stop();

  alog_type &get_alog() { return alog; }
  elog_type &get_elog() { return elog; }

  template <typename T>
  void send(const Connection::Ptr &con, const T &packet, error_code &ec) {
    std::ostringstream out;
    out << packet;
    con->Write(out.str(), ec);
  }

  // A failed send closes the connection, its handler thread cleans up.
  template <typename T>
  void send(const Connection::Ptr &con, const T &packet) {
    error_code ec;
    send(con, packet, ec);
    if (ec) {
      elog.write(elevel::rerror, "[NET ERROR] Send to " + con->get_remote() +
                                     " failed: " + ec.message());
      con->Close();
    }
  }

 private:
  void start_accept();

  boost::asio::io_context io;
  tcp::acceptor acceptor;
  std::unique_ptr<boost::asio::ssl::context> tls_context;
  accept_handler on_accept;
  uint16_t port = 0;

  alog_type alog;
  elog_type elog;
};

#endif  // SRC_SERVER_SERVER_H_
