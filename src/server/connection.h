#ifndef SRC_SERVER_CONNECTION_H_
#define SRC_SERVER_CONNECTION_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

typedef boost::asio::ip::tcp tcp;
typedef boost::system::error_code error_code;

// One client socket, optionally wrapped in TLS.
//
// The handler thread reads, any thread may write or close. All engine calls
// (read_some, write) run under io_mutex so a TLS session never sees a read
// and a write at once; the reader parks in wait() outside the lock while the
// socket is in non-blocking mode, writers switch to blocking for their call.
class Connection {
 public:
  typedef std::shared_ptr<Connection> Ptr;

  // tls_context == nullptr gives a plain TCP connection.
  Connection(tcp::socket in_socket, boost::asio::ssl::context *tls_context, uint64_t in_id);

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  // Server side TLS handshake, a no-op for plain connections. Must run
  // before the first read.
  void Handshake(error_code &ec);

  // Blocks until some bytes arrive, the peer closes, or Close() is called.
  size_t ReadSome(char *data, size_t len, error_code &ec);

  // Writes the whole frame in one call.
  void Write(const std::string &frame, error_code &ec);

  // Shuts the socket down both ways, which wakes a blocked reader.
  void Close();

  bool is_closed() const;
  bool is_tls() const { return tls != nullptr; }
  uint64_t get_id() const { return id; }
  const std::string &get_remote() const { return remote; }

 private:
  tcp::socket socket;
  std::unique_ptr<boost::asio::ssl::stream<tcp::socket &>> tls;

  mutable std::mutex io_mutex;
  mutable std::mutex close_mutex;
  bool closed = false;

  uint64_t id;
  std::string remote;
};

#endif  // SRC_SERVER_CONNECTION_H_
