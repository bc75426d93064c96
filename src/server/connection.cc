#include "server/connection.h"

#include <sstream>

Connection::Connection(tcp::socket in_socket, boost::asio::ssl::context *tls_context,
                       uint64_t in_id)
    : socket(std::move(in_socket)), id(in_id) {
  if (tls_context != nullptr) {
    tls.reset(new boost::asio::ssl::stream<tcp::socket &>(socket, *tls_context));
  }

  error_code ec;
  const tcp::endpoint ep = socket.remote_endpoint(ec);
  if (!ec) {
    std::stringstream s;
    s << ep;
    remote = s.str();
  } else {
    remote = "unknown";
  }

  socket.set_option(tcp::no_delay(true), ec);
}

void Connection::Handshake(error_code &ec) {
  if (tls) {
    std::lock_guard<std::mutex> lock(io_mutex);
    tls->handshake(boost::asio::ssl::stream_base::server, ec);
    if (ec) {
      return;
    }
  }

  std::lock_guard<std::mutex> lock(io_mutex);
  socket.non_blocking(true, ec);
}

size_t Connection::ReadSome(char *data, size_t len, error_code &ec) {
  for (;;) {
    size_t n = 0;
    {
      std::lock_guard<std::mutex> lock(io_mutex);
      if (tls) {
        n = tls->read_some(boost::asio::buffer(data, len), ec);
      } else {
        n = socket.read_some(boost::asio::buffer(data, len), ec);
      }
    }

    if (ec != boost::asio::error::would_block && ec != boost::asio::error::try_again) {
      return n;
    }

    socket.wait(tcp::socket::wait_read, ec);
    if (ec) {
      return 0;
    }
  }
}

void Connection::Write(const std::string &frame, error_code &ec) {
  std::lock_guard<std::mutex> lock(io_mutex);

  socket.non_blocking(false, ec);
  if (ec) {
    return;
  }

  if (tls) {
    boost::asio::write(*tls, boost::asio::buffer(frame), ec);
  } else {
    boost::asio::write(socket, boost::asio::buffer(frame), ec);
  }

  error_code restore_ec;
  socket.non_blocking(true, restore_ec);
  if (!ec) {
    ec = restore_ec;
  }
}

void Connection::Close() {
  std::lock_guard<std::mutex> lock(close_mutex);
  if (closed) {
    return;
  }
  closed = true;

  error_code ec;
  socket.shutdown(tcp::socket::shutdown_both, ec);
}

bool Connection::is_closed() const {
  std::lock_guard<std::mutex> lock(close_mutex);
  return closed;
}
