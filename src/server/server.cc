#include "server/server.h"

Endpoint::Endpoint()
    : acceptor(io),
      alog(websocketpp::log::channel_type_hint::access),
      elog(websocketpp::log::channel_type_hint::error) {
  // set up access channels to only log interesting things
  alog.clear_channels(alevel::all);
  alog.set_channels(alevel::connect | alevel::disconnect | alevel::app);

  elog.clear_channels(elevel::all);
  elog.set_channels(elevel::info | elevel::warn | elevel::rerror | elevel::fatal);
}

bool Endpoint::init_tls(const std::string &cert_file, const std::string &key_file) {
  namespace ssl = boost::asio::ssl;

  std::unique_ptr<ssl::context> ctx(new ssl::context(ssl::context::tls_server));
  ctx->set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 |
                   ssl::context::no_sslv3 | ssl::context::single_dh_use);

  error_code ec;
  ctx->use_certificate_chain_file(cert_file, ec);
  if (ec) {
    elog.write(elevel::warn, "Error loading TLS certificate " + cert_file + ": " + ec.message());
    return false;
  }
  ctx->use_private_key_file(key_file, ssl::context::pem, ec);
  if (ec) {
    elog.write(elevel::warn, "Error loading TLS key " + key_file + ": " + ec.message());
    return false;
  }

  tls_context = std::move(ctx);
  alog.write(alevel::app, "TLS certificate loaded successfully");
  return true;
}

void Endpoint::listen(uint16_t in_port) {
  const tcp::endpoint ep(tcp::v4(), in_port);
  acceptor.open(ep.protocol());
  acceptor.set_option(tcp::acceptor::reuse_address(true));
  acceptor.bind(ep);
  acceptor.listen();
  port = acceptor.local_endpoint().port();

  start_accept();
}

void Endpoint::start_accept() {
  acceptor.async_accept([this](const error_code &ec, tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted || !acceptor.is_open()) {
      return;
    }
    if (ec) {
      elog.write(elevel::rerror, "Error accepting client: " + ec.message());
    } else if (on_accept) {
      on_accept(std::move(socket));
    }
    start_accept();
  });
}

void Endpoint::run() {
  io.run();
}

void Endpoint::stop() {
  boost::asio::post(io, [this]() {
    error_code ec;
    acceptor.close(ec);
    io.stop();
  });
}
