#include "feed_server.hpp"
#include "logging.hpp"
#include <csignal>

namespace rawlink {

FeedServer::FeedServer(asio::io_context &io, const ReceiverConfig &cfg,
                       Delivery &delivery)
    : io_(io), cfg_(cfg), delivery_(delivery), acceptor_(io),
      signals_(io, SIGINT, SIGTERM), feed_(cfg.max_payload) {}

void FeedServer::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  Logger::instance().log(LogLevel::INFO, "feed listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)cfg_.listen_port);
  signals_.async_wait([this](std::error_code ec, int signo) {
    if (ec)
      return;
    Logger::instance().log(LogLevel::INFO, "signal %d, shutting down", signo);
    stop();
  });
  do_accept();
}

void FeedServer::stop() {
  if (stopping_)
    return;
  stopping_ = true;
  delivery_.handle(feed_.disconnect());
  std::error_code ec;
  acceptor_.close(ec);
  signals_.cancel(ec);
  if (active_) {
    active_->sock.close(ec);
    active_.reset();
  }
  io_.stop();
}

void FeedServer::do_accept() {
  auto c = std::make_shared<Conn>(io_);
  acceptor_.async_accept(c->sock, [this, c](std::error_code ec) {
    if (ec) {
      if (!stopping_) {
        Logger::instance().log(LogLevel::WARN, "accept failed: %s",
                               ec.message().c_str());
        do_accept();
      }
      return;
    }
    if (active_) {
      Logger::instance().log(LogLevel::WARN,
                             "rejecting second bridge, one is already attached");
      std::error_code ec2;
      c->sock.close(ec2);
    } else {
      Logger::instance().log(LogLevel::INFO, "bridge connected");
      active_ = c;
      do_read(c);
    }
    do_accept();
  });
}

void FeedServer::do_read(std::shared_ptr<Conn> c) {
  c->sock.async_read_some(
      asio::buffer(c->read_buf), [this, c](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec == asio::error::eof)
            drop(c, "bridge disconnected");
          else if (ec != asio::error::operation_aborted)
            drop(c, ec.message().c_str());
          return;
        }
        delivery_.handle(feed_.feed(c->read_buf.data(), n));
        if (active_ == c)
          do_read(c);
      });
}

void FeedServer::drop(std::shared_ptr<Conn> c, const char *why) {
  Logger::instance().log(LogLevel::WARN, "feed closed: %s", why);
  delivery_.handle(feed_.disconnect());
  std::error_code ec;
  c->sock.close(ec);
  if (active_ == c)
    active_.reset();
}

} // namespace rawlink
