#include "feed.hpp"
#include "frame.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <chrono>
#include <iostream>
#include <thread>

using namespace rawlink;

namespace {

struct ReplayConfig {
    std::string server_host;
    uint16_t server_port{};
    size_t chunk{kDefaultChunkSize};
    int delay_ms{0};
    std::string name;
};

bool send_notification(asio::ip::tcp::socket &sock,
                       const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> wire;
  if (!encode_notification(payload, wire)) {
    Logger::instance().log(LogLevel::ERROR, "notification of %zu bytes too long",
                           payload.size());
    return false;
  }
  std::error_code ec;
  asio::write(sock, asio::buffer(wire), ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "send failed: %s",
                           ec.message().c_str());
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char **argv) {
  std::string server = "127.0.0.1:46090";
  std::string level = "info";
  std::string file;
  ReplayConfig cfg;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(2);
    };
    try {
      if (a == "--server")
        server = next(i);
      else if (a == "--chunk")
        cfg.chunk = (size_t)std::stoul(next(i));
      else if (a == "--delay-ms")
        cfg.delay_ms = std::stoi(next(i));
      else if (a == "--name")
        cfg.name = next(i);
      else if (a == "--log-level")
        level = next(i);
      else if (file.empty() && a.rfind("--", 0) != 0)
        file = a;
      else {
        std::cerr << "unknown argument " << a << "\n";
        return 2;
      }
    } catch (const std::exception &) {
      std::cerr << "bad value for " << a << "\n";
      return 2;
    }
  }
  if (file.empty() || cfg.chunk == 0 || cfg.chunk > 0xFFFF) {
    std::cerr << "usage: rawlink_replay [--server host:port] [--chunk n] "
                 "[--delay-ms n] [--name name] <container>\n";
    return 2;
  }

  LogLevel lvl;
  if (!parse_log_level(level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 2;
  }
  Logger::instance().set_level(lvl);

  if (!parse_host_port(server, cfg.server_host, cfg.server_port)) {
    std::cerr << "bad server" << std::endl;
    return 2;
  }
  if (cfg.name.empty())
    cfg.name = sanitize_filename(file);

  std::vector<uint8_t> bytes;
  std::string err;
  if (!read_file(file, bytes, err)) {
    Logger::instance().log(LogLevel::ERROR, "%s", err.c_str());
    return 1;
  }

  asio::io_context io;
  asio::ip::tcp::socket sock(io);
  asio::ip::tcp::resolver res(io);
  std::error_code ec;
  auto results =
      res.resolve(cfg.server_host, std::to_string(cfg.server_port), ec);
  if (!ec)
    asio::connect(sock, results, ec);
  if (ec) {
    Logger::instance().log(LogLevel::ERROR, "connect failed: %s",
                           ec.message().c_str());
    return 1;
  }

  auto pause = [&] {
    if (cfg.delay_ms > 0)
      std::this_thread::sleep_for(std::chrono::milliseconds(cfg.delay_ms));
  };

  auto t0 = std::chrono::steady_clock::now();
  if (!send_notification(sock, make_header_frame(cfg.name, bytes.size())))
    return 1;
  auto chunks = split_payload(bytes, cfg.chunk);
  for (const auto &c : chunks) {
    pause();
    if (!send_notification(sock, c))
      return 1;
  }
  pause();
  if (!send_notification(sock, make_end_frame()))
    return 1;
  double secs =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - t0)
          .count();

  Logger::instance().log(LogLevel::INFO,
                         "sent %s: %zu bytes in %zu notifications (%.2f s)",
                         cfg.name.c_str(), bytes.size(), chunks.size() + 2,
                         secs);
  sock.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  sock.close(ec);
  return 0;
}
