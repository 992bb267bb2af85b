#include "feed_server.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <iostream>

using namespace rawlink;

int main(int argc, char **argv) {
  std::string listen = "127.0.0.1:46090";
  std::string output_dir = "received_audio";
  std::string level = "info";
  size_t max_payload = kDefaultMaxPayload;
  bool analyze = true;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(2);
    };
    if (a == "--listen")
      listen = next(i);
    else if (a == "--output-dir")
      output_dir = next(i);
    else if (a == "--max-payload") {
      try {
        max_payload = (size_t)std::stoul(next(i));
      } catch (const std::exception &) {
        std::cerr << "bad max payload" << std::endl;
        return 2;
      }
    }
    else if (a == "--no-analyze")
      analyze = false;
    else if (a == "--log-level")
      level = next(i);
    else {
      std::cerr << "usage: rawlink_receiver [--listen host:port] "
                   "[--output-dir dir] [--max-payload n] [--no-analyze] "
                   "[--log-level lvl]\n";
      return 2;
    }
  }

  LogLevel lvl;
  if (!parse_log_level(level, lvl)) {
    std::cerr << "bad log level" << std::endl;
    return 2;
  }
  Logger::instance().set_level(lvl);

  std::string host;
  uint16_t port;
  if (!parse_host_port(listen, host, port)) {
    std::cerr << "bad listen" << std::endl;
    return 2;
  }

  ReceiverConfig cfg;
  cfg.listen_host = host;
  cfg.listen_port = port;
  cfg.max_payload = max_payload;
  cfg.delivery.output_dir = output_dir;
  cfg.delivery.analyze = analyze;

  LoggingUploadSink sink;
  Delivery delivery(cfg.delivery, sink);
  if (!delivery.prepare())
    return 1;

  try {
    asio::io_context io;
    FeedServer server(io, cfg, delivery);
    server.start();
    io.run();
  } catch (const std::exception &e) {
    Logger::instance().log(LogLevel::ERROR, "receiver failed: %s", e.what());
    return 1;
  }
  Logger::instance().log(LogLevel::INFO, "receiver stopped, %zu file(s) uploaded",
                         sink.uploaded().size());
  return 0;
}
