#pragma once
#include <asio.hpp>
#include <memory>
#include <vector>
#include "delivery.hpp"
#include "feed.hpp"

namespace rawlink {

struct ReceiverConfig {
    std::string listen_host{"127.0.0.1"};
    uint16_t listen_port{46090};
    size_t max_payload{kDefaultMaxPayload};
    DeliveryConfig delivery;
};

// Accepts one notification bridge at a time and pumps its bytes through the
// NotificationFeed. Disconnect and shutdown both cancel a live transfer.
class FeedServer {
public:
    using tcp = asio::ip::tcp;

    FeedServer(asio::io_context& io, const ReceiverConfig& cfg, Delivery& delivery);
    void start();
    void stop();

private:
    struct Conn : public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        std::vector<uint8_t> read_buf;
        Conn(asio::io_context& io) : sock(io), read_buf(16*1024) {}
    };

    asio::io_context& io_;
    ReceiverConfig cfg_;
    Delivery& delivery_;
    tcp::acceptor acceptor_;
    asio::signal_set signals_;
    std::shared_ptr<Conn> active_;
    NotificationFeed feed_;
    bool stopping_{false};

    void do_accept();
    void do_read(std::shared_ptr<Conn> c);
    void drop(std::shared_ptr<Conn> c, const char* why);
};

} // namespace rawlink
