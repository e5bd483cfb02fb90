#pragma once

#include "stream_transport.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chunkstream::network {

using boost::asio::ip::tcp;

// Framed transport over a connected TCP socket. Each transport runs its own I/O thread:
// frames are queued and written in order by that thread, and send_frame() reports
// BACKPRESSURED once SEND_QUEUE_LIMIT bytes are waiting. recv_frame() blocks the caller.
class TcpTransport : public FramedStreamTransport {
public:
    static constexpr std::size_t SEND_QUEUE_LIMIT = 1024 * 1024;
    static constexpr std::chrono::milliseconds CLOSE_LINGER{500};

    TcpTransport(std::shared_ptr<boost::asio::io_context> io_context, tcp::socket socket);
    ~TcpTransport() override;

    // nullptr when the host cannot be resolved or connected.
    static std::shared_ptr<TcpTransport> connect(const std::string& host, std::uint16_t port);

    TransportStatus send_frame(std::span<const std::uint8_t> frame) override;

    // Queued frames get up to CLOSE_LINGER to reach the peer before the socket shuts down.
    void close() override;
    bool is_closed() const override { return closed_; }
    std::string remote_endpoint() const override { return remote_endpoint_; }

    std::size_t queued_bytes() const;

protected:
    bool read_exact(std::span<std::uint8_t> buffer) override;

private:
    void do_write();
    void handle_write(const boost::system::error_code& ec);

    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    tcp::socket socket_;
    std::string remote_endpoint_;
    std::thread io_thread_;

    mutable std::mutex write_mutex_;
    std::condition_variable write_cv_;
    std::deque<std::vector<std::uint8_t>> write_queue_;
    std::size_t queued_bytes_ = 0;
    bool write_in_progress_ = false;
    std::atomic<bool> closed_{false};
};

class TcpListener {
public:
    // port 0 picks an ephemeral port, see port()
    explicit TcpListener(std::uint16_t port, const std::string& bind_address = "0.0.0.0");
    ~TcpListener();

    // Blocks until a peer connects. Each accepted transport gets its own io_context.
    // nullptr once the listener is closed.
    std::shared_ptr<TcpTransport> accept();

    void close();
    std::uint16_t port() const { return port_; }

private:
    std::shared_ptr<boost::asio::io_context> io_context_;
    tcp::acceptor acceptor_;
    std::uint16_t port_;
    std::atomic<bool> closed_{false};
};

}
