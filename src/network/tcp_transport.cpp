#include "chunkstream/network/tcp_transport.hpp"
#include "chunkstream/core/logger.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <future>
#include <sys/socket.h>

namespace chunkstream::network {

TcpTransport::TcpTransport(std::shared_ptr<boost::asio::io_context> io_context, tcp::socket socket)
    : io_context_(std::move(io_context))
    , work_guard_(boost::asio::make_work_guard(*io_context_))
    , socket_(std::move(socket)) {

    boost::system::error_code ec;
    auto endpoint = socket_.remote_endpoint(ec);
    if (ec) {
        remote_endpoint_ = "unknown";
        LOG_WARN("Failed to get remote endpoint: {}", ec.message());
    } else {
        remote_endpoint_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

    socket_.set_option(tcp::no_delay(true), ec);
    if (ec) {
        LOG_DEBUG("Could not disable Nagle on {}: {}", remote_endpoint_, ec.message());
    }

    io_thread_ = std::thread([this] { io_context_->run(); });
    LOG_DEBUG("TCP transport to {} open", remote_endpoint_);
}

TcpTransport::~TcpTransport() {
    close();

    work_guard_.reset();
    io_context_->stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }

    boost::system::error_code ec;
    socket_.close(ec);
}

std::shared_ptr<TcpTransport> TcpTransport::connect(const std::string& host, std::uint16_t port) {
    auto io_context = std::make_shared<boost::asio::io_context>();
    tcp::resolver resolver(*io_context);

    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        LOG_ERROR("Failed to resolve {}:{}: {}", host, port, ec.message());
        return nullptr;
    }

    tcp::socket socket(*io_context);
    boost::asio::connect(socket, endpoints, ec);
    if (ec) {
        LOG_ERROR("Failed to connect to {}:{}: {}", host, port, ec.message());
        return nullptr;
    }

    LOG_INFO("Connected to {}:{}", host, port);
    return std::make_shared<TcpTransport>(io_context, std::move(socket));
}

TransportStatus TcpTransport::send_frame(std::span<const std::uint8_t> frame) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_) {
        return TransportStatus::CLOSED;
    }

    // A frame larger than the limit still goes out when nothing else is waiting
    if (!write_queue_.empty() && queued_bytes_ + frame.size() > SEND_QUEUE_LIMIT) {
        return TransportStatus::BACKPRESSURED;
    }

    write_queue_.emplace_back(frame.begin(), frame.end());
    queued_bytes_ += frame.size();

    if (!write_in_progress_) {
        write_in_progress_ = true;
        boost::asio::post(*io_context_, [this] { do_write(); });
    }
    return TransportStatus::OK;
}

void TcpTransport::do_write() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (write_queue_.empty()) {
        write_in_progress_ = false;
        write_cv_.notify_all();
        return;
    }

    // deque::emplace_back leaves the front element in place while this write runs
    auto& frame = write_queue_.front();
    boost::asio::async_write(socket_, boost::asio::buffer(frame),
        [this](const boost::system::error_code& ec, std::size_t) {
            handle_write(ec);
        });
}

void TcpTransport::handle_write(const boost::system::error_code& ec) {
    if (!ec) {
        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            queued_bytes_ -= write_queue_.front().size();
            write_queue_.pop_front();
        }
        do_write();
        return;
    }

    bool was_closed = closed_.exchange(true);
    if (!was_closed) {
        LOG_WARN("Write to {} failed: {}", remote_endpoint_, ec.message());
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_queue_.clear();
        queued_bytes_ = 0;
        write_in_progress_ = false;
    }
    write_cv_.notify_all();

    // Wakes a reader still blocked on the socket
    ::shutdown(socket_.native_handle(), SHUT_RDWR);
}

std::size_t TcpTransport::queued_bytes() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return queued_bytes_;
}

bool TcpTransport::read_exact(std::span<std::uint8_t> buffer) {
    if (closed_) {
        return false;
    }

    // All socket operations run on the I/O thread
    std::promise<boost::system::error_code> done;
    auto result = done.get_future();
    boost::asio::post(*io_context_, [this, buffer, &done] {
        boost::asio::async_read(socket_, boost::asio::buffer(buffer.data(), buffer.size()),
            [&done](const boost::system::error_code& ec, std::size_t) {
                done.set_value(ec);
            });
    });

    auto ec = result.get();
    if (ec) {
        if (ec != boost::asio::error::eof && !closed_) {
            LOG_DEBUG("Read from {} failed: {}", remote_endpoint_, ec.message());
        }
        return false;
    }
    return true;
}

void TcpTransport::close() {
    if (closed_.exchange(true)) {
        return;
    }

    {
        std::unique_lock<std::mutex> lock(write_mutex_);
        if (!write_cv_.wait_for(lock, CLOSE_LINGER, [this] { return !write_in_progress_; })) {
            LOG_DEBUG("Closing TCP transport to {} with {} bytes unsent", remote_endpoint_, queued_bytes_);
        }
    }

    LOG_DEBUG("Closing TCP transport to {}", remote_endpoint_);
    // shutdown() wakes a reader blocked in another thread; the descriptor itself
    // is released in the destructor
    ::shutdown(socket_.native_handle(), SHUT_RDWR);
}

TcpListener::TcpListener(std::uint16_t port, const std::string& bind_address)
    : io_context_(std::make_shared<boost::asio::io_context>())
    , acceptor_(*io_context_, tcp::endpoint(boost::asio::ip::make_address(bind_address), port))
    , port_(acceptor_.local_endpoint().port()) {
    LOG_INFO("Listening on {}:{}", bind_address, port_);
}

TcpListener::~TcpListener() {
    close();
}

std::shared_ptr<TcpTransport> TcpListener::accept() {
    if (closed_) {
        return nullptr;
    }

    auto io_context = std::make_shared<boost::asio::io_context>();
    tcp::socket socket(*io_context);
    boost::system::error_code ec;
    acceptor_.accept(socket, ec);
    if (ec) {
        if (!closed_) {
            LOG_ERROR("Accept failed: {}", ec.message());
        }
        return nullptr;
    }

    return std::make_shared<TcpTransport>(io_context, std::move(socket));
}

void TcpListener::close() {
    if (closed_.exchange(true)) {
        return;
    }
    ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
    boost::system::error_code ec;
    acceptor_.close(ec);
}

}
