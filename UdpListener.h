// UdpListener.h
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "ReceiverConfig.h"

// Socket could not be opened or bound. Fatal to the start attempt.
class StartError : public std::runtime_error {
public:
    explicit StartError(const std::string& what) : std::runtime_error(what) {}
};

// --- UdpListener ---
// Owns one IPv4 UDP socket bound to 0.0.0.0:<port> with SO_REUSEADDR, non-blocking.
// Every datagram is handed to the DatagramHandler on the io_context before the
// next receive is issued. Must be owned by a std::shared_ptr.
class UdpListener : public std::enable_shared_from_this<UdpListener> {
public:
    using DatagramHandler = std::function<void(const std::string& payload, const std::string& source_ip)>;

    struct Options {
        ListenerMode mode = ListenerMode::ASYNC;
        size_t buffer_size = kDefaultBufferSize;
        std::chrono::milliseconds poll_interval{ 100 };
        std::chrono::milliseconds retry_delay{ 1000 };
    };

    UdpListener(boost::asio::io_context& io_ctx, DatagramHandler handler, Options options);
    virtual ~UdpListener();

    UdpListener(const UdpListener&) = delete;
    UdpListener& operator=(const UdpListener&) = delete;

    // Throws StartError. No-op if already running.
    void Start(uint16_t port);
    // Idempotent. After it returns no further datagram reaches the handler
    // and the port is released.
    void Stop();

    bool IsRunning() const { return m_running && m_socket.is_open(); }
    bool IsSocketOpen() const { return m_socket.is_open(); }
    uint16_t LocalPort() const;
    uint64_t ReceiveErrorCount() const { return m_receive_errors.load(); }
    ListenerMode Mode() const { return m_options.mode; }

protected:
    // Sees the result of every receive attempt before it is acted on. Returning
    // an error sends the loop through the log-and-retry path.
    virtual boost::system::error_code CheckReceiveResult(const boost::system::error_code& ec) { return ec; }

private:
    // Async variant
    void DoReceive();
    void OnReceive(uint64_t generation, const boost::system::error_code& ec, std::size_t bytes);

    // Poll variant
    void SchedulePoll(std::chrono::milliseconds delay);
    void OnPollTimer(uint64_t generation, const boost::system::error_code& ec);

    void OnReceiveError(const boost::system::error_code& ec);
    void Dispatch(std::size_t bytes);

    boost::asio::ip::udp::socket m_socket;
    boost::asio::steady_timer m_timer; // poll tick or back-off after a receive error
    boost::asio::ip::udp::endpoint m_sender;
    std::vector<char> m_buffer;
    DatagramHandler m_handler;
    Options m_options;

    bool m_running;
    uint64_t m_generation; // bumped on every Start/Stop; stale handlers compare against it
    std::atomic<uint64_t> m_receive_errors;
};
