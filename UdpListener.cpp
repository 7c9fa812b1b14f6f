#include "UdpListener.h"

#include "ReceiverLog.h"

namespace {
// Upper bound on datagrams drained per poll tick before yielding to other handlers.
constexpr int kMaxDrainPerTick = 1024;
}

UdpListener::UdpListener(boost::asio::io_context& io_ctx, DatagramHandler handler, Options options)
    : m_socket(io_ctx),
    m_timer(io_ctx),
    m_handler(std::move(handler)),
    m_options(options),
    m_running(false),
    m_generation(0),
    m_receive_errors(0)
{
    if (m_options.buffer_size == 0) m_options.buffer_size = kDefaultBufferSize;
}

UdpListener::~UdpListener() {
    Stop();
}

void UdpListener::Start(uint16_t port) {
    if (m_running) return;

    namespace ip = boost::asio::ip;
    boost::system::error_code ec;

    m_socket.open(ip::udp::v4(), ec);
    if (ec) {
        throw StartError("Failed to open UDP socket: " + ec.message());
    }
    m_socket.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
        AddLog("UDP: setsockopt SO_REUSEADDR failed: " + ec.message(), LogType::LIFECYCLE, LogLevel::Warning);
    }
    m_socket.bind(ip::udp::endpoint(ip::address_v4::any(), port), ec);
    if (ec) {
        boost::system::error_code ignored;
        m_socket.close(ignored);
        throw StartError("Failed to bind UDP port " + std::to_string(port) + ": " + ec.message());
    }
    m_socket.non_blocking(true, ec);
    if (ec) {
        boost::system::error_code ignored;
        m_socket.close(ignored);
        throw StartError("Failed to make UDP socket non-blocking: " + ec.message());
    }

    m_buffer.assign(m_options.buffer_size, 0);
    m_running = true;
    ++m_generation;

    AddLog("UDP: listening on port " + std::to_string(LocalPort()) + " (" + ListenerModeName(m_options.mode) + " mode)",
        LogType::LIFECYCLE);

    if (m_options.mode == ListenerMode::POLL) {
        SchedulePoll(std::chrono::milliseconds(0));
    }
    else {
        DoReceive();
    }
}

void UdpListener::Stop() {
    if (!m_running && !m_socket.is_open()) return;

    // Handlers already queued on the io_context see the new generation and return.
    m_running = false;
    ++m_generation;
    m_timer.cancel();

    boost::system::error_code ec;
    m_socket.cancel(ec);
    m_socket.close(ec);
    if (ec) {
        AddLog("UDP: error closing socket: " + ec.message(), LogType::LIFECYCLE, LogLevel::Warning);
    }
    AddLog("UDP: listener stopped.", LogType::LIFECYCLE);
}

uint16_t UdpListener::LocalPort() const {
    boost::system::error_code ec;
    auto endpoint = m_socket.local_endpoint(ec);
    if (ec) return 0;
    return endpoint.port();
}

// --- Async variant ---

void UdpListener::DoReceive() {
    uint64_t generation = m_generation;
    m_socket.async_receive_from(boost::asio::buffer(m_buffer), m_sender,
        [self = shared_from_this(), generation](const boost::system::error_code& ec, std::size_t bytes) {
            self->OnReceive(generation, ec, bytes);
        });
}

void UdpListener::OnReceive(uint64_t generation, const boost::system::error_code& ec, std::size_t bytes) {
    if (ec == boost::asio::error::operation_aborted || generation != m_generation || !m_running) {
        return;
    }
    boost::system::error_code result = CheckReceiveResult(ec);
    if (result) {
        OnReceiveError(result);
        return;
    }
    Dispatch(bytes);
    if (generation == m_generation && m_running) {
        DoReceive();
    }
}

// --- Poll variant ---

void UdpListener::SchedulePoll(std::chrono::milliseconds delay) {
    uint64_t generation = m_generation;
    m_timer.expires_after(delay);
    m_timer.async_wait(
        [self = shared_from_this(), generation](const boost::system::error_code& ec) {
            self->OnPollTimer(generation, ec);
        });
}

void UdpListener::OnPollTimer(uint64_t generation, const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted || generation != m_generation || !m_running) {
        return;
    }

    // Drain everything already queued; an empty poll window is not an error.
    for (int drained = 0; drained < kMaxDrainPerTick; ++drained) {
        boost::system::error_code rec;
        std::size_t bytes = m_socket.receive_from(boost::asio::buffer(m_buffer), m_sender, 0, rec);
        rec = CheckReceiveResult(rec);
        if (rec == boost::asio::error::would_block || rec == boost::asio::error::try_again) {
            SchedulePoll(m_options.poll_interval);
            return;
        }
        if (rec) {
            OnReceiveError(rec);
            return;
        }
        Dispatch(bytes);
        if (generation != m_generation || !m_running) return;
    }

    // Queue still non-empty; come back without waiting a full interval.
    SchedulePoll(std::chrono::milliseconds(0));
}

// --- Shared ---

void UdpListener::OnReceiveError(const boost::system::error_code& ec) {
    ++m_receive_errors;
    AddLog("UDP: error receiving datagram: " + ec.message(), LogType::SYSTEM, LogLevel::Error);

    uint64_t generation = m_generation;
    m_timer.expires_after(m_options.retry_delay);
    m_timer.async_wait(
        [self = shared_from_this(), generation](const boost::system::error_code& wait_ec) {
            if (wait_ec == boost::asio::error::operation_aborted || generation != self->m_generation || !self->m_running) {
                return;
            }
            if (self->m_options.mode == ListenerMode::POLL) {
                self->OnPollTimer(generation, wait_ec);
            }
            else {
                self->DoReceive();
            }
        });
}

void UdpListener::Dispatch(std::size_t bytes) {
    std::string payload(m_buffer.data(), bytes);
    std::string source_ip = m_sender.address().to_string();

    try {
        m_handler(payload, source_ip);
    }
    catch (const std::exception& e) {
        AddLog("UDP: datagram handler failed for message from " + source_ip + ": " + e.what(),
            LogType::SYSTEM, LogLevel::Error);
    }
    catch (...) {
        AddLog("UDP: datagram handler failed for message from " + source_ip + " (unknown exception)",
            LogType::SYSTEM, LogLevel::Error);
    }
}
