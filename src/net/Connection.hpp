#pragma once

#include "AddressLimiter.hpp"
#include "IdAllocator.hpp"
#include "TelnetProtocol.hpp"
#include "common/Byte.hpp"
#include "common/Fd.hpp"
#include "common/Logger.hpp"
#include "common/Time.hpp"

#include <gsl/span>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

class Session;

// Raised by the reading side of a Connection when the link is no longer usable: timeout, reset, end of stream or a
// user interrupt. The connection is always closed by the time this is thrown.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One client's telnet link. A single thread reads from a connection; any thread may send to it or close it.
class Connection : private TelnetProtocol::Handler {
public:
    static constexpr auto MaxOutputBufSize = 32000u;
    static constexpr auto MaxIncomingDataBufferSize = 2048u;
    static constexpr auto DefaultReadTimeout = Seconds(300);

private:
    mutable Logger log_;
    IdAllocator::Reservation id_;
    AddressLimiter::Slot address_slot_;
    Fd fd_;
    std::string remote_address_;
    Time created_at_;
    Seconds read_timeout_;

    // Guards everything written by senders: the output buffer, the closed flag and writes to fd_.
    mutable std::mutex mutex_;
    bool closed_{};
    std::string outbuf_;

    // Only touched by the reading thread.
    TelnetProtocol telnet_{*this};
    std::deque<std::string> pending_lines_;
    bool interrupted_{};
    bool overflowed_{};

    std::atomic<bool> ansi_{};

    mutable std::mutex session_mutex_;
    std::weak_ptr<Session> session_;

    void send_bytes(gsl::span<const byte> data) override;
    void on_line(std::string_view line) override;
    void on_interrupt() override;
    void on_terminal_size(unsigned int width, unsigned int height) override;
    void on_terminal_type(std::string_view type, bool ansi_supported) override;

    void queue_locked(std::string_view data);
    void flush_locked();
    void close_locked(std::string_view reason);
    void on_data(gsl::span<const byte> incoming_data);
    [[noreturn]] void fail(std::string_view reason);

public:
    Connection(IdAllocator::Reservation id, AddressLimiter::Slot address_slot, Fd fd, std::string remote_address,
               Seconds read_timeout = DefaultReadTimeout);
    ~Connection() override;

    Connection(const Connection &) = delete;
    Connection(Connection &&) = delete;
    Connection &operator=(const Connection &) = delete;
    Connection &operator=(Connection &&) = delete;

    [[nodiscard]] IdAllocator::IdType id() const noexcept { return id_->id(); }
    [[nodiscard]] const std::string &remote_address() const noexcept { return remote_address_; }
    [[nodiscard]] Time created_at() const noexcept { return created_at_; }
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] bool supports_ansi() const noexcept { return ansi_; }

    // Sends the initial telnet option negotiation.
    void negotiate();

    // Queues text for the client, colourising |-codes and converting line endings. Never throws: failures close the
    // connection, and sending on a closed connection is a no-op.
    void send(std::string_view text);
    void send_line(std::string_view text);

    // Blocks until a whole line arrives, returning it trimmed. Throws ConnectionError if the read times out, the
    // client goes away or interrupts, or the connection is closed.
    [[nodiscard]] std::string read_line(bool echo = true);
    [[nodiscard]] std::string read_password() { return read_line(false); }

    // Idempotent. Wakes any thread blocked in read_line.
    void close();

    [[nodiscard]] std::shared_ptr<Session> session() const;
    void session(std::weak_ptr<Session> session);
};
