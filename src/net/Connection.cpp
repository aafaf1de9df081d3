#include "Connection.hpp"

#include "common/mask_hostname.hpp"
#include "common/string_utils.hpp"

#include <fmt/format.h>

#include <poll.h>

using namespace std::literals;

namespace {
// How long read_line waits in poll() before rechecking its deadline and the closed flag.
constexpr auto PollSlice = 250ms;
}

Connection::Connection(IdAllocator::Reservation id, AddressLimiter::Slot address_slot, Fd fd,
                       std::string remote_address, Seconds read_timeout)
    : log_(logger_for(fmt::format("Connection.{}", id->id()))), id_(std::move(id)),
      address_slot_(std::move(address_slot)), fd_(std::move(fd)), remote_address_(std::move(remote_address)),
      created_at_(Clock::now()), read_timeout_(read_timeout) {
    log_.info("Incoming connection from {} on fd {}", get_masked_hostname(remote_address_), fd_.number());
}

Connection::~Connection() { log_.debug("Connection destroyed"); }

bool Connection::is_closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

void Connection::negotiate() { telnet_.send_telopts(); }

void Connection::send(std::string_view text) {
    const auto converted = normalise_line_endings(colourise_mud_string(ansi_, text));
    std::lock_guard lock(mutex_);
    if (closed_) {
        log_.debug("Ignoring send on closed connection");
        return;
    }
    queue_locked(converted);
}

void Connection::send_line(std::string_view text) { send(fmt::format("{}\n", text)); }

void Connection::send_bytes(gsl::span<const byte> data) {
    std::lock_guard lock(mutex_);
    if (!closed_)
        queue_locked(std::string_view(reinterpret_cast<const char *>(data.data()), data.size()));
}

void Connection::queue_locked(std::string_view data) {
    if (outbuf_.size() + data.size() > MaxOutputBufSize) {
        close_locked(fmt::format("output buffer overflow ({} bytes pending)", outbuf_.size() + data.size()));
        return;
    }
    outbuf_.append(data);
    flush_locked();
}

void Connection::flush_locked() {
    try {
        while (!outbuf_.empty()) {
            auto num_sent = fd_.try_send_some(outbuf_);
            if (num_sent == 0)
                return;
            outbuf_.erase(0, num_sent);
        }
    } catch (const std::runtime_error &re) {
        close_locked(re.what());
    }
}

void Connection::close_locked(std::string_view reason) {
    if (closed_)
        return;
    closed_ = true;
    outbuf_.clear();
    fd_.shutdown();
    log_.info("Closing connection to {}: {}", get_masked_hostname(remote_address_), reason);
}

void Connection::close() {
    std::lock_guard lock(mutex_);
    if (!closed_ && !outbuf_.empty())
        flush_locked();
    close_locked("closed by server");
}

void Connection::fail(std::string_view reason) {
    {
        std::lock_guard lock(mutex_);
        close_locked(reason);
    }
    throw ConnectionError(std::string(reason));
}

void Connection::on_line(std::string_view line) { pending_lines_.emplace_back(line); }

void Connection::on_interrupt() { interrupted_ = true; }

void Connection::on_terminal_size(unsigned int width, unsigned int height) {
    log_.debug("Terminal size {}x{}", width, height);
}

void Connection::on_terminal_type(std::string_view type, bool ansi_supported) {
    log_.debug("Terminal type '{}' ({}supporting ANSI)", type, ansi_supported ? "" : "not ");
    ansi_ = ansi_supported;
}

void Connection::on_data(gsl::span<const byte> incoming_data) {
    auto new_buf_size = incoming_data.size() + telnet_.buffered_data_size();
    if (new_buf_size >= MaxIncomingDataBufferSize) {
        log_.warn("Client sent too much data ({}>{})", new_buf_size, MaxIncomingDataBufferSize);
        send(">>> Too much incoming data at once - PUT A LID ON IT!!\n");
        overflowed_ = true;
        return;
    }
    telnet_.add_data(incoming_data);
}

std::string Connection::read_line(bool echo) {
    telnet_.set_echo(echo);
    const auto deadline = std::chrono::steady_clock::now() + read_timeout_;
    for (;;) {
        short events = POLLIN;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                pending_lines_.clear();
                throw ConnectionError("Connection is closed");
            }
            if (!outbuf_.empty())
                events |= POLLOUT;
        }
        if (interrupted_)
            fail("Read cancelled by client");
        if (overflowed_)
            fail("Too much incoming data");
        if (!pending_lines_.empty()) {
            auto line = std::move(pending_lines_.front());
            pending_lines_.pop_front();
            // Without echo the client's cursor hasn't moved, so move it for them.
            if (!echo)
                send("\n");
            return std::string(trim(line));
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            fail("Read timeout");
        const auto wait = std::min(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now),
                                   std::chrono::milliseconds(PollSlice));
        short revents{};
        try {
            revents = fd_.poll(events, wait);
        } catch (const std::runtime_error &re) {
            fail(fmt::format("Read error: {}", re.what()));
        }
        if (revents & POLLOUT) {
            std::lock_guard lock(mutex_);
            if (!closed_)
                flush_locked();
        }
        if (revents & (POLLIN | POLLHUP | POLLERR)) {
            // Per read we take at most this much, which also bounds how far a chatty client gets ahead.
            constexpr auto PerSocketReadSize = 1024;
            byte buf[PerSocketReadSize];
            size_t num_read{};
            try {
                num_read = fd_.try_read_some(gsl::span<byte>(buf));
            } catch (const std::runtime_error &re) {
                fail(fmt::format("Read error: {}", re.what()));
            }
            if (num_read == 0)
                fail("Connection lost");
            on_data(gsl::span<const byte>(buf, num_read));
        }
    }
}

std::shared_ptr<Session> Connection::session() const {
    std::lock_guard lock(session_mutex_);
    return session_.lock();
}

void Connection::session(std::weak_ptr<Session> session) {
    std::lock_guard lock(session_mutex_);
    session_ = std::move(session);
}
