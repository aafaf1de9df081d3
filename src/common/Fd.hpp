#pragma once

#include "Byte.hpp"

#include <gsl/span>

#include <chrono>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// An owning wrapper around a POSIX file descriptor. All failing system calls throw fmt::system_error.
class Fd {
    int fd_;

public:
    Fd() : fd_(-1) {}
    explicit Fd(int fd) noexcept : fd_(fd) {}
    ~Fd() noexcept { close(); }
    Fd(const Fd &) = delete;
    Fd &operator=(const Fd &) = delete;
    Fd(Fd &&other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd &operator=(Fd &&other) noexcept {
        close();
        fd_ = std::exchange(other.fd_, -1);
        return *this;
    }
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int number() const {
        if (!is_open())
            throw std::runtime_error("Attempt to get handle for invalid file descriptor");
        return fd_;
    }
    void close() noexcept {
        if (is_open())
            ::close(fd_);
        fd_ = -1;
    }

    void write(std::string_view data) const { write(data.data(), data.size()); }
    void write(gsl::span<const byte> span) const { write(span.data(), span.size_bytes()); }
    void write(const void *data, size_t length) const;

    // Reads whatever is available, blocking if nothing is. Returns zero at end of stream.
    [[nodiscard]] size_t try_read_some(gsl::span<byte> span) const;
    // Sends as much as the socket will take without blocking. Returns zero if the socket is full.
    [[nodiscard]] size_t try_send_some(std::string_view data) const;
    // Waits for any of `events`. Returns the signalled events, or zero on timeout or interruption.
    [[nodiscard]] short poll(short events, std::chrono::milliseconds timeout) const;
    // Shuts down both directions of a socket, leaving the descriptor itself open. Errors are ignored.
    void shutdown() const noexcept;

    template <typename T>
    const Fd &setsockopt(int level, int optname, const T &optval) const {
        return setsockopt(level, optname, &optval, sizeof(optval));
    }
    const Fd &setsockopt(int level, int optname, const void *optval, socklen_t optlen) const;

    template <typename T>
    const Fd &bind(const T &address) const {
        static_assert(sizeof(T) >= sizeof(sockaddr));
        return bind(reinterpret_cast<const sockaddr *>(&address), sizeof(T));
    }
    const Fd &bind(const sockaddr *address, socklen_t socklen) const;
    template <typename T>
    const Fd &connect(const T &address) const {
        static_assert(sizeof(T) >= sizeof(sockaddr));
        return connect(reinterpret_cast<const sockaddr *>(&address), sizeof(T));
    }
    const Fd &connect(const sockaddr *address, socklen_t socklen) const;
    const Fd &listen(int backlog) const;

    Fd accept(sockaddr *address, socklen_t *socklen) const;
    static Fd socket(int domain, int type, int protocol);
    static std::pair<Fd, Fd> socket_pair();
};
