#include "Fd.hpp"

#include <fmt/format.h>

void Fd::write(const void *data, size_t length) const {
    if (!is_open())
        throw std::runtime_error("Write called on invalid file descriptor");
    auto num = ::write(fd_, data, length);
    if (num < 0)
        throw fmt::system_error(errno, "Unable to write to {}", fd_);
    if (static_cast<size_t>(num) != length)
        throw std::runtime_error(fmt::format("Truncated write to file descriptor {} ({}/{})", fd_, num, length));
}

size_t Fd::try_read_some(gsl::span<byte> span) const {
    ssize_t num_bytes = ::read(fd_, span.data(), span.size_bytes());
    if (num_bytes < 0)
        throw fmt::system_error(errno, "Unable to read from {}", fd_);
    return static_cast<size_t>(num_bytes);
}

size_t Fd::try_send_some(std::string_view data) const {
    if (!is_open())
        throw std::runtime_error("Send called on invalid file descriptor");
    auto num = ::send(fd_, data.data(), data.size(), MSG_DONTWAIT | MSG_NOSIGNAL);
    if (num < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return 0;
        throw fmt::system_error(errno, "Unable to send to {}", fd_);
    }
    return static_cast<size_t>(num);
}

short Fd::poll(short events, std::chrono::milliseconds timeout) const {
    pollfd pfd{number(), events, 0};
    auto result = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (result < 0) {
        if (errno == EINTR)
            return 0;
        throw fmt::system_error(errno, "Unable to poll {}", fd_);
    }
    return result == 0 ? 0 : pfd.revents;
}

void Fd::shutdown() const noexcept {
    if (is_open())
        ::shutdown(fd_, SHUT_RDWR);
}

Fd Fd::accept(sockaddr *address, socklen_t *socklen) const {
    auto accepted_fd = ::accept(fd_, address, socklen);
    if (accepted_fd < 0)
        throw fmt::system_error(errno, "Unable to accept from file descriptor {}", fd_);
    return Fd(accepted_fd);
}

Fd Fd::socket(int domain, int type, int protocol) {
    int socket_fd = ::socket(domain, type, protocol);
    if (socket_fd < 0)
        throw fmt::system_error(
            errno, "Unable to create a socket (domain {}, type {}, protocol {})", domain, type, protocol);
    return Fd(socket_fd);
}

std::pair<Fd, Fd> Fd::socket_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) < 0)
        throw fmt::system_error(errno, "Unable to create a socket pair");
    return {Fd(fds[0]), Fd(fds[1])};
}

const Fd &Fd::setsockopt(int level, int optname, const void *optval, socklen_t optlen) const {
    if (!is_open())
        throw std::runtime_error("setsockopt called on invalid file descriptor");

    if (::setsockopt(fd_, level, optname, optval, optlen) < 0)
        throw fmt::system_error(errno, "Unable to set socket option {}:{}", level, optname);
    return *this;
}

const Fd &Fd::bind(const sockaddr *address, socklen_t socklen) const {
    if (::bind(fd_, address, socklen) < 0)
        throw fmt::system_error(errno, "Unable to bind to address");
    return *this;
}

const Fd &Fd::listen(int backlog) const {
    if (::listen(fd_, backlog) < 0)
        throw fmt::system_error(errno, "Unable to listen");
    return *this;
}

const Fd &Fd::connect(const sockaddr *address, socklen_t socklen) const {
    if (::connect(fd_, address, socklen) < 0)
        throw fmt::system_error(errno, "Unable to connect");
    return *this;
}
