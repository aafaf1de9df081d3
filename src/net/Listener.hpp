#pragma once

#include "AddressLimiter.hpp"
#include "Connection.hpp"
#include "IdAllocator.hpp"
#include "common/Fd.hpp"
#include "common/Logger.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

// Owns the listening socket and turns incoming TCP connections into Connections, enforcing the per-address cap.
// Connections handed out hold reservations in this listener, so it must outlive them.
class Listener {
    mutable Logger log_;
    Fd listen_sock_;
    uint16_t port_;
    IdAllocator id_allocator_;
    AddressLimiter address_limiter_;

public:
    // Binds and listens; throws fmt::system_error if the address can't be used.
    Listener(const std::string &host, uint16_t port, size_t max_connections_per_address);

    Listener(const Listener &) = delete;
    Listener(Listener &&) = delete;
    Listener &operator=(const Listener &) = delete;
    Listener &operator=(Listener &&) = delete;

    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] const Fd &fd() const noexcept { return listen_sock_; }
    [[nodiscard]] const AddressLimiter &address_limiter() const noexcept { return address_limiter_; }

    // Accepts one pending connection. Returns nullptr if the client was turned away or accept failed.
    [[nodiscard]] std::shared_ptr<Connection> accept(Seconds read_timeout);
    void close() { listen_sock_.close(); }
};
