#include "Listener.hpp"

#include "common/mask_hostname.hpp"

#include <fmt/format.h>

#include <arpa/inet.h>
#include <netinet/in.h>

using namespace std::literals;

Listener::Listener(const std::string &host, uint16_t port, size_t max_connections_per_address)
    : log_(logger_for("Listener")), address_limiter_(max_connections_per_address) {
    log_.info("Attempting to bind to {}:{}", host, port);
    listen_sock_ = Fd::socket(PF_INET, SOCK_STREAM, IPPROTO_TCP);

    sockaddr_in sin{};
    sin.sin_family = AF_INET;
    sin.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &sin.sin_addr) != 1)
        throw std::runtime_error(fmt::format("Unable to parse bind address '{}'", host));
    listen_sock_.setsockopt(SOL_SOCKET, SO_REUSEADDR, static_cast<int>(1))
        .setsockopt(SOL_SOCKET, SO_LINGER, linger{true, 2})
        .bind(sin)
        .listen(16);

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (getsockname(listen_sock_.number(), reinterpret_cast<sockaddr *>(&bound), &len) < 0)
        throw fmt::system_error(errno, "Unable to determine bound port");
    port_ = ntohs(bound.sin_port);

    log_.info("Listening for connections on port {}", port_);
}

std::shared_ptr<Connection> Listener::accept(Seconds read_timeout) {
    sockaddr_in incoming{};
    socklen_t len = sizeof(incoming);
    try {
        auto new_fd = listen_sock_.accept(reinterpret_cast<sockaddr *>(&incoming), &len);
        char address_buf[INET_ADDRSTRLEN]{};
        auto address = std::string(inet_ntop(AF_INET, &incoming.sin_addr, address_buf, sizeof(address_buf)));

        auto slot = address_limiter_.try_reserve(address);
        if (!slot) {
            log_.warn("Rejected connection from {} - already {} connections from there",
                      get_masked_hostname(address), address_limiter_.max_per_address());
            new_fd.write("Too many connections from your IP address.\r\n"sv);
            return {};
        }
        return std::make_shared<Connection>(id_allocator_.reserve(), std::move(slot), std::move(new_fd),
                                            std::move(address), read_timeout);
    } catch (const std::runtime_error &re) {
        log_.warn("Unable to accept new connection: {}", re.what());
        return {};
    }
}
