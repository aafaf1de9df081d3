/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "Engine.hpp"
#include "RateLimiter.hpp"
#include "WorldLoader.hpp"
#include "commands/commands.hpp"
#include "common/string_utils.hpp"
#include "net/Connection.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>

#include <poll.h>
#include <sys/signalfd.h>

namespace {

constexpr auto PollTimeout = 1000; // ms

}

std::string welcome_banner() {
    return "\n"
           "|C==============================================================|p\n"
           "|Y                     Welcome to Waystone|p\n"
           "|c            A world of sympathy, secrets and song|p\n"
           "|C==============================================================|p\n"
           "\n"
           "  Type |Wlogin <username>|p to sign in to your account.\n"
           "  Type |Wregister <username> <password> <email>|p to create a new one.\n"
           "  Type |Whelp|p for a list of commands.\n"
           "\n";
}

Engine::Engine(Configuration config, std::unique_ptr<Database> database)
    : log_(logger_for("Engine")), config_(std::move(config)), database_(std::move(database)),
      boot_time_(Clock::now()), last_tick_(boot_time_) {
    register_default_commands(commands_);
    add_tick_callback("idle sessions", [this](Mud &mud) {
        if (auto expired = mud.sessions().cleanup_expired(mud.config().session_timeout()))
            log_.info("Disconnected {} idle session(s)", expired);
    });
    add_tick_callback("occupancy", [this](Mud &mud) {
        log_.debug("{} session(s) connected, {} character(s) playing", mud.sessions().size(),
                   mud.characters().size());
    });
}

Engine::~Engine() { stop(); }

void Engine::broadcast_to_room(const std::string &room_id, std::string_view message,
                               std::optional<SessionId> exclude) {
    const auto *room = world_.find(room_id);
    if (!room)
        return;
    for (auto &character_id : room->occupants()) {
        auto session = characters_.find(character_id);
        if (!session || (exclude && session->id() == *exclude))
            continue;
        session->connection().send_line(message);
    }
}

void Engine::broadcast(std::string_view message) {
    for (auto &session : characters_.sessions())
        session->connection().send_line(message);
}

bool Engine::send_to_character(const std::string &character_id, std::string_view message) {
    auto session = characters_.find(character_id);
    if (!session)
        return false;
    session->connection().send_line(message);
    return true;
}

void Engine::leave_world(Session &session) {
    const auto character_id = session.character_id();
    if (!character_id)
        return;
    session.clear_character();
    // Once unbound the character may already be in play elsewhere. Only its owner takes it out of the world.
    if (auto owner = characters_.find(*character_id); !owner || owner->id() != session.id())
        return;
    const auto room_id = world_.remove(*character_id);
    characters_.unbind(*character_id, session.id());
    if (!room_id)
        return;
    try {
        auto txn = database_->begin();
        auto character = txn->find_character(*character_id);
        if (!character)
            return;
        broadcast_to_room(*room_id, fmt::format("{} has left the realm.", character->name));
        character->room_id = *room_id;
        txn->put_character(*character);
        txn->commit();
    } catch (const DatabaseError &error) {
        log_.error("Unable to save character {}: {}", *character_id, error.what());
    }
}

void Engine::load_world() { WorldLoader().load_area_list(config_.area_dir(), world_); }

void Engine::process_command(Session &session, std::string_view line) {
    const auto text = trim(line);
    if (text.empty())
        return;
    std::string verb;
    std::string_view arguments;
    if (text.front() == '\'' || text.front() == ':') {
        verb = std::string(1, text.front());
        arguments = text.substr(1);
    } else {
        const auto verb_end = std::min(text.find_first_of(" \t"), text.size());
        verb = lower_case(text.substr(0, verb_end));
        arguments = text.substr(verb_end);
    }

    auto &connection = session.connection();
    const auto *command = commands_.get(verb);
    if (!command) {
        connection.send_line(fmt::format("Unknown command '{}'. Type 'help' for a list of commands.", verb));
        return;
    }
    Context ctx{session, connection, *this, split_words(arguments), std::string(text)};
    try {
        command->execute(ctx);
    } catch (const ConnectionError &) {
        throw;
    } catch (const std::exception &e) {
        log_.error("Session {}: command '{}' failed on input '{}': {}", session.id(), verb, text,
                   e.what());
        connection.send_line("Something went wrong. Please try again.");
    }
}

std::string_view Engine::prompt_for(const Session &session) {
    if (session.state() == SessionState::Playing)
        return "> ";
    if (session.user_id())
        return "(Character Select) > ";
    return "(Login) > ";
}

void Engine::serve(std::shared_ptr<Connection> connection) {
    connection->negotiate();
    auto session = sessions_.create_session(connection);
    connection->send(welcome_banner());
    RateLimiter limiter(config_.command_rate_limit());
    try {
        while (!connection->is_closed()) {
            // After a logout the connection carries on with a fresh session.
            if (session->state() == SessionState::Disconnected)
                session = sessions_.create_session(connection);
            connection->send(prompt_for(*session));
            const auto line = connection->read_line();
            if (line.empty())
                continue;
            if (!limiter.allow(Clock::now())) {
                connection->send_line("You are sending commands too quickly.");
                continue;
            }
            session->touch();
            process_command(*session, line);
        }
    } catch (const ConnectionError &error) {
        log_.info("Session {} ended: {}", session->id(), error.what());
    }
    leave_world(*session);
    sessions_.destroy_session(session->id());
    connection->close();
}

void Engine::add_tick_callback(std::string name, TickCallback callback) {
    tick_callbacks_.emplace_back(std::move(name), std::move(callback));
}

void Engine::run_tick() {
    for (auto &[name, callback] : tick_callbacks_) {
        try {
            callback(*this);
        } catch (const std::exception &e) {
            log_.error("Tick callback '{}' failed: {}", name, e.what());
        }
    }
}

void Engine::start() {
    load_world();
    if (!world_.find(config_.starting_room()))
        throw WorldLoadError(fmt::format("The starting room '{}' does not exist", config_.starting_room()));

    listener_ = std::make_unique<Listener>(config_.host(), config_.port(), config_.max_connections_per_ip());

    ::signal(SIGPIPE, SIG_IGN);
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    if (auto rc = ::pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0)
        throw fmt::system_error(rc, "pthread_sigmask");
    signal_fd_ = Fd(::signalfd(-1, &signals, SFD_NONBLOCK | SFD_CLOEXEC));
    if (!signal_fd_.is_open())
        throw fmt::system_error(errno, "signalfd");
    log_.info("Waystone is ready to rock on {}:{}", config_.host(), listener_->port());
}

uint16_t Engine::port() const { return listener_ ? listener_->port() : config_.port(); }

bool Engine::handle_signal() {
    signalfd_siginfo info{};
    if (::read(signal_fd_.number(), &info, sizeof(info)) != sizeof(info)) {
        log_.warn("Unable to read signal info - treating as term");
        info.ssi_signo = SIGTERM;
    }
    if (info.ssi_signo == SIGTERM || info.ssi_signo == SIGINT) {
        log_.info("Caught {}, shutting down", ::strsignal(static_cast<int>(info.ssi_signo)));
        return true;
    }
    log_.warn("Unexpected signal {}: ignoring", info.ssi_signo);
    return false;
}

void Engine::spawn(std::shared_ptr<Connection> connection) {
    std::lock_guard lock(threads_mutex_);
    if (stop_requested_) {
        connection->close();
        return;
    }
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto &entry = threads_.emplace_back(ConnectionThread{connection, done, {}});
    entry.thread = std::thread([this, connection = std::move(connection), done]() mutable {
        try {
            serve(connection);
        } catch (const std::exception &e) {
            log_.error("Connection {} failed: {}", connection->id(), e.what());
            connection->close();
        }
        *done = true;
    });
}

void Engine::reap_finished_threads() {
    std::lock_guard lock(threads_mutex_);
    for (auto it = threads_.begin(); it != threads_.end();) {
        if (*it->done) {
            it->thread.join();
            it = threads_.erase(it);
        } else {
            ++it;
        }
    }
}

void Engine::run() {
    if (!listener_ || !signal_fd_.is_open())
        throw std::logic_error("Engine::run() called before start()");
    last_tick_ = Clock::now();
    while (!stop_requested_) {
        pollfd fds[2] = {{listener_->fd().number(), POLLIN, 0}, {signal_fd_.number(), POLLIN, 0}};
        if (::poll(fds, 2, PollTimeout) < 0) {
            if (errno == EINTR)
                continue;
            throw fmt::system_error(errno, "poll");
        }
        if ((fds[1].revents & POLLIN) && handle_signal())
            break;
        if (fds[0].revents & POLLIN) {
            if (auto connection = listener_->accept(config_.read_timeout()))
                spawn(std::move(connection));
        }
        reap_finished_threads();
        if (const auto now = Clock::now(); now - last_tick_ >= config_.tick_interval()) {
            last_tick_ = now;
            run_tick();
        }
    }
    stop();
}

void Engine::stop() {
    {
        std::lock_guard lock(stop_mutex_);
        if (stopped_)
            return;
        stopped_ = true;
    }
    stop_requested_ = true;
    for (auto &session : sessions_.all()) {
        session->connection().send_line("Server is shutting down. Goodbye!");
        session->connection().close();
    }
    if (listener_)
        listener_->close();
    {
        std::lock_guard lock(threads_mutex_);
        // Connections accepted but not yet given a session.
        for (auto &entry : threads_)
            entry.connection->close();
        for (auto &entry : threads_)
            if (entry.thread.joinable())
                entry.thread.join();
        threads_.clear();
    }
    signal_fd_.close();
    log_.info("Waystone MUD server stopped.");
}
