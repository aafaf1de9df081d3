/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "CharacterIndex.hpp"
#include "CommandRegistry.hpp"
#include "Database.hpp"
#include "Mud.hpp"
#include "SessionRegistry.hpp"
#include "World.hpp"
#include "common/Configuration.hpp"
#include "common/Fd.hpp"
#include "common/Logger.hpp"
#include "net/Listener.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

class Connection;

// Owns the whole server: the world, the sessions, the database and the listening socket. The main thread runs the
// accept and tick loop; every connection gets a thread of its own running serve().
class Engine : public Mud {
public:
    using TickCallback = std::function<void(Mud &)>;

private:
    struct ConnectionThread {
        std::shared_ptr<Connection> connection;
        std::shared_ptr<std::atomic<bool>> done;
        std::thread thread;
    };

    mutable Logger log_;
    Configuration config_;
    std::unique_ptr<Database> database_;
    World world_;
    SessionRegistry sessions_;
    CharacterIndex characters_;
    CommandRegistry commands_;
    Time boot_time_;

    std::unique_ptr<Listener> listener_;
    Fd signal_fd_;
    std::atomic<bool> stop_requested_{};
    std::mutex stop_mutex_;
    bool stopped_{};

    std::mutex threads_mutex_;
    std::list<ConnectionThread> threads_;

    std::vector<std::pair<std::string, TickCallback>> tick_callbacks_;
    Time last_tick_;

    void spawn(std::shared_ptr<Connection> connection);
    void reap_finished_threads();
    [[nodiscard]] bool handle_signal();
    [[nodiscard]] static std::string_view prompt_for(const Session &session);

public:
    Engine(Configuration config, std::unique_ptr<Database> database);
    ~Engine() override;

    Engine(const Engine &) = delete;
    Engine(Engine &&) = delete;
    Engine &operator=(const Engine &) = delete;
    Engine &operator=(Engine &&) = delete;

    const Configuration &config() const override { return config_; }
    World &world() override { return world_; }
    SessionRegistry &sessions() override { return sessions_; }
    CharacterIndex &characters() override { return characters_; }
    Database &database() override { return *database_; }
    const CommandRegistry &commands() const override { return commands_; }
    [[nodiscard]] CommandRegistry &command_registry() { return commands_; }

    void broadcast_to_room(const std::string &room_id, std::string_view message,
                           std::optional<SessionId> exclude = std::nullopt) override;
    void broadcast(std::string_view message) override;
    bool send_to_character(const std::string &character_id, std::string_view message) override;
    void leave_world(Session &session) override;

    Time boot_time() const override { return boot_time_; }
    Time current_time() const override { return Clock::now(); }

    // Loads the areas named by the configuration. Throws WorldLoadError.
    void load_world();

    // Runs one line of input as a command on behalf of the session. Failures inside the command are reported to the
    // player and logged; only a ConnectionError escapes.
    void process_command(Session &session, std::string_view line);

    // The per-connection loop: banner, then prompt, read and dispatch until the client goes away.
    void serve(std::shared_ptr<Connection> connection);

    void add_tick_callback(std::string name, TickCallback callback);
    void run_tick();

    // Loads the world, checks the starting room exists, binds the listener and takes over SIGTERM and SIGINT.
    // Anything going wrong here is fatal.
    void start();
    [[nodiscard]] uint16_t port() const;
    // Accepts connections and runs ticks until a termination signal arrives or request_stop() is called, then
    // shuts down.
    void run();
    // May be called from any thread; run() notices within a second.
    void request_stop() noexcept { stop_requested_ = true; }
    // Says goodbye to everyone, closes every connection and the listener and waits for the connection threads.
    // Idempotent. Must not race with run(): use request_stop() from other threads.
    void stop();
};

// The text every new connection is greeted with.
[[nodiscard]] std::string welcome_banner();
