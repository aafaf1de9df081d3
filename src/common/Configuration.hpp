#pragma once

#include "Time.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

#include <spdlog/common.h>

/**
 * Environment variables read by Configuration. The two directories are required; everything else has a default.
 */
static inline constexpr auto WAYSTONE_AREA_DIR_ENV = "WAYSTONE_AREA_DIR";
static inline constexpr auto WAYSTONE_DATA_DIR_ENV = "WAYSTONE_DATA_DIR";
static inline constexpr auto WAYSTONE_HOST_ENV = "WAYSTONE_HOST";
static inline constexpr auto WAYSTONE_PORT_ENV = "WAYSTONE_PORT";
static inline constexpr auto WAYSTONE_MAX_CONNECTIONS_PER_IP_ENV = "WAYSTONE_MAX_CONNECTIONS_PER_IP";
static inline constexpr auto WAYSTONE_SESSION_TIMEOUT_MINUTES_ENV = "WAYSTONE_SESSION_TIMEOUT_MINUTES";
static inline constexpr auto WAYSTONE_READ_TIMEOUT_SECONDS_ENV = "WAYSTONE_READ_TIMEOUT_SECONDS";
static inline constexpr auto WAYSTONE_TICK_SECONDS_ENV = "WAYSTONE_TICK_SECONDS";
static inline constexpr auto WAYSTONE_COMMAND_RATE_LIMIT_ENV = "WAYSTONE_COMMAND_RATE_LIMIT";
static inline constexpr auto WAYSTONE_STARTING_ROOM_ENV = "WAYSTONE_STARTING_ROOM";
static inline constexpr auto WAYSTONE_LOG_LEVEL_ENV = "WAYSTONE_LOG_LEVEL";

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Accessors for configuration settings. The server uses the static singleton; tests construct their own
 * after setting up the environment.
 */
class Configuration {
public:
    Configuration();
    [[nodiscard]] const std::string &area_dir() const noexcept { return area_dir_; }
    [[nodiscard]] const std::string &data_dir() const noexcept { return data_dir_; }
    [[nodiscard]] const std::string &area_file() const noexcept { return area_file_; }
    [[nodiscard]] const std::string &host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    void port(uint16_t port) noexcept { port_ = port; }
    [[nodiscard]] size_t max_connections_per_ip() const noexcept { return max_connections_per_ip_; }
    [[nodiscard]] Minutes session_timeout() const noexcept { return session_timeout_; }
    [[nodiscard]] Seconds read_timeout() const noexcept { return read_timeout_; }
    [[nodiscard]] Seconds tick_interval() const noexcept { return tick_interval_; }
    [[nodiscard]] int command_rate_limit() const noexcept { return command_rate_limit_; }
    [[nodiscard]] const std::string &starting_room() const noexcept { return starting_room_; }
    [[nodiscard]] spdlog::level::level_enum log_level() const noexcept { return log_level_; }

    static Configuration &singleton();

private:
    [[nodiscard]] static bool is_valid_dir(const char *dirname);
    [[nodiscard]] static std::string require_path_env(const std::string &envkey);
    [[nodiscard]] static std::string make_path(std::string dir);
    [[nodiscard]] static int int_env(const std::string &envkey, int default_value, int min_value);
    [[nodiscard]] static std::string string_env(const std::string &envkey, std::string default_value);
    std::string area_dir_;
    std::string data_dir_;
    std::string area_file_;
    std::string host_;
    uint16_t port_;
    size_t max_connections_per_ip_;
    Minutes session_timeout_;
    Seconds read_timeout_;
    Seconds tick_interval_;
    int command_rate_limit_;
    std::string starting_room_;
    spdlog::level::level_enum log_level_;
};
