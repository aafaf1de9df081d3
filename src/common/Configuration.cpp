#include "Configuration.hpp"

#include <fmt/format.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <charconv>
#include <limits>

Configuration::Configuration() {
    area_dir_ = make_path(require_path_env(WAYSTONE_AREA_DIR_ENV));
    data_dir_ = make_path(require_path_env(WAYSTONE_DATA_DIR_ENV));
    area_file_ = area_dir_ + "area.lst";
    host_ = string_env(WAYSTONE_HOST_ENV, "0.0.0.0");
    const auto port = int_env(WAYSTONE_PORT_ENV, 4000, 0);
    if (port > std::numeric_limits<uint16_t>::max())
        throw ConfigurationError(fmt::format("{} is not a valid port number", WAYSTONE_PORT_ENV));
    port_ = static_cast<uint16_t>(port);
    max_connections_per_ip_ = static_cast<size_t>(int_env(WAYSTONE_MAX_CONNECTIONS_PER_IP_ENV, 5, 1));
    session_timeout_ = Minutes(int_env(WAYSTONE_SESSION_TIMEOUT_MINUTES_ENV, 60, 1));
    read_timeout_ = Seconds(int_env(WAYSTONE_READ_TIMEOUT_SECONDS_ENV, 300, 1));
    tick_interval_ = Seconds(int_env(WAYSTONE_TICK_SECONDS_ENV, 30, 1));
    command_rate_limit_ = int_env(WAYSTONE_COMMAND_RATE_LIMIT_ENV, 10, 1);
    starting_room_ = string_env(WAYSTONE_STARTING_ROOM_ENV, "university_main_gates");
    const auto level_name = string_env(WAYSTONE_LOG_LEVEL_ENV, "info");
    log_level_ = spdlog::level::from_str(level_name);
    // from_str maps anything it doesn't recognise to "off".
    if (log_level_ == spdlog::level::off && level_name != "off")
        throw ConfigurationError(fmt::format("{} has an unknown log level '{}'", WAYSTONE_LOG_LEVEL_ENV, level_name));
}

bool Configuration::is_valid_dir(const char *dirname) {
    if (!dirname) {
        return false;
    }
    struct stat dir;
    return !stat(dirname, &dir) && S_ISDIR(dir.st_mode);
}

std::string Configuration::require_path_env(const std::string &envkey) {
    const auto value = std::getenv(envkey.c_str());
    if (!is_valid_dir(value)) {
        throw ConfigurationError(
            fmt::format("An environment variable called {} must specify a directory path", envkey));
    }
    return value;
}

std::string Configuration::make_path(std::string dir) {
    if (dir.empty()) {
        return "./";
    } else if (dir.back() != '/') {
        dir.append("/");
    }
    return dir;
}

int Configuration::int_env(const std::string &envkey, const int default_value, const int min_value) {
    const auto value = std::getenv(envkey.c_str());
    if (!value)
        return default_value;
    const std::string_view text(value);
    int result{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc() || ptr != text.data() + text.size() || result < min_value)
        throw ConfigurationError(fmt::format("{} must be an integer of at least {}, not '{}'", envkey, min_value, text));
    return result;
}

std::string Configuration::string_env(const std::string &envkey, std::string default_value) {
    const auto value = std::getenv(envkey.c_str());
    return value && *value ? std::string(value) : std::move(default_value);
}

Configuration &Configuration::singleton() {
    static Configuration singleton;
    return singleton;
}
