#include "Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>

namespace {
std::shared_ptr<spdlog::sinks::sink> console_sink;
std::once_flag console_sink_created;
}

// Connections and sessions create loggers from their own threads, so the shared sink is created once under a flag and
// is itself a thread-safe (_mt) sink.
Logger logger_for(std::string name) {
    std::call_once(console_sink_created,
                   [] { console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(); });
    auto logger = spdlog::logger(std::move(name), console_sink);
    logger.set_level(spdlog::default_logger()->level());
    return logger;
}

void set_log_level(spdlog::level::level_enum level) { spdlog::set_level(level); }
