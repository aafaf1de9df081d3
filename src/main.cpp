/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "Engine.hpp"
#include "FileDatabase.hpp"
#include "common/Configuration.hpp"
#include "common/Logger.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <memory>
#include <stdexcept>

namespace {

int Main(Logger &log, int argc, char *argv[]) {
    bool help = false;
    bool debug = false;
    int port = -1;
    auto cli = lyra::cli() | lyra::help(help).description("The Waystone MUD server.")("show this help")
               | lyra::opt(port, "port")["-p"]["--port"]("listen on this port instead of the configured one")
               | lyra::opt(debug)["-d"]["--debug"]("enable debugging");

    auto result = cli.parse({argc, argv});
    if (!result) {
        fmt::print("Error in command line: {}\n", result.errorMessage());
        return 1;
    } else if (help) {
        fmt::print("{}", fmt::streamed(cli));
        return 0;
    }
    if (port < -1 || port > 65535) {
        fmt::print("Error in command line: port must be between 0 and 65535\n");
        return 1;
    }

    auto config = Configuration::singleton();
    set_log_level(debug ? spdlog::level::debug : config.log_level());
    if (debug)
        log.info("Debugging logging enabled");
    if (port >= 0)
        config.port(static_cast<uint16_t>(port));

    log.info("Waystone starting up");
    Engine engine(config, std::make_unique<FileDatabase>(config.data_dir()));
    engine.start();
    engine.run();
    return 0;
}

}

int main(int argc, char *argv[]) {
    auto log = logger_for("main");
    try {
        return Main(log, argc, argv);
    } catch (const std::runtime_error &re) {
        log.critical("{}", re.what());
        return 1;
    }
}
