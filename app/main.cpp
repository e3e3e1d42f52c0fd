#include <asio.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <medusa/config/config.hpp>
#include <medusa/core/router.hpp>
#include <medusa/core/store.hpp>
#include <medusa/net/server.hpp>
#include <medusa/util/log.hpp>
#include <medusa/util/thread_pool.hpp>
#include <medusa/version.hpp>

using namespace medusa;

int main(int argc, char** argv) {
    Config cfg;
    try {
        bool help = false;
        cfg = Config::load(argc, argv, help);
        if (help) {
            std::cout << Config::usage();
            return 0;
        }
    }
    catch (const ConfigError& e) {
        std::cerr << "medusa-server: " << e.what() << "\n" << Config::usage();
        return 2;
    }

    if (auto lvl = log::parse_level(cfg.log_level)) log::set_level(*lvl);

    std::cout << "Medusa " << MEDUSA_VERSION << " - in-memory key-value store\n\n"
        << cfg.describe() << "\n";

    try {
        asio::io_context io;

        auto store = std::make_shared<Store>();
        Router router(store, cfg.max_key_length, cfg.max_value_length);
        // declared after the router so queued jobs drain while it is alive
        ThreadPool pool(cfg.effective_workers());

        SessionOptions opts;
        opts.max_line_length = cfg.max_line_length;
        opts.enable_timeouts = cfg.enable_timeouts;
        opts.idle_timeout = cfg.connection_timeout;
        Server server(io, cfg.host, cfg.port, router, pool, cfg.max_connections, opts);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int sig) {
            if (ec) return;
            log::info("signal " + std::to_string(sig) + " received, shutting down");
            server.stop();
            io.stop();
            });

        log::info("Medusa server running on " + cfg.host + ":" + std::to_string(server.port()));
        io.run();
    }
    catch (const std::exception& e) {
        log::error(std::string("fatal: ") + e.what());
        return 1;
    }
    return 0;
}
