#include <medusa/config/config.hpp>
#include <medusa/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <thread>

namespace medusa {

    // ---------- helpers
    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    static std::optional<unsigned long long> parse_ull(const std::string& s) {
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
        try { return std::stoull(s); }
        catch (const std::out_of_range&) { return std::nullopt; }
    }

    static std::optional<uint16_t> parse_port(const std::string& s) {
        auto v = parse_ull(s);
        if (!v || *v == 0 || *v > std::numeric_limits<uint16_t>::max()) return std::nullopt;
        return static_cast<uint16_t>(*v);
    }

    static const char* env(const char* name) {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    }

    // Environment

    void Config::apply_env() {
        if (auto v = env("MEDUSA_HOST")) host = v;
        if (auto v = env("MEDUSA_PORT")) {
            if (auto p = parse_port(v)) port = *p;
        }
        if (auto v = env("MEDUSA_MAX_CONNECTIONS")) {
            if (auto n = parse_ull(v)) max_connections = static_cast<std::size_t>(*n);
        }
        if (auto v = env("MEDUSA_TIMEOUT")) {
            if (auto n = parse_ull(v)) connection_timeout = std::chrono::seconds(*n);
        }
        if (auto v = env("MEDUSA_ENABLE_TIMEOUTS")) enable_timeouts = lower(v) == "true";
        if (auto v = env("MEDUSA_LOG_LEVEL")) {
            if (log::parse_level(v)) log_level = lower(v);
        }
        if (auto v = env("MEDUSA_WORKERS")) {
            if (auto n = parse_ull(v)) worker_threads = static_cast<std::size_t>(*n);
        }
    }

    // Command line

    bool Config::apply_args(const std::vector<std::string>& args) {
        auto value_of = [&](std::size_t& i) -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError("missing value for " + args[i]);
            return args[++i];
        };
        auto number_of = [&](std::size_t& i) -> unsigned long long {
            const std::string& flag = args[i];
            const std::string& v = value_of(i);
            auto n = parse_ull(v);
            if (!n) throw ConfigError("invalid value '" + v + "' for " + flag);
            return *n;
        };

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& a = args[i];
            if (a == "--host" || a == "-h") {
                host = value_of(i);
            }
            else if (a == "--port" || a == "-p") {
                const std::string& v = value_of(i);
                auto p = parse_port(v);
                if (!p) throw ConfigError("invalid port '" + v + "'");
                port = *p;
            }
            else if (a == "--max-connections") {
                max_connections = static_cast<std::size_t>(number_of(i));
            }
            else if (a == "--timeout") {
                connection_timeout = std::chrono::seconds(number_of(i));
            }
            else if (a == "--enable-timeouts") {
                enable_timeouts = true;
            }
            else if (a == "--log-level") {
                const std::string& v = value_of(i);
                if (!log::parse_level(v)) throw ConfigError("invalid log level '" + v + "'");
                log_level = lower(v);
            }
            else if (a == "--workers") {
                worker_threads = static_cast<std::size_t>(number_of(i));
            }
            else if (a == "--help" || a == "-?") {
                return false;
            }
            else if (i == 0 && parse_port(a)) {
                // backward-compat: first arg as port (e.g., "2312")
                port = *parse_port(a);
            }
            else {
                throw ConfigError("unknown option '" + a + "'");
            }
        }
        if (max_connections == 0) throw ConfigError("max connections must be at least 1");
        return true;
    }

    Config Config::load(int argc, char** argv, bool& help) {
        Config c;
        c.apply_env();
        std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
        help = !c.apply_args(args);
        return c;
    }

    std::size_t Config::effective_workers() const {
        if (worker_threads > 0) return worker_threads;
        // keep one thread for Asio, rest for workers
        unsigned hc = std::max(1u, std::thread::hardware_concurrency());
        return hc > 1 ? hc - 1 : 1;
    }

    std::string Config::describe() const {
        std::ostringstream o;
        o << "Medusa configuration:\n"
          << "  host:            " << host << "\n"
          << "  port:            " << port << "\n"
          << "  max connections: " << max_connections << "\n"
          << "  timeouts:        " << (enable_timeouts ? "enabled" : "disabled") << "\n";
        if (enable_timeouts)
            o << "  idle timeout:    " << connection_timeout.count() << "s\n";
        o << "  workers:         " << effective_workers() << "\n"
          << "  log level:       " << log_level << "\n";
        return o.str();
    }

    std::string Config::usage() {
        return "Usage: medusa-server [--host H] [--port N] [--max-connections N]\n"
               "                     [--timeout SECS] [--enable-timeouts]\n"
               "                     [--log-level debug|info|warn|error|off] [--workers N]\n"
               "Environment: MEDUSA_HOST MEDUSA_PORT MEDUSA_MAX_CONNECTIONS MEDUSA_TIMEOUT\n"
               "             MEDUSA_ENABLE_TIMEOUTS MEDUSA_LOG_LEVEL MEDUSA_WORKERS\n";
    }

} // namespace medusa
