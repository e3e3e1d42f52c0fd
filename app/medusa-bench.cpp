#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using asio::ip::tcp;
using Clock = std::chrono::steady_clock;

struct BenchResult {
    std::size_t operations = 0;
    std::size_t failures = 0;
    Clock::duration duration{};

    double ops_per_second() const {
        double s = std::chrono::duration<double>(duration).count();
        return s > 0 ? operations / s : 0.0;
    }
    double avg_latency_ms() const {
        double ms = std::chrono::duration<double, std::milli>(duration).count();
        return operations ? ms / operations : 0.0;
    }
    void print(const std::string& name) const {
        std::cout << "Benchmark: " << name << "\n"
            << "  operations:  " << operations << "\n"
            << "  failures:    " << failures << "\n"
            << "  duration:    " << std::fixed << std::setprecision(3)
            << std::chrono::duration<double>(duration).count() << "s\n"
            << "  ops/sec:     " << std::setprecision(2) << ops_per_second() << "\n"
            << "  avg latency: " << avg_latency_ms() << "ms\n\n";
    }
};

// Blocking request/response over one connection
class Conn {
public:
    Conn(asio::io_context& io, const std::string& host, uint16_t port) : sock_(io) {
        tcp::resolver res(io);
        asio::connect(sock_, res.resolve(host, std::to_string(port)));
        std::string banner;
        read_line(banner);
    }

    std::string call(const std::string& cmd) {
        std::string req = cmd + "\n";
        asio::write(sock_, asio::buffer(req));
        std::string reply;
        read_line(reply);
        return reply;
    }

private:
    void read_line(std::string& line) {
        for (;;) {
            auto pos = buf_.find('\n');
            if (pos != std::string::npos) {
                line.assign(buf_.data(), pos);
                buf_.erase(0, pos + 1);
                return;
            }
            char tmp[4096];
            std::size_t n = sock_.read_some(asio::buffer(tmp)); // throws on error
            buf_.append(tmp, tmp + n);
        }
    }

    tcp::socket sock_;
    std::string buf_;
};

// Runs `ops` commands split across `clients` connections.
template <class MakeCmd>
static BenchResult run(const std::string& host, uint16_t port, std::size_t ops, std::size_t clients, MakeCmd make) {
    std::atomic<std::size_t> done{ 0 }, failed{ 0 };
    std::vector<std::thread> threads;
    auto start = Clock::now();
    for (std::size_t c = 0; c < clients; ++c) {
        threads.emplace_back([&, c] {
            try {
                asio::io_context io;
                Conn conn(io, host, port);
                for (std::size_t i = c; i < ops; i += clients) {
                    auto reply = conn.call(make(i));
                    if (reply.rfind("ERROR", 0) == 0) ++failed;
                    ++done;
                }
            }
            catch (const std::exception& e) {
                std::cerr << "client " << c << ": " << e.what() << "\n";
                ++failed;
            }
            });
    }
    for (auto& t : threads) t.join();

    BenchResult r;
    r.operations = done.load();
    r.failures = failed.load();
    r.duration = Clock::now() - start;
    return r;
}

int main(int argc, char** argv) {
    std::string host = "127.0.0.1";
    uint16_t port = 2312;
    std::size_t ops = 10000;
    std::size_t clients = 4;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if ((a == "-h" || a == "--host") && i + 1 < argc) host = argv[++i];
            else if ((a == "-p" || a == "--port") && i + 1 < argc) port = static_cast<uint16_t>(std::stoi(argv[++i]));
            else if (a == "-n" && i + 1 < argc) ops = std::stoull(argv[++i]);
            else if (a == "-c" && i + 1 < argc) clients = std::stoull(argv[++i]);
            else if (a == "-?" || a == "--help") {
                std::cout << "Usage: medusa-bench [-h host] [-p port] [-n ops] [-c clients]\n";
                return 0;
            }
        }
    }
    catch (const std::exception&) {
        std::cerr << "invalid numeric argument\n";
        return 2;
    }
    if (clients == 0) clients = 1;

    std::cout << "Benchmarking " << host << ":" << port << " with " << ops
        << " operations over " << clients << " connection" << (clients == 1 ? "" : "s") << "\n\n";

    run(host, port, ops, clients, [](std::size_t i) {
        return "SET bench:" + std::to_string(i) + " value_" + std::to_string(i);
        }).print("SET");

    run(host, port, ops, clients, [](std::size_t i) {
        return "GET bench:" + std::to_string(i);
        }).print("GET");

    run(host, port, ops, clients, [](std::size_t i) {
        switch (i % 4) {
        case 0:  return "SET mixed:" + std::to_string(i) + " v" + std::to_string(i);
        case 1:  return "GET mixed:" + std::to_string(i - 1);
        case 2:  return "RPUSH mixed:list v" + std::to_string(i);
        default: return std::string("LPOP mixed:list");
        }
        }).print("MIXED");

    return 0;
}
