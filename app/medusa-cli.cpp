#include <asio.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <medusa/proto/line.hpp>

using asio::ip::tcp;

// ---------- read one '\n'-terminated reply line (without the terminator)
static bool read_line(tcp::socket& sock, std::string& buf, std::string& line) {
    for (;;) {
        auto pos = buf.find('\n');
        if (pos != std::string::npos) {
            line.assign(buf.data(), pos);
            buf.erase(0, pos + 1);
            return true;
        }
        char tmp[4096];
        asio::error_code ec;
        std::size_t n = sock.read_some(asio::buffer(tmp), ec);
        if (ec) return false;
        buf.append(tmp, tmp + n);
    }
}

static void print_reply(const std::string& line) {
    if (line.rfind("ERROR:", 0) == 0) std::cout << "(error) " << line.substr(7) << "\n";
    else if (line.rfind("NULL:", 0) == 0) std::cout << "(nil) " << line.substr(6) << "\n";
    else std::cout << line << "\n";
}

int main(int argc, char** argv) {
    std::string host = "127.0.0.1";
    uint16_t port = 2312;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-h" || a == "--host") && i + 1 < argc) { host = argv[++i]; }
        else if ((a == "-p" || a == "--port") && i + 1 < argc) {
            try { port = static_cast<uint16_t>(std::stoi(argv[++i])); }
            catch (const std::exception&) { std::cerr << "invalid port\n"; return 2; }
        }
        else if (a == "-?" || a == "--help") {
            std::cout << "Usage: medusa-cli [-h host] [-p port]\n"; return 0;
        }
    }

    try {
        asio::io_context io;
        tcp::resolver res(io);
        auto eps = res.resolve(host, std::to_string(port));
        tcp::socket sock(io);
        asio::connect(sock, eps);

        std::string readbuf;
        std::string banner;
        if (!read_line(sock, readbuf, banner)) {
            std::cerr << "connection closed by server\n";
            return 1;
        }
        std::cout << "Connected to " << host << ":" << port << "\n" << banner << "\n";

        for (;;) {
            std::cout << "> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line)) break;

            std::vector<std::string> args;
            if (!medusa::tokenize(line, args)) { std::cout << "(error) unbalanced quotes\n"; continue; }
            if (args.empty()) continue;

            line.push_back('\n');
            asio::write(sock, asio::buffer(line));

            std::string reply;
            if (!read_line(sock, readbuf, reply)) {
                std::cout << "(connection closed)\n"; break;
            }
            print_reply(reply);

            if (args.size() == 1 && (args[0] == "QUIT" || args[0] == "quit" || args[0] == "EXIT" || args[0] == "exit")) break;
        }

        std::error_code ignored;
        sock.close(ignored);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    std::cout << "Disconnected from server\n";
    return 0;
}
