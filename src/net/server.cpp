#include <medusa/net/server.hpp>
#include <medusa/proto/line.hpp>
#include <medusa/util/log.hpp>
#include <asio/write.hpp>
using asio::ip::tcp;

namespace medusa {

    Server::Server(asio::io_context& io, const std::string& host, uint16_t port,
        Router& router, ThreadPool& pool, std::size_t max_connections, SessionOptions opts)
        : acceptor_(io, tcp::endpoint(asio::ip::make_address(host), port))
        , router_(router)
        , pool_(pool)
        , max_connections_(max_connections)
        , opts_(opts)
        , live_(std::make_shared<std::atomic<std::size_t>>(0)) {
        accept();
    }

    uint16_t Server::port() const {
        return acceptor_.local_endpoint().port();
    }

    void Server::stop() {
        std::error_code ignored;
        acceptor_.close(ignored);
    }

    void Server::accept() {
        acceptor_.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted) return; // stopped
            if (ec) {
                log::warn("accept failed: " + ec.message());
            }
            else if (live_->load() >= max_connections_) {
                reject(std::move(socket));
            }
            else {
                ++*live_;
                std::make_shared<Session>(std::move(socket), router_, pool_, opts_, live_)->start();
            }
            accept();
            });
    }

    void Server::reject(tcp::socket socket) {
        log::warn("connection limit (" + std::to_string(max_connections_) + ") reached, rejecting client");
        auto sock = std::make_shared<tcp::socket>(std::move(socket));
        auto msg = std::make_shared<std::string>(reply_error("Server is at maximum capacity"));
        asio::async_write(*sock, asio::buffer(*msg), [sock, msg](std::error_code, std::size_t) {
            std::error_code ignored;
            sock->shutdown(tcp::socket::shutdown_both, ignored);
            sock->close(ignored);
            });
    }

} // namespace medusa
