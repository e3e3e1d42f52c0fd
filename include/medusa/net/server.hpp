#pragma once
#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <medusa/core/router.hpp>
#include <medusa/net/session.hpp>
#include <medusa/util/thread_pool.hpp>

namespace medusa {

	class Server {
	public:
		// port 0 binds an ephemeral port; see port().
		Server(asio::io_context& io, const std::string& host, uint16_t port,
			Router& router, ThreadPool& pool,
			std::size_t max_connections = 100, SessionOptions opts = {});

		uint16_t port() const;
		std::size_t connections() const { return live_->load(); }
		void stop();

	private:
		void accept();
		void reject(asio::ip::tcp::socket socket);

		asio::ip::tcp::acceptor acceptor_;
		Router& router_;
		ThreadPool& pool_;
		std::size_t max_connections_;
		SessionOptions opts_;
		std::shared_ptr<std::atomic<std::size_t>> live_;
	};

} // namespace medusa
