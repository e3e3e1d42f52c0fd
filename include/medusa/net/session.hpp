#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <medusa/core/router.hpp>
#include <medusa/util/thread_pool.hpp>
#include <medusa/proto/line.hpp>

namespace medusa {

	struct SessionOptions {
		std::size_t max_line_length = 64 * 1024;
		bool enable_timeouts = false;
		std::chrono::seconds idle_timeout{ 30 };
	};

	inline constexpr const char* kBanner = "Welcome to Medusa server! Type HELP for a list of commands.";

	// One client connection. Requests from a single read are dispatched as one
	// batch on the pool, and the next read starts only after their replies are
	// queued, so replies leave in request order.
	class Session : public std::enable_shared_from_this<Session> {
	public:
		Session(asio::ip::tcp::socket sock, Router& router, ThreadPool& pool,
			SessionOptions opts, std::shared_ptr<std::atomic<std::size_t>> live);
		~Session();
		void start();

	private:
		void do_read();
		void do_write();
		void enqueue_write(std::string msg);
		// A parsed request, or a protocol error to be answered in its place
		struct Pending {
			std::vector<std::string> args;
			std::string error;
			bool fatal = false;
		};

		void handle_batch(std::vector<Pending> batch);
		void arm_timer();
		void close();

		asio::ip::tcp::socket socket_;
		asio::strand<asio::any_io_executor> strand_;
		asio::steady_timer timer_;
		std::vector<char> inbuf_;
		std::string pending_;
		std::deque<std::string> outq_;
		bool closing_ = false;   // close once outq_ drains
		std::string peer_;

		Router& router_;
		ThreadPool& pool_;
		SessionOptions opts_;
		std::shared_ptr<std::atomic<std::size_t>> live_;
	};

} // namespace medusa
