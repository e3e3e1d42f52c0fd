#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace medusa {

	class ConfigError : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	struct Config {
		std::string host = "127.0.0.1";
		uint16_t port = 2312;
		std::size_t max_connections = 100;
		std::chrono::seconds connection_timeout{ 30 };
		bool enable_timeouts = false;
		std::string log_level = "info";
		std::size_t worker_threads = 0; // 0 => hardware_concurrency() - 1

		// Boundary limits enforced by the router/session, not the store
		std::size_t max_line_length = 64 * 1024;
		std::size_t max_key_length = 1024;
		std::size_t max_value_length = 1024 * 1024;

		// Overlay MEDUSA_* environment variables; unparsable values are ignored.
		void apply_env();

		// Overlay command line flags. Throws ConfigError on a bad flag or value.
		// Returns false when --help was requested.
		bool apply_args(const std::vector<std::string>& args);

		// Defaults -> environment -> command line.
		static Config load(int argc, char** argv, bool& help);

		std::size_t effective_workers() const;

		// Multi-line startup summary
		std::string describe() const;

		static std::string usage();
	};

} // namespace medusa
