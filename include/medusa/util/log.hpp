#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace medusa::log {

	enum class Level { Debug = 0, Info, Warn, Error, Off };

	inline std::optional<Level> parse_level(std::string_view s) {
		std::string l;
		for (char c : s) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
		if (l == "debug") return Level::Debug;
		if (l == "info")  return Level::Info;
		if (l == "warn" || l == "warning") return Level::Warn;
		if (l == "error") return Level::Error;
		if (l == "off")   return Level::Off;
		return std::nullopt;
	}

	inline const char* level_name(Level l) {
		switch (l) {
		case Level::Debug: return "DEBUG";
		case Level::Info:  return "INFO";
		case Level::Warn:  return "WARN";
		case Level::Error: return "ERROR";
		case Level::Off:   return "OFF";
		}
		return "?";
	}

	namespace detail {
		inline std::atomic<Level>& threshold() {
			static std::atomic<Level> lvl{ Level::Info };
			return lvl;
		}
		inline std::mutex& out_mutex() {
			static std::mutex m;
			return m;
		}
	}

	inline void set_level(Level l) { detail::threshold().store(l); }
	inline Level level() { return detail::threshold().load(); }
	inline bool enabled(Level l) { return l != Level::Off && l >= level(); }

	// One line: "2026-10-19 20:05:01 [INFO] msg". Warn and above go to stderr.
	inline void write(Level l, const std::string& msg) {
		if (!enabled(l)) return;
		auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
		std::tm tm{};
		localtime_r(&t, &tm);
		std::ostringstream o;
		o << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " [" << level_name(l) << "] " << msg << "\n";
		std::lock_guard<std::mutex> lk(detail::out_mutex());
		auto& os = l >= Level::Warn ? std::cerr : std::cout;
		os << o.str() << std::flush;
	}

	inline void debug(const std::string& msg) { write(Level::Debug, msg); }
	inline void info(const std::string& msg) { write(Level::Info, msg); }
	inline void warn(const std::string& msg) { write(Level::Warn, msg); }
	inline void error(const std::string& msg) { write(Level::Error, msg); }

} // namespace medusa::log
