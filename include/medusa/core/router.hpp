#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <medusa/core/store.hpp>

namespace medusa {

	struct Reply {
		std::string text;    // one full response line
		bool close = false;  // QUIT/EXIT: close after writing
	};

	// Maps a tokenized request to exactly one Store call and renders the
	// result as a response line. The command set is fixed at construction.
	class Router {
	public:
		using Handler = std::function<std::string(const std::vector<std::string>&)>;

		explicit Router(std::shared_ptr<Store> s,
			std::size_t max_key_length = 1024,
			std::size_t max_value_length = 1024 * 1024);

		Reply dispatch(const std::vector<std::string>& args);

		// Upper-cased names of every known command, sorted
		std::vector<std::string> commands() const;

	private:
		std::string check_key(const std::string& key) const;
		std::string check_value(const std::string& value) const;

		std::shared_ptr<Store> store_;
		std::size_t max_key_;
		std::size_t max_value_;
		std::unordered_map<std::string, Handler> h_;
	};

} // namespace medusa
