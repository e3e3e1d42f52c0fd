#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace medusa {

	// One request line split into tokens: verb followed by its arguments.
	struct LineRequest { std::vector<std::string> args; };

	// Result of trying to parse from a byte buffer.
	struct LineParseResult {
		std::optional<LineRequest> req;  // present when a full line was parsed
		std::string error;               // non-empty on protocol error
		std::size_t consumed = 0;        // how many bytes to erase from the buffer
		bool fatal = false;              // line too long: connection should be dropped
	};

	// Parse exactly one '\n'-terminated line from [data, data+len].
	// If incomplete, returns {req=nullopt, error="", consumed=0}.
	// A blank line parses to an empty args vector.
	LineParseResult parse_line(const char* data, std::size_t len, std::size_t max_line = 64 * 1024);

	// Shell-like split: whitespace separated, '...' and "..." group, backslash
	// escapes inside quotes. Returns false on an unterminated quote.
	bool tokenize(const std::string& line, std::vector<std::string>& out);

	// Emit helpers, each one full response line
	std::string reply_ok(const std::string& s);     // OK: msg\n
	std::string reply_null(const std::string& s);   // NULL: msg\n
	std::string reply_true(const std::string& s);   // TRUE: msg\n
	std::string reply_false(const std::string& s);  // FALSE: msg\n
	std::string reply_error(const std::string& s);  // ERROR: msg\n
	std::string reply_raw(const std::string& s);    // msg\n

	// "a, b, c"
	std::string join(const std::vector<std::string>& items, const std::string& sep = ", ");

} // namespace medusa
