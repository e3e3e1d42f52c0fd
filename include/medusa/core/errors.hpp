#pragma once
#include <stdexcept>
#include <string>
#include <medusa/core/value.hpp>

namespace medusa {

	class Error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Operation expected one variant but the key holds another.
	class TypeMismatch : public Error {
	public:
		TypeMismatch(const std::string& key, ValueType expected, ValueType actual)
			: Error("WRONGTYPE key '" + key + "' holds a " + type_name(actual) +
				" value, not a " + type_name(expected))
			, key_(key), expected_(expected), actual_(actual) {}

		const std::string& key() const { return key_; }
		ValueType expected() const { return expected_; }
		ValueType actual() const { return actual_; }

	private:
		std::string key_;
		ValueType expected_;
		ValueType actual_;
	};

	// The store's lock primitive failed.
	class InternalError : public Error {
	public:
		using Error::Error;
	};

} // namespace medusa
