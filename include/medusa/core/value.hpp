#pragma once
#include <deque>
#include <string>
#include <unordered_map>
#include <variant>

namespace medusa {

	enum class ValueType { None, String, Hash, List };

	using Hash = std::unordered_map<std::string, std::string>;
	using List = std::deque<std::string>;

	// Payload stored under a key; alternative order matches ValueType.
	using Value = std::variant<std::string, Hash, List>;

	inline ValueType type_of(const Value& v) {
		switch (v.index()) {
		case 0: return ValueType::String;
		case 1: return ValueType::Hash;
		case 2: return ValueType::List;
		}
		return ValueType::None;
	}

	inline const char* type_name(ValueType t) {
		switch (t) {
		case ValueType::None:   return "none";
		case ValueType::String: return "string";
		case ValueType::Hash:   return "hash";
		case ValueType::List:   return "list";
		}
		return "none";
	}

} // namespace medusa
