#pragma once
#include <string>
#include <string_view>

namespace medusa {

	// Single-wildcard key matching used by KEYS.
	//   "*"        matches everything
	//   "pre*suf"  key starts with "pre" and ends with "suf" (split on the first '*';
	//              prefix and suffix may overlap in short keys)
	//   "exact"    key == pattern
	bool matches(std::string_view key, std::string_view pattern);

} // namespace medusa
