#pragma once
#include <optional>
#include <utility>
#include <medusa/core/value.hpp>
#include <medusa/time/ttl.hpp>

namespace medusa {

	// A stored value plus its optional absolute expiry.
	struct Entry {
		Value value;
		std::optional<ttl::TimePt> expires_at;

		Entry() = default;
		explicit Entry(Value v, std::optional<ttl::TimePt> exp = std::nullopt)
			: value(std::move(v)), expires_at(exp) {}

		bool is_expired(ttl::TimePt now) const { return ttl::is_expired(expires_at, now); }

		// nullopt: no expiry; -1: expired; otherwise seconds left (>= 1)
		std::optional<long long> remaining_ttl(ttl::TimePt now) const {
			return ttl::remaining_seconds(expires_at, now);
		}

		ValueType type() const { return type_of(value); }
	};

} // namespace medusa
