#pragma once
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include <medusa/core/entry.hpp>
#include <medusa/core/errors.hpp>
#include <medusa/core/value.hpp>
#include <medusa/time/ttl.hpp>

namespace medusa {

	// The data engine: one key space behind one mutex.
	//
	// Every public member takes the lock for its whole duration, so all calls are
	// linearizable. Expired entries are removed lazily by whichever call observes
	// them. Family operations against a key of another variant throw TypeMismatch;
	// a lock failure throws InternalError. Absence is never an error.
	class Store {
	public:
		Store();
		Store(const Store&) = delete;
		Store& operator=(const Store&) = delete;
		Store(Store&&) = delete;
		Store& operator=(Store&&) = delete;

		// STRINGS

		// Replaces whatever the key held; clears any expiry.
		void set(const std::string& key, std::string value);
		// ttl_seconds == 0 stores an already expired entry.
		void set_with_ttl(const std::string& key, std::string value, long long ttl_seconds);
		std::optional<std::string> get(const std::string& key);
		// Removes the key whatever its type; returns what was removed.
		std::optional<Value> del(const std::string& key);
		bool exists(const std::string& key);
		ValueType type_of(const std::string& key);

		// TTL

		// nullopt: absent, or present without expiry;
		// -1: present but expired (removed by this call, so the next call sees absent);
		// otherwise seconds left, never below 1.
		std::optional<long long> ttl(const std::string& key);
		bool expire(const std::string& key, long long ttl_seconds);
		bool persist(const std::string& key);

		// KEY SPACE

		std::set<std::string> list_keys();
		std::set<std::string> keys(const std::string& pattern);
		std::size_t count();
		void clear();
		std::string info();

		// HASHES

		// true if the field was created, false if it overwrote one
		bool hset(const std::string& key, const std::string& field, std::string value);
		std::optional<std::string> hget(const std::string& key, const std::string& field);
		std::map<std::string, std::string> hgetall(const std::string& key);
		bool hdel(const std::string& key, const std::string& field);
		bool hexists(const std::string& key, const std::string& field);
		std::size_t hlen(const std::string& key);

		// LISTS

		std::size_t lpush(const std::string& key, std::string value);
		std::size_t rpush(const std::string& key, std::string value);
		std::optional<std::string> lpop(const std::string& key);
		std::optional<std::string> rpop(const std::string& key);
		std::size_t llen(const std::string& key);
		// Inclusive range; negative indices count from the tail (-1 = last).
		std::vector<std::string> lrange(const std::string& key, long long start, long long stop);

	private:
		std::unique_lock<std::mutex> lock() const;

		// Live entry or nullptr; an expired entry is erased on the way.
		Entry* live_unlocked(const std::string& key, ttl::TimePt now);
		void sweep_unlocked(ttl::TimePt now);

		// nullptr when absent; TypeMismatch when the key holds another variant.
		Hash* find_hash_unlocked(const std::string& key, ttl::TimePt now);
		List* find_list_unlocked(const std::string& key, ttl::TimePt now);
		// Creates the empty container for an absent key.
		Hash& hash_for_write_unlocked(const std::string& key, ttl::TimePt now);
		List& list_for_write_unlocked(const std::string& key, ttl::TimePt now);

		mutable std::mutex mu_;
		std::unordered_map<std::string, Entry> map_;
		const ttl::TimePt started_;
	};

} // namespace medusa
