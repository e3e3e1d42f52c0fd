#include <medusa/core/store.hpp>
#include <medusa/core/pattern.hpp>
#include <medusa/version.hpp>
#include <algorithm>
#include <chrono>
#include <sstream>
#include <system_error>

namespace medusa {

    Store::Store() : started_(ttl::now()) {}

    std::unique_lock<std::mutex> Store::lock() const {
        try {
            return std::unique_lock<std::mutex>(mu_);
        }
        catch (const std::system_error& e) {
            throw InternalError(std::string("failed to acquire store lock: ") + e.what());
        }
    }

    Entry* Store::live_unlocked(const std::string& key, ttl::TimePt now) {
        auto it = map_.find(key);
        if (it == map_.end()) return nullptr;
        if (it->second.is_expired(now)) {
            map_.erase(it); // lazy expire
            return nullptr;
        }
        return &it->second;
    }

    void Store::sweep_unlocked(ttl::TimePt now) {
        for (auto it = map_.begin(); it != map_.end();) {
            if (it->second.is_expired(now)) it = map_.erase(it);
            else ++it;
        }
    }

    // KV

    void Store::set(const std::string& key, std::string value) {
        auto lk = lock();
        map_[key] = Entry(std::move(value));
    }

    void Store::set_with_ttl(const std::string& key, std::string value, long long ttl_seconds) {
        auto now = ttl::now();
        auto lk = lock();
        map_[key] = Entry(std::move(value), ttl::from_seconds(ttl_seconds, now));
    }

    std::optional<std::string> Store::get(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        Entry* e = live_unlocked(key, now);
        if (!e) return std::nullopt;
        auto* s = std::get_if<std::string>(&e->value);
        if (!s) throw TypeMismatch(key, ValueType::String, e->type());
        return *s;
    }

    std::optional<Value> Store::del(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        if (it->second.is_expired(now)) {
            map_.erase(it);
            return std::nullopt;
        }
        Value removed = std::move(it->second.value);
        map_.erase(it);
        return removed;
    }

    bool Store::exists(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        return live_unlocked(key, now) != nullptr;
    }

    ValueType Store::type_of(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        Entry* e = live_unlocked(key, now);
        return e ? e->type() : ValueType::None;
    }

    // TTL

    std::optional<long long> Store::ttl(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        auto it = map_.find(key);
        if (it == map_.end()) return std::nullopt;
        auto remaining = it->second.remaining_ttl(now);
        if (remaining && *remaining == ttl::TTL_EXPIRED) {
            // report once, then the key is gone
            map_.erase(it);
        }
        return remaining;
    }

    bool Store::expire(const std::string& key, long long ttl_seconds) {
        auto now = ttl::now();
        auto lk = lock();
        Entry* e = live_unlocked(key, now);
        if (!e) return false;
        e->expires_at = ttl::from_seconds(ttl_seconds, now);
        return true;
    }

    bool Store::persist(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        Entry* e = live_unlocked(key, now);
        if (!e || !e->expires_at) return false;
        e->expires_at.reset();
        return true;
    }

    // Key space

    std::set<std::string> Store::list_keys() {
        auto now = ttl::now();
        auto lk = lock();
        sweep_unlocked(now);
        std::set<std::string> out;
        for (auto& [k, e] : map_) out.insert(k);
        return out;
    }

    std::set<std::string> Store::keys(const std::string& pattern) {
        auto now = ttl::now();
        auto lk = lock();
        sweep_unlocked(now);
        std::set<std::string> out;
        for (auto& [k, e] : map_) {
            if (matches(k, pattern)) out.insert(k);
        }
        return out;
    }

    std::size_t Store::count() {
        auto now = ttl::now();
        auto lk = lock();
        sweep_unlocked(now);
        return map_.size();
    }

    void Store::clear() {
        auto lk = lock();
        map_.clear();
    }

    std::string Store::info() {
        auto now = ttl::now();
        auto lk = lock();
        sweep_unlocked(now);

        std::size_t strings = 0, hashes = 0, lists = 0, expiring = 0, bytes = 0;
        for (auto& [k, e] : map_) {
            bytes += k.size();
            if (e.expires_at) ++expiring;
            switch (e.type()) {
            case ValueType::String:
                ++strings;
                bytes += std::get<std::string>(e.value).size();
                break;
            case ValueType::Hash:
                ++hashes;
                for (auto& [f, v] : std::get<Hash>(e.value)) bytes += f.size() + v.size();
                break;
            case ValueType::List:
                ++lists;
                for (auto& item : std::get<List>(e.value)) bytes += item.size();
                break;
            case ValueType::None:
                break;
            }
        }
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started_).count();

        std::ostringstream o;
        o << "# Server\n"
          << "medusa_version:" << MEDUSA_VERSION << "\n"
          << "uptime_in_seconds:" << uptime << "\n"
          << "# Memory\n"
          << "used_memory_bytes:" << bytes << "\n"
          << "# Stats\n"
          << "total_keys:" << map_.size() << "\n"
          << "string_keys:" << strings << "\n"
          << "hash_keys:" << hashes << "\n"
          << "list_keys:" << lists << "\n"
          << "expiring_keys:" << expiring << "\n";
        return o.str();
    }

    // Typed lookups

    Hash* Store::find_hash_unlocked(const std::string& key, ttl::TimePt now) {
        Entry* e = live_unlocked(key, now);
        if (!e) return nullptr;
        auto* h = std::get_if<Hash>(&e->value);
        if (!h) throw TypeMismatch(key, ValueType::Hash, e->type());
        return h;
    }

    List* Store::find_list_unlocked(const std::string& key, ttl::TimePt now) {
        Entry* e = live_unlocked(key, now);
        if (!e) return nullptr;
        auto* l = std::get_if<List>(&e->value);
        if (!l) throw TypeMismatch(key, ValueType::List, e->type());
        return l;
    }

    Hash& Store::hash_for_write_unlocked(const std::string& key, ttl::TimePt now) {
        if (Hash* h = find_hash_unlocked(key, now)) return *h;
        auto it = map_.insert_or_assign(key, Entry(Hash{})).first;
        return std::get<Hash>(it->second.value);
    }

    List& Store::list_for_write_unlocked(const std::string& key, ttl::TimePt now) {
        if (List* l = find_list_unlocked(key, now)) return *l;
        auto it = map_.insert_or_assign(key, Entry(List{})).first;
        return std::get<List>(it->second.value);
    }

    // Hashes

    bool Store::hset(const std::string& key, const std::string& field, std::string value) {
        auto now = ttl::now();
        auto lk = lock();
        auto& hm = hash_for_write_unlocked(key, now);
        auto it = hm.find(field);
        if (it == hm.end()) { hm.emplace(field, std::move(value)); return true; }
        it->second = std::move(value); return false;
    }

    std::optional<std::string> Store::hget(const std::string& key, const std::string& field) {
        auto now = ttl::now();
        auto lk = lock();
        Hash* hm = find_hash_unlocked(key, now);
        if (!hm) return std::nullopt;
        auto it = hm->find(field);
        if (it == hm->end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, std::string> Store::hgetall(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        Hash* hm = find_hash_unlocked(key, now);
        if (!hm) return {};
        return std::map<std::string, std::string>(hm->begin(), hm->end());
    }

    bool Store::hdel(const std::string& key, const std::string& field) {
        auto now = ttl::now();
        auto lk = lock();
        Hash* hm = find_hash_unlocked(key, now);
        if (!hm) return false;
        bool removed = hm->erase(field) > 0;
        if (hm->empty()) map_.erase(key);
        return removed;
    }

    bool Store::hexists(const std::string& key, const std::string& field) {
        auto now = ttl::now();
        auto lk = lock();
        Hash* hm = find_hash_unlocked(key, now);
        return hm && hm->count(field) > 0;
    }

    std::size_t Store::hlen(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        Hash* hm = find_hash_unlocked(key, now);
        return hm ? hm->size() : 0;
    }

    // Lists

    std::size_t Store::lpush(const std::string& key, std::string value) {
        auto now = ttl::now();
        auto lk = lock();
        auto& l = list_for_write_unlocked(key, now);
        l.push_front(std::move(value));
        return l.size();
    }

    std::size_t Store::rpush(const std::string& key, std::string value) {
        auto now = ttl::now();
        auto lk = lock();
        auto& l = list_for_write_unlocked(key, now);
        l.push_back(std::move(value));
        return l.size();
    }

    std::optional<std::string> Store::lpop(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        List* l = find_list_unlocked(key, now);
        if (!l || l->empty()) return std::nullopt;
        std::string v = std::move(l->front());
        l->pop_front();
        if (l->empty()) map_.erase(key);
        return v;
    }

    std::optional<std::string> Store::rpop(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        List* l = find_list_unlocked(key, now);
        if (!l || l->empty()) return std::nullopt;
        std::string v = std::move(l->back());
        l->pop_back();
        if (l->empty()) map_.erase(key);
        return v;
    }

    std::size_t Store::llen(const std::string& key) {
        auto now = ttl::now();
        auto lk = lock();
        List* l = find_list_unlocked(key, now);
        return l ? l->size() : 0;
    }

    std::vector<std::string> Store::lrange(const std::string& key, long long start, long long stop) {
        auto now = ttl::now();
        auto lk = lock();
        std::vector<std::string> out;
        List* l = find_list_unlocked(key, now);
        if (!l || l->empty()) return out;

        const long long len = static_cast<long long>(l->size());
        start = start < 0 ? std::max(0LL, len + start) : std::min(start, len);
        stop = stop < 0 ? std::max(0LL, len + stop) : std::min(stop, len - 1);
        if (start > stop) return out;

        out.reserve(static_cast<std::size_t>(stop - start + 1));
        out.assign(l->begin() + start, l->begin() + stop + 1);
        return out;
    }

} // namespace medusa
