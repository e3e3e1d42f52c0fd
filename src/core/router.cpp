#include <medusa/core/router.hpp>
#include <medusa/proto/line.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <string_view>

namespace medusa {

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }

    // strict base-10, optional leading '-'
    static inline bool parse_ll(std::string_view s, long long& out) {
        if (s.empty()) return false;
        long long sign = 1; size_t i = 0;
        if (s[0] == '-') { sign = -1; i = 1; }
        if (i == s.size()) return false;
        long long v = 0;
        for (; i < s.size(); ++i) {
            char c = s[i];
            if (c < '0' || c > '9') return false;
            long long d = (c - '0');
            if (v > (std::numeric_limits<long long>::max() - d) / 10) return false;
            v = v * 10 + d;
        }
        out = v * sign;
        return true;
    }

    static inline std::string usage_error(const char* cmd, const char* what, const char* usage) {
        return reply_error(std::string(cmd) + " requires " + what + " (" + usage + ")");
    }

    static inline std::string not_integer(const std::string& tok) {
        return reply_error("'" + tok + "' is not a valid integer");
    }

    static inline std::string quote(const std::string& s) { return "'" + s + "'"; }

    static std::string render_hash(const std::map<std::string, std::string>& h) {
        std::vector<std::string> parts;
        parts.reserve(h.size());
        for (auto& [f, v] : h) parts.push_back(f + ": " + v);
        return "{" + join(parts) + "}";
    }

    static std::string render_list(const std::vector<std::string>& l) {
        return "[" + join(l) + "]";
    }

    static std::string render_value(const Value& v) {
        if (auto* s = std::get_if<std::string>(&v)) return quote(*s);
        if (auto* h = std::get_if<Hash>(&v)) return render_hash({ h->begin(), h->end() });
        const auto& l = std::get<List>(v);
        return render_list({ l.begin(), l.end() });
    }

    static std::string render_keys(const std::set<std::string>& keys) {
        if (keys.empty()) return reply_ok("No keys found");
        return reply_ok("Keys: " + join({ keys.begin(), keys.end() }));
    }

    static inline std::string expires_in(const std::string& key, long long secs) {
        return reply_ok(quote(key) + " expires in " + std::to_string(secs) + "s");
    }

    static inline std::string key_not_found(const std::string& key) {
        return reply_null("Key " + quote(key) + " not found");
    }


    Router::Router(std::shared_ptr<Store> s, std::size_t max_key_length, std::size_t max_value_length)
        : store_(std::move(s)), max_key_(max_key_length), max_value_(max_value_length) {

        h_["PING"] = [](auto const& a) {
            if (a.size() > 1) return reply_raw("PONG " + join({ a.begin() + 1, a.end() }, " "));
            return reply_raw("PONG");
            };

        h_["HELP"] = [this](auto const&) {
            return reply_ok("Commands: " + join(commands()));
            };

        // SET key value [ttl]
        h_["SET"] = [this](auto const& a) {
            if (a.size() < 3 || a.size() > 4) return usage_error("SET", "key and value", "SET key value [ttl]");
            const std::string& key = a[1];
            const std::string& val = a[2];
            if (auto err = check_key(key); !err.empty()) return err;
            if (auto err = check_value(val); !err.empty()) return err;

            if (a.size() == 4) {
                long long secs = 0;
                if (!parse_ll(a[3], secs)) return not_integer(a[3]);
                if (secs < 0) return reply_error("TTL must be a non-negative number of seconds");
                store_->set_with_ttl(key, val, secs);
                return reply_ok("Set " + quote(key) + " = " + quote(val) + " (expires in " + std::to_string(secs) + "s)");
            }
            store_->set(key, val);
            return reply_ok("Set " + quote(key) + " = " + quote(val));
            };

        h_["GET"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("GET", "a key", "GET key");
            auto v = store_->get(a[1]);                              // lazily evicts expired
            if (!v) return key_not_found(a[1]);
            return reply_ok(quote(a[1]) + " = " + *v);
            };

        h_["DELETE"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("DELETE", "a key", "DELETE key");
            auto v = store_->del(a[1]);
            if (!v) return key_not_found(a[1]);
            return reply_ok("Deleted " + quote(a[1]) + " (was " + render_value(*v) + ")");
            };
        h_["DEL"] = h_["DELETE"];

        h_["EXISTS"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("EXISTS", "a key", "EXISTS key");
            if (store_->exists(a[1])) return reply_true("Key " + quote(a[1]) + " exists");
            return reply_false("Key " + quote(a[1]) + " does not exist");
            };

        h_["TYPE"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("TYPE", "a key", "TYPE key");
            return reply_ok(quote(a[1]) + " is a " + type_name(store_->type_of(a[1])));
            };

        h_["TTL"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("TTL", "a key", "TTL key");
            const std::string& key = a[1];
            auto t = store_->ttl(key);
            if (t && *t == ttl::TTL_EXPIRED) return reply_ok(quote(key) + " has expired");
            if (t) return expires_in(key, *t);
            // nullopt covers both absent and no expiry
            if (store_->exists(key)) return reply_ok(quote(key) + " has no expiration");
            return key_not_found(key);
            };

        h_["EXPIRE"] = [this](auto const& a) {
            // EXPIRE key seconds
            if (a.size() != 3) return usage_error("EXPIRE", "key and seconds", "EXPIRE key seconds");
            const std::string& key = a[1];
            long long sec = 0;
            if (!parse_ll(a[2], sec)) return not_integer(a[2]);
            if (sec < 0) return reply_error("TTL must be a non-negative number of seconds");
            if (!store_->expire(key, sec)) return key_not_found(key);
            return expires_in(key, sec);
            };

        // PERSIST key (remove TTL)
        h_["PERSIST"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("PERSIST", "a key", "PERSIST key");
            if (!store_->persist(a[1])) return reply_null("Key " + quote(a[1]) + " not found or has no expiration");
            return reply_ok("Removed expiration from " + quote(a[1]));
            };

        h_["LIST"] = [this](auto const& a) {
            if (a.size() != 1) return usage_error("LIST", "no arguments", "LIST");
            return render_keys(store_->list_keys());
            };

        h_["KEYS"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("KEYS", "a pattern", "KEYS pattern");
            return render_keys(store_->keys(a[1]));
            };

        h_["COUNT"] = [this](auto const& a) {
            if (a.size() != 1) return usage_error("COUNT", "no arguments", "COUNT");
            return reply_ok(std::to_string(store_->count()) + " entries");
            };

        h_["CLEAR"] = [this](auto const& a) {
            if (a.size() != 1) return usage_error("CLEAR", "no arguments", "CLEAR");
            store_->clear();
            return reply_ok("All entries cleared");
            };

        h_["INFO"] = [this](auto const& a) {
            if (a.size() != 1) return usage_error("INFO", "no arguments", "INFO");
            std::string text = store_->info();
            std::vector<std::string> lines;
            std::size_t pos = 0;
            while (pos < text.size()) {
                auto nl = text.find('\n', pos);
                if (nl == std::string::npos) nl = text.size();
                if (nl > pos) lines.emplace_back(text, pos, nl - pos);
                pos = nl + 1;
            }
            return reply_ok(join(lines, " | "));
            };

        // HSET key field value
        h_["HSET"] = [this](auto const& a) {
            if (a.size() != 4) return usage_error("HSET", "key, field and value", "HSET key field value");
            if (auto err = check_key(a[1]); !err.empty()) return err;
            if (auto err = check_key(a[2]); !err.empty()) return err;
            if (auto err = check_value(a[3]); !err.empty()) return err;
            bool created = store_->hset(a[1], a[2], a[3]);
            return reply_ok(created ? "Created field " + quote(a[2]) : "Updated field " + quote(a[2]));
            };

        // HGET key field
        h_["HGET"] = [this](auto const& a) {
            if (a.size() != 3) return usage_error("HGET", "key and field", "HGET key field");
            auto v = store_->hget(a[1], a[2]);
            if (!v) return reply_null("Field " + quote(a[2]) + " not found in " + quote(a[1]));
            return reply_ok(quote(a[1]) + "." + quote(a[2]) + " = " + *v);
            };

        h_["HGETALL"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("HGETALL", "a key", "HGETALL key");
            return reply_ok(render_hash(store_->hgetall(a[1])));
            };

        h_["HDEL"] = [this](auto const& a) {
            if (a.size() != 3) return usage_error("HDEL", "key and field", "HDEL key field");
            if (!store_->hdel(a[1], a[2])) return reply_null("Field " + quote(a[2]) + " not found in " + quote(a[1]));
            return reply_ok("Deleted field " + quote(a[2]));
            };

        h_["HEXISTS"] = [this](auto const& a) {
            if (a.size() != 3) return usage_error("HEXISTS", "key and field", "HEXISTS key field");
            if (store_->hexists(a[1], a[2])) return reply_true("Field " + quote(a[2]) + " exists in " + quote(a[1]));
            return reply_false("Field " + quote(a[2]) + " does not exist in " + quote(a[1]));
            };

        h_["HLEN"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("HLEN", "a key", "HLEN key");
            return reply_ok(std::to_string(store_->hlen(a[1])) + " fields");
            };

        // LPUSH/RPUSH key value
        h_["LPUSH"] = [this](auto const& a) {
            if (a.size() != 3) return usage_error("LPUSH", "key and value", "LPUSH key value");
            if (auto err = check_key(a[1]); !err.empty()) return err;
            if (auto err = check_value(a[2]); !err.empty()) return err;
            return reply_ok("List length " + std::to_string(store_->lpush(a[1], a[2])));
            };

        h_["RPUSH"] = [this](auto const& a) {
            if (a.size() != 3) return usage_error("RPUSH", "key and value", "RPUSH key value");
            if (auto err = check_key(a[1]); !err.empty()) return err;
            if (auto err = check_value(a[2]); !err.empty()) return err;
            return reply_ok("List length " + std::to_string(store_->rpush(a[1], a[2])));
            };

        h_["LPOP"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("LPOP", "a key", "LPOP key");
            auto v = store_->lpop(a[1]);
            if (!v) return reply_null("List " + quote(a[1]) + " is empty");
            return reply_ok(*v);
            };

        h_["RPOP"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("RPOP", "a key", "RPOP key");
            auto v = store_->rpop(a[1]);
            if (!v) return reply_null("List " + quote(a[1]) + " is empty");
            return reply_ok(*v);
            };

        h_["LLEN"] = [this](auto const& a) {
            if (a.size() != 2) return usage_error("LLEN", "a key", "LLEN key");
            return reply_ok(std::to_string(store_->llen(a[1])) + " items");
            };

        // LRANGE key start stop
        h_["LRANGE"] = [this](auto const& a) {
            if (a.size() != 4) return usage_error("LRANGE", "key, start and stop", "LRANGE key start stop");
            long long start = 0, stop = 0;
            if (!parse_ll(a[2], start)) return not_integer(a[2]);
            if (!parse_ll(a[3], stop)) return not_integer(a[3]);
            return reply_ok(render_list(store_->lrange(a[1], start, stop)));
            };

        h_["QUIT"] = [](auto const&) { return reply_ok("Goodbye!"); };
        h_["EXIT"] = h_["QUIT"];
    }

    std::string Router::check_key(const std::string& key) const {
        if (key.empty()) return reply_error("key must not be empty");
        if (key.size() > max_key_) return reply_error("key exceeds " + std::to_string(max_key_) + " bytes");
        return {};
    }

    std::string Router::check_value(const std::string& value) const {
        if (value.size() > max_value_) return reply_error("value exceeds " + std::to_string(max_value_) + " bytes");
        return {};
    }

    std::vector<std::string> Router::commands() const {
        std::vector<std::string> out;
        out.reserve(h_.size());
        for (auto& [name, h] : h_) out.push_back(name);
        std::sort(out.begin(), out.end());
        return out;
    }

    Reply Router::dispatch(const std::vector<std::string>& args) {
        Reply r;
        if (args.empty()) { r.text = reply_error("Empty command"); return r; }
        auto cmd = upper(args[0]);
        auto it = h_.find(cmd);
        if (it == h_.end()) { r.text = reply_error("Unknown command '" + args[0] + "'"); return r; }
        try {
            r.text = it->second(args);
        }
        catch (const TypeMismatch& e) {
            r.text = reply_error(e.what());
        }
        catch (const std::exception& e) {
            r.text = reply_error(std::string("internal error: ") + e.what());
        }
        r.close = (cmd == "QUIT" || cmd == "EXIT");
        return r;
    }

} // namespace medusa
