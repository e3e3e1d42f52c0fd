#include <medusa/core/pattern.hpp>

namespace medusa {

    static inline bool starts_with(std::string_view s, std::string_view p) {
        return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
    }

    static inline bool ends_with(std::string_view s, std::string_view p) {
        return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
    }

    bool matches(std::string_view key, std::string_view pattern) {
        if (pattern == "*") return true;
        auto star = pattern.find('*');
        if (star == std::string_view::npos) return key == pattern;
        // any later '*' stays literal in the suffix
        auto prefix = pattern.substr(0, star);
        auto suffix = pattern.substr(star + 1);
        return starts_with(key, prefix) && ends_with(key, suffix);
    }

} // namespace medusa
