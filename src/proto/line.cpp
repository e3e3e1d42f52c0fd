#include <medusa/proto/line.hpp>
#include <cctype>
#include <cstring>

namespace medusa {

    // main parser
    LineParseResult parse_line(const char* data, std::size_t len, std::size_t max_line) {
        LineParseResult r;
        if (len == 0) return r;

        const void* nl = std::memchr(data, '\n', len);
        if (!nl) {
            if (len > max_line) {
                r.error = "line too long";
                r.consumed = len;
                r.fatal = true;
            }
            return r; // need more
        }

        std::size_t end = static_cast<const char*>(nl) - data;
        r.consumed = end + 1;
        if (end > max_line) {
            r.error = "line too long";
            r.fatal = true;
            return r;
        }
        if (end > 0 && data[end - 1] == '\r') --end; // tolerate CRLF clients

        LineRequest req;
        if (!tokenize(std::string(data, end), req.args)) {
            r.error = "unbalanced quotes";
            return r;
        }
        r.req = std::move(req);
        return r;
    }

    bool tokenize(const std::string& line, std::vector<std::string>& out) {
        out.clear();
        std::string cur;
        bool inq = false;
        bool have = false; // distinguishes "" from no token
        char q = 0;
        for (size_t i = 0; i < line.size(); ++i) {
            char c = line[i];
            if (!inq && std::isspace(static_cast<unsigned char>(c))) {
                if (have) { out.push_back(cur); cur.clear(); have = false; }
                continue;
            }
            if (!inq && (c == '"' || c == '\'')) { inq = true; q = c; have = true; continue; }
            if (inq && c == q) { inq = false; continue; }
            if (inq && c == '\\' && i + 1 < line.size()) {
                char n = line[++i];
                switch (n) {
                case 'n': cur.push_back('\n'); break;
                case 'r': cur.push_back('\r'); break;
                case 't': cur.push_back('\t'); break;
                case '"': cur.push_back('"'); break;
                case '\'': cur.push_back('\''); break;
                case '\\': cur.push_back('\\'); break;
                default: cur.push_back('\\'); cur.push_back(n); break;
                }
                continue;
            }
            cur.push_back(c);
            have = true;
        }
        if (inq) return false;
        if (have) out.push_back(cur);
        return true;
    }

    // emitters
    std::string reply_ok(const std::string& s) { return "OK: " + s + "\n"; }
    std::string reply_null(const std::string& s) { return "NULL: " + s + "\n"; }
    std::string reply_true(const std::string& s) { return "TRUE: " + s + "\n"; }
    std::string reply_false(const std::string& s) { return "FALSE: " + s + "\n"; }
    std::string reply_error(const std::string& s) { return "ERROR: " + s + "\n"; }
    std::string reply_raw(const std::string& s) { return s + "\n"; }

    std::string join(const std::vector<std::string>& items, const std::string& sep) {
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) out += sep;
            out += items[i];
        }
        return out;
    }

} // namespace medusa
