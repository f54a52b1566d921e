#include <av/formats.h>

#include <arpa/inet.h>

#include <cctype>
#include <cfloat>
#include <cmath>
#include <cstdint>

namespace av {

namespace {
    bool digits(const std::string& s, size_t pos, size_t n) {
        if (pos + n > s.size()) return false;
        for (size_t i = pos; i < pos + n; ++i)
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        return true;
    }

    int number_at(const std::string& s, size_t pos, size_t n) {
        int v = 0;
        for (size_t i = pos; i < pos + n; ++i) v = v * 10 + (s[i] - '0');
        return v;
    }

    bool leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    int days_in_month(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (m == 2 && leap_year(y)) return 29;
        return days[m - 1];
    }

    // Applies `check` to strings only.
    FormatCheck for_strings(bool (*check)(const std::string&)) {
        return [check](const Value& v) { return !v.isString() || check(v.asString()); };
    }

    bool fits_int64(const Value& v) {
        if (v.isInt()) return true;
        if (!v.isIntegral()) return false;
        double d = v.asDouble();
        return d >= -9223372036854775808.0 && d < 9223372036854775808.0;
    }
}  // namespace

namespace formats {

    // full-date: YYYY-MM-DD
    bool is_date(const std::string& s) {
        if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
        if (!digits(s, 0, 4) || !digits(s, 5, 2) || !digits(s, 8, 2)) return false;
        int y = number_at(s, 0, 4), m = number_at(s, 5, 2), d = number_at(s, 8, 2);
        if (m < 1 || m > 12) return false;
        return d >= 1 && d <= days_in_month(y, m);
    }

    // full-time: HH:MM:SS[.frac](Z|+HH:MM|-HH:MM)
    bool is_time(const std::string& s) {
        if (s.size() < 9 || s[2] != ':' || s[5] != ':') return false;
        if (!digits(s, 0, 2) || !digits(s, 3, 2) || !digits(s, 6, 2)) return false;
        int h = number_at(s, 0, 2), mi = number_at(s, 3, 2), sec = number_at(s, 6, 2);
        if (h > 23 || mi > 59 || sec > 60) return false;
        size_t pos = 8;
        if (s[pos] == '.') {
            ++pos;
            size_t start = pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
            if (pos == start) return false;
        }
        if (pos >= s.size()) return false;
        if ((s[pos] == 'Z' || s[pos] == 'z') && pos + 1 == s.size()) return true;
        if (s[pos] != '+' && s[pos] != '-') return false;
        if (s.size() != pos + 6 || s[pos + 3] != ':') return false;
        if (!digits(s, pos + 1, 2) || !digits(s, pos + 4, 2)) return false;
        return number_at(s, pos + 1, 2) <= 23 && number_at(s, pos + 4, 2) <= 59;
    }

    bool is_date_time(const std::string& s) {
        if (s.size() < 11) return false;
        char sep = s[10];
        if (sep != 'T' && sep != 't' && sep != ' ') return false;
        return is_date(s.substr(0, 10)) && is_time(s.substr(11));
    }

    bool is_email(const std::string& s) {
        size_t at = s.find('@');
        if (at == std::string::npos || at == 0 || at > 64 || s.find('@', at + 1) != std::string::npos) return false;
        std::string local = s.substr(0, at);
        if (local.front() == '.' || local.back() == '.' || local.find("..") != std::string::npos) return false;
        static const std::string specials = "!#$%&'*+-/=?^_`{|}~.";
        for (char c : local) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && specials.find(c) == std::string::npos) return false;
        }
        std::string domain = s.substr(at + 1);
        return domain.find('.') != std::string::npos && is_hostname(domain);
    }

    // 8-4-4-4-12 hex digits
    bool is_uuid(const std::string& s) {
        if (s.size() != 36) return false;
        for (size_t i = 0; i < s.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (s[i] != '-') return false;
            } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
                return false;
            }
        }
        return true;
    }

    // dotted quad, no leading zeros
    bool is_ipv4(const std::string& s) {
        size_t pos = 0;
        for (int part = 0; part < 4; ++part) {
            size_t start = pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
            size_t len = pos - start;
            if (len == 0 || len > 3) return false;
            if (len > 1 && s[start] == '0') return false;
            if (number_at(s, start, len) > 255) return false;
            if (part < 3) {
                if (pos >= s.size() || s[pos] != '.') return false;
                ++pos;
            }
        }
        return pos == s.size();
    }

    bool is_ipv6(const std::string& s) {
        if (s.empty() || s.size() > 45) return false;
        unsigned char buf[16];
        return inet_pton(AF_INET6, s.c_str(), buf) == 1;
    }

    bool is_hostname(const std::string& s) {
        if (s.empty() || s.size() > 253) return false;
        size_t pos = 0;
        while (true) {
            size_t dot = s.find('.', pos);
            std::string label = s.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
            if (label.empty() || label.size() > 63) return false;
            if (label.front() == '-' || label.back() == '-') return false;
            for (char c : label) {
                if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') return false;
            }
            if (dot == std::string::npos) break;
            pos = dot + 1;
        }
        return true;
    }

    // scheme ":" hier-part, no whitespace or control characters
    bool is_uri(const std::string& s) {
        size_t colon = s.find(':');
        if (colon == std::string::npos || colon == 0) return false;
        if (!std::isalpha(static_cast<unsigned char>(s[0]))) return false;
        for (size_t i = 1; i < colon; ++i) {
            char c = s[i];
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') return false;
        }
        if (colon + 1 >= s.size()) return false;
        for (char c : s) {
            unsigned char u = static_cast<unsigned char>(c);
            if (u <= 0x20 || u == 0x7F || c == '"' || c == '<' || c == '>' || c == '\\' || c == '^' || c == '`' ||
                c == '{' || c == '|' || c == '}')
                return false;
        }
        return true;
    }

}  // namespace formats

FormatRegistry FormatRegistry::with_builtins() {
    FormatRegistry r;
    r.add("date", for_strings(&formats::is_date));
    r.add("time", for_strings(&formats::is_time));
    r.add("date-time", for_strings(&formats::is_date_time));
    r.add("email", for_strings(&formats::is_email));
    r.add("uuid", for_strings(&formats::is_uuid));
    r.add("ipv4", for_strings(&formats::is_ipv4));
    r.add("ipv6", for_strings(&formats::is_ipv6));
    r.add("hostname", for_strings(&formats::is_hostname));
    r.add("uri", for_strings(&formats::is_uri));

    // OpenAPI numeric formats
    r.add("int32", [](const Value& v) {
        if (!v.isNumber()) return true;
        if (!v.isIntegral()) return false;
        double d = v.asDouble();
        return d >= static_cast<double>(INT32_MIN) && d <= static_cast<double>(INT32_MAX);
    });
    r.add("int64", [](const Value& v) { return !v.isNumber() || fits_int64(v); });
    r.add("float", [](const Value& v) {
        if (!v.isNumber()) return true;
        double d = v.asDouble();
        return std::isfinite(d) && std::fabs(d) <= static_cast<double>(FLT_MAX);
    });
    r.add("double", [](const Value& v) { return !v.isNumber() || std::isfinite(v.asDouble()); });
    return r;
}

void FormatRegistry::add(const std::string& name, FormatCheck check) { checks_[name] = std::move(check); }

const FormatCheck* FormatRegistry::find(const std::string& name) const {
    auto it = checks_.find(name);
    return it == checks_.end() ? nullptr : &it->second;
}

std::vector<std::string> FormatRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(checks_.size());
    for (auto const& c : checks_) out.push_back(c.first);
    return out;
}

}  // namespace av
