#include <av/pointer.h>
#include <av/errors.h>

#include <cctype>

namespace av {
namespace pointer {

std::string escape(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~')
            out += "~0";
        else if (c == '/')
            out += "~1";
        else
            out.push_back(c);
    }
    return out;
}

std::string unescape(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (size_t i = 0; i < token.size(); ++i) {
        char c = token[i];
        if (c != '~') {
            out.push_back(c);
            continue;
        }
        if (i + 1 >= token.size()) throw Error("invalid JSON pointer escape at end of '" + token + "'");
        char n = token[++i];
        if (n == '0')
            out.push_back('~');
        else if (n == '1')
            out.push_back('/');
        else
            throw Error(std::string("invalid JSON pointer escape '~") + n + "' in '" + token + "'");
    }
    return out;
}

std::string percent_decode(const std::string& s) {
    auto hex = [](char c) -> int {
        if ('0' <= c && c <= '9') return c - '0';
        if ('a' <= c && c <= 'f') return 10 + (c - 'a');
        if ('A' <= c && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() && hex(s[i + 1]) >= 0 && hex(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex(s[i + 1]) * 16 + hex(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

bool is_local(const std::string& ref) { return ref.empty() || ref[0] == '#'; }

std::vector<std::string> split(const std::string& ref) {
    std::vector<std::string> tokens;
    if (!is_local(ref)) throw Error("only local references are supported: '" + ref + "'");
    std::string fragment = ref.empty() ? std::string() : percent_decode(ref.substr(1));
    if (fragment.empty()) return tokens;
    if (fragment[0] != '/') throw Error("'" + ref + "' is not a JSON pointer fragment");

    size_t pos = 1;
    while (true) {
        size_t next = fragment.find('/', pos);
        tokens.push_back(unescape(fragment.substr(pos, next == std::string::npos ? std::string::npos : next - pos)));
        if (next == std::string::npos) break;
        pos = next + 1;
    }
    return tokens;
}

std::string join(const std::vector<std::string>& tokens) {
    std::string out = "#";
    for (auto const& t : tokens) {
        out.push_back('/');
        out += escape(t);
    }
    return out;
}

std::string append(const std::string& pointer, const std::string& token) { return pointer + "/" + escape(token); }

std::string normalize(const std::string& ref) { return join(split(ref)); }

const Value* walk(const Value& root, const std::vector<std::string>& tokens) {
    const Value* cur = &root;
    for (auto const& t : tokens) {
        if (cur->isObject()) {
            cur = cur->find(t);
            if (cur == nullptr) return nullptr;
        } else if (cur->isArray()) {
            if (t.empty() || (t.size() > 1 && t[0] == '0')) return nullptr;
            size_t index = 0;
            for (char c : t) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return nullptr;
                index = index * 10 + static_cast<size_t>(c - '0');
                if (index > cur->size()) return nullptr;
            }
            if (index >= cur->size()) return nullptr;
            cur = &cur->at(index);
        } else {
            return nullptr;
        }
    }
    return cur;
}

}  // namespace pointer
}  // namespace av
