#include <av/json.h>
#include <av/errors.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace av {

namespace {
    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener {
            char ch;
            size_t line, col;
        };
        std::vector<Opener> opener_stack;

        explicit Parser(const std::string& str) : s(str) {}

        char peek() const { return i < s.size() ? s[i] : '\0'; }
        bool at_end() const { return i >= s.size(); }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') {
                ++line;
                col = 1;
            } else
                ++col;
            return c;
        }

        void advance(size_t n) {
            for (size_t k = 0; k < n; ++k) get();
        }

        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            // find start of error line
            size_t pos = 0;
            size_t cur = 1;
            while (cur < err_line and pos < s.size()) {
                if (s[pos] == '\n') ++cur;
                ++pos;
            }
            size_t line_end = pos;
            while (line_end < s.size() and s[line_end] != '\n') ++line_end;
            std::string line_text = s.substr(pos, line_end - pos);
            size_t caret_pos = err_col > 0 ? err_col - 1 : 0;
            if (caret_pos > line_text.size()) caret_pos = line_text.size();
            std::string caret(caret_pos, ' ');
            caret.push_back('^');

            std::ostringstream ss;
            ss << "JSON parse error: " << base << " (line " << err_line << ", column " << err_col << ")\n";
            ss << line_text << "\n" << caret;
            if (not opener_stack.empty()) {
                auto o = opener_stack.back();
                ss << "\n('" << o.ch << "' opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw ParseError(format_error(base, line, col), line, col);
        }

        void open(char ch) {
            opener_stack.push_back(Opener{ch, line, col});
            if (opener_stack.size() > kMaxNestingDepth)
                fail("maximum nesting depth of " + std::to_string(kMaxNestingDepth) + " exceeded");
        }

        void skip_ws() {
            while (i < s.size()) {
                unsigned char c = static_cast<unsigned char>(s[i]);
                if (std::isspace(c)) {
                    get();
                    continue;
                }

                // line comments: //... and #...
                if ((c == '/' and i + 1 < s.size() and s[i + 1] == '/') or c == '#') {
                    while (i < s.size() and peek() != '\n') get();
                    continue;
                }

                // block comment /* ... */
                if (c == '/' and i + 1 < s.size() and s[i + 1] == '*') {
                    size_t l = line, cl = col;
                    advance(2);
                    bool closed = false;
                    while (i < s.size()) {
                        char a = get();
                        if (a == '*' and peek() == '/') {
                            get();
                            closed = true;
                            break;
                        }
                    }
                    if (not closed) throw ParseError(format_error("unterminated block comment", l, cl), l, cl);
                    continue;
                }

                break;
            }
        }

        Value parse_value() {
            skip_ws();
            char c = peek();
            if (c == '\0') fail("unexpected end of input while parsing value");
            if (c == 'n') return parse_literal("null", Value());
            if (c == 't') return parse_literal("true", Value(true));
            if (c == 'f') return parse_literal("false", Value(false));
            if (c == '"') return Value(parse_string());
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            // friendly suggestions for Python-style True/False/None and unquoted identifiers
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_' or
                                         s[j] == '/' or s[j] == '.' or s[j] == '-'))
                    ++j;
                std::string token = s.substr(i, j - i);
                if (token == "True" or token == "False" or token == "None") {
                    std::string sug = token == "True" ? "true" : (token == "False" ? "false" : "null");
                    fail("unexpected token '" + token + "'; did you mean '" + sug + "'?");
                }
                fail("unexpected token '" + token + "'; did you mean to quote it?");
            }
            fail(std::string("unexpected character '") + c + "' while parsing value");
        }

        Value parse_literal(const char* word, Value v) {
            std::string w(word);
            if (s.compare(i, w.size(), w) != 0) fail("invalid literal");
            advance(w.size());
            char next = peek();
            if (std::isalnum(static_cast<unsigned char>(next)) or next == '_') fail("invalid literal");
            return v;
        }

        static int hex_val(char c) {
            if ('0' <= c and c <= '9') return c - '0';
            if ('a' <= c and c <= 'f') return 10 + (c - 'a');
            if ('A' <= c and c <= 'F') return 10 + (c - 'A');
            return -1;
        }

        static void encode_utf8(uint32_t cp, std::string& out) {
            if (cp <= 0x7F)
                out.push_back(static_cast<char>(cp));
            else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                char h = get();
                if (h == '\0') fail("unterminated unicode escape");
                int hv = hex_val(h);
                if (hv < 0) fail("invalid unicode escape");
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        std::string parse_string() {
            size_t start_line = line, start_col = col;
            get();  // opening quote
            std::string out;
            while (true) {
                if (at_end())
                    throw ParseError(format_error("unexpected end in string", start_line, start_col), start_line,
                                     start_col);
                char c = get();
                if (c == '"') break;
                if (static_cast<unsigned char>(c) < 0x20) fail("control character in string; use an escape sequence");
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                char e = get();
                switch (e) {
                    case '"':
                        out.push_back('"');
                        break;
                    case '\\':
                        out.push_back('\\');
                        break;
                    case '/':
                        out.push_back('/');
                        break;
                    case 'b':
                        out.push_back('\b');
                        break;
                    case 'f':
                        out.push_back('\f');
                        break;
                    case 'n':
                        out.push_back('\n');
                        break;
                    case 'r':
                        out.push_back('\r');
                        break;
                    case 't':
                        out.push_back('\t');
                        break;
                    case 'u': {
                        uint32_t cp = parse_hex4();
                        // surrogate pair
                        if (cp >= 0xD800 and cp <= 0xDBFF) {
                            if (peek() != '\\' or i + 1 >= s.size() or s[i + 1] != 'u')
                                fail("unpaired high surrogate in unicode escape");
                            advance(2);
                            uint32_t lo = parse_hex4();
                            if (lo < 0xDC00 or lo > 0xDFFF) fail("invalid low surrogate in unicode escape");
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        } else if (cp >= 0xDC00 and cp <= 0xDFFF) {
                            fail("unpaired low surrogate in unicode escape");
                        }
                        encode_utf8(cp, out);
                        break;
                    }
                    case '\0':
                        fail("unexpected end in string escape");
                    default:
                        fail(std::string("unsupported escape sequence '\\") + e + "'");
                }
            }
            return out;
        }

        Value parse_number() {
            size_t start = i;
            if (peek() == '-') get();
            if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
            if (peek() == '0' and i + 1 < s.size() and std::isdigit(static_cast<unsigned char>(s[i + 1])))
                fail("invalid number; leading zeros are not allowed");
            while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            bool is_float = false;
            if (peek() == '.') {
                is_float = true;
                get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            if (peek() == 'e' or peek() == 'E') {
                is_float = true;
                get();
                if (peek() == '+' or peek() == '-') get();
                if (not std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
                while (std::isdigit(static_cast<unsigned char>(peek()))) get();
            }
            std::string token = s.substr(start, i - start);
            if (not is_float) {
                errno = 0;
                long long v = std::strtoll(token.c_str(), nullptr, 10);
                if (errno != ERANGE) return Value(static_cast<int64_t>(v));
                // out of int64 range: keep it as a double
            }
            return Value(std::strtod(token.c_str(), nullptr));
        }

        Value parse_array() {
            open('[');
            get();
            Value out = Value::array();
            skip_ws();
            if (peek() == ']') {
                get();
                opener_stack.pop_back();
                return out;
            }
            while (true) {
                out.push_back(parse_value());
                skip_ws();
                char c = peek();
                if (c == ']') {
                    get();
                    break;
                }
                if (c == ',') {
                    get();
                    skip_ws();
                    if (peek() == ']') fail("trailing ',' before ']'");
                    continue;
                }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                if (c == '\0') fail("unexpected end of input; expected ',' or ']'");
                fail("expected ',' or ']'");
            }
            opener_stack.pop_back();
            return out;
        }

        Value parse_object() {
            open('{');
            get();
            Value d = Value::object();
            skip_ws();
            if (peek() == '}') {
                get();
                opener_stack.pop_back();
                return d;
            }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    // attempt to read an identifier to provide a helpful suggestion
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_')) ++j;
                    std::string ident = s.substr(i, j - i);
                    std::string base = "expected string key";
                    if (not ident.empty()) base += "; are you missing quotes around '" + ident + "'?";
                    fail(base);
                }
                size_t key_line = line, key_col = col;
                std::string key = parse_string();
                skip_ws();
                if (peek() != ':') fail("expected ':' after object key");
                get();
                Value v = parse_value();
                if (not d.insert(key, std::move(v)))
                    throw ParseError(format_error("duplicate key '" + key + "'", key_line, key_col), key_line,
                                     key_col);
                skip_ws();
                char c = peek();
                if (c == '}') {
                    get();
                    break;
                }
                if (c == ',') {
                    get();
                    skip_ws();
                    if (peek() == '}') fail("trailing ',' before '}'");
                    continue;
                }
                if (c == '"') fail("expected ',' or '}'; is there a missing ',' before this key?");
                if (c == '\0') fail("unexpected end of input; expected ',' or '}'");
                fail("expected ',' or '}'");
            }
            opener_stack.pop_back();
            return d;
        }
    };
}  // namespace

Value parse_json(const std::string& text) {
    Parser p(text);
    p.skip_ws();
    if (p.at_end()) throw ParseError("JSON parse error: empty document", 1, 1);
    Value val = p.parse_value();
    p.skip_ws();
    if (not p.at_end()) p.fail("extra data after JSON value");
    return val;
}

}  // namespace av
