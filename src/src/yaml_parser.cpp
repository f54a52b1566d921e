#include <av/yaml.h>
#include <av/errors.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>
#include <vector>

namespace av {

namespace {
    [[noreturn]] void yaml_error(const std::string& msg, size_t line, size_t col = 1) {
        throw ParseError("YAML parse error: " + msg + " (line " + std::to_string(line) + ")", line, col);
    }

    std::string trim(const std::string& s) {
        size_t a = 0;
        while (a < s.size() && (s[a] == ' ' || s[a] == '\t')) ++a;
        size_t b = s.size();
        while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
        return s.substr(a, b - a);
    }

    // Remove a trailing `# comment` that is not inside quotes.
    std::string strip_comment(const std::string& s) {
        bool in_single = false, in_double = false;
        for (size_t i = 0; i < s.size(); ++i) {
            char c = s[i];
            if (in_double) {
                if (c == '\\')
                    ++i;
                else if (c == '"')
                    in_double = false;
                continue;
            }
            if (in_single) {
                if (c == '\'') in_single = false;
                continue;
            }
            if (c == '"' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '[' || s[i - 1] == '{' || s[i - 1] == ','))
                in_double = true;
            else if (c == '\'' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '[' || s[i - 1] == '{' || s[i - 1] == ','))
                in_single = true;
            else if (c == '#' && (i == 0 || s[i - 1] == ' ' || s[i - 1] == '\t'))
                return s.substr(0, i);
        }
        return s;
    }

    void encode_utf8(uint32_t cp, std::string& out) {
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

    // s[i] is the opening '"'; on return i is one past the closing quote.
    std::string parse_double_quoted(const std::string& s, size_t& i, size_t line) {
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) yaml_error("unterminated quoted string", line);
            char c = s[i++];
            if (c == '"') break;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) yaml_error("unterminated escape sequence", line);
            char e = s[i++];
            switch (e) {
                case 'n':
                    out.push_back('\n');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case '0':
                    out.push_back('\0');
                    break;
                case '"':
                case '\\':
                case '/':
                case ' ':
                    out.push_back(e);
                    break;
                case 'x':
                case 'u':
                case 'U': {
                    size_t digits = e == 'x' ? 2 : (e == 'u' ? 4 : 8);
                    if (i + digits > s.size()) yaml_error("truncated unicode escape", line);
                    uint32_t cp = 0;
                    for (size_t k = 0; k < digits; ++k) {
                        char h = s[i++];
                        if (!std::isxdigit(static_cast<unsigned char>(h))) yaml_error("invalid unicode escape", line);
                        cp = (cp << 4) | static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(h))
                                                                   ? h - '0'
                                                                   : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                    }
                    encode_utf8(cp, out);
                    break;
                }
                default:
                    yaml_error(std::string("unsupported escape sequence '\\") + e + "'", line);
            }
        }
        return out;
    }

    // s[i] is the opening '\''; '' inside the string is an escaped quote.
    std::string parse_single_quoted(const std::string& s, size_t& i, size_t line) {
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) yaml_error("unterminated quoted string", line);
            char c = s[i++];
            if (c == '\'') {
                if (i < s.size() && s[i] == '\'') {
                    out.push_back('\'');
                    ++i;
                    continue;
                }
                break;
            }
            out.push_back(c);
        }
        return out;
    }

    bool looks_numeric(const std::string& str) {
        if (str.empty()) return false;
        char f = str[0];
        if (!(std::isdigit(static_cast<unsigned char>(f)) || f == '-' || f == '+' || f == '.')) return false;
        for (char c : str) {
            if (!(std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' || c == '+' ||
                  c == '-'))
                return false;
        }
        return true;
    }

    // Plain scalar resolution following the YAML 1.2 core schema.
    Value parse_scalar(const std::string& str) {
        if (str.empty() || str == "null" || str == "~" || str == "Null" || str == "NULL") return Value();
        if (str == "true" || str == "True" || str == "TRUE") return Value(true);
        if (str == "false" || str == "False" || str == "FALSE") return Value(false);

        if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'o')) {
            char* end = nullptr;
            errno = 0;
            long long v = std::strtoll(str.c_str() + 2, &end, str[1] == 'x' ? 16 : 8);
            if (errno == 0 && end && *end == '\0') return Value(static_cast<int64_t>(v));
            return Value(str);
        }

        if (looks_numeric(str)) {
            bool is_float = str.find_first_of(".eE") != std::string::npos;
            char* end = nullptr;
            errno = 0;
            if (!is_float) {
                long long v = std::strtoll(str.c_str(), &end, 10);
                if (errno == 0 && end && *end == '\0') return Value(static_cast<int64_t>(v));
                errno = 0;
            }
            double d = std::strtod(str.c_str(), &end);
            if (errno == 0 && end && *end == '\0') return Value(d);
        }
        return Value(str);
    }

    void reject_unsupported(const std::string& text, size_t line) {
        if (text.empty()) return;
        char c = text[0];
        if (c == '&' || c == '*') yaml_error("anchors and aliases are not supported", line);
        if (c == '!') yaml_error("tags are not supported", line);
        if (c == '?' && (text.size() == 1 || text[1] == ' ')) yaml_error("complex mapping keys are not supported", line);
        if (c == '@' || c == '`') yaml_error(std::string("reserved indicator '") + c + "' cannot start a scalar", line);
    }

    // Flow collections: [a, b] and {k: v}, possibly nested.
    struct FlowParser {
        const std::string& s;
        size_t i = 0;
        size_t line;
        size_t depth = 0;

        FlowParser(const std::string& str, size_t l) : s(str), line(l) {}

        void skip_ws() {
            while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
        }

        char peek() const { return i < s.size() ? s[i] : '\0'; }

        Value parse_all() {
            Value v = parse_value(false);
            skip_ws();
            if (i < s.size()) yaml_error("unexpected text after flow collection: '" + s.substr(i) + "'", line);
            return v;
        }

        std::string parse_plain(bool is_key) {
            size_t start = i;
            while (i < s.size()) {
                char c = s[i];
                if (c == ',' || c == ']' || c == '}' || c == '[' || c == '{') break;
                if (c == ':' && (i + 1 >= s.size() || s[i + 1] == ' ' || s[i + 1] == ',' || s[i + 1] == '}' ||
                                 s[i + 1] == ']'))
                    break;
                ++i;
            }
            (void)is_key;
            return trim(s.substr(start, i - start));
        }

        Value parse_value(bool is_key) {
            skip_ws();
            char c = peek();
            if (c == '[' || c == '{') {
                if (++depth > kMaxNestingDepth)
                    yaml_error("maximum nesting depth of " + std::to_string(kMaxNestingDepth) + " exceeded", line);
                Value v = c == '[' ? parse_sequence() : parse_mapping();
                --depth;
                return v;
            }
            if (c == '"') return Value(parse_double_quoted(s, i, line));
            if (c == '\'') return Value(parse_single_quoted(s, i, line));
            std::string plain = parse_plain(is_key);
            reject_unsupported(plain, line);
            return parse_scalar(plain);
        }

        Value parse_sequence() {
            ++i;
            Value out = Value::array();
            while (true) {
                skip_ws();
                if (i >= s.size()) yaml_error("unterminated flow sequence", line);
                if (peek() == ']') {
                    ++i;
                    return out;
                }
                out.push_back(parse_value(false));
                skip_ws();
                if (peek() == ',') {
                    ++i;
                    continue;
                }
                if (peek() == ']') continue;
                yaml_error("expected ',' or ']' in flow sequence", line);
            }
        }

        Value parse_mapping() {
            ++i;
            Value out = Value::object();
            while (true) {
                skip_ws();
                if (i >= s.size()) yaml_error("unterminated flow mapping", line);
                if (peek() == '}') {
                    ++i;
                    return out;
                }
                std::string key;
                if (peek() == '"')
                    key = parse_double_quoted(s, i, line);
                else if (peek() == '\'')
                    key = parse_single_quoted(s, i, line);
                else
                    key = parse_plain(true);
                skip_ws();
                Value value;
                if (peek() == ':') {
                    ++i;
                    skip_ws();
                    if (peek() != ',' && peek() != '}') value = parse_value(false);
                }
                if (!out.insert(key, std::move(value))) yaml_error("duplicate key '" + key + "' in flow mapping", line);
                skip_ws();
                if (peek() == ',') {
                    ++i;
                    continue;
                }
                if (peek() == '}') continue;
                yaml_error("expected ',' or '}' in flow mapping", line);
            }
        }
    };

    struct Line {
        size_t number;
        int indent;
        std::string text;  // comment stripped and trimmed
        std::string raw;   // everything after the indentation
        bool blank;
    };

    struct YamlParser {
        std::vector<Line> lines;
        size_t idx = 0;
        size_t depth = 0;

        explicit YamlParser(const std::string& s) { split(s); }

        void split(const std::string& s) {
            size_t pos = 0;
            size_t number = 0;
            bool seen_content = false;
            bool ended = false;
            while (pos <= s.size()) {
                size_t eol = s.find('\n', pos);
                if (eol == std::string::npos) eol = s.size();
                std::string raw_line = s.substr(pos, eol - pos);
                pos = eol + 1;
                ++number;
                if (!raw_line.empty() && raw_line.back() == '\r') raw_line.pop_back();

                size_t k = 0;
                while (k < raw_line.size() && raw_line[k] == ' ') ++k;
                Line ln;
                ln.number = number;
                ln.indent = static_cast<int>(k);
                ln.raw = raw_line.substr(k);
                ln.text = trim(strip_comment(ln.raw));
                ln.blank = ln.text.empty() || ended;
                if (!ln.blank && k < raw_line.size() && raw_line[k] == '\t')
                    yaml_error("tabs are not allowed for indentation", number, k + 1);

                if (!ln.blank && ln.indent == 0) {
                    if (ln.text[0] == '%' && !seen_content) {
                        ln.blank = true;  // directive
                    } else if (ln.text == "---" || ln.text.rfind("--- ", 0) == 0) {
                        if (seen_content) yaml_error("multi-document streams are not supported", number);
                        std::string rest = trim(ln.text.substr(3));
                        ln.blank = rest.empty();
                        ln.text = rest;
                        ln.raw = rest;
                    } else if (ln.text == "...") {
                        ln.blank = true;
                        ended = true;
                    }
                }
                if (!ln.blank) seen_content = true;
                lines.push_back(std::move(ln));
                if (eol == s.size()) break;
            }
        }

        bool next_content() {
            while (idx < lines.size() && lines[idx].blank) ++idx;
            return idx < lines.size();
        }

        static bool is_seq_item(const std::string& text) {
            return text == "-" || (text.size() >= 2 && text[0] == '-' && text[1] == ' ');
        }

        // Split `key: rest`. Returns false when the text is not a mapping entry.
        static bool split_key(const std::string& text, std::string& key, std::string& rest, size_t line) {
            if (text.empty() || text[0] == '[' || text[0] == '{') return false;
            size_t pos = 0;
            if (text[0] == '"' || text[0] == '\'') {
                size_t i = 0;
                key = text[0] == '"' ? parse_double_quoted(text, i, line) : parse_single_quoted(text, i, line);
                while (i < text.size() && text[i] == ' ') ++i;
                if (i >= text.size() || text[i] != ':') return false;
                if (i + 1 < text.size() && text[i + 1] != ' ') return false;
                pos = i;
            } else {
                pos = std::string::npos;
                for (size_t i = 0; i < text.size(); ++i) {
                    if (text[i] == ':' && (i + 1 == text.size() || text[i + 1] == ' ')) {
                        pos = i;
                        break;
                    }
                }
                if (pos == std::string::npos) return false;
                key = trim(text.substr(0, pos));
                if (key.empty()) return false;
            }
            rest = trim(text.substr(pos + 1));
            return true;
        }

        static int bracket_depth(const std::string& text) {
            int depth = 0;
            bool in_single = false, in_double = false;
            for (size_t i = 0; i < text.size(); ++i) {
                char c = text[i];
                if (in_double) {
                    if (c == '\\')
                        ++i;
                    else if (c == '"')
                        in_double = false;
                } else if (in_single) {
                    if (c == '\'') in_single = false;
                } else if (c == '"') {
                    in_double = true;
                } else if (c == '\'') {
                    in_single = true;
                } else if (c == '[' || c == '{') {
                    ++depth;
                } else if (c == ']' || c == '}') {
                    --depth;
                }
            }
            return depth;
        }

        // A flow collection may continue over the following lines.
        std::string collect_flow(std::string text, size_t line) {
            if (text.empty() || (text[0] != '[' && text[0] != '{')) return text;
            while (bracket_depth(text) > 0) {
                if (!next_content()) yaml_error("unterminated flow collection", line);
                text += " " + lines[idx].text;
                ++idx;
            }
            return text;
        }

        Value parse_inline(const std::string& text, size_t line) {
            if (text.empty()) return Value();
            reject_unsupported(text, line);
            if (text[0] == '[' || text[0] == '{') return FlowParser(text, line).parse_all();
            if (text[0] == '"' || text[0] == '\'') {
                size_t i = 0;
                std::string out = text[0] == '"' ? parse_double_quoted(text, i, line)
                                                 : parse_single_quoted(text, i, line);
                if (!trim(text.substr(i)).empty())
                    yaml_error("unexpected text after quoted string: '" + trim(text.substr(i)) + "'", line);
                return Value(out);
            }
            return parse_scalar(text);
        }

        // `|`, `|-`, `|+`, `>`, `>-`, `>+`; idx points at the first content line.
        Value parse_block_scalar(const std::string& header, int parent_indent, size_t line) {
            bool folded = header[0] == '>';
            char chomp = header.size() > 1 ? header[1] : ' ';
            if (header.size() > 2 || (header.size() == 2 && chomp != '-' && chomp != '+'))
                yaml_error("unsupported block scalar header '" + header + "'", line);

            std::vector<std::string> body;
            int block_indent = -1;
            while (idx < lines.size()) {
                const Line& ln = lines[idx];
                bool empty = trim(ln.raw).empty();
                if (!empty && ln.indent <= parent_indent) break;
                if (empty) {
                    body.emplace_back();
                } else {
                    if (block_indent < 0) block_indent = ln.indent;
                    if (ln.indent < block_indent) yaml_error("inconsistent indentation in block scalar", ln.number);
                    body.push_back(std::string(static_cast<size_t>(ln.indent - block_indent), ' ') + ln.raw);
                }
                ++idx;
            }

            size_t trailing = 0;
            while (!body.empty() && body.back().empty()) {
                body.pop_back();
                ++trailing;
            }

            std::string out;
            bool prev_content = false;
            for (size_t k = 0; k < body.size(); ++k) {
                const std::string& b = body[k];
                if (!folded) {
                    if (k > 0) out.push_back('\n');
                    out += b;
                    continue;
                }
                if (b.empty()) {
                    out.push_back('\n');
                    prev_content = false;
                } else {
                    if (prev_content) out.push_back(' ');
                    out += b;
                    prev_content = true;
                }
            }
            if (chomp == '+')
                out += std::string(trailing + 1, '\n');
            else if (chomp != '-' && !body.empty())
                out.push_back('\n');
            return Value(out);
        }

        void check_no_deeper(int indent) {
            if (next_content() && lines[idx].indent > indent)
                yaml_error("unexpected indentation", lines[idx].number, static_cast<size_t>(lines[idx].indent) + 1);
        }

        Value parse_node(int indent) {
            if (++depth > kMaxNestingDepth)
                yaml_error("maximum nesting depth of " + std::to_string(kMaxNestingDepth) + " exceeded",
                           lines[idx].number, static_cast<size_t>(indent) + 1);
            Value v = parse_node_at(indent);
            --depth;
            return v;
        }

        Value parse_node_at(int indent) {
            const Line& ln = lines[idx];
            std::string key, rest;
            if (is_seq_item(ln.text)) return parse_sequence(indent);
            if (split_key(ln.text, key, rest, ln.number)) return parse_mapping(indent);
            size_t number = ln.number;
            std::string text = ln.text;
            ++idx;
            if (!text.empty() && (text[0] == '|' || text[0] == '>')) return parse_block_scalar(text, indent - 1, number);
            Value v = parse_inline(collect_flow(text, number), number);
            check_no_deeper(indent);
            return v;
        }

        Value parse_mapping(int indent) {
            Value obj = Value::object();
            while (next_content() && lines[idx].indent == indent) {
                const Line& ln = lines[idx];
                size_t number = ln.number;
                if (is_seq_item(ln.text)) yaml_error("unexpected sequence item inside a mapping", number);
                std::string key, rest;
                if (!split_key(ln.text, key, rest, number))
                    yaml_error("expected 'key: value' but found '" + ln.text + "'", number);
                ++idx;

                Value value;
                if (rest.empty()) {
                    if (next_content()) {
                        const Line& nx = lines[idx];
                        if (nx.indent > indent)
                            value = parse_node(nx.indent);
                        else if (nx.indent == indent && is_seq_item(nx.text))
                            value = parse_sequence(indent);
                    }
                } else if (rest[0] == '|' || rest[0] == '>') {
                    value = parse_block_scalar(rest, indent, number);
                } else {
                    value = parse_inline(collect_flow(rest, number), number);
                    check_no_deeper(indent);
                }

                if (!obj.insert(key, std::move(value))) yaml_error("duplicate key '" + key + "' in YAML mapping", number);
            }
            return obj;
        }

        Value parse_sequence(int indent) {
            Value arr = Value::array();
            while (next_content() && lines[idx].indent == indent && is_seq_item(lines[idx].text)) {
                Line& ln = lines[idx];
                size_t number = ln.number;
                size_t off = 1;
                while (off < ln.text.size() && ln.text[off] == ' ') ++off;
                std::string item = ln.text.substr(off);
                std::string key, rest;

                if (item.empty()) {
                    ++idx;
                    if (next_content() && lines[idx].indent > indent)
                        arr.push_back(parse_node(lines[idx].indent));
                    else
                        arr.push_back(Value());
                } else if (is_seq_item(item) || split_key(item, key, rest, number)) {
                    // "- key: value": the item is a nested block starting at the item's column
                    size_t raw_off = ln.raw.find(item);
                    ln.indent += static_cast<int>(off);
                    ln.text = item;
                    ln.raw = raw_off == std::string::npos ? item : ln.raw.substr(raw_off);
                    arr.push_back(parse_node(ln.indent));
                } else if (item[0] == '|' || item[0] == '>') {
                    ++idx;
                    arr.push_back(parse_block_scalar(item, indent, number));
                } else {
                    ++idx;
                    arr.push_back(parse_inline(collect_flow(item, number), number));
                    check_no_deeper(indent);
                }
            }
            return arr;
        }

        Value parse() {
            if (!next_content()) return Value();
            int indent = lines[idx].indent;
            Value root = parse_node(indent);
            if (next_content())
                yaml_error("unexpected content '" + lines[idx].text + "'; check indentation", lines[idx].number,
                           static_cast<size_t>(lines[idx].indent) + 1);
            return root;
        }
    };
}  // namespace

Value parse_yaml(const std::string& text) {
    YamlParser parser(text);
    return parser.parse();
}

}  // namespace av
