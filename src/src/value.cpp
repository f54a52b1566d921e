#include <av/value.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace av {

namespace {
    // Shortest representation that reads back to the same double.
    std::string format_double(double x) {
        if (!std::isfinite(x)) return "null";
        char buf[32];
        for (int precision = 15; precision <= 17; ++precision) {
            std::snprintf(buf, sizeof(buf), "%.*g", precision, x);
            if (std::strtod(buf, nullptr) == x) break;
        }
        std::string out(buf);
        // keep doubles recognisable as such
        if (out.find_first_of(".eE") == std::string::npos) out += ".0";
        return out;
    }

    void dump_to(const Value& v, std::ostringstream& ss, int indent, int level) {
        auto newline = [&](int lvl) {
            if (indent <= 0) return;
            ss << '\n' << std::string(static_cast<std::size_t>(indent * lvl), ' ');
        };
        switch (v.type()) {
            case Value::Null:
                ss << "null";
                break;
            case Value::Boolean:
                ss << (v.asBool() ? "true" : "false");
                break;
            case Value::Integer:
                ss << v.asInt();
                break;
            case Value::Double:
                ss << format_double(v.asDouble());
                break;
            case Value::String:
                ss << '"' << escape_json_string(v.asString()) << '"';
                break;
            case Value::Array: {
                const auto& elems = v.asArray();
                if (elems.empty()) {
                    ss << "[]";
                    break;
                }
                ss << '[';
                for (std::size_t i = 0; i < elems.size(); ++i) {
                    if (i > 0) ss << ',';
                    newline(level + 1);
                    dump_to(elems[i], ss, indent, level + 1);
                }
                newline(level);
                ss << ']';
                break;
            }
            case Value::Object: {
                const auto& members = v.items();
                if (members.empty()) {
                    ss << "{}";
                    break;
                }
                ss << '{';
                for (std::size_t i = 0; i < members.size(); ++i) {
                    if (i > 0) ss << ',';
                    newline(level + 1);
                    ss << '"' << escape_json_string(members[i].first) << "\":";
                    if (indent > 0) ss << ' ';
                    dump_to(members[i].second, ss, indent, level + 1);
                }
                newline(level);
                ss << '}';
                break;
            }
        }
    }
}  // namespace

std::string escape_json_string(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string Value::typeName() const {
    switch (my_type) {
        case TYPE::Null:
            return "null";
        case TYPE::Boolean:
            return "boolean";
        case TYPE::Integer:
            return "integer";
        case TYPE::Double:
            return "number";
        case TYPE::String:
            return "string";
        case TYPE::Array:
            return "array";
        case TYPE::Object:
            return "object";
    }
    throw std::logic_error("Not a valid type");
}

bool Value::isIntegral() const noexcept {
    if (my_type == TYPE::Integer) return true;
    if (my_type != TYPE::Double) return false;
    return std::isfinite(m_double) && std::floor(m_double) == m_double;
}

bool Value::asBool() const {
    if (my_type == TYPE::Boolean) return m_bool;
    throw std::runtime_error("not a bool");
}

int64_t Value::asInt() const {
    if (my_type == TYPE::Integer) return m_int;
    if (my_type == TYPE::Double) {
        // [-2^63, 2^63)
        if (!(m_double >= -9223372036854775808.0 && m_double < 9223372036854775808.0))
            throw std::runtime_error("number out of int64 range");
        return static_cast<int64_t>(m_double);
    }
    throw std::runtime_error("not an int");
}

double Value::asDouble() const {
    if (my_type == TYPE::Double) return m_double;
    if (my_type == TYPE::Integer) return static_cast<double>(m_int);
    throw std::runtime_error("not a double");
}

const std::string& Value::asString() const {
    if (my_type == TYPE::String) return m_string;
    throw std::runtime_error("not a string");
}

const std::vector<Value>& Value::asArray() const {
    if (my_type == TYPE::Array) return m_array;
    throw std::logic_error("Not a list");
}

const std::vector<Value::Member>& Value::items() const {
    if (my_type == TYPE::Object) return m_members;
    throw std::logic_error("Cannot get items of non-object type");
}

std::vector<std::string> Value::keys() const {
    std::vector<std::string> out;
    if (my_type != TYPE::Object) return out;
    out.reserve(m_members.size());
    for (auto const& m : m_members) out.push_back(m.first);
    return out;
}

std::size_t Value::size() const noexcept {
    switch (my_type) {
        case TYPE::Array:
            return m_array.size();
        case TYPE::Object:
            return m_members.size();
        default:
            return 0;
    }
}

const Value* Value::find(const std::string& key) const noexcept {
    if (my_type != TYPE::Object) return nullptr;
    auto it = m_index.find(key);
    if (it == m_index.end()) return nullptr;
    return &m_members[it->second].second;
}

const Value& Value::at(const std::string& key) const {
    if (const Value* v = find(key)) return *v;

    // didn't find it, throw a decent error message
    std::ostringstream ss;
    ss << "Could not find key <" << key << "> available options are: ";
    bool first = true;
    for (auto const& m : m_members) {
        if (!first) ss << ",";
        first = false;
        ss << '"' << m.first << '"';
    }
    throw std::out_of_range(ss.str());
}

const Value& Value::at(std::size_t index) const {
    if (my_type != TYPE::Array) throw std::logic_error("Not a list");
    if (index >= m_array.size())
        throw std::out_of_range("index " + std::to_string(index) + " out of range (size " +
                                std::to_string(m_array.size()) + ")");
    return m_array[index];
}

Value& Value::operator[](const std::string& key) {
    if (my_type == TYPE::Null) my_type = TYPE::Object;
    if (my_type != TYPE::Object) throw std::logic_error("Not an object");
    auto it = m_index.find(key);
    if (it != m_index.end()) return m_members[it->second].second;
    m_index.emplace(key, m_members.size());
    m_members.emplace_back(key, Value());
    return m_members.back().second;
}

bool Value::insert(const std::string& key, Value v) {
    if (my_type == TYPE::Null) my_type = TYPE::Object;
    if (my_type != TYPE::Object) throw std::logic_error("Not an object");
    if (m_index.count(key) != 0) return false;
    m_index.emplace(key, m_members.size());
    m_members.emplace_back(key, std::move(v));
    return true;
}

void Value::push_back(Value v) {
    if (my_type == TYPE::Null) my_type = TYPE::Array;
    if (my_type != TYPE::Array) throw std::logic_error("Not a list");
    m_array.push_back(std::move(v));
}

bool Value::operator==(const Value& rhs) const {
    if (isNumber() && rhs.isNumber()) {
        if (isInt() && rhs.isInt()) return m_int == rhs.m_int;
        return asDouble() == rhs.asDouble();
    }
    if (my_type != rhs.my_type) return false;
    switch (my_type) {
        case TYPE::Null:
            return true;
        case TYPE::Boolean:
            return m_bool == rhs.m_bool;
        case TYPE::String:
            return m_string == rhs.m_string;
        case TYPE::Array:
            return m_array == rhs.m_array;
        case TYPE::Object: {
            if (m_members.size() != rhs.m_members.size()) return false;
            for (auto const& m : m_members) {
                const Value* other = rhs.find(m.first);
                if (other == nullptr || *other != m.second) return false;
            }
            return true;
        }
        default:
            break;
    }
    return false;
}

std::string Value::dump(int indent) const {
    std::ostringstream ss;
    dump_to(*this, ss, indent, 0);
    return ss.str();
}

}  // namespace av
