// av::Value - the document tree shared by schema documents and instances
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace av {

class Value {
  public:
    enum TYPE { Null, Boolean, Integer, Double, String, Array, Object };

    using Member = std::pair<std::string, Value>;

  private:
    TYPE my_type = TYPE::Null;
    bool m_bool = false;
    int64_t m_int = 0;
    double m_double = 0.0;
    std::string m_string;

    std::vector<Value> m_array;
    // Object members keep their insertion order; m_index maps key -> position.
    std::vector<Member> m_members;
    std::map<std::string, std::size_t> m_index;

  public:
    Value() = default;
    Value(bool b) : my_type(TYPE::Boolean), m_bool(b) {}
    Value(int n) : my_type(TYPE::Integer), m_int(n) {}
    Value(int64_t n) : my_type(TYPE::Integer), m_int(n) {}
    Value(double x) : my_type(TYPE::Double), m_double(x) {}
    Value(const char* s) : my_type(TYPE::String), m_string(s) {}
    Value(std::string s) : my_type(TYPE::String), m_string(std::move(s)) {}

    static Value null() { return Value(); }

    static Value array(std::vector<Value> elements = {}) {
        Value v;
        v.my_type = TYPE::Array;
        v.m_array = std::move(elements);
        return v;
    }

    static Value object() {
        Value v;
        v.my_type = TYPE::Object;
        return v;
    }

    TYPE type() const noexcept { return my_type; }

    // JSON type name: null, boolean, integer, number, string, array, object.
    // Doubles report "number" even when they carry no fractional part.
    std::string typeName() const;

    bool isNull() const noexcept { return my_type == TYPE::Null; }
    bool isBool() const noexcept { return my_type == TYPE::Boolean; }
    bool isInt() const noexcept { return my_type == TYPE::Integer; }
    bool isDouble() const noexcept { return my_type == TYPE::Double; }
    bool isNumber() const noexcept { return isInt() || isDouble(); }
    bool isString() const noexcept { return my_type == TYPE::String; }
    bool isArray() const noexcept { return my_type == TYPE::Array; }
    bool isObject() const noexcept { return my_type == TYPE::Object; }

    // A number with no fractional component, independent of storage.
    bool isIntegral() const noexcept;

    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    const std::string& asString() const;
    const std::vector<Value>& asArray() const;
    const std::vector<Member>& items() const;
    std::vector<std::string> keys() const;

    // Element count of arrays, member count of objects, 0 for scalars.
    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    bool has(const std::string& key) const noexcept { return find(key) != nullptr; }
    const Value* find(const std::string& key) const noexcept;
    const Value& at(const std::string& key) const;
    const Value& at(std::size_t index) const;

    // Mutating access. operator[] turns a null value into an object.
    Value& operator[](const std::string& key);
    // Returns false (and leaves the value untouched) when the key exists.
    bool insert(const std::string& key, Value v);
    void push_back(Value v);

    // Structural equality: numbers by value (1 == 1.0), objects by key set
    // regardless of member order, arrays element-wise.
    bool operator==(const Value& rhs) const;
    bool operator!=(const Value& rhs) const { return !(*this == rhs); }

    // Compact JSON when indent == 0, otherwise pretty-printed.
    std::string dump(int indent = 0) const;
};

std::string escape_json_string(const std::string& s);

// Deepest array/object nesting the JSON and YAML readers accept.
constexpr std::size_t kMaxNestingDepth = 1000;

}  // namespace av
