// tl::Value / tl::Dictionary - the in-memory form of a parsed JSON document
#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace tl {

struct Dictionary;

// One JSON value. Objects are held through a shared pointer, so copying a
// Value that holds an object shares the members; operator== compares content.
struct Value {
    using list_t = std::vector<Value>;
    using dict_ptr = std::shared_ptr<Dictionary>;
    using key_type = std::string;

    std::variant<std::monostate, int64_t, double, bool, std::string, list_t, dict_ptr> v;

    Value() = default;
    Value(int64_t x) : v(x) {}
    Value(int x) : v(int64_t(x)) {}
    Value(double x) : v(x) {}
    Value(bool b) : v(b) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(std::string s) : v(std::move(s)) {}
    Value(list_t l) : v(std::move(l)) {}
    Value(Dictionary d);

    static Value null() { return Value(); }
    static Value list() { return Value(list_t{}); }
    static Value object();

    bool is_null() const noexcept { return v.index() == 0; }
    bool is_int() const noexcept { return std::holds_alternative<int64_t>(v); }
    bool is_double() const noexcept { return std::holds_alternative<double>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_list() const noexcept { return std::holds_alternative<list_t>(v); }
    bool is_dict() const noexcept { return std::holds_alternative<dict_ptr>(v); }

    bool isNull() const noexcept { return is_null(); }
    bool isList() const noexcept { return is_list(); }
    bool isDict() const noexcept { return is_dict(); }

    int64_t as_int() const { return std::get<int64_t>(v); }
    double as_double() const { return std::get<double>(v); }
    bool as_bool() const { return std::get<bool>(v); }
    const std::string& as_string() const { return std::get<std::string>(v); }
    const list_t& as_list() const { return std::get<list_t>(v); }
    const Dictionary& as_dict() const { return *std::get<dict_ptr>(v); }

    // Lenient accessors: numbers convert into each other, asString() falls
    // back to the JSON text. Anything else throws std::runtime_error.
    std::string asString() const { return is_string() ? as_string() : dump(); }
    int64_t asInt() const;
    double asDouble() const;
    bool asBool() const;
    std::vector<std::string> asStrings() const;

    // JSON has one number type: an integer equals a double of the same value.
    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

    // Mutable access turns the value into a list/object first if needed and
    // grows the list to fit idx.
    Value& operator[](size_t idx);
    Value& operator[](const key_type& k);

    const Value& at(size_t idx) const;
    const Value& at(const key_type& k) const;

    size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }
    std::vector<std::string> keys() const;
    bool has(const key_type& k) const;

    // JSON text; compact when indent < 0 (see json_printer.cpp)
    std::string dump(int indent = -1) const;
    std::string type_name() const;
};

struct Dictionary {
    using key_type = std::string;
    using map_type = std::map<key_type, Value>;

    map_type data;

    Dictionary() = default;
    Dictionary(std::initializer_list<map_type::value_type> init) : data(init) {}

    size_t count(const key_type& k) const { return data.count(k); }
    bool has(const key_type& k) const { return data.count(k) != 0; }
    size_t size() const noexcept { return data.size(); }
    bool empty() const noexcept { return data.empty(); }
    bool erase(const key_type& k) { return data.erase(k) != 0; }
    void clear() noexcept { data.clear(); }

    Value& operator[](const key_type& k) { return data[k]; }
    const Value& at(const key_type& k) const {
        auto it = data.find(k);
        if (it == data.end()) throw std::out_of_range("key not found: \"" + k + "\"");
        return it->second;
    }
    Value& at(const key_type& k) {
        return const_cast<Value&>(static_cast<const Dictionary&>(*this).at(k));
    }

    std::vector<key_type> keys() const {
        std::vector<key_type> out;
        out.reserve(data.size());
        for (const auto& kv : data) out.push_back(kv.first);
        return out;
    }

    std::string dump(int indent = -1) const { return Value(*this).dump(indent); }
};

inline Value::Value(Dictionary d) : v(std::make_shared<Dictionary>(std::move(d))) {}

inline Value Value::object() { return Value(Dictionary{}); }

inline int64_t Value::asInt() const {
    if (is_int()) return as_int();
    if (is_double()) return static_cast<int64_t>(as_double());
    throw std::runtime_error("not an integer: " + dump());
}

inline double Value::asDouble() const {
    if (is_double()) return as_double();
    if (is_int()) return static_cast<double>(as_int());
    throw std::runtime_error("not a number: " + dump());
}

inline bool Value::asBool() const {
    if (!is_bool()) throw std::runtime_error("not a boolean: " + dump());
    return as_bool();
}

inline std::vector<std::string> Value::asStrings() const {
    if (!is_list()) throw std::runtime_error("not an array: " + dump());
    std::vector<std::string> out;
    for (const auto& e : as_list()) out.push_back(e.asString());
    return out;
}

inline bool Value::operator==(const Value& o) const {
    if (is_dict() and o.is_dict()) return as_dict().data == o.as_dict().data;
    if (is_double() != o.is_double() and (is_int() or o.is_int()))
        return asDouble() == o.asDouble();
    return v == o.v;
}

inline Value& Value::operator[](size_t idx) {
    if (!is_list()) v = list_t{};
    auto& items = std::get<list_t>(v);
    if (idx >= items.size()) items.resize(idx + 1);
    return items[idx];
}

inline Value& Value::operator[](const key_type& k) {
    if (!is_dict()) v = std::make_shared<Dictionary>();
    return (*std::get<dict_ptr>(v))[k];
}

inline const Value& Value::at(size_t idx) const {
    if (!is_list()) throw std::out_of_range("not an array: " + type_name());
    if (idx >= as_list().size()) throw std::out_of_range("index out of range: " + std::to_string(idx));
    return as_list()[idx];
}

inline const Value& Value::at(const key_type& k) const {
    if (!is_dict()) throw std::out_of_range("not an object: " + type_name());
    return as_dict().at(k);
}

inline size_t Value::size() const noexcept {
    if (is_list()) return as_list().size();
    if (is_dict()) return as_dict().size();
    return 0;
}

inline std::vector<std::string> Value::keys() const {
    if (!is_dict()) throw std::runtime_error("not an object: " + type_name());
    return as_dict().keys();
}

inline bool Value::has(const key_type& k) const { return is_dict() and as_dict().has(k); }

inline std::string Value::type_name() const {
    switch (v.index()) {
        case 0: return "null";
        case 1: return "integer";
        case 2: return "number";
        case 3: return "boolean";
        case 4: return "string";
        case 5: return "array";
        default: return "object";
    }
}

} // namespace tl
