#pragma once

#include <cstddef>
#include <expected>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace curlmux::json {

class Value;
using Null = std::monostate;
using Boolean = bool;
using Number = double;
using String = std::string;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

class Value {
public:
    using VariantType = std::variant<Null, Boolean, Number, String, Array, Object>;
    Value() : data_(Null{}) {}
    Value(Null) : data_(Null{}) {}
    Value(bool b) : data_(b) {}
    Value(int n) : data_(static_cast<double>(n)) {}
    Value(double d) : data_(d) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Boolean>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }
    bool is_object() const { return std::holds_alternative<Object>(data_); }

    bool as_bool() const { return std::get<Boolean>(data_); }
    double as_number() const { return std::get<Number>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }

    // Missing keys and non-objects yield null.
    const Value& operator[](const std::string& key) const {
        static const Value null_value;
        if (!is_object()) return null_value;
        const auto& obj = as_object();
        auto it = obj.find(key);
        return it != obj.end() ? it->second : null_value;
    }
private:
    VariantType data_;
};

struct ParseError {
    std::string message;
    size_t offset = 0;
};

// Strict RFC 8259 parser. Trailing content after the value is an error.
std::expected<Value, ParseError> parse(std::string_view input);

// Compact serialisation. Non-finite numbers are written as null.
std::string dump(const Value& value);

} // namespace curlmux::json
