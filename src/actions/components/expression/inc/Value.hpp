#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <nlohmann/json_fwd.hpp>


// Dynamically typed value flowing through expressions, templates, form values and
// step results. Lists and maps are immutable once built and shared between copies.
class Value {
public:
    using List = std::vector<Value>;
    using Map = std::map<std::string, Value>;

    enum class Type {
        Null,
        Bool,
        Integer,
        Double,
        String,
        List,
        Map
    };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : data_(value) {}

    template <typename T,
              typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value, int>::type = 0>
    Value(T value) : data_(static_cast<int64_t>(value)) {}

    Value(double value) : data_(value) {}
    Value(const char* value) : data_(std::string(value)) {}
    Value(std::string value) : data_(std::move(value)) {}
    Value(List list) : data_(std::make_shared<const List>(std::move(list))) {}
    Value(Map map) : data_(std::make_shared<const Map>(std::move(map))) {}

    Type type() const { return static_cast<Type>(data_.index()); }
    std::string type_name() const;

    bool is_null() const { return type() == Type::Null; }
    bool is_bool() const { return type() == Type::Bool; }
    bool is_number() const { return type() == Type::Integer || type() == Type::Double; }
    bool is_string() const { return type() == Type::String; }
    bool is_list() const { return type() == Type::List; }
    bool is_map() const { return type() == Type::Map; }

    bool as_bool() const;
    int64_t as_int() const;
    double as_number() const;
    const std::string& as_string() const;
    const List& as_list() const;
    const Map& as_map() const;

    // null, false, 0, "" and empty containers are falsy
    bool truthy() const;

    // null, "" and [] are empty
    bool empty() const;

    // Map member lookup; a missing key yields null, a non-map target is an error
    Value get_attribute(const std::string& name) const;

    // List position (negative counts from the end), map key or string position
    Value get_index(const Value& key) const;

    // Text form used for argv entries and embedded placeholders
    std::string to_string() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    nlohmann::json to_json() const;
    static Value from_json(const nlohmann::json& json);

private:
    std::variant<
        std::monostate,
        bool,
        int64_t,
        double,
        std::string,
        std::shared_ptr<const List>,
        std::shared_ptr<const Map>
    > data_;
};
