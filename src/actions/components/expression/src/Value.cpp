#include "Value.hpp"
#include "EngineError.hpp"
#include "StringUtils.hpp"
#include <cmath>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

std::string Value::type_name() const {
    switch (type()) {
        case Type::Null:    return "null";
        case Type::Bool:    return "bool";
        case Type::Integer: return "int";
        case Type::Double:  return "float";
        case Type::String:  return "string";
        case Type::List:    return "list";
        case Type::Map:     return "map";
    }
    return "unknown";
}

bool Value::as_bool() const {
    if (!is_bool()) {
        throw EvaluationError("Expected bool but got " + type_name());
    }
    return std::get<bool>(data_);
}

int64_t Value::as_int() const {
    if (type() == Type::Integer) {
        return std::get<int64_t>(data_);
    }
    if (type() == Type::Double) {
        double d = std::get<double>(data_);
        if (std::floor(d) == d) {
            return static_cast<int64_t>(d);
        }
    }
    throw EvaluationError("Expected integer but got " + type_name());
}

double Value::as_number() const {
    if (type() == Type::Integer) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    if (type() == Type::Double) {
        return std::get<double>(data_);
    }
    throw EvaluationError("Expected number but got " + type_name());
}

const std::string& Value::as_string() const {
    if (!is_string()) {
        throw EvaluationError("Expected string but got " + type_name());
    }
    return std::get<std::string>(data_);
}

const Value::List& Value::as_list() const {
    if (!is_list()) {
        throw EvaluationError("Expected list but got " + type_name());
    }
    return *std::get<std::shared_ptr<const List>>(data_);
}

const Value::Map& Value::as_map() const {
    if (!is_map()) {
        throw EvaluationError("Expected map but got " + type_name());
    }
    return *std::get<std::shared_ptr<const Map>>(data_);
}

bool Value::truthy() const {
    switch (type()) {
        case Type::Null:    return false;
        case Type::Bool:    return std::get<bool>(data_);
        case Type::Integer: return std::get<int64_t>(data_) != 0;
        case Type::Double:  return std::get<double>(data_) != 0.0;
        case Type::String:  return !std::get<std::string>(data_).empty();
        case Type::List:    return !as_list().empty();
        case Type::Map:     return !as_map().empty();
    }
    return false;
}

bool Value::empty() const {
    switch (type()) {
        case Type::Null:   return true;
        case Type::String: return std::get<std::string>(data_).empty();
        case Type::List:   return as_list().empty();
        default:           return false;
    }
}

Value Value::get_attribute(const std::string& name) const {
    if (!is_map()) {
        throw EvaluationError(fmt::format("Attribute access '.{}' on {} value", name, type_name()));
    }
    const auto& map = as_map();
    auto it = map.find(name);
    return it == map.end() ? Value() : it->second;
}

Value Value::get_index(const Value& key) const {
    if (is_list() || is_string()) {
        if (key.type() != Type::Integer) {
            throw EvaluationError(fmt::format("{} index must be int, not {}", type_name(), key.type_name()));
        }
        // Strings index by character, matching len()
        std::vector<std::string> chars;
        if (is_string()) {
            chars = StringUtils::utf8_chars(as_string());
        }
        const int64_t size = is_list()
            ? static_cast<int64_t>(as_list().size())
            : static_cast<int64_t>(chars.size());
        int64_t pos = key.as_int();
        if (pos < 0) pos += size;
        if (pos < 0 || pos >= size) {
            throw EvaluationError(fmt::format("{} index {} out of range", type_name(), key.as_int()));
        }
        if (is_list()) {
            return as_list()[static_cast<size_t>(pos)];
        }
        return chars[static_cast<size_t>(pos)];
    }

    if (is_map()) {
        if (!key.is_string()) {
            throw EvaluationError("map key must be string, not " + key.type_name());
        }
        const auto& map = as_map();
        auto it = map.find(key.as_string());
        if (it == map.end()) {
            throw EvaluationError("Key not found: '" + key.as_string() + "'");
        }
        return it->second;
    }

    throw EvaluationError(fmt::format("{} value is not indexable", type_name()));
}

static std::string format_double(double d) {
    if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 1e16) {
        return fmt::format("{:.1f}", d);
    }
    return fmt::format("{}", d);
}

std::string Value::to_string() const {
    switch (type()) {
        case Type::Null:    return "";
        case Type::Bool:    return std::get<bool>(data_) ? "true" : "false";
        case Type::Integer: return std::to_string(std::get<int64_t>(data_));
        case Type::Double:  return format_double(std::get<double>(data_));
        case Type::String:  return std::get<std::string>(data_);
        case Type::List:
        case Type::Map:     return to_json().dump();
    }
    return "";
}

bool Value::operator==(const Value& other) const {
    if (is_number() && other.is_number()) {
        if (type() == Type::Integer && other.type() == Type::Integer) {
            return as_int() == other.as_int();
        }
        return as_number() == other.as_number();
    }
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case Type::Null:   return true;
        case Type::Bool:   return std::get<bool>(data_) == std::get<bool>(other.data_);
        case Type::String: return std::get<std::string>(data_) == std::get<std::string>(other.data_);
        case Type::List:   return as_list() == other.as_list();
        case Type::Map:    return as_map() == other.as_map();
        default:           return false;
    }
}

nlohmann::json Value::to_json() const {
    switch (type()) {
        case Type::Null:    return nullptr;
        case Type::Bool:    return std::get<bool>(data_);
        case Type::Integer: return std::get<int64_t>(data_);
        case Type::Double:  return std::get<double>(data_);
        case Type::String:  return std::get<std::string>(data_);
        case Type::List: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : as_list()) {
                arr.push_back(item.to_json());
            }
            return arr;
        }
        case Type::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, item] : as_map()) {
                obj[key] = item.to_json();
            }
            return obj;
        }
    }
    return nullptr;
}

Value Value::from_json(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
            return Value();
        case nlohmann::json::value_t::boolean:
            return Value(json.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return Value(json.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return Value(static_cast<int64_t>(json.get<uint64_t>()));
        case nlohmann::json::value_t::number_float:
            return Value(json.get<double>());
        case nlohmann::json::value_t::string:
            return Value(json.get<std::string>());
        case nlohmann::json::value_t::array: {
            List list;
            for (const auto& item : json) {
                list.push_back(from_json(item));
            }
            return Value(std::move(list));
        }
        case nlohmann::json::value_t::object: {
            Map map;
            for (auto it = json.begin(); it != json.end(); ++it) {
                map.emplace(it.key(), from_json(it.value()));
            }
            return Value(std::move(map));
        }
        default:
            throw EvaluationError("Unsupported JSON value type");
    }
}
