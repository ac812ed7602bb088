#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "errors.hpp"

namespace ptzgw {

/// JSON value used for configuration, wire frames and DTOs.
///
/// Hand-written parser and serializer (no external dependencies).
/// Object keys are kept sorted.
class Json {
public:
    enum class Type {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object,
    };

    using Array  = std::vector<Json>;
    using Object = std::map<std::string, Json>;

    Json() = default;
    Json(std::nullptr_t) {}
    Json(bool value);
    Json(int value);
    Json(double value);
    Json(const char* value);
    Json(std::string value);
    Json(Array value);
    Json(Object value);

    /// Parse JSON text. Throws JsonError with the offset of the problem.
    static Json parse(const std::string& text);

    /// Serialize to compact JSON text.
    std::string dump() const;

    // --- Type queries ---

    Type type() const { return type_; }
    bool is_null() const   { return type_ == Type::Null; }
    bool is_bool() const   { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const  { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    // --- Checked accessors (throw JsonError on type mismatch) ---

    bool as_bool() const;
    double as_number() const;
    int as_int() const;
    const std::string& as_string() const;
    const Array& as_array() const;
    const Object& as_object() const;

    // --- Object helpers ---

    /// Returns nullptr if this is not an object or the key is missing.
    const Json* find(const std::string& key) const;
    bool contains(const std::string& key) const;

    /// Member access; converts a null value into an empty object.
    Json& operator[](const std::string& key);

    /// String member, or the default when missing or not a string.
    std::string get_string(const std::string& key,
                           const std::string& default_val = "") const;

    /// Numeric member, or the default when missing or not a number.
    double get_number(const std::string& key, double default_val = 0.0) const;

    /// Append to an array; converts a null value into an empty array.
    void push_back(Json value);

    std::size_t size() const;

    bool operator==(const Json& other) const;
    bool operator!=(const Json& other) const { return !(*this == other); }

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    Array array_;
    Object object_;

    void dump_to(std::string& out) const;
};

} // namespace ptzgw
