#include "ptzgw/json.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <utility>

namespace ptzgw {

namespace {

const char* type_name(Json::Type type) {
    switch (type) {
        case Json::Type::Null:   return "null";
        case Json::Type::Bool:   return "bool";
        case Json::Type::Number: return "number";
        case Json::Type::String: return "string";
        case Json::Type::Array:  return "array";
        case Json::Type::Object: return "object";
    }
    return "unknown";
}

/// Append a code point as UTF-8.
void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// Recursive-descent parser over a complete document.
class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    Json parse_document() {
        skip_ws();
        Json value = parse_value(0);
        skip_ws();
        if (i_ != text_.size()) {
            fail("unexpected trailing content");
        }
        return value;
    }

private:
    static constexpr int MAX_DEPTH = 64;

    const std::string& text_;
    std::size_t i_ = 0;

    [[noreturn]] void fail(const std::string& what) const {
        throw JsonError("JSON parse error at offset " + std::to_string(i_) +
                        ": " + what);
    }

    void skip_ws() {
        while (i_ < text_.size() &&
               (text_[i_] == ' ' || text_[i_] == '\t' ||
                text_[i_] == '\n' || text_[i_] == '\r')) {
            ++i_;
        }
    }

    bool consume(char c) {
        if (i_ < text_.size() && text_[i_] == c) {
            ++i_;
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!consume(c)) {
            fail(std::string("expected '") + c + "'");
        }
    }

    bool consume_literal(const char* literal) {
        std::size_t n = std::char_traits<char>::length(literal);
        if (text_.compare(i_, n, literal) == 0) {
            i_ += n;
            return true;
        }
        return false;
    }

    Json parse_value(int depth) {
        if (depth > MAX_DEPTH) {
            fail("nesting too deep");
        }
        if (i_ >= text_.size()) {
            fail("unexpected end of input");
        }

        char c = text_[i_];
        if (c == '{') return parse_object(depth);
        if (c == '[') return parse_array(depth);
        if (c == '"') return Json(parse_string());
        if (c == '-' || (c >= '0' && c <= '9')) return Json(parse_number());
        if (consume_literal("true"))  return Json(true);
        if (consume_literal("false")) return Json(false);
        if (consume_literal("null"))  return Json();

        fail("expected a JSON value");
    }

    Json parse_object(int depth) {
        expect('{');
        Json::Object object;
        skip_ws();
        if (consume('}')) {
            return Json(std::move(object));
        }
        while (true) {
            skip_ws();
            std::string key = parse_string();
            skip_ws();
            expect(':');
            skip_ws();
            object[key] = parse_value(depth + 1);
            skip_ws();
            if (consume('}')) {
                break;
            }
            expect(',');
        }
        return Json(std::move(object));
    }

    Json parse_array(int depth) {
        expect('[');
        Json::Array array;
        skip_ws();
        if (consume(']')) {
            return Json(std::move(array));
        }
        while (true) {
            skip_ws();
            array.push_back(parse_value(depth + 1));
            skip_ws();
            if (consume(']')) {
                break;
            }
            expect(',');
        }
        return Json(std::move(array));
    }

    uint32_t parse_hex4() {
        if (i_ + 4 > text_.size()) {
            fail("truncated \\u escape");
        }
        uint32_t cp = 0;
        for (int k = 0; k < 4; ++k) {
            char h = text_[i_++];
            cp <<= 4;
            if (h >= '0' && h <= '9')      cp |= static_cast<uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
            else fail("invalid hex digit in \\u escape");
        }
        return cp;
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            if (i_ >= text_.size()) {
                fail("unterminated string");
            }
            char c = text_[i_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (i_ >= text_.size()) {
                fail("unterminated escape");
            }
            char esc = text_[i_++];
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    uint32_t cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // surrogate pair
                        if (!consume_literal("\\u")) {
                            fail("unpaired surrogate");
                        }
                        uint32_t low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("unpaired surrogate");
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    fail(std::string("invalid escape '\\") + esc + "'");
            }
        }
    }

    double parse_number() {
        std::size_t start = i_;
        consume('-');
        if (i_ >= text_.size() || text_[i_] < '0' || text_[i_] > '9') {
            fail("invalid number");
        }
        while (i_ < text_.size() &&
               ((text_[i_] >= '0' && text_[i_] <= '9') || text_[i_] == '.' ||
                text_[i_] == 'e' || text_[i_] == 'E' ||
                text_[i_] == '+' || text_[i_] == '-')) {
            ++i_;
        }
        std::string literal = text_.substr(start, i_ - start);
        char* end = nullptr;
        double value = std::strtod(literal.c_str(), &end);
        if (end != literal.c_str() + literal.size()) {
            fail("invalid number '" + literal + "'");
        }
        return value;
    }
};

void dump_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void dump_number(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        out += std::to_string(static_cast<long long>(value));
        return;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    out += buf;
}

} // anonymous namespace

Json::Json(bool value) : type_(Type::Bool), bool_(value) {}

Json::Json(int value) : type_(Type::Number), number_(value) {}

Json::Json(double value) : type_(Type::Number), number_(value) {}

Json::Json(const char* value) : type_(Type::String), string_(value) {}

Json::Json(std::string value) : type_(Type::String), string_(std::move(value)) {}

Json::Json(Array value) : type_(Type::Array), array_(std::move(value)) {}

Json::Json(Object value) : type_(Type::Object), object_(std::move(value)) {}

Json Json::parse(const std::string& text) {
    return Parser(text).parse_document();
}

std::string Json::dump() const {
    std::string out;
    dump_to(out);
    return out;
}

void Json::dump_to(std::string& out) const {
    switch (type_) {
        case Type::Null:
            out += "null";
            break;
        case Type::Bool:
            out += bool_ ? "true" : "false";
            break;
        case Type::Number:
            dump_number(out, number_);
            break;
        case Type::String:
            dump_string(out, string_);
            break;
        case Type::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : array_) {
                if (!first) out += ',';
                first = false;
                item.dump_to(out);
            }
            out += ']';
            break;
        }
        case Type::Object: {
            out += '{';
            bool first = true;
            for (const auto& [key, item] : object_) {
                if (!first) out += ',';
                first = false;
                dump_string(out, key);
                out += ':';
                item.dump_to(out);
            }
            out += '}';
            break;
        }
    }
}

bool Json::as_bool() const {
    if (type_ != Type::Bool) {
        throw JsonError(std::string("expected bool, got ") + type_name(type_));
    }
    return bool_;
}

double Json::as_number() const {
    if (type_ != Type::Number) {
        throw JsonError(std::string("expected number, got ") + type_name(type_));
    }
    return number_;
}

int Json::as_int() const {
    double value = as_number();
    if (std::floor(value) != value ||
        value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        throw JsonError("expected integer, got " + std::to_string(value));
    }
    return static_cast<int>(value);
}

const std::string& Json::as_string() const {
    if (type_ != Type::String) {
        throw JsonError(std::string("expected string, got ") + type_name(type_));
    }
    return string_;
}

const Json::Array& Json::as_array() const {
    if (type_ != Type::Array) {
        throw JsonError(std::string("expected array, got ") + type_name(type_));
    }
    return array_;
}

const Json::Object& Json::as_object() const {
    if (type_ != Type::Object) {
        throw JsonError(std::string("expected object, got ") + type_name(type_));
    }
    return object_;
}

const Json* Json::find(const std::string& key) const {
    if (type_ != Type::Object) {
        return nullptr;
    }
    auto it = object_.find(key);
    return it == object_.end() ? nullptr : &it->second;
}

bool Json::contains(const std::string& key) const {
    return find(key) != nullptr;
}

Json& Json::operator[](const std::string& key) {
    if (type_ == Type::Null) {
        type_ = Type::Object;
    }
    if (type_ != Type::Object) {
        throw JsonError(std::string("cannot index ") + type_name(type_) +
                        " with key '" + key + "'");
    }
    return object_[key];
}

std::string Json::get_string(const std::string& key,
                             const std::string& default_val) const {
    const Json* value = find(key);
    if (value == nullptr || !value->is_string()) {
        return default_val;
    }
    return value->string_;
}

double Json::get_number(const std::string& key, double default_val) const {
    const Json* value = find(key);
    if (value == nullptr || !value->is_number()) {
        return default_val;
    }
    return value->number_;
}

void Json::push_back(Json value) {
    if (type_ == Type::Null) {
        type_ = Type::Array;
    }
    if (type_ != Type::Array) {
        throw JsonError(std::string("cannot append to ") + type_name(type_));
    }
    array_.push_back(std::move(value));
}

std::size_t Json::size() const {
    switch (type_) {
        case Type::Array:  return array_.size();
        case Type::Object: return object_.size();
        case Type::Null:   return 0;
        default:           return 1;
    }
}

bool Json::operator==(const Json& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case Type::Null:   return true;
        case Type::Bool:   return bool_ == other.bool_;
        case Type::Number: return number_ == other.number_;
        case Type::String: return string_ == other.string_;
        case Type::Array:  return array_ == other.array_;
        case Type::Object: return object_ == other.object_;
    }
    return false;
}

} // namespace ptzgw
