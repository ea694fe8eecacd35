#include "io/json_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <climits>
#include <fstream>
#include <sstream>

namespace astra {

const char* json_type_name(JsonType type) {
    switch (type) {
        case JsonType::NIL:    return "null";
        case JsonType::BOOL:   return "bool";
        case JsonType::NUMBER: return "number";
        case JsonType::STRING: return "string";
        case JsonType::OBJECT: return "object";
        case JsonType::ARRAY:  return "array";
    }
    return "null";
}

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

JsonValue JsonValue::object() {
    JsonValue v;
    v.type = JsonType::OBJECT;
    return v;
}

JsonValue JsonValue::array() {
    JsonValue v;
    v.type = JsonType::ARRAY;
    return v;
}

static std::runtime_error type_mismatch(const char* wanted, JsonType got) {
    return std::runtime_error(std::string("JsonValue: expected ") + wanted
                              + ", found " + json_type_name(got));
}

bool JsonValue::as_bool() const {
    if (!is_bool()) throw type_mismatch("bool", type);
    return bool_val_;
}

double JsonValue::as_number() const {
    if (!is_number()) throw type_mismatch("number", type);
    return num_val_;
}

int JsonValue::as_int() const {
    double v = as_number();
    if (!fits_int(v)) {
        std::ostringstream msg;
        msg << "JsonValue: number " << v << " is outside the int range";
        throw std::runtime_error(msg.str());
    }
    return static_cast<int>(v);
}

bool JsonValue::fits_int(double v) {
    return v > static_cast<double>(INT_MIN) - 1.0 && v < static_cast<double>(INT_MAX) + 1.0;
}

const std::string& JsonValue::as_string() const {
    if (!is_string()) throw type_mismatch("string", type);
    return str_val_;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (!is_object()) return null_value();
    auto it = obj_map_.find(key);
    return it == obj_map_.end() ? null_value() : it->second;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (!is_array() || index >= arr_val_.size()) return null_value();
    return arr_val_[index];
}

bool JsonValue::has(const std::string& key) const {
    return is_object() && obj_map_.count(key) > 0;
}

size_t JsonValue::size() const {
    if (is_array()) return arr_val_.size();
    if (is_object()) return obj_map_.size();
    return 0;
}

void JsonValue::add_member(const std::string& key, JsonValue&& val) {
    if (obj_map_.count(key) == 0) keys_.push_back(key);
    obj_map_[key] = std::move(val);
}

void JsonValue::add_element(JsonValue&& val) {
    arr_val_.push_back(std::move(val));
}

const JsonValue& JsonValue::null_value() {
    static const JsonValue nil;
    return nil;
}

// ═══════════════════════════════════════════════════════════════
// Parser
// ═══════════════════════════════════════════════════════════════

namespace {

// Deep nesting would otherwise recurse without bound
constexpr int MAX_DEPTH = 256;

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        skip_ws();
        JsonValue root = parse_value(0);
        skip_ws();
        if (pos_ < src_.size()) {
            throw error("Trailing characters after JSON value");
        }
        return root;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;
    int line_ = 1;
    int col_ = 1;

    bool at_end() const { return pos_ >= src_.size(); }
    char peek() const { return at_end() ? '\0' : src_[pos_]; }

    char next() {
        if (at_end()) throw error("Unexpected end of input");
        char c = src_[pos_++];
        if (c == '\n') {
            line_++;
            col_ = 1;
        } else {
            col_++;
        }
        return c;
    }

    void expect(char c) {
        char got = next();
        if (got != c) {
            throw error(std::string("Expected '") + c + "', got '" + got + "'");
        }
    }

    void expect_word(const char* word) {
        for (const char* p = word; *p; ++p) {
            if (peek() != *p) throw error(std::string("Invalid literal, expected '") + word + "'");
            next();
        }
    }

    void skip_ws() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) next();
    }

    bool is_digit(char c) const { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    std::runtime_error error(const std::string& msg) const {
        return std::runtime_error("JSON parse error at line " + std::to_string(line_)
                                  + ", column " + std::to_string(col_) + ": " + msg);
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_DEPTH) throw error("Nesting too deep");
        skip_ws();

        char c = peek();
        switch (c) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': return JsonValue(parse_string());
            case 't': expect_word("true");  return JsonValue(true);
            case 'f': expect_word("false"); return JsonValue(false);
            case 'n': expect_word("null");  return JsonValue();
            default: break;
        }
        if (c == '-' || is_digit(c)) return parse_number();
        if (at_end()) throw error("Unexpected end of input");
        throw error(std::string("Unexpected character '") + c + "'");
    }

    unsigned read_hex4() {
        unsigned code = 0;
        for (int i = 0; i < 4; i++) {
            char h = next();
            code <<= 4;
            if (h >= '0' && h <= '9')      code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else throw error("Bad hex digit in \\u escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out += static_cast<char>(code);
        } else if (code < 0x800) {
            out += static_cast<char>(0xC0 | (code >> 6));
            out += static_cast<char>(0x80 | (code & 0x3F));
        } else {
            out += static_cast<char>(0xE0 | (code >> 12));
            out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (code & 0x3F));
        }
    }

    std::string parse_string() {
        expect('"');
        std::string out;
        while (true) {
            if (at_end()) throw error("Unterminated string");
            char c = next();
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) throw error("Control character in string");
            if (c != '\\') {
                out += c;
                continue;
            }

            char esc = next();
            switch (esc) {
                case '"':  out += '"';  break;
                case '\\': out += '\\'; break;
                case '/':  out += '/';  break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':  append_utf8(out, read_hex4()); break;   // BMP only
                default:
                    throw error(std::string("Unknown escape '\\") + esc + "'");
            }
        }
        return out;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') next();

        if (peek() == '0') {
            next();
        } else if (is_digit(peek())) {
            while (is_digit(peek())) next();
        } else {
            throw error("Expected digit");
        }

        if (peek() == '.') {
            next();
            if (!is_digit(peek())) throw error("Expected digit after '.'");
            while (is_digit(peek())) next();
        }

        if (peek() == 'e' || peek() == 'E') {
            next();
            if (peek() == '+' || peek() == '-') next();
            if (!is_digit(peek())) throw error("Expected digit in exponent");
            while (is_digit(peek())) next();
        }

        std::string text = src_.substr(start, pos_ - start);
        return JsonValue(std::strtod(text.c_str(), nullptr));
    }

    JsonValue parse_object(int depth) {
        expect('{');
        JsonValue obj = JsonValue::object();

        skip_ws();
        if (peek() == '}') {
            next();
            return obj;
        }

        while (true) {
            skip_ws();
            if (peek() != '"') throw error("Expected member name");
            std::string key = parse_string();
            skip_ws();
            expect(':');
            obj.add_member(key, parse_value(depth + 1));

            skip_ws();
            char c = next();
            if (c == '}') break;
            if (c != ',') throw error("Expected ',' or '}' in object");
        }
        return obj;
    }

    JsonValue parse_array(int depth) {
        expect('[');
        JsonValue arr = JsonValue::array();

        skip_ws();
        if (peek() == ']') {
            next();
            return arr;
        }

        while (true) {
            arr.add_element(parse_value(depth + 1));

            skip_ws();
            char c = next();
            if (c == ']') break;
            if (c != ',') throw error("Expected ',' or ']' in array");
        }
        return arr;
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════════
// Public API
// ═══════════════════════════════════════════════════════════════

JsonValue JsonReader::parse(const std::string& json) {
    Parser parser(json);
    return parser.parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open JSON file: " + filename);
    }

    std::ostringstream ss;
    ss << file.rdbuf();

    try {
        return parse(ss.str());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(filename + ": " + e.what());
    }
}

} // namespace astra
