/**
 * JSON Reader
 *
 * Recursive-descent parser producing a JsonValue tree. Objects remember
 * member order so scenario files can be echoed back in the order they
 * were written. Errors carry line and column.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("scenario.json");
 *   std::string id = root["asteroid"].get_string("apophis");
 *   double dt = root["config"]["dt"].get_number(1.0 / 60.0);
 */

#ifndef ASTRA_IO_JSON_READER_HPP
#define ASTRA_IO_JSON_READER_HPP

#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace astra {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

const char* json_type_name(JsonType type);

class JsonValue {
public:
    JsonType type = JsonType::NIL;

    JsonValue() = default;
    explicit JsonValue(bool v) : type(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type(JsonType::STRING), str_val_(std::move(v)) {}

    static JsonValue object();
    static JsonValue array();

    bool is_null()   const { return type == JsonType::NIL; }
    bool is_bool()   const { return type == JsonType::BOOL; }
    bool is_number() const { return type == JsonType::NUMBER; }
    bool is_string() const { return type == JsonType::STRING; }
    bool is_object() const { return type == JsonType::OBJECT; }
    bool is_array()  const { return type == JsonType::ARRAY; }

    // Strict accessors, throw std::runtime_error on type mismatch
    bool as_bool() const;
    double as_number() const;
    int as_int() const;   // also throws outside the int range
    const std::string& as_string() const;

    // Lenient accessors, fall back to the default on mismatch
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() && fits_int(num_val_) ? static_cast<int>(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    /** True when truncating v to int is defined. */
    static bool fits_int(double v);

    /** Missing members and non-objects yield a shared null value. */
    const JsonValue& operator[](const std::string& key) const;
    const JsonValue& operator[](size_t index) const;

    bool has(const std::string& key) const;
    size_t size() const;

    /** Member names in document order. */
    const std::vector<std::string>& keys() const { return keys_; }
    const std::vector<JsonValue>& elements() const { return arr_val_; }

    /** Later duplicates replace the value but keep the first position. */
    void add_member(const std::string& key, JsonValue&& val);
    void add_element(JsonValue&& val);

private:
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::unordered_map<std::string, JsonValue> obj_map_;
    std::vector<std::string> keys_;
    std::vector<JsonValue> arr_val_;

    static const JsonValue& null_value();
};

class JsonReader {
public:
    /**
     * Parse a complete JSON document. Anything but whitespace after the
     * root value is an error.
     * @throws std::runtime_error with "line L, column C" on parse errors
     */
    static JsonValue parse(const std::string& json);

    /** @throws std::runtime_error on file or parse errors */
    static JsonValue parse_file(const std::string& filename);
};

} // namespace astra

#endif // ASTRA_IO_JSON_READER_HPP
