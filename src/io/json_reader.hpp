/**
 * Lightweight JSON Reader
 *
 * Recursive-descent parser producing a tree of JsonValue nodes for the
 * scenario documents. Objects, arrays, strings, numbers, booleans and
 * null. Parse failures report line and column and throw ValidationError.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("scenario.json");
 *   double v = root["transmitter"]["velocity"].get_number(1.0);
 */

#ifndef RXNET_IO_JSON_READER_HPP
#define RXNET_IO_JSON_READER_HPP

#include <string>
#include <unordered_map>
#include <vector>

namespace rxnet {

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

    bool is_null()   const { return type == JsonType::NIL; }
    bool is_bool()   const { return type == JsonType::BOOL; }
    bool is_number() const { return type == JsonType::NUMBER; }
    bool is_string() const { return type == JsonType::STRING; }
    bool is_object() const { return type == JsonType::OBJECT; }
    bool is_array()  const { return type == JsonType::ARRAY; }

    // Defaults on type mismatch
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? static_cast<int>(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    /** Member lookup; a shared null value when absent or not an object. */
    const JsonValue& operator[](const std::string& key) const;

    /** Element lookup; a shared null value when out of range or not an array. */
    const JsonValue& operator[](size_t index) const;

    bool has(const std::string& key) const {
        return is_object() && members_.count(key) > 0;
    }

    size_t size() const {
        if (is_array()) return elements_.size();
        if (is_object()) return members_.size();
        return 0;
    }

    // Builders used by the parser
    void set_object() { type = JsonType::OBJECT; }
    void set_array()  { type = JsonType::ARRAY; }
    void add_member(const std::string& key, JsonValue&& val) { members_[key] = std::move(val); }
    void add_element(JsonValue&& val) { elements_.push_back(std::move(val)); }

private:
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::unordered_map<std::string, JsonValue> members_;
    std::vector<JsonValue> elements_;
};

class JsonReader {
public:
    /** @throws ValidationError on malformed input or trailing content */
    static JsonValue parse(const std::string& json);

    /** @throws ValidationError when the file cannot be read or parsed */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace rxnet

#endif  // RXNET_IO_JSON_READER_HPP
