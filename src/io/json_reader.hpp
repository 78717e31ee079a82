/**
 * Lightweight JSON Reader
 *
 * Recursive-descent parser producing a tree of JsonValue nodes, used to
 * load the application config. Accepts standard JSON plus `//` line
 * comments so config files can be annotated. No external dependencies.
 *
 * Usage:
 *   auto root = JsonReader::parse_file("config.json");
 *   double window = root["traffic"]["hysteresis_seconds"].get_number(2.0);
 */

#ifndef SKYTRAFFIC_JSON_READER_HPP
#define SKYTRAFFIC_JSON_READER_HPP

#include <string>
#include <vector>
#include <map>
#include <stdexcept>

namespace skytraffic {

enum class JsonType {
    NIL,
    BOOL,
    NUMBER,
    STRING,
    OBJECT,
    ARRAY
};

class JsonValue {
public:
    JsonType type = JsonType::NIL;

    JsonValue() = default;
    explicit JsonValue(bool v) : type(JsonType::BOOL), bool_val_(v) {}
    explicit JsonValue(double v) : type(JsonType::NUMBER), num_val_(v) {}
    explicit JsonValue(std::string v) : type(JsonType::STRING), str_val_(std::move(v)) {}

    static JsonValue make_object() { JsonValue v; v.type = JsonType::OBJECT; return v; }
    static JsonValue make_array()  { JsonValue v; v.type = JsonType::ARRAY;  return v; }

    bool is_null()   const { return type == JsonType::NIL; }
    bool is_bool()   const { return type == JsonType::BOOL; }
    bool is_number() const { return type == JsonType::NUMBER; }
    bool is_string() const { return type == JsonType::STRING; }
    bool is_object() const { return type == JsonType::OBJECT; }
    bool is_array()  const { return type == JsonType::ARRAY; }

    // Strict accessors (throw on type mismatch)
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;

    // Lenient accessors (default on type mismatch)
    bool get_bool(bool def = false) const { return is_bool() ? bool_val_ : def; }
    double get_number(double def = 0.0) const { return is_number() ? num_val_ : def; }
    int get_int(int def = 0) const { return is_number() ? static_cast<int>(num_val_) : def; }
    std::string get_string(const std::string& def = "") const { return is_string() ? str_val_ : def; }

    // Object access; a missing key yields a null value
    const JsonValue& operator[](const std::string& key) const;
    bool has(const std::string& key) const;

    // Array access; out of range yields a null value
    const JsonValue& operator[](size_t index) const;
    const std::vector<JsonValue>& elements() const { return arr_val_; }

    size_t size() const;

    // Builders used by the parser. Later duplicates of a key win.
    void add_member(const std::string& key, JsonValue&& val) { obj_map_[key] = std::move(val); }
    void add_element(JsonValue&& val) { arr_val_.push_back(std::move(val)); }

private:
    bool bool_val_ = false;
    double num_val_ = 0.0;
    std::string str_val_;
    std::map<std::string, JsonValue> obj_map_;
    std::vector<JsonValue> arr_val_;

    static const JsonValue& null_value();
};

/// Parse failure with 1-based line/column of the offending character.
class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& msg, size_t line, size_t column);

    size_t line() const { return line_; }
    size_t column() const { return column_; }

private:
    size_t line_;
    size_t column_;
};

class JsonReader {
public:
    /**
     * Parse a JSON document. Trailing non-whitespace is an error.
     * @throws JsonParseError on malformed input
     */
    static JsonValue parse(const std::string& json);

    /**
     * Parse a JSON file.
     * @throws std::runtime_error if the file cannot be read, JsonParseError otherwise
     */
    static JsonValue parse_file(const std::string& filename);
};

}  // namespace skytraffic

#endif  // SKYTRAFFIC_JSON_READER_HPP
