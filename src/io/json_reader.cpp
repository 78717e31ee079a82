/**
 * JSON Reader Implementation — Recursive descent parser with position tracking
 */

#include "io/json_reader.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <cctype>
#include <cstdlib>

namespace skytraffic {

// ═══════════════════════════════════════════════════════════════
// JsonValue
// ═══════════════════════════════════════════════════════════════

bool JsonValue::as_bool() const {
    if (!is_bool()) throw std::runtime_error("JsonValue: not a bool");
    return bool_val_;
}

double JsonValue::as_number() const {
    if (!is_number()) throw std::runtime_error("JsonValue: not a number");
    return num_val_;
}

const std::string& JsonValue::as_string() const {
    if (!is_string()) throw std::runtime_error("JsonValue: not a string");
    return str_val_;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (!is_object()) return null_value();
    auto it = obj_map_.find(key);
    return it == obj_map_.end() ? null_value() : it->second;
}

bool JsonValue::has(const std::string& key) const {
    return is_object() && obj_map_.count(key) > 0;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (!is_array() || index >= arr_val_.size()) return null_value();
    return arr_val_[index];
}

size_t JsonValue::size() const {
    if (is_array()) return arr_val_.size();
    if (is_object()) return obj_map_.size();
    return 0;
}

const JsonValue& JsonValue::null_value() {
    static const JsonValue nil;
    return nil;
}

JsonParseError::JsonParseError(const std::string& msg, size_t line, size_t column)
    : std::runtime_error("JSON parse error at line " + std::to_string(line) +
                         ", column " + std::to_string(column) + ": " + msg),
      line_(line), column_(column) {}

// ═══════════════════════════════════════════════════════════════
// Parser internals
// ═══════════════════════════════════════════════════════════════

namespace {

constexpr int MAX_DEPTH = 128;

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        skip_ignorable();
        JsonValue val = parse_value(0);
        skip_ignorable();
        if (pos_ < src_.size()) {
            throw error("Unexpected trailing content");
        }
        return val;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;

    bool at_end() const { return pos_ >= src_.size(); }

    char peek() const { return at_end() ? '\0' : src_[pos_]; }

    char next() {
        if (at_end()) throw error("Unexpected end of input");
        return src_[pos_++];
    }

    void consume(char c) {
        char got = next();
        if (got != c) {
            throw error(std::string("Expected '") + c + "', got '" + got + "'");
        }
    }

    bool consume_literal(const char* lit) {
        size_t n = std::char_traits<char>::length(lit);
        if (src_.compare(pos_, n, lit) != 0) return false;
        pos_ += n;
        return true;
    }

    // Whitespace and `//` comments up to end of line
    void skip_ignorable() {
        while (!at_end()) {
            char c = src_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                pos_++;
            } else if (c == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '/') {
                while (!at_end() && src_[pos_] != '\n') pos_++;
            } else {
                break;
            }
        }
    }

    JsonParseError error(const std::string& msg) const {
        size_t line = 1;
        size_t column = 1;
        size_t limit = std::min(pos_, src_.size());
        for (size_t i = 0; i < limit; i++) {
            if (src_[i] == '\n') {
                line++;
                column = 1;
            } else {
                column++;
            }
        }
        return JsonParseError(msg, line, column);
    }

    JsonValue parse_value(int depth) {
        if (depth > MAX_DEPTH) throw error("Nesting too deep");

        skip_ignorable();
        char c = peek();
        switch (c) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': return JsonValue(parse_string());
            case 't':
                if (consume_literal("true")) return JsonValue(true);
                break;
            case 'f':
                if (consume_literal("false")) return JsonValue(false);
                break;
            case 'n':
                if (consume_literal("null")) return JsonValue();
                break;
            default:
                if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
                    return parse_number();
                }
                break;
        }
        if (at_end()) throw error("Unexpected end of input");
        throw error(std::string("Unexpected character '") + c + "'");
    }

    unsigned read_hex4() {
        if (pos_ + 4 > src_.size()) throw error("Incomplete \\u escape");
        unsigned code = 0;
        for (int i = 0; i < 4; i++) {
            char h = src_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9')      code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else throw error("Invalid hex digit in \\u escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned long cp) {
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

    std::string parse_string() {
        consume('"');
        std::string out;
        while (true) {
            if (at_end()) throw error("Unterminated string");
            char c = src_[pos_++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) {
                throw error("Control character in string");
            }
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
                case 'u': {
                    unsigned long cp = read_hex4();
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!consume_literal("\\u")) throw error("Unpaired high surrogate");
                        unsigned long lo = read_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) throw error("Invalid low surrogate");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    throw error(std::string("Unknown escape \\") + esc);
            }
        }
        return out;
    }

    void skip_digits() {
        while (std::isdigit(static_cast<unsigned char>(peek()))) pos_++;
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
            skip_digits();
        } else {
            throw error("Expected digit");
        }

        if (peek() == '.') {
            pos_++;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw error("Expected digit after decimal point");
            }
            skip_digits();
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) {
                throw error("Expected digit in exponent");
            }
            skip_digits();
        }

        return JsonValue(std::strtod(src_.substr(start, pos_ - start).c_str(), nullptr));
    }

    JsonValue parse_object(int depth) {
        consume('{');
        JsonValue obj = JsonValue::make_object();

        skip_ignorable();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        while (true) {
            skip_ignorable();
            if (peek() != '"') throw error("Expected string key");
            std::string key = parse_string();
            skip_ignorable();
            consume(':');
            obj.add_member(key, parse_value(depth + 1));

            skip_ignorable();
            char sep = next();
            if (sep == '}') break;
            if (sep != ',') throw error("Expected ',' or '}' in object");
        }
        return obj;
    }

    JsonValue parse_array(int depth) {
        consume('[');
        JsonValue arr = JsonValue::make_array();

        skip_ignorable();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        while (true) {
            arr.add_element(parse_value(depth + 1));

            skip_ignorable();
            char sep = next();
            if (sep == ']') break;
            if (sep != ',') throw error("Expected ',' or ']' in array");
        }
        return arr;
    }
};

}  // anonymous namespace

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
    return parse(ss.str());
}

}  // namespace skytraffic
