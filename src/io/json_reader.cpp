#include "io/json_reader.hpp"
#include "core/sim_errors.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace rxnet {

const char* json_type_name(JsonType type) {
    switch (type) {
        case JsonType::NIL:    return "null";
        case JsonType::BOOL:   return "bool";
        case JsonType::NUMBER: return "number";
        case JsonType::STRING: return "string";
        case JsonType::OBJECT: return "object";
        case JsonType::ARRAY:  return "array";
    }
    return "unknown";
}

static const JsonValue& shared_null() {
    static const JsonValue nil;
    return nil;
}

const JsonValue& JsonValue::operator[](const std::string& key) const {
    if (!is_object()) return shared_null();
    auto it = members_.find(key);
    return it == members_.end() ? shared_null() : it->second;
}

const JsonValue& JsonValue::operator[](size_t index) const {
    if (!is_array() || index >= elements_.size()) return shared_null();
    return elements_[index];
}

namespace {

class Parser {
public:
    explicit Parser(const std::string& input) : src_(input) {}

    JsonValue parse_document() {
        JsonValue root = parse_value();
        skip_whitespace();
        if (pos_ < src_.size()) throw error("trailing content after document");
        return root;
    }

private:
    const std::string& src_;
    size_t pos_ = 0;

    char peek() const { return pos_ < src_.size() ? src_[pos_] : '\0'; }

    char advance() {
        if (pos_ >= src_.size()) throw error("unexpected end of input");
        return src_[pos_++];
    }

    void expect(char c) {
        char got = advance();
        if (got != c) {
            throw error(std::string("expected '") + c + "', got '" + got + "'");
        }
    }

    void skip_whitespace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            pos_++;
        }
    }

    bool is_digit(char c) const { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

    ValidationError error(const std::string& msg) const {
        size_t line = 1, col = 1;
        for (size_t i = 0; i < pos_ && i < src_.size(); i++) {
            if (src_[i] == '\n') { line++; col = 1; } else { col++; }
        }
        return ValidationError("JSON parse error at line " + std::to_string(line) +
                               ", column " + std::to_string(col) + ": " + msg);
    }

    JsonValue parse_value() {
        skip_whitespace();
        char c = peek();
        if (c == '{') return parse_object();
        if (c == '[') return parse_array();
        if (c == '"') return JsonValue(parse_string());
        if (c == 't') return parse_literal("true", JsonValue(true));
        if (c == 'f') return parse_literal("false", JsonValue(false));
        if (c == 'n') return parse_literal("null", JsonValue());
        if (c == '-' || is_digit(c)) return parse_number();
        if (c == '\0') throw error("unexpected end of input");
        throw error(std::string("unexpected character '") + c + "'");
    }

    JsonValue parse_literal(const char* word, JsonValue val) {
        std::string w(word);
        if (src_.compare(pos_, w.size(), w) != 0) throw error("expected '" + w + "'");
        pos_ += w.size();
        return val;
    }

    void append_utf8(std::string& out, unsigned long code) {
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
        for (;;) {
            char c = advance();
            if (c == '"') return out;
            if (c != '\\') {
                out += c;
                continue;
            }
            char esc = advance();
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
                    if (pos_ + 4 > src_.size()) throw error("incomplete \\u escape");
                    std::string hex = src_.substr(pos_, 4);
                    for (char h : hex) {
                        if (!std::isxdigit(static_cast<unsigned char>(h))) {
                            throw error("bad \\u escape");
                        }
                    }
                    pos_ += 4;
                    append_utf8(out, std::strtoul(hex.c_str(), nullptr, 16));
                    break;
                }
                default:
                    throw error(std::string("unknown escape \\") + esc);
            }
        }
    }

    JsonValue parse_number() {
        size_t start = pos_;
        if (peek() == '-') pos_++;

        if (peek() == '0') {
            pos_++;
        } else if (is_digit(peek())) {
            while (is_digit(peek())) pos_++;
        } else {
            throw error("expected digit in number");
        }

        if (peek() == '.') {
            pos_++;
            if (!is_digit(peek())) throw error("expected digit after decimal point");
            while (is_digit(peek())) pos_++;
        }

        if (peek() == 'e' || peek() == 'E') {
            pos_++;
            if (peek() == '+' || peek() == '-') pos_++;
            if (!is_digit(peek())) throw error("expected digit in exponent");
            while (is_digit(peek())) pos_++;
        }

        return JsonValue(std::strtod(src_.substr(start, pos_ - start).c_str(), nullptr));
    }

    JsonValue parse_object() {
        expect('{');
        JsonValue obj;
        obj.set_object();

        skip_whitespace();
        if (peek() == '}') {
            pos_++;
            return obj;
        }

        for (;;) {
            skip_whitespace();
            if (peek() != '"') throw error("expected member name");
            std::string key = parse_string();
            skip_whitespace();
            expect(':');
            obj.add_member(key, parse_value());
            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect('}');
        return obj;
    }

    JsonValue parse_array() {
        expect('[');
        JsonValue arr;
        arr.set_array();

        skip_whitespace();
        if (peek() == ']') {
            pos_++;
            return arr;
        }

        for (;;) {
            arr.add_element(parse_value());
            skip_whitespace();
            if (peek() != ',') break;
            pos_++;
        }

        skip_whitespace();
        expect(']');
        return arr;
    }
};

}  // namespace

JsonValue JsonReader::parse(const std::string& json) {
    return Parser(json).parse_document();
}

JsonValue JsonReader::parse_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ValidationError("cannot open JSON file: " + filename);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

}  // namespace rxnet
