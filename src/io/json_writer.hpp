/**
 * Lightweight JSON Writer (header-only)
 *
 * Streams well-formed JSON with indentation. A scope opened with
 * compact = true keeps all of its items on one line, which keeps long
 * record arrays ([x, y] pairs, one detection per line) readable.
 *
 * Usage:
 *   JsonWriter w(out);
 *   w.begin_object();
 *     w.kv("status", "completed");
 *     w.key("origin").begin_array(true).value(0.0).value(0.0).end_array();
 *   w.end_object();
 */

#ifndef RXNET_IO_JSON_WRITER_HPP
#define RXNET_IO_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <ostream>
#include <string>
#include <vector>

namespace rxnet {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    JsonWriter& begin_object(bool compact = false) {
        open('{', compact);
        return *this;
    }

    JsonWriter& end_object() {
        close('}');
        return *this;
    }

    JsonWriter& begin_array(bool compact = false) {
        open('[', compact);
        return *this;
    }

    JsonWriter& end_array() {
        close(']');
        return *this;
    }

    JsonWriter& key(const std::string& k) {
        separator();
        os_ << '"';
        write_escaped(k);
        os_ << (in_compact() ? "\":" : "\": ");
        after_key_ = true;
        return *this;
    }

    JsonWriter& value(const std::string& v) {
        separator();
        os_ << '"';
        write_escaped(v);
        os_ << '"';
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v) {
        separator();
        os_ << v;
        return *this;
    }

    JsonWriter& value(long long v) {
        separator();
        os_ << v;
        return *this;
    }

    JsonWriter& value(size_t v) {
        separator();
        os_ << v;
        return *this;
    }

    /** NaN and infinities are written as null. */
    JsonWriter& value(double v) {
        separator();
        if (!std::isfinite(v)) {
            os_ << "null";
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", v);
            os_ << buf;
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        separator();
        os_ << (v ? "true" : "false");
        return *this;
    }

    JsonWriter& null_value() {
        separator();
        os_ << "null";
        return *this;
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        value(v);
        return *this;
    }

private:
    struct Scope {
        int count = 0;
        bool compact = false;
    };

    std::ostream& os_;
    int indent_size_;
    std::vector<Scope> stack_;
    bool after_key_ = false;

    bool in_compact() const {
        for (const auto& s : stack_) {
            if (s.compact) return true;
        }
        return false;
    }

    void open(char bracket, bool compact) {
        separator();
        os_ << bracket;
        stack_.push_back(Scope{0, compact});
    }

    void close(char bracket) {
        bool had_items = !stack_.empty() && stack_.back().count > 0;
        bool compact = in_compact();
        if (!stack_.empty()) stack_.pop_back();
        if (had_items && !compact) newline();
        os_ << bracket;
        after_key_ = false;
    }

    // Comma and line break before an item; nothing directly after a key.
    void separator() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (stack_.empty()) return;
        auto& scope = stack_.back();
        if (scope.count > 0) os_ << (in_compact() ? ", " : ",");
        if (!in_compact()) newline();
        scope.count++;
    }

    void newline() {
        os_ << '\n';
        int depth = static_cast<int>(stack_.size());
        for (int i = 0; i < depth * indent_size_; i++) {
            os_ << ' ';
        }
    }

    void write_escaped(const std::string& s) {
        for (char c : s) {
            switch (c) {
                case '"':  os_ << "\\\""; break;
                case '\\': os_ << "\\\\"; break;
                case '\b': os_ << "\\b";  break;
                case '\f': os_ << "\\f";  break;
                case '\n': os_ << "\\n";  break;
                case '\r': os_ << "\\r";  break;
                case '\t': os_ << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
    }
};

}  // namespace rxnet

#endif  // RXNET_IO_JSON_WRITER_HPP
