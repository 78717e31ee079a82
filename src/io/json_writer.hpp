/**
 * Lightweight JSON Writer (header-only)
 *
 * Streams JSON to an ostream, either indented or compact. Compact mode
 * (indent_size == 0) writes a document on a single line, which is how
 * events and snapshots are emitted as JSON Lines.
 *
 * Usage:
 *   JsonWriter w(std::cout, 0);
 *   w.begin_object();
 *     w.kv("callsign", "CCA101").kv("altitude", 2500.0);
 *   w.end_object();
 *   std::cout << '\n';
 */

#ifndef SKYTRAFFIC_JSON_WRITER_HPP
#define SKYTRAFFIC_JSON_WRITER_HPP

#include <cmath>
#include <cstdio>
#include <ostream>
#include <string>
#include <vector>

namespace skytraffic {

class JsonWriter {
public:
    explicit JsonWriter(std::ostream& os, int indent_size = 2)
        : os_(os), indent_size_(indent_size) {}

    // ── Structure ──

    JsonWriter& begin_object() { return open('{'); }
    JsonWriter& end_object()   { return close('}'); }
    JsonWriter& begin_array()  { return open('['); }
    JsonWriter& end_array()    { return close(']'); }

    JsonWriter& key(const std::string& k) {
        separate();
        write_quoted(k);
        os_ << (pretty() ? "\": " : "\":");
        after_key_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        separate();
        write_quoted(v);
        os_ << '"';
        return *this;
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v) {
        separate();
        os_ << v;
        return *this;
    }

    JsonWriter& value(size_t v) {
        separate();
        os_ << v;
        return *this;
    }

    JsonWriter& value(double v) {
        separate();
        if (std::isfinite(v)) {
            const std::streamsize saved = os_.precision(10);
            os_ << v;
            os_.precision(saved);
        } else {
            os_ << "null";
        }
        return *this;
    }

    JsonWriter& value(bool v) {
        separate();
        os_ << (v ? "true" : "false");
        return *this;
    }

    JsonWriter& null_value() {
        separate();
        os_ << "null";
        return *this;
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

private:
    std::ostream& os_;
    int indent_size_;
    std::vector<int> counts_;   // items written per open scope
    bool after_key_ = false;

    bool pretty() const { return indent_size_ > 0; }

    JsonWriter& open(char bracket) {
        separate();
        os_ << bracket;
        counts_.push_back(0);
        return *this;
    }

    JsonWriter& close(char bracket) {
        bool had_items = !counts_.empty() && counts_.back() > 0;
        if (!counts_.empty()) counts_.pop_back();
        if (had_items) newline();
        os_ << bracket;
        return *this;
    }

    // Comma and indentation before a key or a bare value
    void separate() {
        if (after_key_) {
            after_key_ = false;
            return;
        }
        if (counts_.empty()) return;
        if (counts_.back() > 0) os_ << ',';
        counts_.back()++;
        newline();
    }

    void newline() {
        if (!pretty()) return;
        os_ << '\n' << std::string(counts_.size() * static_cast<size_t>(indent_size_), ' ');
    }

    // Opening quote plus escaped body; callers add the closing quote
    void write_quoted(const std::string& s) {
        os_ << '"';
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

}  // namespace skytraffic

#endif  // SKYTRAFFIC_JSON_WRITER_HPP
