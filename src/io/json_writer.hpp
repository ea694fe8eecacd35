/**
 * JSON Writer (header-only)
 *
 * Streams well-formed JSON to an ostream. indent_size 0 gives compact
 * single-line output (used for JSON-lines progress records).
 *
 * Usage:
 *   JsonWriter w(std::cout);
 *   w.begin_object();
 *     w.kv("asteroid", "apophis");
 *     w.kv("energyMt", 1234.5);
 *     w.key("effects").begin_array();
 *       w.value("Local seismic activity");
 *     w.end_array();
 *   w.end_object();
 */

#ifndef ASTRA_IO_JSON_WRITER_HPP
#define ASTRA_IO_JSON_WRITER_HPP

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace astra {

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
        separator();
        write_string(k);
        os_ << (indent_size_ > 0 ? ": " : ":");
        after_key_ = true;
        return *this;
    }

    // ── Values ──

    JsonWriter& value(const std::string& v) {
        separator();
        write_string(v);
        return done();
    }

    JsonWriter& value(const char* v) { return value(std::string(v)); }

    JsonWriter& value(int v)     { separator(); os_ << v; return done(); }
    JsonWriter& value(int64_t v) { separator(); os_ << v; return done(); }
    JsonWriter& value(size_t v)  { separator(); os_ << v; return done(); }

    JsonWriter& value(double v) {
        separator();
        if (!std::isfinite(v)) {
            os_ << "null";
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.15g", v);
            os_ << buf;
        }
        return done();
    }

    JsonWriter& value(bool v) {
        separator();
        os_ << (v ? "true" : "false");
        return done();
    }

    template<typename T>
    JsonWriter& value(const std::optional<T>& v) {
        return v ? value(*v) : null_value();
    }

    JsonWriter& null_value() {
        separator();
        os_ << "null";
        return done();
    }

    template<typename T>
    JsonWriter& kv(const std::string& k, const T& v) {
        key(k);
        return value(v);
    }

    /** Array of strings in one call. */
    JsonWriter& string_array(const std::string& k, const std::vector<std::string>& items) {
        key(k).begin_array();
        for (const auto& s : items) value(s);
        return end_array();
    }

private:
    std::ostream& os_;
    int indent_size_;
    std::vector<int> counts_;   // items written per open scope
    bool after_key_ = false;

    JsonWriter& open(char bracket) {
        separator();
        os_ << bracket;
        after_key_ = false;
        counts_.push_back(0);
        return *this;
    }

    JsonWriter& close(char bracket) {
        bool empty = !counts_.empty() && counts_.back() == 0;
        if (!counts_.empty()) counts_.pop_back();
        if (!empty) newline();
        os_ << bracket;
        return *this;
    }

    JsonWriter& done() {
        after_key_ = false;
        return *this;
    }

    void separator() {
        if (after_key_) return;
        if (counts_.empty()) return;
        if (counts_.back() > 0) os_ << ',';
        newline();
        counts_.back()++;
    }

    void newline() {
        if (indent_size_ <= 0) return;
        os_ << '\n';
        os_ << std::string(counts_.size() * static_cast<size_t>(indent_size_), ' ');
    }

    void write_string(const std::string& s) {
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
                        std::snprintf(buf, sizeof(buf), "\\u%04x",
                                      static_cast<unsigned>(static_cast<unsigned char>(c)));
                        os_ << buf;
                    } else {
                        os_ << c;
                    }
                    break;
            }
        }
        os_ << '"';
    }
};

} // namespace astra

#endif // ASTRA_IO_JSON_WRITER_HPP
