#pragma once

#include <string>
#include <string_view>
#include <cstdint>


namespace lcr {
namespace json {

// Escape a string for use inside a JSON string literal (RFC 8259)
inline void escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
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
                    out += "\\u00";
                    out += hex[(c >> 4) & 0x0F];
                    out += hex[c & 0x0F];
                } else {
                    out += c;
                }
        }
    }
}

inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    escape(out, s);
    return out;
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = static_cast<char>('0' + (value % 10));
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

inline void append(std::string& out, std::int64_t value)
{
    if (value < 0) {
        out += '-';
        // two's complement safe magnitude
        append(out, static_cast<std::uint64_t>(0) - static_cast<std::uint64_t>(value));
        return;
    }
    append(out, static_cast<std::uint64_t>(value));
}

// "value" with escaping
inline void append_quoted(std::string& out, std::string_view value) {
    out += '"';
    escape(out, value);
    out += '"';
}

// ------------------------------------------------------------
// Flat object writer: {"k":v,"k2":"s",...}
// ------------------------------------------------------------
class ObjectWriter {
public:
    explicit ObjectWriter(std::string& out) : out_(out) {
        out_ += '{';
    }

    ObjectWriter(const ObjectWriter&) = delete;
    ObjectWriter& operator=(const ObjectWriter&) = delete;

    ~ObjectWriter() {
        out_ += '}';
    }

    ObjectWriter& string(std::string_view key, std::string_view value) {
        key_(key);
        append_quoted(out_, value);
        return *this;
    }

    ObjectWriter& number(std::string_view key, std::uint64_t value) {
        key_(key);
        append(out_, value);
        return *this;
    }

    ObjectWriter& number(std::string_view key, std::int64_t value) {
        key_(key);
        append(out_, value);
        return *this;
    }

    // Pre-formatted numeric text (e.g. exact decimals), written unquoted
    ObjectWriter& raw_number(std::string_view key, std::string_view text) {
        key_(key);
        out_ += text;
        return *this;
    }

    ObjectWriter& boolean(std::string_view key, bool value) {
        key_(key);
        out_ += value ? "true" : "false";
        return *this;
    }

    ObjectWriter& null(std::string_view key) {
        key_(key);
        out_ += "null";
        return *this;
    }

    // Pre-serialized JSON value (array / nested object)
    ObjectWriter& raw(std::string_view key, std::string_view json) {
        key_(key);
        out_ += json;
        return *this;
    }

private:
    void key_(std::string_view key) {
        if (!first_) out_ += ',';
        first_ = false;
        append_quoted(out_, key);
        out_ += ':';
    }

    std::string& out_;
    bool first_ = true;
};

} // namespace json
} // namespace lcr
