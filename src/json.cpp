#include "json.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <format>

namespace curlmux::json {

namespace {

constexpr int kMaxDepth = 512;

class Parser {
public:
    explicit Parser(std::string_view input) : in_(input) {}

    std::expected<Value, ParseError> run() {
        auto value = parse_value(0);
        if (!value) return value;
        skip_ws();
        if (pos_ != in_.size()) return fail("Unexpected trailing characters");
        return value;
    }

private:
    std::unexpected<ParseError> fail(std::string_view what) const {
        return std::unexpected(ParseError{std::format("{} at offset {}", what, pos_), pos_});
    }

    void skip_ws() {
        while (pos_ < in_.size() && (in_[pos_] == ' ' || in_[pos_] == '\t' || in_[pos_] == '\n' || in_[pos_] == '\r')) ++pos_;
    }

    bool consume(std::string_view word) {
        if (in_.substr(pos_, word.size()) != word) return false;
        pos_ += word.size();
        return true;
    }

    std::expected<Value, ParseError> parse_value(int depth) {
        if (depth > kMaxDepth) return fail("Nesting too deep");
        skip_ws();
        if (pos_ >= in_.size()) return fail("Unexpected end of input");
        switch (in_[pos_]) {
            case '{': return parse_object(depth);
            case '[': return parse_array(depth);
            case '"': {
                auto s = parse_string();
                if (!s) return std::unexpected(s.error());
                return Value(std::move(*s));
            }
            case 't': if (consume("true")) return Value(true); break;
            case 'f': if (consume("false")) return Value(false); break;
            case 'n': if (consume("null")) return Value(); break;
            default: return parse_number();
        }
        return fail("Invalid literal");
    }

    std::expected<Value, ParseError> parse_object(int depth) {
        ++pos_;
        Object obj;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == '}') { ++pos_; return Value(std::move(obj)); }
        while (true) {
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != '"') return fail("Expected object key");
            auto key = parse_string();
            if (!key) return std::unexpected(key.error());
            skip_ws();
            if (pos_ >= in_.size() || in_[pos_] != ':') return fail("Expected ':'");
            ++pos_;
            auto value = parse_value(depth + 1);
            if (!value) return value;
            obj.insert_or_assign(std::move(*key), std::move(*value));
            skip_ws();
            if (pos_ >= in_.size()) return fail("Unterminated object");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == '}') { ++pos_; return Value(std::move(obj)); }
            return fail("Expected ',' or '}'");
        }
    }

    std::expected<Value, ParseError> parse_array(int depth) {
        ++pos_;
        Array arr;
        skip_ws();
        if (pos_ < in_.size() && in_[pos_] == ']') { ++pos_; return Value(std::move(arr)); }
        while (true) {
            auto value = parse_value(depth + 1);
            if (!value) return value;
            arr.push_back(std::move(*value));
            skip_ws();
            if (pos_ >= in_.size()) return fail("Unterminated array");
            if (in_[pos_] == ',') { ++pos_; continue; }
            if (in_[pos_] == ']') { ++pos_; return Value(std::move(arr)); }
            return fail("Expected ',' or ']'");
        }
    }

    std::expected<unsigned, ParseError> parse_hex4() {
        if (pos_ + 4 > in_.size()) return fail("Truncated \\u escape");
        unsigned cp = 0;
        auto [end, ec] = std::from_chars(in_.data() + pos_, in_.data() + pos_ + 4, cp, 16);
        if (ec != std::errc() || end != in_.data() + pos_ + 4) return fail("Invalid \\u escape");
        pos_ += 4;
        return cp;
    }

    static void append_utf8(std::string& out, unsigned cp) {
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

    std::expected<std::string, ParseError> parse_string() {
        ++pos_;
        std::string out;
        while (pos_ < in_.size()) {
            char c = in_[pos_++];
            if (c == '"') return out;
            if (static_cast<unsigned char>(c) < 0x20) return fail("Control character in string");
            if (c != '\\') { out += c; continue; }
            if (pos_ >= in_.size()) break;
            char esc = in_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) return std::unexpected(cp.error());
                    unsigned code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (!consume("\\u")) return fail("Unpaired surrogate");
                        auto low = parse_hex4();
                        if (!low) return std::unexpected(low.error());
                        if (*low < 0xDC00 || *low > 0xDFFF) return fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return fail("Unpaired surrogate");
                    }
                    append_utf8(out, code);
                    break;
                }
                default: return fail("Invalid escape");
            }
        }
        return fail("Unterminated string");
    }

    std::expected<Value, ParseError> parse_number() {
        size_t start = pos_;
        if (pos_ < in_.size() && in_[pos_] == '-') ++pos_;
        if (pos_ >= in_.size() || !std::isdigit(static_cast<unsigned char>(in_[pos_]))) return fail("Invalid number");
        if (in_[pos_] == '0') ++pos_;
        else while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) ++pos_;
        if (pos_ < in_.size() && in_[pos_] == '.') {
            ++pos_;
            if (pos_ >= in_.size() || !std::isdigit(static_cast<unsigned char>(in_[pos_]))) return fail("Invalid fraction");
            while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) ++pos_;
        }
        if (pos_ < in_.size() && (in_[pos_] == 'e' || in_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < in_.size() && (in_[pos_] == '+' || in_[pos_] == '-')) ++pos_;
            if (pos_ >= in_.size() || !std::isdigit(static_cast<unsigned char>(in_[pos_]))) return fail("Invalid exponent");
            while (pos_ < in_.size() && std::isdigit(static_cast<unsigned char>(in_[pos_]))) ++pos_;
        }
        double d = 0;
        auto [end, ec] = std::from_chars(in_.data() + start, in_.data() + pos_, d);
        if (ec != std::errc() || end != in_.data() + pos_) return fail("Number out of range");
        return Value(d);
    }

    std::string_view in_;
    size_t pos_ = 0;
};

void dump_string(const std::string& s, std::string& out) {
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                else out += c;
        }
    }
    out += '"';
}

void dump_into(const Value& v, std::string& out) {
    if (v.is_null()) {
        out += "null";
    } else if (v.is_bool()) {
        out += v.as_bool() ? "true" : "false";
    } else if (v.is_number()) {
        double d = v.as_number();
        if (!std::isfinite(d)) out += "null";
        else out += std::format("{}", d);
    } else if (v.is_string()) {
        dump_string(v.as_string(), out);
    } else if (v.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& item : v.as_array()) {
            if (!first) out += ',';
            first = false;
            dump_into(item, out);
        }
        out += ']';
    } else {
        out += '{';
        bool first = true;
        for (const auto& [key, item] : v.as_object()) {
            if (!first) out += ',';
            first = false;
            dump_string(key, out);
            out += ':';
            dump_into(item, out);
        }
        out += '}';
    }
}

} // namespace

std::expected<Value, ParseError> parse(std::string_view input) {
    return Parser(input).run();
}

std::string dump(const Value& value) {
    std::string out;
    dump_into(value, out);
    return out;
}

} // namespace curlmux::json
