#include <agentmem/core/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace agentmem {

// Value accessors
bool Json::as_bool(bool def) const {
    return type_ == BOOL ? bool_ : def;
}

double Json::as_number(double def) const {
    return type_ == NUMBER ? number_ : def;
}

int64_t Json::as_int(int64_t def) const {
    return type_ == NUMBER ? static_cast<int64_t>(number_) : def;
}

std::string Json::as_string(const std::string& def) const {
    return type_ == STRING ? string_ : def;
}

const std::vector<Json>& Json::as_array() const {
    static const std::vector<Json> empty;
    return type_ == ARRAY ? array_ : empty;
}

const std::map<std::string, Json>& Json::as_object() const {
    static const std::map<std::string, Json> empty;
    return type_ == OBJECT ? object_ : empty;
}

std::vector<std::string> Json::as_string_list() const {
    std::vector<std::string> out;
    if (type_ != ARRAY) return out;
    for (size_t i = 0; i < array_.size(); ++i) {
        if (array_[i].is_string()) out.push_back(array_[i].string_);
    }
    return out;
}

const Json& Json::operator[](const std::string& key) const {
    static const Json null_json;
    if (type_ != OBJECT) return null_json;
    std::map<std::string, Json>::const_iterator it = object_.find(key);
    return it != object_.end() ? it->second : null_json;
}

const Json& Json::operator[](size_t idx) const {
    static const Json null_json;
    if (type_ != ARRAY || idx >= array_.size()) return null_json;
    return array_[idx];
}

bool Json::has(const std::string& key) const {
    return type_ == OBJECT && object_.find(key) != object_.end();
}

size_t Json::size() const {
    if (type_ == ARRAY) return array_.size();
    if (type_ == OBJECT) return object_.size();
    return 0;
}

void Json::set(const std::string& key, const Json& value) {
    if (type_ != OBJECT) {
        *this = Json::object();
    }
    object_[key] = value;
}

void Json::push(const Json& value) {
    if (type_ != ARRAY) {
        *this = Json::array();
    }
    array_.push_back(value);
}

bool Json::erase(const std::string& key) {
    if (type_ != OBJECT) return false;
    return object_.erase(key) > 0;
}

std::string Json::get_string(const std::string& key, const std::string& def) const {
    const Json& v = (*this)[key];
    return v.is_string() ? v.string_ : def;
}

int Json::get_int(const std::string& key, int def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int>(v.number_) : def;
}

int64_t Json::get_int64(const std::string& key, int64_t def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? static_cast<int64_t>(v.number_) : def;
}

double Json::get_double(const std::string& key, double def) const {
    const Json& v = (*this)[key];
    return v.is_number() ? v.number_ : def;
}

bool Json::get_bool(const std::string& key, bool def) const {
    const Json& v = (*this)[key];
    return v.is_bool() ? v.bool_ : def;
}

Json Json::object() {
    Json j;
    j.type_ = OBJECT;
    return j;
}

Json Json::array() {
    Json j;
    j.type_ = ARRAY;
    return j;
}

Json Json::from_strings(const std::vector<std::string>& items) {
    Json j = Json::array();
    for (size_t i = 0; i < items.size(); ++i) {
        j.array_.push_back(Json(items[i]));
    }
    return j;
}

bool Json::operator==(const Json& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case NUL: return true;
        case BOOL: return bool_ == other.bool_;
        case NUMBER: return number_ == other.number_;
        case STRING: return string_ == other.string_;
        case ARRAY: return array_ == other.array_;
        case OBJECT: return object_ == other.object_;
    }
    return false;
}

// ============ Serialization ============

std::string Json::dump() const {
    std::ostringstream ss;
    dump_impl(ss);
    return ss.str();
}

void Json::dump_number(std::ostringstream& ss, double n) {
    if (std::isnan(n) || std::isinf(n)) {
        ss << "null";
        return;
    }
    // Integral values inside the exactly representable range print as integers
    if (std::fabs(n) < 9007199254740992.0 && n == std::floor(n)) {
        ss << static_cast<int64_t>(n);
        return;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.17g", n);
    ss << buf;
}

void Json::dump_impl(std::ostringstream& ss) const {
    switch (type_) {
        case NUL:
            ss << "null";
            break;
        case BOOL:
            ss << (bool_ ? "true" : "false");
            break;
        case NUMBER:
            dump_number(ss, number_);
            break;
        case STRING:
            ss << '"';
            escape_string(ss, string_);
            ss << '"';
            break;
        case ARRAY:
            ss << '[';
            for (size_t i = 0; i < array_.size(); ++i) {
                if (i > 0) ss << ',';
                array_[i].dump_impl(ss);
            }
            ss << ']';
            break;
        case OBJECT: {
            ss << '{';
            bool first = true;
            for (std::map<std::string, Json>::const_iterator it = object_.begin();
                 it != object_.end(); ++it) {
                if (!first) ss << ',';
                first = false;
                ss << '"';
                escape_string(ss, it->first);
                ss << "\":";
                it->second.dump_impl(ss);
            }
            ss << '}';
            break;
        }
    }
}

void Json::escape_string(std::ostringstream& ss, const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    ss << buf;
                } else {
                    ss << c;
                }
        }
    }
}

// ============ Parsing ============

class Json::Parser {
public:
    explicit Parser(const std::string& text) : s_(text), pos_(0), depth_(0) {}

    Json parse_document() {
        Json value = parse_value();
        skip_ws();
        if (pos_ != s_.size()) fail("unexpected trailing data");
        return value;
    }

private:
    static const int MAX_DEPTH = 256;

    const std::string& s_;
    size_t pos_;
    int depth_;

    void fail(const std::string& what) const {
        throw JsonParseError("Invalid JSON at position " + std::to_string(pos_) + ": " + what);
    }

    void skip_ws() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) pos_++;
    }

    bool consume_literal(const char* lit) {
        size_t n = std::char_traits<char>::length(lit);
        if (s_.compare(pos_, n, lit) != 0) return false;
        pos_ += n;
        return true;
    }

    Json parse_value() {
        skip_ws();
        if (pos_ >= s_.size()) fail("unexpected end of input");

        char c = s_[pos_];
        if (c == 'n') {
            if (!consume_literal("null")) fail("expected 'null'");
            return Json();
        }
        if (c == 't') {
            if (!consume_literal("true")) fail("expected 'true'");
            return Json(true);
        }
        if (c == 'f') {
            if (!consume_literal("false")) fail("expected 'false'");
            return Json(false);
        }
        if (c == '"') return Json(parse_string());
        if (c == '[') return parse_array();
        if (c == '{') return parse_object();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parse_number();

        fail(std::string("unexpected character '") + c + "'");
        return Json();
    }

    Json parse_number() {
        size_t start = pos_;
        if (s_[pos_] == '-') pos_++;
        size_t digits = pos_;
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) pos_++;
        if (pos_ == digits) fail("expected digit");
        if (pos_ < s_.size() && s_[pos_] == '.') {
            pos_++;
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) pos_++;
        }
        if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
            pos_++;
            if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) pos_++;
            while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) pos_++;
        }
        return Json(std::strtod(s_.substr(start, pos_ - start).c_str(), NULL));
    }

    unsigned read_hex4() {
        if (pos_ + 4 > s_.size()) fail("truncated \\u escape");
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = s_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else fail("bad hex digit in \\u escape");
        }
        return code;
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

    std::string parse_string() {
        pos_++; // opening quote
        std::string result;
        while (true) {
            if (pos_ >= s_.size()) fail("unterminated string");
            char c = s_[pos_++];
            if (c == '"') break;
            if (c != '\\') {
                result += c;
                continue;
            }
            if (pos_ >= s_.size()) fail("unterminated escape");
            char e = s_[pos_++];
            switch (e) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    unsigned cp = read_hex4();
                    if (cp >= 0xDC00 && cp <= 0xDFFF) fail("invalid surrogate pair");
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (s_.compare(pos_, 2, "\\u") != 0) fail("invalid surrogate pair");
                        pos_ += 2;
                        unsigned low = read_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("invalid surrogate pair");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    fail(std::string("bad escape '\\") + e + "'");
            }
        }
        return result;
    }

    Json parse_array() {
        if (++depth_ > MAX_DEPTH) fail("nesting too deep");
        pos_++; // [
        Json arr = Json::array();
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == ']') {
            pos_++;
            --depth_;
            return arr;
        }
        while (true) {
            arr.push(parse_value());
            skip_ws();
            if (pos_ >= s_.size()) fail("unterminated array");
            char c = s_[pos_++];
            if (c == ']') break;
            if (c != ',') fail("expected ',' or ']'");
        }
        --depth_;
        return arr;
    }

    Json parse_object() {
        if (++depth_ > MAX_DEPTH) fail("nesting too deep");
        pos_++; // {
        Json obj = Json::object();
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == '}') {
            pos_++;
            --depth_;
            return obj;
        }
        while (true) {
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != '"') fail("expected object key");
            std::string key = parse_string();
            skip_ws();
            if (pos_ >= s_.size() || s_[pos_] != ':') fail("expected ':'");
            pos_++;
            obj.set(key, parse_value());
            skip_ws();
            if (pos_ >= s_.size()) fail("unterminated object");
            char c = s_[pos_++];
            if (c == '}') break;
            if (c != ',') fail("expected ',' or '}'");
        }
        --depth_;
        return obj;
    }
};

Json Json::parse(const std::string& str) {
    Parser parser(str);
    return parser.parse_document();
}

} // namespace agentmem
