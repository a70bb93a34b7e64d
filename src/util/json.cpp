// AETHER - JSON Value Implementation
// Copyright (c) 2024 AETHER Developers
// MIT License

#include <aether/util/json.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace aether {
namespace util {

// ============================================================================
// JSONValue Static Members
// ============================================================================

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

// ============================================================================
// JSONValue Implementation
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    return defaultValue;
}

const std::string& JSONValue::GetString(const std::string& defaultValue) const {
    if (type_ == Type::String) return stringValue_;
    return defaultValue;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    if (type_ != Type::Object) return false;
    return objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(const JSONValue& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(value);
}

void JSONValue::Push(JSONValue&& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

std::string JSONQuote(const std::string& str) {
    std::ostringstream ss;
    ss << '"';
    for (char c : str) {
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
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(static_cast<unsigned char>(c))
                       << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
    return ss.str();
}

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            ss << intValue_;
            break;

        case Type::String:
            ss << JSONQuote(stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
            } else if (pretty) {
                ss << "[\n";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    ss << childIndent << arrayValue_[i].ToJSON(true, indent + 1);
                    if (i + 1 < arrayValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "]";
            } else {
                ss << "[";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    if (i > 0) ss << ",";
                    ss << arrayValue_[i].ToJSON(false, 0);
                }
                ss << "]";
            }
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
            } else if (pretty) {
                ss << "{\n";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    ss << childIndent << JSONQuote(key) << ": "
                       << value.ToJSON(true, indent + 1);
                    if (++i < objectValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "}";
            } else {
                ss << "{";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    if (i++ > 0) ss << ",";
                    ss << JSONQuote(key) << ":" << value.ToJSON(false, 0);
                }
                ss << "}";
            }
            break;
        }
    }

    return ss.str();
}

// ============================================================================
// Parser
// ============================================================================

namespace {

constexpr int MAX_NESTING_DEPTH = 64;

class Parser {
public:
    explicit Parser(const std::string& json) : json_(json) {}

    std::optional<JSONValue> ParseDocument() {
        auto value = ParseValue(0);
        if (!value) return std::nullopt;
        SkipWhitespace();
        if (pos_ != json_.size()) return std::nullopt;
        return value;
    }

private:
    void SkipWhitespace() {
        while (pos_ < json_.size() &&
               (json_[pos_] == ' ' || json_[pos_] == '\t' ||
                json_[pos_] == '\n' || json_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool Consume(const char* literal) {
        size_t len = std::char_traits<char>::length(literal);
        if (json_.compare(pos_, len, literal) != 0) return false;
        pos_ += len;
        return true;
    }

    std::optional<uint32_t> ParseHex4() {
        if (pos_ + 4 > json_.size()) return std::nullopt;
        uint32_t value = 0;
        for (size_t i = 0; i < 4; ++i) {
            char c = json_[pos_ + i];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else return std::nullopt;
        }
        pos_ += 4;
        return value;
    }

    static void AppendUTF8(std::string& out, uint32_t cp) {
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

    std::optional<std::string> ParseString() {
        if (pos_ >= json_.size() || json_[pos_] != '"') return std::nullopt;
        ++pos_;

        std::string result;
        while (pos_ < json_.size() && json_[pos_] != '"') {
            char c = json_[pos_];
            if (static_cast<unsigned char>(c) < 0x20) return std::nullopt;
            if (c != '\\') {
                result += c;
                ++pos_;
                continue;
            }

            if (++pos_ >= json_.size()) return std::nullopt;
            char esc = json_[pos_++];
            switch (esc) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    auto cp = ParseHex4();
                    if (!cp) return std::nullopt;
                    if (*cp >= 0xD800 && *cp <= 0xDBFF) {
                        // High surrogate must be followed by a low one
                        if (!Consume("\\u")) return std::nullopt;
                        auto low = ParseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) return std::nullopt;
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (*cp >= 0xDC00 && *cp <= 0xDFFF) {
                        return std::nullopt;
                    }
                    AppendUTF8(result, *cp);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        if (pos_ >= json_.size()) return std::nullopt;
        ++pos_;  // Closing quote
        return result;
    }

    std::optional<JSONValue> ParseNumber() {
        size_t start = pos_;
        if (pos_ < json_.size() && json_[pos_] == '-') ++pos_;

        size_t digitsStart = pos_;
        while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) {
            ++pos_;
        }
        size_t digits = pos_ - digitsStart;
        if (digits == 0) return std::nullopt;
        if (digits > 1 && json_[digitsStart] == '0') return std::nullopt;

        // Fractions and exponents are not part of the wallet formats
        if (pos_ < json_.size() &&
            (json_[pos_] == '.' || json_[pos_] == 'e' || json_[pos_] == 'E')) {
            return std::nullopt;
        }

        std::string numStr = json_.substr(start, pos_ - start);
        errno = 0;
        char* end = nullptr;
        long long value = std::strtoll(numStr.c_str(), &end, 10);
        if (errno == ERANGE || end != numStr.c_str() + numStr.size()) {
            return std::nullopt;
        }
        return JSONValue(static_cast<int64_t>(value));
    }

    std::optional<JSONValue> ParseArray(int depth) {
        ++pos_;  // '['
        JSONValue::Array arr;

        SkipWhitespace();
        if (pos_ < json_.size() && json_[pos_] == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }

        while (true) {
            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));

            SkipWhitespace();
            if (pos_ >= json_.size()) return std::nullopt;
            if (json_[pos_] == ']') {
                ++pos_;
                return JSONValue(std::move(arr));
            }
            if (json_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseObject(int depth) {
        ++pos_;  // '{'
        JSONValue::Object obj;

        SkipWhitespace();
        if (pos_ < json_.size() && json_[pos_] == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }

        while (true) {
            SkipWhitespace();
            auto key = ParseString();
            if (!key) return std::nullopt;

            SkipWhitespace();
            if (pos_ >= json_.size() || json_[pos_] != ':') return std::nullopt;
            ++pos_;

            auto val = ParseValue(depth + 1);
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);

            SkipWhitespace();
            if (pos_ >= json_.size()) return std::nullopt;
            if (json_[pos_] == '}') {
                ++pos_;
                return JSONValue(std::move(obj));
            }
            if (json_[pos_] != ',') return std::nullopt;
            ++pos_;
        }
    }

    std::optional<JSONValue> ParseValue(int depth) {
        if (depth > MAX_NESTING_DEPTH) return std::nullopt;

        SkipWhitespace();
        if (pos_ >= json_.size()) return std::nullopt;

        char c = json_[pos_];
        if (c == 'n') {
            if (!Consume("null")) return std::nullopt;
            return JSONValue();
        }
        if (c == 't') {
            if (!Consume("true")) return std::nullopt;
            return JSONValue(true);
        }
        if (c == 'f') {
            if (!Consume("false")) return std::nullopt;
            return JSONValue(false);
        }
        if (c == '"') {
            auto str = ParseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return ParseArray(depth);
        if (c == '{') return ParseObject(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return ParseNumber();

        return std::nullopt;
    }

    const std::string& json_;
    size_t pos_{0};
};

} // anonymous namespace

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    Parser parser(json);
    return parser.ParseDocument();
}

} // namespace util
} // namespace aether
