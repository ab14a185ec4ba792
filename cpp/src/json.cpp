#include "vaultcrypt/json.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace vaultcrypt::json {

namespace {

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    std::vector<std::pair<std::string, Value>> ParseRoot() {
        SkipWhitespace();
        Expect('{', "JSON root must be an object");
        std::vector<std::pair<std::string, Value>> members;
        SkipWhitespace();
        if (Peek() == '}') {
            ++pos_;
        } else {
            while (true) {
                SkipWhitespace();
                if (Peek() != '"') {
                    Fail("expected member name");
                }
                std::string key = ParseString();
                SkipWhitespace();
                Expect(':', "expected ':' after member name");
                Value value = ParseValue(0);
                members.emplace_back(std::move(key), std::move(value));
                SkipWhitespace();
                if (Peek() == ',') {
                    ++pos_;
                    continue;
                }
                Expect('}', "expected ',' or '}'");
                break;
            }
        }
        SkipWhitespace();
        if (pos_ != text_.size()) {
            Fail("trailing characters after object");
        }
        return members;
    }

private:
    static constexpr int kMaxDepth = 64;

    [[noreturn]] void Fail(const char* what) const {
        throw std::runtime_error("Malformed JSON at offset " + std::to_string(pos_) + ": " + what);
    }

    char Peek() const {
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    void Expect(char ch, const char* what) {
        if (Peek() != ch) {
            Fail(what);
        }
        ++pos_;
    }

    void SkipWhitespace() {
        while (pos_ < text_.size()) {
            char ch = text_[pos_];
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
                break;
            }
            ++pos_;
        }
    }

    bool Consume(std::string_view literal) {
        if (text_.substr(pos_, literal.size()) == literal) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    unsigned ParseHex4() {
        if (text_.size() - pos_ < 4) {
            Fail("truncated unicode escape");
        }
        unsigned value = 0;
        for (int i = 0; i < 4; ++i) {
            char ch = text_[pos_++];
            value <<= 4;
            if (ch >= '0' && ch <= '9') {
                value |= static_cast<unsigned>(ch - '0');
            } else if (ch >= 'a' && ch <= 'f') {
                value |= static_cast<unsigned>(ch - 'a' + 10);
            } else if (ch >= 'A' && ch <= 'F') {
                value |= static_cast<unsigned>(ch - 'A' + 10);
            } else {
                Fail("invalid unicode escape");
            }
        }
        return value;
    }

    static void AppendUtf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string ParseString() {
        Expect('"', "expected string");
        std::string out;
        while (true) {
            if (pos_ >= text_.size()) {
                Fail("unterminated string");
            }
            char ch = text_[pos_++];
            if (ch == '"') {
                return out;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                Fail("control character in string");
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (pos_ >= text_.size()) {
                Fail("unterminated escape");
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned cp = ParseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (!Consume("\\u")) {
                            Fail("unpaired surrogate");
                        }
                        unsigned low = ParseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            Fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        Fail("unpaired surrogate");
                    }
                    AppendUtf8(out, cp);
                    break;
                }
                default:
                    Fail("invalid escape");
            }
        }
    }

    void ParseNumber(Value& value) {
        std::size_t start = pos_;
        if (Peek() == '-') {
            ++pos_;
        }
        if (Peek() == '0') {
            ++pos_;
        } else if (Peek() >= '1' && Peek() <= '9') {
            while (Peek() >= '0' && Peek() <= '9') ++pos_;
        } else {
            Fail("invalid number");
        }
        if (Peek() == '.') {
            ++pos_;
            if (!(Peek() >= '0' && Peek() <= '9')) {
                Fail("invalid fraction");
            }
            while (Peek() >= '0' && Peek() <= '9') ++pos_;
        }
        if (Peek() == 'e' || Peek() == 'E') {
            ++pos_;
            if (Peek() == '+' || Peek() == '-') ++pos_;
            if (!(Peek() >= '0' && Peek() <= '9')) {
                Fail("invalid exponent");
            }
            while (Peek() >= '0' && Peek() <= '9') ++pos_;
        }
        value.type = Type::kNumber;
        value.text = std::string(text_.substr(start, pos_ - start));
        value.number = std::strtod(value.text.c_str(), nullptr);
    }

    // Arrays and objects below the root are validated and captured raw.
    void ParseContainer(Value& value, char open, char close, int depth) {
        std::size_t start = pos_;
        Expect(open, "expected container");
        SkipWhitespace();
        if (Peek() == close) {
            ++pos_;
        } else {
            while (true) {
                SkipWhitespace();
                if (open == '{') {
                    if (Peek() != '"') {
                        Fail("expected member name");
                    }
                    ParseString();
                    SkipWhitespace();
                    Expect(':', "expected ':' after member name");
                }
                ParseValue(depth + 1);
                SkipWhitespace();
                if (Peek() == ',') {
                    ++pos_;
                    continue;
                }
                Expect(close, "unterminated container");
                break;
            }
        }
        value.type = open == '{' ? Type::kObject : Type::kArray;
        value.text = std::string(text_.substr(start, pos_ - start));
    }

    Value ParseValue(int depth) {
        if (depth > kMaxDepth) {
            Fail("nesting too deep");
        }
        SkipWhitespace();
        Value value;
        char ch = Peek();
        if (ch == '"') {
            value.type = Type::kString;
            value.text = ParseString();
        } else if (ch == '{') {
            ParseContainer(value, '{', '}', depth);
        } else if (ch == '[') {
            ParseContainer(value, '[', ']', depth);
        } else if (Consume("true")) {
            value.type = Type::kBool;
            value.boolean = true;
            value.text = "true";
        } else if (Consume("false")) {
            value.type = Type::kBool;
            value.text = "false";
        } else if (Consume("null")) {
            value.type = Type::kNull;
            value.text = "null";
        } else if (ch == '-' || (ch >= '0' && ch <= '9')) {
            ParseNumber(value);
        } else {
            Fail("unexpected token");
        }
        return value;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

std::string_view TypeName(Type type) {
    switch (type) {
        case Type::kNull: return "null";
        case Type::kBool: return "boolean";
        case Type::kNumber: return "number";
        case Type::kString: return "string";
        case Type::kArray: return "array";
        case Type::kObject: return "object";
    }
    return "unknown";
}

std::optional<std::uint64_t> Value::AsUint() const {
    if (type != Type::kNumber || number < 0.0 || std::floor(number) != number || number > 9007199254740992.0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(number);
}

Object Object::Parse(std::string_view text) {
    Object object;
    object.members_ = Parser(text).ParseRoot();
    return object;
}

const Value* Object::Find(std::string_view key) const {
    // Last duplicate wins.
    const Value* found = nullptr;
    for (const auto& member : members_) {
        if (member.first == key) {
            found = &member.second;
        }
    }
    return found;
}

void Writer::Key(std::string_view key) {
    if (!body_.empty()) {
        body_.push_back(',');
    }
    body_.push_back('"');
    body_ += Escape(key);
    body_ += "\":";
}

Writer& Writer::String(std::string_view key, std::string_view value) {
    Key(key);
    body_.push_back('"');
    body_ += Escape(value);
    body_.push_back('"');
    return *this;
}

Writer& Writer::Number(std::string_view key, std::uint64_t value) {
    Key(key);
    body_ += std::to_string(value);
    return *this;
}

Writer& Writer::Bool(std::string_view key, bool value) {
    Key(key);
    body_ += value ? "true" : "false";
    return *this;
}

std::string Writer::Finish() const {
    return "{" + body_ + "}";
}

std::string Escape(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
                    out += buffer;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

}  // namespace vaultcrypt::json
