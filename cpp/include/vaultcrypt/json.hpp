#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vaultcrypt::json {

enum class Type {
    kNull,
    kBool,
    kNumber,
    kString,
    kArray,
    kObject,
};

std::string_view TypeName(Type type);

struct Value {
    Type type = Type::kNull;
    std::string text;  // unescaped string, or the raw literal for other types
    bool boolean = false;
    double number = 0.0;

    // Non-negative integral numbers only.
    std::optional<std::uint64_t> AsUint() const;
};

// One JSON object with its members in document order. Nested arrays and
// objects are validated and kept as raw text.
class Object {
public:
    // Throws std::runtime_error on malformed input or a non-object root.
    static Object Parse(std::string_view text);

    const Value* Find(std::string_view key) const;
    bool Has(std::string_view key) const { return Find(key) != nullptr; }

private:
    std::vector<std::pair<std::string, Value>> members_;
};

// Emits a flat object, keys in call order.
class Writer {
public:
    Writer& String(std::string_view key, std::string_view value);
    Writer& Number(std::string_view key, std::uint64_t value);
    Writer& Bool(std::string_view key, bool value);
    std::string Finish() const;

private:
    void Key(std::string_view key);

    std::string body_;
};

std::string Escape(std::string_view input);

}  // namespace vaultcrypt::json
