#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace confine {

// ============================================================================
// Byte/Text Types
// ============================================================================

using Bytes = std::vector<uint8_t>;

// Text is always UTF-8 inside a std::string.
enum class Encoding {
    Utf8,
    Latin1,
    Ascii,
    Hex,
};

// Input accepted by construct(): text (interpreted per encoding) or raw bytes.
using ByteSource = std::variant<std::string, Bytes>;

// Accepts utf8/utf-8, latin1/binary, ascii, hex (case-insensitive).
std::optional<Encoding> parse_encoding(const std::string& name);
const char* encoding_name(Encoding encoding);

// True when every byte sequence in text is well-formed UTF-8
// (no overlongs, no surrogates, nothing above U+10FFFF).
bool is_valid_utf8(const std::string& text);

// ============================================================================
// Built-in Primitives
// ============================================================================
//
// These are the implementations installed in the ambient codec table at
// startup. Code that needs tamper-resistant conversion must reach them through
// a PrimitiveSnapshot, never by name through the ambient table.

namespace codec {

// Invalid UTF-8 input is decoded with U+FFFD per maximal invalid subsequence.
std::string decode(const Bytes& bytes, Encoding encoding);

// Latin1/Ascii keep the low 8 bits of each code point. Hex parses digit
// pairs and stops at the first pair that is not hex.
Bytes encode(const std::string& text, Encoding encoding);

Bytes construct(const ByteSource& source, Encoding encoding);

} // namespace codec

// Function pointer types for the three primitives.
using DecodeFn = std::string (*)(const Bytes&, Encoding);
using EncodeFn = Bytes (*)(const std::string&, Encoding);
using ConstructFn = Bytes (*)(const ByteSource&, Encoding);

struct PrimitiveBindings {
    DecodeFn decode = nullptr;
    EncodeFn encode = nullptr;
    ConstructFn construct = nullptr;
};

// Bindings pointing at the built-in codec.
PrimitiveBindings builtin_bindings();

} // namespace confine
