#include "confine/codec.hpp"

#include <algorithm>
#include <cctype>

namespace confine {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void append_code_point(std::string& out, uint32_t cp) {
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

const uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Length of the well-formed sequence starting at data[i], or 0 if the
// sequence is invalid. On 0, *consumed holds the length of the maximal
// invalid subpart (always >= 1).
size_t scan_sequence(const uint8_t* data, size_t size, size_t i, size_t* consumed) {
    uint8_t lead = data[i];
    if (lead < 0x80) {
        return 1;
    }

    size_t need = 0;
    uint8_t lower = 0x80;
    uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
        if (lead == 0xE0) lower = 0xA0;
        if (lead == 0xED) upper = 0x9F;  // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
        if (lead == 0xF0) lower = 0x90;
        if (lead == 0xF4) upper = 0x8F;  // above U+10FFFF
    } else {
        *consumed = 1;
        return 0;
    }

    size_t j = 1;
    for (; j <= need; ++j) {
        if (i + j >= size) break;
        uint8_t c = data[i + j];
        uint8_t lo = (j == 1) ? lower : 0x80;
        uint8_t hi = (j == 1) ? upper : 0xBF;
        if (c < lo || c > hi) break;
    }
    if (j > need) {
        return need + 1;
    }
    *consumed = j;
    return 0;
}

std::string decode_utf8(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size);
    size_t i = 0;
    while (i < size) {
        size_t consumed = 0;
        size_t len = scan_sequence(data, size, i, &consumed);
        if (len == 0) {
            append_code_point(out, REPLACEMENT_CHARACTER);
            i += consumed;
        } else {
            out.append(reinterpret_cast<const char*>(data + i), len);
            i += len;
        }
    }
    return out;
}

// Code points of well-formed UTF-8.
std::vector<uint32_t> code_points(const std::string& valid) {
    std::vector<uint32_t> cps;
    size_t i = 0;
    while (i < valid.size()) {
        uint8_t lead = static_cast<uint8_t>(valid[i]);
        uint32_t cp = 0;
        size_t len = 1;
        if (lead < 0x80) {
            cp = lead;
        } else if (lead < 0xE0) {
            cp = lead & 0x1F;
            len = 2;
        } else if (lead < 0xF0) {
            cp = lead & 0x0F;
            len = 3;
        } else {
            cp = lead & 0x07;
            len = 4;
        }
        for (size_t k = 1; k < len && i + k < valid.size(); ++k) {
            cp = (cp << 6) | (static_cast<uint8_t>(valid[i + k]) & 0x3F);
        }
        cps.push_back(cp);
        i += len;
    }
    return cps;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::optional<Encoding> parse_encoding(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "utf8" || n == "utf-8") return Encoding::Utf8;
    if (n == "latin1" || n == "binary") return Encoding::Latin1;
    if (n == "ascii") return Encoding::Ascii;
    if (n == "hex") return Encoding::Hex;
    return std::nullopt;
}

const char* encoding_name(Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8: return "utf8";
        case Encoding::Latin1: return "latin1";
        case Encoding::Ascii: return "ascii";
        case Encoding::Hex: return "hex";
    }
    return "utf8";
}

bool is_valid_utf8(const std::string& text) {
    const auto* data = reinterpret_cast<const uint8_t*>(text.data());
    size_t i = 0;
    while (i < text.size()) {
        size_t consumed = 0;
        size_t len = scan_sequence(data, text.size(), i, &consumed);
        if (len == 0) {
            return false;
        }
        i += len;
    }
    return true;
}

namespace codec {

std::string decode(const Bytes& bytes, Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8:
            return decode_utf8(bytes.data(), bytes.size());
        case Encoding::Latin1: {
            std::string out;
            out.reserve(bytes.size());
            for (uint8_t b : bytes) {
                append_code_point(out, b);
            }
            return out;
        }
        case Encoding::Ascii: {
            std::string out;
            out.reserve(bytes.size());
            for (uint8_t b : bytes) {
                out.push_back(static_cast<char>(b & 0x7F));
            }
            return out;
        }
        case Encoding::Hex: {
            static const char digits[] = "0123456789abcdef";
            std::string out;
            out.reserve(bytes.size() * 2);
            for (uint8_t b : bytes) {
                out.push_back(digits[b >> 4]);
                out.push_back(digits[b & 0x0F]);
            }
            return out;
        }
    }
    return {};
}

Bytes encode(const std::string& text, Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8: {
            std::string valid = decode_utf8(reinterpret_cast<const uint8_t*>(text.data()),
                                            text.size());
            return Bytes(valid.begin(), valid.end());
        }
        case Encoding::Latin1:
        case Encoding::Ascii: {
            std::string valid = decode_utf8(reinterpret_cast<const uint8_t*>(text.data()),
                                            text.size());
            Bytes out;
            for (uint32_t cp : code_points(valid)) {
                out.push_back(static_cast<uint8_t>(cp & 0xFF));
            }
            return out;
        }
        case Encoding::Hex: {
            Bytes out;
            for (size_t i = 0; i + 1 < text.size(); i += 2) {
                int hi = hex_value(text[i]);
                int lo = hex_value(text[i + 1]);
                if (hi < 0 || lo < 0) break;
                out.push_back(static_cast<uint8_t>((hi << 4) | lo));
            }
            return out;
        }
    }
    return {};
}

Bytes construct(const ByteSource& source, Encoding encoding) {
    if (const auto* text = std::get_if<std::string>(&source)) {
        return encode(*text, encoding);
    }
    return std::get<Bytes>(source);
}

} // namespace codec

PrimitiveBindings builtin_bindings() {
    PrimitiveBindings b;
    b.decode = &codec::decode;
    b.encode = &codec::encode;
    b.construct = &codec::construct;
    return b;
}

} // namespace confine
