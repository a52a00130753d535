#include "confine/ambient.hpp"

#include <spdlog/spdlog.h>

namespace confine {

CodecTable::CodecTable() : bindings_(builtin_bindings()) {}

std::string CodecTable::decode(const Bytes& bytes, Encoding encoding) const {
    DecodeFn fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = bindings_.decode;
    }
    return fn ? fn(bytes, encoding) : std::string();
}

Bytes CodecTable::encode(const std::string& text, Encoding encoding) const {
    EncodeFn fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = bindings_.encode;
    }
    return fn ? fn(text, encoding) : Bytes();
}

Bytes CodecTable::construct(const ByteSource& source, Encoding encoding) const {
    ConstructFn fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fn = bindings_.construct;
    }
    return fn ? fn(source, encoding) : Bytes();
}

bool CodecTable::refuse_override(const char* which) const {
    if (sealed_) {
        spdlog::warn("Refused override of sealed codec primitive '{}'", which);
        return true;
    }
    return false;
}

bool CodecTable::set_decode(DecodeFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refuse_override("decode")) return false;
    bindings_.decode = fn;
    return true;
}

bool CodecTable::set_encode(EncodeFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refuse_override("encode")) return false;
    bindings_.encode = fn;
    return true;
}

bool CodecTable::set_construct(ConstructFn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (refuse_override("construct")) return false;
    bindings_.construct = fn;
    return true;
}

void CodecTable::seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sealed_) {
        sealed_ = true;
        spdlog::debug("Codec table sealed");
    }
}

bool CodecTable::sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

PrimitiveBindings CodecTable::bindings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bindings_;
}

CodecTable& ambient_codecs() {
    static CodecTable table;
    return table;
}

} // namespace confine
