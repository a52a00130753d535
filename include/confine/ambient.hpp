#pragma once

#include "confine/codec.hpp"

#include <mutex>
#include <string>

namespace confine {

// ============================================================================
// Ambient Codec Table
// ============================================================================
//
// The process-wide, overridable indirection through which ordinary code
// converts bytes and text. Every call looks up the binding current at call
// time, so anything that has run in the process can have replaced it.
// Security decisions must use a PrimitiveSnapshot instead.

class CodecTable {
public:
    // Starts with the built-in codec bindings.
    CodecTable();

    std::string decode(const Bytes& bytes, Encoding encoding) const;
    Bytes encode(const std::string& text, Encoding encoding) const;
    Bytes construct(const ByteSource& source, Encoding encoding) const;

    // Replace a binding. Returns false, leaving the binding untouched,
    // once the table is sealed.
    bool set_decode(DecodeFn fn);
    bool set_encode(EncodeFn fn);
    bool set_construct(ConstructFn fn);

    // Irreversibly refuse all further overrides.
    void seal();
    bool sealed() const;

    // Copy of the bindings as they are right now.
    PrimitiveBindings bindings() const;

private:
    bool refuse_override(const char* which) const;

    mutable std::mutex mutex_;
    PrimitiveBindings bindings_;
    bool sealed_ = false;
};

// The process-wide table.
CodecTable& ambient_codecs();

} // namespace confine
