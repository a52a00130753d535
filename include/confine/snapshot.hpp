#pragma once

#include "confine/codec.hpp"

#include <optional>
#include <string>

namespace confine {

// ============================================================================
// Trusted Primitive Snapshot
// ============================================================================
//
// An immutable bundle of direct function pointers to the byte/text
// primitives. The pointers are fixed at construction and every call goes
// straight through them; nothing is looked up by name or through the ambient
// codec table, so later overrides of that table cannot reach a snapshot.

class PrimitiveSnapshot {
public:
    // nullopt when any binding is null.
    static std::optional<PrimitiveSnapshot> from(const PrimitiveBindings& bindings);

    std::string decode(const Bytes& bytes, Encoding encoding) const;
    Bytes encode(const std::string& text, Encoding encoding) const;
    Bytes construct(const ByteSource& source, Encoding encoding) const;

    // Copy of the captured pointers, for inspection.
    PrimitiveBindings bindings() const;

private:
    PrimitiveSnapshot(DecodeFn decode, EncodeFn encode, ConstructFn construct);

    const DecodeFn decode_;
    const EncodeFn encode_;
    const ConstructFn construct_;
};

// ============================================================================
// Process-wide Capture
// ============================================================================

struct CaptureResult {
    bool ok = false;
    bool already_captured = false;           // this call was a no-op
    const PrimitiveSnapshot* snapshot = nullptr;
    std::string error;
};

// Capture the ambient codec table's current bindings into the process-wide
// snapshot. The library calls this during static initialization, before
// main(). Only the first call captures; later calls return the existing
// snapshot with already_captured set and never replace it. A failed capture
// (a primitive is missing) is permanent and callers must not proceed.
CaptureResult capture_trusted_primitives();

// The process-wide snapshot, or nullptr if capture failed. Never destroyed.
const PrimitiveSnapshot* trusted_primitives();

} // namespace confine
