#include "confine/snapshot.hpp"
#include "confine/ambient.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace confine {

PrimitiveSnapshot::PrimitiveSnapshot(DecodeFn decode, EncodeFn encode, ConstructFn construct)
    : decode_(decode), encode_(encode), construct_(construct) {}

std::optional<PrimitiveSnapshot> PrimitiveSnapshot::from(const PrimitiveBindings& bindings) {
    if (!bindings.decode || !bindings.encode || !bindings.construct) {
        return std::nullopt;
    }
    return PrimitiveSnapshot(bindings.decode, bindings.encode, bindings.construct);
}

std::string PrimitiveSnapshot::decode(const Bytes& bytes, Encoding encoding) const {
    return decode_(bytes, encoding);
}

Bytes PrimitiveSnapshot::encode(const std::string& text, Encoding encoding) const {
    return encode_(text, encoding);
}

Bytes PrimitiveSnapshot::construct(const ByteSource& source, Encoding encoding) const {
    return construct_(source, encoding);
}

PrimitiveBindings PrimitiveSnapshot::bindings() const {
    PrimitiveBindings b;
    b.decode = decode_;
    b.encode = encode_;
    b.construct = construct_;
    return b;
}

namespace {

struct CaptureState {
    std::once_flag once;
    const PrimitiveSnapshot* snapshot = nullptr;
    std::string error;
};

// Heap-allocated and never freed: the snapshot outlives every static
// destructor that might still validate paths.
CaptureState& capture_state() {
    static CaptureState* state = new CaptureState();
    return *state;
}

void do_capture(CaptureState& state) {
    auto snapshot = PrimitiveSnapshot::from(ambient_codecs().bindings());
    if (!snapshot) {
        state.error = "codec primitives unavailable at capture time";
        spdlog::critical("Trusted primitive capture failed: {}", state.error);
        return;
    }
    state.snapshot = new PrimitiveSnapshot(*snapshot);
}

} // namespace

CaptureResult capture_trusted_primitives() {
    CaptureState& state = capture_state();
    bool captured_now = false;
    std::call_once(state.once, [&]() {
        captured_now = true;
        do_capture(state);
    });

    CaptureResult result;
    result.already_captured = !captured_now;
    result.snapshot = state.snapshot;
    result.ok = state.snapshot != nullptr;
    result.error = state.error;
    if (result.already_captured) {
        spdlog::warn("Trusted primitives already captured; re-capture ignored");
    }
    return result;
}

const PrimitiveSnapshot* trusted_primitives() {
    CaptureState& state = capture_state();
    std::call_once(state.once, [&]() { do_capture(state); });
    return state.snapshot;
}

namespace {

// Capture before main() so nothing loaded later can have touched the table.
[[maybe_unused]] const bool captured_at_load = trusted_primitives() != nullptr;

} // namespace

} // namespace confine
