#pragma once

#include "confine/codec.hpp"
#include "confine/snapshot.hpp"

#include <optional>
#include <string>
#include <variant>

namespace confine {

// ============================================================================
// Errors and Results
// ============================================================================

enum class ValidationError {
    None,
    InvalidInputType,       // neither text nor bytes, or text not UTF-8
    InvalidBaseDirectory,   // base cannot be made absolute/canonical
    ContainsNul,
    PathTraversal,          // resolves outside the base on the first check
    IntegrityViolation,     // round trip through the snapshot changed the result
    PrimitivesUnavailable,  // process-wide capture failed
};

// Stable snake_case name, e.g. "path_traversal".
const char* to_string(ValidationError error);

struct ValidationResult {
    bool ok = false;
    std::string path;  // canonical confined path when ok
    ValidationError error = ValidationError::None;
    std::string message;
};

// Untrusted caller input. monostate stands for a value that is neither
// text nor bytes.
using Candidate = std::variant<std::monostate, std::string, Bytes>;

enum class SymlinkPolicy {
    Resolve,  // resolve symlinks of the existing prefix
    Lexical,  // string normalization only
};

struct ValidatorOptions {
    Encoding encoding = Encoding::Utf8;  // for byte candidates
    SymlinkPolicy symlinks = SymlinkPolicy::Resolve;
};

// Separator-aware containment: path equals base, or starts with base + "/".
bool is_within_base(const std::string& path, const std::string& base);

// ============================================================================
// Path Validator
// ============================================================================

struct PathValidatorResult;

class PathValidator {
public:
    // Canonicalizes allowed_base once. Uses the process-wide snapshot.
    static PathValidatorResult create(const std::string& allowed_base,
                                      const ValidatorOptions& options = {});

    // Same, with an explicitly injected snapshot.
    static PathValidatorResult create(const std::string& allowed_base,
                                      const ValidatorOptions& options,
                                      const PrimitiveSnapshot& snapshot);

    // Resolve candidate under the base directory. Byte candidates are decoded
    // with the snapshot, never the ambient codec table. A successful result is
    // re-encoded and decoded through the snapshot and must come back
    // unchanged and still confined.
    ValidationResult validate(const Candidate& candidate) const;

    const std::string& base_directory() const { return base_; }
    const ValidatorOptions& options() const { return options_; }
    const PrimitiveSnapshot& snapshot() const { return snapshot_; }

private:
    PathValidator(std::string base, const ValidatorOptions& options,
                  const PrimitiveSnapshot& snapshot);

    const std::string base_;
    const ValidatorOptions options_;
    const PrimitiveSnapshot snapshot_;
};

struct PathValidatorResult {
    bool ok = false;
    std::optional<PathValidator> validator;
    ValidationError error = ValidationError::None;
    std::string message;
};

} // namespace confine
