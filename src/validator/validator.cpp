#include "confine/validator.hpp"

#include <filesystem>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace confine {

namespace fs = std::filesystem;

namespace {

const char SEPARATOR = '/';

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::string strip_trailing_separators(std::string s) {
    while (s.size() > 1 && s.back() == SEPARATOR) {
        s.pop_back();
    }
    return s;
}

// Absolute, normalized, no trailing separator. Under Resolve, symlinks in
// the existing prefix are resolved too.
bool canonicalize(const fs::path& absolute_path, SymlinkPolicy policy,
                  std::string& out, std::string& error) {
    fs::path p = absolute_path.lexically_normal();
    if (policy == SymlinkPolicy::Resolve) {
        std::error_code ec;
        p = fs::weakly_canonical(p, ec);
        if (ec) {
            error = ec.message();
            return false;
        }
    }
    out = strip_trailing_separators(p.generic_string());
    return true;
}

// JSON string literal of untrusted text, so control characters cannot
// forge log lines. Invalid UTF-8 is replaced rather than thrown on.
std::string quoted(const std::string& text) {
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ValidationResult fail(ValidationError error, std::string message) {
    ValidationResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

} // namespace

const char* to_string(ValidationError error) {
    switch (error) {
        case ValidationError::None: return "none";
        case ValidationError::InvalidInputType: return "invalid_input_type";
        case ValidationError::InvalidBaseDirectory: return "invalid_base_directory";
        case ValidationError::ContainsNul: return "contains_nul";
        case ValidationError::PathTraversal: return "path_traversal";
        case ValidationError::IntegrityViolation: return "integrity_violation";
        case ValidationError::PrimitivesUnavailable: return "primitives_unavailable";
    }
    return "unknown";
}

bool is_within_base(const std::string& path, const std::string& base) {
    if (path == base) {
        return true;
    }
    if (base.empty()) {
        return false;
    }
    // The filesystem root already ends in a separator.
    std::string prefix = base;
    if (prefix.back() != SEPARATOR) {
        prefix.push_back(SEPARATOR);
    }
    return path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0;
}

PathValidator::PathValidator(std::string base, const ValidatorOptions& options,
                             const PrimitiveSnapshot& snapshot)
    : base_(std::move(base)), options_(options), snapshot_(snapshot) {}

PathValidatorResult PathValidator::create(const std::string& allowed_base,
                                          const ValidatorOptions& options) {
    const PrimitiveSnapshot* snapshot = trusted_primitives();
    if (!snapshot) {
        PathValidatorResult result;
        result.error = ValidationError::PrimitivesUnavailable;
        result.message = "trusted primitives were not captured";
        return result;
    }
    return create(allowed_base, options, *snapshot);
}

PathValidatorResult PathValidator::create(const std::string& allowed_base,
                                          const ValidatorOptions& options,
                                          const PrimitiveSnapshot& snapshot) {
    PathValidatorResult result;
    result.error = ValidationError::InvalidBaseDirectory;

    if (allowed_base.empty()) {
        result.message = "base directory is empty";
        return result;
    }
    if (contains_nul(allowed_base)) {
        result.message = "base directory contains NUL";
        return result;
    }

    std::error_code ec;
    fs::path absolute_base = fs::absolute(fs::path(allowed_base), ec);
    if (ec || !absolute_base.is_absolute()) {
        result.message = "cannot make base directory absolute: " + confine::quoted(allowed_base);
        return result;
    }

    std::string base;
    std::string error;
    if (!canonicalize(absolute_base, options.symlinks, base, error)) {
        result.message = "cannot canonicalize base directory " + confine::quoted(allowed_base) + ": " + error;
        return result;
    }

    spdlog::debug("Path validator base directory: {}", confine::quoted(base));
    result.ok = true;
    result.error = ValidationError::None;
    result.validator.emplace(PathValidator(std::move(base), options, snapshot));
    return result;
}

ValidationResult PathValidator::validate(const Candidate& candidate) const {
    // 1. Normalize to text.
    std::string text;
    if (const auto* s = std::get_if<std::string>(&candidate)) {
        if (!is_valid_utf8(*s)) {
            return fail(ValidationError::InvalidInputType, "path text is not valid UTF-8");
        }
        text = *s;
    } else if (const auto* bytes = std::get_if<Bytes>(&candidate)) {
        text = snapshot_.decode(*bytes, options_.encoding);
    } else {
        return fail(ValidationError::InvalidInputType, "path must be text or bytes");
    }

    if (contains_nul(text)) {
        spdlog::warn("Rejected path containing NUL");
        return fail(ValidationError::ContainsNul, "path contains NUL");
    }

    // 2. Resolve against the base.
    fs::path input(text);
    fs::path joined = input.is_absolute() ? input : fs::path(base_) / input;
    std::string resolved;
    std::string error;
    if (!canonicalize(joined, options_.symlinks, resolved, error)) {
        spdlog::warn("Cannot canonicalize path {}: {}", confine::quoted(text), error);
        return fail(ValidationError::PathTraversal,
                    "cannot canonicalize " + confine::quoted(text) + ": " + error);
    }

    // 3. First bound check.
    if (!is_within_base(resolved, base_)) {
        spdlog::warn("Path traversal detected: {} -> {}", confine::quoted(text), confine::quoted(resolved));
        return fail(ValidationError::PathTraversal, "path traversal detected: " + confine::quoted(text));
    }

    // 4. Round trip through the captured primitives only.
    Bytes path_bytes = snapshot_.construct(ByteSource(resolved), Encoding::Utf8);
    std::string final_path = snapshot_.decode(path_bytes, Encoding::Utf8);

    // 5. Second bound check.
    if (final_path != resolved || !is_within_base(final_path, base_)) {
        spdlog::error("Codec integrity violation while validating {}: {} became {}",
                      confine::quoted(text), confine::quoted(resolved), confine::quoted(final_path));
        return fail(ValidationError::IntegrityViolation,
                    "byte/text round trip changed the path: " + confine::quoted(text));
    }

    spdlog::debug("Path accepted: {}", confine::quoted(final_path));
    ValidationResult result;
    result.ok = true;
    result.path = std::move(final_path);
    return result;
}

} // namespace confine
