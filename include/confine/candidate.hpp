#pragma once

#include "confine/validator.hpp"

#include <nlohmann/json.hpp>

namespace confine {

// Convert a dynamically typed value into a Candidate.
//   string                         -> text
//   binary                         -> bytes
//   array of integers 0..255       -> bytes
//   {"type":"Buffer","data":[...]} -> bytes
// Anything else yields monostate, which validate() rejects as
// InvalidInputType.
Candidate candidate_from_json(const nlohmann::json& value);

} // namespace confine
