#pragma once

/**
 * confine - tamper-resistant path confinement
 *
 * Decides whether a path, given as text or raw bytes, resolves inside a base
 * directory, using byte/text primitives captured before untrusted code runs.
 */

#define CONFINE_VERSION "0.1.0"

#include "confine/ambient.hpp"
#include "confine/candidate.hpp"
#include "confine/codec.hpp"
#include "confine/guard_config.hpp"
#include "confine/logging.hpp"
#include "confine/snapshot.hpp"
#include "confine/validator.hpp"
