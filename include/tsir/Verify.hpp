//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tsir/Verify.hpp
// Purpose: Stable façade exposing the typestate verifier entry points.
// Key invariants: Mirrors tsir::verify::Verifier public API only.
// Ownership/Lifetime: Caller retains ownership of programs and diagnostics.
// Links: docs/tsir-verifier.md
#pragma once

#include "tsir/verify/DiagSink.hpp"
#include "tsir/verify/Verifier.hpp"

/// @file include/tsir/Verify.hpp
/// @brief Public forwarding header providing structured verification entry
///        points without requiring downstreams to include src/tsir paths.
