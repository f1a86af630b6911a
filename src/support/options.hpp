//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Settings passed from tsir-verify to Verifier::run.
// Key invariants: jobs == 0 is treated as 1; jobs never exceeds the
//                 function count.
// Ownership/Lifetime: Caller owns option values.
// Links: docs/tsir-verifier.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace tsir::support
{

/// @brief Verifier settings, filled from `--trace` and `--jobs N`.
/// @details Neither setting changes which functions are accepted; trace notes
///          and results are reported in program order for any job count.
struct Options
{
    /// Report each checked node and each accepted judgment as a note.
    bool trace = false;

    /// Worker threads; functions are handed out one at a time.
    unsigned jobs = 1;
};

} // namespace tsir::support
