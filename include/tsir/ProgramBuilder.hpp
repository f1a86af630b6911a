//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tsir/ProgramBuilder.hpp
// Purpose: Stable façade for constructing programs without depending on src paths.
// Key invariants: Mirrors tsir::build::ProgramBuilder API; no additional behavior.
// Ownership/Lifetime: Builders reference a caller-owned Program.
// Links: docs/tsir-format.md
#pragma once

#include "tsir/build/ProgramBuilder.hpp"
