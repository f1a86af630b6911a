//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tsir/IO.hpp
// Purpose: Stable façade for .tsir text parsing and serialization.
// Key invariants: Re-exports supported IO interfaces; parser internals stay internal.
// Ownership/Lifetime: Parser/Serializer mirror underlying implementations.
// Links: docs/tsir-format.md
#pragma once

#include "tsir/io/Parser.hpp"
#include "tsir/io/Serializer.hpp"
