//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tsir/version.hpp
// Purpose: Central definition of the textual IR format version.
// Key invariants: The parser accepts exactly this version in the `tsir` banner.
// Ownership/Lifetime: Header-only constants.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#define TSIR_FORMAT_VERSION_MAJOR 0
#define TSIR_FORMAT_VERSION_MINOR 1
#define TSIR_FORMAT_VERSION_STR "0.1"
