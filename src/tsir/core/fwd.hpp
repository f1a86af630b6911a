//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Forward declarations for the core IR types.  Headers that only need pointer
// or reference types include this file instead of the full definitions.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace tsir::core
{
struct Program;
struct Function;
struct FunctionSig;
struct LabeledNode;
struct Node;
struct NodeType;
struct Location;
struct Lifetime;
struct Type;
struct Outlives;
class TypeContext;
} // namespace tsir::core
