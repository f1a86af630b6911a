//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tsir/parse/Cursor.h
// Purpose: Declare a lightweight text cursor for the .tsir line parsers.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller; no allocations.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the scanning cursor shared by the declaration, type and
///        node parsers.
/// @details Every .tsir declaration fits on one line, so the cursor scans a
///          single line and tracks a column for diagnostics.  Token helpers
///          skip blanks first and leave the cursor untouched on mismatch.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tsir::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Lightweight cursor for scanning one line of IR text.
class Cursor
{
  public:
    explicit Cursor(std::string_view text) noexcept : text_(text) {}

    /// @brief View the unconsumed suffix.
    [[nodiscard]] std::string_view remaining() const noexcept
    {
        return text_.substr(index_);
    }

    /// @brief True when only blanks remain.
    [[nodiscard]] bool atEnd() noexcept;

    /// @brief Inspect the next non-blank character without consuming it.
    [[nodiscard]] char peek() noexcept;

    /// @brief 1-based column of the next unconsumed character.
    [[nodiscard]] std::size_t column() const noexcept
    {
        return index_ + 1;
    }

    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Skip blanks.
    void skipWs() noexcept;

    /// @brief Consume @p c if it is the next non-blank character.
    bool consumeIf(char c) noexcept;

    /// @brief Consume a two-character punctuator such as `->`.
    bool consumePunct(std::string_view punct) noexcept;

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (index_ < text_.size() && pred(text_[index_]))
            ++index_;
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Consume an identifier: `[A-Za-z_][A-Za-z0-9_.]*`.
    bool consumeIdent(std::string_view &out) noexcept;

    /// @brief Consume an unsigned decimal literal.
    bool consumeNumber(uint64_t &out) noexcept;

    /// @brief Consume @p kw when it appears as a whole word.
    bool consumeKeyword(std::string_view kw) noexcept;

    /// @brief Check for @p kw as a whole word without consuming it.
    [[nodiscard]] bool peekKeyword(std::string_view kw) noexcept;

    /// @brief Move to @p offset within the line.
    void seek(std::size_t offset) noexcept
    {
        index_ = offset > text_.size() ? text_.size() : offset;
    }

  private:
    std::string_view text_;
    std::size_t index_ = 0;
};

} // namespace tsir::parse
