//===----------------------------------------------------------------------===//
//
// Part of the Tsir project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tsir/parse/Cursor.cpp
// Purpose: Provide out-of-line helpers for the parse::Cursor utility.
// Key invariants: Failed token reads leave the cursor where it started.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: docs/tsir-format.md
//
//===----------------------------------------------------------------------===//

#include "tsir/parse/Cursor.h"

#include <cctype>
#include <limits>

namespace tsir::parse
{
namespace
{
bool isIdentStart(char ch)
{
    const auto uc = static_cast<unsigned char>(ch);
    return std::isalpha(uc) || ch == '_';
}

bool isIdentBody(char ch)
{
    const auto uc = static_cast<unsigned char>(ch);
    return std::isalnum(uc) || ch == '_' || ch == '.';
}
} // namespace

void Cursor::skipWs() noexcept
{
    while (index_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[index_])))
        ++index_;
}

bool Cursor::atEnd() noexcept
{
    skipWs();
    return index_ >= text_.size();
}

/// @details Returns '\0' at end of line so callers can compare directly.
char Cursor::peek() noexcept
{
    skipWs();
    return index_ < text_.size() ? text_[index_] : '\0';
}

bool Cursor::consumeIf(char c) noexcept
{
    if (peek() != c)
        return false;
    ++index_;
    return true;
}

bool Cursor::consumePunct(std::string_view punct) noexcept
{
    skipWs();
    if (text_.substr(index_, punct.size()) != punct)
        return false;
    index_ += punct.size();
    return true;
}

bool Cursor::consumeIdent(std::string_view &out) noexcept
{
    skipWs();
    if (index_ >= text_.size() || !isIdentStart(text_[index_]))
        return false;
    out = consumeWhile(isIdentBody);
    return true;
}

/// @details Rejects literals that overflow 64 bits and rewinds on failure.
bool Cursor::consumeNumber(uint64_t &out) noexcept
{
    skipWs();
    const std::size_t begin = index_;
    uint64_t value = 0;
    while (index_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[index_])))
    {
        const uint64_t digit = static_cast<uint64_t>(text_[index_] - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10)
        {
            index_ = begin;
            return false;
        }
        value = value * 10 + digit;
        ++index_;
    }
    if (index_ == begin)
        return false;
    out = value;
    return true;
}

bool Cursor::peekKeyword(std::string_view kw) noexcept
{
    skipWs();
    if (kw.empty() || text_.substr(index_, kw.size()) != kw)
        return false;
    const std::size_t after = index_ + kw.size();
    return after >= text_.size() || !isIdentBody(text_[after]);
}

bool Cursor::consumeKeyword(std::string_view kw) noexcept
{
    if (!peekKeyword(kw))
        return false;
    index_ += kw.size();
    return true;
}

} // namespace tsir::parse
