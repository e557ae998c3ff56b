#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>

namespace taskpad::details
{

// Offsets count Unicode code points. Surfaces that address bytes convert at
// their own boundary.
struct SelectionRange
{
    std::size_t anchor = 0;
    std::size_t head = 0;

    static SelectionRange caret(std::size_t offset) noexcept { return {offset, offset}; }

    std::size_t from() const noexcept { return std::min(anchor, head); }
    std::size_t to() const noexcept { return std::max(anchor, head); }
    bool empty() const noexcept { return anchor == head; }
    bool operator==(const SelectionRange &other) const noexcept = default;
};

struct TransformSpec
{
    std::string prefix;
    std::string suffix;
    std::string placeholder;
};

// Replace code points [from, to) of the current document with `insert`.
struct TextChange
{
    std::size_t from = 0;
    std::size_t to = 0;
    std::string insert;
};

struct TransformResult
{
    std::string document;
    SelectionRange selection;
    TextChange change;
};

/// Wraps the selected text (or `spec.placeholder` when the selection is empty)
/// in `spec.prefix` and `spec.suffix`.
///
/// The resulting selection covers the wrapped text only, never the markers, so
/// a placeholder can be overtyped right away. Offsets past the end of
/// `document` are clamped.
TransformResult wrapSelection(std::string_view document, SelectionRange range, const TransformSpec &spec);

// Collapses every "\r\n" into "\n". Lone '\r' characters are kept.
std::string normalizeLineEndings(std::string_view text);

// Number of code points in UTF-8 `text`; continuation bytes are not counted.
std::size_t codePointCount(std::string_view text) noexcept;

// Byte offset at which code point `index` starts, text.size() past the end.
std::size_t byteOffset(std::string_view text, std::size_t index) noexcept;

} // namespace taskpad::details
