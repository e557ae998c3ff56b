#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taskpad::details
{

enum class PreviewTarget
{
    Text,
    Link,
    TaskCheckbox
};

struct PreviewSpan
{
    PreviewTarget kind = PreviewTarget::Text;
    std::size_t start = 0; // byte offsets into the line, [start, end)
    std::size_t end = 0;
    std::string url;
};

struct PreviewHit
{
    PreviewTarget target = PreviewTarget::Text;
    std::string url;
};

// Interactive spans of one preview line: inline links, autolinks, bare
// http(s) URLs and a leading task checkbox marker. Sorted by start.
std::vector<PreviewSpan> scanInteractiveSpans(std::string_view line);

// Byte offset of the character drawn at `column`, counting East Asian wide
// characters as two columns. Returns line.size() past the end.
std::size_t offsetForColumn(std::string_view line, std::size_t column);

// Classifies the character at (row, column) of the rendered preview text.
PreviewHit hitTest(std::string_view text, std::size_t row, std::size_t column);

// Returns the `row`th line of `text` (without the line break).
std::string_view lineAt(std::string_view text, std::size_t row);

} // namespace taskpad::details
