#include "taskpad/details/preview_links.hpp"

#include <algorithm>
#include <cstdint>

namespace taskpad::details
{
namespace
{

bool isWhitespace(char ch) noexcept
{
    return ch == ' ' || ch == '\t';
}

bool startsWith(std::string_view text, std::size_t pos, std::string_view prefix) noexcept
{
    return text.size() - pos >= prefix.size() && text.compare(pos, prefix.size(), prefix) == 0;
}

bool startsUrl(std::string_view text, std::size_t pos) noexcept
{
    return startsWith(text, pos, "https://") || startsWith(text, pos, "http://");
}

bool overlaps(const std::vector<PreviewSpan> &spans, std::size_t pos) noexcept
{
    return std::any_of(spans.begin(), spans.end(), [&](const PreviewSpan &span) {
        return pos >= span.start && pos < span.end;
    });
}

std::string trimmed(std::string_view view)
{
    std::size_t first = 0;
    while (first < view.size() && isWhitespace(view[first]))
        ++first;
    std::size_t last = view.size();
    while (last > first && isWhitespace(view[last - 1]))
        --last;
    return std::string(view.substr(first, last - first));
}

void scanTaskCheckbox(std::string_view line, std::vector<PreviewSpan> &spans)
{
    std::size_t pos = 0;
    while (pos < line.size() && isWhitespace(line[pos]))
        ++pos;
    while (pos < line.size() && line[pos] == '>')
    {
        ++pos;
        while (pos < line.size() && isWhitespace(line[pos]))
            ++pos;
    }
    if (pos >= line.size() || (line[pos] != '-' && line[pos] != '*' && line[pos] != '+'))
        return;
    ++pos;
    if (pos >= line.size() || line[pos] != ' ')
        return;
    ++pos;
    if (line.size() - pos < 3 || line[pos] != '[' || line[pos + 2] != ']')
        return;
    const char mark = line[pos + 1];
    if (mark != ' ' && mark != 'x' && mark != 'X')
        return;
    spans.push_back({PreviewTarget::TaskCheckbox, pos, pos + 3, {}});
}

void scanInlineLinks(std::string_view line, std::vector<PreviewSpan> &spans)
{
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] != '[')
            continue;
        if (overlaps(spans, i))
            continue;

        std::size_t depth = 1;
        std::size_t j = i + 1;
        while (j < line.size() && depth > 0)
        {
            if (line[j] == '[')
                ++depth;
            else if (line[j] == ']')
                --depth;
            ++j;
        }
        if (depth != 0 || j >= line.size() || line[j] != '(')
            continue;

        std::size_t k = j + 1;
        const std::size_t urlStart = k;
        int parenDepth = 1;
        while (k < line.size() && parenDepth > 0)
        {
            if (line[k] == '(')
                ++parenDepth;
            else if (line[k] == ')')
                --parenDepth;
            ++k;
        }
        if (parenDepth != 0)
            continue;

        std::string url = trimmed(line.substr(urlStart, k - 1 - urlStart));
        if (url.size() >= 2 && url.front() == '<' && url.back() == '>')
            url = url.substr(1, url.size() - 2);
        // Images render as images, not as clickable links.
        const bool image = i > 0 && line[i - 1] == '!';
        if (!image)
            spans.push_back({PreviewTarget::Link, i, k, url});
        i = k - 1;
    }
}

void scanAutolinks(std::string_view line, std::vector<PreviewSpan> &spans)
{
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (overlaps(spans, i))
            continue;
        if (line[i] == '<' && startsUrl(line, i + 1))
        {
            const std::size_t close = line.find('>', i + 1);
            if (close != std::string_view::npos)
            {
                spans.push_back({PreviewTarget::Link, i, close + 1, std::string(line.substr(i + 1, close - i - 1))});
                i = close;
            }
            continue;
        }
        if (startsUrl(line, i) && (i == 0 || isWhitespace(line[i - 1]) || line[i - 1] == '('))
        {
            std::size_t end = i;
            while (end < line.size() && !isWhitespace(line[end]) && line[end] != '<' && line[end] != '>')
                ++end;
            // Trailing sentence punctuation is not part of the URL.
            while (end > i && (line[end - 1] == '.' || line[end - 1] == ',' || line[end - 1] == ')' ||
                               line[end - 1] == ';' || line[end - 1] == ':'))
                --end;
            spans.push_back({PreviewTarget::Link, i, end, std::string(line.substr(i, end - i))});
            i = end - 1;
        }
    }
}

std::uint32_t decodeAt(std::string_view text, std::size_t pos, std::size_t &length) noexcept
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t expected = 1;
    std::uint32_t cp = lead;
    if (lead >= 0xF0)
    {
        expected = 4;
        cp = lead & 0x07;
    }
    else if (lead >= 0xE0)
    {
        expected = 3;
        cp = lead & 0x0F;
    }
    else if (lead >= 0xC0)
    {
        expected = 2;
        cp = lead & 0x1F;
    }
    if (pos + expected > text.size())
    {
        length = 1;
        return lead;
    }
    for (std::size_t i = 1; i < expected; ++i)
        cp = (cp << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
    length = expected;
    return cp;
}

bool isWide(std::uint32_t cp) noexcept
{
    return (cp >= 0x1100 && cp <= 0x115F) || (cp >= 0x2E80 && cp <= 0xA4CF) ||
           (cp >= 0xAC00 && cp <= 0xD7A3) || (cp >= 0xF900 && cp <= 0xFAFF) ||
           (cp >= 0xFE30 && cp <= 0xFE4F) || (cp >= 0xFF00 && cp <= 0xFF60) ||
           (cp >= 0xFFE0 && cp <= 0xFFE6) || (cp >= 0x1F300 && cp <= 0x1FAFF) ||
           (cp >= 0x20000 && cp <= 0x3FFFD);
}

} // namespace

std::vector<PreviewSpan> scanInteractiveSpans(std::string_view line)
{
    std::vector<PreviewSpan> spans;
    scanTaskCheckbox(line, spans);
    scanInlineLinks(line, spans);
    scanAutolinks(line, spans);
    std::sort(spans.begin(), spans.end(), [](const PreviewSpan &a, const PreviewSpan &b) {
        return a.start < b.start;
    });
    return spans;
}

std::size_t offsetForColumn(std::string_view line, std::size_t column)
{
    std::size_t pos = 0;
    std::size_t x = 0;
    while (pos < line.size())
    {
        std::size_t length = 1;
        const std::uint32_t cp = decodeAt(line, pos, length);
        const std::size_t width = isWide(cp) ? 2 : 1;
        if (column < x + width)
            return pos;
        x += width;
        pos += length;
    }
    return line.size();
}

std::string_view lineAt(std::string_view text, std::size_t row)
{
    std::size_t start = 0;
    for (std::size_t i = 0; i < row; ++i)
    {
        const std::size_t next = text.find('\n', start);
        if (next == std::string_view::npos)
            return {};
        start = next + 1;
    }
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos)
        end = text.size();
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r')
        line.remove_suffix(1);
    return line;
}

PreviewHit hitTest(std::string_view text, std::size_t row, std::size_t column)
{
    const std::string_view line = lineAt(text, row);
    const std::size_t offset = offsetForColumn(line, column);
    if (offset >= line.size())
        return {};
    for (const auto &span : scanInteractiveSpans(line))
    {
        if (offset >= span.start && offset < span.end)
            return {span.kind, span.url};
    }
    return {};
}

} // namespace taskpad::details
