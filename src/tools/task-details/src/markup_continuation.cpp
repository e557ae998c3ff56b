#include "taskpad/details/markup_continuation.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace taskpad::details
{
namespace
{

// CommonMark caps ordered list markers at nine digits, which also keeps the
// next ordinal well inside a long.
constexpr std::size_t kMaxOrdinalDigits = 9;

bool isBlank(std::string_view text)
{
    for (char ch : text)
    {
        if (ch != ' ' && ch != '\t')
            return false;
    }
    return true;
}

} // namespace

LinePattern analyzeLinePattern(std::string_view line)
{
    LinePattern pattern;
    std::size_t pos = 0;
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t'))
        ++pos;
    pattern.indent = std::string(line.substr(0, pos));
    std::size_t blockStart = pos;
    while (pos < line.size() && line[pos] == '>')
    {
        ++pos;
        if (pos < line.size() && line[pos] == ' ')
            ++pos;
    }
    pattern.blockquote = std::string(line.substr(blockStart, pos - blockStart));
    pattern.markerStart = pos;
    std::size_t markerEnd = pos;
    if (pos < line.size())
    {
        char ch = line[pos];
        const bool spaced = pos + 1 < line.size() && (line[pos + 1] == ' ' || line[pos + 1] == '\t');
        if ((ch == '-' || ch == '*' || ch == '+') && (spaced || pos + 1 == line.size()))
        {
            pattern.hasBullet = true;
            pattern.bulletChar = ch;
            markerEnd = pos + 1;
            while (markerEnd < line.size() && (line[markerEnd] == ' ' || line[markerEnd] == '\t'))
                ++markerEnd;
            if (markerEnd + 2 < line.size() && line[markerEnd] == '[' && line[markerEnd + 2] == ']')
            {
                pattern.hasTask = true;
                markerEnd += 3;
                if (markerEnd < line.size() && (line[markerEnd] == ' ' || line[markerEnd] == '\t'))
                    ++markerEnd;
            }
        }
        else if (std::isdigit(static_cast<unsigned char>(ch)))
        {
            std::size_t digitsEnd = pos;
            while (digitsEnd < line.size() && std::isdigit(static_cast<unsigned char>(line[digitsEnd])))
                ++digitsEnd;
            if (digitsEnd - pos <= kMaxOrdinalDigits && digitsEnd < line.size() &&
                (line[digitsEnd] == '.' || line[digitsEnd] == ')'))
            {
                pattern.orderedNumber = std::strtol(std::string(line.substr(pos, digitsEnd - pos)).c_str(), nullptr, 10);
                pattern.orderedDelimiter = line[digitsEnd];
                markerEnd = digitsEnd + 1;
                while (markerEnd < line.size() && (line[markerEnd] == ' ' || line[markerEnd] == '\t'))
                    ++markerEnd;
                pattern.hasOrdered = true;
            }
        }
    }
    pattern.markerEnd = markerEnd;
    return pattern;
}

ContinuationPlan planContinuation(std::string_view line, std::size_t caret)
{
    ContinuationPlan plan;
    const LinePattern pattern = analyzeLinePattern(line);
    const bool listItem = pattern.hasBullet || pattern.hasOrdered || pattern.hasTask;
    if (!listItem && pattern.blockquote.empty())
        return plan;
    if (caret < pattern.markerEnd)
        return plan;

    const bool emptyItem = isBlank(line.substr(pattern.markerEnd));
    if (emptyItem)
    {
        // Enter on an empty item ends the list (or quote) instead of
        // repeating the marker.
        plan.action = ContinuationPlan::Action::EndList;
        plan.removeFrom = listItem ? pattern.indent.size() + pattern.blockquote.size() : pattern.indent.size();
        plan.removeTo = line.size();
        return plan;
    }

    std::string marker;
    if (pattern.hasTask)
        marker = std::string(1, pattern.bulletChar) + " [ ] ";
    else if (pattern.hasBullet)
        marker = std::string(1, pattern.bulletChar) + " ";
    else if (pattern.hasOrdered)
        marker = std::to_string(pattern.orderedNumber + 1) + pattern.orderedDelimiter + " ";

    std::string quote = pattern.blockquote;
    if (!quote.empty() && quote.back() != ' ')
        quote.push_back(' ');

    plan.action = ContinuationPlan::Action::Continue;
    plan.prefix = pattern.indent + quote + marker;
    return plan;
}

std::optional<TransformResult> continueMarkupAt(std::string_view document, std::size_t caret)
{
    const std::size_t caretByte = byteOffset(document, caret);
    std::size_t lineStart = 0;
    if (caretByte > 0)
    {
        const std::size_t previousBreak = document.rfind('\n', caretByte - 1);
        if (previousBreak != std::string_view::npos)
            lineStart = previousBreak + 1;
    }
    std::size_t lineEnd = document.find('\n', caretByte);
    if (lineEnd == std::string_view::npos)
        lineEnd = document.size();

    const ContinuationPlan plan =
        planContinuation(document.substr(lineStart, lineEnd - lineStart), caretByte - lineStart);

    TransformResult result;
    switch (plan.action)
    {
    case ContinuationPlan::Action::None:
        return std::nullopt;
    case ContinuationPlan::Action::EndList:
    {
        const std::size_t fromByte = lineStart + plan.removeFrom;
        const std::size_t toByte = lineStart + plan.removeTo;
        result.change.from = codePointCount(document.substr(0, fromByte));
        result.change.to = result.change.from + codePointCount(document.substr(fromByte, toByte - fromByte));
        result.document.append(document.substr(0, fromByte));
        result.document.append(document.substr(toByte));
        result.selection = SelectionRange::caret(result.change.from);
        return result;
    }
    case ContinuationPlan::Action::Continue:
        break;
    }

    result.change.from = caret;
    result.change.to = caret;
    result.change.insert = "\n" + plan.prefix;
    result.document.append(document.substr(0, caretByte));
    result.document.append(result.change.insert);
    result.document.append(document.substr(caretByte));
    result.selection = SelectionRange::caret(caret + codePointCount(result.change.insert));
    return result;
}

} // namespace taskpad::details
