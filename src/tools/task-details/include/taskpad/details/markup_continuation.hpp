#pragma once

#include "taskpad/details/selection_transform.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace taskpad::details
{

struct LinePattern
{
    std::string indent;
    std::string blockquote;
    std::size_t markerStart = 0;
    std::size_t markerEnd = 0;
    bool hasBullet = false;
    bool hasOrdered = false;
    bool hasTask = false;
    char bulletChar = '-';
    long orderedNumber = 0;
    char orderedDelimiter = '.';
};

LinePattern analyzeLinePattern(std::string_view line);

struct ContinuationPlan
{
    enum class Action
    {
        None,     // not a list or quote line, Enter keeps its default meaning
        Continue, // insert a line break followed by `prefix`
        EndList   // remove [removeFrom, removeTo) of the line, no line break
    };

    Action action = Action::None;
    std::string prefix;
    std::size_t removeFrom = 0;
    std::size_t removeTo = 0;
};

// `caret` is the byte offset of the caret within `line`.
ContinuationPlan planContinuation(std::string_view line, std::size_t caret);

// The edit Enter makes at `caret` (a code point offset into `document`), or
// nothing when Enter keeps its default meaning. An empty item loses its
// marker and the caret stays on that line.
std::optional<TransformResult> continueMarkupAt(std::string_view document, std::size_t caret);

} // namespace taskpad::details
