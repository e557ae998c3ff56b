#include "taskpad/details/selection_transform.hpp"

namespace taskpad::details
{

namespace
{

bool isContinuationByte(char ch) noexcept
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

} // namespace

TransformResult wrapSelection(std::string_view document, SelectionRange range, const TransformSpec &spec)
{
    const std::size_t length = codePointCount(document);
    const std::size_t from = std::min(range.from(), length);
    const std::size_t to = std::min(range.to(), length);
    const std::size_t fromByte = byteOffset(document, from);
    const std::size_t toByte = byteOffset(document, to);

    std::string_view selected = document.substr(fromByte, toByte - fromByte);
    if (selected.empty())
        selected = spec.placeholder;

    TransformResult result;
    result.change.from = from;
    result.change.to = to;
    result.change.insert.reserve(spec.prefix.size() + selected.size() + spec.suffix.size());
    result.change.insert.append(spec.prefix);
    result.change.insert.append(selected);
    result.change.insert.append(spec.suffix);

    result.document.reserve(document.size() - (toByte - fromByte) + result.change.insert.size());
    result.document.append(document.substr(0, fromByte));
    result.document.append(result.change.insert);
    result.document.append(document.substr(toByte));

    const std::size_t innerStart = from + codePointCount(spec.prefix);
    result.selection = {innerStart, innerStart + codePointCount(selected)};
    return result;
}

std::string normalizeLineEndings(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            continue;
        out.push_back(text[i]);
    }
    return out;
}

std::size_t codePointCount(std::string_view text) noexcept
{
    std::size_t count = 0;
    for (char ch : text)
    {
        if (!isContinuationByte(ch))
            ++count;
    }
    return count;
}

std::size_t byteOffset(std::string_view text, std::size_t index) noexcept
{
    std::size_t seen = 0;
    for (std::size_t pos = 0; pos < text.size(); ++pos)
    {
        if (isContinuationByte(text[pos]))
            continue;
        if (seen == index)
            return pos;
        ++seen;
    }
    return text.size();
}

} // namespace taskpad::details
