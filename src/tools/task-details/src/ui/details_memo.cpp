#include "details_memo.hpp"

#include "taskpad/details/details_keymap.hpp"
#include "taskpad/details/markup_continuation.hpp"
#include "taskpad/details/selection_transform.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <optional>
#include <vector>

namespace taskpad::details
{
namespace
{

bool isContinuationByte(char ch) noexcept
{
    return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

} // namespace

DetailsMemo::DetailsMemo(const TRect &bounds, TScrollBar *vScroll, ushort bufSize)
    : TMemo(bounds, nullptr, vScroll, nullptr, bufSize)
{
    options |= ofFirstClick;
    growMode = gfGrowHiX | gfGrowHiY;
}

TPalette &DetailsMemo::getPalette() const
{
    return TEditor::getPalette();
}

void DetailsMemo::handleEvent(TEvent &event)
{
    if (event.what == evKeyDown && controller_ && controller_->isEditing())
    {
        TKey pressed(event.keyDown.keyCode, event.keyDown.controlKeyState);
        if (std::uint16_t command = DetailsKeymap::resolve(pressed))
        {
            if (controller_->runCommand(command) == KeyDisposition::Handled)
            {
                clearEvent(event);
                return;
            }
        }
    }

    TMemo::handleEvent(event);
    reportDraft();
}

void DetailsMemo::setState(ushort aState, Boolean enable)
{
    TMemo::setState(aState, enable);
    if ((aState & sfFocused) != 0 && !enable && controller_)
    {
        // TGroup clears its own focus before its current view's, so a group
        // that is still focused means focus moved to a sibling inside it.
        const bool insideSurface = owner != nullptr && (owner->state & sfFocused) != 0;
        controller_->blur(BlurEvent{insideSurface});
    }
}

bool DetailsMemo::setText(const std::string &value)
{
    const std::string encoded = encodeEditorText(value);
    if (encoded.size() > bufSize || encoded.size() > std::numeric_limits<ushort>::max())
        return false;
    std::vector<char> raw(sizeof(ushort) + std::max<std::size_t>(encoded.size(), 1));
    auto *memo = reinterpret_cast<TMemoData *>(raw.data());
    memo->length = static_cast<ushort>(encoded.size());
    if (memo->length > 0)
        std::memcpy(memo->buffer, encoded.data(), memo->length);
    TMemo::setData(memo);
    modified = False;
    return true;
}

std::size_t DetailsMemo::encodedSize(std::string_view text) noexcept
{
    std::size_t size = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            continue;
        ++size;
    }
    return size;
}

std::string DetailsMemo::text() const
{
    return readRange(0, bufLen);
}

SelectionRange DetailsMemo::selection() const
{
    const std::size_t start = textOffset(selStart);
    const std::size_t end = textOffset(selEnd);
    if (start == end)
        return SelectionRange::caret(textOffset(curPtr));
    // The caret sits at one end of the selection; that end is the head.
    if (curPtr == selStart)
        return {end, start};
    return {start, end};
}

void DetailsMemo::dispatch(const TextChange &change, SelectionRange selection)
{
    const std::string encoded = encodeEditorText(change.insert);
    lock();
    setSelect(bufferOffset(change.from), bufferOffset(change.to), False);
    if (!encoded.empty())
        insertText(encoded.c_str(), static_cast<uint>(encoded.size()), False);
    else if (hasSelection())
        deleteSelect();
    const uint anchor = bufferOffset(selection.anchor);
    const uint head = bufferOffset(selection.head);
    setSelect(std::min(anchor, head), std::max(anchor, head), Boolean(head < anchor));
    trackCursor(False);
    unlock();
    modified = False;
}

void DetailsMemo::placeCaretAtEnd()
{
    setCurPtr(bufLen, 0);
    trackCursor(False);
}

void DetailsMemo::requestFocus()
{
    if (owner)
        owner->select();
    select();
}

bool DetailsMemo::continueMarkup()
{
    if (hasSelection())
        return false;
    const std::optional<TransformResult> edit = continueMarkupAt(text(), selection().head);
    if (!edit)
        return false;
    dispatch(edit->change, edit->selection);
    return true;
}

std::string DetailsMemo::readRange(uint start, uint end) const
{
    auto *self = const_cast<DetailsMemo *>(this);
    std::string result;
    result.reserve(end > start ? end - start : 0);
    for (uint i = start; i < end && i < bufLen; ++i)
    {
        char ch = self->bufChar(i);
        if (ch == '\r')
        {
            if (i + 1 < end && i + 1 < bufLen && self->bufChar(i + 1) == '\n')
                ++i;
            result.push_back('\n');
        }
        else
        {
            result.push_back(ch);
        }
    }
    return result;
}

// The buffer holds UTF-8 with "\r" or "\r\n" line breaks; offsets handed to
// the controller count code points with every line break as one.
std::size_t DetailsMemo::textOffset(uint ptr) const
{
    auto *self = const_cast<DetailsMemo *>(this);
    std::size_t offset = 0;
    for (uint i = 0; i < ptr && i < bufLen; ++i)
    {
        const char ch = self->bufChar(i);
        if (ch == '\r' && i + 1 < ptr && i + 1 < bufLen && self->bufChar(i + 1) == '\n')
            ++i;
        else if (isContinuationByte(ch))
            continue;
        ++offset;
    }
    return offset;
}

uint DetailsMemo::bufferOffset(std::size_t offset) const
{
    auto *self = const_cast<DetailsMemo *>(this);
    uint ptr = 0;
    for (std::size_t i = 0; i < offset && ptr < bufLen; ++i)
    {
        if (self->bufChar(ptr) == '\r' && ptr + 1 < bufLen && self->bufChar(ptr + 1) == '\n')
            ++ptr;
        ++ptr;
        while (ptr < bufLen && isContinuationByte(self->bufChar(ptr)))
            ++ptr;
    }
    return ptr;
}

void DetailsMemo::reportDraft()
{
    if (!modified || !controller_)
        return;
    modified = False;
    controller_->draftChanged(text());
}

std::string DetailsMemo::encodeEditorText(std::string_view text)
{
    std::string encoded;
    encoded.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
            continue;
        encoded.push_back(text[i] == '\n' ? '\r' : text[i]);
    }
    return encoded;
}

} // namespace taskpad::details
