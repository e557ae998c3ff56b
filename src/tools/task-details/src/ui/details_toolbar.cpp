#include "details_toolbar.hpp"

#include "taskpad/commands/task_details.hpp"
#include "taskpad/details/details_keymap.hpp"
#include "taskpad/hotkeys.hpp"

#include <algorithm>
#include <initializer_list>

#define cpDetailsToolbar "\x06\x07"

namespace taskpad::details
{
namespace
{

namespace cmd = commands::details;

std::string hintFor(std::uint16_t command)
{
    const std::string key = hotkeys::displayText(command);
    const std::string label = hotkeys::commandLabel(command);
    if (key.empty())
        return {};
    return key + " " + label;
}

} // namespace

DetailsToolbar::DetailsToolbar(const TRect &bounds)
    : TView(bounds)
{
    options |= ofSelectable | ofFirstClick;
    growMode = gfGrowHiX;
    refreshLabels();
}

TPalette &DetailsToolbar::getPalette() const
{
    static TPalette palette(cpDetailsToolbar, sizeof(cpDetailsToolbar) - 1);
    return palette;
}

void DetailsToolbar::refreshLabels()
{
    buttons_ = {
        {cmd::WrapBold, "[B]"},
        {cmd::WrapItalic, "[I]"},
        {cmd::WrapLink, "[Link]"},
    };
    int x = 1;
    for (auto &button : buttons_)
    {
        button.start = x;
        button.width = static_cast<int>(button.label.size());
        x += button.width + 1;
    }

    hints_.clear();
    for (std::uint16_t command : {cmd::CommitAndClose, cmd::Discard})
    {
        const std::string hint = hintFor(command);
        if (hint.empty())
            continue;
        if (!hints_.empty())
            hints_ += "  ";
        hints_ += hint;
    }
    drawView();
}

void DetailsToolbar::draw()
{
    const TColorAttr normal = getColor(1);
    const TColorAttr highlight = getColor(2);
    TDrawBuffer buffer;
    buffer.moveChar(0, ' ', normal, size.x);
    for (std::size_t i = 0; i < buttons_.size(); ++i)
    {
        const bool active = (state & sfFocused) != 0 && i == focused_;
        buffer.moveStr(buttons_[i].start, TStringView(buttons_[i].label), active ? highlight : normal);
    }
    if (!hints_.empty())
    {
        const int width = strwidth(TStringView(hints_));
        const int x = std::max(buttons_.empty() ? 1 : buttons_.back().start + buttons_.back().width + 2, size.x - width - 1);
        buffer.moveStr(x, TStringView(hints_), normal);
    }
    writeLine(0, 0, size.x, 1, buffer);
}

void DetailsToolbar::handleEvent(TEvent &event)
{
    TView::handleEvent(event);

    if (event.what == evMouseDown)
    {
        const TPoint local = makeLocal(event.mouse.where);
        const int index = buttonAt(local.x);
        if (index >= 0)
            press(static_cast<std::size_t>(index));
        clearEvent(event);
    }
    else if (event.what == evKeyDown)
    {
        TKey pressed(event.keyDown.keyCode, event.keyDown.controlKeyState);
        if (std::uint16_t command = DetailsKeymap::resolve(pressed); command != 0 && command != cmd::ContinueMarkup)
        {
            message(owner, evCommand, command, this);
            clearEvent(event);
            return;
        }
        switch (event.keyDown.keyCode)
        {
        case kbLeft:
            focused_ = focused_ == 0 ? buttons_.size() - 1 : focused_ - 1;
            drawView();
            clearEvent(event);
            break;
        case kbRight:
            focused_ = (focused_ + 1) % buttons_.size();
            drawView();
            clearEvent(event);
            break;
        case kbEnter:
            press(focused_);
            clearEvent(event);
            break;
        default:
            if (event.keyDown.charScan.charCode == ' ')
            {
                press(focused_);
                clearEvent(event);
            }
            break;
        }
    }
}

int DetailsToolbar::buttonAt(int x) const
{
    for (std::size_t i = 0; i < buttons_.size(); ++i)
    {
        if (x >= buttons_[i].start && x < buttons_[i].start + buttons_[i].width)
            return static_cast<int>(i);
    }
    return -1;
}

void DetailsToolbar::press(std::size_t index)
{
    if (index >= buttons_.size())
        return;
    focused_ = index;
    message(owner, evCommand, buttons_[index].command, this);
}

} // namespace taskpad::details
