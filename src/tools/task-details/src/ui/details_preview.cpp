#include "details_preview.hpp"

#include "taskpad/commands/task_details.hpp"
#include "taskpad/details/mode_controller.hpp"

#include <algorithm>
#include <utility>

#define cpDetailsPreview "\x06\x07"

namespace taskpad::details
{

DetailsPreview::DetailsPreview(const TRect &bounds, std::string emptyPlaceholder)
    : TView(bounds), emptyPlaceholder_(std::move(emptyPlaceholder))
{
    options |= ofSelectable | ofFirstClick;
    growMode = gfGrowHiX | gfGrowHiY;
}

TPalette &DetailsPreview::getPalette() const
{
    static TPalette palette(cpDetailsPreview, sizeof(cpDetailsPreview) - 1);
    return palette;
}

void DetailsPreview::setValue(const std::string &value)
{
    value_ = value;
    rerender();
}

void DetailsPreview::setRenderer(Renderer renderer)
{
    renderer_ = std::move(renderer);
    rerender();
}

void DetailsPreview::rerender()
{
    rendered_ = renderer_ && !value_.empty() ? renderer_(value_) : value_;
    topLine_ = std::clamp(topLine_, 0, std::max(0, lineCount() - 1));
    drawView();
}

bool DetailsPreview::isBlank() const
{
    return rendered_.find_first_not_of(" \t\r\n") == std::string::npos;
}

int DetailsPreview::lineCount() const
{
    return static_cast<int>(std::count(rendered_.begin(), rendered_.end(), '\n')) + 1;
}

void DetailsPreview::draw()
{
    const TColorAttr normal = getColor(1);
    const TColorAttr link = getColor(2);
    TColorAttr dimmed = normal;
    ::setFore(dimmed, TColorBIOS(0x8));

    TDrawBuffer buffer;
    if (isBlank())
    {
        for (int y = 0; y < size.y; ++y)
        {
            buffer.moveChar(0, ' ', normal, size.x);
            if (y == 0)
                buffer.moveStr(1, TStringView(emptyPlaceholder_), dimmed);
            writeLine(0, y, size.x, 1, buffer);
        }
        return;
    }

    for (int y = 0; y < size.y; ++y)
    {
        buffer.moveChar(0, ' ', normal, size.x);
        const std::string_view line = lineAt(rendered_, static_cast<std::size_t>(topLine_ + y));
        if (!line.empty())
        {
            std::size_t drawn = 0;
            int x = 0;
            for (const auto &span : scanInteractiveSpans(line))
            {
                const TStringView before(line.data() + drawn, span.start - drawn);
                x += buffer.moveStr(x, before, normal);
                const TStringView marked(line.data() + span.start, span.end - span.start);
                x += buffer.moveStr(x, marked, span.kind == PreviewTarget::Link ? link : normal);
                drawn = span.end;
            }
            buffer.moveStr(x, TStringView(line.data() + drawn, line.size() - drawn), normal);
        }
        writeLine(0, y, size.x, 1, buffer);
    }
}

void DetailsPreview::handleEvent(TEvent &event)
{
    TView::handleEvent(event);

    if (event.what == evMouseDown)
    {
        const TPoint local = makeLocal(event.mouse.where);
        const std::size_t row = static_cast<std::size_t>(topLine_ + local.y);
        const PreviewHit hit = isBlank() ? PreviewHit{} : hitTest(rendered_, row, static_cast<std::size_t>(local.x));
        if (hit.target == PreviewTarget::Link)
        {
            std::string url = hit.url;
            message(owner, evBroadcast, commands::details::OpenLink, &url);
        }
        else
        {
            requestActivation(ActivationSource::Pointer, hit.target);
        }
        clearEvent(event);
    }
    else if (event.what == evMouseWheel)
    {
        if (event.mouse.wheel == mwUp)
            scrollBy(-1);
        else if (event.mouse.wheel == mwDown)
            scrollBy(1);
        clearEvent(event);
    }
    else if (event.what == evKeyDown)
    {
        switch (event.keyDown.keyCode)
        {
        case kbEnter:
            requestActivation(ActivationSource::Keyboard, PreviewTarget::Text);
            clearEvent(event);
            break;
        case kbUp:
            scrollBy(-1);
            clearEvent(event);
            break;
        case kbDown:
            scrollBy(1);
            clearEvent(event);
            break;
        default:
            if (event.keyDown.charScan.charCode == ' ')
            {
                requestActivation(ActivationSource::Keyboard, PreviewTarget::Text);
                clearEvent(event);
            }
            break;
        }
    }
}

void DetailsPreview::requestActivation(ActivationSource source, PreviewTarget target)
{
    ActivationRequest request{source, target};
    message(owner, evBroadcast, commands::details::Activate, &request);
}

void DetailsPreview::scrollBy(int delta)
{
    const int next = std::clamp(topLine_ + delta, 0, std::max(0, lineCount() - size.y));
    if (next != topLine_)
    {
        topLine_ = next;
        drawView();
    }
}

} // namespace taskpad::details
