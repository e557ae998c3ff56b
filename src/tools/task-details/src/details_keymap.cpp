#include "taskpad/details/details_keymap.hpp"

#include "taskpad/commands/task_details.hpp"

namespace taskpad::details
{
namespace
{

namespace cmd = commands::details;

const KeymapEntry kEntries[] = {
    {cmd::WrapBold, "wrap-bold"},
    {cmd::WrapItalic, "wrap-italic"},
    {cmd::WrapLink, "wrap-link"},
    {cmd::CommitAndClose, "commit-and-close"},
    {cmd::Discard, "discard"},
    {cmd::ContinueMarkup, "continue-markup"},
};

} // namespace

std::span<const KeymapEntry> DetailsKeymap::entries() noexcept
{
    return kEntries;
}

std::uint16_t DetailsKeymap::resolve(TKey pressed) noexcept
{
    if (pressed.code == kbNoKey)
        return 0;
    for (const auto &entry : kEntries)
    {
        const TKey bound = hotkeys::key(entry.command);
        if (bound.code != kbNoKey && bound == pressed)
            return entry.command;
    }
    return 0;
}

} // namespace taskpad::details
