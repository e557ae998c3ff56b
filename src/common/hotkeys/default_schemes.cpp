#include "taskpad/hotkeys.hpp"

#include "taskpad/commands/task_details.hpp"

#include <tvision/views.h>
#include <tvision/tkeys.h>

namespace taskpad::hotkeys
{

namespace
{

namespace details = commands::details;

// Ctrl-I is indistinguishable from Tab on most terminals, so italic lives on
// Alt-I here.
const KeyBinding kLinuxBindings[] = {
    {cmQuit, TKey(kbAltX), "Alt-X"},
    {cmClose, TKey(kbAltF3), "Alt-F3"},
    {cmNext, TKey(kbF6), "F6"},

    {details::WrapBold, TKey(kbCtrlB), "Ctrl-B"},
    {details::WrapItalic, TKey(kbAltI), "Alt-I"},
    {details::WrapLink, TKey(kbCtrlK), "Ctrl-K"},
    {details::CommitAndClose, TKey(kbCtrlEnter), "Ctrl-Enter"},
    {details::Discard, TKey(kbEsc), "Esc"},
    {details::ContinueMarkup, TKey(kbEnter), "Enter"},
    {details::Reload, TKey(kbF5), "F5"},
    {details::About, TKey(kbF1), "F1"},
};

// Terminal.app swallows most Alt combinations and Ctrl-Enter.
const KeyBinding kMacBindings[] = {
    {cmQuit, TKey(kbCtrlQ), "Ctrl-Q"},
    {cmClose, TKey(kbCtrlW), "Ctrl-W"},
    {cmNext, TKey(kbF6), "F6"},

    {details::WrapBold, TKey(kbCtrlB), "Ctrl-B"},
    {details::WrapItalic, TKey(kbCtrlT), "Ctrl-T"},
    {details::WrapLink, TKey(kbCtrlK), "Ctrl-K"},
    {details::CommitAndClose, TKey(kbCtrlS), "Ctrl-S"},
    {details::Discard, TKey(kbEsc), "Esc"},
    {details::ContinueMarkup, TKey(kbEnter), "Enter"},
    {details::Reload, TKey(kbF5), "F5"},
    {details::About, TKey(kbF1), "F1"},
};

const Scheme kBuiltInSchemes[] = {
    {"linux", "Linux", "Turbo Vision style shortcuts", kLinuxBindings},
    {"mac", "macOS", "Shortcuts that survive macOS terminals", kMacBindings},
};

const CommandLabel kCommandLabels[] = {
    {details::WrapBold, "Bold"},
    {details::WrapItalic, "Italic"},
    {details::WrapLink, "Link"},
    {details::CommitAndClose, "Save"},
    {details::Discard, "Cancel"},
    {details::ContinueMarkup, "Continue List"},
    {details::Reload, "Reload"},
    {details::About, "About"},
    {cmQuit, "Quit"},
};

} // namespace

void registerBuiltinHotkeySchemes()
{
    registerSchemes(kBuiltInSchemes);
    registerCommandLabels(kCommandLabels);
}

} // namespace taskpad::hotkeys
