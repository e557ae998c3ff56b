#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifndef Uses_TKeys
#define Uses_TKeys
#endif
#ifndef Uses_TStatusItem
#define Uses_TStatusItem
#endif
#ifndef Uses_TMenuItem
#define Uses_TMenuItem
#endif

#include <tvision/tv.h>

namespace taskpad::hotkeys
{

struct KeyBinding
{
    std::uint16_t command = 0;
    TKey key{};
    std::string display; // Human readable label such as "Ctrl-B".
};

struct Scheme
{
    std::string_view id;
    std::string_view displayName;
    std::string_view description;
    std::span<const KeyBinding> bindings;
};

struct CommandLabel
{
    std::uint16_t command = 0;
    std::string_view label;
};

void registerSchemes(std::span<const Scheme> schemes);

// Registers the built-in "linux" and "mac" schemes once, then activates the
// platform default.
void registerDefaultSchemes();

// registerDefaultSchemes() followed by the preferred scheme from hotkeys.json
// and the TASKPAD_HOTKEY_SCHEME environment variable.
void init();

bool setActiveScheme(std::string_view id);

std::string_view activeScheme();

std::string defaultSchemeId();

std::vector<std::pair<std::string, std::string>> availableSchemes();

const KeyBinding *lookup(std::uint16_t command) noexcept;

TKey key(std::uint16_t command) noexcept;

std::string displayText(std::uint16_t command);

std::string statusLabel(std::uint16_t command, std::string_view action);

void configureStatusItem(TStatusItem &item, std::string_view action);

void configureMenuItem(TMenuItem &item);

// Consumes --hotkeys=<id> and --hotkeys <id> from argv.
void applyCommandLineScheme(int &argc, char **argv);

void registerCommandLabels(std::span<const CommandLabel> labels);

std::string commandLabel(std::uint16_t command);

// Reads the "custom" scheme and the preferred scheme from hotkeys.json under
// the config root (or $TASKPAD_HOTKEYS_CONFIG). The custom scheme starts as a
// copy of its base scheme. False when the file is missing or unreadable.
bool loadCustomBindings();

std::string formatKey(TKey key);

} // namespace taskpad::hotkeys
