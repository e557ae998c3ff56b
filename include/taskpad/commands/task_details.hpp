#pragma once

#include <cstdint>

namespace taskpad::commands::details
{

// Editing surface commands, resolved through the details key table.
inline constexpr std::uint16_t WrapBold = 3020;
inline constexpr std::uint16_t WrapItalic = 3021;
inline constexpr std::uint16_t WrapLink = 3022;
inline constexpr std::uint16_t CommitAndClose = 3030;
inline constexpr std::uint16_t Discard = 3031;
inline constexpr std::uint16_t ContinueMarkup = 3032;

// Host level commands.
inline constexpr std::uint16_t Activate = 3040;
inline constexpr std::uint16_t OpenLink = 3041;
inline constexpr std::uint16_t Reload = 3050;
inline constexpr std::uint16_t About = 3090;

} // namespace taskpad::commands::details
