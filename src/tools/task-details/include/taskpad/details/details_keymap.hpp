#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "taskpad/hotkeys.hpp"

namespace taskpad::details
{

struct KeymapEntry
{
    std::uint16_t command = 0;
    std::string_view name;
};

/// Keys the details editor claims before the memo's own bindings.
///
/// The table is flat and ordered; the key for each entry comes from the
/// active hotkey scheme, so rebinding a command in hotkeys.json moves it
/// here as well.
class DetailsKeymap
{
public:
    static std::span<const KeymapEntry> entries() noexcept;

    // Command bound to `pressed`, or 0 when the key is not claimed.
    static std::uint16_t resolve(TKey pressed) noexcept;
};

} // namespace taskpad::details
