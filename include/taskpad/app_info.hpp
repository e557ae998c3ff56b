#pragma once

#include <span>
#include <string>
#include <string_view>

namespace taskpad::appinfo
{

struct ToolInfo
{
    std::string_view id;
    std::string_view executable;
    std::string_view displayName;
    std::string_view shortDescription;
    std::string_view aboutDescription;
};

std::span<const ToolInfo> tools() noexcept;

const ToolInfo *findTool(std::string_view id) noexcept;

// Throws std::runtime_error for an unknown id.
const ToolInfo &requireTool(std::string_view id);

struct AboutInfo
{
    std::string_view applicationName = "Taskpad";
    std::string_view version;
    std::string_view buildDate = __DATE__;
    std::string_view buildTime = __TIME__;
};

// Paragraphs separated by blank lines, ready for a message box.
std::string buildAboutMessage(const ToolInfo &tool, const AboutInfo &about);

} // namespace taskpad::appinfo
