#include "taskpad/app_info.hpp"

#include <algorithm>
#include <array>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace taskpad::appinfo
{
    namespace
    {

        constexpr std::array<ToolInfo, 1> kTools{{
            ToolInfo{
                "taskpad-details",
                "taskpad-details",
                "Task Details",
                "Edit free-form task details inline, in the terminal.",
                "Task Details shows each task's notes as a read-only preview until you click or press Enter on it. "
                "The notes then turn into an editor with Markdown helpers for bold, italic and links. Leaving the "
                "editor saves the text only when it actually changed, and Esc throws the edit away."},
        }};

    } // namespace

    std::span<const ToolInfo> tools() noexcept
    {
        return std::span<const ToolInfo>{kTools};
    }

    const ToolInfo *findTool(std::string_view id) noexcept
    {
        auto it = std::find_if(kTools.begin(), kTools.end(), [&](const ToolInfo &info)
                               { return info.id == id; });
        if (it == kTools.end())
            return nullptr;
        return &*it;
    }

    const ToolInfo &requireTool(std::string_view id)
    {
        if (const ToolInfo *info = findTool(id))
            return *info;
        throw std::runtime_error("Unknown tool id: " + std::string{id});
    }

    std::string buildAboutMessage(const ToolInfo &tool, const AboutInfo &about)
    {
        std::vector<std::string> paragraphs;
        {
            std::ostringstream headerOut;
            headerOut << about.applicationName;
            if (!tool.displayName.empty())
                headerOut << " - " << tool.displayName;
            paragraphs.emplace_back(headerOut.str());
        }

        if (!tool.aboutDescription.empty())
            paragraphs.emplace_back(tool.aboutDescription);

        if (!about.version.empty())
        {
            std::ostringstream versionOut;
            versionOut << "Version: " << about.version;
            paragraphs.emplace_back(versionOut.str());
        }

        if (!about.buildDate.empty())
        {
            std::ostringstream buildOut;
            buildOut << "Build: " << about.buildDate;
            if (!about.buildTime.empty())
                buildOut << ' ' << about.buildTime;
            paragraphs.emplace_back(buildOut.str());
        }

        std::ostringstream out;
        for (std::size_t i = 0; i < paragraphs.size(); ++i)
        {
            if (i > 0)
                out << "\n\n";
            out << paragraphs[i];
        }
        return out.str();
    }

} // namespace taskpad::appinfo
