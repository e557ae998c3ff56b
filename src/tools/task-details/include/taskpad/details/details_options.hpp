#pragma once

#include "taskpad/details/selection_transform.hpp"
#include "taskpad/options.hpp"

#include <cstdint>
#include <string>

namespace taskpad::details
{

inline constexpr const char *kOptionBoldPlaceholder = "bold-placeholder";
inline constexpr const char *kOptionItalicPlaceholder = "italic-placeholder";
inline constexpr const char *kOptionLinkPlaceholder = "link-placeholder";
inline constexpr const char *kOptionLinkUrl = "link-url";
inline constexpr const char *kOptionEmptyPlaceholder = "empty-placeholder";
inline constexpr const char *kOptionExemptTaskCheckboxes = "exempt-task-checkboxes";
inline constexpr const char *kOptionEditorBufferSize = "editor-buffer-size";

void registerDetailsOptions(config::OptionRegistry &registry);

struct TransformCatalog
{
    TransformSpec bold{"**", "**", "文本"};
    TransformSpec italic{"*", "*", "文本"};
    TransformSpec link{"[", "](https://)", "文本"};

    // nullptr for commands that are not text transforms.
    const TransformSpec *forCommand(std::uint16_t command) const noexcept;
};

TransformCatalog transformCatalogFrom(const config::OptionRegistry &registry);

struct PreviewSettings
{
    std::string emptyPlaceholder = "添加详情…";
    bool exemptTaskCheckboxes = false;
};

PreviewSettings previewSettingsFrom(const config::OptionRegistry &registry);

} // namespace taskpad::details
