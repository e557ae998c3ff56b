#include "taskpad/details/details_options.hpp"

#include "taskpad/commands/task_details.hpp"

namespace taskpad::details
{

void registerDetailsOptions(config::OptionRegistry &registry)
{
    using config::OptionKind;
    using config::OptionValue;

    const TransformCatalog defaults;
    const PreviewSettings preview;

    registry.registerOption({kOptionBoldPlaceholder, OptionKind::String, OptionValue(defaults.bold.placeholder),
                             "Bold Placeholder", "Text inserted by the bold command when nothing is selected."});
    registry.registerOption({kOptionItalicPlaceholder, OptionKind::String, OptionValue(defaults.italic.placeholder),
                             "Italic Placeholder", "Text inserted by the italic command when nothing is selected."});
    registry.registerOption({kOptionLinkPlaceholder, OptionKind::String, OptionValue(defaults.link.placeholder),
                             "Link Placeholder", "Link label inserted when nothing is selected."});
    registry.registerOption({kOptionLinkUrl, OptionKind::String, OptionValue("https://"),
                             "Link URL", "Target written into new links, ready to be completed."});
    registry.registerOption({kOptionEmptyPlaceholder, OptionKind::String, OptionValue(preview.emptyPlaceholder),
                             "Empty Placeholder", "Hint shown in the preview while the details are blank."});
    registry.registerOption({kOptionExemptTaskCheckboxes, OptionKind::Boolean, OptionValue(preview.exemptTaskCheckboxes),
                             "Exempt Task Checkboxes", "Clicking a task checkbox in the preview does not start editing."});
    registry.registerOption({kOptionEditorBufferSize, OptionKind::Integer, OptionValue(std::int64_t{8192}),
                             "Editor Buffer Size", "Capacity of the editing surface in bytes."});
}

const TransformSpec *TransformCatalog::forCommand(std::uint16_t command) const noexcept
{
    switch (command)
    {
    case commands::details::WrapBold:
        return &bold;
    case commands::details::WrapItalic:
        return &italic;
    case commands::details::WrapLink:
        return &link;
    default:
        return nullptr;
    }
}

TransformCatalog transformCatalogFrom(const config::OptionRegistry &registry)
{
    TransformCatalog catalog;
    catalog.bold.placeholder = registry.getString(kOptionBoldPlaceholder, catalog.bold.placeholder);
    catalog.italic.placeholder = registry.getString(kOptionItalicPlaceholder, catalog.italic.placeholder);
    catalog.link.placeholder = registry.getString(kOptionLinkPlaceholder, catalog.link.placeholder);
    catalog.link.suffix = "](" + registry.getString(kOptionLinkUrl, "https://") + ")";
    return catalog;
}

PreviewSettings previewSettingsFrom(const config::OptionRegistry &registry)
{
    PreviewSettings settings;
    settings.emptyPlaceholder = registry.getString(kOptionEmptyPlaceholder, settings.emptyPlaceholder);
    settings.exemptTaskCheckboxes = registry.getBool(kOptionExemptTaskCheckboxes, settings.exemptTaskCheckboxes);
    return settings;
}

} // namespace taskpad::details
