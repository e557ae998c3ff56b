#include <gtest/gtest.h>

#include "taskpad/commands/task_details.hpp"
#include "taskpad/details/details_options.hpp"
#include "taskpad/options.hpp"

namespace
{

namespace cmd = taskpad::commands::details;

taskpad::config::OptionRegistry makeRegistry()
{
    taskpad::config::OptionRegistry registry("taskpad-details-tests");
    taskpad::details::registerDetailsOptions(registry);
    return registry;
}

} // namespace

TEST(DetailsOptions, RegistersEveryOption)
{
    auto registry = makeRegistry();
    EXPECT_TRUE(registry.hasOption(taskpad::details::kOptionBoldPlaceholder));
    EXPECT_TRUE(registry.hasOption(taskpad::details::kOptionItalicPlaceholder));
    EXPECT_TRUE(registry.hasOption(taskpad::details::kOptionLinkPlaceholder));
    EXPECT_TRUE(registry.hasOption(taskpad::details::kOptionLinkUrl));
    EXPECT_TRUE(registry.hasOption(taskpad::details::kOptionEmptyPlaceholder));
    EXPECT_TRUE(registry.hasOption(taskpad::details::kOptionExemptTaskCheckboxes));
    EXPECT_TRUE(registry.hasOption(taskpad::details::kOptionEditorBufferSize));
    EXPECT_EQ(8192, registry.getInteger(taskpad::details::kOptionEditorBufferSize));
}

TEST(DetailsOptions, DefaultCatalogMatchesBuiltInMarkers)
{
    const auto catalog = taskpad::details::transformCatalogFrom(makeRegistry());
    EXPECT_EQ("**", catalog.bold.prefix);
    EXPECT_EQ("**", catalog.bold.suffix);
    EXPECT_EQ("*", catalog.italic.prefix);
    EXPECT_EQ("[", catalog.link.prefix);
    EXPECT_EQ("](https://)", catalog.link.suffix);
    EXPECT_EQ("文本", catalog.bold.placeholder);
}

TEST(DetailsOptions, CatalogFollowsOverrides)
{
    auto registry = makeRegistry();
    registry.set(taskpad::details::kOptionLinkUrl, "https://tasks.example/");
    registry.set(taskpad::details::kOptionItalicPlaceholder, "text");

    const auto catalog = taskpad::details::transformCatalogFrom(registry);
    EXPECT_EQ("](https://tasks.example/)", catalog.link.suffix);
    EXPECT_EQ("text", catalog.italic.placeholder);
}

TEST(DetailsOptions, ForCommandSelectsTransform)
{
    const taskpad::details::TransformCatalog catalog;
    EXPECT_EQ(&catalog.bold, catalog.forCommand(cmd::WrapBold));
    EXPECT_EQ(&catalog.italic, catalog.forCommand(cmd::WrapItalic));
    EXPECT_EQ(&catalog.link, catalog.forCommand(cmd::WrapLink));
    EXPECT_EQ(nullptr, catalog.forCommand(cmd::CommitAndClose));
}

TEST(DetailsOptions, PreviewSettingsFollowOverrides)
{
    auto registry = makeRegistry();
    auto settings = taskpad::details::previewSettingsFrom(registry);
    EXPECT_FALSE(settings.exemptTaskCheckboxes);
    EXPECT_EQ("添加详情…", settings.emptyPlaceholder);

    registry.set(taskpad::details::kOptionExemptTaskCheckboxes, "yes");
    registry.set(taskpad::details::kOptionEmptyPlaceholder, "Add details");
    settings = taskpad::details::previewSettingsFrom(registry);
    EXPECT_TRUE(settings.exemptTaskCheckboxes);
    EXPECT_EQ("Add details", settings.emptyPlaceholder);
}
