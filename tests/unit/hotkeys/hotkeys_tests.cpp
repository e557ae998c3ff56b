#include <gtest/gtest.h>

#include "taskpad/hotkeys.hpp"
#include "taskpad/commands/task_details.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{

namespace details = taskpad::commands::details;

void ensureRegistered()
{
    taskpad::hotkeys::registerDefaultSchemes();
}

bool hasScheme(const std::string &id)
{
    auto schemes = taskpad::hotkeys::availableSchemes();
    return std::any_of(schemes.begin(), schemes.end(), [&](const auto &entry) { return entry.first == id; });
}

} // namespace

TEST(Hotkeys, RegistersDefaultScheme)
{
    ensureRegistered();
    EXPECT_TRUE(hasScheme("linux"));
    EXPECT_TRUE(hasScheme("mac"));
#if defined(__APPLE__)
    EXPECT_EQ("mac", taskpad::hotkeys::defaultSchemeId());
#else
    EXPECT_EQ("linux", taskpad::hotkeys::defaultSchemeId());
#endif
}

TEST(Hotkeys, LookupReturnsDetailsBinding)
{
    ensureRegistered();
    ASSERT_TRUE(taskpad::hotkeys::setActiveScheme("linux"));
    const auto *binding = taskpad::hotkeys::lookup(details::WrapBold);
    ASSERT_NE(nullptr, binding);
    EXPECT_EQ(TKey(kbCtrlB), binding->key);
    EXPECT_EQ("Ctrl-B", binding->display);
    EXPECT_EQ("Ctrl-B", taskpad::hotkeys::displayText(details::WrapBold));
}

TEST(Hotkeys, SchemesDifferWhereTerminalsDiffer)
{
    ensureRegistered();
    ASSERT_TRUE(taskpad::hotkeys::setActiveScheme("linux"));
    EXPECT_EQ(TKey(kbCtrlEnter), taskpad::hotkeys::key(details::CommitAndClose));
    ASSERT_TRUE(taskpad::hotkeys::setActiveScheme("mac"));
    EXPECT_EQ(TKey(kbCtrlS), taskpad::hotkeys::key(details::CommitAndClose));
    EXPECT_EQ(TKey(kbEsc), taskpad::hotkeys::key(details::Discard));
}

TEST(Hotkeys, UnknownSchemeIsRejected)
{
    ensureRegistered();
    ASSERT_TRUE(taskpad::hotkeys::setActiveScheme("linux"));
    EXPECT_FALSE(taskpad::hotkeys::setActiveScheme("does-not-exist"));
    EXPECT_EQ("linux", taskpad::hotkeys::activeScheme());
}

TEST(Hotkeys, ApplyCommandLineSchemeOverrides)
{
    ensureRegistered();
    taskpad::hotkeys::setActiveScheme("linux");
    int argc = 3;
    char arg0[] = "taskpad-test";
    char arg1[] = "--hotkeys=mac";
    char arg2[] = "Groceries";
    char *argv[] = {arg0, arg1, arg2, nullptr};
    taskpad::hotkeys::applyCommandLineScheme(argc, argv);
    EXPECT_EQ(2, argc);
    EXPECT_STREQ("taskpad-test", argv[0]);
    EXPECT_STREQ("Groceries", argv[1]);
    EXPECT_EQ("mac", taskpad::hotkeys::activeScheme());
}

TEST(Hotkeys, StatusLabelHighlightsKey)
{
    ensureRegistered();
    taskpad::hotkeys::setActiveScheme("linux");
    EXPECT_EQ("~F5~ Reload", taskpad::hotkeys::statusLabel(details::Reload, "Reload"));
    EXPECT_EQ("Unbound", taskpad::hotkeys::statusLabel(9999, "Unbound"));
}

TEST(Hotkeys, CommandLabelsProvideDisplayNames)
{
    ensureRegistered();
    EXPECT_EQ("Bold", taskpad::hotkeys::commandLabel(details::WrapBold));
    EXPECT_EQ("Save", taskpad::hotkeys::commandLabel(details::CommitAndClose));
    EXPECT_EQ("Quit", taskpad::hotkeys::commandLabel(cmQuit));
    EXPECT_EQ("", taskpad::hotkeys::commandLabel(9999));
}

TEST(Hotkeys, FormatKeyNamesModifiers)
{
    EXPECT_EQ("Ctrl-B", taskpad::hotkeys::formatKey(TKey(kbCtrlB)));
    EXPECT_EQ("F5", taskpad::hotkeys::formatKey(TKey(kbF5)));
    EXPECT_EQ("Esc", taskpad::hotkeys::formatKey(TKey(kbEsc)));
}

TEST(Hotkeys, CustomBindingsLoadFromConfigFile)
{
    ensureRegistered();
    taskpad::hotkeys::setActiveScheme("linux");

    const auto configPath = std::filesystem::temp_directory_path() / "taskpad_hotkeys_test.json";
    {
        const TKey italic(kbCtrlT);
        std::ofstream out(configPath);
        out << "{\"custom_scheme_base\": \"linux\", \"custom_scheme_bindings\": {\""
            << details::WrapItalic << "\": {\"key\": {\"code\": " << italic.code << ", \"mods\": " << italic.mods
            << "}}, \"not-a-command\": {}}}";
    }
    ::setenv("TASKPAD_HOTKEYS_CONFIG", configPath.c_str(), 1);

    ASSERT_TRUE(taskpad::hotkeys::loadCustomBindings());
    ASSERT_TRUE(taskpad::hotkeys::setActiveScheme("custom"));
    EXPECT_EQ(TKey(kbCtrlT), taskpad::hotkeys::key(details::WrapItalic));
    EXPECT_EQ("Ctrl-T", taskpad::hotkeys::displayText(details::WrapItalic));
    // Commands the file does not mention keep the base scheme's keys.
    EXPECT_EQ(TKey(kbCtrlB), taskpad::hotkeys::key(details::WrapBold));
    EXPECT_TRUE(hasScheme("custom"));

    taskpad::hotkeys::setActiveScheme("linux");
    ::unsetenv("TASKPAD_HOTKEYS_CONFIG");
    std::error_code ec;
    std::filesystem::remove(configPath, ec);
}

TEST(Hotkeys, MissingConfigFileLoadsNothing)
{
    ensureRegistered();
    const auto configPath = std::filesystem::temp_directory_path() / "taskpad_hotkeys_missing.json";
    std::error_code ec;
    std::filesystem::remove(configPath, ec);
    ::setenv("TASKPAD_HOTKEYS_CONFIG", configPath.c_str(), 1);

    EXPECT_FALSE(taskpad::hotkeys::loadCustomBindings());

    ::unsetenv("TASKPAD_HOTKEYS_CONFIG");
}
