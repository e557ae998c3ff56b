#include "ui/task_details_app.hpp"

#include "taskpad/app_info.hpp"
#include "taskpad/details/details_options.hpp"
#include "taskpad/details/task_store.hpp"
#include "taskpad/hotkeys.hpp"
#include "taskpad/options.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{

const taskpad::appinfo::ToolInfo &toolInfo()
{
    return taskpad::appinfo::requireTool("taskpad-details");
}

void printUsage()
{
    const auto &info = toolInfo();
    std::cout << info.executable << " - " << info.shortDescription << "\n\n"
              << "Usage: " << info.executable << " [options] [TITLE]\n"
              << "  --tasks FILE           Read and write tasks in FILE\n"
              << "  --load-options FILE    Load options from FILE\n"
              << "  --no-default-options   Do not load saved defaults\n"
              << "  --list-options         Print the effective options and exit\n"
              << "  --save-options         Save the effective options as defaults and exit\n"
              << "  --hotkeys SCHEME       Use the specified hotkey scheme for this run\n\n"
              << "TITLE names the task created when the task file is empty.\n"
              << "Available schemes:\n";
    for (const auto &[id, name] : taskpad::hotkeys::availableSchemes())
        std::cout << "  " << id << " (" << name << ")\n";
    std::cout << "Set TASKPAD_HOTKEY_SCHEME to choose a default hotkey scheme." << std::endl;
}

void listOptions(const taskpad::config::OptionRegistry &registry)
{
    for (const auto &definition : registry.listRegisteredOptions())
    {
        std::cout << definition.key << " = " << registry.getString(definition.key) << "\n";
        if (!definition.description.empty())
            std::cout << "    " << definition.description << "\n";
    }
    std::cout.flush();
}

} // namespace

int main(int argc, char **argv)
{
    auto registry = std::make_shared<taskpad::config::OptionRegistry>("taskpad-details");
    taskpad::details::registerDetailsOptions(*registry);

    taskpad::hotkeys::init();
    taskpad::hotkeys::applyCommandLineScheme(argc, argv);

    bool loadDefaults = true;
    bool listOnly = false;
    bool saveOnly = false;
    std::vector<std::filesystem::path> optionFiles;
    std::filesystem::path tasksFile;
    std::string title;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--no-default-options")
        {
            loadDefaults = false;
        }
        else if (arg == "--list-options")
        {
            listOnly = true;
        }
        else if (arg == "--save-options")
        {
            saveOnly = true;
        }
        else if (arg.rfind("--tasks", 0) == 0 || arg.rfind("--load-options", 0) == 0)
        {
            const bool isTasks = arg.rfind("--tasks", 0) == 0;
            const std::string flag = isTasks ? "--tasks" : "--load-options";
            std::string value;
            if (arg.size() > flag.size() && arg[flag.size()] == '=')
            {
                value = arg.substr(flag.size() + 1);
            }
            else if (arg.size() == flag.size() && i + 1 < argc)
            {
                value = argv[++i];
            }
            else
            {
                std::cerr << "taskpad-details: invalid " << flag << " usage" << std::endl;
                return 1;
            }
            if (value.empty())
            {
                std::cerr << "taskpad-details: " << flag << " requires a file path" << std::endl;
                return 1;
            }
            if (isTasks)
                tasksFile = value;
            else
                optionFiles.emplace_back(value);
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "taskpad-details: unknown option '" << arg << "'" << std::endl;
            return 1;
        }
        else
        {
            if (!title.empty())
                title.push_back(' ');
            title += arg;
        }
    }

    if (loadDefaults)
        registry->loadDefaults();
    for (const auto &file : optionFiles)
    {
        if (!registry->loadFromFile(file))
        {
            std::cerr << "taskpad-details: failed to load options from '" << file.string() << "'" << std::endl;
            return 1;
        }
    }
    registry->applyEnvironment();

    if (listOnly)
    {
        listOptions(*registry);
        return 0;
    }
    if (saveOnly)
    {
        const std::filesystem::path path = registry->defaultOptionsPath();
        if (!registry->saveToFile(path))
        {
            std::cerr << "taskpad-details: failed to save options to '" << path.string() << "'" << std::endl;
            return 1;
        }
        std::cout << "Saved options to " << path.string() << std::endl;
        return 0;
    }

    if (tasksFile.empty())
        tasksFile = taskpad::config::OptionRegistry::configRoot() / registry->appId() / "tasks.json";

    taskpad::details::TaskStore store(tasksFile);
    try
    {
        store.load();
    }
    catch (const taskpad::details::TaskStoreError &e)
    {
        std::cerr << "taskpad-details: " << e.what() << std::endl;
        return 1;
    }

    taskpad::details::TaskDetailsApp app(registry, std::move(store), title);
    app.run();
    app.shutDown();

    // Windows closed by the shutdown commit their drafts after the last
    // chance to show a message box.
    const std::vector<std::string> errors = app.takePendingErrors();
    for (const auto &error : errors)
        std::cerr << "taskpad-details: could not save task details: " << error << std::endl;
    return errors.empty() ? 0 : 1;
}
