#include "task_details_app.hpp"

#include "task_window.hpp"

#include "taskpad/app_info.hpp"
#include "taskpad/commands/task_details.hpp"
#include "taskpad/details/details_options.hpp"
#include "taskpad/hotkeys.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace taskpad::details
{
namespace
{

const appinfo::ToolInfo &toolInfo()
{
    return appinfo::requireTool("taskpad-details");
}

// TDrawBuffer draws a tab as a glyph; the preview lays it out instead.
std::string expandTabs(const std::string &text)
{
    constexpr std::size_t tabWidth = 4;
    std::string out;
    out.reserve(text.size());
    std::size_t column = 0;
    for (char ch : text)
    {
        if (ch == '\t')
        {
            const std::size_t spaces = tabWidth - column % tabWidth;
            out.append(spaces, ' ');
            column += spaces;
            continue;
        }
        out.push_back(ch);
        if (ch == '\n')
            column = 0;
        else if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
            ++column;
    }
    return out;
}

ushort clampBufferSize(std::int64_t requested)
{
    constexpr std::int64_t minimum = 256;
    constexpr std::int64_t maximum = std::numeric_limits<ushort>::max();
    return static_cast<ushort>(std::clamp(requested, minimum, maximum));
}

} // namespace

TaskDetailsApp::TaskDetailsApp(std::shared_ptr<config::OptionRegistry> options, TaskStore store,
                               std::string newTaskTitle)
    : TProgInit(&TaskDetailsApp::initStatusLine, &TaskDetailsApp::initMenuBar, &TApplication::initDeskTop),
      options_(std::move(options)),
      store_(std::move(store)),
      persister_(store_)
{
    viewSettings_.transforms = transformCatalogFrom(*options_);
    viewSettings_.preview = previewSettingsFrom(*options_);
    viewSettings_.bufferSize = clampBufferSize(options_->getInteger(kOptionEditorBufferSize, 8192));
    viewSettings_.renderer = expandTabs;

    if (store_.tasks().empty())
        store_.addTask(newTaskTitle.empty() ? "Untitled task" : std::move(newTaskTitle));

    openTaskWindows();
}

TMenuBar *TaskDetailsApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;

    auto *reloadItem = new TMenuItem("~R~eload", commands::details::Reload, kbNoKey, hcNoContext);
    hotkeys::configureMenuItem(*reloadItem);
    auto *quitItem = new TMenuItem("E~x~it", cmQuit, kbNoKey, hcNoContext);
    hotkeys::configureMenuItem(*quitItem);
    auto *nextItem = new TMenuItem("~N~ext", cmNext, kbNoKey, hcNoContext);
    hotkeys::configureMenuItem(*nextItem);
    auto *closeItem = new TMenuItem("~C~lose", cmClose, kbNoKey, hcNoContext);
    hotkeys::configureMenuItem(*closeItem);
    auto *aboutItem = new TMenuItem("~A~bout...", commands::details::About, kbNoKey, hcNoContext);
    hotkeys::configureMenuItem(*aboutItem);

    TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) + *reloadItem + newLine() + *quitItem;
    TSubMenu &windowMenu = *new TSubMenu("~W~indow", hcNoContext) + *nextItem + *closeItem;
    TSubMenu &helpMenu = *new TSubMenu("~H~elp", hcNoContext) + *aboutItem;

    return new TMenuBar(r, fileMenu + windowMenu + helpMenu);
}

TStatusLine *TaskDetailsApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;

    auto *reloadItem = new TStatusItem("Reload", kbNoKey, commands::details::Reload);
    hotkeys::configureStatusItem(*reloadItem, hotkeys::commandLabel(commands::details::Reload));
    auto *closeItem = new TStatusItem("Close", kbNoKey, cmClose);
    hotkeys::configureStatusItem(*closeItem, "Close");
    auto *quitItem = new TStatusItem("Quit", kbNoKey, cmQuit);
    hotkeys::configureStatusItem(*quitItem, hotkeys::commandLabel(cmQuit));

    // Details commands belong to the memo's key table. Their hints carry no
    // key code so the status line never claims Enter or Esc for itself.
    const std::string editHint = hotkeys::statusLabel(commands::details::CommitAndClose,
                                                      hotkeys::commandLabel(commands::details::CommitAndClose));
    auto *editItem = new TStatusItem(editHint.c_str(), kbNoKey, 0);

    reloadItem->next = closeItem;
    closeItem->next = quitItem;
    quitItem->next = editItem;

    return new TStatusLine(r, *new TStatusDef(0, 0xFFFF, reloadItem));
}

void TaskDetailsApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);

    if (event.what != evCommand)
        return;

    switch (event.message.command)
    {
    case commands::details::Reload:
        reloadTasks();
        clearEvent(event);
        break;
    case commands::details::About:
        showAbout();
        clearEvent(event);
        break;
    default:
        break;
    }
}

void TaskDetailsApp::idle()
{
    TApplication::idle();

    for (auto *window : std::vector<TaskWindow *>(windows))
        window->processDeferred();

    reportPendingErrors();
}

void TaskDetailsApp::registerWindow(TaskWindow *window)
{
    if (!window)
        return;
    windows.push_back(window);
}

void TaskDetailsApp::unregisterWindow(TaskWindow *window)
{
    auto it = std::remove(windows.begin(), windows.end(), window);
    windows.erase(it, windows.end());
}

void TaskDetailsApp::persistDetails(const std::string &taskId, const std::string &details)
{
    persister_.persist(taskId, details);
}

void TaskDetailsApp::openLink(const std::string &url)
{
    const std::string text = "Link target:\n\n" + url;
    messageBox(text.c_str(), mfInformation | mfOKButton);
}

void TaskDetailsApp::openTaskWindows()
{
    if (!deskTop)
        return;

    const TRect area = deskTop->getExtent();
    const auto &tasks = store_.tasks();
    const int count = static_cast<int>(tasks.size());
    for (int i = 0; i < count; ++i)
    {
        TRect bounds = area;
        bounds.a.x += static_cast<short>(i * 2);
        bounds.a.y += static_cast<short>(i);
        const std::string title = tasks[i].title.empty() ? tasks[i].id : tasks[i].title;
        auto *window = new TaskWindow(*this, bounds, tasks[i].id, title, tasks[i].details, viewSettings_);
        deskTop->insert(validView(window));
    }
}

void TaskDetailsApp::reloadTasks()
{
    try
    {
        store_.load();
    }
    catch (const TaskStoreError &e)
    {
        messageBox(e.what(), mfError | mfOKButton);
        return;
    }

    for (auto *window : std::vector<TaskWindow *>(windows))
    {
        if (const Task *task = store_.find(window->taskId()))
            window->applyExternalValue(task->details);
    }
}

void TaskDetailsApp::showAbout()
{
    appinfo::AboutInfo about;
#ifdef TASKPAD_DETAILS_VERSION
    about.version = TASKPAD_DETAILS_VERSION;
#else
    about.version = "dev";
#endif
    const std::string text = appinfo::buildAboutMessage(toolInfo(), about);
    messageBox(text.c_str(), mfInformation | mfOKButton);
}

void TaskDetailsApp::reportPendingErrors()
{
    if (!persister_.hasErrors())
        return;
    for (const auto &error : persister_.takeErrors())
    {
        const std::string text = "Could not save task details.\n\n" + error;
        messageBox(text.c_str(), mfError | mfOKButton);
    }
}

} // namespace taskpad::details
