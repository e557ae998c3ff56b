#pragma once

#include "tvision_include.hpp"

#include "task_details_view.hpp"

#include "taskpad/details/task_store.hpp"
#include "taskpad/options.hpp"

#include <memory>
#include <string>
#include <vector>

namespace taskpad::details
{

class TaskWindow;

class TaskDetailsApp : public TApplication
{
public:
    // `store` is already loaded; an empty store gets one task titled
    // `newTaskTitle`.
    TaskDetailsApp(std::shared_ptr<config::OptionRegistry> options, TaskStore store, std::string newTaskTitle);

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

    void registerWindow(TaskWindow *window);
    void unregisterWindow(TaskWindow *window);

    // Commit hook of every details view. Store failures are queued and
    // reported from idle(); the session itself stays closed.
    void persistDetails(const std::string &taskId, const std::string &details);
    // Failures queued after the event loop stopped, e.g. by windows that
    // committed while shutting down.
    std::vector<std::string> takePendingErrors() { return persister_.takeErrors(); }
    void openLink(const std::string &url);

private:
    void openTaskWindows();
    void reloadTasks();
    void showAbout();
    void reportPendingErrors();

    std::shared_ptr<config::OptionRegistry> options_;
    DetailsViewSettings viewSettings_;
    TaskStore store_;
    DetailsPersister persister_;
    std::vector<TaskWindow *> windows;
};

} // namespace taskpad::details
