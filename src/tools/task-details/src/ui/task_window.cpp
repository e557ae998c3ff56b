#include "task_window.hpp"

#include "task_details_app.hpp"
#include "task_details_view.hpp"

namespace taskpad::details
{

TaskWindow::TaskWindow(TaskDetailsApp &application, const TRect &bounds, const std::string &taskId,
                       const std::string &title, const std::string &details, const DetailsViewSettings &settings)
    : TWindowInit(&TWindow::initFrame),
      TWindow(bounds, title.c_str(), wnNoNumber),
      app(application),
      taskId_(taskId)
{
    options |= ofTileable;

    TRect interior = getExtent();
    interior.grow(-1, -1);
    detailsView = new TaskDetailsView(interior, settings, details,
                                      [this](const std::string &value) { app.persistDetails(taskId_, value); });
    detailsView->setLinkHandler([this](const std::string &url) { app.openLink(url); });
    insert(detailsView);
    detailsView->select();

    app.registerWindow(this);
}

void TaskWindow::sizeLimits(TPoint &min, TPoint &max)
{
    TWindow::sizeLimits(min, max);
    constexpr short minWidth = 30;
    constexpr short minHeight = 6;
    if (min.x < minWidth)
        min.x = minWidth;
    if (min.y < minHeight)
        min.y = minHeight;
}

void TaskWindow::shutDown()
{
    app.unregisterWindow(this);
    detailsView = nullptr;
    TWindow::shutDown();
}

void TaskWindow::processDeferred()
{
    if (detailsView && detailsView->hasDeferred())
        detailsView->processDeferred();
}

void TaskWindow::applyExternalValue(const std::string &details)
{
    if (detailsView)
        detailsView->setValue(details);
}

} // namespace taskpad::details
