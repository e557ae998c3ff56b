#pragma once

#include "tvision_include.hpp"

#include <string>

namespace taskpad::details
{

class TaskDetailsApp;
class TaskDetailsView;
struct DetailsViewSettings;

class TaskWindow : public TWindow
{
public:
    TaskWindow(TaskDetailsApp &app, const TRect &bounds, const std::string &taskId, const std::string &title,
               const std::string &details, const DetailsViewSettings &settings);

    virtual void sizeLimits(TPoint &min, TPoint &max) override;
    virtual void shutDown() override;

    const std::string &taskId() const noexcept { return taskId_; }
    void processDeferred();
    void applyExternalValue(const std::string &details);

private:
    TaskDetailsApp &app;
    std::string taskId_;
    TaskDetailsView *detailsView = nullptr;
};

} // namespace taskpad::details
