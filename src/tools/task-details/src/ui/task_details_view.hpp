#pragma once

#include "tvision_include.hpp"

#include "taskpad/details/details_options.hpp"
#include "taskpad/details/mode_controller.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace taskpad::details
{

class DetailsMemo;
class DetailsPreview;
class DetailsToolbar;

struct DetailsViewSettings
{
    TransformCatalog transforms;
    PreviewSettings preview;
    ushort bufferSize = 8192;
    // Maps the committed value to the preview text; unset shows it raw.
    std::function<std::string(const std::string &)> renderer;
};

/// The dual-mode details control: a read-only preview in View mode, the
/// toolbar and memo while Editing.
class TaskDetailsView : public TGroup
{
public:
    using LinkHandler = std::function<void(const std::string &url)>;

    TaskDetailsView(const TRect &bounds, const DetailsViewSettings &settings, std::string value,
                    DetailsModeController::CommitHook onCommit);

    virtual void handleEvent(TEvent &event) override;
    virtual void shutDown() override;

    // The host's value changed; forces View mode when it differs.
    void setValue(const std::string &value);
    void setLinkHandler(LinkHandler handler) { linkHandler_ = std::move(handler); }

    // Runs the work deferred to the next idle tick of the event loop.
    void processDeferred();
    bool hasDeferred() const noexcept { return !deferred_.empty(); }

private:
    void modeChanged(EditorMode mode);
    void mountSurface();
    void unmountSurface();
    void ensureSurfaceCapacity(std::size_t bytes);

    DetailsModeController controller_;
    DetailsPreview *preview_ = nullptr;
    DetailsToolbar *toolbar_ = nullptr;
    DetailsMemo *memo_ = nullptr;
    TScrollBar *scrollBar_ = nullptr;
    std::vector<std::function<void()>> deferred_;
    LinkHandler linkHandler_;
};

} // namespace taskpad::details
