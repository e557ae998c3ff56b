#include "task_details_view.hpp"

#include "details_memo.hpp"
#include "details_preview.hpp"
#include "details_toolbar.hpp"

#include "taskpad/commands/task_details.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace taskpad::details
{
namespace
{

// TEditor addresses its buffer with ushort lengths.
constexpr std::size_t kMaxSurfaceBytes = std::numeric_limits<ushort>::max();
// Room left for typing when the memo is grown to fit a value.
constexpr std::size_t kEditHeadroom = 1024;

} // namespace

TaskDetailsView::TaskDetailsView(const TRect &bounds, const DetailsViewSettings &settings, std::string value,
                                 DetailsModeController::CommitHook onCommit)
    : TGroup(bounds), controller_(std::move(value), std::move(onCommit))
{
    options |= ofSelectable | ofFirstClick;
    growMode = gfGrowHiX | gfGrowHiY;

    controller_.setTransforms(settings.transforms);
    controller_.setActivationPolicy(
        ActivationPolicy{settings.preview.exemptTaskCheckboxes, kMaxSurfaceBytes - kEditHeadroom});
    controller_.setScheduler([this](std::function<void()> task) { deferred_.push_back(std::move(task)); });

    // Insertion order matters: resetCurrent() picks the first visible
    // selectable view, which must be the memo while editing.
    TRect memoRect = getExtent();
    memoRect.a.y = 1;
    memoRect.b.x -= 1;
    TRect scrollRect = getExtent();
    scrollRect.a.y = 1;
    scrollRect.a.x = scrollRect.b.x - 1;
    scrollBar_ = new TScrollBar(scrollRect);
    scrollBar_->growMode = gfGrowLoX | gfGrowHiX | gfGrowHiY;
    memo_ = new DetailsMemo(memoRect, scrollBar_, settings.bufferSize);
    insert(memo_);
    insert(scrollBar_);

    TRect toolbarRect = getExtent();
    toolbarRect.b.y = 1;
    toolbar_ = new DetailsToolbar(toolbarRect);
    insert(toolbar_);

    preview_ = new DetailsPreview(getExtent(), settings.preview.emptyPlaceholder);
    insert(preview_);

    memo_->hide();
    scrollBar_->hide();
    toolbar_->hide();
    if (settings.renderer)
        preview_->setRenderer(settings.renderer);
    preview_->setValue(controller_.committedValue());
    preview_->select();

    memo_->attach(&controller_);
    controller_.setModeListener([this](EditorMode mode) { modeChanged(mode); });
}

void TaskDetailsView::handleEvent(TEvent &event)
{
    TGroup::handleEvent(event);

    if (event.what == evBroadcast)
    {
        switch (event.message.command)
        {
        case commands::details::Activate:
            if (event.message.infoPtr &&
                !controller_.activate(*static_cast<const ActivationRequest *>(event.message.infoPtr)) &&
                controller_.exceedsSurfaceCapacity())
                messageBox("These details are too large to edit here.", mfError | mfOKButton);
            clearEvent(event);
            break;
        case commands::details::OpenLink:
            if (event.message.infoPtr && linkHandler_)
                linkHandler_(*static_cast<const std::string *>(event.message.infoPtr));
            clearEvent(event);
            break;
        default:
            break;
        }
    }
    else if (event.what == evCommand)
    {
        switch (event.message.command)
        {
        case commands::details::WrapBold:
        case commands::details::WrapItalic:
        case commands::details::WrapLink:
        case commands::details::CommitAndClose:
        case commands::details::Discard:
            controller_.runCommand(event.message.command);
            // Toolbar presses take the focus; give it back to the memo.
            if (controller_.isEditing())
                memo_->select();
            clearEvent(event);
            break;
        default:
            break;
        }
    }
}

void TaskDetailsView::shutDown()
{
    // Closing the window while editing is a genuine exit.
    controller_.blur(BlurEvent{false});
    controller_.setModeListener({});
    controller_.setScheduler({});
    if (memo_)
    {
        memo_->attach(nullptr);
        controller_.surfaceDestroyed(*memo_);
    }
    deferred_.clear();
    memo_ = nullptr;
    preview_ = nullptr;
    toolbar_ = nullptr;
    scrollBar_ = nullptr;
    TGroup::shutDown();
}

void TaskDetailsView::setValue(const std::string &value)
{
    controller_.externalUpdate(value);
}

void TaskDetailsView::processDeferred()
{
    std::vector<std::function<void()>> pending;
    pending.swap(deferred_);
    for (auto &task : pending)
        task();
}

void TaskDetailsView::modeChanged(EditorMode mode)
{
    if (mode == EditorMode::Editing)
    {
        if ((memo_->state & sfVisible) == 0)
            mountSurface();
        return;
    }
    unmountSurface();
    preview_->setValue(controller_.committedValue());
}

void TaskDetailsView::mountSurface()
{
    ensureSurfaceCapacity(DetailsMemo::encodedSize(controller_.draft()));
    if (!memo_->setText(controller_.draft()))
    {
        controller_.discard();
        messageBox("These details are too large to edit here.", mfError | mfOKButton);
        return;
    }
    memo_->show();
    scrollBar_->show();
    toolbar_->refreshLabels();
    toolbar_->show();
    preview_->hide();
    memo_->select();
    controller_.surfaceCreated(*memo_);
}

// Replaces the memo with a larger one when `bytes` plus typing room does not
// fit its buffer. The replacement takes the memo's place in the Z-order.
void TaskDetailsView::ensureSurfaceCapacity(std::size_t bytes)
{
    const std::size_t needed = std::min(bytes + kEditHeadroom, kMaxSurfaceBytes);
    if (needed <= memo_->bufSize)
        return;

    auto *replacement = new DetailsMemo(memo_->getBounds(), scrollBar_, static_cast<ushort>(needed));
    replacement->hide();
    memo_->attach(nullptr);
    controller_.surfaceDestroyed(*memo_);
    remove(memo_);
    TObject::destroy(memo_);
    insertBefore(replacement, nullptr);
    replacement->attach(&controller_);
    memo_ = replacement;
}

void TaskDetailsView::unmountSurface()
{
    if ((memo_->state & sfVisible) == 0)
        return;
    toolbar_->hide();
    scrollBar_->hide();
    preview_->show();
    memo_->hide();
    preview_->select();
}

} // namespace taskpad::details
