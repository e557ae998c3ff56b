#include "taskpad/details/mode_controller.hpp"

#include "taskpad/commands/task_details.hpp"

#include <utility>

namespace taskpad::details
{

DetailsModeController::DetailsModeController(std::string committed, CommitHook hook)
    : session_(std::move(committed)), coordinator_(session_, std::move(hook))
{
}

const std::string &DetailsModeController::displayedValue() const noexcept
{
    return isEditing() ? session_.draft() : session_.committedValue();
}

bool DetailsModeController::activate(const ActivationRequest &request)
{
    if (isEditing())
        return false;
    if (request.target == PreviewTarget::Link)
        return false;
    if (request.target == PreviewTarget::TaskCheckbox && policy_.exemptTaskCheckboxes)
        return false;
    if (exceedsSurfaceCapacity())
        return false;

    session_.begin();
    mode_ = EditorMode::Editing;
    notify();
    return true;
}

bool DetailsModeController::exceedsSurfaceCapacity() const noexcept
{
    return policy_.maxValueBytes != 0 && session_.committedValue().size() > policy_.maxValueBytes;
}

void DetailsModeController::surfaceCreated(EditingSurface &surface)
{
    surface_ = &surface;
    auto place = [this]() {
        if (surface_ && isEditing())
        {
            surface_->placeCaretAtEnd();
            surface_->requestFocus();
        }
    };
    if (scheduler_)
        scheduler_(place);
    else
        place();
}

void DetailsModeController::surfaceDestroyed(EditingSurface &surface) noexcept
{
    if (surface_ == &surface)
        surface_ = nullptr;
}

void DetailsModeController::draftChanged(std::string text)
{
    if (isEditing())
        session_.setDraft(std::move(text));
}

void DetailsModeController::commitAndClose()
{
    if (!isEditing())
        return;
    if (session_.consumeSuppressedExit())
        return;
    closeWithCommit();
}

void DetailsModeController::discard()
{
    if (!isEditing())
        return;
    session_.suppressNextExit();
    session_.dropDraft();
    enterView();
}

void DetailsModeController::blur(const BlurEvent &event)
{
    if (session_.consumeSuppressedExit())
        return;
    if (!isEditing())
        return;
    if (event.relatedInsideSurface)
        return;
    closeWithCommit();
}

void DetailsModeController::externalUpdate(const std::string &value)
{
    if (value == session_.committedValue())
        return;
    session_.setCommittedValue(value);
    session_.dropDraft();
    if (isEditing())
    {
        session_.suppressNextExit();
        enterView();
        return;
    }
    notify();
}

KeyDisposition DetailsModeController::runCommand(std::uint16_t command)
{
    namespace cmd = commands::details;
    switch (command)
    {
    case cmd::WrapBold:
    case cmd::WrapItalic:
    case cmd::WrapLink:
        if (const TransformSpec *spec = transforms_.forCommand(command))
            applyTransform(*spec);
        return KeyDisposition::Handled;
    case cmd::CommitAndClose:
        commitAndClose();
        return KeyDisposition::Handled;
    case cmd::Discard:
        discard();
        return KeyDisposition::Handled;
    case cmd::ContinueMarkup:
        if (surface_ && isEditing() && surface_->continueMarkup())
        {
            session_.setDraft(surface_->text());
            return KeyDisposition::Handled;
        }
        return KeyDisposition::FallThrough;
    default:
        return KeyDisposition::FallThrough;
    }
}

bool DetailsModeController::applyTransform(const TransformSpec &spec)
{
    if (!surface_ || !isEditing())
        return false;
    const TransformResult result = wrapSelection(surface_->text(), surface_->selection(), spec);
    surface_->dispatch(result.change, result.selection);
    // The surface may refuse part of the change (e.g. a full buffer).
    session_.setDraft(surface_->text());
    return true;
}

void DetailsModeController::closeWithCommit()
{
    session_.suppressNextExit();
    const std::optional<std::string> staged = coordinator_.stage(session_.draft());
    session_.dropDraft();
    enterView();
    // The mirror is already advanced; a throwing hook leaves the control in View.
    if (staged)
        coordinator_.publish(*staged);
}

void DetailsModeController::enterView()
{
    mode_ = EditorMode::View;
    surface_ = nullptr;
    notify();
}

void DetailsModeController::notify()
{
    if (modeListener_)
        modeListener_(mode_);
}

} // namespace taskpad::details
