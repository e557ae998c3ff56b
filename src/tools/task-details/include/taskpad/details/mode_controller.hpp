#pragma once

#include "taskpad/details/commit_coordinator.hpp"
#include "taskpad/details/edit_session.hpp"
#include "taskpad/details/preview_links.hpp"
#include "taskpad/details/selection_transform.hpp"
#include "taskpad/details/details_options.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace taskpad::details
{

enum class EditorMode
{
    View,
    Editing
};

enum class ActivationSource
{
    Pointer,
    Keyboard
};

struct ActivationRequest
{
    ActivationSource source = ActivationSource::Pointer;
    PreviewTarget target = PreviewTarget::Text;
};

struct BlurEvent
{
    // Focus moved to an element inside the editing surface's own subtree.
    bool relatedInsideSurface = false;
};

enum class KeyDisposition
{
    Handled,
    FallThrough
};

/// The text surface mounted while editing. Offsets count code points.
class EditingSurface
{
public:
    virtual ~EditingSurface() = default;

    virtual std::string text() const = 0;
    virtual SelectionRange selection() const = 0;
    virtual void dispatch(const TextChange &change, SelectionRange selection) = 0;
    virtual void placeCaretAtEnd() = 0;
    virtual void requestFocus() = 0;
    // Continues the list or quote item at the caret. False when the surface
    // declined and the key should keep its default meaning.
    virtual bool continueMarkup() = 0;
};

struct ActivationPolicy
{
    bool exemptTaskCheckboxes = false;
    // Largest value, in bytes, the surface can hold. Zero means no limit.
    std::size_t maxValueBytes = 0;
};

/// View/Editing state machine of the details control.
///
/// Every exit path (commit key, genuine blur, escape, external update) goes
/// through one EditSession, so the commit hook runs at most once per session.
class DetailsModeController
{
public:
    using CommitHook = CommitCoordinator::CommitHook;
    using ModeListener = std::function<void(EditorMode mode)>;
    using Scheduler = std::function<void(std::function<void()> task)>;

    explicit DetailsModeController(std::string committed = {}, CommitHook hook = {});

    DetailsModeController(const DetailsModeController &) = delete;
    DetailsModeController &operator=(const DetailsModeController &) = delete;

    void setModeListener(ModeListener listener) { modeListener_ = std::move(listener); }
    // Without a scheduler deferred work runs immediately.
    void setScheduler(Scheduler scheduler) { scheduler_ = std::move(scheduler); }
    void setActivationPolicy(ActivationPolicy policy) { policy_ = policy; }
    void setTransforms(TransformCatalog catalog) { transforms_ = std::move(catalog); }

    EditorMode mode() const noexcept { return mode_; }
    bool isEditing() const noexcept { return mode_ == EditorMode::Editing; }
    const std::string &committedValue() const noexcept { return session_.committedValue(); }
    const std::string &draft() const noexcept { return session_.draft(); }
    // The committed value in View mode, the draft while editing.
    const std::string &displayedValue() const noexcept;
    const EditSession &session() const noexcept { return session_; }
    const TransformCatalog &transforms() const noexcept { return transforms_; }

    // View -> Editing. Returns false when the request is refused.
    bool activate(const ActivationRequest &request);
    // The committed value is larger than the surface can hold.
    bool exceedsSurfaceCapacity() const noexcept;

    // The host mounted `surface` for the current session.
    void surfaceCreated(EditingSurface &surface);
    void surfaceDestroyed(EditingSurface &surface) noexcept;
    void draftChanged(std::string text);

    void commitAndClose();
    void discard();
    void blur(const BlurEvent &event);
    void externalUpdate(const std::string &value);

    // Runs a details command against the mounted surface.
    KeyDisposition runCommand(std::uint16_t command);
    bool applyTransform(const TransformSpec &spec);

private:
    void closeWithCommit();
    void enterView();
    void notify();

    EditSession session_;
    CommitCoordinator coordinator_;
    EditorMode mode_ = EditorMode::View;
    EditingSurface *surface_ = nullptr;
    ModeListener modeListener_;
    Scheduler scheduler_;
    ActivationPolicy policy_;
    TransformCatalog transforms_;
};

} // namespace taskpad::details
