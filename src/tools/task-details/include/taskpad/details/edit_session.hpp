#pragma once

#include <optional>
#include <string>

namespace taskpad::details
{

/// Synchronously mutated state shared by the exit handlers of one edit
/// session: the committed mirror, the in-progress draft and the one-shot
/// guard that keeps a second exit handler from resolving the session again.
class EditSession
{
public:
    explicit EditSession(std::string committed = {});

    const std::string &committedValue() const noexcept { return committed_; }
    void setCommittedValue(std::string value);

    // Seeds the draft from the committed value and clears the guard.
    void begin();

    bool hasDraft() const noexcept { return draft_.has_value(); }
    // The committed value when no session is open.
    const std::string &draft() const noexcept;
    void setDraft(std::string text);
    void dropDraft() noexcept;

    void suppressNextExit() noexcept { suppressNextExit_ = true; }
    // Returns whether the guard was set, clearing it.
    bool consumeSuppressedExit() noexcept;

private:
    std::string committed_;
    std::optional<std::string> draft_;
    bool suppressNextExit_ = false;
};

} // namespace taskpad::details
