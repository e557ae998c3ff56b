#pragma once

#include "taskpad/details/edit_session.hpp"

#include <functional>
#include <optional>
#include <string>

namespace taskpad::details
{

class CommitCoordinator
{
public:
    using CommitHook = std::function<void(const std::string &nextValue)>;

    CommitCoordinator(EditSession &session, CommitHook hook);

    // True when the normalized candidate differs from the normalized mirror.
    bool differsFromCommitted(const std::string &candidate) const;

    // Advances the mirror to the normalized candidate and returns it, or
    // returns nothing when the candidate is not a meaningful change.
    std::optional<std::string> stage(const std::string &candidate);

    // Calls the hook. Exceptions from the hook are not caught.
    void publish(const std::string &value) const;

    // stage() followed by publish(). Returns whether the hook was called.
    bool attemptCommit(const std::string &candidate);

private:
    EditSession &session_;
    CommitHook hook_;
};

} // namespace taskpad::details
