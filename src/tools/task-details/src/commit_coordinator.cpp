#include "taskpad/details/commit_coordinator.hpp"

#include "taskpad/details/selection_transform.hpp"

#include <utility>

namespace taskpad::details
{

CommitCoordinator::CommitCoordinator(EditSession &session, CommitHook hook)
    : session_(session), hook_(std::move(hook))
{
}

bool CommitCoordinator::differsFromCommitted(const std::string &candidate) const
{
    return normalizeLineEndings(candidate) != normalizeLineEndings(session_.committedValue());
}

std::optional<std::string> CommitCoordinator::stage(const std::string &candidate)
{
    std::string normalized = normalizeLineEndings(candidate);
    if (normalized == normalizeLineEndings(session_.committedValue()))
        return std::nullopt;
    session_.setCommittedValue(normalized);
    return normalized;
}

void CommitCoordinator::publish(const std::string &value) const
{
    if (hook_)
        hook_(value);
}

bool CommitCoordinator::attemptCommit(const std::string &candidate)
{
    std::optional<std::string> staged = stage(candidate);
    if (!staged)
        return false;
    publish(*staged);
    return true;
}

} // namespace taskpad::details
