#include "taskpad/details/edit_session.hpp"

#include <utility>

namespace taskpad::details
{

EditSession::EditSession(std::string committed)
    : committed_(std::move(committed))
{
}

void EditSession::setCommittedValue(std::string value)
{
    committed_ = std::move(value);
}

void EditSession::begin()
{
    draft_ = committed_;
    suppressNextExit_ = false;
}

const std::string &EditSession::draft() const noexcept
{
    return draft_ ? *draft_ : committed_;
}

void EditSession::setDraft(std::string text)
{
    draft_ = std::move(text);
}

void EditSession::dropDraft() noexcept
{
    draft_.reset();
}

bool EditSession::consumeSuppressedExit() noexcept
{
    const bool wasSet = suppressNextExit_;
    suppressNextExit_ = false;
    return wasSet;
}

} // namespace taskpad::details
