#pragma once

#include "tvision_include.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace taskpad::details
{

// One-row formatting strip shown above the memo while editing. Clicks and
// keys are forwarded to the owner as evCommand messages.
class DetailsToolbar : public TView
{
public:
    explicit DetailsToolbar(const TRect &bounds);

    virtual void draw() override;
    virtual void handleEvent(TEvent &event) override;
    virtual TPalette &getPalette() const override;

    // Re-reads the hint labels from the active hotkey scheme.
    void refreshLabels();

private:
    struct Button
    {
        std::uint16_t command = 0;
        std::string label;
        int start = 0;
        int width = 0;
    };

    int buttonAt(int x) const;
    void press(std::size_t index);

    std::vector<Button> buttons_;
    std::string hints_;
    std::size_t focused_ = 0;
};

} // namespace taskpad::details
