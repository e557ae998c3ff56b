#pragma once

#include "tvision_include.hpp"

#include "taskpad/details/mode_controller.hpp"

#include <string>
#include <string_view>

namespace taskpad::details
{

// The editing surface: a TMemo whose key table is consulted first and whose
// focus changes are reported to the mode controller.
class DetailsMemo : public TMemo, public EditingSurface
{
public:
    DetailsMemo(const TRect &bounds, TScrollBar *vScroll, ushort bufSize);

    void attach(DetailsModeController *controller) noexcept { controller_ = controller; }

    virtual void handleEvent(TEvent &event) override;
    virtual void setState(ushort aState, Boolean enable) override;
    virtual TPalette &getPalette() const override;

    // False when the encoded value does not fit the buffer; nothing changes.
    bool setText(const std::string &value);

    // Bytes `text` occupies once loaded into the editor buffer.
    static std::size_t encodedSize(std::string_view text) noexcept;

    std::string text() const override;
    SelectionRange selection() const override;
    void dispatch(const TextChange &change, SelectionRange selection) override;
    void placeCaretAtEnd() override;
    void requestFocus() override;
    bool continueMarkup() override;

private:
    std::string readRange(uint start, uint end) const;
    std::size_t textOffset(uint ptr) const;
    uint bufferOffset(std::size_t offset) const;
    void reportDraft();

    static std::string encodeEditorText(std::string_view text);

    DetailsModeController *controller_ = nullptr;
};

} // namespace taskpad::details
