#pragma once

#include "tvision_include.hpp"

#include "taskpad/details/preview_links.hpp"

#include <functional>
#include <string>

namespace taskpad::details
{

class DetailsPreview : public TView
{
public:
    using Renderer = std::function<std::string(const std::string &value)>;

    DetailsPreview(const TRect &bounds, std::string emptyPlaceholder);

    virtual void draw() override;
    virtual void handleEvent(TEvent &event) override;
    virtual TPalette &getPalette() const override;

    void setValue(const std::string &value);
    void setRenderer(Renderer renderer);

private:
    void rerender();
    void requestActivation(ActivationSource source, PreviewTarget target);
    void scrollBy(int delta);
    int lineCount() const;
    bool isBlank() const;

    std::string value_;
    std::string rendered_;
    std::string emptyPlaceholder_;
    Renderer renderer_;
    int topLine_ = 0;
};

} // namespace taskpad::details
