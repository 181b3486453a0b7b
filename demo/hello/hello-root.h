#pragma once

#include <plugview/widget-root.h>
#include <array>

namespace plugview::demo {

// A column of three push buttons and an animated activity indicator.
class HelloRoot : public WidgetRoot {
public:
    static constexpr size_t BUTTON_COUNT = 3;

    Handled handlePointerEvent(const PointerEvent& event) override;
    Handled handleWindowEvent(const WindowEvent& event) override;
    RedrawResult redraw() override;

    uint32_t clicks(size_t button) const { return _buttons.at(button).clicks; }

private:
    struct Button {
        bool hovered = false;
        bool pressed = false;
        uint32_t clicks = 0;
    };

    // Physical-pixel rect of a button for the current size and scale.
    Rect buttonRect(size_t index) const;
    int hitTest(const PhysicalPosition& position) const;

    std::array<Button, BUTTON_COUNT> _buttons;
    uint32_t _width = 0;
    uint32_t _height = 0;
    double _scale = 1.0;
    double _phase = 0.0;
};

} // namespace plugview::demo
