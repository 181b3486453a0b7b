#pragma once

#include <plugview/host-event.h>
#include <plugview/pointer.h>
#include <chrono>
#include <optional>
#include <variant>

namespace plugview {

struct ResizeEvent {
    uint32_t width;  // physical
    uint32_t height; // physical
    double scale;
};

struct FocusEvent {
    bool focused;
};

struct CloseEvent {};

using NormalizedEvent = std::variant<PointerEvent, KeyboardEvent, ResizeEvent,
                                     FocusEvent, CloseEvent>;

PointerButton translateMouseButton(MouseButton button) noexcept;
Modifiers translateModifiers(uint32_t hostModifiers) noexcept;

//-----------------------------------------------------------------------------
// EventTranslator
//
// Maps host notifications to the widget tree event model. Host events carry
// only deltas (a button press has no position), so the translator keeps the
// last pointer position, the pressed buttons, the modifiers and the scale
// factor between calls and attaches them to every pointer event.
//-----------------------------------------------------------------------------
class EventTranslator {
public:
    explicit EventTranslator(double scaleFactor = 1.0);

    // nullopt when the event has no widget tree counterpart (drag and drop).
    std::optional<NormalizedEvent> translate(const HostEvent& event);

    // Non-positive scales fall back to 1.0.
    void setScaleFactor(double scale) noexcept;
    double scaleFactor() const noexcept { return _scale; }

    PhysicalPosition logicalPosition() const noexcept { return _logicalPosition; }
    const PointerButtons& buttons() const noexcept { return _buttons; }
    Modifiers modifiers() const noexcept { return _modifiers; }

private:
    PointerState pointerState() const;
    static PointerInfo pointerInfo();

    PhysicalPosition _logicalPosition;
    PointerButtons _buttons;
    Modifiers _modifiers;
    double _scale;
    std::chrono::steady_clock::time_point _startTime;
};

} // namespace plugview
