#include <plugview/event-translator.h>
#include <ytrace/ytrace.hpp>

namespace plugview {

PointerButton translateMouseButton(MouseButton button) noexcept {
    switch (button) {
    case MouseButton::Left:
        return PointerButton::Primary;
    case MouseButton::Right:
        return PointerButton::Secondary;
    case MouseButton::Middle:
        return PointerButton::Auxiliary;
    case MouseButton::Back:
        return PointerButton::X1;
    case MouseButton::Forward:
        return PointerButton::X2;
    case MouseButton::Other:
        break;
    }
    return PointerButton::Primary;
}

Modifiers translateModifiers(uint32_t hostModifiers) noexcept {
    uint8_t bits = 0;
    if (hostModifiers & keymod::Shift) bits |= Modifiers::SHIFT;
    if (hostModifiers & keymod::Control) bits |= Modifiers::CONTROL;
    if (hostModifiers & keymod::Alt) bits |= Modifiers::ALT;
    if (hostModifiers & keymod::Meta) bits |= Modifiers::META;
    return Modifiers(bits);
}

EventTranslator::EventTranslator(double scaleFactor)
    : _scale(1.0), _startTime(std::chrono::steady_clock::now()) {
    setScaleFactor(scaleFactor);
}

void EventTranslator::setScaleFactor(double scale) noexcept {
    // Pointer positions are divided by the scale.
    _scale = scale > 0.0 ? scale : 1.0;
}

PointerInfo EventTranslator::pointerInfo() {
    return PointerInfo{PointerId::primary(), std::nullopt, PointerType::Mouse};
}

PointerState EventTranslator::pointerState() const {
    auto elapsed = std::chrono::steady_clock::now() - _startTime;

    PointerState state;
    state.time = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count());
    state.position = {_logicalPosition.x * _scale, _logicalPosition.y * _scale};
    state.buttons = _buttons;
    state.modifiers = _modifiers;
    state.scaleFactor = _scale;
    return state;
}

std::optional<NormalizedEvent> EventTranslator::translate(const HostEvent& event) {
    using Type = HostEvent::Type;

    switch (event.type) {
    case Type::CursorMoved: {
        _logicalPosition = {event.cursor.x / _scale, event.cursor.y / _scale};
        _modifiers = translateModifiers(event.cursor.modifiers);
        PointerMove move;
        move.update.pointer = pointerInfo();
        move.update.current = pointerState();
        return NormalizedEvent{PointerEvent{std::move(move)}};
    }

    case Type::ButtonPressed: {
        _modifiers = translateModifiers(event.button.modifiers);
        auto button = translateMouseButton(event.button.button);
        _buttons.insert(button);
        return NormalizedEvent{PointerEvent{PointerDown{button, pointerInfo(), pointerState()}}};
    }

    case Type::ButtonReleased: {
        _modifiers = translateModifiers(event.button.modifiers);
        auto button = translateMouseButton(event.button.button);
        _buttons.remove(button);
        return NormalizedEvent{PointerEvent{PointerUp{button, pointerInfo(), pointerState()}}};
    }

    case Type::WheelScrolled: {
        _modifiers = translateModifiers(event.wheel.modifiers);
        ScrollDelta delta;
        delta.kind = event.wheel.unit == ScrollUnit::Lines ? ScrollDelta::Kind::Lines
                                                           : ScrollDelta::Kind::Pixels;
        delta.x = event.wheel.x;
        delta.y = event.wheel.y;
        return NormalizedEvent{PointerEvent{PointerScroll{pointerInfo(), delta, pointerState()}}};
    }

    case Type::CursorEntered:
        return NormalizedEvent{PointerEvent{PointerEnter{pointerInfo()}}};

    case Type::CursorLeft:
        return NormalizedEvent{PointerEvent{PointerLeave{pointerInfo()}}};

    case Type::DragEntered:
    case Type::DragMoved:
    case Type::DragLeft:
    case Type::DragDropped:
        ytrace("drag event {} has no widget tree counterpart", static_cast<int>(event.type));
        return std::nullopt;

    case Type::Keyboard:
        _modifiers = translateModifiers(event.keyboard.modifiers);
        return NormalizedEvent{event.keyboard};

    case Type::Resized:
        setScaleFactor(event.window.scale);
        return NormalizedEvent{ResizeEvent{event.window.physicalWidth,
                                           event.window.physicalHeight,
                                           _scale}};

    case Type::Focused:
        return NormalizedEvent{FocusEvent{true}};

    case Type::Unfocused:
        return NormalizedEvent{FocusEvent{false}};

    case Type::WillClose:
        return NormalizedEvent{CloseEvent{}};

    case Type::None:
        break;
    }
    return std::nullopt;
}

} // namespace plugview
