#pragma once

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <variant>
#include <vector>

namespace plugview {

enum class PointerButton : uint8_t {
    Primary,
    Secondary,
    Auxiliary,
    X1,
    X2
};

// Set of pressed pointer buttons.
class PointerButtons {
public:
    PointerButtons() = default;
    PointerButtons(std::initializer_list<PointerButton> buttons) {
        for (auto b : buttons) {
            insert(b);
        }
    }

    void insert(PointerButton b) noexcept { _bits |= bit(b); }
    void remove(PointerButton b) noexcept { _bits &= static_cast<uint8_t>(~bit(b)); }
    bool contains(PointerButton b) const noexcept { return (_bits & bit(b)) != 0; }
    bool empty() const noexcept { return _bits == 0; }
    void clear() noexcept { _bits = 0; }

    bool operator==(const PointerButtons&) const = default;

private:
    static uint8_t bit(PointerButton b) noexcept {
        return static_cast<uint8_t>(1u << static_cast<uint8_t>(b));
    }

    uint8_t _bits = 0;
};

// Modifier keys the widget tree understands.
class Modifiers {
public:
    static constexpr uint8_t SHIFT = 1u << 0;
    static constexpr uint8_t CONTROL = 1u << 1;
    static constexpr uint8_t ALT = 1u << 2;
    static constexpr uint8_t META = 1u << 3;

    Modifiers() = default;
    explicit Modifiers(uint8_t bits) : _bits(bits & (SHIFT | CONTROL | ALT | META)) {}

    bool shift() const noexcept { return _bits & SHIFT; }
    bool control() const noexcept { return _bits & CONTROL; }
    bool alt() const noexcept { return _bits & ALT; }
    bool meta() const noexcept { return _bits & META; }
    bool empty() const noexcept { return _bits == 0; }
    uint8_t bits() const noexcept { return _bits; }

    bool operator==(const Modifiers&) const = default;

private:
    uint8_t _bits = 0;
};

struct PointerId {
    uint64_t value;

    static constexpr PointerId primary() { return PointerId{1}; }

    bool operator==(const PointerId&) const = default;
};

enum class PointerType : uint8_t {
    Mouse,
    Touch,
    Pen,
    Unknown
};

struct PointerInfo {
    std::optional<PointerId> pointerId;
    std::optional<uint64_t> persistentDeviceId;
    PointerType pointerType = PointerType::Mouse;
};

struct PhysicalPosition {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const PhysicalPosition&) const = default;
};

struct ContactGeometry {
    double width = 1.0;
    double height = 1.0;
};

struct PointerOrientation {
    float altitude = 1.5707964f; // perpendicular to the surface
    float azimuth = 0.0f;
};

struct PointerState {
    uint64_t time = 0; // nanoseconds since the translator was created
    PhysicalPosition position;
    PointerButtons buttons;
    Modifiers modifiers;
    uint8_t count = 1;
    ContactGeometry contactGeometry;
    PointerOrientation orientation;
    float pressure = 0.0f;
    float tangentialPressure = 0.0f;
    double scaleFactor = 1.0;

    PhysicalPosition logicalPosition() const noexcept {
        return {position.x / scaleFactor, position.y / scaleFactor};
    }
};

struct ScrollDelta {
    enum class Kind : uint8_t {
        Lines,
        Pixels,
        Pages
    };

    Kind kind = Kind::Lines;
    double x = 0.0;
    double y = 0.0;
};

struct PointerUpdate {
    PointerInfo pointer;
    PointerState current;
    std::vector<PointerState> coalesced;
    std::vector<PointerState> predicted;
};

struct PointerMove {
    PointerUpdate update;
};

struct PointerDown {
    std::optional<PointerButton> button;
    PointerInfo pointer;
    PointerState state;
};

struct PointerUp {
    std::optional<PointerButton> button;
    PointerInfo pointer;
    PointerState state;
};

struct PointerScroll {
    PointerInfo pointer;
    ScrollDelta delta;
    PointerState state;
};

struct PointerEnter {
    PointerInfo pointer;
};

struct PointerLeave {
    PointerInfo pointer;
};

using PointerEvent = std::variant<PointerMove, PointerDown, PointerUp,
                                  PointerScroll, PointerEnter, PointerLeave>;

} // namespace plugview
