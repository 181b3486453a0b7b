#include "hello-root.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace plugview::demo {

namespace {

constexpr float BUTTON_WIDTH = 180.0f;
constexpr float BUTTON_HEIGHT = 40.0f;
constexpr float BUTTON_SPACING = 16.0f;
constexpr float CORNER_RADIUS = 6.0f;
constexpr double TWO_PI = 6.283185307179586;

const Color BUTTON_IDLE = Color::rgba8(60, 63, 72);
const Color BUTTON_HOVER = Color::rgba8(78, 82, 96);
const Color BUTTON_PRESSED = Color::rgba8(52, 120, 200);
const Color BUTTON_BORDER = Color::rgba8(110, 115, 130);
const Color CLICK_DOT = Color::rgba8(230, 180, 60);
const Color INDICATOR = Color::rgba8(90, 200, 140);

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Rect HelloRoot::buttonRect(size_t index) const {
    float scale = static_cast<float>(_scale);
    float logicalWidth = _width / scale;
    float logicalHeight = _height / scale;
    float columnHeight = BUTTON_COUNT * BUTTON_HEIGHT + (BUTTON_COUNT - 1) * BUTTON_SPACING;
    float x = (logicalWidth - BUTTON_WIDTH) * 0.5f;
    float y = (logicalHeight - columnHeight) * 0.5f + index * (BUTTON_HEIGHT + BUTTON_SPACING);
    return Rect::fromOriginSize(x * scale, y * scale, BUTTON_WIDTH * scale, BUTTON_HEIGHT * scale);
}

int HelloRoot::hitTest(const PhysicalPosition& position) const {
    Point p{static_cast<float>(position.x), static_cast<float>(position.y)};
    for (size_t i = 0; i < BUTTON_COUNT; ++i) {
        if (buttonRect(i).contains(p)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

Handled HelloRoot::handlePointerEvent(const PointerEvent& event) {
    return std::visit(overloaded{
        [this](const PointerMove& move) {
            int hit = hitTest(move.update.current.position);
            for (size_t i = 0; i < BUTTON_COUNT; ++i) {
                _buttons[i].hovered = static_cast<int>(i) == hit;
            }
            return hit >= 0 ? Handled::Yes : Handled::No;
        },
        [this](const PointerDown& down) {
            if (down.button != PointerButton::Primary) {
                return Handled::No;
            }
            int hit = hitTest(down.state.position);
            if (hit < 0) {
                return Handled::No;
            }
            _buttons[hit].pressed = true;
            return Handled::Yes;
        },
        [this](const PointerUp& up) {
            if (up.button != PointerButton::Primary) {
                return Handled::No;
            }
            int hit = hitTest(up.state.position);
            Handled handled = Handled::No;
            for (size_t i = 0; i < BUTTON_COUNT; ++i) {
                if (_buttons[i].pressed && static_cast<int>(i) == hit) {
                    ++_buttons[i].clicks;
                    yinfo("Button {} clicked ({} total)", i + 1, _buttons[i].clicks);
                    handled = Handled::Yes;
                }
                _buttons[i].pressed = false;
            }
            return handled;
        },
        [](const PointerScroll&) { return Handled::No; },
        [](const PointerEnter&) { return Handled::No; },
        [this](const PointerLeave&) {
            for (auto& button : _buttons) {
                button.hovered = false;
                button.pressed = false;
            }
            return Handled::Yes;
        },
    }, event);
}

Handled HelloRoot::handleWindowEvent(const WindowEvent& event) {
    std::visit(overloaded{
        [this](const WindowResize& resize) {
            _width = resize.width;
            _height = resize.height;
        },
        [this](const WindowRescale& rescale) {
            _scale = rescale.scale > 0.0 ? rescale.scale : 1.0;
        },
        [this](const AnimFrame& frame) {
            _phase = std::fmod(_phase + std::chrono::duration<double>(frame.elapsed).count(), 2.0);
        },
    }, event);
    return Handled::Yes;
}

RedrawResult HelloRoot::redraw() {
    RedrawResult result;
    Scene& scene = result.scene;
    float scale = static_cast<float>(_scale);

    for (size_t i = 0; i < BUTTON_COUNT; ++i) {
        const auto& button = _buttons[i];
        Rect rect = buttonRect(i);
        Color fill = button.pressed ? BUTTON_PRESSED : button.hovered ? BUTTON_HOVER : BUTTON_IDLE;
        scene.fillRoundedRect(rect, CORNER_RADIUS * scale, fill);
        scene.strokeRoundedRect(rect, CORNER_RADIUS * scale, 1.0f * scale, BUTTON_BORDER);

        // One dot per click, up to what fits inside the button.
        uint32_t dots = std::min<uint32_t>(button.clicks, 12);
        for (uint32_t d = 0; d < dots; ++d) {
            Point center{rect.x0 + (14.0f + d * 12.0f) * scale, rect.center().y};
            scene.fillCircle(center, 3.5f * scale, CLICK_DOT);
        }
    }

    // Indicator orbiting above the buttons, one turn every two seconds.
    Rect top = buttonRect(0);
    Point hub{top.center().x, top.y0 - 36.0f * scale};
    double angle = _phase * 0.5 * TWO_PI;
    Point dot{hub.x + static_cast<float>(std::cos(angle)) * 14.0f * scale,
              hub.y + static_cast<float>(std::sin(angle)) * 14.0f * scale};
    scene.strokeLine(hub, dot, 2.0f * scale, INDICATOR.withAlpha(0.6f));
    scene.fillCircle(dot, 5.0f * scale, INDICATOR);
    return result;
}

} // namespace plugview::demo
