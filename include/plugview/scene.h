#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace plugview {

// Straight-alpha color, components in [0, 1].
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    static constexpr Color rgba8(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
        return Color{r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
    }

    Color withAlpha(float alpha) const { return Color{r, g, b, alpha}; }

    bool operator==(const Color&) const = default;
};

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

struct Rect {
    float x0 = 0.0f;
    float y0 = 0.0f;
    float x1 = 0.0f;
    float y1 = 0.0f;

    static Rect fromOriginSize(float x, float y, float w, float h) {
        return Rect{x, y, x + w, y + h};
    }

    float width() const { return x1 - x0; }
    float height() const { return y1 - y0; }
    Point center() const { return {(x0 + x1) * 0.5f, (y0 + y1) * 0.5f}; }
    bool contains(Point p) const { return p.x >= x0 && p.x < x1 && p.y >= y0 && p.y < y1; }
    Rect inset(float d) const { return Rect{x0 + d, y0 + d, x1 - d, y1 - d}; }
};

enum class PrimitiveKind : uint32_t {
    FillRect = 0,
    FillRoundedRect = 1,
    StrokeRoundedRect = 2,
    FillCircle = 3,
    StrokeLine = 4
};

// GPU layout, 48 bytes, matches `Prim` in the compute shader.
struct ScenePrimitive {
    PrimitiveKind kind;
    float strokeWidth;
    float radius;
    float _pad;
    float geom[4]; // rect x0,y0,x1,y1 | circle cx,cy | line ax,ay,bx,by
    Color color;
};
static_assert(sizeof(ScenePrimitive) == 48, "ScenePrimitive must match the WGSL struct");

//-----------------------------------------------------------------------------
// Scene - ordered list of primitives in physical pixels, painted back to front
//-----------------------------------------------------------------------------
class Scene {
public:
    void fillRect(const Rect& rect, Color color);
    void fillRoundedRect(const Rect& rect, float radius, Color color);
    void strokeRoundedRect(const Rect& rect, float radius, float width, Color color);
    void fillCircle(Point center, float radius, Color color);
    void strokeLine(Point a, Point b, float width, Color color);

    // Appends another scene translated by offset.
    void append(const Scene& other, Point offset = {});

    void reset() { _primitives.clear(); }

    const std::vector<ScenePrimitive>& primitives() const { return _primitives; }
    size_t size() const { return _primitives.size(); }
    bool empty() const { return _primitives.empty(); }

private:
    std::vector<ScenePrimitive> _primitives;
};

} // namespace plugview
