#include <plugview/scene.h>
#include <algorithm>

namespace plugview {

static ScenePrimitive makeRectPrimitive(PrimitiveKind kind, const Rect& rect,
                                        float radius, float width, Color color) {
    ScenePrimitive p{};
    p.kind = kind;
    p.strokeWidth = width;
    p.radius = std::max(0.0f, radius);
    p.geom[0] = std::min(rect.x0, rect.x1);
    p.geom[1] = std::min(rect.y0, rect.y1);
    p.geom[2] = std::max(rect.x0, rect.x1);
    p.geom[3] = std::max(rect.y0, rect.y1);
    p.color = color;
    return p;
}

void Scene::fillRect(const Rect& rect, Color color) {
    _primitives.push_back(makeRectPrimitive(PrimitiveKind::FillRect, rect, 0.0f, 0.0f, color));
}

void Scene::fillRoundedRect(const Rect& rect, float radius, Color color) {
    _primitives.push_back(
        makeRectPrimitive(PrimitiveKind::FillRoundedRect, rect, radius, 0.0f, color));
}

void Scene::strokeRoundedRect(const Rect& rect, float radius, float width, Color color) {
    if (width <= 0.0f) {
        return;
    }
    _primitives.push_back(
        makeRectPrimitive(PrimitiveKind::StrokeRoundedRect, rect, radius, width, color));
}

void Scene::fillCircle(Point center, float radius, Color color) {
    if (radius <= 0.0f) {
        return;
    }
    ScenePrimitive p{};
    p.kind = PrimitiveKind::FillCircle;
    p.radius = radius;
    p.geom[0] = center.x;
    p.geom[1] = center.y;
    p.color = color;
    _primitives.push_back(p);
}

void Scene::strokeLine(Point a, Point b, float width, Color color) {
    if (width <= 0.0f) {
        return;
    }
    ScenePrimitive p{};
    p.kind = PrimitiveKind::StrokeLine;
    p.strokeWidth = width;
    p.geom[0] = a.x;
    p.geom[1] = a.y;
    p.geom[2] = b.x;
    p.geom[3] = b.y;
    p.color = color;
    _primitives.push_back(p);
}

void Scene::append(const Scene& other, Point offset) {
    _primitives.reserve(_primitives.size() + other._primitives.size());
    for (ScenePrimitive p : other._primitives) {
        p.geom[0] += offset.x;
        p.geom[1] += offset.y;
        // Circles only use the first point.
        if (p.kind != PrimitiveKind::FillCircle) {
            p.geom[2] += offset.x;
            p.geom[3] += offset.y;
        }
        _primitives.push_back(p);
    }
}

} // namespace plugview
