//=============================================================================
// Scene Tests
//=============================================================================

#include <boost/ut.hpp>
#include <plugview/scene.h>

using namespace boost::ut;
using namespace plugview;

suite scene_tests = [] {
    "primitives keep paint order"_test = [] {
        Scene scene;
        scene.fillRect(Rect::fromOriginSize(0, 0, 10, 10), Color::rgba8(255, 0, 0));
        scene.fillCircle({5, 5}, 3, Color::rgba8(0, 255, 0));
        scene.strokeLine({0, 0}, {10, 10}, 2, Color::rgba8(0, 0, 255));

        expect((scene.size() == 3_ul) >> fatal);
        expect(scene.primitives()[0].kind == PrimitiveKind::FillRect);
        expect(scene.primitives()[1].kind == PrimitiveKind::FillCircle);
        expect(scene.primitives()[2].kind == PrimitiveKind::StrokeLine);
        expect(eq(scene.primitives()[2].strokeWidth, 2.0f));
    };

    "rect geometry is normalized"_test = [] {
        Scene scene;
        scene.fillRoundedRect(Rect{20, 30, 10, 5}, -4, Color{});
        const auto& p = scene.primitives().front();
        expect(eq(p.geom[0], 10.0f));
        expect(eq(p.geom[1], 5.0f));
        expect(eq(p.geom[2], 20.0f));
        expect(eq(p.geom[3], 30.0f));
        expect(eq(p.radius, 0.0f));
    };

    "degenerate strokes and circles are dropped"_test = [] {
        Scene scene;
        scene.fillCircle({1, 1}, 0, Color{});
        scene.strokeLine({0, 0}, {1, 1}, 0, Color{});
        scene.strokeRoundedRect(Rect{0, 0, 4, 4}, 1, 0, Color{});
        expect(scene.empty());
    };

    "append translates"_test = [] {
        Scene child;
        child.fillRect(Rect{0, 0, 2, 2}, Color{});
        child.fillCircle({1, 1}, 1, Color{});

        Scene parent;
        parent.append(child, {10, 20});
        expect((parent.size() == 2_ul) >> fatal);
        const auto& rect = parent.primitives()[0];
        expect(eq(rect.geom[0], 10.0f));
        expect(eq(rect.geom[3], 22.0f));
        const auto& circle = parent.primitives()[1];
        expect(eq(circle.geom[0], 11.0f));
        expect(eq(circle.geom[1], 21.0f));
        expect(eq(circle.geom[2], 0.0f));

        parent.reset();
        expect(parent.empty());
    };

    "rect helpers"_test = [] {
        auto r = Rect::fromOriginSize(10, 10, 20, 40);
        expect(eq(r.width(), 20.0f));
        expect(eq(r.height(), 40.0f));
        expect(eq(r.center().x, 20.0f));
        expect(r.contains({10, 10}));
        expect(!r.contains({30, 10}));
        expect(eq(r.inset(5).width(), 10.0f));
    };

    "color conversion"_test = [] {
        auto c = Color::rgba8(255, 0, 51, 255);
        expect(eq(c.r, 1.0f));
        expect(eq(c.g, 0.0f));
        expect(eq(c.b, 0.2f));
        expect(eq(c.withAlpha(0.5f).a, 0.5f));
    };
};
