//=============================================================================
// PlugviewWindow Tests
//
// Entry points against an in-process backend: builder hand-off, one-shot
// factory, error propagation, handle and backend lifetime.
//=============================================================================

#include <boost/ut.hpp>
#include "harness/session_harness.h"
#include <plugview/one-shot.h>

using namespace boost::ut;
using namespace plugview;
using namespace plugview::test;

suite plugview_window_tests = [] {
    "blocking window builds the tree exactly once"_test = [] {
        for (int frames : {1, 2, 60, 500}) {
            auto backend = std::make_shared<FakeHostBackend>();
            backend->framesPerWindow = frames;
            auto surface = std::make_shared<SurfaceStats>();
            auto root = std::make_shared<RootStats>();
            auto builds = std::make_shared<int>(0);

            SessionOptions opts;
            opts.surfaceFactory = mockSurfaceFactory(surface);

            auto res = PlugviewWindow::openBlocking(WindowOpenOptions{},
                                                    countingBuilder(builds, root), opts, backend);
            expect(res.has_value()) << error_msg(res);
            expect(*builds == 1_i);
            expect(surface->renders == frames);
            expect(backend->openBlockingCalls == 1_i);
        }
    };

    "options are forwarded to the backend"_test = [] {
        auto backend = std::make_shared<FakeHostBackend>();
        backend->framesPerWindow = 0;
        WindowOpenOptions options;
        options.title = "synth";
        options.size = {640.0, 480.0};
        options.scale = WindowScalePolicy::scaleFactor(1.25);

        SessionOptions opts;
        opts.surfaceFactory = mockSurfaceFactory(std::make_shared<SurfaceStats>());
        auto res = PlugviewWindow::openBlocking(
            options, countingBuilder(std::make_shared<int>(0), std::make_shared<RootStats>()),
            opts, backend);
        expect(res.has_value());
        expect(backend->lastOptions.title == "synth");
        expect(eq(backend->lastOptions.size.width, 640.0));
        expect(!backend->lastOptions.scale.isSystem());
        expect(eq(backend->lastOptions.scale.factor(), 1.25));
    };

    "missing builder is rejected before the backend"_test = [] {
        auto backend = std::make_shared<FakeHostBackend>();
        auto res = PlugviewWindow::openBlocking(WindowOpenOptions{}, WidgetBuilder{}, {}, backend);
        expect(!res.has_value());
        expect(backend->openBlockingCalls == 0_i);

        auto parented = PlugviewWindow::openParented(NativeWindowHandle::xlib(nullptr, 1),
                                                     WindowOpenOptions{}, WidgetBuilder{}, {},
                                                     backend);
        expect(!parented.has_value());
        expect(backend->openParentedCalls == 0_i);
    };

    "backend failure carries its cause"_test = [] {
        auto backend = std::make_shared<FakeHostBackend>();
        backend->failOpen = true;
        auto res = PlugviewWindow::openBlocking(
            WindowOpenOptions{},
            countingBuilder(std::make_shared<int>(0), std::make_shared<RootStats>()), {},
            backend);
        expect(!res.has_value());
        expect(error_msg(res) == "Window loop failed: No display available");
    };

    "parented window returns an open handle"_test = [] {
        auto backend = std::make_shared<FakeHostBackend>();
        auto surface = std::make_shared<SurfaceStats>();
        auto builds = std::make_shared<int>(0);
        SessionOptions opts;
        opts.surfaceFactory = mockSurfaceFactory(surface);

        WindowOpenOptions options;
        options.size = {320.0, 200.0};
        auto res = PlugviewWindow::openParented(NativeWindowHandle::xlib(nullptr, 42), options,
                                                countingBuilder(builds, std::make_shared<RootStats>()),
                                                opts, backend);
        expect((res.has_value()) >> fatal);
        auto handle = *res;
        expect(handle->isOpen());
        expect(*builds == 0_i) << "builder waits for the first frame";

        backend->parentedHandler->onFrame(*backend->parentedWindow);
        backend->parentedHandler->onFrame(*backend->parentedWindow);
        expect(*builds == 1_i);
        expect(surface->renders == 2_i);

        handle->close();
        expect(!handle->isOpen());
    };

    "parented window keeps running after its handle is dropped"_test = [] {
        auto backend = std::make_shared<FakeHostBackend>();
        auto surface = std::make_shared<SurfaceStats>();
        auto root = std::make_shared<RootStats>();
        SessionOptions opts;
        opts.surfaceFactory = mockSurfaceFactory(surface);

        std::weak_ptr<WindowHandle> weakHandle;
        {
            auto res = PlugviewWindow::openParented(NativeWindowHandle::xlib(nullptr, 42),
                                                    WindowOpenOptions{},
                                                    countingBuilder(std::make_shared<int>(0), root),
                                                    opts, backend);
            expect((res.has_value()) >> fatal);
            weakHandle = *res;
        }
        expect(weakHandle.expired());

        backend->runParentedFrames(5);
        expect(surface->renders == 5_i);
        expect(backend->parentedOpen);
        expect(!backend->parentedWindow->closeRequested());
        expect(root->windowEvents.back() == "anim");
    };

    "handle keeps the backend alive"_test = [] {
        auto backend = std::make_shared<FakeHostBackend>();
        std::weak_ptr<FakeHostBackend> weakBackend = backend;
        PlugviewWindowHandle handle;
        {
            auto res = PlugviewWindow::openParented(
                NativeWindowHandle::xlib(nullptr, 7), WindowOpenOptions{},
                countingBuilder(std::make_shared<int>(0), std::make_shared<RootStats>()), {},
                backend);
            expect((res.has_value()) >> fatal);
            handle = *res;
        }

        backend.reset();
        expect(!weakBackend.expired());
        expect(handle->isOpen());

        handle->close();
        expect(!handle->isOpen());
        handle.reset();
        expect(weakBackend.expired());
    };

    "parented failure is reported"_test = [] {
        auto backend = std::make_shared<FakeHostBackend>();
        backend->failOpen = true;
        auto res = PlugviewWindow::openParented(
            NativeWindowHandle::wayland(nullptr, nullptr), WindowOpenOptions{},
            countingBuilder(std::make_shared<int>(0), std::make_shared<RootStats>()), {}, backend);
        expect(!res.has_value());
        expect(error_msg(res) == "Failed to open parented window: Parent window is not embeddable");
    };

    "handler factory hands out the builder once"_test = [] {
        auto builds = std::make_shared<int>(0);
        SessionOptions opts;
        opts.surfaceFactory = mockSurfaceFactory(std::make_shared<SurfaceStats>());
        auto factory = PlugviewWindow::makeHandlerFactory(
            countingBuilder(builds, std::make_shared<RootStats>()), opts);

        FakeHostWindow window({256.0, 128.0}, 1.0);
        auto first = factory(window);
        expect((first.has_value()) >> fatal);

        auto second = factory(window);
        expect(!second.has_value());
        expect(second.error().message() == "Widget builder was already consumed");

        auto* session = dynamic_cast<WindowSession*>(first->get());
        expect((session != nullptr) >> fatal);
        expect(eq(session->logicalSize().width, 256.0));
        expect(eq(session->logicalSize().height, 128.0));

        session->onFrame(window);
        session->onFrame(window);
        expect(*builds == 1_i);
    };

    "one-shot slot"_test = [] {
        OneShot<int> slot(7);
        expect(!slot.taken());
        auto first = slot.take();
        expect(first.has_value());
        expect(*first == 7_i);
        expect(slot.taken());
        expect(!slot.take().has_value());
    };
};
