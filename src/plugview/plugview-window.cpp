#include <plugview/plugview-window.h>
#include <plugview/one-shot.h>
#include <ytrace/ytrace.hpp>

namespace plugview {

HandlerFactory PlugviewWindow::makeHandlerFactory(WidgetBuilder builder,
                                                  SessionOptions sessionOptions) {
    auto slot = std::make_shared<OneShot<WidgetBuilder>>(std::move(builder));
    return [slot, sessionOptions](HostWindow& window)
               -> Result<std::unique_ptr<WindowHandler>> {
        auto taken = slot->take();
        if (!taken) {
            return Err<std::unique_ptr<WindowHandler>>("Widget builder was already consumed");
        }
        std::unique_ptr<WindowHandler> session = std::make_unique<WindowSession>(
            std::move(*taken), window.logicalSize(), sessionOptions);
        return Ok(std::move(session));
    };
}

static Result<HostBackend::Ptr> resolveBackend(HostBackend::Ptr backend) {
    if (backend) {
        return Ok(std::move(backend));
    }
    return HostBackend::createDefault();
}

Result<PlugviewWindowHandle> PlugviewWindow::openParented(const NativeWindowHandle& parent,
                                                          const WindowOpenOptions& options,
                                                          WidgetBuilder builder,
                                                          SessionOptions sessionOptions,
                                                          HostBackend::Ptr backend) noexcept {
    if (!builder) {
        return Err<PlugviewWindowHandle>("No widget builder given");
    }
    auto backendRes = resolveBackend(std::move(backend));
    if (!backendRes) {
        return Err<PlugviewWindowHandle>("Failed to create host backend", backendRes);
    }

    yinfo("Opening parented window '{}' ({}x{}) in {} parent", options.title,
          options.size.width, options.size.height, toString(parent.platform));
    auto res = (*backendRes)->openParented(
        parent, options, makeHandlerFactory(std::move(builder), std::move(sessionOptions)));
    if (!res) {
        return Err<PlugviewWindowHandle>("Failed to open parented window", res);
    }
    return res;
}

Result<void> PlugviewWindow::openBlocking(const WindowOpenOptions& options,
                                          WidgetBuilder builder,
                                          SessionOptions sessionOptions,
                                          HostBackend::Ptr backend) noexcept {
    if (!builder) {
        return Err<void>("No widget builder given");
    }
    auto backendRes = resolveBackend(std::move(backend));
    if (!backendRes) {
        return Err<void>("Failed to create host backend", backendRes);
    }

    yinfo("Opening window '{}' ({}x{})", options.title, options.size.width, options.size.height);
    auto res = (*backendRes)->openBlocking(
        options, makeHandlerFactory(std::move(builder), std::move(sessionOptions)));
    if (!res) {
        return Err<void>("Window loop failed", res);
    }
    return Ok();
}

} // namespace plugview
