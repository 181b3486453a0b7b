#include <plugview/host-window.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <GLFW/glfw3.h>

#if defined(_WIN32)
#define GLFW_EXPOSE_NATIVE_WIN32
#include <GLFW/glfw3native.h>
#elif PLUGVIEW_HAS_X11
#define GLFW_EXPOSE_NATIVE_X11
#include <GLFW/glfw3native.h>
#include <X11/Xlib.h>
#endif

namespace plugview {

namespace {

uint32_t translateGlfwMods(int mods) {
    uint32_t out = 0;
    if (mods & GLFW_MOD_SHIFT) out |= keymod::Shift;
    if (mods & GLFW_MOD_CONTROL) out |= keymod::Control;
    if (mods & GLFW_MOD_ALT) out |= keymod::Alt;
    if (mods & GLFW_MOD_SUPER) out |= keymod::Meta;
    if (mods & GLFW_MOD_CAPS_LOCK) out |= keymod::CapsLock;
    if (mods & GLFW_MOD_NUM_LOCK) out |= keymod::NumLock;
    return out;
}

MouseButton translateGlfwButton(int button) {
    switch (button) {
    case GLFW_MOUSE_BUTTON_LEFT: return MouseButton::Left;
    case GLFW_MOUSE_BUTTON_RIGHT: return MouseButton::Right;
    case GLFW_MOUSE_BUTTON_MIDDLE: return MouseButton::Middle;
    case GLFW_MOUSE_BUTTON_4: return MouseButton::Back;
    case GLFW_MOUSE_BUTTON_5: return MouseButton::Forward;
    default: return MouseButton::Other;
    }
}

void glfwErrorCallback(int code, const char* description) {
    yerror("GLFW error {}: {}", code, description ? description : "");
}

} // namespace

// =============================================================================
// GlfwWindow - one native window plus the handler it feeds
// =============================================================================

class GlfwWindow : public HostWindow {
public:
    static Result<std::unique_ptr<GlfwWindow>> create(const WindowOpenOptions& options,
                                                      bool embedded) noexcept {
        glfwDefaultWindowHints();
        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_SCALE_TO_MONITOR, options.scale.isSystem() ? GLFW_TRUE : GLFW_FALSE);
        if (embedded) {
            glfwWindowHint(GLFW_DECORATED, GLFW_FALSE);
            glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
        }

        double factor = options.scale.isSystem() ? 1.0 : options.scale.factor();
        int width = std::max(1, static_cast<int>(options.size.width * factor));
        int height = std::max(1, static_cast<int>(options.size.height * factor));

        GLFWwindow* handle = glfwCreateWindow(width, height, options.title.c_str(), nullptr, nullptr);
        if (!handle) {
            return Err<std::unique_ptr<GlfwWindow>>("Failed to create GLFW window");
        }
        auto window = std::unique_ptr<GlfwWindow>(new GlfwWindow(handle, options.scale));
        yinfo("GLFW window created: {}x{} '{}'", width, height, options.title);
        return Ok(std::move(window));
    }

    ~GlfwWindow() override {
        finish();
        if (_window) {
            glfwDestroyWindow(_window);
            _window = nullptr;
        }
    }

    NativeWindowHandle nativeHandle() const override {
        return NativeWindowHandle::glfw(_window);
    }

    double scaleFactor() const override {
        if (!_policy.isSystem()) {
            return _policy.factor();
        }
        float xscale = 1.0f;
        float yscale = 1.0f;
        glfwGetWindowContentScale(_window, &xscale, &yscale);
        return xscale > 0.0f ? xscale : 1.0;
    }

    Size logicalSize() const override {
        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(_window, &width, &height);
        double scale = scaleFactor();
        return Size{width / scale, height / scale};
    }

    void close() override {
        glfwSetWindowShouldClose(_window, GLFW_TRUE);
    }

    bool shouldClose() const {
        return glfwWindowShouldClose(_window);
    }

    GLFWwindow* glfwHandle() const { return _window; }

    Result<void> attach(const HandlerFactory& factory) {
        auto res = factory(*this);
        if (!res) {
            return Err<void>("Window handler factory failed", res);
        }
        _handler = std::move(*res);

        glfwSetWindowUserPointer(_window, this);
        glfwSetKeyCallback(_window, keyCallbackStatic);
        glfwSetCharCallback(_window, charCallbackStatic);
        glfwSetMouseButtonCallback(_window, mouseButtonCallbackStatic);
        glfwSetCursorPosCallback(_window, cursorPosCallbackStatic);
        glfwSetCursorEnterCallback(_window, cursorEnterCallbackStatic);
        glfwSetScrollCallback(_window, scrollCallbackStatic);
        glfwSetFramebufferSizeCallback(_window, framebufferSizeCallbackStatic);
        glfwSetWindowContentScaleCallback(_window, contentScaleCallbackStatic);
        glfwSetWindowFocusCallback(_window, windowFocusCallbackStatic);

        // Hosts report the initial size the same way as later changes.
        deliverResize();
        return Ok();
    }

    void frame() {
        if (_handler && !_finished) {
            _handler->onFrame(*this);
        }
    }

    // Sends WillClose once and drops the handler while the window still exists.
    void finish() {
        if (_finished) {
            return;
        }
        _finished = true;
        if (_handler) {
            deliver(HostEvent::willClose());
            _handler.reset();
        }
    }

private:
    GlfwWindow(GLFWwindow* window, WindowScalePolicy policy)
        : _window(window), _policy(policy) {}

    void deliver(const HostEvent& event) {
        if (_handler) {
            _handler->onEvent(*this, event);
        }
    }

    void deliverResize() {
        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(_window, &width, &height);
        deliver(HostEvent::resized(static_cast<uint32_t>(std::max(width, 0)),
                                   static_cast<uint32_t>(std::max(height, 0)),
                                   scaleFactor()));
    }

    // Window coordinates to framebuffer pixels.
    double pixelRatio() const {
        int winWidth = 0;
        int winHeight = 0;
        int fbWidth = 0;
        int fbHeight = 0;
        glfwGetWindowSize(_window, &winWidth, &winHeight);
        glfwGetFramebufferSize(_window, &fbWidth, &fbHeight);
        return winWidth > 0 ? static_cast<double>(fbWidth) / winWidth : 1.0;
    }

    //-------------------------------------------------------------------------
    // GLFW callbacks
    //-------------------------------------------------------------------------
    static GlfwWindow* self(GLFWwindow* window) {
        return static_cast<GlfwWindow*>(glfwGetWindowUserPointer(window));
    }

    static void keyCallbackStatic(GLFWwindow* window, int key, int scancode, int action, int mods) {
        auto* w = self(window);
        w->_mods = translateGlfwMods(mods);
        KeyboardEvent ev{};
        ev.state = action == GLFW_RELEASE ? KeyState::Up : KeyState::Down;
        ev.key = key;
        ev.scancode = scancode;
        ev.codepoint = 0;
        ev.repeat = action == GLFW_REPEAT;
        ev.modifiers = w->_mods;
        w->deliver(HostEvent::keyboardEvent(ev));
    }

    // Text arrives separately from key codes in GLFW.
    static void charCallbackStatic(GLFWwindow* window, unsigned int codepoint) {
        auto* w = self(window);
        KeyboardEvent ev{};
        ev.state = KeyState::Down;
        ev.key = GLFW_KEY_UNKNOWN;
        ev.codepoint = codepoint;
        ev.modifiers = w->_mods;
        w->deliver(HostEvent::keyboardEvent(ev));
    }

    static void mouseButtonCallbackStatic(GLFWwindow* window, int button, int action, int mods) {
        auto* w = self(window);
        w->_mods = translateGlfwMods(mods);
        auto mapped = translateGlfwButton(button);
        auto index = static_cast<uint8_t>(button);
        if (action == GLFW_PRESS) {
            w->deliver(HostEvent::buttonPressed(mapped, w->_mods, index));
        } else if (action == GLFW_RELEASE) {
            w->deliver(HostEvent::buttonReleased(mapped, w->_mods, index));
        }
    }

    static void cursorPosCallbackStatic(GLFWwindow* window, double x, double y) {
        auto* w = self(window);
        double ratio = w->pixelRatio();
        w->deliver(HostEvent::cursorMoved(x * ratio, y * ratio, w->_mods));
    }

    static void cursorEnterCallbackStatic(GLFWwindow* window, int entered) {
        auto* w = self(window);
        w->deliver(entered ? HostEvent::cursorEntered() : HostEvent::cursorLeft());
    }

    static void scrollCallbackStatic(GLFWwindow* window, double xoffset, double yoffset) {
        auto* w = self(window);
        w->deliver(HostEvent::wheelScrolled(ScrollUnit::Lines, static_cast<float>(xoffset),
                                            static_cast<float>(yoffset), w->_mods));
    }

    static void framebufferSizeCallbackStatic(GLFWwindow* window, int, int) {
        self(window)->deliverResize();
    }

    static void contentScaleCallbackStatic(GLFWwindow* window, float, float) {
        self(window)->deliverResize();
    }

    static void windowFocusCallbackStatic(GLFWwindow* window, int focused) {
        auto* w = self(window);
        w->deliver(focused ? HostEvent::focused() : HostEvent::unfocused());
    }

    GLFWwindow* _window = nullptr;
    WindowScalePolicy _policy;
    std::unique_ptr<WindowHandler> _handler;
    uint32_t _mods = 0;
    bool _finished = false;
};

//-----------------------------------------------------------------------------
// Embedding into a host window
//-----------------------------------------------------------------------------

static Result<void> embedIntoParent(GlfwWindow& child, const NativeWindowHandle& parent) {
    using Platform = NativeWindowHandle::Platform;
    if (!parent.valid()) {
        return Err<void>(std::string("Invalid ") + toString(parent.platform) + " parent handle");
    }
#if defined(_WIN32)
    if (parent.platform == Platform::Win32) {
        HWND hwnd = glfwGetWin32Window(child.glfwHandle());
        LONG_PTR style = GetWindowLongPtr(hwnd, GWL_STYLE);
        style = (style & ~static_cast<LONG_PTR>(WS_POPUP | WS_OVERLAPPEDWINDOW)) | WS_CHILD;
        SetWindowLongPtr(hwnd, GWL_STYLE, style);
        if (!SetParent(hwnd, static_cast<HWND>(parent.surface))) {
            return Err<void>("SetParent failed");
        }
        glfwShowWindow(child.glfwHandle());
        return Ok();
    }
#elif PLUGVIEW_HAS_X11
    if (parent.platform == Platform::Xlib || parent.platform == Platform::Xcb) {
        Display* display = glfwGetX11Display();
        if (!display) {
            return Err<void>("GLFW is not running on X11");
        }
        ::Window childWindow = glfwGetX11Window(child.glfwHandle());
        XReparentWindow(display, childWindow, static_cast<::Window>(parent.window), 0, 0);
        XMapWindow(display, childWindow);
        XFlush(display);
        return Ok();
    }
#endif
    return Err<void>(std::string("Cannot embed into a ") + toString(parent.platform) +
                     " parent on this platform");
}

// =============================================================================
// GlfwHostBackend
//
// Blocking windows run on the caller's thread. Parented windows share one
// detached window thread; other threads talk to it through a task queue and
// glfwPostEmptyEvent. While that thread runs it holds a reference to the
// backend, so parented windows outlive the handles returned for them. The
// thread exits once it has no windows and it holds the last reference.
// =============================================================================

class GlfwHostBackend : public HostBackend,
                        public std::enable_shared_from_this<GlfwHostBackend> {
public:
    explicit GlfwHostBackend(double frameRate)
        : _framePeriod(std::chrono::duration_cast<std::chrono::steady_clock::duration>(
              std::chrono::duration<double>(1.0 / std::max(frameRate, 1.0)))) {}

    // Only reached once the window thread has let go of the backend.
    ~GlfwHostBackend() override = default;

    Result<void> openBlocking(const WindowOpenOptions& options, HandlerFactory factory) override {
        if (_threadRunning) {
            return Err<void>("Cannot open a blocking window while parented windows are running");
        }
        std::lock_guard<std::mutex> glfwLock(glfwLifetimeMutex());
        glfwSetErrorCallback(glfwErrorCallback);
        if (!glfwInit()) {
            return Err<void>("Failed to initialize GLFW");
        }

        Result<void> result = Ok();
        {
            auto windowRes = GlfwWindow::create(options, false);
            if (!windowRes) {
                glfwTerminate();
                return Err<void>("Failed to open window", windowRes);
            }
            auto window = std::move(*windowRes);
            if (auto res = window->attach(factory); !res) {
                result = res;
            } else {
                auto nextFrame = std::chrono::steady_clock::now();
                while (!window->shouldClose()) {
                    waitUntil(nextFrame);
                    auto now = std::chrono::steady_clock::now();
                    if (now >= nextFrame) {
                        window->frame();
                        nextFrame = advanceFrame(nextFrame, now);
                    }
                }
                window->finish();
            }
        }
        glfwTerminate();
        yinfo("Blocking window loop finished");
        return result;
    }

    Result<WindowHandle::Ptr> openParented(const NativeWindowHandle& parent,
                                           const WindowOpenOptions& options,
                                           HandlerFactory factory) override {
        if (auto res = startThread(); !res) {
            return Err<WindowHandle::Ptr>("Failed to start window thread", res);
        }

        auto open = std::make_shared<std::atomic<bool>>(false);
        uint64_t id = _nextWindowId++;
        auto handle = WindowHandle::Ptr(std::make_shared<Handle>(shared_from_this(), id, open));

        auto task = [this, parent, options, factory = std::move(factory), open, id]() -> Result<void> {
            auto windowRes = GlfwWindow::create(options, true);
            if (!windowRes) {
                return Err<void>("Failed to create child window", windowRes);
            }
            auto window = std::move(*windowRes);
            if (auto res = embedIntoParent(*window, parent); !res) {
                return res;
            }
            if (auto res = window->attach(factory); !res) {
                return res;
            }
            open->store(true);
            _windows.push_back(ManagedWindow{id, std::move(window), open});
            return Ok();
        };

        // From a callback on the window thread the window list may be in use
        // and nobody else can run the queue: create the window after this
        // iteration and report failures through the log.
        if (onWindowThread()) {
            post([task = std::move(task), id]() {
                if (auto res = task(); !res) {
                    yerror("Failed to open parented window {}: {}", id, error_msg(res));
                }
            });
            return Ok(std::move(handle));
        }

        auto promise = std::make_shared<std::promise<Result<void>>>();
        auto future = promise->get_future();
        post([task = std::move(task), promise]() mutable { promise->set_value(task()); });
        Result<void> created = future.get();
        if (!created) {
            return Err<WindowHandle::Ptr>("Failed to open parented window", created);
        }
        return Ok(std::move(handle));
    }

private:
    struct ManagedWindow {
        uint64_t id;
        std::unique_ptr<GlfwWindow> window;
        std::shared_ptr<std::atomic<bool>> open;
    };

    class Handle : public WindowHandle {
    public:
        Handle(std::shared_ptr<GlfwHostBackend> backend, uint64_t id,
               std::shared_ptr<std::atomic<bool>> open)
            : _backend(std::move(backend)), _id(id), _open(std::move(open)) {}

        void close() override {
            if (!_open->load()) {
                return;
            }
            auto* backend = _backend.get();
            uint64_t id = _id;
            backend->post([backend, id]() { backend->closeWindow(id); });
        }

        bool isOpen() const override { return _open->load(); }

    private:
        std::shared_ptr<GlfwHostBackend> _backend;
        uint64_t _id;
        std::shared_ptr<std::atomic<bool>> _open;
    };

    using Task = std::function<void()>;

    // Guards createDefault's registry against the window thread deciding to exit.
    static std::mutex& registryMutex() {
        static std::mutex mutex;
        return mutex;
    }

    static std::weak_ptr<GlfwHostBackend>& registry() {
        static std::weak_ptr<GlfwHostBackend> backend;
        return backend;
    }

    // glfwInit/glfwTerminate of successive window threads must not overlap.
    static std::mutex& glfwLifetimeMutex() {
        static std::mutex mutex;
        return mutex;
    }

    bool onWindowThread() const {
        return _threadRunning && std::this_thread::get_id() == _threadId.load();
    }

    void waitUntil(std::chrono::steady_clock::time_point deadline) {
        auto now = std::chrono::steady_clock::now();
        if (deadline <= now) {
            glfwPollEvents();
            return;
        }
        glfwWaitEventsTimeout(std::chrono::duration<double>(deadline - now).count());
    }

    std::chrono::steady_clock::time_point advanceFrame(std::chrono::steady_clock::time_point next,
                                                       std::chrono::steady_clock::time_point now) {
        next += _framePeriod;
        // Skip missed frames instead of bursting.
        if (next < now) {
            next = now + _framePeriod;
        }
        return next;
    }

    Result<void> startThread() {
        std::unique_lock<std::mutex> lock(_startMutex);
        if (_threadRunning) {
            return Ok();
        }
        _startResult.reset();
        _self = shared_from_this();
        std::thread([this]() { threadMain(); }).detach();
        _startCv.wait(lock, [this]() { return _startResult.has_value(); });
        return *_startResult;
    }

    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(_taskMutex);
            _tasks.push_back(std::move(task));
        }
        if (_threadRunning) {
            glfwPostEmptyEvent();
        }
    }

    void closeWindow(uint64_t id) {
        for (auto& managed : _windows) {
            if (managed.id == id) {
                managed.window->close();
            }
        }
    }

    void runTasks() {
        std::deque<Task> tasks;
        {
            std::lock_guard<std::mutex> lock(_taskMutex);
            tasks.swap(_tasks);
        }
        for (auto& task : tasks) {
            task();
        }
    }

    void reapClosedWindows() {
        // Closing handlers may post new windows; finish them off the list.
        std::vector<ManagedWindow> closed;
        for (auto it = _windows.begin(); it != _windows.end();) {
            if (!it->window->shouldClose()) {
                ++it;
                continue;
            }
            closed.push_back(std::move(*it));
            it = _windows.erase(it);
        }
        for (auto& managed : closed) {
            managed.window->finish();
            managed.window.reset();
            managed.open->store(false);
        }
    }

    // True when no window is left and nothing outside this thread can reach
    // the backend any more; createDefault will then build a new one.
    bool idleAndUnowned() {
        if (!_windows.empty()) {
            return false;
        }
        std::lock_guard<std::mutex> registryLock(registryMutex());
        {
            std::lock_guard<std::mutex> taskLock(_taskMutex);
            if (!_tasks.empty()) {
                return false;
            }
        }
        if (_self.use_count() > 1) {
            return false;
        }
        registry().reset();
        return true;
    }

    void threadMain() {
        std::unique_lock<std::mutex> glfwLock(glfwLifetimeMutex());
        glfwSetErrorCallback(glfwErrorCallback);
        bool initialized = glfwInit();
        {
            std::lock_guard<std::mutex> lock(_startMutex);
            _threadId = std::this_thread::get_id();
            _startResult = initialized ? Ok() : Err<void>("Failed to initialize GLFW");
            _threadRunning = initialized;
        }
        _startCv.notify_all();
        if (!initialized) {
            glfwLock.unlock();
            auto self = std::move(_self);
            return;
        }
        yinfo("GLFW window thread started");

        auto nextFrame = std::chrono::steady_clock::now();
        while (!idleAndUnowned()) {
            runTasks();
            waitUntil(nextFrame);
            runTasks();

            auto now = std::chrono::steady_clock::now();
            if (now >= nextFrame) {
                for (auto& managed : _windows) {
                    managed.window->frame();
                }
                nextFrame = advanceFrame(nextFrame, now);
            }
            reapClosedWindows();
        }

        _threadRunning = false;
        glfwTerminate();
        glfwLock.unlock();
        yinfo("GLFW window thread stopped");

        // Last reference: the backend is destroyed here, on a detached thread
        // that no longer touches it.
        auto self = std::move(_self);
    }

    std::chrono::steady_clock::duration _framePeriod;

    std::shared_ptr<GlfwHostBackend> _self; // held while the window thread runs
    std::atomic<std::thread::id> _threadId{};
    std::atomic<bool> _threadRunning{false};
    std::mutex _startMutex;
    std::condition_variable _startCv;
    std::optional<Result<void>> _startResult;

    std::mutex _taskMutex;
    std::deque<Task> _tasks;

    // Window thread only.
    std::vector<ManagedWindow> _windows;
    std::atomic<uint64_t> _nextWindowId{1};

    friend class HostBackend;
};

Result<HostBackend::Ptr> HostBackend::createDefault(double frameRate) noexcept {
    // Parented windows of all plugin instances share one window thread.
    std::lock_guard<std::mutex> lock(GlfwHostBackend::registryMutex());
    if (auto backend = GlfwHostBackend::registry().lock()) {
        return Ok(HostBackend::Ptr(backend));
    }
    auto backend = std::make_shared<GlfwHostBackend>(frameRate);
    GlfwHostBackend::registry() = backend;
    return Ok(HostBackend::Ptr(backend));
}

} // namespace plugview
