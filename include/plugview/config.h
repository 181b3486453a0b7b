#pragma once

#include <plugview/result.hpp>
#include <plugview/scene.h>
#include <plugview/host-window.h>
#include <plugview/surface-options.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace plugview {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then the config file, then PLUGVIEW_* environment, then
    // command line overrides.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Slash separated path, e.g. "window/width"
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // $XDG_CONFIG_HOME/plugview/config.yaml or ~/.config/plugview/config.yaml
    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "PLUGVIEW_";

    static constexpr const char* KEY_WINDOW_TITLE = "window/title";
    static constexpr const char* KEY_WINDOW_WIDTH = "window/width";
    static constexpr const char* KEY_WINDOW_HEIGHT = "window/height";
    static constexpr const char* KEY_WINDOW_SCALE = "window/scale";
    static constexpr const char* KEY_WINDOW_FRAME_RATE = "window/frame-rate";
    static constexpr const char* KEY_RENDER_BACKGROUND = "render/background";
    static constexpr const char* KEY_RENDER_PRESENT_MODE = "render/present-mode";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";

    WindowOpenOptions windowOpenOptions() const;
    Color backgroundColor() const;
    SurfaceOptions surfaceOptions() const;
    double frameRate() const;
    std::string logLevel() const;

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // "window/frame-rate" -> "PLUGVIEW_WINDOW_FRAME_RATE"
    static std::string pathToEnvVar(const std::string& path);

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

// "#rrggbb" or "#rrggbbaa"
Result<Color> parseColor(const std::string& text) noexcept;

} // namespace plugview
