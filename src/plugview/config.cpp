#include <plugview/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace plugview {

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<void> Config::init() noexcept {
    loadDefaults();

    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            // An explicitly requested file must load.
            if (!_configPath.empty()) {
                return Err<void>("Failed to load config file " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["window"]["title"] = "plugview";
    _config["window"]["width"] = 400;
    _config["window"]["height"] = 300;
    _config["window"]["scale"] = "system";
    _config["window"]["frame-rate"] = 60;

    _config["render"]["background"] = "#1e1e23";
    _config["render"]["present-mode"] = "fifo";

    _config["log"]["level"] = "info";
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && fileConfig.IsMap()) {
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            ydebug("Config override from {}: {}", envVar, val);
            node[key] = std::string(val);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-' || c == '.') {
            envVar += '_';
        } else {
            envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (it->second.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], it->second);
        } else {
            target[key] = YAML::Clone(it->second);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    // reset() rebinds; const operator[] never inserts.
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next) {
            return YAML::Node();
        }
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::filesystem::path Config::getXDGConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "plugview" / "config.yaml";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "plugview" / "config.yaml";
    }
    return {};
}

//-----------------------------------------------------------------------------
// Typed views
//-----------------------------------------------------------------------------

WindowOpenOptions Config::windowOpenOptions() const {
    WindowOpenOptions options;
    options.title = get<std::string>(KEY_WINDOW_TITLE, "plugview");
    options.size.width = get<double>(KEY_WINDOW_WIDTH, 400.0);
    options.size.height = get<double>(KEY_WINDOW_HEIGHT, 300.0);

    auto scale = get<std::string>(KEY_WINDOW_SCALE, "system");
    if (scale == "system") {
        options.scale = WindowScalePolicy::systemScaleFactor();
    } else if (auto factor = get<double>(KEY_WINDOW_SCALE); factor && *factor > 0.0) {
        options.scale = WindowScalePolicy::scaleFactor(*factor);
    } else {
        ywarn("Invalid {} '{}', using the system scale factor", KEY_WINDOW_SCALE, scale);
    }
    return options;
}

Color Config::backgroundColor() const {
    auto text = get<std::string>(KEY_RENDER_BACKGROUND, "#1e1e23");
    auto color = parseColor(text);
    if (!color) {
        ywarn("Invalid {}: {}", KEY_RENDER_BACKGROUND, error_msg(color));
        return Color::rgba8(30, 30, 35, 255);
    }
    return *color;
}

SurfaceOptions Config::surfaceOptions() const {
    SurfaceOptions options;
    auto mode = parsePresentMode(get<std::string>(KEY_RENDER_PRESENT_MODE, "fifo"));
    if (!mode) {
        ywarn("{}, using fifo", error_msg(mode));
    } else {
        options.presentMode = *mode;
    }
    return options;
}

double Config::frameRate() const {
    double rate = get<double>(KEY_WINDOW_FRAME_RATE, 60.0);
    return rate > 0.0 ? rate : 60.0;
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

Result<Color> parseColor(const std::string& text) noexcept {
    std::string hex = text;
    if (!hex.empty() && hex[0] == '#') {
        hex.erase(0, 1);
    }
    if (hex.size() != 6 && hex.size() != 8) {
        return Err<Color>("Color must be #rrggbb or #rrggbbaa: " + text);
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Err<Color>("Invalid hex digit in color: " + text);
        }
    }
    auto byteAt = [&hex](size_t i) {
        return static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16));
    };
    uint8_t alpha = hex.size() == 8 ? byteAt(6) : 255;
    return Ok(Color::rgba8(byteAt(0), byteAt(2), byteAt(4), alpha));
}

} // namespace plugview
