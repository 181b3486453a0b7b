//=============================================================================
// plugview-hello
//
// Opens a top-level window with a small widget tree and blocks until it is
// closed.
//=============================================================================

#include "hello-root.h"
#include <plugview/config.h>
#include <plugview/plugview-window.h>
#include <ytrace/ytrace.hpp>
#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <iostream>

using namespace plugview;

static Result<Config::Ptr> parseArgs(int argc, char* argv[]) noexcept {
    args::ArgumentParser parser("plugview-hello - widget tree in a WebGPU window");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path",
                                            {'c', "config"});
    args::ValueFlag<uint32_t> widthArg(parser, "width", "Logical window width",
                                       {'W', "width"});
    args::ValueFlag<uint32_t> heightArg(parser, "height", "Logical window height",
                                        {'H', "height"});
    args::ValueFlag<std::string> titleArg(parser, "title", "Window title", {"title"});
    args::ValueFlag<std::string> scaleArg(parser, "scale",
                                          "Scale factor, or 'system'", {"scale"});
    args::ValueFlag<std::string> presentArg(parser, "mode",
                                            "Present mode: fifo, mailbox, immediate",
                                            {"present-mode"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return Err<Config::Ptr>("Help requested");
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return Err<Config::Ptr>(std::string("Parse error: ") + e.what());
    }

    // Build command line overrides for config
    YAML::Node cmdOverrides;
    if (widthArg) {
        cmdOverrides["window"]["width"] = args::get(widthArg);
    }
    if (heightArg) {
        cmdOverrides["window"]["height"] = args::get(heightArg);
    }
    if (titleArg) {
        cmdOverrides["window"]["title"] = args::get(titleArg);
    }
    if (scaleArg) {
        cmdOverrides["window"]["scale"] = args::get(scaleArg);
    }
    if (presentArg) {
        cmdOverrides["render"]["present-mode"] = args::get(presentArg);
    }

    std::string configPath = configFile ? args::get(configFile) : "";
    auto configResult = Config::create(configPath, cmdOverrides);
    if (!configResult) {
        return Err<Config::Ptr>("Failed to create config", configResult);
    }
    return configResult;
}

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);

    auto configResult = parseArgs(argc, argv);
    if (!configResult) {
        if (configResult.error().message() == "Help requested") {
            return 0;
        }
        yerror("Failed to initialize plugview-hello: {}", error_msg(configResult));
        return 1;
    }
    auto config = *configResult;

    spdlog::set_level(spdlog::level::from_str(config->logLevel()));
    // SPDLOG_LEVEL wins over the config file
    spdlog::cfg::load_env_levels();

    SessionOptions sessionOptions;
    sessionOptions.background = config->backgroundColor();
    sessionOptions.surface = config->surfaceOptions();

    auto backendResult = HostBackend::createDefault(config->frameRate());
    if (!backendResult) {
        yerror("Failed to create host backend: {}", error_msg(backendResult));
        return 1;
    }

    yinfo("Opening window...");
    auto res = PlugviewWindow::openBlocking(
        config->windowOpenOptions(),
        [] { return WidgetRoot::Ptr(new demo::HelloRoot()); },
        sessionOptions, *backendResult);
    if (!res) {
        yerror("Window failed: {}", error_msg(res));
        return 1;
    }
    yinfo("Window closed.");
    return 0;
}
