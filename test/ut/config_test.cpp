//=============================================================================
// Config Tests
//
// Layering of defaults, config file, PLUGVIEW_* environment and command line
// overrides, plus the typed views the demo reads.
//=============================================================================

#include <boost/ut.hpp>
#include <plugview/config.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace boost::ut;
using namespace plugview;

namespace {

namespace fs = std::filesystem;

// Points XDG_CONFIG_HOME at an empty directory so a user config never leaks in.
struct IsolatedEnv {
    fs::path dir;

    IsolatedEnv() {
        dir = fs::temp_directory_path() / "plugview-config-test";
        fs::create_directories(dir);
        setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    }

    ~IsolatedEnv() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write(const std::string& name, const std::string& text) const {
        auto path = dir / name;
        std::ofstream out(path);
        out << text;
        return path;
    }
};

} // namespace

suite config_tests = [] {
    "defaults"_test = [] {
        IsolatedEnv env;
        auto res = Config::create();
        expect((res.has_value()) >> fatal) << error_msg(res);
        auto config = *res;

        expect(config->get<std::string>(Config::KEY_WINDOW_TITLE, "") == "plugview");
        expect(config->get<int>(Config::KEY_WINDOW_WIDTH, 0) == 400_i);
        expect(config->get<int>(Config::KEY_WINDOW_HEIGHT, 0) == 300_i);
        expect(eq(config->frameRate(), 60.0));
        expect(config->logLevel() == "info");
        expect(config->backgroundColor() == Color::rgba8(30, 30, 35, 255));
        expect(config->surfaceOptions().presentMode == PresentMode::Fifo);
        expect(config->windowOpenOptions().scale.isSystem());
        expect(!config->has("window/missing"));
        expect(!config->get<int>("nothing/here").has_value());
    };

    "config file overrides defaults"_test = [] {
        IsolatedEnv env;
        auto path = env.write("custom.yaml",
                              "window:\n"
                              "  title: Synth\n"
                              "  width: 800\n"
                              "  scale: 2\n"
                              "render:\n"
                              "  present-mode: mailbox\n");
        auto res = Config::create(path.string());
        expect((res.has_value()) >> fatal) << error_msg(res);
        auto options = (*res)->windowOpenOptions();
        expect(options.title == "Synth");
        expect(eq(options.size.width, 800.0));
        expect(eq(options.size.height, 300.0)) << "untouched keys keep their default";
        expect(!options.scale.isSystem());
        expect(eq(options.scale.factor(), 2.0));
        expect((*res)->surfaceOptions().presentMode == PresentMode::Mailbox);
    };

    "missing explicit file is an error"_test = [] {
        IsolatedEnv env;
        auto res = Config::create((env.dir / "does-not-exist.yaml").string());
        expect(!res.has_value());
    };

    "malformed file is an error"_test = [] {
        IsolatedEnv env;
        auto path = env.write("broken.yaml", "window: [unclosed\n");
        auto res = Config::create(path.string());
        expect(!res.has_value());
    };

    "xdg file is picked up"_test = [] {
        IsolatedEnv env;
        fs::create_directories(env.dir / "plugview");
        env.write("plugview/config.yaml", "log:\n  level: debug\n");
        expect(Config::getXDGConfigPath() == env.dir / "plugview" / "config.yaml");

        auto res = Config::create();
        expect((res.has_value()) >> fatal);
        expect((*res)->logLevel() == "debug");
    };

    "environment overrides file"_test = [] {
        IsolatedEnv env;
        auto path = env.write("env.yaml", "window:\n  frame-rate: 30\n");
        setenv("PLUGVIEW_WINDOW_FRAME_RATE", "120", 1);
        auto res = Config::create(path.string());
        unsetenv("PLUGVIEW_WINDOW_FRAME_RATE");

        expect((res.has_value()) >> fatal);
        expect(eq((*res)->frameRate(), 120.0));
    };

    "command line overrides environment"_test = [] {
        IsolatedEnv env;
        setenv("PLUGVIEW_WINDOW_TITLE", "from-env", 1);
        YAML::Node overrides;
        overrides["window"]["title"] = "from-cli";
        overrides["render"]["background"] = "#ff000080";
        auto res = Config::create("", overrides);
        unsetenv("PLUGVIEW_WINDOW_TITLE");

        expect((res.has_value()) >> fatal);
        expect((*res)->windowOpenOptions().title == "from-cli");
        expect((*res)->backgroundColor() == Color::rgba8(255, 0, 0, 128));
        expect((*res)->get<int>(Config::KEY_WINDOW_WIDTH, 0) == 400_i) << "siblings survive the merge";
    };

    "invalid values fall back"_test = [] {
        IsolatedEnv env;
        YAML::Node overrides;
        overrides["window"]["frame-rate"] = -5;
        overrides["window"]["scale"] = "huge";
        overrides["render"]["background"] = "teal";
        overrides["render"]["present-mode"] = "triple";
        auto res = Config::create("", overrides);
        expect((res.has_value()) >> fatal);
        auto config = *res;
        expect(eq(config->frameRate(), 60.0));
        expect(config->windowOpenOptions().scale.isSystem());
        expect(config->backgroundColor() == Color::rgba8(30, 30, 35, 255));
        expect(config->surfaceOptions().presentMode == PresentMode::Fifo);
    };

    "parse colors"_test = [] {
        expect(*parseColor("#000000") == Color::rgba8(0, 0, 0, 255));
        expect(*parseColor("1e1e23") == Color::rgba8(30, 30, 35, 255));
        expect(*parseColor("#FFFFFF00") == Color::rgba8(255, 255, 255, 0));
        expect(!parseColor("#fff").has_value());
        expect(!parseColor("#gg0000").has_value());
        expect(!parseColor("").has_value());
    };
};
