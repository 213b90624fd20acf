//=============================================================================
// Config Tests
//
// Defaults, YAML file loading, SCREENCALC_* environment overrides and
// command line overrides, plus fallback on invalid values.
//=============================================================================

#include <boost/ut.hpp>
#include <screencalc/config.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace boost::ut;
using namespace screencalc;

namespace fs = std::filesystem;

namespace {

// Private XDG home so a developer's own config never leaks into tests
struct ScopedConfigHome {
    fs::path dir;

    ScopedConfigHome() {
        dir = fs::temp_directory_path() / ("screencalc-config-test-" + std::to_string(::getpid()));
        fs::create_directories(dir);
        ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
        for (const char* var : {"SCREENCALC_REPORT_PRECISION", "SCREENCALC_REPORT_SECONDARY_UNITS",
                                "SCREENCALC_SOLVER_ASPECT_MAX_DENOMINATOR", "SCREENCALC_LOG_LEVEL"}) {
            ::unsetenv(var);
        }
    }

    ~ScopedConfigHome() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write(const std::string& name, const std::string& content) const {
        fs::path p = dir / name;
        fs::create_directories(p.parent_path());
        std::ofstream(p) << content;
        return p;
    }
};

} // namespace

suite config_default_tests = [] {
    "defaults without any file"_test = [] {
        ScopedConfigHome home;
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->aspectMaxDenominator() == 100);
        expect((*config)->reportPrecision() == 3);
        expect((*config)->secondaryUnits());
        expect((*config)->logLevel() == "warn");
        expect((*config)->loadedPath().empty());
    };

    "env var names"_test = [] {
        expect(Config::pathToEnvVar("report.precision") == "SCREENCALC_REPORT_PRECISION");
        expect(Config::pathToEnvVar("solver.aspect-max-denominator") ==
               "SCREENCALC_SOLVER_ASPECT_MAX_DENOMINATOR");
    };

    "xdg path"_test = [] {
        ScopedConfigHome home;
        expect(Config::getXDGConfigPath() == home.dir / "screencalc" / "config.yaml");
    };
};

suite config_file_tests = [] {
    "explicit file overrides defaults"_test = [] {
        ScopedConfigHome home;
        auto path = home.write("custom.yaml",
                               "report:\n  precision: 1\n  secondary-units: false\n"
                               "solver:\n  aspect-max-denominator: 20\n");
        auto config = Config::create(path.string());
        expect(config.has_value() >> fatal);
        expect((*config)->reportPrecision() == 1);
        expect(!(*config)->secondaryUnits());
        expect((*config)->aspectMaxDenominator() == 20);
        expect((*config)->logLevel() == "warn");
        expect((*config)->loadedPath() == path.string());
    };

    "xdg file is picked up"_test = [] {
        ScopedConfigHome home;
        home.write("screencalc/config.yaml", "log:\n  level: debug\n");
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->logLevel() == "debug");
    };

    "missing explicit file is a ConfigError"_test = [] {
        ScopedConfigHome home;
        auto config = Config::create((home.dir / "nope.yaml").string());
        expect(!config.has_value() >> fatal);
        expect(config.error().kind() == ErrorKind::ConfigError);
    };

    "non-mapping file is a ConfigError"_test = [] {
        ScopedConfigHome home;
        auto path = home.write("list.yaml", "- a\n- b\n");
        auto config = Config::create(path.string());
        expect(!config.has_value() >> fatal);
        expect(config.error().kind() == ErrorKind::ConfigError);
    };

    "complex keys in an explicit file are a ConfigError"_test = [] {
        ScopedConfigHome home;
        auto path = home.write("complex.yaml", "? [a, b]\n: 1\n");
        auto config = Config::create(path.string());
        expect(!config.has_value() >> fatal);
        expect(config.error().kind() == ErrorKind::ConfigError);
    };

    "broken xdg file is ignored as a whole"_test = [] {
        ScopedConfigHome home;
        home.write("screencalc/config.yaml",
                   "report:\n  precision: 6\n? [a, b]\n: 1\n");
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->reportPrecision() == 3);
        expect((*config)->loadedPath().empty());
    };

    "invalid values fall back to defaults"_test = [] {
        ScopedConfigHome home;
        auto path = home.write("bad.yaml",
                               "report:\n  precision: -2\n  secondary-units: maybe\n"
                               "solver:\n  aspect-max-denominator: 0\n"
                               "log:\n  level: loud\n");
        auto config = Config::create(path.string());
        expect(config.has_value() >> fatal);
        expect((*config)->reportPrecision() == 3);
        expect((*config)->secondaryUnits());
        expect((*config)->aspectMaxDenominator() == 100);
        expect((*config)->logLevel() == "warn");
    };
};

suite config_override_tests = [] {
    "environment beats the file"_test = [] {
        ScopedConfigHome home;
        auto path = home.write("custom.yaml", "report:\n  precision: 1\n");
        ::setenv("SCREENCALC_REPORT_PRECISION", "5", 1);
        auto config = Config::create(path.string());
        ::unsetenv("SCREENCALC_REPORT_PRECISION");
        expect(config.has_value() >> fatal);
        expect((*config)->reportPrecision() == 5);
    };

    "command line beats the environment"_test = [] {
        ScopedConfigHome home;
        ::setenv("SCREENCALC_LOG_LEVEL", "error", 1);
        YAML::Node overrides;
        overrides["log"]["level"] = "debug";
        auto config = Config::create("", overrides);
        ::unsetenv("SCREENCALC_LOG_LEVEL");
        expect(config.has_value() >> fatal);
        expect((*config)->logLevel() == "debug");
    };

    "generic getters"_test = [] {
        ScopedConfigHome home;
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->has("report.precision"));
        expect(!(*config)->has("report.colour"));
        expect((*config)->get<int>("report.colour", 7) == 7);
        expect(!(*config)->get<int>("nothing.here").has_value());
    };
};
