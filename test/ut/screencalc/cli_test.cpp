//=============================================================================
// Command Line Tests
//
// Flag parsing, rejection of positional arguments, exit statuses and the
// complete parse -> solve -> report path through run().
//=============================================================================

#include <boost/ut.hpp>
#include <screencalc/cli.h>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace screencalc;

namespace {

struct RunOutput {
    int status;
    std::string out;
    std::string err;
};

RunOutput runWith(std::vector<const char*> args) {
    // Keep any real user config out of the way
    ::setenv("XDG_CONFIG_HOME", "/nonexistent/screencalc-cli-test", 1);
    args.insert(args.begin(), "screencalc");
    std::ostringstream out;
    std::ostringstream err;
    int status = run(static_cast<int>(args.size()), args.data(), out, err);
    return {status, out.str(), err.str()};
}

Result<CliOptions> parse(std::vector<const char*> args) {
    args.insert(args.begin(), "screencalc");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

} // namespace

suite cli_parse_tests = [] {
    "flags are named after the parameters"_test = [] {
        auto options = parse({"--aspect=16:9", "--diagonal", "55in", "--heightpx=1080"});
        expect(options.has_value() >> fatal);
        expect(options->values[paramIndex(ParamId::Aspect)] == std::optional<std::string>("16:9"));
        expect(options->values[paramIndex(ParamId::Diagonal)] == std::optional<std::string>("55in"));
        expect(options->values[paramIndex(ParamId::HeightPx)] == std::optional<std::string>("1080"));
        expect(!options->values[paramIndex(ParamId::Width)].has_value());
    };

    "positional arguments fail with UnexpectedArgument"_test = [] {
        auto options = parse({"--height=10cm", "extra"});
        expect(!options.has_value() >> fatal);
        expect(options.error().kind() == ErrorKind::UnexpectedArgument);
        expect(options.error().message().find("extra") != std::string::npos);
    };

    "unknown flags fail with UnexpectedArgument"_test = [] {
        auto options = parse({"--resolution=4k"});
        expect(!options.has_value() >> fatal);
        expect(options.error().kind() == ErrorKind::UnexpectedArgument);
    };

    "help is not an error"_test = [] {
        auto options = parse({"--help"});
        expect(options.has_value() >> fatal);
        expect(options->helpRequested);
        expect(options->helpText.find("--widthpx") != std::string::npos);
        expect(options->helpText.find("dpcm") != std::string::npos);
    };

    "config and verbose"_test = [] {
        auto options = parse({"--config", "/tmp/x.yaml", "-v"});
        expect(options.has_value() >> fatal);
        expect(options->configPath == "/tmp/x.yaml");
        expect(options->verbose);
    };

    "initial state converts every supplied value"_test = [] {
        auto options = parse({"--aspect=16:9", "--density=80"});
        expect(options.has_value() >> fatal);
        auto state = buildInitialState(*options);
        expect(state.has_value() >> fatal);
        expect(state->resolvedCount() == 2_u);
        expect(*state->ratio(ParamId::Aspect) == Ratio{16, 9});
    };

    "initial state reports the first bad value"_test = [] {
        auto options = parse({"--height=10"});
        expect(options.has_value() >> fatal);
        auto state = buildInitialState(*options);
        expect(!state.has_value() >> fatal);
        expect(state.error().kind() == ErrorKind::MissingUnit);
        expect(std::string(errorKindName(state.error().kind())) == "MissingUnit");
    };
};

suite cli_run_tests = [] {
    "successful run prints the report"_test = [] {
        auto r = runWith({"--heightpx=1080", "--widthpx=1920"});
        expect(r.status == kExitOk);
        expect(r.out.find("aspect: 9:16\n") != std::string::npos);
        expect(r.out.find("pixels: 2073600\n") != std::string::npos);
        expect(r.out.find("undetermined: density, diagonal, distance, height, width\n") !=
               std::string::npos);
        expect(r.err.empty());
    };

    "unknown unit exits with status 1"_test = [] {
        auto r = runWith({"--density=300xyz"});
        expect(r.status == kExitInvalidValue);
        expect(r.out.empty());
        expect(r.err.find("xyz") != std::string::npos);
    };

    "missing unit exits with status 1"_test = [] {
        auto r = runWith({"--height=10"});
        expect(r.status == kExitInvalidValue);
        expect(r.err.find("--height") != std::string::npos);
    };

    "positional argument exits with status 2"_test = [] {
        auto r = runWith({"55in"});
        expect(r.status == kExitUsage);
        expect(r.out.empty());
    };

    "missing explicit config exits with status 1"_test = [] {
        auto r = runWith({"--config=/nonexistent/screencalc.yaml", "--density=300"});
        expect(r.status == kExitInvalidValue);
    };

    "help exits with status 0"_test = [] {
        auto r = runWith({"-h"});
        expect(r.status == kExitOk);
        expect(r.out.find("screencalc") != std::string::npos);
    };

    "nothing supplied reports everything undetermined"_test = [] {
        auto r = runWith({});
        expect(r.status == kExitOk);
        expect(r.out == "undetermined: aspect, density, diagonal, distance, height, heightpx, "
                        "pixels, width, widthpx\n");
    };
};
