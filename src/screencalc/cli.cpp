#include <screencalc/cli.h>
#include <screencalc/config.h>
#include <screencalc/reporter.h>
#include <screencalc/solver.h>
#include <screencalc/units.h>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <ytrace/ytrace.hpp>

#include <memory>
#include <ostream>
#include <sstream>
#include <vector>

namespace screencalc {

namespace {

struct FlagHelp {
    const char* metavar;
    const char* help;
};

// Indexed by paramIndex()
constexpr std::array<FlagHelp, kParamCount> kFlagHelp = {{
    {"H:W", "Aspect ratio, relative height:width (e.g. 9:16)"},
    {"DENSITY", "Pixel density (default unit dpi)"},
    {"LENGTH", "Diagonal size"},
    {"LENGTH", "Viewing distance"},
    {"LENGTH", "Physical height"},
    {"COUNT", "Height in pixels"},
    {"LENGTH", "Physical width"},
    {"COUNT", "Width in pixels"},
    {"COUNT", "Total number of pixels"},
}};

std::string unitList(const UnitTable& table) {
    std::string out;
    for (const auto& u : table.units) {
        if (!out.empty()) out += ", ";
        out += u.suffix;
    }
    return out;
}

std::string epilog() {
    std::string text = "Units:\n";
    text += "  lengths: " + unitList(lengthUnits()) + " (unit required)\n";
    text += "  density: " + unitList(densityUnits()) + " (default " +
            std::string(densityUnits().defaultSuffix) + ")\n";
    text += "\nExample:\n  screencalc --aspect=9:16 --diagonal=55in --density=80dpi\n";
    return text;
}

void setupLogging(bool verbose) {
    if (!spdlog::get("screencalc")) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("screencalc"));
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    spdlog::cfg::load_env_levels();
}

int exitCodeFor(const Error& error) {
    ydebug("failed with {}", errorKindName(error.kind()));
    return error.kind() == ErrorKind::UnexpectedArgument ? kExitUsage : kExitInvalidValue;
}

} // namespace

Result<CliOptions> parseCommandLine(int argc, const char* const* argv) {
    args::ArgumentParser parser(
        "screencalc - derive missing screen parameters from the ones you know",
        epilog());
    parser.Prog("screencalc");

    args::HelpFlag help(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "PATH", "Config file", {"config"});
    args::Flag verboseFlag(parser, "verbose", "Log solver steps", {'v', "verbose"});

    std::vector<std::unique_ptr<args::ValueFlag<std::string>>> paramFlags;
    for (ParamId id : kAllParams) {
        const auto& h = kFlagHelp[paramIndex(id)];
        paramFlags.push_back(std::make_unique<args::ValueFlag<std::string>>(
            parser, h.metavar, h.help, args::Matcher{std::string(paramName(id))}));
    }

    args::PositionalList<std::string> extra(parser, "args", "", {}, args::Options::Hidden);

    CliOptions options;
    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::ostringstream ss;
        ss << parser;
        options.helpRequested = true;
        options.helpText = ss.str();
        return Ok(std::move(options));
    } catch (const args::Error& e) {
        return Err<CliOptions>(e.what(), ErrorKind::UnexpectedArgument);
    }

    if (extra) {
        return Err<CliOptions>("unexpected argument '" + args::get(extra).front() + "'",
                               ErrorKind::UnexpectedArgument);
    }

    for (ParamId id : kAllParams) {
        auto& flag = *paramFlags[paramIndex(id)];
        if (flag) {
            options.values[paramIndex(id)] = args::get(flag);
        }
    }
    if (configFlag) {
        options.configPath = args::get(configFlag);
    }
    options.verbose = static_cast<bool>(verboseFlag);
    return Ok(std::move(options));
}

Result<SolverState> buildInitialState(const CliOptions& options) {
    SolverState state;
    for (ParamId id : kAllParams) {
        const auto& raw = options.values[paramIndex(id)];
        if (!raw) continue;

        auto value = parseParameter(id, *raw);
        if (!value) {
            return Err<SolverState>(value.error());
        }
        if (auto res = state.set(id, *value); !res) {
            return Err<SolverState>(res.error());
        }
        ydebug("given: {} = {}", paramName(id), *raw);
    }
    return Ok(std::move(state));
}

int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    auto options = parseCommandLine(argc, argv);
    if (!options) {
        err << "screencalc: " << error_msg(options) << "\n";
        return exitCodeFor(options.error());
    }
    if (options->helpRequested) {
        out << options->helpText;
        return kExitOk;
    }

    setupLogging(options->verbose);

    YAML::Node overrides;
    if (options->verbose) {
        overrides["log"]["level"] = "debug";
    }
    auto config = Config::create(options->configPath, overrides);
    if (!config) {
        err << "screencalc: " << error_msg(config) << "\n";
        return exitCodeFor(config.error());
    }
    spdlog::set_level(spdlog::level::from_str((*config)->logLevel()));
    spdlog::cfg::load_env_levels();

    auto initial = buildInitialState(*options);
    if (!initial) {
        err << "screencalc: " << error_msg(initial) << "\n";
        return exitCodeFor(initial.error());
    }

    Solver solver(SolverOptions{(*config)->aspectMaxDenominator()});
    SolveResult result = solver.solve(std::move(*initial));
    yinfo("solved in {} passes, {} undetermined", result.passes, result.unresolved.size());

    ReportOptions reportOptions;
    reportOptions.precision = (*config)->reportPrecision();
    reportOptions.secondaryUnits = (*config)->secondaryUnits();
    out << formatReport(result, reportOptions);
    return kExitOk;
}

} // namespace screencalc
