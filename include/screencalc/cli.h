#pragma once

#include <screencalc/parameter.h>
#include <screencalc/result.hpp>
#include <array>
#include <iosfwd>
#include <optional>
#include <string>

namespace screencalc {

struct CliOptions {
    // Raw flag values indexed by paramIndex(), absent when not supplied
    std::array<std::optional<std::string>, kParamCount> values;
    std::string configPath;
    bool verbose = false;
    bool helpRequested = false;
    std::string helpText;
};

// Exit statuses of run()
inline constexpr int kExitOk = 0;
inline constexpr int kExitInvalidValue = 1;
inline constexpr int kExitUsage = 2;

/**
 * Parse argv. Unknown flags and positional arguments fail with
 * UnexpectedArgument; values are not interpreted here.
 */
Result<CliOptions> parseCommandLine(int argc, const char* const* argv);

// Convert every supplied raw value with parseParameter()
Result<SolverState> buildInitialState(const CliOptions& options);

// Whole program: parse, configure, solve, report
int run(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace screencalc
