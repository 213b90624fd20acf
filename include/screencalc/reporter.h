#pragma once

#include <screencalc/solver.h>
#include <string>

namespace screencalc {

struct ReportOptions {
    int precision = 3;           // decimals for lengths and densities
    bool secondaryUnits = true;  // inches / dpi in parentheses
};

// Single value as printed: "139.700cm (55.000in)", "1920", "9:16"
std::string formatValue(ParamId id, const Value& value, const ReportOptions& options = {});

/**
 * Full report: one "name: value" line per resolved parameter, sorted by
 * name, then "undetermined: a, b" when anything is left unresolved.
 */
std::string formatReport(const SolveResult& result, const ReportOptions& options = {});

} // namespace screencalc
