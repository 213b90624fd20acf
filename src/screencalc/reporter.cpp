#include <screencalc/reporter.h>
#include <screencalc/registry.h>
#include <screencalc/units.h>

#include <algorithm>
#include <format>

namespace screencalc {

namespace {

std::string fixed(double v, int precision) {
    return std::format("{:.{}f}", v, precision);
}

// "<canonical><suffix> (<secondary><suffix>)"
std::string withUnits(double canonical, const UnitTable& table, std::string_view secondary,
                      const ReportOptions& options) {
    std::string out = fixed(canonical, options.precision) + std::string(table.canonicalSuffix);
    if (options.secondaryUnits) {
        if (auto factor = unitFactor(table, secondary)) {
            out += " (" + fixed(canonical / *factor, options.precision) + std::string(secondary) + ")";
        }
    }
    return out;
}

std::vector<ParamId> sortedByName(std::vector<ParamId> ids) {
    std::sort(ids.begin(), ids.end(), [](ParamId a, ParamId b) {
        return paramName(a) < paramName(b);
    });
    return ids;
}

} // namespace

std::string formatValue(ParamId id, const Value& value, const ReportOptions& options) {
    if (const auto* r = std::get_if<Ratio>(&value)) {
        return std::format("{}:{}", r->numerator, r->denominator);
    }
    if (const auto* n = std::get_if<uint64_t>(&value)) {
        return std::format("{}", *n);
    }

    double v = std::get<double>(value);
    switch (paramInfo(id).dimension) {
    case Dimension::Length:
        return withUnits(v, lengthUnits(), "in", options);
    case Dimension::Density:
        return withUnits(v, densityUnits(), "dpi", options);
    case Dimension::None:
        break;
    }
    return fixed(v, options.precision);
}

std::string formatReport(const SolveResult& result, const ReportOptions& options) {
    std::vector<ParamId> resolved;
    for (ParamId id : kAllParams) {
        if (result.state.isResolved(id)) resolved.push_back(id);
    }

    std::string out;
    for (ParamId id : sortedByName(resolved)) {
        out += std::format("{}: {}\n", paramName(id), formatValue(id, *result.state.get(id), options));
    }

    if (!result.unresolved.empty()) {
        std::string names;
        for (ParamId id : sortedByName(result.unresolved)) {
            if (!names.empty()) names += ", ";
            names += paramName(id);
        }
        out += "undetermined: " + names + "\n";
    }
    return out;
}

} // namespace screencalc
