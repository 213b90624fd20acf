#include <screencalc/solver.h>
#include <ytrace/ytrace.hpp>

#include <string>

namespace screencalc {

namespace {

std::string joinNames(const std::vector<ParamId>& ids) {
    std::string out;
    for (ParamId id : ids) {
        if (!out.empty()) out += ",";
        out += paramName(id);
    }
    return out;
}

} // namespace

SolveResult Solver::solve(SolverState initial) const {
    SolveResult result;
    result.state = std::move(initial);

    for (ParamId id : kAllParams) {
        if (result.state.isResolved(id)) {
            result.derivations[paramIndex(id)] = Derivation{};
        }
    }

    ydebug("solve: {} of {} parameters given", result.state.resolvedCount(), kParamCount);

    while (!result.state.allResolved()) {
        const int pass = ++result.passes;
        bool progress = false;

        for (const ParamInfo& info : parameterRegistry()) {
            if (result.state.isResolved(info.id)) continue;
            if (resolveOne(info, result, pass)) {
                progress = true;
            }
        }

        ydebug("solve: pass {} done, {} resolved", pass, result.state.resolvedCount());
        if (!progress) break;
    }

    result.unresolved = result.state.unresolved();
    if (!result.unresolved.empty()) {
        ydebug("solve: undetermined after {} passes: {}", result.passes,
               joinNames(result.unresolved));
    }
    return result;
}

bool Solver::resolveOne(const ParamInfo& info, SolveResult& result, int pass) const {
    const RuleContext ctx{_options.aspectMaxDenominator};
    std::vector<Value> args;

    for (size_t i = 0; i < info.rules.size(); ++i) {
        const Rule& rule = info.rules[i];

        args.clear();
        bool ready = true;
        for (ParamId pre : rule.prerequisites) {
            const auto& v = result.state.get(pre);
            if (!v) {
                ready = false;
                break;
            }
            args.push_back(*v);
        }
        if (!ready) continue;

        auto value = rule.formula(args, ctx);
        if (!value) {
            ydebug("solve: {} <- {} rejected its inputs ({})", paramName(info.id),
                   joinNames(rule.prerequisites), rule.expression);
            continue;
        }

        if (auto res = result.state.set(info.id, std::move(*value)); !res) {
            // Registry formula produced the wrong kind
            yerror("solve: {} <- {}: {}", paramName(info.id), rule.expression, error_msg(res));
            return false;
        }
        result.derivations[paramIndex(info.id)] = Derivation{static_cast<int>(i), pass};
        ydebug("solve: pass {}: {} <- {} via {}", pass, paramName(info.id),
               joinNames(rule.prerequisites), rule.expression);
        return true;
    }
    return false;
}

} // namespace screencalc
