#pragma once

#include <screencalc/parameter.h>
#include <screencalc/registry.h>
#include <array>
#include <optional>
#include <vector>

namespace screencalc {

struct SolverOptions {
    int64_t aspectMaxDenominator = 100;
};

// How a parameter got its value
struct Derivation {
    static constexpr int kGiven = -1;

    int rule = kGiven;  // index into paramInfo(id).rules, or kGiven
    int pass = 0;       // 0 for given values
};

struct SolveResult {
    SolverState state;
    std::vector<ParamId> unresolved;  // enumeration order
    int passes = 0;
    std::array<std::optional<Derivation>, kParamCount> derivations;
};

/**
 * Fixpoint solver.
 *
 * Each pass walks the parameters in registry order; for every unknown one
 * the first rule whose prerequisites are all resolved is applied. Values
 * derived earlier in a pass are visible to later parameters of the same
 * pass. Solving stops when everything is resolved or a pass derives
 * nothing, so there are never more passes than parameters.
 *
 * Supplied values are never cross-checked or replaced.
 */
class Solver {
public:
    explicit Solver(SolverOptions options = {}) noexcept : _options(options) {}

    [[nodiscard]] SolveResult solve(SolverState initial) const;

    [[nodiscard]] const SolverOptions& options() const noexcept { return _options; }

private:
    // Returns true if the parameter got a value
    bool resolveOne(const ParamInfo& info, SolveResult& result, int pass) const;

    SolverOptions _options;
};

} // namespace screencalc
