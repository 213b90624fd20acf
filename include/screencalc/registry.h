#pragma once

#include <screencalc/parameter.h>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace screencalc {

/**
 * Parameter registry - the static rule table the solver walks.
 *
 * Every parameter has an ordered list of alternative derivations. A rule
 * names its prerequisites and a formula receiving their values in exactly
 * that order. The first rule whose prerequisites are all resolved wins,
 * so the declaration order below is part of the results.
 *
 *   aspect    height,width | heightpx,widthpx
 *   density   distance | height,heightpx | width,widthpx
 *   diagonal  aspect,height | aspect,width | height,width
 *   distance  density
 *   height    aspect,diagonal | aspect,width | density,heightpx | diagonal,width
 *   heightpx  aspect,pixels | aspect,widthpx | density,height | pixels,widthpx
 *   width     aspect,diagonal | aspect,height | density,widthpx | diagonal,height
 *   widthpx   aspect,pixels | aspect,heightpx | density,width | pixels,heightpx
 *   pixels    heightpx,widthpx
 */

// Reporting hint only, the solver ignores it
enum class Dimension : uint8_t {
    None,
    Length,   // centimeters, reported with inches alongside
    Density,  // dots per centimeter, reported with dpi alongside
};

struct RuleContext {
    int64_t aspectMaxDenominator = 100;
};

/**
 * A formula returns nullopt when its inputs are degenerate for it
 * (zero divisor, diagonal shorter than a side, non-finite result).
 * The solver then moves on to the next rule.
 */
using Formula = std::optional<Value> (*)(std::span<const Value> args, const RuleContext& ctx);

struct Rule {
    std::vector<ParamId> prerequisites;
    Formula formula = nullptr;
    std::string_view expression;  // human-readable formula for logs
};

struct ParamInfo {
    ParamId id;
    ValueKind kind;
    Dimension dimension;
    std::vector<Rule> rules;
};

// All parameters, in kAllParams order
const std::vector<ParamInfo>& parameterRegistry();

const ParamInfo& paramInfo(ParamId id);

} // namespace screencalc
