#include <screencalc/registry.h>
#include <screencalc/acuity.h>
#include <screencalc/rational.h>

#include <cmath>
#include <limits>

namespace screencalc {

namespace {

using P = ParamId;

//=============================================================================
// Argument access and result checks
//=============================================================================

double asReal(const Value& v) { return std::get<double>(v); }
const Ratio& asRatio(const Value& v) { return std::get<Ratio>(v); }
uint64_t asCount(const Value& v) { return std::get<uint64_t>(v); }

double num(const Value& v) { return static_cast<double>(asRatio(v).numerator); }
double den(const Value& v) { return static_cast<double>(asRatio(v).denominator); }
double diagonalUnits(const Value& v) { return std::hypot(num(v), den(v)); }

std::optional<Value> continuous(double v) {
    if (!std::isfinite(v)) return std::nullopt;
    return Value(v);
}

// Largest double that converts to uint64_t without overflow
constexpr double kCountLimit = 18446744073709549568.0;

std::optional<Value> countValue(double v) {
    if (!std::isfinite(v) || v < 0.0 || v > kCountLimit) return std::nullopt;
    return Value(static_cast<uint64_t>(v));
}

// Nearest integer, ties to even
std::optional<Value> roundedCount(double v) {
    return countValue(std::nearbyint(v));
}

std::optional<Value> flooredCount(double v) {
    return countValue(std::floor(v));
}

std::optional<Value> aspectValue(std::optional<Ratio> r) {
    if (!r || r->numerator <= 0) return std::nullopt;
    return Value(*r);
}

// Remaining side of a right triangle
std::optional<Value> otherSide(double diagonal, double side) {
    double sq = diagonal * diagonal - side * side;
    if (!(sq > 0.0)) return std::nullopt;
    return continuous(std::sqrt(sq));
}

std::optional<Value> splitPixels(uint64_t pixels, uint64_t side) {
    if (side == 0) return std::nullopt;
    return Value(pixels / side);
}

//=============================================================================
// Formulas, named <target>From<Prerequisites>
//=============================================================================

std::optional<Value> aspectFromSize(std::span<const Value> a, const RuleContext& ctx) {
    return aspectValue(approximateRatio(asReal(a[0]) / asReal(a[1]), ctx.aspectMaxDenominator));
}

std::optional<Value> aspectFromPixels(std::span<const Value> a, const RuleContext& ctx) {
    constexpr auto kMax = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t h = asCount(a[0]);
    uint64_t w = asCount(a[1]);
    if (w == 0 || h > kMax || w > kMax) return std::nullopt;
    return aspectValue(approximateRatio(static_cast<int64_t>(h), static_cast<int64_t>(w),
                                        ctx.aspectMaxDenominator));
}

std::optional<Value> densityFromDistance(std::span<const Value> a, const RuleContext&) {
    return continuous(acuity::densityForDistance(asReal(a[0])));
}

std::optional<Value> densityFromSide(std::span<const Value> a, const RuleContext&) {
    return continuous(static_cast<double>(asCount(a[1])) / asReal(a[0]));
}

std::optional<Value> diagonalFromAspectHeight(std::span<const Value> a, const RuleContext&) {
    return continuous(asReal(a[1]) / num(a[0]) * diagonalUnits(a[0]));
}

std::optional<Value> diagonalFromAspectWidth(std::span<const Value> a, const RuleContext&) {
    return continuous(asReal(a[1]) / den(a[0]) * diagonalUnits(a[0]));
}

std::optional<Value> diagonalFromSides(std::span<const Value> a, const RuleContext&) {
    return continuous(std::hypot(asReal(a[0]), asReal(a[1])));
}

std::optional<Value> distanceFromDensity(std::span<const Value> a, const RuleContext&) {
    return continuous(acuity::distanceForDensity(asReal(a[0])));
}

std::optional<Value> heightFromAspectDiagonal(std::span<const Value> a, const RuleContext&) {
    return continuous(asReal(a[1]) / diagonalUnits(a[0]) * num(a[0]));
}

std::optional<Value> heightFromAspectWidth(std::span<const Value> a, const RuleContext&) {
    return continuous(asReal(a[1]) / den(a[0]) * num(a[0]));
}

std::optional<Value> sideFromDensityPixels(std::span<const Value> a, const RuleContext&) {
    return continuous(static_cast<double>(asCount(a[1])) / asReal(a[0]));
}

std::optional<Value> sideFromDiagonalSide(std::span<const Value> a, const RuleContext&) {
    return otherSide(asReal(a[0]), asReal(a[1]));
}

std::optional<Value> heightPxFromAspectPixels(std::span<const Value> a, const RuleContext&) {
    return roundedCount(std::sqrt(static_cast<double>(asCount(a[1])) * asRatio(a[0]).toDouble()));
}

std::optional<Value> heightPxFromAspectWidthPx(std::span<const Value> a, const RuleContext&) {
    return roundedCount(static_cast<double>(asCount(a[1])) / den(a[0]) * num(a[0]));
}

std::optional<Value> pxFromDensitySide(std::span<const Value> a, const RuleContext&) {
    return flooredCount(asReal(a[1]) * asReal(a[0]));
}

std::optional<Value> pxFromPixelsSide(std::span<const Value> a, const RuleContext&) {
    return splitPixels(asCount(a[0]), asCount(a[1]));
}

std::optional<Value> widthFromAspectDiagonal(std::span<const Value> a, const RuleContext&) {
    return continuous(asReal(a[1]) / diagonalUnits(a[0]) * den(a[0]));
}

std::optional<Value> widthFromAspectHeight(std::span<const Value> a, const RuleContext&) {
    return continuous(asReal(a[1]) / num(a[0]) * den(a[0]));
}

std::optional<Value> widthPxFromAspectPixels(std::span<const Value> a, const RuleContext&) {
    return roundedCount(std::sqrt(static_cast<double>(asCount(a[1])) / asRatio(a[0]).toDouble()));
}

std::optional<Value> widthPxFromAspectHeightPx(std::span<const Value> a, const RuleContext&) {
    return roundedCount(static_cast<double>(asCount(a[1])) / num(a[0]) * den(a[0]));
}

std::optional<Value> pixelsFromSides(std::span<const Value> a, const RuleContext&) {
    uint64_t h = asCount(a[0]);
    uint64_t w = asCount(a[1]);
    if (w != 0 && h > std::numeric_limits<uint64_t>::max() / w) return std::nullopt;
    return Value(h * w);
}

std::vector<ParamInfo> buildRegistry() {
    std::vector<ParamInfo> reg;
    reg.reserve(kParamCount);

    reg.push_back({P::Aspect, ValueKind::Ratio, Dimension::None, {
        {{P::Height, P::Width}, aspectFromSize, "height:width, denominator bounded"},
        {{P::HeightPx, P::WidthPx}, aspectFromPixels, "heightpx:widthpx, denominator bounded"},
    }});

    reg.push_back({P::Density, ValueKind::Continuous, Dimension::Density, {
        {{P::Distance}, densityFromDistance, "acuity / distance"},
        {{P::Height, P::HeightPx}, densityFromSide, "heightpx / height"},
        {{P::Width, P::WidthPx}, densityFromSide, "widthpx / width"},
    }});

    reg.push_back({P::Diagonal, ValueKind::Continuous, Dimension::Length, {
        {{P::Aspect, P::Height}, diagonalFromAspectHeight, "height / num * hypot(num, den)"},
        {{P::Aspect, P::Width}, diagonalFromAspectWidth, "width / den * hypot(num, den)"},
        {{P::Height, P::Width}, diagonalFromSides, "hypot(height, width)"},
    }});

    reg.push_back({P::Distance, ValueKind::Continuous, Dimension::Length, {
        {{P::Density}, distanceFromDensity, "acuity / density"},
    }});

    reg.push_back({P::Height, ValueKind::Continuous, Dimension::Length, {
        {{P::Aspect, P::Diagonal}, heightFromAspectDiagonal, "diagonal / hypot(num, den) * num"},
        {{P::Aspect, P::Width}, heightFromAspectWidth, "width / den * num"},
        {{P::Density, P::HeightPx}, sideFromDensityPixels, "heightpx / density"},
        {{P::Diagonal, P::Width}, sideFromDiagonalSide, "sqrt(diagonal^2 - width^2)"},
    }});

    reg.push_back({P::HeightPx, ValueKind::Count, Dimension::None, {
        {{P::Aspect, P::Pixels}, heightPxFromAspectPixels, "round(sqrt(pixels * aspect))"},
        {{P::Aspect, P::WidthPx}, heightPxFromAspectWidthPx, "round(widthpx / den * num)"},
        {{P::Density, P::Height}, pxFromDensitySide, "floor(height * density)"},
        {{P::Pixels, P::WidthPx}, pxFromPixelsSide, "pixels div widthpx"},
    }});

    reg.push_back({P::Width, ValueKind::Continuous, Dimension::Length, {
        {{P::Aspect, P::Diagonal}, widthFromAspectDiagonal, "diagonal / hypot(num, den) * den"},
        {{P::Aspect, P::Height}, widthFromAspectHeight, "height / num * den"},
        {{P::Density, P::WidthPx}, sideFromDensityPixels, "widthpx / density"},
        {{P::Diagonal, P::Height}, sideFromDiagonalSide, "sqrt(diagonal^2 - height^2)"},
    }});

    reg.push_back({P::WidthPx, ValueKind::Count, Dimension::None, {
        {{P::Aspect, P::Pixels}, widthPxFromAspectPixels, "round(sqrt(pixels / aspect))"},
        {{P::Aspect, P::HeightPx}, widthPxFromAspectHeightPx, "round(heightpx / num * den)"},
        {{P::Density, P::Width}, pxFromDensitySide, "floor(width * density)"},
        {{P::Pixels, P::HeightPx}, pxFromPixelsSide, "pixels div heightpx"},
    }});

    reg.push_back({P::Pixels, ValueKind::Count, Dimension::None, {
        {{P::HeightPx, P::WidthPx}, pixelsFromSides, "heightpx * widthpx"},
    }});

    return reg;
}

} // namespace

const std::vector<ParamInfo>& parameterRegistry() {
    static const std::vector<ParamInfo> registry = buildRegistry();
    return registry;
}

const ParamInfo& paramInfo(ParamId id) {
    return parameterRegistry()[paramIndex(id)];
}

} // namespace screencalc
