#pragma once

#include <screencalc/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace screencalc {

/**
 * The nine screen parameters, in solver enumeration order.
 * Rule results depend on this order, do not re-sort.
 */
enum class ParamId : uint8_t {
    Aspect = 0,
    Density,
    Diagonal,
    Distance,
    Height,
    HeightPx,
    Width,
    WidthPx,
    Pixels,
};

inline constexpr size_t kParamCount = 9;

inline constexpr std::array<ParamId, kParamCount> kAllParams = {
    ParamId::Aspect,   ParamId::Density, ParamId::Diagonal,
    ParamId::Distance, ParamId::Height,  ParamId::HeightPx,
    ParamId::Width,    ParamId::WidthPx, ParamId::Pixels,
};

constexpr size_t paramIndex(ParamId id) noexcept {
    return static_cast<size_t>(id);
}

// Identifier as used on the command line and in reports ("heightpx")
std::string_view paramName(ParamId id) noexcept;
std::optional<ParamId> paramFromName(std::string_view name) noexcept;

enum class ValueKind : uint8_t {
    Ratio,       // exact fraction, aspect only
    Continuous,  // centimeters or dots per centimeter
    Count,       // pixel counts
};

constexpr ValueKind paramKind(ParamId id) noexcept {
    switch (id) {
    case ParamId::Aspect:
        return ValueKind::Ratio;
    case ParamId::HeightPx:
    case ParamId::WidthPx:
    case ParamId::Pixels:
        return ValueKind::Count;
    default:
        return ValueKind::Continuous;
    }
}

/**
 * Ratio - relative height over relative width.
 * Not reduced implicitly: "32:18" stays 32:18 until a rule derives a new one.
 */
struct Ratio {
    int64_t numerator = 0;
    int64_t denominator = 1;

    [[nodiscard]] double toDouble() const noexcept {
        return static_cast<double>(numerator) / static_cast<double>(denominator);
    }

    bool operator==(const Ratio&) const = default;
};

using Value = std::variant<Ratio, double, uint64_t>;

constexpr ValueKind valueKind(const Value& value) noexcept {
    switch (value.index()) {
    case 0:  return ValueKind::Ratio;
    case 1:  return ValueKind::Continuous;
    default: return ValueKind::Count;
    }
}

/**
 * SolverState - every parameter either unknown or resolved.
 *
 * Resolution is monotonic: set() refuses to overwrite a resolved parameter
 * and refuses a value whose kind does not match the parameter.
 */
class SolverState {
public:
    SolverState() = default;

    Result<void> set(ParamId id, Value value);

    [[nodiscard]] bool isResolved(ParamId id) const noexcept {
        return _values[paramIndex(id)].has_value();
    }

    [[nodiscard]] const std::optional<Value>& get(ParamId id) const noexcept {
        return _values[paramIndex(id)];
    }

    [[nodiscard]] std::optional<Ratio> ratio(ParamId id) const;
    [[nodiscard]] std::optional<double> continuous(ParamId id) const;
    [[nodiscard]] std::optional<uint64_t> count(ParamId id) const;

    [[nodiscard]] size_t resolvedCount() const noexcept;
    [[nodiscard]] bool allResolved() const noexcept { return resolvedCount() == kParamCount; }

    // Unknown parameters in enumeration order
    [[nodiscard]] std::vector<ParamId> unresolved() const;

private:
    std::array<std::optional<Value>, kParamCount> _values;
};

} // namespace screencalc
