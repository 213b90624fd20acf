#pragma once

#include <screencalc/parameter.h>
#include <screencalc/result.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace screencalc {

/**
 * Unit parsing - turns "<number><suffix>" into canonical values.
 *
 * Canonical units:
 *   lengths  -> centimeters
 *   density  -> dots per centimeter
 *   aspect   -> exact height:width ratio, not reduced
 *   counts   -> plain non-negative integers
 *
 * Errors:
 *   UnrecognizedUnit    suffix not in the quantity's table ("300xyz")
 *   MissingUnit         bare number and the quantity has no default ("10")
 *   InvalidNumber       no leading number at all ("cm")
 *   InvalidInteger      malformed pixel count
 *   InvalidAspectSyntax anything but "<int>:<int>" with non-zero parts
 */

struct UnitFactor {
    std::string_view suffix;
    double factor;  // multiply to get the canonical unit
};

struct UnitTable {
    std::string_view quantity;          // "length", "density"
    std::string_view canonicalSuffix;   // "cm", "dpcm"
    std::span<const UnitFactor> units;
    std::string_view defaultSuffix;     // empty: a unit is required
};

const UnitTable& lengthUnits() noexcept;
const UnitTable& densityUnits() noexcept;

// Factor for one suffix of a table, nullopt if the table lacks it
std::optional<double> unitFactor(const UnitTable& table, std::string_view suffix) noexcept;

Result<double> parseQuantity(std::string_view text, const UnitTable& table);
Result<double> parseLength(std::string_view text);
Result<double> parseDensity(std::string_view text);
Result<Ratio> parseAspect(std::string_view text);
Result<uint64_t> parseCount(std::string_view text);

// One entry point per identifier, dispatching on the parameter's kind
Result<Value> parseParameter(ParamId id, std::string_view text);

} // namespace screencalc
