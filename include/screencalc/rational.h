#pragma once

#include <screencalc/parameter.h>
#include <cstdint>
#include <optional>

namespace screencalc {

/**
 * Closest fraction to num/den whose denominator does not exceed
 * maxDenominator (continued-fraction convergents plus the last
 * semiconvergent). Exact fractions already within the bound are returned
 * reduced. On an exact tie between the two candidates the convergent wins.
 *
 * num must be >= 0, den and maxDenominator must be > 0.
 */
Ratio approximateRatio(int64_t num, int64_t den, int64_t maxDenominator);

/**
 * Same reduction for a floating-point quotient. The double is first
 * turned into its exact binary fraction so the result does not depend on
 * accumulated rounding in the expansion.
 *
 * nullopt for negative or non-finite values and for values too large
 * to scale into 64-bit terms.
 */
std::optional<Ratio> approximateRatio(double value, int64_t maxDenominator);

int64_t gcd(int64_t a, int64_t b) noexcept;

} // namespace screencalc
