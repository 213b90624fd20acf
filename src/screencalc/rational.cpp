#include <screencalc/rational.h>

#include <cmath>
#include <cstdlib>

namespace screencalc {

namespace {

// Every product below mixes two int64-bounded terms, so it stays under 2^126
__extension__ typedef __int128 Wide;

Wide absWide(Wide v) {
    return v < 0 ? -v : v;
}

// Largest power-of-two denominator used for the exact form of a double
constexpr int kMaxDenominatorShift = 62;

} // namespace

int64_t gcd(int64_t a, int64_t b) noexcept {
    a = a < 0 ? -a : a;
    b = b < 0 ? -b : b;
    while (b != 0) {
        int64_t t = a % b;
        a = b;
        b = t;
    }
    return a;
}

Ratio approximateRatio(int64_t num, int64_t den, int64_t maxDenominator) {
    if (int64_t g = gcd(num, den); g > 1) {
        num /= g;
        den /= g;
    }
    if (den <= maxDenominator) {
        return Ratio{num, den};
    }

    // Convergents p0/q0, p1/q1 of the continued fraction of num/den
    Wide p0 = 0, q0 = 1, p1 = 1, q1 = 0;
    Wide n = num, d = den;
    const Wide maxDen = maxDenominator;
    for (;;) {
        Wide a = n / d;
        Wide q2 = q0 + a * q1;
        if (q2 > maxDen) break;
        Wide p2 = p0 + a * p1;
        p0 = p1;
        q0 = q1;
        p1 = p2;
        q1 = q2;
        Wide r = n - a * d;
        n = d;
        d = r;
    }

    // Best semiconvergent still within the bound
    Wide k = (maxDen - q0) / q1;
    Wide ps = p0 + k * p1;
    Wide qs = q0 + k * q1;

    // |p1/q1 - x| <= |ps/qs - x|, cross-multiplied with x = num/den
    Wide errConvergent = absWide(p1 * den - Wide(num) * q1) * qs;
    Wide errSemi = absWide(ps * den - Wide(num) * qs) * q1;
    if (errConvergent <= errSemi) {
        return Ratio{static_cast<int64_t>(p1), static_cast<int64_t>(q1)};
    }
    return Ratio{static_cast<int64_t>(ps), static_cast<int64_t>(qs)};
}

std::optional<Ratio> approximateRatio(double value, int64_t maxDenominator) {
    if (!std::isfinite(value) || value < 0.0 || maxDenominator <= 0) {
        return std::nullopt;
    }
    if (value == 0.0) {
        return Ratio{0, 1};
    }

    int exponent = 0;
    double fraction = std::frexp(value, &exponent);  // value = fraction * 2^exponent
    auto mantissa = static_cast<int64_t>(std::ldexp(fraction, 53));
    int shift = exponent - 53;

    if (shift >= 0) {
        if (shift > kMaxDenominatorShift - 53) {
            return std::nullopt;  // beyond int64 once scaled
        }
        return approximateRatio(mantissa << shift, int64_t{1}, maxDenominator);
    }

    int denShift = -shift;
    if (denShift > kMaxDenominatorShift) {
        // Bits below 2^-62 cannot influence a denominator this small
        mantissa >>= (denShift - kMaxDenominatorShift);
        denShift = kMaxDenominatorShift;
        if (mantissa == 0) {
            return Ratio{0, 1};
        }
    }
    return approximateRatio(mantissa, int64_t{1} << denShift, maxDenominator);
}

} // namespace screencalc
