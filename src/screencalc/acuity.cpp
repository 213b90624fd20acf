#include <screencalc/acuity.h>

#include <cmath>
#include <numbers>

namespace screencalc::acuity {

double pixelAngle() noexcept {
    return std::numbers::pi / (180.0 * 60.0);
}

double factor() noexcept {
    static const double value = std::numbers::sqrt2 / std::tan(pixelAngle());
    return value;
}

double densityForDistance(double distanceCm) noexcept {
    return factor() / distanceCm;
}

double distanceForDensity(double densityDpcm) noexcept {
    return factor() / densityDpcm;
}

} // namespace screencalc::acuity
