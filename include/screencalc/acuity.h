#pragma once

namespace screencalc::acuity {

/**
 * Visual acuity model.
 *
 * A typical eye separates two points one arc-minute apart. Diagonal
 * neighbours are sqrt(2) further apart than axis-aligned ones, so the
 * densest useful screen at distance d (cm) has
 *
 *   density = sqrt(2) / tan(1') / d     dots per centimeter
 *
 * Both directions share factor() so distance -> density -> distance
 * returns the starting value up to rounding.
 */

// One arc-minute in radians
double pixelAngle() noexcept;

// sqrt(2) / tan(pixelAngle())
double factor() noexcept;

double densityForDistance(double distanceCm) noexcept;
double distanceForDensity(double densityDpcm) noexcept;

} // namespace screencalc::acuity
