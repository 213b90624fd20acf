//=============================================================================
// Acuity Model Tests
//=============================================================================

#include <boost/ut.hpp>
#include <screencalc/acuity.h>

#include <cmath>
#include <numbers>

using namespace boost::ut;
using namespace screencalc;

suite acuity_tests = [] {
    "pixel angle is one arc-minute"_test = [] {
        expect(std::abs(acuity::pixelAngle() * 60.0 * 180.0 / std::numbers::pi - 1.0) < 1e-12);
    };

    "factor is sqrt2 over tan of the pixel angle"_test = [] {
        double expected = std::sqrt(2.0) / std::tan(std::numbers::pi / 10800.0);
        expect(std::abs(acuity::factor() - expected) < 1e-9);
        expect(std::abs(acuity::factor() - 4861.707970122356) < 1e-6);
    };

    "distance and density are reciprocal through the factor"_test = [] {
        expect(std::abs(acuity::densityForDistance(50.0) - acuity::factor() / 50.0) < 1e-12);
        expect(std::abs(acuity::distanceForDensity(97.0) - acuity::factor() / 97.0) < 1e-12);
    };

    "density round trip recovers the start value"_test = [] {
        for (double d : {0.01, 1.0, 31.496062992125985, 118.11, 300.0, 1e6}) {
            double back = acuity::densityForDistance(acuity::distanceForDensity(d));
            expect(std::abs(back - d) <= 1e-12 * d) << d;
        }
    };

    "distance round trip recovers the start value"_test = [] {
        for (double cm : {10.0, 50.0, 154.35922805138478, 400.0}) {
            double back = acuity::distanceForDensity(acuity::densityForDistance(cm));
            expect(std::abs(back - cm) <= 1e-12 * cm) << cm;
        }
    };
};
