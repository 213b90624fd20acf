//=============================================================================
// Result Reporter Tests
//=============================================================================

#include <boost/ut.hpp>
#include <screencalc/reporter.h>
#include <screencalc/units.h>

#include <string>

using namespace boost::ut;
using namespace screencalc;

namespace {

using P = ParamId;

SolveResult solved(std::initializer_list<std::pair<P, const char*>> raw) {
    SolverState state;
    for (const auto& [id, text] : raw) {
        auto value = parseParameter(id, text);
        if (value) (void)state.set(id, *value);
    }
    return Solver().solve(std::move(state));
}

} // namespace

suite reporter_value_tests = [] {
    "lengths show centimeters and inches"_test = [] {
        expect(formatValue(P::Diagonal, 139.7) == "139.700cm (55.000in)");
    };

    "density shows dpcm and dpi"_test = [] {
        expect(formatValue(P::Density, 40.0) == "40.000dpcm (101.600dpi)");
    };

    "counts are plain integers"_test = [] {
        expect(formatValue(P::Pixels, uint64_t{2073600}) == "2073600");
    };

    "aspect prints numerator:denominator"_test = [] {
        expect(formatValue(P::Aspect, Ratio{9, 16}) == "9:16");
    };

    "precision and secondary units follow the options"_test = [] {
        ReportOptions options;
        options.precision = 1;
        options.secondaryUnits = false;
        expect(formatValue(P::Height, 12.345, options) == "12.3cm");
        expect(formatValue(P::Density, 40.0, options) == "40.0dpcm");
    };
};

suite reporter_report_tests = [] {
    "lines are sorted by name"_test = [] {
        auto result = solved({{P::Height, "30cm"}, {P::Width, "40cm"},
                              {P::HeightPx, "1200"}, {P::WidthPx, "1600"}});
        std::string report = formatReport(result);

        auto pos = [&](const char* key) { return report.find(std::string(key) + ": "); };
        expect(pos("aspect") < pos("density"));
        expect(pos("density") < pos("diagonal"));
        expect(pos("diagonal") < pos("distance"));
        expect(pos("distance") < pos("height"));
        expect(pos("height") < pos("heightpx"));
        expect(pos("heightpx") < pos("pixels"));
        expect(pos("pixels") < pos("width"));
        expect(pos("width") < pos("widthpx"));
        expect(report.find("undetermined") == std::string::npos);
        expect(report.find("aspect: 3:4\n") != std::string::npos);
        expect(report.find("pixels: 1920000\n") != std::string::npos);
    };

    "unresolved names close the report sorted and comma-joined"_test = [] {
        auto result = solved({{P::Aspect, "9:16"}, {P::Pixels, "2073600"}});
        std::string report = formatReport(result);
        std::string last = "undetermined: density, diagonal, distance, height, width\n";
        expect((report.size() >= last.size()) >> fatal);
        expect(report.substr(report.size() - last.size()) == last);
    };

    "full report for the density only case"_test = [] {
        auto result = solved({{P::Density, "254"}});
        std::string expected =
            "density: 100.000dpcm (254.000dpi)\n"
            "distance: 48.617cm (19.141in)\n"
            "undetermined: aspect, diagonal, height, heightpx, pixels, width, widthpx\n";
        expect(formatReport(result) == expected) << formatReport(result);
    };
};
