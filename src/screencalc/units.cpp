#include <screencalc/units.h>
#include <ytrace/ytrace.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <string>

namespace screencalc {

namespace {

constexpr double kCmPerInch = 2.54;

constexpr std::array<UnitFactor, 4> kLengthFactors = {{
    {"cm", 1.0},
    {"mm", 0.1},
    {"m", 100.0},
    {"in", kCmPerInch},
}};

constexpr std::array<UnitFactor, 3> kDensityFactors = {{
    {"dpi", 1.0 / kCmPerInch},
    {"dpcm", 1.0},
    {"dpm", 0.01},
}};

const UnitTable kLengthTable{"length", "cm", kLengthFactors, ""};
const UnitTable kDensityTable{"density", "dpcm", kDensityFactors, "dpi"};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

std::string acceptedSuffixes(const UnitTable& table) {
    std::string list;
    for (const auto& u : table.units) {
        if (!list.empty()) list += ", ";
        list += u.suffix;
    }
    return list;
}

// Whole string must be a base-10 integer fitting T
template<typename T>
std::optional<T> parseWholeInteger(std::string_view text) {
    if (text.empty()) return std::nullopt;
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

} // namespace

const UnitTable& lengthUnits() noexcept {
    return kLengthTable;
}

const UnitTable& densityUnits() noexcept {
    return kDensityTable;
}

std::optional<double> unitFactor(const UnitTable& table, std::string_view suffix) noexcept {
    for (const auto& u : table.units) {
        if (u.suffix == suffix) return u.factor;
    }
    return std::nullopt;
}

Result<double> parseQuantity(std::string_view text, const UnitTable& table) {
    std::string_view s = trim(text);

    double number = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), number);
    if (ec != std::errc() || ptr == s.data()) {
        return Err<double>("'" + std::string(text) + "' does not start with a number",
                           ErrorKind::InvalidNumber);
    }
    if (!std::isfinite(number)) {
        return Err<double>("'" + std::string(text) + "' is not a finite number",
                           ErrorKind::InvalidNumber);
    }
    if (number < 0.0) {
        return Err<double>("'" + std::string(text) + "' is negative", ErrorKind::InvalidNumber);
    }

    std::string_view suffix = trim(s.substr(static_cast<size_t>(ptr - s.data())));
    if (suffix.empty()) {
        if (table.defaultSuffix.empty()) {
            return Err<double>("no unit given in '" + std::string(text) + "' (accepted " +
                               std::string(table.quantity) + " units: " +
                               acceptedSuffixes(table) + ")",
                               ErrorKind::MissingUnit);
        }
        suffix = table.defaultSuffix;
        ydebug("'{}' has no unit, assuming {}", text, suffix);
    }

    auto factor = unitFactor(table, suffix);
    if (!factor) {
        return Err<double>("unrecognized " + std::string(table.quantity) + " unit '" +
                           std::string(suffix) + "' (accepted: " +
                           acceptedSuffixes(table) + ")",
                           ErrorKind::UnrecognizedUnit);
    }
    return Ok(number * *factor);
}

Result<double> parseLength(std::string_view text) {
    return parseQuantity(text, lengthUnits());
}

Result<double> parseDensity(std::string_view text) {
    return parseQuantity(text, densityUnits());
}

Result<Ratio> parseAspect(std::string_view text) {
    std::string_view s = trim(text);
    auto colon = s.find(':');
    if (colon == std::string_view::npos || s.find(':', colon + 1) != std::string_view::npos) {
        return Err<Ratio>("aspect '" + std::string(text) + "' is not of the form <int>:<int>",
                          ErrorKind::InvalidAspectSyntax);
    }

    auto num = parseWholeInteger<int64_t>(trim(s.substr(0, colon)));
    auto den = parseWholeInteger<int64_t>(trim(s.substr(colon + 1)));
    if (!num || !den) {
        return Err<Ratio>("aspect '" + std::string(text) + "' is not of the form <int>:<int>",
                          ErrorKind::InvalidAspectSyntax);
    }
    if (*num <= 0 || *den <= 0) {
        return Err<Ratio>("aspect '" + std::string(text) + "' needs positive components",
                          ErrorKind::InvalidAspectSyntax);
    }
    return Ok(Ratio{*num, *den});
}

Result<uint64_t> parseCount(std::string_view text) {
    auto value = parseWholeInteger<uint64_t>(trim(text));
    if (!value) {
        return Err<uint64_t>("'" + std::string(text) + "' is not a non-negative integer",
                             ErrorKind::InvalidInteger);
    }
    return Ok(*value);
}

Result<Value> parseParameter(ParamId id, std::string_view text) {
    const std::string context = "invalid --" + std::string(paramName(id));

    switch (id) {
    case ParamId::Aspect: {
        auto res = parseAspect(text);
        if (!res) return Err<Value>(context, res);
        return Ok<Value>(*res);
    }
    case ParamId::Density: {
        auto res = parseDensity(text);
        if (!res) return Err<Value>(context, res);
        return Ok<Value>(*res);
    }
    case ParamId::Diagonal:
    case ParamId::Distance:
    case ParamId::Height:
    case ParamId::Width: {
        auto res = parseLength(text);
        if (!res) return Err<Value>(context, res);
        return Ok<Value>(*res);
    }
    case ParamId::HeightPx:
    case ParamId::WidthPx:
    case ParamId::Pixels: {
        auto res = parseCount(text);
        if (!res) return Err<Value>(context, res);
        return Ok<Value>(*res);
    }
    }
    return Err<Value>("unknown parameter", ErrorKind::UnknownParameter);
}

} // namespace screencalc
