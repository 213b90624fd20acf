#include <screencalc/parameter.h>
#include <string>

namespace screencalc {

namespace {

constexpr std::array<std::string_view, kParamCount> kNames = {
    "aspect", "density", "diagonal", "distance", "height",
    "heightpx", "width", "widthpx", "pixels",
};

const char* kindName(ValueKind kind) {
    switch (kind) {
    case ValueKind::Ratio:      return "ratio";
    case ValueKind::Continuous: return "continuous";
    case ValueKind::Count:      return "count";
    }
    return "unknown";
}

} // namespace

std::string_view paramName(ParamId id) noexcept {
    return kNames[paramIndex(id)];
}

std::optional<ParamId> paramFromName(std::string_view name) noexcept {
    for (ParamId id : kAllParams) {
        if (kNames[paramIndex(id)] == name) {
            return id;
        }
    }
    return std::nullopt;
}

//=============================================================================
// SolverState
//=============================================================================

Result<void> SolverState::set(ParamId id, Value value) {
    if (valueKind(value) != paramKind(id)) {
        return Err<void>(std::string(paramName(id)) + " expects a " +
                         kindName(paramKind(id)) + " value, got " +
                         kindName(valueKind(value)));
    }
    auto& slot = _values[paramIndex(id)];
    if (slot) {
        return Err<void>(std::string(paramName(id)) + " is already resolved");
    }
    slot = std::move(value);
    return Ok();
}

std::optional<Ratio> SolverState::ratio(ParamId id) const {
    const auto& v = get(id);
    if (!v) return std::nullopt;
    if (const auto* r = std::get_if<Ratio>(&*v)) return *r;
    return std::nullopt;
}

std::optional<double> SolverState::continuous(ParamId id) const {
    const auto& v = get(id);
    if (!v) return std::nullopt;
    if (const auto* d = std::get_if<double>(&*v)) return *d;
    return std::nullopt;
}

std::optional<uint64_t> SolverState::count(ParamId id) const {
    const auto& v = get(id);
    if (!v) return std::nullopt;
    if (const auto* n = std::get_if<uint64_t>(&*v)) return *n;
    return std::nullopt;
}

size_t SolverState::resolvedCount() const noexcept {
    size_t n = 0;
    for (const auto& v : _values) {
        if (v) n++;
    }
    return n;
}

std::vector<ParamId> SolverState::unresolved() const {
    std::vector<ParamId> ids;
    for (ParamId id : kAllParams) {
        if (!isResolved(id)) ids.push_back(id);
    }
    return ids;
}

} // namespace screencalc
