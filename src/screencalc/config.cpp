#include <screencalc/config.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace screencalc {

namespace {

constexpr std::array<const char*, 4> kKnownKeys = {
    Config::KEY_ASPECT_MAX_DENOMINATOR,
    Config::KEY_REPORT_PRECISION,
    Config::KEY_REPORT_SECONDARY_UNITS,
    Config::KEY_LOG_LEVEL,
};

constexpr std::array<const char*, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& parts, size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node(YAML::NodeType::Undefined);
    return lookup(child, parts, i + 1);
}

} // namespace

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(config);
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<void> Config::init() noexcept {
    loadDefaults();

    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            return res;
        }
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Ignoring config file {}: {}", xdgPath.string(), error_msg(res));
            }
        }
    }

    applyEnvOverrides();

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        try {
            mergeNodes(_config, _cmdOverrides);
        } catch (const YAML::Exception& e) {
            return Err<void>(std::string("invalid command line overrides: ") + e.what(),
                             ErrorKind::ConfigError);
        }
    }
    return Ok();
}

void Config::loadDefaults() {
    setNode(KEY_ASPECT_MAX_DENOMINATOR, YAML::Node(DEFAULT_ASPECT_MAX_DENOMINATOR));
    setNode(KEY_REPORT_PRECISION, YAML::Node(DEFAULT_REPORT_PRECISION));
    setNode(KEY_REPORT_SECONDARY_UNITS, YAML::Node(true));
    setNode(KEY_LOG_LEVEL, YAML::Node("warn"));
}

Result<void> Config::loadFile(const std::string& path) {
    YAML::Node file;
    try {
        file = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Err<void>("cannot load config " + path + ": " + e.what(), ErrorKind::ConfigError);
    }
    if (file.IsNull()) {
        _loadedPath = path;
        return Ok();  // empty file
    }
    if (!file.IsMap()) {
        return Err<void>("config " + path + " must be a mapping", ErrorKind::ConfigError);
    }
    // Merge into a copy so a rejected file leaves no partial settings behind
    YAML::Node merged = YAML::Clone(_config);
    try {
        mergeNodes(merged, file);
    } catch (const YAML::Exception& e) {
        return Err<void>("invalid config " + path + ": " + e.what(), ErrorKind::ConfigError);
    }
    _config.reset(merged);
    _loadedPath = path;
    yinfo("Loaded config from: {}", path);
    return Ok();
}

void Config::applyEnvOverrides() {
    for (const char* key : kKnownKeys) {
        std::string var = pathToEnvVar(key);
        if (const char* value = std::getenv(var.c_str())) {
            ydebug("config: {} overridden by {}", key, var);
            setNode(key, YAML::Node(std::string(value)));
        }
    }
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

YAML::Node Config::getNode(const std::string& path) const {
    return lookup(_config, splitPath(path), 0);
}

void Config::setNode(const std::string& path, const YAML::Node& value) {
    auto parts = splitPath(path);
    if (parts.empty()) return;

    YAML::Node current = _config;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }
    current[parts.back()] = value;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap()) {
            YAML::Node child = target[key];
            if (!child.IsMap()) {
                child = YAML::Node(YAML::NodeType::Map);
            }
            mergeNodes(child, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::vector<std::string> Config::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string var = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') {
            var += '_';
        } else {
            var += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return var;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".config";
    } else {
        return {};
    }
    return base / "screencalc" / "config.yaml";
}

//=============================================================================
// Validated accessors
//=============================================================================

int64_t Config::aspectMaxDenominator() const {
    auto v = get<int64_t>(KEY_ASPECT_MAX_DENOMINATOR);
    if (!v || *v <= 0) {
        ywarn("config: {} must be a positive integer, using {}",
              KEY_ASPECT_MAX_DENOMINATOR, DEFAULT_ASPECT_MAX_DENOMINATOR);
        return DEFAULT_ASPECT_MAX_DENOMINATOR;
    }
    return *v;
}

int Config::reportPrecision() const {
    auto v = get<int>(KEY_REPORT_PRECISION);
    if (!v || *v < 0 || *v > 17) {
        ywarn("config: {} must be between 0 and 17, using {}",
              KEY_REPORT_PRECISION, DEFAULT_REPORT_PRECISION);
        return DEFAULT_REPORT_PRECISION;
    }
    return *v;
}

bool Config::secondaryUnits() const {
    auto v = get<bool>(KEY_REPORT_SECONDARY_UNITS);
    if (!v) {
        ywarn("config: {} must be a boolean, using true", KEY_REPORT_SECONDARY_UNITS);
        return true;
    }
    return *v;
}

std::string Config::logLevel() const {
    auto v = get<std::string>(KEY_LOG_LEVEL, "warn");
    if (std::find(kLogLevels.begin(), kLogLevels.end(), v) == kLogLevels.end()) {
        ywarn("config: unknown {} '{}', using warn", KEY_LOG_LEVEL, v);
        return "warn";
    }
    return v;
}

} // namespace screencalc
