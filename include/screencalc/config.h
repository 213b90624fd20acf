#pragma once

#include <screencalc/result.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace screencalc {

/**
 * Config - YAML settings with environment and command line overrides.
 *
 * Precedence, lowest first:
 *   built-in defaults
 *   config file (explicit path, else $XDG_CONFIG_HOME/screencalc/config.yaml)
 *   SCREENCALC_* environment variables (report.precision -> SCREENCALC_REPORT_PRECISION)
 *   command line overrides
 *
 * A missing default file is fine; an explicit path that cannot be read or
 * parsed is a ConfigError.
 */
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "report.precision"), nullopt if missing
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Path of the file actually loaded, empty if none
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    // "report.precision" -> "SCREENCALC_REPORT_PRECISION"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "SCREENCALC_";

    static constexpr const char* KEY_ASPECT_MAX_DENOMINATOR = "solver.aspect-max-denominator";
    static constexpr const char* KEY_REPORT_PRECISION = "report.precision";
    static constexpr const char* KEY_REPORT_SECONDARY_UNITS = "report.secondary-units";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

    static constexpr int64_t DEFAULT_ASPECT_MAX_DENOMINATOR = 100;
    static constexpr int DEFAULT_REPORT_PRECISION = 3;

    // Validated accessors, invalid settings fall back to defaults
    int64_t aspectMaxDenominator() const;
    int reportPrecision() const;
    bool secondaryUnits() const;
    std::string logLevel() const;

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    Result<void> loadFile(const std::string& path);
    void loadDefaults();
    void applyEnvOverrides();

    YAML::Node getNode(const std::string& path) const;
    void setNode(const std::string& path, const YAML::Node& value);

    // Merge source into target, scalars in source win
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    static std::vector<std::string> splitPath(const std::string& path);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace screencalc
