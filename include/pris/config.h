#pragma once

#include <pris/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pris {

//=============================================================================
// Config - layered settings
//
// Later layers override earlier ones:
//   1. built-in defaults
//   2. config file (explicit path, else $XDG_CONFIG_HOME/pris/config.yaml)
//   3. PRIS_* environment variables (font/line-height -> PRIS_FONT_LINE_HEIGHT)
//   4. command overrides
//=============================================================================
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Factory method following the create pattern
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by slash path (e.g., "font/family")
    // Returns nullopt if the key doesn't exist or has another type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // A YAML sequence, or a colon-separated string
    std::vector<std::string> getPathList(const std::string& path) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // The file that was loaded, empty when none
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "PRIS_";

    static constexpr const char* KEY_CANVAS_WIDTH = "canvas/width";
    static constexpr const char* KEY_CANVAS_HEIGHT = "canvas/height";
    static constexpr const char* KEY_UNITS_PT = "units/pt";
    static constexpr const char* KEY_FONT_FAMILY = "font/family";
    static constexpr const char* KEY_FONT_STYLE = "font/style";
    static constexpr const char* KEY_FONT_SIZE = "font/size";
    static constexpr const char* KEY_FONT_LINE_HEIGHT = "font/line-height";
    static constexpr const char* KEY_FONT_TEXT_ALIGN = "font/text-align";
    static constexpr const char* KEY_STYLE_COLOR = "style/color";
    static constexpr const char* KEY_STYLE_LINE_WIDTH = "style/line-width";
    static constexpr const char* KEY_IMAGE_SEARCH_PATH = "image/search-path";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // "font/line-height" -> "PRIS_FONT_LINE_HEIGHT"
    static std::string pathToEnvVar(const std::string& path);
    static std::vector<std::string> splitPath(const std::string& path);
    static std::vector<std::string> parsePathList(const std::string& pathStr);
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

// Template implementations
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

} // namespace pris
