#pragma once
#include <usbbw/Constants.hpp>
#include <usbbw/Types.hpp>
#include <QJsonObject>
#include <QJsonValue>
#include <QObject>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace usbbw {

struct Settings {
    int refreshMs{DEFAULT_REFRESH_MS};
    std::string theme{"dark"};
    bool useBits{true};
};

// Matches a device's ACPI physical location; absent fields match anything.
struct PhysicalPortRule {
    std::optional<std::string> panel;
    std::optional<std::string> horizontalPosition;
    std::optional<std::string> verticalPosition;
    std::optional<bool> dock;
    std::string label;

    bool matches(const PhysicalLocation& location) const;
};

// ACPI location words -> display words, used for generated port labels
struct PositionLabels {
    std::map<std::string, std::string> panel;
    std::map<std::string, std::string> vertical;
    std::map<std::string, std::string> horizontal;
};

struct MermaidSettings {
    std::vector<std::string> hidePaths;
    std::vector<std::string> filterVendors;
    bool collapseSingleChildHubs{false};
};

// The merged, typed view of all configuration layers.
struct LabelConfig {
    Settings settings;
    std::map<std::string, std::string> controllers;  // PCI address -> label
    std::map<std::string, std::string> buses;        // "3" -> label
    std::map<std::string, std::string> devices;      // "3-1.2" -> label
    std::map<std::string, std::string> products;     // VID:PID[:Serial] -> label
    std::vector<PhysicalPortRule> physicalPorts;
    PositionLabels positionLabels;
    MermaidSettings mermaid;

    // Throws ConfigException(ConfigParseError) naming the offending key.
    static LabelConfig fromJson(const QJsonObject& root, const std::string& file = "");
};

struct ConfigError {
    ErrorCode code;
    std::string file;
    std::string key;
    std::string message;

    std::string describe() const;
};

class ConfigException : public UsbError {
public:
    ConfigException(ErrorCode code,
                    const std::string& file,
                    const std::string& key,
                    const std::string& message)
        : UsbError(code, message), file_(file), key_(key) {}

    const std::string& file() const { return file_; }
    const std::string& key() const { return key_; }

private:
    std::string file_;
    std::string key_;
};

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    const LabelConfig& config() const;
    std::string loadedFile() const;
    std::optional<ConfigError> lastError() const;

    // Loads a file and everything it inherits. On any failure the built-in
    // defaults are restored and lastError() describes what went wrong.
    bool loadFromFile(const std::string& filename);
    // First existing file of defaultSearchPaths(); none found is not an error.
    bool loadDefault();
    void resetToDefaults();

    // Adds or replaces entries of the file's own "products" mapping. Other
    // keys are kept; a file that does not parse is left alone.
    bool writeProductLabels(const std::string& filename,
                            const std::map<std::string, std::string>& labels);

    static QJsonObject loadLayers(const std::string& filename);
    static QJsonValue mergeLayers(const QJsonValue& parent, const QJsonValue& child);
    static std::vector<std::string> defaultSearchPaths();
    static std::string userConfigPath();
    static std::optional<std::string> normalizeProductKey(const std::string& key);
    static std::string exampleConfig();

signals:
    void configLoaded(const std::string& filename);
    void configError(const std::string& file, const std::string& key, const std::string& message);
    void labelsWritten(const std::string& filename, int count);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
