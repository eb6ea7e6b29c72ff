#include "ConfigManager.hpp"
#include "Logger.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStringList>
#include <cctype>

namespace usbbw {

namespace {

using StringMap = std::map<std::string, std::string>;

std::string str(const QString& s) {
    return s.toStdString();
}

[[noreturn]] void parseError(const std::string& file, const std::string& key,
                             const std::string& message) {
    throw ConfigException(ErrorCode::ConfigParseError, file, key, message);
}

StringMap readStringMap(const QJsonObject& root, const QString& section, const std::string& file) {
    StringMap result;
    QJsonValue value = root.value(section);
    if (value.isUndefined() || value.isNull()) {
        return result;
    }
    if (!value.isObject()) {
        parseError(file, str(section), "'" + str(section) + "' must be a table of labels");
    }
    QJsonObject table = value.toObject();
    for (auto it = table.begin(); it != table.end(); ++it) {
        if (!it.value().isString()) {
            parseError(file, str(section) + "." + str(it.key()), "label must be a string");
        }
        result[str(it.key())] = str(it.value().toString());
    }
    return result;
}

std::vector<std::string> readStringList(const QJsonObject& table, const QString& name,
                                        const std::string& keyPrefix, const std::string& file) {
    std::vector<std::string> result;
    QJsonValue value = table.value(name);
    if (value.isUndefined() || value.isNull()) {
        return result;
    }
    if (!value.isArray()) {
        parseError(file, keyPrefix + str(name), "must be an array of strings");
    }
    for (const QJsonValue& item : value.toArray()) {
        if (!item.isString()) {
            parseError(file, keyPrefix + str(name), "must be an array of strings");
        }
        result.push_back(str(item.toString()));
    }
    return result;
}

std::optional<std::string> optionalString(const QJsonObject& table, const QString& name,
                                          const std::string& key, const std::string& file) {
    QJsonValue value = table.value(name);
    if (value.isUndefined() || value.isNull()) {
        return std::nullopt;
    }
    if (!value.isString()) {
        parseError(file, key, "must be a string");
    }
    return str(value.toString());
}

bool isHexWord(const std::string& s) {
    if (s.size() != 4) return false;
    for (char c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

QJsonObject readLayer(const QString& path, QStringList& stack) {
    QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        throw ConfigException(ErrorCode::ConfigNotFound, str(path), "",
                              "configuration file not found");
    }

    QString canonical = info.canonicalFilePath();
    if (stack.contains(canonical)) {
        QStringList chain = stack.mid(stack.indexOf(canonical));
        chain << canonical;
        throw ConfigException(ErrorCode::ConfigCycle, str(path), "inherit",
                              "circular inheritance: " + str(chain.join(" -> ")));
    }

    QFile file(canonical);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigException(ErrorCode::ConfigNotFound, str(path), "",
                              "cannot read configuration file: " + str(file.errorString()));
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError) {
        parseError(str(path), "", str(error.errorString()) +
                   " at offset " + std::to_string(error.offset));
    }
    if (!doc.isObject()) {
        parseError(str(path), "", "top level must be an object");
    }

    QJsonObject layer = doc.object();
    QJsonValue inherit = layer.take("inherit");
    if (inherit.isUndefined()) {
        return layer;
    }

    QStringList parents;
    if (inherit.isString()) {
        parents << inherit.toString();
    } else if (inherit.isArray()) {
        for (const QJsonValue& item : inherit.toArray()) {
            if (!item.isString()) {
                parseError(str(path), "inherit", "inherit array must contain only strings");
            }
            parents << item.toString();
        }
    } else {
        parseError(str(path), "inherit", "inherit must be a string or array of strings");
    }

    stack << canonical;
    QJsonValue merged;
    bool haveParent = false;
    for (const QString& parent : parents) {
        QJsonObject inherited = readLayer(info.absoluteDir().filePath(parent), stack);
        merged = haveParent ? ConfigManager::mergeLayers(merged, inherited) : QJsonValue(inherited);
        haveParent = true;
    }
    stack.removeLast();

    if (!haveParent) {
        return layer;
    }
    return ConfigManager::mergeLayers(merged, layer).toObject();
}

} // namespace

bool PhysicalPortRule::matches(const PhysicalLocation& location) const {
    if (panel && *panel != location.panel) return false;
    if (horizontalPosition && *horizontalPosition != location.horizontalPosition) return false;
    if (verticalPosition && *verticalPosition != location.verticalPosition) return false;
    if (dock && *dock != location.dock) return false;
    return true;
}

LabelConfig LabelConfig::fromJson(const QJsonObject& root, const std::string& file) {
    LabelConfig config;

    QJsonValue settings = root.value("settings");
    if (settings.isObject()) {
        QJsonObject table = settings.toObject();
        if (table.contains("refresh_ms")) {
            QJsonValue v = table.value("refresh_ms");
            if (!v.isDouble() || v.toInt() <= 0) {
                parseError(file, "settings.refresh_ms", "must be a positive integer");
            }
            config.settings.refreshMs = v.toInt();
        }
        if (auto theme = optionalString(table, "theme", "settings.theme", file)) {
            config.settings.theme = *theme;
        }
        if (table.contains("use_bits")) {
            if (!table.value("use_bits").isBool()) {
                parseError(file, "settings.use_bits", "must be true or false");
            }
            config.settings.useBits = table.value("use_bits").toBool();
        }
    } else if (!settings.isUndefined() && !settings.isNull()) {
        parseError(file, "settings", "'settings' must be a table");
    }

    config.controllers = readStringMap(root, "controllers", file);
    config.buses = readStringMap(root, "buses", file);
    config.devices = readStringMap(root, "devices", file);

    for (const auto& [key, label] : readStringMap(root, "products", file)) {
        auto normalized = ConfigManager::normalizeProductKey(key);
        if (!normalized) {
            parseError(file, "products." + key, "expected VID:PID or VID:PID:Serial");
        }
        config.products[*normalized] = label;
    }

    QJsonValue ports = root.value("physical_ports");
    if (ports.isArray()) {
        int i = 0;
        for (const QJsonValue& item : ports.toArray()) {
            std::string key = "physical_ports[" + std::to_string(i++) + "]";
            if (!item.isObject()) {
                parseError(file, key, "each physical port rule must be a table");
            }
            QJsonObject table = item.toObject();
            PhysicalPortRule rule;
            auto label = optionalString(table, "label", key + ".label", file);
            if (!label) {
                parseError(file, key + ".label", "physical port rule needs a label");
            }
            rule.label = *label;
            rule.panel = optionalString(table, "panel", key + ".panel", file);
            rule.horizontalPosition = optionalString(table, "horizontal_position",
                                                     key + ".horizontal_position", file);
            rule.verticalPosition = optionalString(table, "vertical_position",
                                                   key + ".vertical_position", file);
            if (table.contains("dock")) {
                if (!table.value("dock").isBool()) {
                    parseError(file, key + ".dock", "must be true or false");
                }
                rule.dock = table.value("dock").toBool();
            }
            config.physicalPorts.push_back(std::move(rule));
        }
    } else if (!ports.isUndefined() && !ports.isNull()) {
        parseError(file, "physical_ports", "'physical_ports' must be an array");
    }

    QJsonValue positions = root.value("position_labels");
    if (positions.isObject()) {
        QJsonObject table = positions.toObject();
        config.positionLabels.panel = readStringMap(table, "panel", file);
        config.positionLabels.vertical = readStringMap(table, "vertical", file);
        config.positionLabels.horizontal = readStringMap(table, "horizontal", file);
    } else if (!positions.isUndefined() && !positions.isNull()) {
        parseError(file, "position_labels", "'position_labels' must be a table");
    }

    QJsonValue mermaid = root.value("mermaid");
    if (mermaid.isObject()) {
        QJsonObject table = mermaid.toObject();
        config.mermaid.hidePaths = readStringList(table, "hide_paths", "mermaid.", file);
        config.mermaid.filterVendors = readStringList(table, "filter_vendors", "mermaid.", file);
        for (auto& vendor : config.mermaid.filterVendors) {
            for (auto& c : vendor) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
        }
        if (table.contains("collapse_single_child_hubs")) {
            if (!table.value("collapse_single_child_hubs").isBool()) {
                parseError(file, "mermaid.collapse_single_child_hubs", "must be true or false");
            }
            config.mermaid.collapseSingleChildHubs =
                table.value("collapse_single_child_hubs").toBool();
        }
    } else if (!mermaid.isUndefined() && !mermaid.isNull()) {
        parseError(file, "mermaid", "'mermaid' must be a table");
    }

    return config;
}

std::string ConfigError::describe() const {
    std::string text = std::string(errorCodeName(code)) + " in " + file;
    if (!key.empty()) {
        text += " (key '" + key + "')";
    }
    return text + ": " + message;
}

class ConfigManager::Private {
public:
    LabelConfig config;
    std::string loadedFile;
    std::optional<ConfigError> lastError;
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
}

ConfigManager::~ConfigManager() = default;

const LabelConfig& ConfigManager::config() const {
    return d->config;
}

std::string ConfigManager::loadedFile() const {
    return d->loadedFile;
}

std::optional<ConfigError> ConfigManager::lastError() const {
    return d->lastError;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    try {
        QJsonObject merged = loadLayers(filename);
        d->config = LabelConfig::fromJson(merged, filename);
        d->loadedFile = filename;
        d->lastError.reset();
    } catch (const ConfigException& e) {
        resetToDefaults();
        d->lastError = ConfigError{e.code(), e.file(), e.key(), e.what()};
        LOG_ERROR(d->lastError->describe() + "; using default configuration");
        emit configError(e.file(), e.key(), e.what());
        return false;
    }

    LOG_INFO("Loaded configuration from " + filename);
    emit configLoaded(filename);
    return true;
}

bool ConfigManager::loadDefault() {
    for (const auto& path : defaultSearchPaths()) {
        if (QFileInfo::exists(QString::fromStdString(path))) {
            return loadFromFile(path);
        }
    }

    LOG_INFO("No configuration file found, using defaults");
    resetToDefaults();
    return true;
}

void ConfigManager::resetToDefaults() {
    d->config = LabelConfig{};
    d->loadedFile.clear();
    d->lastError.reset();
}

bool ConfigManager::writeProductLabels(const std::string& filename,
                                       const std::map<std::string, std::string>& labels) {
    auto fail = [this, &filename](const std::string& key, const std::string& message) {
        d->lastError = ConfigError{ErrorCode::ConfigParseError, filename, key, message};
        LOG_ERROR("Failed to write labels: " + d->lastError->describe());
        emit configError(filename, key, message);
        return false;
    };

    QString path = QString::fromStdString(filename);
    QJsonObject root;

    if (QFileInfo::exists(path)) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            return fail("", "cannot read: " + str(file.errorString()));
        }
        QByteArray content = file.readAll();
        if (!content.trimmed().isEmpty()) {
            QJsonParseError error;
            QJsonDocument doc = QJsonDocument::fromJson(content, &error);
            if (error.error != QJsonParseError::NoError || !doc.isObject()) {
                return fail("", "existing file does not parse, not overwriting");
            }
            root = doc.object();
        }
    }

    QJsonValue productsValue = root.value("products");
    if (!productsValue.isUndefined() && !productsValue.isObject()) {
        return fail("products", "'products' is not a table, not overwriting");
    }
    QJsonObject products = productsValue.toObject();

    for (const auto& [key, label] : labels) {
        auto normalized = normalizeProductKey(key);
        if (!normalized) {
            return fail("products." + key, "expected VID:PID or VID:PID:Serial");
        }
        products.insert(QString::fromStdString(*normalized), QString::fromStdString(label));
    }
    root.insert("products", products);

    QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return fail("", "cannot create directory " + str(info.absolutePath()));
    }

    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly)) {
        return fail("", "cannot write: " + str(out.errorString()));
    }
    out.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!out.commit()) {
        return fail("", "cannot write: " + str(out.errorString()));
    }

    LOG_INFO("Wrote " + std::to_string(labels.size()) + " label(s) to " + filename);
    emit labelsWritten(filename, static_cast<int>(labels.size()));
    return true;
}

QJsonObject ConfigManager::loadLayers(const std::string& filename) {
    QStringList stack;
    return readLayer(QString::fromStdString(filename), stack);
}

QJsonValue ConfigManager::mergeLayers(const QJsonValue& parent, const QJsonValue& child) {
    if (parent.isObject() && child.isObject()) {
        QJsonObject result = parent.toObject();
        QJsonObject overlay = child.toObject();
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            if (result.contains(it.key())) {
                result.insert(it.key(), mergeLayers(result.value(it.key()), it.value()));
            } else {
                result.insert(it.key(), it.value());
            }
        }
        return result;
    }

    if (parent.isArray() && child.isArray()) {
        QJsonArray result = parent.toArray();
        for (const QJsonValue& item : child.toArray()) {
            result.append(item);
        }
        return result;
    }

    return child;
}

std::vector<std::string> ConfigManager::defaultSearchPaths() {
    return {
        str(QDir::currentPath() + "/usbbw.json"),
        userConfigPath(),
        "/etc/usbbw.json"
    };
}

std::string ConfigManager::userConfigPath() {
    return str(QDir::homePath() + "/.config/usbbw/config.json");
}

std::optional<std::string> ConfigManager::normalizeProductKey(const std::string& key) {
    auto first = key.find(':');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto second = key.find(':', first + 1);

    std::string vid = key.substr(0, first);
    std::string pid = key.substr(first + 1, second == std::string::npos ? std::string::npos
                                                                        : second - first - 1);
    if (!isHexWord(vid) || !isHexWord(pid)) {
        return std::nullopt;
    }

    std::string result = vid + ":" + pid;
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (second != std::string::npos) {
        std::string serial = key.substr(second + 1);
        if (serial.empty()) {
            return std::nullopt;
        }
        result += ":" + serial;
    }
    return result;
}

std::string ConfigManager::exampleConfig() {
    return R"({
    "inherit": [],
    "settings": {
        "refresh_ms": 1000,
        "theme": "dark",
        "use_bits": true
    },
    "controllers": {
        "0000:c1:00.4": "Integrated USB"
    },
    "buses": {
        "1": "Internal USB 2.0",
        "2": "Internal USB 3.x"
    },
    "devices": {
        "3-1": "Dock Hub"
    },
    "physical_ports": [
        { "panel": "left", "vertical_position": "upper", "label": "Left Rear USB Port" }
    ],
    "position_labels": {
        "panel": { "left": "Left", "right": "Right" },
        "vertical": { "upper": "Rear", "lower": "Front" },
        "horizontal": {}
    },
    "products": {
        "0d28:0204": "DAPLink Debug Adapter"
    },
    "mermaid": {
        "hide_paths": [],
        "filter_vendors": [],
        "collapse_single_child_hubs": false
    }
}
)";
}

}
