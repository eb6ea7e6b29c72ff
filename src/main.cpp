#include "core/LibusbAttributeSource.hpp"
#include "core/Logger.hpp"
#include "core/RefreshController.hpp"
#include "core/SysfsAttributeSource.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/ExportManager.hpp"
#include <usbbw/Constants.hpp>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <algorithm>
#include <iostream>
#include <iterator>
#include <set>

using namespace usbbw;

namespace {

const char* const COMMANDS[] = {
    "summary", "list", "recommend", "mermaid", "init-config",
    "generate-config", "label", "watch"
};

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription(
        "USB periodic bandwidth inspector.\n\n"
        "Commands:\n"
        "  summary                      Bandwidth usage per bus (default)\n"
        "  list                         Devices in tree order\n"
        "  recommend                    Best buses for a new device\n"
        "  mermaid                      Topology as a Mermaid flowchart\n"
        "  init-config                  Print an example configuration\n"
        "  generate-config              Configuration seeded from this system\n"
        "  label <config_key> <label>   Store a product label\n"
        "  watch                        Report devices as they come and go\n\n"
        "Configuration keys (JSON, see init-config):\n"
        "  inherit                      File or list of files merged underneath\n"
        "  settings                     refresh_ms, theme, use_bits\n"
        "  controllers                  PCI address -> label\n"
        "  buses                        Bus number -> label\n"
        "  devices                      Device path -> label\n"
        "  products                     VID:PID[:Serial] -> label\n"
        "  physical_ports               Rules on panel/positions/dock -> label\n"
        "  position_labels              ACPI location words -> display words\n"
        "  mermaid                      hide_paths, filter_vendors,\n"
        "                               collapse_single_child_hubs");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "Command to run.", "[command]");

    parser.addOption(QCommandLineOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"));
    parser.addOption(QCommandLineOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"));
    parser.addOption(QCommandLineOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level",
        "2"));
    parser.addOption(QCommandLineOption(
        QStringList() << "o" << "output",
        "Write to file instead of stdout.",
        "file"));
    parser.addOption(QCommandLineOption(
        "markdown", "mermaid: full markdown document with summary."));
    parser.addOption(QCommandLineOption(
        "periodic-only", "list: only devices with periodic endpoints."));
    parser.addOption(QCommandLineOption(
        "verbose", "list: power, serial and endpoint details."));
    parser.addOption(QCommandLineOption(
        "required", "recommend: bandwidth the new device needs, in bps.", "bps", "0"));
    parser.addOption(QCommandLineOption(
        "source", "Attribute source: sysfs or libusb.", "source", "sysfs"));
    parser.addOption(QCommandLineOption(
        "sysfs-root", "Directory to read instead of /sys/bus/usb/devices.", "dir"));
}

void initializeLogger(const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }
    logger.setLogLevel(Logger::levelFromVerbosity(parser.value("verbosity").toInt()));

    LOG_INFO("usbbw starting");
}

// Config errors are reported and the defaults used; never fatal.
void loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    if (parser.isSet("config")) {
        config.loadFromFile(parser.value("config").toStdString());
    } else {
        config.loadDefault();
    }
}

std::unique_ptr<AttributeSource> createSource(const QCommandLineParser& parser) {
    const QString kind = parser.value("source");
    if (kind == "libusb") {
        auto source = std::make_unique<LibusbAttributeSource>();
        source->setReadStrings(true);
        return source;
    }
    if (kind != "sysfs") {
        LOG_WARNING("unknown source '" + kind.toStdString() + "', using sysfs");
    }
    if (parser.isSet("sysfs-root")) {
        return std::make_unique<SysfsAttributeSource>(parser.value("sysfs-root").toStdString());
    }
    return std::make_unique<SysfsAttributeSource>();
}

int runLabel(ConfigManager& config, const QCommandLineParser& parser) {
    const QStringList args = parser.positionalArguments();
    if (args.size() != 3) {
        std::cerr << "usage: usbbw label <VID:PID[:Serial]> <label>" << std::endl;
        return 2;
    }

    const std::string target = parser.isSet("config") ? parser.value("config").toStdString()
                                                      : ConfigManager::userConfigPath();
    if (!config.writeProductLabels(target, {{args[1].toStdString(), args[2].toStdString()}})) {
        std::cerr << config.lastError()->describe() << std::endl;
        return 1;
    }
    std::cerr << "Label written to " << target << std::endl;
    return 0;
}

int runWatch(QCoreApplication& app, RefreshController& controller, int intervalMs) {
    QObject::connect(&controller, &RefreshController::deviceAdded,
                     [&controller](const std::string& path, const std::string& label,
                                   uint64_t ordinal) {
        if (controller.snapshot()->sequence == 1) {
            return;
        }
        std::cout << "[+] #" << ordinal << " " << path << " " << label << std::endl;
    });
    QObject::connect(&controller, &RefreshController::deviceRemoved,
                     [](const std::string& path, const std::string& label) {
        std::cout << "[-] " << path << " " << label << std::endl;
    });
    // A broken device warns on every refresh; report it once
    std::set<std::string> reported;
    QObject::connect(&controller, &RefreshController::warningRaised,
                     [&reported](const TopologyWarning& warning) {
        if (!reported.insert(warning.message).second) {
            return;
        }
        std::cerr << "[!] " << errorCodeName(warning.code) << ": " << warning.message
                  << std::endl;
    });
    QObject::connect(&controller, &RefreshController::refreshFailed,
                     [](const std::string& message) {
        std::cerr << "refresh failed: " << message << std::endl;
    });

    if (!controller.refresh()) {
        return 1;
    }
    std::cout << "Watching " << controller.snapshot()->topology.deviceCount()
              << " devices, refreshing every " << intervalMs << " ms" << std::endl;

    controller.start(intervalMs);
    return app.exec();
}

int run(QCoreApplication& app, const QCommandLineParser& parser) {
    const QStringList args = parser.positionalArguments();
    const std::string command = args.isEmpty() ? "summary" : args.first().toStdString();
    if (std::find(std::begin(COMMANDS), std::end(COMMANDS), command) == std::end(COMMANDS)) {
        std::cerr << "unknown command '" << command << "'" << std::endl;
        return 2;
    }

    ConfigManager configManager;
    loadConfiguration(configManager, parser);
    const LabelConfig& config = configManager.config();

    ExportManager exporter{LabelResolver(config)};
    const std::string output = parser.value("output").toStdString();

    if (command == "init-config") {
        return exporter.write(ConfigManager::exampleConfig(), output) ? 0 : 1;
    }
    if (command == "label") {
        return runLabel(configManager, parser);
    }

    RefreshController controller(createSource(parser), config);
    if (command == "watch") {
        return runWatch(app, controller, config.settings.refreshMs);
    }

    if (!controller.refresh()) {
        std::cerr << "Cannot read the USB topology" << std::endl;
        return 1;
    }
    const Snapshot& snapshot = *controller.snapshot();

    std::string content;
    if (command == "summary") {
        content = exporter.summary(snapshot);
    } else if (command == "list") {
        ListOptions options;
        options.periodicOnly = parser.isSet("periodic-only");
        options.verbose = parser.isSet("verbose");
        content = exporter.deviceList(snapshot, options);
    } else if (command == "recommend") {
        bool ok = false;
        qulonglong required = parser.value("required").toULongLong(&ok);
        if (!ok) {
            std::cerr << "--required expects a number of bits per second" << std::endl;
            return 2;
        }
        content = exporter.recommendations(snapshot, required);
    } else if (command == "mermaid") {
        content = parser.isSet("markdown") ? exporter.markdown(snapshot)
                                           : exporter.mermaid(snapshot);
    } else if (command == "generate-config") {
        content = exporter.generateConfig(snapshot);
    }

    if (!exporter.write(content, output)) {
        return 1;
    }
    if (command == "generate-config" && !output.empty()) {
        std::cerr << "Config written to " << output << std::endl
                  << "Edit the file to customize labels, then copy to one of:" << std::endl;
        for (const auto& path : ConfigManager::defaultSearchPaths()) {
            std::cerr << "  " << path << std::endl;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[]) {
    try {
        QCoreApplication app(argc, argv);
        app.setApplicationName("usbbw");
        app.setApplicationVersion("0.3.0");

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        initializeLogger(parser);
        return run(app, parser);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
