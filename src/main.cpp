#include "bluez/BluezGateway.hpp"
#include "core/ConnectionCoordinator.hpp"
#include "core/DeviceRegistry.hpp"
#include "core/Logger.hpp"
#include "gui/TrayMenuPresenter.hpp"
#include "utils/ConfigManager.hpp"
#include <bluetray/Constants.hpp>
#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QMessageBox>
#include <chrono>
#include <iostream>

using namespace bluetray;

namespace {

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Connect paired Bluetooth devices from the system tray");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Specify configuration file path.",
        "config"
    );
    parser.addOption(configOption);

    QCommandLineOption logFileOption(
        QStringList() << "l" << "log-file",
        "Specify log file path.",
        "log-file"
    );
    parser.addOption(logFileOption);

    QCommandLineOption logLevelOption(
        QStringList() << "v" << "verbosity",
        "Set log level (0-4: debug, info, warning, error, critical).",
        "level",
        "1"
    );
    parser.addOption(logLevelOption);
}

bool loadConfiguration(ConfigManager& config, const QCommandLineParser& parser) {
    QString configPath;

    if (parser.isSet("config")) {
        configPath = parser.value("config");
    } else {
        QStringList configLocations = {
            QDir::currentPath() + "/bluetray.json",
            QDir::homePath() + "/.config/bluetray/bluetray.json",
            "/etc/bluetray/bluetray.json"
        };

        for (const auto& path : configLocations) {
            if (QFile::exists(path)) {
                configPath = path;
                break;
            }
        }
    }

    if (configPath.isEmpty()) {
        LOG_INFO("No configuration file found, using defaults");
        return true;
    }

    if (!config.loadFromFile(configPath.toStdString())) {
        LOG_ERROR("Failed to load configuration from " + configPath.toStdString());
        // Only a file named on the command line is mandatory
        if (parser.isSet("config")) {
            return false;
        }
        config.resetToDefaults();
        return true;
    }
    LOG_INFO("Loaded configuration from " + configPath.toStdString());
    return true;
}

// Command line values win over the configuration file.
void initializeLogger(const ConfigManager& config, const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    std::string logFile = config.getString(ConfigKeys::LOG_FILE);
    if (parser.isSet("log-file")) {
        logFile = parser.value("log-file").toStdString();
    }
    if (!logFile.empty()) {
        logger.setLogFile(logFile);
        logger.setLogDestination(LogDestination::All);
    }

    int verbosity = config.getInt(ConfigKeys::LOG_LEVEL, 1);
    if (parser.isSet("verbosity")) {
        verbosity = parser.value("verbosity").toInt();
    }
    logger.setLogLevel(Logger::levelFromVerbosity(verbosity));
}

void reportFatal(const QString& title, const std::string& message) {
    std::cerr << message << std::endl;
    QMessageBox::critical(nullptr, title, QString::fromStdString(message));
}

} // namespace

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName(APPLICATION_NAME);
    app.setApplicationVersion(APPLICATION_VERSION);
    app.setOrganizationName("bluetray");
    // Only the tray icon is visible; closing a dialog must not exit
    app.setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    setupCommandLineParser(parser);
    parser.process(app);

    // Early messages go to the console at the requested verbosity
    if (parser.isSet("verbosity")) {
        Logger::instance().setLogLevel(
            Logger::levelFromVerbosity(parser.value("verbosity").toInt()));
    }

    ConfigManager configManager;
    if (!loadConfiguration(configManager, parser)) {
        reportFatal("Configuration Error",
                    "Could not load the configuration file; see the log for details.");
        return ExitCodes::FATAL_ERROR;
    }
    initializeLogger(configManager, parser);
    LOG_INFO("Application starting...");

    try {
        if (!QSystemTrayIcon::isSystemTrayAvailable()) {
            LOG_WARNING("No system tray detected; the icon may not be visible");
        }

        BluezGateway gateway;
        gateway.setCallTimeout(std::chrono::milliseconds(
            configManager.getInt(ConfigKeys::GATEWAY_TIMEOUT, DEFAULT_GATEWAY_TIMEOUT)));
        gateway.initialize();

        DeviceRegistry registry;
        ConnectionCoordinator coordinator(registry, gateway);
        coordinator.setFailureCooldown(std::chrono::milliseconds(
            configManager.getInt(ConfigKeys::FAILURE_COOLDOWN, DEFAULT_FAILURE_COOLDOWN)));
        coordinator.setMaxConcurrentOperations(configManager.getInt(
            ConfigKeys::MAX_CONCURRENT_OPERATIONS, DEFAULT_MAX_CONCURRENT_OPERATIONS));

        TrayMenuPresenter presenter(registry, coordinator, configManager);
        presenter.show();

        coordinator.refresh();

        LOG_INFO("Application initialized successfully");
        int result = app.exec();
        LOG_INFO("Application shutting down");
        return result;

    } catch (const BluetoothUnavailableError& e) {
        LOG_CRITICAL("Bluetooth unavailable: " + std::string(e.what()));
        reportFatal("Bluetooth Unavailable",
                    "Bluetooth support is not available on this system:\n" +
                    std::string(e.what()));
        return ExitCodes::BLUETOOTH_UNAVAILABLE;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        reportFatal("Critical Error", "An unhandled error occurred: " + std::string(e.what()));
        return ExitCodes::FATAL_ERROR;
    }
}
