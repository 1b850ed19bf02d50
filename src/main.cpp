#include "gui/MainWindow.hpp"
#include "core/ApplicationController.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/ToolLocator.hpp"
#include "core/Logger.hpp"
#include <QApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QMessageBox>
#include <QDir>
#include <iostream>

using namespace mirror_launcher;

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Mirror Launcher");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(
        QStringList() << "c" << "config",
        "Specify settings file path.",
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

void initializeLogger(const QCommandLineParser& parser) {
    auto& logger = Logger::instance();

    if (parser.isSet("log-file")) {
        logger.setLogFile(parser.value("log-file").toStdString());
        logger.setLogDestination(LogDestination::All);
    }

    if (parser.isSet("verbosity")) {
        int level = parser.value("verbosity").toInt();
        switch (level) {
            case 0: logger.setLogLevel(LogLevel::Debug); break;
            case 1: logger.setLogLevel(LogLevel::Info); break;
            case 2: logger.setLogLevel(LogLevel::Warning); break;
            case 3: logger.setLogLevel(LogLevel::Error); break;
            case 4: logger.setLogLevel(LogLevel::Critical); break;
            default: logger.setLogLevel(LogLevel::Info); break;
        }
    }

    LOG_DEBUG("Application starting...");
}

std::string settingsPath(const QCommandLineParser& parser) {
    if (parser.isSet("config")) {
        return parser.value("config").toStdString();
    }
    return QDir(QCoreApplication::applicationDirPath()).filePath("config.json").toStdString();
}

void handleUnexpectedExceptions() {
    try {
        throw;  // Rethrow the current exception
    } catch (const std::exception& e) {
        LOG_CRITICAL("Unhandled exception: " + std::string(e.what()));
        QMessageBox::critical(nullptr, "Critical Error",
            QString("An unhandled error occurred: %1\n\n"
                   "The application will now close.").arg(e.what()));
    } catch (...) {
        LOG_CRITICAL("Unknown unhandled exception");
        QMessageBox::critical(nullptr, "Critical Error",
            "An unknown error occurred.\n\n"
            "The application will now close.");
    }
}

int main(int argc, char *argv[]) {
    std::set_terminate([]() {
        handleUnexpectedExceptions();
        std::abort();
    });

    try {
        QApplication app(argc, argv);
        app.setApplicationName("Mirror Launcher");
        app.setApplicationVersion("1.0.0");

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        initializeLogger(parser);

        // A missing or corrupt file leaves the defaults in place.
        const std::string configPath = settingsPath(parser);
        ConfigManager configManager;
        configManager.loadFromFile(configPath);

        ApplicationController::Options options;
        options.tools = locateTools(QCoreApplication::applicationDirPath().toStdString(), configManager);
        options.configPath = configPath;

        ApplicationController controller(configManager, options);
        MainWindow mainWindow(&controller);
        mainWindow.show();

        controller.start();
        LOG_DEBUG("Application initialized successfully");

        const int status = app.exec();
        controller.shutdown();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        LOG_CRITICAL("Fatal error: " + std::string(e.what()));
        return 1;
    } catch (...) {
        std::cerr << "Unknown fatal error occurred" << std::endl;
        LOG_CRITICAL("Unknown fatal error occurred");
        return 1;
    }
}
