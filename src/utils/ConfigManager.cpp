#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include "../core/Messages.hpp"
#include "../core/StreamOptions.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <cmath>
#include <map>
#include <optional>

namespace mirror_launcher {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

namespace keys {
constexpr const char* MaxSize = "maxSize";
constexpr const char* MaxFps = "maxFps";
constexpr const char* Bitrate = "bitrate";
constexpr const char* Codec = "codec";
constexpr const char* ScreenOff = "screenOff";
constexpr const char* Borderless = "borderless";
constexpr const char* WindowPosition = "windowPosition";
constexpr const char* PrintFps = "printFps";
constexpr const char* LastIp = "lastIp";
constexpr const char* Language = "language";
constexpr const char* ShowOnboarding = "showOnboarding";
constexpr const char* AdbPath = "adbPath";
constexpr const char* ScrcpyPath = "scrcpyPath";
}

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> settings;

    // Utility functions for JSON conversion
    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double d) -> QJsonValue { return d; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return ConfigValue{json.toBool()};
            case QJsonValue::Double: {
                const double number = json.toDouble();
                if (std::floor(number) == number && std::abs(number) < 2147483647.0) {
                    return ConfigValue{static_cast<int>(number)};
                }
                return ConfigValue{number};
            }
            case QJsonValue::String:
                return ConfigValue{json.toString().toStdString()};
            default:
                return std::nullopt;
        }
    }

    void setDefaults() {
        const StreamParameters defaults;
        settings = {
            {keys::MaxSize, pixels(defaults.maxDimension)},
            {keys::MaxFps, framesPerSecond(defaults.maxFps)},
            {keys::Bitrate, defaults.bitrateMbps},
            {keys::Codec, codecName(defaults.codec)},
            {keys::ScreenOff, defaults.screenOff},
            {keys::Borderless, defaults.borderless},
            {keys::WindowPosition, positionName(defaults.windowPosition)},
            {keys::PrintFps, defaults.printFps},
            {keys::LastIp, std::string()},
            {keys::Language, languageCode(Language::English)},
            {keys::ShowOnboarding, true}
        };
    }

    template<typename T>
    const T* find(const std::string& key) const {
        auto it = settings.find(key);
        if (it == settings.end()) {
            return nullptr;
        }
        return std::get_if<T>(&it->second);
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    const bool* value = d->find<bool>(key);
    return value ? *value : defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    const int* value = d->find<int>(key);
    return value ? *value : defaultValue;
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    if (const double* value = d->find<double>(key)) {
        return *value;
    }
    if (const int* value = d->find<int>(key)) {
        return *value;
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    const std::string* value = d->find<std::string>(key);
    return value ? *value : defaultValue;
}

void ConfigManager::setBool(const std::string& key, bool value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->settings[key] = value;
    emit configChanged(key);
}

StreamParameters ConfigManager::streamParameters() const {
    StreamParameters params;

    if (auto dimension = dimensionFromPixels(getInt(keys::MaxSize, pixels(params.maxDimension)))) {
        params.maxDimension = *dimension;
    }
    if (auto fps = fpsFromValue(getInt(keys::MaxFps, framesPerSecond(params.maxFps)))) {
        params.maxFps = *fps;
    }
    params.bitrateMbps = clampBitrate(getInt(keys::Bitrate, params.bitrateMbps));
    if (auto codec = codecFromName(getString(keys::Codec))) {
        params.codec = *codec;
    }
    params.screenOff = getBool(keys::ScreenOff, params.screenOff);
    params.borderless = getBool(keys::Borderless, params.borderless);
    if (auto position = positionFromName(getString(keys::WindowPosition))) {
        params.windowPosition = *position;
    }
    params.printFps = getBool(keys::PrintFps, params.printFps);

    return params;
}

void ConfigManager::setStreamParameters(const StreamParameters& params) {
    setInt(keys::MaxSize, pixels(params.maxDimension));
    setInt(keys::MaxFps, framesPerSecond(params.maxFps));
    setInt(keys::Bitrate, clampBitrate(params.bitrateMbps));
    setString(keys::Codec, codecName(params.codec));
    setBool(keys::ScreenOff, params.screenOff);
    setBool(keys::Borderless, params.borderless);
    setString(keys::WindowPosition, positionName(params.windowPosition));
    setBool(keys::PrintFps, params.printFps);
}

std::string ConfigManager::lastIp() const {
    return getString(keys::LastIp);
}

void ConfigManager::setLastIp(const std::string& ip) {
    setString(keys::LastIp, ip);
}

Language ConfigManager::language() const {
    return languageFromCode(getString(keys::Language), Language::English);
}

void ConfigManager::setLanguage(Language language) {
    setString(keys::Language, languageCode(language));
}

bool ConfigManager::showOnboarding() const {
    return getBool(keys::ShowOnboarding, true);
}

void ConfigManager::setShowOnboarding(bool show) {
    setBool(keys::ShowOnboarding, show);
}

std::string ConfigManager::adbPath() const {
    return getString(keys::AdbPath);
}

std::string ConfigManager::scrcpyPath() const {
    return getString(keys::ScrcpyPath);
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.exists()) {
        LOG_WARNING("No settings file at " + filename + ", using defaults");
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING("Cannot read settings file " + filename + ": " +
                    file.errorString().toStdString());
        return false;
    }

    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (doc.isNull() || !doc.isObject()) {
        LOG_WARNING("Settings file " + filename + " is corrupt (" +
                    error.errorString().toStdString() + "), using defaults");
        d->setDefaults();
        return false;
    }

    const QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        if (auto value = d->fromJsonValue(it.value())) {
            d->settings[it.key().toStdString()] = *value;
        } else {
            LOG_DEBUG("Ignoring setting " + it.key().toStdString() + " of unsupported type");
        }
    }

    LOG_DEBUG("Loaded settings from " + filename);
    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject root;
    for (const auto& [key, value] : d->settings) {
        root[QString::fromStdString(key)] = d->toJsonValue(value);
    }

    QSaveFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR("Cannot write settings file " + filename + ": " +
                  file.errorString().toStdString());
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    if (!file.commit()) {
        LOG_ERROR("Failed to save settings to " + filename + ": " +
                  file.errorString().toStdString());
        return false;
    }
    return true;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();

    // Notify about changes
    for (const auto& [key, _] : d->settings) {
        emit configChanged(key);
    }
}

}
