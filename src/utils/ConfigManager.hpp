#pragma once
#include <mirror-launcher/Types.hpp>
#include <QObject>
#include <memory>
#include <string>
#include <variant>

namespace mirror_launcher {

using ConfigValue = std::variant<bool, int, double, std::string>;

// Flat JSON settings document. Unknown keys survive a load/save cycle;
// the typed accessors fall back per field when a stored value is invalid.
class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    // Configuration access
    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    // Typed settings
    StreamParameters streamParameters() const;
    void setStreamParameters(const StreamParameters& params);

    std::string lastIp() const;
    void setLastIp(const std::string& ip);

    Language language() const;
    void setLanguage(Language language);

    bool showOnboarding() const;
    void setShowOnboarding(bool show);

    // Empty unless the user pinned a tool location.
    std::string adbPath() const;
    std::string scrcpyPath() const;

    // File operations. A missing or unreadable file leaves the defaults in
    // place and returns false.
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
