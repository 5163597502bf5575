#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QJsonObject>

#include "tci/TciTypes.h"
#include "tci/TciProtocol.h"

/**
 * @brief Application settings manager
 *
 * Handles loading/saving the radio-control configuration to a JSON file.
 * The session components never read the file themselves: values are read
 * when connecting and written back when they change.
 */
class Settings {
public:
    // TCI control endpoint settings
    struct TciSettings {
        QString host = TciProtocol::DEFAULT_HOST;
        int port = TciProtocol::DEFAULT_PORT;
        Profile profile = Profile::Thetis;
        bool sendSpot = true;
        SpotPolicy defaultSpotPolicy = SpotPolicy::Timed;
        int spotTtlSeconds = TciProtocol::DEFAULT_SPOT_TTL_SECONDS;
        int connectTimeoutMs = TciProtocol::DEFAULT_CONNECT_TIMEOUT_MS;
        int commandIntervalMs = TciProtocol::DEFAULT_COMMAND_INTERVAL_MS;
    };

    Settings() = default;
    ~Settings() = default;

    /**
     * @brief Load settings from default config file
     * @return true if successful
     */
    bool load();

    /**
     * @brief Save settings to default config file
     * @return true if successful
     */
    bool save();

    /**
     * @brief Load settings from a custom file path
     * @param filePath Path to the config file
     * @return true if successful
     */
    bool loadFromFile(const QString& filePath);

    /**
     * @brief Save settings to a custom file path
     * @param filePath Path to save the config file
     * @return true if successful
     */
    bool saveToFile(const QString& filePath);

    /**
     * @brief Get config file path (default location in AppData)
     */
    static QString getConfigPath();

    /**
     * @brief Get config directory (AppData)
     */
    static QString getConfigDir();

    bool isDirty() const { return m_dirty; }
    void markDirty() { m_dirty = true; }

    /**
     * @brief Get the file the settings were last loaded from or saved to
     */
    QString currentConfigPath() const { return m_currentConfigPath; }

    // Accessors
    TciSettings& tci() { return m_tci; }
    const TciSettings& tci() const { return m_tci; }

    QJsonObject toJson() const;
    void fromJson(const QJsonObject& json);

private:
    TciSettings m_tci;

    QString m_version = "1.0";
    bool m_dirty = false;
    QString m_currentConfigPath;
};

#endif // SETTINGS_H
