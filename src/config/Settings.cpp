#include "config/Settings.h"
#include <QFile>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QDebug>

namespace {

bool readJsonObject(const QString& path, QJsonObject& out)
{
    QFile file(path);

    if (!file.exists()) {
        qDebug() << "Config file does not exist, using defaults:" << path;
        return false;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "Failed to open config file:" << path;
        return false;
    }

    QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "Invalid config file format:" << path << parseError.errorString();
        return false;
    }

    out = doc.object();
    return true;
}

bool writeJsonObject(const QString& path, const QJsonObject& json)
{
    QFileInfo fileInfo(path);
    QDir().mkpath(fileInfo.absolutePath());

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Failed to save config file:" << path;
        return false;
    }

    QJsonDocument doc(json);
    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();
    return true;
}

} // namespace

QString Settings::getConfigDir()
{
    QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    // Ensure directory name is SwlView
    if (!appData.endsWith("SwlView")) {
        appData = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation) + "/SwlView";
    }
    return appData;
}

QString Settings::getConfigPath()
{
    return getConfigDir() + "/config.json";
}

bool Settings::load()
{
    QString path = getConfigPath();
    QJsonObject json;
    if (!readJsonObject(path, json)) {
        return false;
    }

    fromJson(json);
    m_currentConfigPath = path;
    m_dirty = false;
    qDebug() << "Settings loaded from:" << path;
    return true;
}

bool Settings::save()
{
    QString path = getConfigPath();
    if (!writeJsonObject(path, toJson())) {
        return false;
    }

    m_currentConfigPath = path;
    m_dirty = false;
    qDebug() << "Settings saved to:" << path;
    return true;
}

bool Settings::loadFromFile(const QString& filePath)
{
    QJsonObject json;
    if (!readJsonObject(filePath, json)) {
        return false;
    }

    fromJson(json);
    m_currentConfigPath = filePath;
    m_dirty = false;
    qDebug() << "Settings loaded from:" << filePath;
    return true;
}

bool Settings::saveToFile(const QString& filePath)
{
    if (!writeJsonObject(filePath, toJson())) {
        return false;
    }

    m_currentConfigPath = filePath;
    m_dirty = false;
    qDebug() << "Settings saved to:" << filePath;
    return true;
}

QJsonObject Settings::toJson() const
{
    QJsonObject root;
    root["version"] = m_version;

    // TCI
    QJsonObject tci;
    tci["host"] = m_tci.host;
    tci["port"] = m_tci.port;
    tci["profile"] = profileToString(m_tci.profile);
    tci["send_spot"] = m_tci.sendSpot;
    tci["default_spot_policy"] = spotPolicyToString(m_tci.defaultSpotPolicy);
    tci["spot_ttl_seconds"] = m_tci.spotTtlSeconds;
    tci["connect_timeout_ms"] = m_tci.connectTimeoutMs;
    tci["command_interval_ms"] = m_tci.commandIntervalMs;
    root["tci"] = tci;

    return root;
}

void Settings::fromJson(const QJsonObject& json)
{
    m_version = json["version"].toString("1.0");

    QJsonObject tci = json["tci"].toObject();

    QString host = tci["host"].toString(TciProtocol::DEFAULT_HOST).trimmed();
    m_tci.host = host.isEmpty() ? TciProtocol::DEFAULT_HOST : host;

    int port = tci["port"].toInt(TciProtocol::DEFAULT_PORT);
    m_tci.port = (port > 0 && port <= 65535) ? port : TciProtocol::DEFAULT_PORT;

    bool ok = false;
    m_tci.profile = profileFromString(tci["profile"].toString("thetis"), &ok);
    if (!ok) {
        qWarning() << "Unknown TCI profile in config, using thetis:" << tci["profile"].toString();
    }

    m_tci.sendSpot = tci["send_spot"].toBool(true);
    m_tci.defaultSpotPolicy = spotPolicyFromString(tci["default_spot_policy"].toString("timed"), &ok);
    if (!ok) {
        qWarning() << "Unknown spot policy in config, using timed:"
                   << tci["default_spot_policy"].toString();
    }
    m_tci.spotTtlSeconds = qMax(1, tci["spot_ttl_seconds"].toInt(TciProtocol::DEFAULT_SPOT_TTL_SECONDS));
    m_tci.connectTimeoutMs = qMax(100, tci["connect_timeout_ms"].toInt(TciProtocol::DEFAULT_CONNECT_TIMEOUT_MS));
    m_tci.commandIntervalMs = qMax(0, tci["command_interval_ms"].toInt(TciProtocol::DEFAULT_COMMAND_INTERVAL_MS));
}
