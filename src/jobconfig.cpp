#include "jobconfig.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QJsonDocument>

namespace Bridge {

const QString JobConfig::DEFAULT_REVISION_HEADER = "QDataBridge";

bool JobConfig::load(const QString &path, QString *error)
{
    if (!QFile::exists(path)) {
        if (error) *error = QString("Job file not found: %1").arg(path);
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        if (error) *error = QString("Failed to read job file: %1").arg(path);
        return false;
    }

    // Connection
    const QString kind = settings.value("connection/kind", "file").toString().toLower();
    const QString loaderNodeKey = settings.value("connection/loaderNodeKey").toString();
    if (kind == "file") {
        connection = DataConnection::file(loaderNodeKey, settings.value("connection/filepath").toString());
    } else if (kind == "api") {
        connection = DataConnection::api(loaderNodeKey, settings.value("connection/baseUrl").toString());
    } else {
        if (error) *error = QString("Unknown connection kind \"%1\" in %2").arg(kind, path);
        return false;
    }

    // Integrator data is kept as a JSON string
    const QString dataStr = settings.value("connection/data").toString();
    if (!dataStr.isEmpty()) {
        QJsonDocument doc = QJsonDocument::fromJson(dataStr.toUtf8());
        if (!doc.isNull() && doc.isObject()) {
            connection.data = doc.object();
        }
    }

    // Job
    containerNodeKey = settings.value("job/containerNodeKey").toString();
    enableDelete = settings.value("job/enableDelete", true).toBool();
    revisionHeader = settings.value("job/revisionHeader", DEFAULT_REVISION_HEADER).toString();
    outputDir = settings.value("job/outputDir").toString();

    // Advanced
    debugLogging = settings.value("advanced/debugLogging", false).toBool();

    // Relative file paths are relative to the job file
    if (connection.isFile() && !connection.filepath.isEmpty()
        && QFileInfo(connection.filepath).isRelative()) {
        connection.filepath = QFileInfo(path).dir().filePath(connection.filepath);
    }

    return true;
}

bool JobConfig::save(const QString &path) const
{
    QDir dir = QFileInfo(path).dir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);

    settings.setValue("connection/kind", connection.kindName());
    settings.setValue("connection/loaderNodeKey", connection.loaderNodeKey);
    if (connection.isFile()) {
        settings.setValue("connection/filepath", connection.filepath);
    } else {
        settings.setValue("connection/baseUrl", connection.baseUrl);
    }
    if (!connection.data.isEmpty()) {
        settings.setValue("connection/data",
                          QString::fromUtf8(QJsonDocument(connection.data).toJson(QJsonDocument::Compact)));
    }

    if (!containerNodeKey.isEmpty()) {
        settings.setValue("job/containerNodeKey", containerNodeKey);
    }
    settings.setValue("job/enableDelete", enableDelete);
    settings.setValue("job/revisionHeader", revisionHeader);
    if (!outputDir.isEmpty()) {
        settings.setValue("job/outputDir", outputDir);
    }

    settings.setValue("advanced/debugLogging", debugLogging);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool JobConfig::validate(QString *error) const
{
    if (connection.loaderNodeKey.isEmpty()) {
        if (error) *error = "connection.loaderNodeKey is required";
        return false;
    }
    if (connection.isFile()) {
        if (!QFileInfo(connection.filepath).isFile()) {
            if (error) *error = QString("FileConnection.filepath not found - %1").arg(connection.filepath);
            return false;
        }
    } else if (connection.baseUrl.isEmpty()) {
        if (error) *error = "connection.baseUrl is required for api connections";
        return false;
    }
    return true;
}

} // namespace Bridge
