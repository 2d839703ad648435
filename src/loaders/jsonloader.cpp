#include "jsonloader.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonArray>
#include <QJsonParseError>
#include <QDebug>

namespace Bridge {

JSONLoader::JSONLoader(const LoaderProps &props, QObject *parent)
    : Loader(props, parent)
{
}

bool JSONLoader::openConnection(const DataConnection &connection)
{
    if (!connection.isFile()) {
        setError("JSONLoader requires a file connection");
        return false;
    }

    QFile file(connection.filepath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(QString("Failed to open source file: %1").arg(connection.filepath));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        setError(QString("Failed to parse %1: %2").arg(connection.filepath, parseError.errorString()));
        return false;
    }
    if (!doc.isObject()) {
        setError(QString("Source file is not a JSON object: %1").arg(connection.filepath));
        return false;
    }

    m_document = doc.object();
    m_filepath = connection.filepath;
    qDebug() << "[JSONLoader] Opened" << m_filepath << "with" << m_document.size() << "entities";
    return true;
}

void JSONLoader::closeConnection()
{
    m_document = QJsonObject();
    m_filepath.clear();
}

bool JSONLoader::sourceKeys(QStringList *keys)
{
    *keys = m_document.keys();
    return true;
}

bool JSONLoader::readInstances(const QString &entityKey, QList<IRInstance> *instances)
{
    const QJsonValue value = m_document.value(entityKey);
    if (!value.isArray()) {
        setError(QString("Entity %1 in %2 is not an array").arg(entityKey, m_filepath));
        return false;
    }

    const QString pkey = primaryKeyOf(entityKey);
    const QJsonArray rows = value.toArray();
    for (const QJsonValue &row : rows) {
        if (!row.isObject()) {
            setError(QString("Entity %1 in %2 contains a row that is not an object").arg(entityKey, m_filepath));
            return false;
        }
        instances->append(IRInstance(pkey, entityKey, row.toObject()));
    }
    return true;
}

} // namespace Bridge
