#include "sqliteloader.h"

#include <QFileInfo>
#include <QJsonObject>
#include <QDebug>

#include <sqlite3.h>

namespace Bridge {

namespace {

/// Finalizes a prepared statement when it leaves scope
struct Statement {
    sqlite3_stmt *s = nullptr;
    ~Statement() { if (s) sqlite3_finalize(s); }
};

QJsonValue columnValue(sqlite3_stmt *stmt, int column)
{
    switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_INTEGER:
        return QJsonValue(static_cast<qint64>(sqlite3_column_int64(stmt, column)));
    case SQLITE_FLOAT:
        return QJsonValue(sqlite3_column_double(stmt, column));
    case SQLITE_NULL:
        return QJsonValue(QJsonValue::Null);
    case SQLITE_BLOB: {
        const char *blob = static_cast<const char *>(sqlite3_column_blob(stmt, column));
        int size = sqlite3_column_bytes(stmt, column);
        return QJsonValue(QString::fromLatin1(QByteArray(blob, size).toBase64()));
    }
    default: {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        int size = sqlite3_column_bytes(stmt, column);
        return QJsonValue(QString::fromUtf8(reinterpret_cast<const char *>(text), size));
    }
    }
}

} // namespace

SQLiteLoader::SQLiteLoader(const LoaderProps &props, QObject *parent)
    : Loader(props, parent)
{
}

SQLiteLoader::~SQLiteLoader()
{
    if (m_db) {
        sqlite3_close(m_db);
    }
}

bool SQLiteLoader::openConnection(const DataConnection &connection)
{
    if (!connection.isFile()) {
        setError("SQLiteLoader requires a file connection");
        return false;
    }

    // sqlite3 would silently create a missing database
    if (!QFileInfo::exists(connection.filepath)) {
        setError(QString("Source file not found: %1").arg(connection.filepath));
        return false;
    }

    const QByteArray path = connection.filepath.toUtf8();
    int rc = sqlite3_open_v2(path.constData(), &m_db, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        setError(QString("Failed to open database %1: %2").arg(connection.filepath, lastDbError()));
        sqlite3_close(m_db);
        m_db = nullptr;
        return false;
    }

    m_filepath = connection.filepath;
    qDebug() << "[SQLiteLoader] Opened" << m_filepath;
    return true;
}

void SQLiteLoader::closeConnection()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
    m_filepath.clear();
}

bool SQLiteLoader::sourceKeys(QStringList *keys)
{
    keys->clear();
    Statement st;
    const char *sql = "SELECT name FROM sqlite_master WHERE type = 'table' AND name NOT LIKE 'sqlite_%' ORDER BY name;";
    if (sqlite3_prepare_v2(m_db, sql, -1, &st.s, nullptr) != SQLITE_OK) {
        setError(QString("Failed to list tables in %1: %2").arg(m_filepath, lastDbError()));
        return false;
    }

    int rc;
    while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
        keys->append(QString::fromUtf8(reinterpret_cast<const char *>(sqlite3_column_text(st.s, 0))));
    }

    if (rc != SQLITE_DONE) {
        setError(QString("Failed to list tables in %1: %2").arg(m_filepath, lastDbError()));
        return false;
    }
    return true;
}

bool SQLiteLoader::readInstances(const QString &entityKey, QList<IRInstance> *instances)
{
    QString quoted = entityKey;
    quoted.replace('"', "\"\"");
    const QByteArray sql = QString("SELECT * FROM \"%1\";").arg(quoted).toUtf8();

    Statement st;
    if (sqlite3_prepare_v2(m_db, sql.constData(), -1, &st.s, nullptr) != SQLITE_OK) {
        setError(QString("Failed to read table %1 in %2: %3").arg(entityKey, m_filepath, lastDbError()));
        return false;
    }

    const QString pkey = primaryKeyOf(entityKey);
    const int columns = sqlite3_column_count(st.s);

    int rc;
    while ((rc = sqlite3_step(st.s)) == SQLITE_ROW) {
        QJsonObject row;
        for (int i = 0; i < columns; ++i) {
            row.insert(QString::fromUtf8(sqlite3_column_name(st.s, i)), columnValue(st.s, i));
        }
        instances->append(IRInstance(pkey, entityKey, row));
    }

    if (rc != SQLITE_DONE) {
        setError(QString("Failed to read table %1 in %2: %3").arg(entityKey, m_filepath, lastDbError()));
        return false;
    }
    return true;
}

QString SQLiteLoader::lastDbError() const
{
    return m_db ? QString::fromUtf8(sqlite3_errmsg(m_db)) : QString("out of memory");
}

} // namespace Bridge
