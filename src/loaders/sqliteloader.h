#ifndef SQLITELOADER_H
#define SQLITELOADER_H

#include "loader.h"

struct sqlite3;

namespace Bridge {

/**
 * @brief Loader for SQLite database files
 *
 * Every table is an entity and every row an instance. Column values keep
 * their SQLite storage class: integers and reals become JSON numbers, text
 * becomes strings and NULL becomes JSON null.
 */
class SQLiteLoader : public Loader
{
    Q_OBJECT

public:
    explicit SQLiteLoader(const LoaderProps &props, QObject *parent = nullptr);
    ~SQLiteLoader();

protected:
    bool openConnection(const DataConnection &connection) override;
    void closeConnection() override;
    bool sourceKeys(QStringList *keys) override;
    bool readInstances(const QString &entityKey, QList<IRInstance> *instances) override;

private:
    QString lastDbError() const;

    sqlite3 *m_db = nullptr;
    QString m_filepath;
};

} // namespace Bridge

#endif // SQLITELOADER_H
