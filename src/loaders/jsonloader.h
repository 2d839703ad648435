#ifndef JSONLOADER_H
#define JSONLOADER_H

#include "loader.h"

#include <QJsonObject>

namespace Bridge {

/**
 * @brief Loader for JSON documents
 *
 * The document is an object mapping entity keys to arrays of row objects:
 * @code
 * { "Component": [ { "id": "1", "name": "A" } ] }
 * @endcode
 * The whole file is read on open.
 */
class JSONLoader : public Loader
{
    Q_OBJECT

public:
    explicit JSONLoader(const LoaderProps &props, QObject *parent = nullptr);

protected:
    bool openConnection(const DataConnection &connection) override;
    void closeConnection() override;
    bool sourceKeys(QStringList *keys) override;
    bool readInstances(const QString &entityKey, QList<IRInstance> *instances) override;

private:
    QJsonObject m_document;
    QString m_filepath;
};

} // namespace Bridge

#endif // JSONLOADER_H
