#ifndef LOADER_H
#define LOADER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QMap>
#include <QJsonObject>
#include "../ir/irmodel.h"

namespace Bridge {

/**
 * @brief Description of where source data comes from
 *
 * Either a local file or a remote API. The loader node key names the
 * loader-config node that records this connection in the repository.
 */
struct DataConnection {
    enum class Kind {
        File,
        Api
    };

    Kind kind = Kind::File;
    QString loaderNodeKey;
    QString filepath;       ///< File connections only
    QString baseUrl;        ///< API connections only
    QJsonObject data;       ///< Arbitrary integrator data

    static DataConnection file(const QString &loaderNodeKey, const QString &filepath);
    static DataConnection api(const QString &loaderNodeKey, const QString &baseUrl);

    bool isFile() const { return kind == Kind::File; }
    QString kindName() const;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &obj, DataConnection *connection, QString *error = nullptr);
};

/**
 * @brief Loader settings supplied by the integrator
 */
struct LoaderProps {
    QString format;                     ///< "json", "sqlite", ...
    QStringList entities;               ///< Entity keys imported into the IR model
    QStringList relationships;          ///< Relationship keys imported into the IR model
    QString defaultPrimaryKey = QStringLiteral("id");
    QMap<QString, QString> primaryKeyMap;   ///< Entity key -> primary key attribute
    QString version = QStringLiteral("0.0");

    QJsonObject toJson() const;
    static LoaderProps fromJson(const QJsonObject &obj);
};

/**
 * @brief Converts a data source into IR entities
 *
 * Subclasses implement the connection handling and row reading for one
 * format. The base class filters the source keys against the configured
 * entity and relationship lists and validates every instance.
 *
 * Usage:
 * @code
 * JSONLoader loader(props);
 * if (loader.open(DataConnection::file("loader", "/data/source.json"))) {
 *     QList<IREntity> entities;
 *     loader.getEntities(&entities);
 *     loader.close();
 * }
 * @endcode
 */
class Loader : public QObject
{
    Q_OBJECT

public:
    explicit Loader(const LoaderProps &props, QObject *parent = nullptr);
    virtual ~Loader() = default;

    // ========== Connection ==========

    /**
     * @brief Open the data source
     *
     * Opening an already-open loader logs an error and returns false.
     */
    bool open(const DataConnection &connection);

    /**
     * @brief Close the data source
     *
     * Closing a loader that is not open logs an error and does nothing.
     */
    void close();

    bool isOpen() const { return m_open; }

    // ========== Data Access ==========

    /**
     * @brief Read every configured entity
     * @return false if the loader is closed, the source cannot be read or an instance is invalid
     */
    bool getEntities(QList<IREntity> *entities);

    /**
     * @brief Read every configured relationship
     */
    bool getRelationships(QList<IRRelationship> *relationships);

    /**
     * @brief Primary key attribute of an entity
     *
     * Falls back to the default primary key when no override exists.
     */
    QString primaryKeyOf(const QString &entityKey) const;

    // ========== Properties ==========

    LoaderProps props() const { return m_props; }
    QString format() const { return m_props.format; }
    QString version() const { return m_props.version; }

    QJsonObject toJson() const { return m_props.toJson(); }

    QString errorString() const { return m_error; }

signals:
    void errorOccurred(const QString &error);

protected:
    virtual bool openConnection(const DataConnection &connection) = 0;
    virtual void closeConnection() = 0;

    /**
     * @brief Every entity key the source holds
     * @return false with the error set when the source cannot be listed
     */
    virtual bool sourceKeys(QStringList *keys) = 0;

    /**
     * @brief Read the rows of one source entity
     *
     * Implementations use primaryKeyOf() for the instance primary key.
     */
    virtual bool readInstances(const QString &entityKey, QList<IRInstance> *instances) = 0;

    void setError(const QString &error);

private:
    bool collect(const QStringList &wanted, QList<IREntity> *out);

    LoaderProps m_props;
    bool m_open = false;
    QString m_error;
};

/**
 * @brief Create a loader for a format name
 * @return nullptr for an unknown format
 */
Loader *createLoader(const LoaderProps &props, QObject *parent = nullptr);

} // namespace Bridge

#endif // LOADER_H
