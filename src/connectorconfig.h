#ifndef CONNECTORCONFIG_H
#define CONNECTORCONFIG_H

#include <QString>
#include <QStringList>
#include <QJsonObject>

namespace Bridge {

/**
 * @brief Identity and schemas of a connector
 *
 * Supplied by integrator code (or a mapping document) once, before the
 * node tree is built.
 */
struct ConnectorConfig {
    QString appId;
    QString appVersion;
    QString connectorName;
    QStringList domainSchemaPaths;  ///< Serialized schemas imported before the data phase

    /// Dynamic schema holding the classes defined by the mappings, optional
    QString dynamicSchemaName;
    QString dynamicSchemaAlias;

    bool hasDynamicSchema() const { return !dynamicSchemaName.isEmpty(); }

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &obj, ConnectorConfig *config, QString *error = nullptr);
};

} // namespace Bridge

#endif // CONNECTORCONFIG_H
