#include "connectorconfig.h"

#include <QJsonArray>

namespace Bridge {

QJsonObject ConnectorConfig::toJson() const
{
    QJsonObject obj;
    obj["appId"] = appId;
    obj["appVersion"] = appVersion;
    obj["connectorName"] = connectorName;
    obj["domainSchemaPaths"] = QJsonArray::fromStringList(domainSchemaPaths);

    if (hasDynamicSchema()) {
        QJsonObject dynamic;
        dynamic["schemaName"] = dynamicSchemaName;
        dynamic["schemaAlias"] = dynamicSchemaAlias;
        obj["dynamicSchema"] = dynamic;
    }
    return obj;
}

bool ConnectorConfig::fromJson(const QJsonObject &obj, ConnectorConfig *config, QString *error)
{
    ConnectorConfig c;
    c.appId = obj.value("appId").toString();
    c.appVersion = obj.value("appVersion").toString();
    c.connectorName = obj.value("connectorName").toString();

    for (const QJsonValue &v : obj.value("domainSchemaPaths").toArray()) {
        c.domainSchemaPaths.append(v.toString());
    }

    if (obj.contains("dynamicSchema")) {
        const QJsonObject dynamic = obj.value("dynamicSchema").toObject();
        c.dynamicSchemaName = dynamic.value("schemaName").toString();
        c.dynamicSchemaAlias = dynamic.value("schemaAlias").toString();
        if (c.dynamicSchemaName.isEmpty()) {
            if (error) *error = "dynamicSchema.schemaName is required";
            return false;
        }
        if (c.dynamicSchemaAlias.isEmpty()) {
            c.dynamicSchemaAlias = c.dynamicSchemaName.toLower();
        }
    }

    if (c.connectorName.isEmpty()) {
        if (error) *error = "connectorName is required";
        return false;
    }

    *config = c;
    return true;
}

} // namespace Bridge
