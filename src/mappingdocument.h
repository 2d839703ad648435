#ifndef MAPPINGDOCUMENT_H
#define MAPPINGDOCUMENT_H

#include <QString>
#include <QJsonObject>

namespace Bridge {

class SyncEngine;

/**
 * @brief Connector mapping declared as JSON
 *
 * Lets the CLI run connectors without integrator code. Hooks (instance
 * filters and property transforms) cannot be expressed and are left unset.
 *
 * @code
 * {
 *   "connector": { "connectorName": "plant", "dynamicSchema": { "schemaName": "Plant" } },
 *   "containers": [ "Subject1" ],
 *   "groups": [ { "key": "LinkModel1", "container": "Subject1", "kind": "link" },
 *               { "key": "PhysicalModel1", "container": "Subject1", "kind": "physical" } ],
 *   "loader": { "key": "loader", "group": "LinkModel1", "props": { "format": "json", "entities": ["Component"] } },
 *   "records": [ { "key": "Component", "group": "PhysicalModel1", "irEntity": "Component",
 *                  "class": "Plant:Component",
 *                  "definition": { "name": "Component", "baseClass": "Core:PhysicalElement" } } ],
 *   "links": [ ... ],
 *   "foreignKeys": [ ... ],
 *   "aspects": [ { "key": "Rating", "container": "Subject1", "irEntity": "Rating",
 *                  "element": "Component", "elementAttr": "component", "class": "Plant:Rating",
 *                  "definition": { "name": "Rating", "baseClass": "Core:ElementUniqueAspect" } } ]
 * }
 * @endcode
 *
 * Records are added in document order, so parent records must come
 * before their children.
 */
class MappingDocument
{
public:
    /**
     * @brief Read a mapping file and build the engine's config and node tree
     *
     * Relative domain schema paths resolve against the mapping file's folder.
     */
    static bool load(const QString &path, SyncEngine *engine, QString *error = nullptr);

    static bool apply(const QJsonObject &doc, SyncEngine *engine, QString *error = nullptr);
};

} // namespace Bridge

#endif // MAPPINGDOCUMENT_H
