#ifndef SCHEMACOMPARER_H
#define SCHEMACOMPARER_H

#include <QString>
#include <QStringList>
#include "schemadef.h"

namespace Bridge {

/**
 * @brief Structural diff of two versions of a schema
 *
 * Versions are not compared; a candidate is built at the persisted version
 * before it is diffed. Each difference produces one diagnostic line, e.g.
 * "Class Tank: property Capacity added".
 */
class SchemaComparer
{
public:
    /**
     * @brief Compare a candidate against the persisted schema
     * @param diagnostics Receives one line per difference
     * @param error Receives the reason when the schemas cannot be compared
     * @return false when either schema is malformed (duplicate class names)
     */
    static bool compare(const SchemaDef &candidate,
                        const SchemaDef &persisted,
                        QStringList *diagnostics,
                        QString *error = nullptr);

    /**
     * @brief Reject schemas with duplicate class names
     */
    static bool checkUniqueClasses(const SchemaDef &schema, QString *error = nullptr);

private:
    static void compareClass(const ClassDefinition &candidate,
                             const ClassDefinition &persisted,
                             QStringList *diagnostics);
    static void compareConstraint(const QString &className,
                                  const QString &end,
                                  const RelationshipConstraint &candidate,
                                  const RelationshipConstraint &persisted,
                                  QStringList *diagnostics);
};

} // namespace Bridge

#endif // SCHEMACOMPARER_H
