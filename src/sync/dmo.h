#ifndef DMO_H
#define DMO_H

#include <QString>
#include <QJsonObject>
#include <functional>
#include "../ir/irmodel.h"
#include "../schema/schemadef.h"
#include "../repo/repository.h"

/**
 * @file dmo.h
 * @brief Mapping objects binding IR entities to repository classes
 *
 * A mapping object (DMO) is plain data: which IR entity it reads, which
 * class it writes, and optional hooks that filter instances or adjust the
 * properties written for them.
 */

namespace Bridge {

/**
 * @brief Target class of a mapping
 *
 * Either names a class that already exists ("Core:PhysicalElement"), or
 * carries the definition of a new class generated into the dynamic schema.
 * For a defined class the class part of the name must equal the
 * definition's name.
 */
struct ClassRef {
    QString className;
    bool isDefined = false;
    ClassDefinition definition;

    static ClassRef existing(const QString &className);
    static ClassRef defined(const QString &className, const ClassDefinition &definition);

    /**
     * @brief Class name as written to the repository
     *
     * Defined classes live in the dynamic schema.
     */
    QString fullName(const QString &dynamicSchemaName) const;

    QJsonObject toJson() const;
};

/**
 * @brief Which side of a link an endpoint is resolved from
 */
enum class EndpointType {
    IREntity,       ///< Record synchronized from an IR entity of this tree
    TargetEntity    ///< Record already in the repository, found through a locator
};

QString endpointTypeName(EndpointType type);

using InstancePredicate = std::function<bool(const IRInstance &)>;
using RecordTransform = std::function<void(RecordProps &, const IRInstance &)>;
using LinkTransform = std::function<void(RelationshipProps &, const IRInstance &)>;
using ReferenceTransform = std::function<void(RelatedRef &, const IRInstance &)>;
using AspectTransform = std::function<void(AspectProps &, const IRInstance &)>;

/**
 * @brief Maps IR entity instances to records
 */
struct RecordDMO {
    QString irEntity;
    ClassRef target;
    QString categoryAttr;           ///< Attribute holding the category instance's primary key
    QString parentAttr;             ///< Attribute holding the parent instance's primary key
    InstancePredicate doSyncInstance;
    RecordTransform modifyProps;    ///< Applied after the default properties

    QJsonObject toJson() const;
};

/**
 * @brief Maps IR relationship instances to link-table relationships
 */
struct LinkDMO {
    QString irEntity;
    ClassRef relationship;
    QString fromAttr;
    EndpointType fromType = EndpointType::IREntity;
    QString toAttr;
    EndpointType toType = EndpointType::IREntity;
    InstancePredicate doSyncInstance;
    LinkTransform modifyProps;

    QJsonObject toJson() const;
};

/**
 * @brief Maps IR relationship instances to a reference property
 *
 * The reference is set on the target record and points at the source
 * record.
 */
struct ForeignKeyDMO {
    QString irEntity;
    ClassRef relationship;
    QString fromAttr;
    EndpointType fromType = EndpointType::IREntity;
    QString toAttr;
    EndpointType toType = EndpointType::IREntity;
    QString refProperty;            ///< Reference property set on the target record
    InstancePredicate doSyncInstance;
    ReferenceTransform modifyProps;

    QJsonObject toJson() const;
};

/**
 * @brief Maps IR entity instances to unique aspects of existing records
 *
 * The target class must derive from Core:ElementUniqueAspect. Each instance
 * names its owning record through elementAttr.
 */
struct AspectDMO {
    QString irEntity;
    ClassRef target;
    QString elementAttr;            ///< Attribute holding the owner's key
    EndpointType elementType = EndpointType::IREntity;
    InstancePredicate doSyncInstance;
    AspectTransform modifyProps;

    QJsonObject toJson() const;
};

// ========== Validation ==========

bool validateAspectDMO(const AspectDMO &dmo, QString *error = nullptr);
bool validateRecordDMO(const RecordDMO &dmo, QString *error = nullptr);
bool validateLinkDMO(const LinkDMO &dmo, QString *error = nullptr);
bool validateForeignKeyDMO(const ForeignKeyDMO &dmo, QString *error = nullptr);

} // namespace Bridge

#endif // DMO_H
