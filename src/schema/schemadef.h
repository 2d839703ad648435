#ifndef SCHEMADEF_H
#define SCHEMADEF_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QJsonObject>

/**
 * @file schemadef.h
 * @brief In-memory description of repository schemas
 *
 * A schema is a named, versioned set of entity and relationship classes.
 * The JSON form produced by SchemaDef::toJson() is also the format accepted
 * by Repository::importSchema().
 */

namespace Bridge {

/**
 * @brief Schema version (read, write, minor)
 *
 * Serialized as "RR.WW.mm", e.g. "01.00.02".
 */
struct SchemaVersion {
    int read = 1;
    int write = 0;
    int minor = 0;

    SchemaVersion() = default;
    SchemaVersion(int r, int w, int m) : read(r), write(w), minor(m) {}

    QString toString() const;
    static bool fromString(const QString &text, SchemaVersion *version);

    bool operator==(const SchemaVersion &o) const { return read == o.read && write == o.write && minor == o.minor; }
    bool operator!=(const SchemaVersion &o) const { return !(*this == o); }
    bool operator<(const SchemaVersion &o) const;
};

struct PropertyDef {
    QString name;
    QString type = QStringLiteral("string");    ///< string, int, double, boolean, navigation

    bool operator==(const PropertyDef &o) const { return name == o.name && type == o.type; }
    bool operator!=(const PropertyDef &o) const { return !(*this == o); }
};

/**
 * @brief One end of a relationship class
 */
struct RelationshipConstraint {
    QString multiplicity = QStringLiteral("(0..*)");
    QStringList classes;            ///< Full class names allowed on this end
    bool polymorphic = true;
    QString roleLabel;

    QJsonObject toJson() const;
    static RelationshipConstraint fromJson(const QJsonObject &obj);

    bool operator==(const RelationshipConstraint &o) const;
    bool operator!=(const RelationshipConstraint &o) const { return !(*this == o); }
};

/**
 * @brief An entity or relationship class
 *
 * Base class names are either qualified ("Core:PhysicalElement") or bare,
 * in which case they name a class of the same schema.
 */
struct ClassDefinition {
    enum class Kind {
        Entity,
        Relationship
    };

    QString name;
    Kind kind = Kind::Entity;
    QString baseClass;
    QString label;
    QList<PropertyDef> properties;

    // Relationship classes only
    QString strength = QStringLiteral("referencing");
    QString strengthDirection = QStringLiteral("forward");
    RelationshipConstraint source;
    RelationshipConstraint target;

    static ClassDefinition entity(const QString &name, const QString &baseClass,
                                  const QList<PropertyDef> &properties = QList<PropertyDef>());
    static ClassDefinition relationship(const QString &name, const QString &baseClass,
                                        const RelationshipConstraint &source,
                                        const RelationshipConstraint &target,
                                        const QString &strength = QStringLiteral("referencing"));

    bool isRelationship() const { return kind == Kind::Relationship; }
    const PropertyDef *findProperty(const QString &name) const;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject &obj, ClassDefinition *def, QString *error = nullptr);

    bool operator==(const ClassDefinition &o) const;
    bool operator!=(const ClassDefinition &o) const { return !(*this == o); }
};

/**
 * @brief A complete schema
 */
struct SchemaDef {
    QString name;
    QString alias;
    SchemaVersion version;
    QStringList references;     ///< Names of schemas this one builds on
    QList<ClassDefinition> classes;

    const ClassDefinition *findClass(const QString &className) const;

    QJsonObject toJson() const;
    QByteArray serialize() const;

    static bool fromJson(const QJsonObject &obj, SchemaDef *schema, QString *error = nullptr);
    static bool deserialize(const QByteArray &data, SchemaDef *schema, QString *error = nullptr);
    static bool fromFile(const QString &path, SchemaDef *schema, QString *error = nullptr);
};

// ========== Class Names ==========

/// Schema part of "Schema:Class" or "Schema.Class" (empty for bare names)
QString schemaNameOf(const QString &fullName);

/// Class part of "Schema:Class" or "Schema.Class"
QString classNameOf(const QString &fullName);

/// Qualify a bare class name with a schema, leave qualified names alone
QString qualifiedClassName(const QString &schemaName, const QString &className);

// ========== Base Schema ==========

namespace CoreClasses {
const char Schema[] = "Core";
const char Element[] = "Core:Element";
const char DefinitionElement[] = "Core:DefinitionElement";
const char Category[] = "Core:Category";
const char Subject[] = "Core:Subject";
const char RepositoryLink[] = "Core:RepositoryLink";
const char ElementUniqueAspect[] = "Core:ElementUniqueAspect";
const char PhysicalElement[] = "Core:PhysicalElement";
const char InformationRecordElement[] = "Core:InformationRecordElement";
const char DefinitionPartition[] = "Core:DefinitionPartition";
const char PhysicalPartition[] = "Core:PhysicalPartition";
const char InformationRecordPartition[] = "Core:InformationRecordPartition";
const char LinkPartition[] = "Core:LinkPartition";
const char DefinitionModel[] = "Core:DefinitionModel";
const char PhysicalModel[] = "Core:PhysicalModel";
const char InformationRecordModel[] = "Core:InformationRecordModel";
const char LinkModel[] = "Core:LinkModel";
const char ElementRefersToElements[] = "Core:ElementRefersToElements";
const char ElementOwnsChildElements[] = "Core:ElementOwnsChildElements";
const char SubjectOwnsSubjects[] = "Core:SubjectOwnsSubjects";
const char SubjectOwnsPartitionElements[] = "Core:SubjectOwnsPartitionElements";
}

/**
 * @brief The base schema present in every repository
 */
SchemaDef coreSchema();

} // namespace Bridge

#endif // SCHEMADEF_H
