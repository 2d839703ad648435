#ifndef CHANGEDETECTOR_H
#define CHANGEDETECTOR_H

#include <QString>
#include "synctypes.h"
#include "../repo/repository.h"

namespace Bridge {

/**
 * @brief Everything needed to upsert one synchronized record
 */
struct UpsertArgs {
    RecordProps props;      ///< Record to write; props.code is its identity
    QString version;        ///< Source version of the instance
    QString checksum;       ///< Content fingerprint of the instance
    QString scope;          ///< Provenance scope (collection id)
    QString kind;           ///< Provenance kind (IR entity key)
    QString identifier;     ///< Provenance identifier (code value)
};

/**
 * @brief Everything needed to upsert one synchronized aspect
 *
 * Same provenance identity as UpsertArgs; props.elementId names the owner.
 */
struct AspectUpsertArgs {
    AspectProps props;
    QString version;
    QString checksum;
    QString scope;          ///< Provenance scope (container id)
    QString kind;
    QString identifier;     ///< Provenance identifier (instance key)
};

struct ChangeResult {
    QString entityId;
    ItemState state = ItemState::Unchanged;
};

/**
 * @brief Decides New / Changed / Unchanged for a record and writes it
 *
 * The provenance marker attached to a record is the only state kept
 * between runs. A record is Unchanged when its marker's version and
 * checksum both match the incoming values; Unchanged records cause no
 * repository write at all.
 *
 * Cases:
 * - no marker, no record with the code: insert record and marker (New)
 * - no marker, record with the code exists: update it and attach a marker (New)
 * - marker exists but its record is gone: insert record, repoint marker (New)
 * - marker matches: nothing (Unchanged)
 * - marker differs: update record and marker (Changed)
 */
class ChangeDetector
{
public:
    explicit ChangeDetector(Repository *repository);

    bool upsertRecord(const UpsertArgs &args, ChangeResult *result, QString *error = nullptr);

    /**
     * @brief Upsert an aspect under the same rules as a record
     *
     * Without a marker, an aspect of the class already on the owner is adopted.
     */
    bool upsertAspect(const AspectUpsertArgs &args, ChangeResult *result, QString *error = nullptr);

    /**
     * @brief State an instance would get, without writing anything
     */
    ItemState detect(const QString &scope, const QString &kind, const QString &identifier,
                     const QString &version, const QString &checksum) const;

private:
    bool fail(const QString &what, QString *error) const;

    Repository *m_repository;
};

} // namespace Bridge

#endif // CHANGEDETECTOR_H
