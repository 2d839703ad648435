#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums for the sync engine
 */

namespace Bridge {

/**
 * @brief Change state of a synchronized item
 *
 * Reported for every record, relationship, loader record and schema the
 * engine touches during a run.
 */
enum class ItemState {
    Unchanged,      ///< Nothing written
    New,            ///< Created (or first adopted) during this run
    Changed         ///< Existing item was rewritten
};

/**
 * @brief Phases of a run, in execution order
 */
enum class RunPhase {
    Idle,
    LoaderSync,         ///< Container, loader group and loader record
    DomainSchemaSync,   ///< Import of fixed domain schemas
    DynamicSchemaSync,  ///< Generate, compare and import the dynamic schema
    DataSync,           ///< Walk the node tree against the IR model
    OrphanSync,         ///< Delete records whose source disappeared
    ExtentsSync,        ///< Recompute repository extents
    Done,
    Failed
};

/**
 * @brief Kind of change set pushed to the repository
 */
enum class ChangesType {
    Regular,
    Schema
};

QString itemStateName(ItemState state);
QString runPhaseName(RunPhase phase);

/**
 * @brief Summary of sync operation results
 */
struct SyncStats {
    int created = 0;        ///< Items created
    int updated = 0;        ///< Existing items rewritten
    int deleted = 0;        ///< Records deleted as orphans
    int unchanged = 0;      ///< Items with no changes
    int skipped = 0;        ///< Instances whose endpoints could not be resolved
    int errors = 0;         ///< Errors during sync

    int total() const { return created + updated + deleted + unchanged; }

    void record(ItemState state) {
        switch (state) {
        case ItemState::New:       ++created; break;
        case ItemState::Changed:   ++updated; break;
        case ItemState::Unchanged: ++unchanged; break;
        }
    }

    SyncStats &operator+=(const SyncStats &other) {
        created += other.created;
        updated += other.updated;
        deleted += other.deleted;
        unchanged += other.unchanged;
        skipped += other.skipped;
        errors += other.errors;
        return *this;
    }

    QString summary() const {
        return QString("Created: %1, Updated: %2, Deleted: %3, Unchanged: %4, Skipped: %5, Errors: %6")
            .arg(created).arg(updated).arg(deleted).arg(unchanged).arg(skipped).arg(errors);
    }
};

/**
 * @brief Result of a complete run
 */
struct SyncResult {
    bool success = false;
    QString errorMessage;
    RunPhase phase = RunPhase::Idle;                ///< Last phase entered (the failing one on error)
    ItemState sourceState = ItemState::Unchanged;   ///< State of the loader record
    ItemState schemaState = ItemState::Unchanged;   ///< State of the dynamic schema
    SyncStats stats;
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }
};

} // namespace Bridge

// Register types for Qt metatype system (needed for queued signals)
Q_DECLARE_METATYPE(Bridge::SyncResult)
Q_DECLARE_METATYPE(Bridge::SyncStats)
Q_DECLARE_METATYPE(Bridge::RunPhase)

#endif // SYNCTYPES_H
