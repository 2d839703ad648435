#include "changedetector.h"

#include <QDebug>

namespace Bridge {

ChangeDetector::ChangeDetector(Repository *repository)
    : m_repository(repository)
{
}

bool ChangeDetector::fail(const QString &what, QString *error) const
{
    const QString message = QString("%1: %2").arg(what, m_repository->errorString());
    if (error) {
        *error = message;
    }
    return false;
}

ItemState ChangeDetector::detect(const QString &scope, const QString &kind, const QString &identifier,
                                 const QString &version, const QString &checksum) const
{
    ProvenanceRecord marker;
    if (m_repository->findProvenance(scope, kind, identifier, &marker).isEmpty()) {
        return ItemState::New;
    }
    RecordProps existing;
    if (!m_repository->record(marker.elementId, &existing)) {
        return ItemState::New;
    }
    if (marker.version == version && marker.checksum == checksum) {
        return ItemState::Unchanged;
    }
    return ItemState::Changed;
}

bool ChangeDetector::upsertRecord(const UpsertArgs &args, ChangeResult *result, QString *error)
{
    ProvenanceRecord marker;
    const QString markerId = m_repository->findProvenance(args.scope, args.kind, args.identifier, &marker);

    QString existingId;
    if (args.props.code.isValid()) {
        existingId = m_repository->findRecordByCode(args.props.code);
    }
    if (existingId.isEmpty() && !markerId.isEmpty()
        && m_repository->record(marker.elementId, nullptr)) {
        existingId = marker.elementId;
    }

    RecordProps props = args.props;

    // References are owned by foreign-key nodes, keep them across rewrites
    RecordProps previous;
    if (!existingId.isEmpty() && m_repository->record(existingId, &previous)) {
        for (auto it = previous.references.constBegin(); it != previous.references.constEnd(); ++it) {
            if (!props.references.contains(it.key())) {
                props.references.insert(it.key(), it.value());
            }
        }
    }

    // Marker and record both present: compare the fingerprint
    if (!markerId.isEmpty() && !existingId.isEmpty()) {
        if (marker.version == args.version && marker.checksum == args.checksum
            && marker.elementId == existingId) {
            result->entityId = existingId;
            result->state = ItemState::Unchanged;
            return true;
        }

        props.id = existingId;
        if (!m_repository->updateRecord(props)) {
            return fail(QString("Failed to update %1").arg(args.identifier), error);
        }
        marker.elementId = existingId;
        marker.version = args.version;
        marker.checksum = args.checksum;
        if (!m_repository->updateProvenance(marker)) {
            return fail(QString("Failed to update provenance of %1").arg(args.identifier), error);
        }
        qDebug() << "[ChangeDetector] Changed" << args.kind << args.identifier;
        result->entityId = existingId;
        result->state = ItemState::Changed;
        return true;
    }

    QString id = existingId;
    if (id.isEmpty()) {
        props.id.clear();
        id = m_repository->insertRecord(props);
        if (id.isEmpty()) {
            return fail(QString("Failed to insert %1").arg(args.identifier), error);
        }
    } else {
        // Record created outside synchronization: adopt it
        props.id = id;
        if (!m_repository->updateRecord(props)) {
            return fail(QString("Failed to update %1").arg(args.identifier), error);
        }
    }

    marker.elementId = id;
    marker.scopeId = args.scope;
    marker.kind = args.kind;
    marker.identifier = args.identifier;
    marker.version = args.version;
    marker.checksum = args.checksum;

    if (markerId.isEmpty()) {
        marker.id.clear();
        if (m_repository->insertProvenance(marker).isEmpty()) {
            return fail(QString("Failed to attach provenance to %1").arg(args.identifier), error);
        }
    } else if (!m_repository->updateProvenance(marker)) {
        return fail(QString("Failed to update provenance of %1").arg(args.identifier), error);
    }

    qDebug() << "[ChangeDetector] New" << args.kind << args.identifier << "->" << id;
    result->entityId = id;
    result->state = ItemState::New;
    return true;
}

bool ChangeDetector::upsertAspect(const AspectUpsertArgs &args, ChangeResult *result, QString *error)
{
    ProvenanceRecord marker;
    const QString markerId = m_repository->findProvenance(args.scope, args.kind, args.identifier, &marker);

    QString existingId;
    AspectProps existing;
    if (!markerId.isEmpty() && m_repository->aspect(marker.elementId, &existing)) {
        existingId = marker.elementId;
    } else {
        existingId = m_repository->findUniqueAspect(args.props.elementId, args.props.classFullName);
        if (!existingId.isEmpty()) {
            m_repository->aspect(existingId, &existing);
        }
    }

    const bool tracked = !markerId.isEmpty() && !existingId.isEmpty() && marker.elementId == existingId;
    if (tracked && marker.version == args.version && marker.checksum == args.checksum
        && existing.elementId == args.props.elementId) {
        result->entityId = existingId;
        result->state = ItemState::Unchanged;
        return true;
    }

    AspectProps props = args.props;
    QString id = existingId;
    if (id.isEmpty()) {
        props.id.clear();
        id = m_repository->insertAspect(props);
        if (id.isEmpty()) {
            return fail(QString("Failed to insert aspect %1").arg(args.identifier), error);
        }
    } else {
        props.id = id;
        if (!m_repository->updateAspect(props)) {
            return fail(QString("Failed to update aspect %1").arg(args.identifier), error);
        }
    }

    marker.elementId = id;
    marker.scopeId = args.scope;
    marker.kind = args.kind;
    marker.identifier = args.identifier;
    marker.version = args.version;
    marker.checksum = args.checksum;

    if (markerId.isEmpty()) {
        marker.id.clear();
        if (m_repository->insertProvenance(marker).isEmpty()) {
            return fail(QString("Failed to attach provenance to aspect %1").arg(args.identifier), error);
        }
    } else if (!m_repository->updateProvenance(marker)) {
        return fail(QString("Failed to update provenance of aspect %1").arg(args.identifier), error);
    }

    result->entityId = id;
    result->state = tracked ? ItemState::Changed : ItemState::New;
    qDebug() << "[ChangeDetector]" << itemStateName(result->state) << "aspect" << args.kind << args.identifier;
    return true;
}

} // namespace Bridge
